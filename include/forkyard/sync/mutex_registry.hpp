#pragma once

#include "forkyard/common/result.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace forkyard::sync {

inline constexpr const char *kSessionCreationLock = "session-creation";
/// Timeout value that makes acquire() wait until the lock is free.
inline constexpr std::chrono::milliseconds kWaitIndefinitely = std::chrono::milliseconds::max();

[[nodiscard]] std::string workspace_lock_key(const std::string &workspace_path);
[[nodiscard]] std::string session_lock_key(const std::string &session_id);

/// Named, FIFO, non-reentrant locks. Acquisition gives up after a timeout and reports
/// ErrorKind::Contention, unless the timeout is kWaitIndefinitely.
class MutexRegistry {
public:
  class Guard {
  public:
    Guard() = default;
    Guard(Guard &&other) noexcept;
    Guard &operator=(Guard &&other) noexcept;
    Guard(const Guard &) = delete;
    Guard &operator=(const Guard &) = delete;
    ~Guard();

    void release();
    [[nodiscard]] bool owns() const { return registry_ != nullptr; }
    [[nodiscard]] const std::string &key() const { return key_; }

  private:
    friend class MutexRegistry;
    Guard(MutexRegistry *registry, std::string key)
        : registry_(registry), key_(std::move(key)) {}

    MutexRegistry *registry_ = nullptr;
    std::string key_;
  };

  explicit MutexRegistry(std::chrono::milliseconds default_timeout = std::chrono::seconds(30));

  [[nodiscard]] common::Result<Guard>
  acquire(const std::string &key,
          std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  /// Runs fn while holding `key`. fn returns common::Status or common::Result<T>.
  template <typename Fn>
  auto with_lock(const std::string &key, Fn &&fn,
                 std::optional<std::chrono::milliseconds> timeout = std::nullopt)
      -> std::invoke_result_t<Fn> {
    using Ret = std::invoke_result_t<Fn>;
    auto guard = acquire(key, timeout);
    if (!guard.ok()) {
      if constexpr (std::is_same_v<Ret, common::Status>) {
        return common::Status::error(guard.details());
      } else {
        return Ret::failure(guard.details());
      }
    }
    Guard held = std::move(guard.value());
    return fn();
  }

  [[nodiscard]] bool is_locked(const std::string &key) const;
  [[nodiscard]] std::vector<std::string> locked_resources() const;
  [[nodiscard]] std::chrono::milliseconds default_timeout() const { return default_timeout_; }

private:
  struct Entry {
    bool held = false;
    std::deque<std::uint64_t> waiters;
  };

  void release(const std::string &key);

  std::chrono::milliseconds default_timeout_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::unordered_map<std::string, Entry> entries_;
  std::uint64_t next_ticket_ = 0;
};

} // namespace forkyard::sync
