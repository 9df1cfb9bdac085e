#include "forkyard/sync/mutex_registry.hpp"

#include <algorithm>

namespace forkyard::sync {

std::string workspace_lock_key(const std::string &workspace_path) {
  return "workspace:" + workspace_path;
}

std::string session_lock_key(const std::string &session_id) { return "session:" + session_id; }

MutexRegistry::Guard::Guard(Guard &&other) noexcept
    : registry_(other.registry_), key_(std::move(other.key_)) {
  other.registry_ = nullptr;
}

MutexRegistry::Guard &MutexRegistry::Guard::operator=(Guard &&other) noexcept {
  if (this != &other) {
    release();
    registry_ = other.registry_;
    key_ = std::move(other.key_);
    other.registry_ = nullptr;
  }
  return *this;
}

MutexRegistry::Guard::~Guard() { release(); }

void MutexRegistry::Guard::release() {
  if (registry_ != nullptr) {
    registry_->release(key_);
    registry_ = nullptr;
  }
}

MutexRegistry::MutexRegistry(const std::chrono::milliseconds default_timeout)
    : default_timeout_(default_timeout) {}

common::Result<MutexRegistry::Guard>
MutexRegistry::acquire(const std::string &key,
                       const std::optional<std::chrono::milliseconds> timeout) {
  const auto limit = timeout.value_or(default_timeout_);

  std::unique_lock<std::mutex> lock(mutex_);
  const std::uint64_t ticket = next_ticket_++;
  entries_[key].waiters.push_back(ticket);

  const auto my_turn = [this, &key, ticket] {
    const auto &current = entries_[key];
    return !current.held && !current.waiters.empty() && current.waiters.front() == ticket;
  };

  if (limit == kWaitIndefinitely) {
    cv_.wait(lock, my_turn);
  } else if (!cv_.wait_until(lock, std::chrono::steady_clock::now() + limit, my_turn)) {
    auto &entry = entries_[key];
    entry.waiters.erase(std::remove(entry.waiters.begin(), entry.waiters.end(), ticket),
                        entry.waiters.end());
    if (!entry.held && entry.waiters.empty()) {
      entries_.erase(key);
    }
    cv_.notify_all();
    return common::Result<Guard>::failure(
        common::ErrorKind::Contention,
        "Timed out after " + std::to_string(limit.count()) + "ms waiting for lock '" + key + "'");
  }

  auto &owned = entries_[key];
  owned.waiters.pop_front();
  owned.held = true;
  return common::Result<Guard>::success(Guard(this, key));
}

void MutexRegistry::release(const std::string &key) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(key);
    if (it == entries_.end()) {
      return;
    }
    it->second.held = false;
    if (it->second.waiters.empty()) {
      entries_.erase(it);
    }
  }
  cv_.notify_all();
}

bool MutexRegistry::is_locked(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = entries_.find(key);
  return it != entries_.end() && it->second.held;
}

std::vector<std::string> MutexRegistry::locked_resources() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> keys;
  for (const auto &[key, entry] : entries_) {
    if (entry.held) {
      keys.push_back(key);
    }
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

} // namespace forkyard::sync
