#pragma once

#include "forkyard/jobs/backend.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <thread>
#include <unordered_map>
#include <vector>

namespace forkyard::jobs {

struct JobRecord {
  std::string id;
  JobKind kind = JobKind::CreateSession;
  JobState state = JobState::Waiting;
  std::string error;
  std::optional<std::string> session_id;
};

/// Jobs persisted in an SQLite database and claimed by per-kind worker threads. Jobs left
/// waiting by a previous process are picked up; jobs left active are marked failed.
class SqliteJobQueue final : public JobBackend {
public:
  SqliteJobQueue(std::filesystem::path db_path, PoolWidths widths,
                 std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100));
  ~SqliteJobQueue() override;

  SqliteJobQueue(const SqliteJobQueue &) = delete;
  SqliteJobQueue &operator=(const SqliteJobQueue &) = delete;

  [[nodiscard]] common::Status status() const;

  common::Status start(JobProcessor processor) override;
  common::Result<JobHandle> enqueue(Job job) override;
  void shutdown() override;
  [[nodiscard]] std::size_t depth(JobKind kind) const override;
  [[nodiscard]] std::string_view name() const override { return "sqlite"; }

  [[nodiscard]] common::Result<JobRecord> record(const std::string &id) const;

private:
  struct Claimed {
    std::string id;
    Job job;
  };

  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Status fail_interrupted();
  [[nodiscard]] common::Result<std::optional<Claimed>> claim_next(JobKind kind);
  [[nodiscard]] common::Status finish(const std::string &id, const JobOutcome &outcome);
  void worker_loop(JobKind kind);

  std::filesystem::path db_path_;
  PoolWidths widths_;
  std::chrono::milliseconds poll_interval_;
  sqlite3 *db_ = nullptr;
  std::string open_error_;
  mutable std::mutex db_mutex_;

  JobProcessor processor_;
  std::mutex wake_mutex_;
  std::condition_variable wake_;
  std::mutex completions_mutex_;
  std::unordered_map<std::string, std::shared_ptr<JobCompletion>> completions_;
  std::vector<std::thread> threads_;
  std::atomic<bool> running_{false};
  std::atomic<bool> stopping_{false};
  std::mutex lifecycle_mutex_;
};

} // namespace forkyard::jobs
