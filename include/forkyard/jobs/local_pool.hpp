#pragma once

#include "forkyard/jobs/backend.hpp"

#include <array>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace forkyard::jobs {

/// In-process FIFO queues, one per job kind, each served by its own thread pool.
class LocalWorkerPool final : public JobBackend {
public:
  explicit LocalWorkerPool(PoolWidths widths);
  ~LocalWorkerPool() override;

  LocalWorkerPool(const LocalWorkerPool &) = delete;
  LocalWorkerPool &operator=(const LocalWorkerPool &) = delete;

  common::Status start(JobProcessor processor) override;
  common::Result<JobHandle> enqueue(Job job) override;
  void shutdown() override;
  [[nodiscard]] std::size_t depth(JobKind kind) const override;
  [[nodiscard]] std::string_view name() const override { return "local"; }

private:
  struct Pending {
    std::string id;
    Job job;
    std::shared_ptr<JobCompletion> completion;
  };

  struct KindQueue {
    mutable std::mutex mutex;
    std::condition_variable cv;
    std::deque<Pending> pending;
  };

  void worker_loop(JobKind kind);
  [[nodiscard]] KindQueue &queue_for(JobKind kind);
  [[nodiscard]] const KindQueue &queue_for(JobKind kind) const;

  PoolWidths widths_;
  JobProcessor processor_;
  std::array<KindQueue, 3> queues_;
  std::vector<std::thread> threads_;
  std::atomic<bool> running_{false};
  std::atomic<bool> stopping_{false};
  std::mutex lifecycle_mutex_;
};

} // namespace forkyard::jobs
