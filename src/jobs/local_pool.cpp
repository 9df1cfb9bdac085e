#include "forkyard/jobs/local_pool.hpp"

#include "forkyard/common/fs.hpp"
#include "forkyard/observability/global.hpp"

namespace forkyard::jobs {

namespace {

constexpr std::array<JobKind, 3> kKinds = {JobKind::CreateSession, JobKind::SendInput,
                                           JobKind::ContinueSession};

} // namespace

std::uint32_t PoolWidths::for_kind(const JobKind kind) const {
  switch (kind) {
  case JobKind::CreateSession:
    return create_session;
  case JobKind::SendInput:
    return send_input;
  case JobKind::ContinueSession:
    return continue_session;
  }
  return 1;
}

LocalWorkerPool::LocalWorkerPool(const PoolWidths widths) : widths_(widths) {}

LocalWorkerPool::~LocalWorkerPool() { shutdown(); }

LocalWorkerPool::KindQueue &LocalWorkerPool::queue_for(const JobKind kind) {
  return queues_[static_cast<std::size_t>(kind)];
}

const LocalWorkerPool::KindQueue &LocalWorkerPool::queue_for(const JobKind kind) const {
  return queues_[static_cast<std::size_t>(kind)];
}

common::Status LocalWorkerPool::start(JobProcessor processor) {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (running_.load()) {
    return common::Status::error(common::ErrorKind::Internal, "Worker pool already started");
  }
  for (const auto kind : kKinds) {
    if (widths_.for_kind(kind) == 0) {
      return common::Status::error(common::ErrorKind::Configuration,
                                   std::string("Worker pool width for ") +
                                       std::string(to_string(kind)) + " must be positive");
    }
  }
  processor_ = std::move(processor);
  stopping_ = false;
  running_ = true;
  for (const auto kind : kKinds) {
    for (std::uint32_t i = 0; i < widths_.for_kind(kind); ++i) {
      threads_.emplace_back([this, kind] { worker_loop(kind); });
    }
  }
  observability::log_debug("jobs", "Local worker pool started with " +
                                       std::to_string(threads_.size()) + " threads");
  return common::Status::success();
}

common::Result<JobHandle> LocalWorkerPool::enqueue(Job job) {
  if (!running_.load() || stopping_.load()) {
    return common::Result<JobHandle>::failure(common::ErrorKind::Internal,
                                              "Worker pool is not accepting jobs");
  }
  const JobKind kind = job_kind(job);
  auto completion = std::make_shared<JobCompletion>();
  std::string id = common::generate_id();
  auto &queue = queue_for(kind);
  std::size_t depth = 0;
  {
    std::lock_guard<std::mutex> lock(queue.mutex);
    queue.pending.push_back(Pending{.id = id, .job = std::move(job), .completion = completion});
    depth = queue.pending.size();
  }
  queue.cv.notify_one();
  observability::record_metric(
      observability::QueueDepthMetric{.kind = std::string(to_string(kind)), .depth = depth});
  return common::Result<JobHandle>::success(JobHandle(std::move(id), kind, std::move(completion)));
}

void LocalWorkerPool::worker_loop(const JobKind kind) {
  auto &queue = queue_for(kind);
  while (true) {
    Pending next;
    {
      std::unique_lock<std::mutex> lock(queue.mutex);
      queue.cv.wait(lock, [&] { return stopping_.load() || !queue.pending.empty(); });
      if (queue.pending.empty()) {
        return;
      }
      next = std::move(queue.pending.front());
      queue.pending.pop_front();
    }
    next.completion->complete(processor_(next.id, next.job));
  }
}

void LocalWorkerPool::shutdown() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (!running_.load()) {
    return;
  }
  stopping_ = true;
  for (auto &queue : queues_) {
    // Pairs with the predicate check in worker_loop.
    { std::lock_guard<std::mutex> queue_lock(queue.mutex); }
    queue.cv.notify_all();
  }
  for (auto &thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  threads_.clear();
  running_ = false;
}

std::size_t LocalWorkerPool::depth(const JobKind kind) const {
  const auto &queue = queue_for(kind);
  std::lock_guard<std::mutex> lock(queue.mutex);
  return queue.pending.size();
}

} // namespace forkyard::jobs
