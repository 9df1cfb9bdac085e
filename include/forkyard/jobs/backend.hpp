#pragma once

#include "forkyard/common/result.hpp"
#include "forkyard/jobs/job.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace forkyard::jobs {

/// Worker count per job kind.
struct PoolWidths {
  std::uint32_t create_session = 1;
  std::uint32_t send_input = 10;
  std::uint32_t continue_session = 10;

  [[nodiscard]] std::uint32_t for_kind(JobKind kind) const;
};

/// Runs one job on a worker thread. Never called concurrently for the same job.
using JobProcessor = std::function<JobOutcome(const std::string &job_id, const Job &job)>;

/// Queues jobs per kind and runs them on bounded worker pools. Each job is processed at most
/// once; a failed job is not re-queued.
class JobBackend {
public:
  virtual ~JobBackend() = default;

  [[nodiscard]] virtual common::Status start(JobProcessor processor) = 0;
  [[nodiscard]] virtual common::Result<JobHandle> enqueue(Job job) = 0;
  /// Finishes queued work, then joins every worker.
  virtual void shutdown() = 0;
  [[nodiscard]] virtual std::size_t depth(JobKind kind) const = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace forkyard::jobs
