#pragma once

#include "forkyard/common/result.hpp"
#include "forkyard/sessions/session.hpp"

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace forkyard::jobs {

enum class JobKind { CreateSession, SendInput, ContinueSession };

[[nodiscard]] std::string_view to_string(JobKind kind);
[[nodiscard]] std::optional<JobKind> parse_job_kind(std::string_view text);

struct CreateSessionJob {
  std::string prompt;
  /// Display name template; empty asks the name suggester.
  std::string name_template;
  /// Position inside a batch.
  std::optional<std::uint32_t> index;
  std::optional<std::int64_t> project_id;
  std::optional<std::string> base_branch;
  bool auto_commit = true;
  sessions::ToolKind tool = sessions::ToolKind::Claude;
  sessions::CommitMode commit_mode = sessions::CommitMode::Checkpoint;
  std::optional<std::string> folder_id;
};

struct SendInputJob {
  std::string session_id;
  std::string input;
};

struct ContinueSessionJob {
  std::string session_id;
  std::string prompt;
};

using Job = std::variant<CreateSessionJob, SendInputJob, ContinueSessionJob>;

[[nodiscard]] JobKind job_kind(const Job &job);

/// Flat JSON payload used by persistent backends.
[[nodiscard]] std::string job_to_json(const Job &job);
[[nodiscard]] common::Result<Job> job_from_json(JobKind kind, const std::string &json);

enum class JobState { Waiting, Active, Completed, Failed };

[[nodiscard]] std::string_view to_string(JobState state);

struct JobOutcome {
  JobState state = JobState::Completed;
  /// Set when a create-session job got as far as persisting its session.
  std::optional<std::string> session_id;
  std::optional<common::Error> error;

  [[nodiscard]] bool ok() const { return state == JobState::Completed; }
};

/// One-shot completion slot shared between a worker and the handles given to callers.
class JobCompletion {
public:
  void complete(JobOutcome outcome);
  [[nodiscard]] JobOutcome wait();
  [[nodiscard]] bool done() const;

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::optional<JobOutcome> outcome_;
};

class JobHandle {
public:
  JobHandle(std::string id, JobKind kind, std::shared_ptr<JobCompletion> completion);

  [[nodiscard]] const std::string &id() const { return id_; }
  [[nodiscard]] JobKind kind() const { return kind_; }
  /// Blocks until a worker has processed the job.
  [[nodiscard]] JobOutcome wait() const;
  [[nodiscard]] bool done() const;

private:
  std::string id_;
  JobKind kind_;
  std::shared_ptr<JobCompletion> completion_;
};

/// Lifecycle notifications, identical for every backend.
class JobListener {
public:
  virtual ~JobListener() = default;
  virtual void on_job_state(const std::string &job_id, JobKind kind, JobState state,
                            const std::string &detail) = 0;
};

} // namespace forkyard::jobs
