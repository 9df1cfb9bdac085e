#pragma once

#include "forkyard/agents/panels.hpp"
#include "forkyard/common/result.hpp"
#include "forkyard/events/notifier.hpp"
#include "forkyard/jobs/backend.hpp"
#include "forkyard/jobs/job.hpp"
#include "forkyard/naming/resolver.hpp"
#include "forkyard/naming/suggester.hpp"
#include "forkyard/sessions/execution_tracker.hpp"
#include "forkyard/sessions/manager.hpp"
#include "forkyard/sessions/store.hpp"
#include "forkyard/sync/mutex_registry.hpp"
#include "forkyard/workspace/manager.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace forkyard::jobs {

/// Width of the create-session pool when the configuration leaves it at 0.
[[nodiscard]] std::uint32_t platform_session_concurrency();

struct SchedulerServices {
  std::shared_ptr<sessions::SessionStore> store;
  std::shared_ptr<sessions::SessionManager> sessions;
  std::shared_ptr<workspace::WorkspaceManager> workspaces;
  std::shared_ptr<naming::NameResolver> resolver;
  std::shared_ptr<naming::NameSuggester> suggester;
  std::shared_ptr<sync::MutexRegistry> locks;
  std::shared_ptr<events::NotificationSink> sink;
  std::shared_ptr<agents::AgentController> agents;
  /// Optional. When set, agents are addressed through their panels.
  std::shared_ptr<agents::PanelDirectory> panels;
  std::shared_ptr<JobListener> listener;
  /// Optional. When set, every agent start or continuation opens an execution turn.
  std::shared_ptr<sessions::ExecutionTracker> executions;
};

struct SchedulerOptions {
  std::uint32_t panel_wait_attempts = 15;
  std::chrono::milliseconds panel_wait_interval{200};
  std::chrono::milliseconds build_timeout{std::chrono::minutes(10)};
};

class JobScheduler {
public:
  JobScheduler(SchedulerServices services, std::unique_ptr<JobBackend> backend,
               SchedulerOptions options = {});
  ~JobScheduler();

  JobScheduler(const JobScheduler &) = delete;
  JobScheduler &operator=(const JobScheduler &) = delete;

  [[nodiscard]] common::Status start();

  [[nodiscard]] common::Result<JobHandle> submit(Job job);

  /// Creates `count` sessions from one template. With more than one session the name is
  /// generated once, a folder groups the batch and each job carries its index.
  [[nodiscard]] common::Result<std::vector<JobHandle>> submit_batch(CreateSessionJob job_template,
                                                                    std::uint32_t count);

  [[nodiscard]] common::Result<JobHandle> create_session(CreateSessionJob job);
  [[nodiscard]] common::Result<JobHandle> send_input(const std::string &session_id,
                                                     const std::string &input);
  [[nodiscard]] common::Result<JobHandle> continue_session(const std::string &session_id,
                                                           const std::string &prompt);

  /// Closes the session's open turn and stores its execution diff. Called by the agent host
  /// when the agent finishes a prompt. Sessions in checkpoint mode with auto-commit get their
  /// changes committed first, so the diff spans the checkpoint commit.
  [[nodiscard]] common::Result<sessions::ExecutionDiff> complete_turn(const std::string &session_id);

  void shutdown();

  [[nodiscard]] const JobBackend &backend() const { return *backend_; }

private:
  JobOutcome process(const std::string &job_id, const Job &job);
  void notify(const std::string &job_id, JobKind kind, JobState state,
              const std::string &detail = "");

  [[nodiscard]] common::Status run_create(const CreateSessionJob &job,
                                          std::optional<std::string> &session_id);
  [[nodiscard]] common::Status run_send_input(const SendInputJob &job);
  [[nodiscard]] common::Status run_continue(const ContinueSessionJob &job);

  [[nodiscard]] common::Result<sessions::Project>
  resolve_project(const std::optional<std::int64_t> &project_id) const;
  [[nodiscard]] common::Result<sessions::Session>
  materialize(const CreateSessionJob &job, const sessions::Project &project);
  void run_build_script(const sessions::Session &session, const sessions::Project &project);
  [[nodiscard]] common::Status start_agent(const sessions::Session &session,
                                           const std::string &prompt);
  [[nodiscard]] common::Result<agents::Panel> find_panel(const sessions::Session &session) const;
  void open_turn(const sessions::Session &session, const std::string &prompt);
  void checkpoint_turn(const std::string &session_id, const std::string &prompt);
  [[nodiscard]] common::Status close_failed_turn(const std::string &session_id,
                                                 common::Status status);

  SchedulerServices services_;
  std::unique_ptr<JobBackend> backend_;
  SchedulerOptions options_;

  std::mutex turns_mutex_;
  /// Prompt of each open turn, used for its checkpoint commit message.
  std::unordered_map<std::string, std::string> turn_prompts_;
};

} // namespace forkyard::jobs
