#include "forkyard/jobs/scheduler.hpp"

#include "forkyard/common/fs.hpp"
#include "forkyard/common/process.hpp"
#include "forkyard/observability/global.hpp"
#include "forkyard/sessions/checkpoint.hpp"

#include <sstream>
#include <type_traits>

namespace forkyard::jobs {

namespace {

constexpr const char *kFallbackWorkspaceName = "session";

sessions::ToolKind panel_tool(const sessions::ToolKind tool) {
  return tool == sessions::ToolKind::None ? sessions::ToolKind::Claude : tool;
}

} // namespace

std::uint32_t platform_session_concurrency() {
#ifdef __linux__
  return 1;
#else
  return 5;
#endif
}

JobScheduler::JobScheduler(SchedulerServices services, std::unique_ptr<JobBackend> backend,
                           SchedulerOptions options)
    : services_(std::move(services)), backend_(std::move(backend)), options_(options) {}

JobScheduler::~JobScheduler() { shutdown(); }

common::Status JobScheduler::start() {
  if (services_.store == nullptr || services_.sessions == nullptr ||
      services_.workspaces == nullptr || services_.resolver == nullptr ||
      services_.suggester == nullptr || services_.locks == nullptr ||
      services_.agents == nullptr) {
    return common::Status::error(common::ErrorKind::Configuration,
                                 "Job scheduler is missing a required service");
  }
  auto started = backend_->start(
      [this](const std::string &job_id, const Job &job) { return process(job_id, job); });
  if (started.ok()) {
    observability::log_info("jobs", "Job scheduler started on the " +
                                        std::string(backend_->name()) + " backend");
  }
  return started;
}

void JobScheduler::shutdown() {
  if (backend_ != nullptr) {
    backend_->shutdown();
  }
}

void JobScheduler::notify(const std::string &job_id, const JobKind kind, const JobState state,
                          const std::string &detail) {
  observability::record_job(job_id, std::string(to_string(kind)),
                            std::string(to_string(state)), detail);
  if (services_.listener != nullptr) {
    services_.listener->on_job_state(job_id, kind, state, detail);
  }
}

common::Result<JobHandle> JobScheduler::submit(Job job) {
  auto handle = backend_->enqueue(std::move(job));
  if (handle.ok()) {
    notify(handle.value().id(), handle.value().kind(), JobState::Waiting);
  }
  return handle;
}

common::Result<JobHandle> JobScheduler::create_session(CreateSessionJob job) {
  return submit(Job{std::move(job)});
}

common::Result<JobHandle> JobScheduler::send_input(const std::string &session_id,
                                                   const std::string &input) {
  return submit(Job{SendInputJob{.session_id = session_id, .input = input}});
}

common::Result<JobHandle> JobScheduler::continue_session(const std::string &session_id,
                                                         const std::string &prompt) {
  return submit(Job{ContinueSessionJob{.session_id = session_id, .prompt = prompt}});
}

common::Result<std::vector<JobHandle>> JobScheduler::submit_batch(CreateSessionJob job_template,
                                                                  const std::uint32_t count) {
  using BatchResult = common::Result<std::vector<JobHandle>>;
  if (count == 0) {
    return BatchResult::failure(common::ErrorKind::Configuration,
                                "Session count must be at least 1");
  }
  if (count == 1) {
    auto handle = create_session(std::move(job_template));
    if (!handle.ok()) {
      return BatchResult::failure(handle.details());
    }
    return BatchResult::success({handle.value()});
  }

  if (common::trim(job_template.name_template).empty()) {
    job_template.name_template = services_.suggester->suggest(job_template.prompt);
  }

  auto project = resolve_project(job_template.project_id);
  if (project.ok()) {
    job_template.project_id = project.value().id;
    auto folder = services_.store->create_folder(job_template.name_template, project.value().id);
    if (folder.ok()) {
      job_template.folder_id = folder.value().id;
      if (services_.sink != nullptr) {
        services_.sink->folder_created(folder.value());
      }
    } else {
      observability::log_warn("jobs", "Could not create a folder for the batch: " +
                                          folder.error());
    }
  } else {
    observability::log_warn("jobs", "Batch submitted without a resolvable project: " +
                                        project.error());
  }

  std::vector<JobHandle> handles;
  handles.reserve(count);
  for (std::uint32_t i = 0; i < count; ++i) {
    CreateSessionJob job = job_template;
    job.index = i;
    auto handle = create_session(std::move(job));
    if (!handle.ok()) {
      return BatchResult::failure(handle.details());
    }
    handles.push_back(handle.value());
  }
  return BatchResult::success(std::move(handles));
}

JobOutcome JobScheduler::process(const std::string &job_id, const Job &job) {
  const JobKind kind = job_kind(job);
  notify(job_id, kind, JobState::Active);

  std::optional<std::string> session_id;
  const common::Status status = std::visit(
      [&](const auto &value) -> common::Status {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, CreateSessionJob>) {
          return run_create(value, session_id);
        } else if constexpr (std::is_same_v<T, SendInputJob>) {
          return run_send_input(value);
        } else {
          return run_continue(value);
        }
      },
      job);

  if (status.ok()) {
    notify(job_id, kind, JobState::Completed, session_id.value_or(""));
    return JobOutcome{.state = JobState::Completed, .session_id = session_id};
  }

  observability::log_error("jobs", std::string(to_string(kind)) + " job " + job_id +
                                       " failed: " + status.details().describe());
  if (session_id.has_value()) {
    auto marked =
        services_.sessions->set_status(*session_id, sessions::VisibleStatus::Error, status.error());
    if (!marked.ok()) {
      observability::log_error("jobs", "Could not mark session " + *session_id +
                                           " as failed: " + marked.error());
    }
  }
  notify(job_id, kind, JobState::Failed, status.error());
  return JobOutcome{.state = JobState::Failed, .session_id = session_id, .error = status.details()};
}

common::Result<sessions::Project>
JobScheduler::resolve_project(const std::optional<std::int64_t> &project_id) const {
  if (project_id.has_value()) {
    return services_.store->get_project(*project_id);
  }
  auto active = services_.store->active_project();
  if (!active.ok()) {
    return common::Result<sessions::Project>::failure(active.details());
  }
  if (!active.value().has_value()) {
    return common::Result<sessions::Project>::failure(
        common::ErrorKind::Configuration,
        "No project specified and no active project selected");
  }
  return common::Result<sessions::Project>::success(*active.value());
}

common::Result<sessions::Session> JobScheduler::materialize(const CreateSessionJob &job,
                                                            const sessions::Project &project) {
  std::string display_name;
  std::string workspace_name;
  if (common::trim(job.name_template).empty()) {
    display_name = services_.suggester->suggest(job.prompt);
    workspace_name = naming::to_workspace_name(display_name);
  } else {
    display_name = job.name_template;
    workspace_name = naming::template_workspace_name(job.name_template);
  }
  if (workspace_name.empty()) {
    workspace_name = kFallbackWorkspaceName;
  }

  // Creation queues behind slower workers instead of failing; names are settled in order.
  return services_.locks->with_lock(sync::kSessionCreationLock, [&]() {
    using SessionResult = common::Result<sessions::Session>;
    auto names = services_.resolver->resolve(display_name, workspace_name, project, job.index);
    if (!names.ok()) {
      return SessionResult::failure(names.details());
    }
    observability::log_info("jobs", "Creating workspace " + names.value().workspace_name +
                                        " for session \"" + names.value().display_name + "\"");

    auto created = services_.workspaces->create(project.path, names.value().workspace_name,
                                                std::nullopt, job.base_branch,
                                                project.worktree_folder);
    if (!created.ok()) {
      return SessionResult::failure(created.details());
    }

    sessions::Session session;
    session.name = names.value().display_name;
    session.workspace_name = names.value().workspace_name;
    session.workspace_path = created.value().path.string();
    session.initial_prompt = job.prompt;
    session.base_branch = created.value().base_branch;
    session.base_commit = created.value().base_commit;
    session.status = sessions::PersistedStatus::Pending;
    session.project_id = project.id;
    session.folder_id = job.folder_id;
    session.tool = job.tool;
    session.commit_mode = job.commit_mode;
    session.auto_commit = job.auto_commit;
    return services_.store->create_session(std::move(session));
  }, sync::kWaitIndefinitely);
}

void JobScheduler::run_build_script(const sessions::Session &session,
                                    const sessions::Project &project) {
  if (!project.build_script.has_value() || common::trim(*project.build_script).empty()) {
    return;
  }
  auto report = [&](const std::string &message) {
    auto updated = services_.sessions->set_status_message(session.id, message);
    if (!updated.ok()) {
      observability::log_warn("jobs", "Could not update status of " + session.id + ": " +
                                          updated.error());
    }
  };

  report("Waiting for build script to complete...");
  common::ProcessOptions process_options;
  process_options.working_directory = session.workspace_path;
  process_options.timeout = options_.build_timeout;

  std::istringstream lines(*project.build_script);
  std::string command;
  while (std::getline(lines, command)) {
    command = common::trim(command);
    if (command.empty()) {
      continue;
    }
    report("Running build command: " + command);
    auto result = common::run_shell(command, process_options);
    if (!result.ok()) {
      report("Build script failed: " + result.error());
      return;
    }
    if (!result.value().success()) {
      const std::string reason = result.value().timed_out
                                     ? "timed out"
                                     : "exit " + std::to_string(result.value().exit_code);
      observability::log_warn("jobs", "Build command '" + command + "' failed (" + reason +
                                          "): " + result.value().combined_output());
      report("Build script failed: " + command + " (" + reason + ")");
      return;
    }
  }
  report("Build script completed");
}

common::Result<agents::Panel> JobScheduler::find_panel(const sessions::Session &session) const {
  auto found = services_.panels->find_panel(session.id, panel_tool(session.tool));
  if (!found.ok()) {
    return common::Result<agents::Panel>::failure(found.details());
  }
  if (!found.value().has_value()) {
    return common::Result<agents::Panel>::failure(
        common::ErrorKind::NotFound, "No " + std::string(sessions::to_string(panel_tool(session.tool))) +
                                         " panel found for session " + session.id);
  }
  return common::Result<agents::Panel>::success(*found.value());
}

common::Status JobScheduler::start_agent(const sessions::Session &session,
                                         const std::string &prompt) {
  auto running = services_.sessions->set_status(session.id, sessions::VisibleStatus::Running);
  if (!running.ok()) {
    return common::Status::error(running.details());
  }

  if (services_.panels == nullptr) {
    open_turn(running.value(), prompt);
    return close_failed_turn(session.id, services_.agents->start_session(running.value(), prompt));
  }

  agents::PanelWaiter waiter(services_.panels, options_.panel_wait_attempts,
                             options_.panel_wait_interval);
  auto panel = waiter.wait_for(session.id, session.tool);
  if (!panel.ok()) {
    return common::Status::error(panel.details());
  }
  auto recorded = services_.sessions->record_message(session.id, panel.value().id, "user", prompt);
  if (!recorded.ok()) {
    observability::log_warn("jobs", "Could not record the initial prompt for panel " +
                                        panel.value().id + ": " + recorded.error());
  }
  open_turn(running.value(), prompt);
  auto started = close_failed_turn(
      session.id, services_.agents->start_panel(panel.value(), running.value(), prompt));
  if (!started.ok()) {
    return common::Status::error(started.kind(), "Failed to start " +
                                                     std::string(sessions::to_string(session.tool)) +
                                                     " panel: " + started.error());
  }
  return started;
}

common::Status JobScheduler::run_create(const CreateSessionJob &job,
                                        std::optional<std::string> &session_id) {
  auto project = resolve_project(job.project_id);
  if (!project.ok()) {
    return common::Status::error(project.details());
  }

  auto session = materialize(job, project.value());
  if (!session.ok()) {
    return common::Status::error(session.details());
  }
  session_id = session.value().id;

  const bool has_prompt = !common::trim(job.prompt).empty();
  if (has_prompt) {
    auto recorded =
        services_.sessions->record_message(session.value().id, std::nullopt, "user", job.prompt);
    if (!recorded.ok()) {
      observability::log_warn("jobs", "Could not record the initial prompt for session " +
                                          session.value().id + ": " + recorded.error());
    }
  }

  if (services_.sink != nullptr) {
    services_.sink->session_created(session.value());
  }
  run_build_script(session.value(), project.value());

  if (!has_prompt || job.tool == sessions::ToolKind::None) {
    auto stopped = services_.sessions->set_status(session.value().id,
                                                  sessions::VisibleStatus::Stopped);
    if (!stopped.ok()) {
      return common::Status::error(stopped.details());
    }
    return common::Status::success();
  }
  return start_agent(session.value(), job.prompt);
}

common::Status JobScheduler::run_send_input(const SendInputJob &job) {
  auto session = services_.store->get_session(job.session_id);
  if (!session.ok()) {
    return common::Status::error(session.details());
  }
  if (services_.panels == nullptr) {
    return services_.agents->send_input(session.value(), job.input);
  }
  auto panel = find_panel(session.value());
  if (!panel.ok()) {
    return common::Status::error(panel.details());
  }
  return services_.agents->send_input_to_panel(panel.value(), job.input);
}

common::Status JobScheduler::run_continue(const ContinueSessionJob &job) {
  auto session = services_.store->get_session(job.session_id);
  if (!session.ok()) {
    return common::Status::error(session.details());
  }

  std::optional<agents::Panel> panel;
  if (services_.panels != nullptr) {
    auto found = find_panel(session.value());
    if (!found.ok()) {
      return common::Status::error(found.details());
    }
    panel = found.value();
  }

  const std::optional<std::string> panel_id =
      panel.has_value() ? std::optional<std::string>(panel->id) : std::nullopt;
  auto history = services_.sessions->history(session.value().id, panel_id);
  if (!history.ok()) {
    return common::Status::error(history.details());
  }
  auto recorded =
      services_.sessions->record_message(session.value().id, panel_id, "user", job.prompt);
  if (!recorded.ok()) {
    return common::Status::error(recorded.details());
  }

  auto running = services_.sessions->set_status(session.value().id,
                                                sessions::VisibleStatus::Running);
  if (!running.ok()) {
    return common::Status::error(running.details());
  }
  open_turn(running.value(), job.prompt);
  if (panel.has_value()) {
    return close_failed_turn(session.value().id,
                             services_.agents->continue_panel(*panel, running.value(),
                                                              history.value(), job.prompt));
  }
  return close_failed_turn(session.value().id,
                           services_.agents->continue_session(running.value(), history.value(),
                                                              job.prompt));
}

void JobScheduler::open_turn(const sessions::Session &session, const std::string &prompt) {
  if (services_.executions == nullptr) {
    return;
  }
  if (auto opened = services_.executions->start(session.id, session.workspace_path);
      !opened.ok()) {
    observability::log_warn("jobs", "Not tracking changes for session " + session.id + ": " +
                                        opened.error());
    return;
  }
  std::lock_guard<std::mutex> lock(turns_mutex_);
  turn_prompts_[session.id] = prompt;
}

common::Status JobScheduler::close_failed_turn(const std::string &session_id,
                                               common::Status status) {
  if (!status.ok() && services_.executions != nullptr) {
    services_.executions->cancel(session_id);
    std::lock_guard<std::mutex> lock(turns_mutex_);
    turn_prompts_.erase(session_id);
  }
  return status;
}

void JobScheduler::checkpoint_turn(const std::string &session_id, const std::string &prompt) {
  auto session = services_.store->get_session(session_id);
  if (!session.ok()) {
    observability::log_warn("jobs", "No checkpoint for session " + session_id + ": " +
                                        session.error());
    return;
  }
  auto sequence = services_.store->next_execution_sequence(session_id);
  const auto message = sessions::checkpoint_message(prompt, sequence.ok() ? sequence.value() : 0);
  auto committed =
      sessions::commit_checkpoint(*services_.workspaces->git(), session.value(), message);
  if (!committed.ok()) {
    observability::log_warn("jobs", "Checkpoint commit failed for session " + session_id + ": " +
                                        committed.error());
  }
}

common::Result<sessions::ExecutionDiff>
JobScheduler::complete_turn(const std::string &session_id) {
  if (services_.executions == nullptr) {
    return common::Result<sessions::ExecutionDiff>::failure(
        common::ErrorKind::Configuration, "Execution tracking is not enabled");
  }
  if (!services_.executions->is_tracking(session_id)) {
    return common::Result<sessions::ExecutionDiff>::failure(
        common::ErrorKind::NotFound, "No execution in progress for session " + session_id);
  }
  std::string prompt;
  {
    std::lock_guard<std::mutex> lock(turns_mutex_);
    if (const auto it = turn_prompts_.find(session_id); it != turn_prompts_.end()) {
      prompt = std::move(it->second);
      turn_prompts_.erase(it);
    }
  }
  // A failed checkpoint leaves the changes uncommitted; the diff still records them.
  checkpoint_turn(session_id, prompt);
  auto recorded = services_.executions->finish(session_id);
  if (recorded.ok()) {
    observability::log_info("jobs", "Recorded execution " +
                                        std::to_string(recorded.value().sequence) +
                                        " for session " + session_id);
  }
  return recorded;
}

} // namespace forkyard::jobs
