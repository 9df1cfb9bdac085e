#include "forkyard/cli/commands.hpp"

#include "forkyard/common/fs.hpp"
#include "forkyard/config/config.hpp"
#include "forkyard/events/notifier.hpp"
#include "forkyard/runtime/app.hpp"
#include "forkyard/sessions/checkpoint.hpp"
#include "forkyard/sessions/state_machine.hpp"

#include <charconv>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace forkyard::cli {

namespace {

std::string version_string() {
#ifdef FORKYARD_VERSION
  std::string version = FORKYARD_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "forkyard " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

template <typename Int> bool parse_number(const std::string &text, Int &out) {
  const auto *end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), end, out);
  return ec == std::errc() && ptr == end;
}

int report(const common::Error &error) {
  std::cerr << "error (" << common::error_kind_name(error.kind) << "): " << error.describe()
            << "\n";
  if (error.diagnostics.has_value() && !error.diagnostics->working_directory.empty()) {
    std::cerr << "  in " << error.diagnostics->working_directory << "\n";
  }
  return 1;
}

int report(const common::Status &status) { return report(status.details()); }

common::Result<runtime::RuntimeContext>
open_runtime(std::shared_ptr<events::NotificationSink> sink = nullptr) {
  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    return context;
  }
  if (auto initialized = context.value().initialize(std::move(sink)); !initialized.ok()) {
    return common::Result<runtime::RuntimeContext>::failure(initialized.details());
  }
  return context;
}

common::Result<sessions::Project> active_project(const runtime::RuntimeContext &context) {
  auto active = context.store()->active_project();
  if (!active.ok()) {
    return common::Result<sessions::Project>::failure(active.details());
  }
  if (!active.value().has_value()) {
    return common::Result<sessions::Project>::failure(
        common::ErrorKind::Configuration, "No active project. Run: forkyard project add <path>");
  }
  return common::Result<sessions::Project>::success(*active.value());
}

void print_session_line(const sessions::Session &session) {
  std::cout << session.id << "  " << sessions::to_string(sessions::visible_status(session))
            << "  " << session.name << "  [" << session.workspace_name << "]";
  if (!session.status_message.empty()) {
    std::cout << "  " << session.status_message;
  }
  std::cout << "\n";
}

int run_project(std::vector<std::string> args) {
  if (args.empty()) {
    std::cerr << "Usage: forkyard project add|list|activate\n";
    return 1;
  }
  const std::string action = args[0];
  args.erase(args.begin());

  auto context = open_runtime();
  if (!context.ok()) {
    return report(context.details());
  }
  auto &store = context.value().store();

  if (action == "add") {
    sessions::NewProject project;
    std::string value;
    if (take_option(args, "--name", "-n", value)) {
      project.name = value;
    }
    if (take_option(args, "--folder", "", value)) {
      project.worktree_folder = value;
    }
    if (take_option(args, "--build-script", "", value)) {
      project.build_script = value;
    }
    if (args.empty()) {
      std::cerr << "Usage: forkyard project add <path> [--name N] [--folder F] "
                   "[--build-script CMDS]\n";
      return 1;
    }
    const auto path =
        std::filesystem::absolute(common::expand_path(args[0])).lexically_normal();
    if (project.name.empty()) {
      project.name = path.filename().string();
    }
    project.path = path.string();
    auto branch = context.value().workspaces()->main_branch(path);
    if (branch.ok()) {
      project.main_branch = branch.value();
    }
    auto created = store->create_project(project);
    if (!created.ok()) {
      return report(created.details());
    }
    std::cout << "Added project " << created.value().id << ": " << created.value().name << " ("
              << created.value().path << ")\n";
    return 0;
  }

  if (action == "list") {
    auto projects = store->list_projects();
    if (!projects.ok()) {
      return report(projects.details());
    }
    for (const auto &project : projects.value()) {
      std::cout << (project.active ? "* " : "  ") << project.id << "  " << project.name << "  "
                << project.path << "\n";
    }
    return 0;
  }

  if (action == "activate") {
    std::int64_t id = 0;
    if (args.empty() || !parse_number(args[0], id)) {
      std::cerr << "Usage: forkyard project activate <id>\n";
      return 1;
    }
    if (auto status = store->set_active_project(id); !status.ok()) {
      return report(status);
    }
    std::cout << "Active project: " << id << "\n";
    return 0;
  }

  std::cerr << "Unknown project command: " << action << "\n";
  return 1;
}

int run_workspace(std::vector<std::string> args) {
  if (args.empty()) {
    std::cerr << "Usage: forkyard workspace create|remove|list|branches\n";
    return 1;
  }
  const std::string action = args[0];
  args.erase(args.begin());

  auto context = open_runtime();
  if (!context.ok()) {
    return report(context.details());
  }
  auto project = active_project(context.value());
  if (!project.ok()) {
    return report(project.details());
  }
  const auto &workspaces = context.value().workspaces();
  const std::filesystem::path root = project.value().path;

  if (action == "create") {
    std::string branch;
    std::string base;
    const bool has_branch = take_option(args, "--branch", "-b", branch);
    const bool has_base = take_option(args, "--base", "", base);
    if (args.empty()) {
      std::cerr << "Usage: forkyard workspace create <name> [--branch B] [--base B]\n";
      return 1;
    }
    auto created = workspaces->create(
        root, args[0], has_branch ? std::optional<std::string>(branch) : std::nullopt,
        has_base ? std::optional<std::string>(base) : std::nullopt,
        project.value().worktree_folder);
    if (!created.ok()) {
      return report(created.details());
    }
    std::cout << "Created " << created.value().path.string() << " on branch "
              << created.value().branch << " from " << created.value().base_branch << " @ "
              << created.value().base_commit << "\n";
    return 0;
  }

  if (action == "remove") {
    if (args.empty()) {
      std::cerr << "Usage: forkyard workspace remove <name>\n";
      return 1;
    }
    if (auto removed = workspaces->remove(root, args[0], project.value().worktree_folder);
        !removed.ok()) {
      return report(removed);
    }
    std::cout << "Removed " << args[0] << "\n";
    return 0;
  }

  if (action == "list") {
    auto entries = workspaces->list(root);
    if (!entries.ok()) {
      return report(entries.details());
    }
    for (const auto &entry : entries.value()) {
      std::cout << entry.path.string() << "  " << (entry.branch.empty() ? "(detached)" : entry.branch)
                << "\n";
    }
    return 0;
  }

  if (action == "branches") {
    auto branches = workspaces->list_branches(root);
    if (!branches.ok()) {
      return report(branches.details());
    }
    for (const auto &branch : branches.value()) {
      std::cout << (branch.is_current ? "* " : "  ") << branch.name
                << (branch.has_worktree ? "  (worktree)" : "") << "\n";
    }
    return 0;
  }

  std::cerr << "Unknown workspace command: " << action << "\n";
  return 1;
}

int create_sessions(runtime::RuntimeContext &context, std::vector<std::string> args) {
  jobs::CreateSessionJob job;
  std::string value;
  std::uint32_t count = 1;
  if (take_option(args, "--count", "-c", value) && !parse_number(value, count)) {
    std::cerr << "Invalid --count: " << value << "\n";
    return 1;
  }
  if (take_option(args, "--name", "-n", value)) {
    job.name_template = value;
  }
  if (take_option(args, "--base", "", value)) {
    job.base_branch = value;
  }
  if (take_option(args, "--tool", "-t", value)) {
    const auto tool = sessions::parse_tool_kind(value);
    if (!tool.has_value()) {
      std::cerr << "Unknown tool: " << value << " (claude, codex, none)\n";
      return 1;
    }
    job.tool = *tool;
  }
  if (take_option(args, "--commit-mode", "", value)) {
    const auto mode = sessions::parse_commit_mode(value);
    if (!mode.has_value()) {
      std::cerr << "Unknown commit mode: " << value << " (disabled, checkpoint, structured)\n";
      return 1;
    }
    job.commit_mode = *mode;
  }
  if (take_option(args, "--project", "-p", value)) {
    std::int64_t project_id = 0;
    if (!parse_number(value, project_id)) {
      std::cerr << "Invalid --project: " << value << "\n";
      return 1;
    }
    job.project_id = project_id;
  }
  job.auto_commit = !take_flag(args, "--no-auto-commit");
  job.prompt = join_tokens(args);

  auto scheduler = context.create_scheduler();
  if (!scheduler.ok()) {
    return report(scheduler.details());
  }
  auto handles = scheduler.value()->submit_batch(std::move(job), count);
  if (!handles.ok()) {
    return report(handles.details());
  }

  int exit_code = 0;
  for (const auto &handle : handles.value()) {
    const auto outcome = handle.wait();
    if (!outcome.ok()) {
      exit_code = 1;
      if (outcome.error.has_value()) {
        report(*outcome.error);
      }
      continue;
    }
    if (outcome.session_id.has_value()) {
      auto session = context.store()->get_session(*outcome.session_id);
      if (session.ok()) {
        print_session_line(session.value());
        std::cout << "  " << session.value().workspace_path << "\n";
      }
    }
  }
  scheduler.value()->shutdown();
  return exit_code;
}

int run_session(std::vector<std::string> args) {
  if (args.empty()) {
    std::cerr << "Usage: forkyard session create|list|view|archive|history|record|diffs\n";
    return 1;
  }
  const std::string action = args[0];
  args.erase(args.begin());

  // --jsonl streams session notifications to stdout next to the log observer.
  std::shared_ptr<events::NotificationSink> sink;
  if (take_flag(args, "--jsonl")) {
    auto fanout = std::make_shared<events::FanoutNotificationSink>();
    fanout->add(std::make_shared<events::ObserverNotificationSink>());
    fanout->add(std::make_shared<events::JsonlNotificationSink>(std::cout));
    sink = std::move(fanout);
  }

  auto context = open_runtime(std::move(sink));
  if (!context.ok()) {
    return report(context.details());
  }
  const auto &manager = context.value().sessions();

  if (action == "create") {
    return create_sessions(context.value(), std::move(args));
  }

  if (action == "list") {
    const bool include_archived = take_flag(args, "--all");
    std::optional<std::int64_t> project_id;
    auto project = active_project(context.value());
    if (project.ok()) {
      project_id = project.value().id;
    }
    auto listed = manager->list(project_id, include_archived);
    if (!listed.ok()) {
      return report(listed.details());
    }
    for (const auto &session : listed.value()) {
      print_session_line(session);
    }
    return 0;
  }

  if (args.empty()) {
    std::cerr << "Usage: forkyard session " << action << " <session-id>\n";
    return 1;
  }
  const std::string id = args[0];

  if (action == "view") {
    auto viewed = manager->mark_viewed(id);
    if (!viewed.ok()) {
      return report(viewed.details());
    }
    const auto &session = viewed.value();
    std::cout << "Session:   " << session.name << " (" << session.id << ")\n";
    std::cout << "Status:    " << sessions::to_string(sessions::visible_status(session)) << "\n";
    std::cout << "Workspace: " << session.workspace_path << "\n";
    std::cout << "Base:      " << session.base_branch << " @ " << session.base_commit << "\n";
    auto divergence =
        context.value().workspaces()->ahead_behind(session.workspace_path, session.base_branch);
    if (divergence.ok()) {
      std::cout << "Ahead:     " << divergence.value().ahead << "  Behind: "
                << divergence.value().behind << "\n";
    }
    if (!session.status_message.empty()) {
      std::cout << "Message:   " << session.status_message << "\n";
    }
    return 0;
  }

  if (action == "archive") {
    if (auto archived = manager->archive(id); !archived.ok()) {
      return report(archived);
    }
    std::cout << "Archived " << id << "\n";
    return 0;
  }

  if (action == "history") {
    auto history = manager->history(id);
    if (!history.ok()) {
      return report(history.details());
    }
    for (const auto &message : history.value()) {
      std::cout << "[" << message.created_at << "] " << message.role << ": " << message.content
                << "\n";
    }
    return 0;
  }

  if (action == "record") {
    auto session = context.value().store()->get_session(id);
    if (!session.ok()) {
      return report(session.details());
    }
    auto previous = context.value().store()->list_execution_diffs(id);
    if (!previous.ok()) {
      return report(previous.details());
    }
    // A manual turn starts where the last recorded one ended.
    std::optional<std::string> since;
    if (!previous.value().empty()) {
      since = previous.value().back().after_commit;
    } else if (!session.value().base_commit.empty()) {
      since = session.value().base_commit;
    }
    const auto &executions = context.value().executions();
    if (auto opened = executions->start(id, session.value().workspace_path, since);
        !opened.ok()) {
      return report(opened);
    }
    const auto message = sessions::checkpoint_message(
        "", static_cast<std::int64_t>(previous.value().size()) + 1);
    auto checkpoint = sessions::commit_checkpoint(*context.value().workspaces()->git(),
                                                  session.value(), message);
    if (!checkpoint.ok()) {
      executions->cancel(id);
      return report(checkpoint.details());
    }
    if (checkpoint.value().has_value()) {
      std::cout << "Committed " << checkpoint.value()->substr(0, 8) << " " << message << "\n";
    }
    auto recorded = executions->finish(id);
    if (!recorded.ok()) {
      return report(recorded.details());
    }
    std::cout << "Recorded execution " << recorded.value().sequence << ": +"
              << recorded.value().additions << " -" << recorded.value().deletions << " in "
              << recorded.value().files_changed_count << " files\n";
    return 0;
  }

  if (action == "diffs") {
    auto diffs = context.value().store()->list_execution_diffs(id);
    if (!diffs.ok()) {
      return report(diffs.details());
    }
    for (const auto &diff : diffs.value()) {
      std::cout << "#" << diff.sequence << "  " << diff.before_commit.substr(0, 8) << ".."
                << diff.after_commit.substr(0, 8) << "  +" << diff.additions << " -"
                << diff.deletions << "  " << diff.files_changed_count << " files\n";
      for (const auto &file : diff.files_changed) {
        std::cout << "    " << file << "\n";
      }
    }
    return 0;
  }

  std::cerr << "Unknown session command: " << action << "\n";
  return 1;
}

struct SessionTarget {
  sessions::Session session;
  sessions::Project project;
};

common::Result<SessionTarget> load_target(const runtime::RuntimeContext &context,
                                          const std::string &id) {
  auto session = context.store()->get_session(id);
  if (!session.ok()) {
    return common::Result<SessionTarget>::failure(session.details());
  }
  auto project = context.store()->get_project(session.value().project_id);
  if (!project.ok()) {
    return common::Result<SessionTarget>::failure(project.details());
  }
  return common::Result<SessionTarget>::success(
      SessionTarget{.session = session.value(), .project = project.value()});
}

void print_outcome(const workspace::ReconcileOutcome &outcome) {
  for (const auto &command : outcome.commands) {
    std::cout << "  $ " << command << "\n";
  }
  if (outcome.divergence.has_value()) {
    std::cout << "Ahead: " << outcome.divergence->ahead
              << "  Behind: " << outcome.divergence->behind << "\n";
  }
}

int run_reconcile(const std::string &command, std::vector<std::string> args) {
  std::string message;
  const bool has_message = take_option(args, "--message", "-m", message);
  if (args.empty()) {
    std::cerr << "Usage: forkyard " << command << " <session-id>"
              << (command == "squash" ? " -m MESSAGE" : "") << "\n";
    return 1;
  }
  if (command == "squash" && (!has_message || common::trim(message).empty())) {
    std::cerr << "squash requires a commit message (-m)\n";
    return 1;
  }

  auto context = open_runtime();
  if (!context.ok()) {
    return report(context.details());
  }
  auto target = load_target(context.value(), args[0]);
  if (!target.ok()) {
    return report(target.details());
  }
  const auto &session = target.value().session;
  const std::filesystem::path workspace_path = session.workspace_path;
  const std::filesystem::path project_path = target.value().project.path;
  auto &reconciler = context.value().reconciler();

  if (command == "conflicts") {
    auto report_result = reconciler->detect_conflicts(workspace_path, session.base_branch);
    if (!report_result.ok()) {
      return report(report_result.details());
    }
    const auto &conflicts = report_result.value();
    if (!conflicts.has_conflicts) {
      std::cout << "No conflicts with " << session.base_branch << "\n";
      return 0;
    }
    std::cout << "Conflicts with " << session.base_branch << ":\n";
    for (const auto &file : conflicts.conflicting_files) {
      std::cout << "  " << file << "\n";
    }
    std::cout << "Commits only in workspace:\n";
    for (const auto &commit : conflicts.ours_commits) {
      std::cout << "  " << commit << "\n";
    }
    std::cout << "Commits only in " << session.base_branch << ":\n";
    for (const auto &commit : conflicts.theirs_commits) {
      std::cout << "  " << commit << "\n";
    }
    return 2;
  }

  common::Result<workspace::ReconcileOutcome> outcome =
      command == "rebase-from-main"
          ? reconciler->rebase_main_into_workspace(workspace_path, session.base_branch)
      : command == "rebase-to-main"
          ? reconciler->rebase_to_main(project_path, workspace_path, session.base_branch)
          : reconciler->squash_and_rebase_to_main(project_path, workspace_path,
                                                  session.base_branch, message);
  if (!outcome.ok()) {
    return report(outcome.details());
  }
  print_outcome(outcome.value());
  return 0;
}

int run_config(std::vector<std::string> args) {
  const std::string action = args.empty() ? "show" : args[0];
  if (action == "path") {
    auto path = config::config_path();
    if (!path.ok()) {
      return report(path.details());
    }
    std::cout << path.value().string() << "\n";
    return 0;
  }
  if (action != "show") {
    std::cerr << "Usage: forkyard config show|path\n";
    return 1;
  }
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return report(loaded.details());
  }
  std::cout << config::render_config(loaded.value(), false);
  auto validated = config::validate_config(loaded.value());
  if (!validated.ok()) {
    return report(validated.details());
  }
  for (const auto &warning : validated.value()) {
    std::cerr << "warning: " << warning << "\n";
  }
  return 0;
}

} // namespace

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "Usage: forkyard [--config PATH] <command> [options]\n\n";
  std::cout << "Projects:\n";
  std::cout << "  project add <path> [--name N] [--folder F] [--build-script CMDS]\n";
  std::cout << "  project list\n";
  std::cout << "  project activate <id>\n\n";
  std::cout << "Workspaces (active project):\n";
  std::cout << "  workspace create <name> [--branch B] [--base B]\n";
  std::cout << "  workspace remove <name>\n";
  std::cout << "  workspace list\n";
  std::cout << "  workspace branches\n\n";
  std::cout << "Sessions:\n";
  std::cout << "  session create [--count N] [--name T] [--base B] [--tool claude|codex|none]\n";
  std::cout << "                 [--commit-mode M] [--project ID] [--no-auto-commit] [--jsonl]\n";
  std::cout << "                 PROMPT\n";
  std::cout << "  session list [--all]\n";
  std::cout << "  session view <id>\n";
  std::cout << "  session archive <id>\n";
  std::cout << "  session history <id>\n";
  std::cout << "  session record <id>\n";
  std::cout << "  session diffs <id>\n\n";
  std::cout << "Reconciliation:\n";
  std::cout << "  conflicts <session>\n";
  std::cout << "  rebase-from-main <session>\n";
  std::cout << "  rebase-to-main <session>\n";
  std::cout << "  squash <session> -m MESSAGE\n\n";
  std::cout << "Other:\n";
  std::cout << "  config show|path\n";
  std::cout << "  version\n";
}

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "project") {
    return run_project(std::move(args));
  }
  if (subcommand == "workspace") {
    return run_workspace(std::move(args));
  }
  if (subcommand == "session") {
    return run_session(std::move(args));
  }
  if (subcommand == "conflicts" || subcommand == "rebase-from-main" ||
      subcommand == "rebase-to-main" || subcommand == "squash") {
    return run_reconcile(subcommand, std::move(args));
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace forkyard::cli
