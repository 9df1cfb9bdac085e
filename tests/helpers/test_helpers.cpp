#include "tests/helpers/test_helpers.hpp"

#include "forkyard/common/fs.hpp"
#include "forkyard/common/process.hpp"

#include <cstdlib>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>

namespace forkyard::testing {

config::Config mock_config() {
  config::Config config;
  config.queue.backend = "local";
  config.queue.session_concurrency = 1;
  config.panels.wait_attempts = 3;
  config.panels.wait_interval_ms = 10;
  config.naming.provider = "fallback";
  config.observability.backend = "none";
  return config;
}

void MockHttpClient::set_response(const std::uint16_t status, std::string body) {
  response_ = naming::HttpReply{};
  response_.status = status;
  response_.body = std::move(body);
}

void MockHttpClient::set_network_error(std::string message) {
  response_ = naming::HttpReply{};
  response_.transport_error = std::move(message);
}

naming::HttpReply
MockHttpClient::post_json(const std::string &url, const naming::HttpHeaders &headers,
                          const std::string &body, std::uint64_t) {
  ++calls_;
  last_url_ = url;
  last_headers_ = headers;
  last_body_ = body;
  return response_;
}

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() / ("forkyard-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
  path_ = std::filesystem::canonical(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc);
  out << content;
}

std::filesystem::path write_git_wrapper(const std::filesystem::path &path,
                                        const std::string &prelude) {
  std::filesystem::create_directories(path.parent_path());
  {
    std::ofstream out(path, std::ios::trunc);
    out << "#!/bin/sh\n" << prelude << "\nexec git \"$@\"\n";
  }
  std::filesystem::permissions(path,
                               std::filesystem::perms::owner_all |
                                   std::filesystem::perms::group_read |
                                   std::filesystem::perms::group_exec,
                               std::filesystem::perm_options::replace);
  return path;
}

config::Config temp_config(const TempWorkspace &workspace) {
  auto config = mock_config();
  config.storage.database_path = (workspace.path() / "state" / "forkyard.db").string();

  std::error_code ec;
  std::filesystem::create_directories(workspace.path() / "state", ec);

  return config;
}

void ensure_git_identity() {
  setenv("GIT_AUTHOR_NAME", "Forkyard Tests", 1);
  setenv("GIT_AUTHOR_EMAIL", "tests@forkyard.invalid", 1);
  setenv("GIT_COMMITTER_NAME", "Forkyard Tests", 1);
  setenv("GIT_COMMITTER_EMAIL", "tests@forkyard.invalid", 1);
}

std::string git(const std::filesystem::path &cwd, const std::vector<std::string> &args) {
  ensure_git_identity();
  std::vector<std::string> argv = {"git"};
  argv.insert(argv.end(), args.begin(), args.end());
  common::ProcessOptions options;
  options.working_directory = cwd;
  auto result = common::run_process(argv, options);
  if (!result.ok()) {
    throw std::runtime_error("git could not start: " + result.error());
  }
  if (!result.value().success()) {
    throw std::runtime_error("git " + (args.empty() ? std::string() : args.front()) +
                             " failed: " + result.value().combined_output());
  }
  return common::trim(result.value().stdout_text);
}

void init_repository(const std::filesystem::path &root) {
  std::filesystem::create_directories(root);
  git(root, {"init", "-q"});
  git(root, {"symbolic-ref", "HEAD", "refs/heads/main"});
  git(root, {"config", "user.name", "Forkyard Tests"});
  git(root, {"config", "user.email", "tests@forkyard.invalid"});
  git(root, {"config", "commit.gpgsign", "false"});
  commit_file(root, "README.md", "# fixture\n", "Initial commit");
}

std::string commit_file(const std::filesystem::path &repo, const std::string &name,
                        const std::string &content, const std::string &message) {
  const auto file_path = repo / name;
  std::filesystem::create_directories(file_path.parent_path());
  {
    std::ofstream out(file_path, std::ios::trunc);
    out << content;
  }
  git(repo, {"add", "--", name});
  git(repo, {"commit", "-q", "-m", message});
  return git(repo, {"rev-parse", "HEAD"});
}

std::string read_file(const std::filesystem::path &path) {
  std::ifstream in(path);
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

void RecordingSink::session_created(const sessions::Session &session) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.push_back({"session_created", session.id, session.name});
}

void RecordingSink::session_updated(const sessions::Session &session) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.push_back({"session_updated", session.id, session.name});
}

void RecordingSink::session_deleted(const std::string &session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.push_back({"session_deleted", session_id, ""});
}

void RecordingSink::folder_created(const sessions::Folder &folder) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.push_back({"folder_created", folder.id, folder.name});
}

std::vector<RecordingSink::Entry> RecordingSink::entries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_;
}

std::size_t RecordingSink::count(const std::string &event) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t total = 0;
  for (const auto &entry : entries_) {
    if (entry.event == event) {
      ++total;
    }
  }
  return total;
}

void FakeAgentController::fail_with(const common::ErrorKind kind, std::string message) {
  std::lock_guard<std::mutex> lock(mutex_);
  failure_ = common::Error{.kind = kind, .message = std::move(message)};
}

common::Status FakeAgentController::record(std::string call, const std::size_t history_size) {
  std::lock_guard<std::mutex> lock(mutex_);
  calls_.push_back(std::move(call));
  last_history_size_ = history_size;
  if (failure_.has_value()) {
    return common::Status::error(*failure_);
  }
  return common::Status::success();
}

common::Status FakeAgentController::start_panel(const agents::Panel &panel,
                                                const sessions::Session &,
                                                const std::string &prompt) {
  return record("start_panel:" + panel.id + ":" + prompt);
}

common::Status
FakeAgentController::continue_panel(const agents::Panel &panel, const sessions::Session &,
                                    const std::vector<sessions::ConversationMessage> &history,
                                    const std::string &prompt) {
  return record("continue_panel:" + panel.id + ":" + prompt, history.size());
}

common::Status FakeAgentController::send_input_to_panel(const agents::Panel &panel,
                                                        const std::string &input) {
  return record("send_input_to_panel:" + panel.id + ":" + input);
}

common::Status FakeAgentController::start_session(const sessions::Session &session,
                                                  const std::string &prompt) {
  return record("start_session:" + session.id + ":" + prompt);
}

common::Status
FakeAgentController::continue_session(const sessions::Session &session,
                                      const std::vector<sessions::ConversationMessage> &history,
                                      const std::string &prompt) {
  return record("continue_session:" + session.id + ":" + prompt, history.size());
}

common::Status FakeAgentController::send_input(const sessions::Session &session,
                                               const std::string &input) {
  return record("send_input:" + session.id + ":" + input);
}

std::vector<std::string> FakeAgentController::calls() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return calls_;
}

std::size_t FakeAgentController::last_history_size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_history_size_;
}

FakePanelDirectory::FakePanelDirectory(const std::uint32_t appear_after, const bool enabled)
    : appear_after_(appear_after), enabled_(enabled) {}

common::Result<std::optional<agents::Panel>>
FakePanelDirectory::find_panel(const std::string &session_id,
                               const sessions::ToolKind tool) const {
  using Found = common::Result<std::optional<agents::Panel>>;
  std::lock_guard<std::mutex> lock(mutex_);
  const std::uint32_t seen = lookups_[session_id]++;
  if (!enabled_ || seen < appear_after_) {
    return Found::success(std::nullopt);
  }
  return Found::success(
      agents::Panel{.id = "panel-" + session_id, .session_id = session_id, .tool = tool});
}

std::uint32_t FakePanelDirectory::lookups(const std::string &session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = lookups_.find(session_id);
  return it == lookups_.end() ? 0 : it->second;
}

ServiceHarness::ServiceHarness() {
  project_root = temp.path() / "project";
  init_repository(project_root);

  store = std::make_shared<sessions::SqliteSessionStore>(temp.path() / "forkyard.db");
  if (auto opened = store->status(); !opened.ok()) {
    throw std::runtime_error("store did not open: " + opened.error());
  }
  sink = std::make_shared<RecordingSink>();
  locks = std::make_shared<sync::MutexRegistry>(std::chrono::seconds(30));
  git_runner = std::make_shared<workspace::GitRunner>();
  workspaces = std::make_shared<workspace::WorkspaceManager>(git_runner, "worktrees");
  sessions = std::make_shared<sessions::SessionManager>(store, workspaces, sink);
  resolver = std::make_shared<naming::NameResolver>(store, workspaces);
  suggester = std::make_shared<naming::FallbackNameSuggester>();
  agents = std::make_shared<FakeAgentController>();
  executions = std::make_shared<sessions::ExecutionTracker>(
      store, std::make_shared<workspace::DiffCapture>(git_runner), locks);

  auto created = store->create_project(sessions::NewProject{.name = "fixture",
                                                            .path = project_root.string(),
                                                            .worktree_folder = std::nullopt,
                                                            .build_script = std::nullopt,
                                                            .main_branch = "main"});
  if (!created.ok()) {
    throw std::runtime_error("project not created: " + created.error());
  }
  project = created.value();
}

jobs::SchedulerServices
ServiceHarness::services(std::shared_ptr<agents::PanelDirectory> panels) const {
  jobs::SchedulerServices services;
  services.store = store;
  services.sessions = sessions;
  services.workspaces = workspaces;
  services.resolver = resolver;
  services.suggester = suggester;
  services.locks = locks;
  services.sink = sink;
  services.agents = agents;
  services.panels = std::move(panels);
  services.executions = executions;
  return services;
}

} // namespace forkyard::testing
