#include "forkyard/workspace/manager.hpp"

#include "forkyard/common/fs.hpp"
#include "forkyard/observability/global.hpp"

#include <algorithm>
#include <charconv>
#include <sstream>

namespace forkyard::workspace {

namespace {

constexpr const char *kComponent = "workspace";

common::Status validate_name(const std::string &name) {
  if (common::trim(name).empty()) {
    return common::Status::error(common::ErrorKind::Configuration,
                                 "Workspace name must not be empty");
  }
  if (name.find('/') != std::string::npos || name.find('\\') != std::string::npos ||
      name == "." || name == "..") {
    return common::Status::error(common::ErrorKind::Configuration,
                                 "Invalid workspace name: " + name);
  }
  return common::Status::success();
}

bool is_missing_worktree_message(const std::string &text) {
  return common::contains(text, "is not a working tree") ||
         common::contains(text, "does not exist") ||
         common::contains(text, "No such file or directory");
}

std::uint32_t parse_count(const std::string &text) {
  std::uint32_t value = 0;
  const auto trimmed = common::trim(text);
  std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), value);
  return value;
}

} // namespace

WorkspaceManager::WorkspaceManager(std::shared_ptr<GitRunner> git, std::string default_folder)
    : git_(std::move(git)), default_folder_(std::move(default_folder)) {
  if (default_folder_.empty()) {
    default_folder_ = "worktrees";
  }
}

std::filesystem::path
WorkspaceManager::workspace_path(const std::filesystem::path &project_root,
                                 const std::string &name,
                                 const std::optional<std::string> &subfolder) const {
  const std::string folder =
      subfolder.has_value() && !common::trim(*subfolder).empty() ? *subfolder : default_folder_;
  const std::filesystem::path folder_path(folder);
  const std::filesystem::path base =
      folder_path.is_absolute() ? folder_path : std::filesystem::absolute(project_root) / folder_path;
  return (base / name).lexically_normal();
}

common::Status WorkspaceManager::ensure_repository(const std::filesystem::path &project_root,
                                                   GitTranscript &transcript) {
  auto inside = git_->probe(project_root, {"rev-parse", "--is-inside-work-tree"}, &transcript);
  if (!inside.ok()) {
    return common::Status::error(inside.details());
  }
  if (!inside.value().ok() || inside.value().text() != "true") {
    observability::log_info(kComponent, "Initializing git repository in " + project_root.string());
    if (auto init = git_->run(project_root, {"init"}, &transcript); !init.ok()) {
      return common::Status::error(init.details());
    }
  }

  auto head = git_->probe(project_root, {"rev-parse", "--verify", "HEAD"}, &transcript);
  if (!head.ok()) {
    return common::Status::error(head.details());
  }
  if (head.value().ok()) {
    return common::Status::success();
  }

  observability::log_info(kComponent, "No commits in " + project_root.string() +
                                          ", creating initial commit");
  if (auto add = git_->probe(project_root, {"add", "-A"}, &transcript); !add.ok()) {
    return common::Status::error(add.details());
  }
  if (auto commit =
          git_->run(project_root, {"commit", "--allow-empty", "-m", "Initial commit"}, &transcript);
      !commit.ok()) {
    return common::Status::error(commit.details());
  }
  return common::Status::success();
}

bool WorkspaceManager::branch_exists(const std::filesystem::path &project_root,
                                     const std::string &branch, GitTranscript *transcript) const {
  auto result = git_->probe(project_root, {"show-ref", "--verify", "--quiet", "refs/heads/" + branch},
                            transcript);
  return result.ok() && result.value().ok();
}

common::Result<WorkspaceInfo>
WorkspaceManager::create(const std::filesystem::path &project_root, const std::string &name,
                         const std::optional<std::string> &branch,
                         const std::optional<std::string> &base_branch,
                         const std::optional<std::string> &subfolder) {
  if (auto valid = validate_name(name); !valid.ok()) {
    return common::Result<WorkspaceInfo>::failure(valid.details());
  }

  const std::filesystem::path root = std::filesystem::absolute(project_root).lexically_normal();
  const std::filesystem::path path = workspace_path(root, name, subfolder);
  const std::string branch_name = branch.has_value() && !branch->empty() ? *branch : name;
  GitTranscript transcript;

  const auto fail = [&](const common::Error &cause) {
    observability::record_workspace("create", path.string(), branch_name, false);
    common::Error error = cause;
    error.message = "Failed to create worktree: " + cause.message;
    if (!error.diagnostics.has_value()) {
      error.diagnostics = transcript.diagnostics(root, root);
    }
    return common::Result<WorkspaceInfo>::failure(std::move(error));
  };

  std::error_code ec;
  std::filesystem::create_directories(root, ec);
  if (ec) {
    return fail(common::Error{.kind = common::ErrorKind::External,
                              .message = "cannot create " + root.string() + ": " + ec.message()});
  }

  if (auto repo = ensure_repository(root, transcript); !repo.ok()) {
    return fail(repo.details());
  }

  // Stale worktree registrations and leftover directories at the target path.
  (void)git_->probe(root, {"worktree", "remove", "--force", path.string()}, &transcript);
  if (std::filesystem::exists(path, ec)) {
    std::filesystem::remove_all(path, ec);
    if (ec) {
      return fail(common::Error{.kind = common::ErrorKind::External,
                                .message = "cannot clear " + path.string() + ": " + ec.message()});
    }
  }
  if (auto prune = git_->run(root, {"worktree", "prune"}, &transcript); !prune.ok()) {
    return fail(prune.details());
  }

  std::filesystem::create_directories(path.parent_path(), ec);
  if (ec) {
    return fail(common::Error{.kind = common::ErrorKind::External,
                              .message = "cannot create " + path.parent_path().string() + ": " +
                                         ec.message()});
  }

  WorkspaceInfo info;
  info.path = path;
  info.branch = branch_name;

  if (branch_exists(root, branch_name, &transcript)) {
    auto tip = git_->run(root, {"rev-parse", "refs/heads/" + branch_name + "^{commit}"}, &transcript);
    if (!tip.ok()) {
      return fail(tip.details());
    }
    info.base_commit = tip.value().text();
    if (auto add = git_->run(root, {"worktree", "add", path.string(), branch_name}, &transcript);
        !add.ok()) {
      return fail(add.details());
    }
  } else {
    std::string base_ref = "HEAD";
    if (base_branch.has_value() && !base_branch->empty()) {
      if (!branch_exists(root, *base_branch, &transcript)) {
        return fail(common::Error{.kind = common::ErrorKind::Configuration,
                                  .message = "Base branch '" + *base_branch + "' does not exist"});
      }
      base_ref = "refs/heads/" + *base_branch;
    }
    auto commit = git_->run(root, {"rev-parse", base_ref + "^{commit}"}, &transcript);
    if (!commit.ok()) {
      return fail(commit.details());
    }
    info.base_commit = commit.value().text();
    if (auto add = git_->run(root, {"worktree", "add", "-b", branch_name, path.string(),
                                    info.base_commit},
                             &transcript);
        !add.ok()) {
      return fail(add.details());
    }
  }

  if (base_branch.has_value() && !base_branch->empty()) {
    info.base_branch = *base_branch;
  } else {
    auto current = git_->run(root, {"branch", "--show-current"}, &transcript);
    info.base_branch = current.ok() && !current.value().text().empty() ? current.value().text()
                                                                        : "HEAD";
  }

  observability::record_workspace("create", path.string(), branch_name, true);
  return common::Result<WorkspaceInfo>::success(std::move(info));
}

common::Status WorkspaceManager::remove(const std::filesystem::path &project_root,
                                        const std::string &name,
                                        const std::optional<std::string> &subfolder) {
  if (auto valid = validate_name(name); !valid.ok()) {
    return valid;
  }
  const std::filesystem::path root = std::filesystem::absolute(project_root).lexically_normal();
  const std::filesystem::path path = workspace_path(root, name, subfolder);
  GitTranscript transcript;

  auto removed = git_->probe(root, {"worktree", "remove", "--force", path.string()}, &transcript);
  if (!removed.ok()) {
    return common::Status::error(removed.details());
  }
  if (!removed.value().ok()) {
    const std::string message = removed.value().combined();
    if (!is_missing_worktree_message(message)) {
      observability::record_workspace("remove", path.string(), "", false);
      return common::Status::error(common::Error{
          .kind = common::ErrorKind::External,
          .message = "Failed to remove worktree: " + common::trim(message),
          .diagnostics = transcript.diagnostics(root, root)});
    }
    observability::log_debug(kComponent, "Worktree " + path.string() + " already removed");
    (void)git_->probe(root, {"worktree", "prune"}, &transcript);
  }

  observability::record_workspace("remove", path.string(), "", true);
  return common::Status::success();
}

common::Result<std::vector<WorktreeEntry>>
WorkspaceManager::list(const std::filesystem::path &project_root) const {
  auto output = git_->run(project_root, {"worktree", "list", "--porcelain"});
  if (!output.ok()) {
    return common::Result<std::vector<WorktreeEntry>>::failure(output.details());
  }

  std::vector<WorktreeEntry> entries;
  std::optional<WorktreeEntry> current;
  const auto flush = [&entries, &current] {
    if (current.has_value() && !current->branch.empty()) {
      entries.push_back(std::move(*current));
    }
    current.reset();
  };

  for (const auto &line : common::split_lines(output.value().stdout_text)) {
    if (common::starts_with(line, "worktree ")) {
      flush();
      current = WorktreeEntry{.path = line.substr(9), .branch = "", .head = ""};
    } else if (current.has_value() && common::starts_with(line, "HEAD ")) {
      current->head = line.substr(5);
    } else if (current.has_value() && common::starts_with(line, "branch ")) {
      std::string ref = line.substr(7);
      if (common::starts_with(ref, "refs/heads/")) {
        ref = ref.substr(11);
      }
      current->branch = ref;
    }
  }
  flush();
  return common::Result<std::vector<WorktreeEntry>>::success(std::move(entries));
}

common::Result<std::vector<BranchInfo>>
WorkspaceManager::list_branches(const std::filesystem::path &project_root) const {
  using Branches = common::Result<std::vector<BranchInfo>>;
  auto refs = git_->run(project_root, {"for-each-ref", "--format=%(refname:short)", "refs/heads"});
  if (!refs.ok()) {
    return Branches::failure(refs.details());
  }
  auto current = git_->run(project_root, {"branch", "--show-current"});
  const std::string current_name = current.ok() ? current.value().text() : "";

  auto worktrees = list(project_root);
  if (!worktrees.ok()) {
    return Branches::failure(worktrees.details());
  }

  std::vector<BranchInfo> branches;
  for (const auto &line : common::split_lines(refs.value().stdout_text)) {
    const std::string name = common::trim(line);
    if (name.empty()) {
      continue;
    }
    const bool has_worktree =
        std::any_of(worktrees.value().begin(), worktrees.value().end(),
                    [&name](const WorktreeEntry &entry) { return entry.branch == name; });
    branches.push_back(
        BranchInfo{.name = name, .is_current = name == current_name, .has_worktree = has_worktree});
  }

  std::sort(branches.begin(), branches.end(), [](const BranchInfo &a, const BranchInfo &b) {
    if (a.has_worktree != b.has_worktree) {
      return a.has_worktree;
    }
    return a.name < b.name;
  });
  return Branches::success(std::move(branches));
}

common::Result<std::string>
WorkspaceManager::main_branch(const std::filesystem::path &project_root) const {
  auto current = git_->run(project_root, {"branch", "--show-current"});
  if (!current.ok()) {
    return common::Result<std::string>::failure(current.details());
  }
  const std::string name = current.value().text();
  if (name.empty()) {
    return common::Result<std::string>::failure(
        common::ErrorKind::External,
        "Cannot determine main branch: HEAD is detached in " + project_root.string());
  }
  return common::Result<std::string>::success(name);
}

common::Result<AheadBehind> WorkspaceManager::ahead_behind(const std::filesystem::path &workspace,
                                                           const std::string &base_branch) const {
  auto counts =
      git_->run(workspace, {"rev-list", "--left-right", "--count", base_branch + "...HEAD"});
  if (!counts.ok()) {
    return common::Result<AheadBehind>::failure(counts.details());
  }
  std::istringstream stream(counts.value().text());
  std::string behind;
  std::string ahead;
  stream >> behind >> ahead;
  return common::Result<AheadBehind>::success(
      AheadBehind{.ahead = parse_count(ahead), .behind = parse_count(behind)});
}

common::Result<std::string> WorkspaceManager::head_commit(const std::filesystem::path &repo) const {
  auto head = git_->run(repo, {"rev-parse", "HEAD"});
  if (!head.ok()) {
    return common::Result<std::string>::failure(head.details());
  }
  return common::Result<std::string>::success(head.value().text());
}

common::Result<std::vector<CommitSummary>>
WorkspaceManager::recent_commits(const std::filesystem::path &workspace,
                                 const std::size_t count) const {
  auto log = git_->run(workspace,
                       {"log", "-" + std::to_string(count), "--pretty=format:%H|%s|%ai"});
  if (!log.ok()) {
    return common::Result<std::vector<CommitSummary>>::failure(log.details());
  }
  std::vector<CommitSummary> commits;
  for (const auto &line : common::split_lines(log.value().stdout_text)) {
    const auto first = line.find('|');
    const auto last = line.rfind('|');
    if (first == std::string::npos || last == first) {
      continue;
    }
    commits.push_back(CommitSummary{.hash = line.substr(0, first),
                                    .subject = line.substr(first + 1, last - first - 1),
                                    .date = line.substr(last + 1)});
  }
  return common::Result<std::vector<CommitSummary>>::success(std::move(commits));
}

} // namespace forkyard::workspace
