#pragma once

#include "forkyard/common/result.hpp"
#include "forkyard/workspace/git.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace forkyard::workspace {

struct WorkspaceInfo {
  std::filesystem::path path;
  std::string branch;
  /// Commit the branch started from; fixed for the lifetime of the workspace.
  std::string base_commit;
  std::string base_branch;
};

struct WorktreeEntry {
  std::filesystem::path path;
  std::string branch;
  std::string head;
};

struct BranchInfo {
  std::string name;
  bool is_current = false;
  bool has_worktree = false;
};

struct AheadBehind {
  std::uint32_t ahead = 0;
  std::uint32_t behind = 0;
};

struct CommitSummary {
  std::string hash;
  std::string subject;
  std::string date;
};

/// Creates and removes git worktrees under a project's worktree folder.
class WorkspaceManager {
public:
  explicit WorkspaceManager(std::shared_ptr<GitRunner> git,
                            std::string default_folder = "worktrees");

  /// Absolute subfolder is used as is, a relative one is joined to the project root.
  [[nodiscard]] std::filesystem::path
  workspace_path(const std::filesystem::path &project_root, const std::string &name,
                 const std::optional<std::string> &subfolder = std::nullopt) const;

  [[nodiscard]] common::Result<WorkspaceInfo>
  create(const std::filesystem::path &project_root, const std::string &name,
         const std::optional<std::string> &branch = std::nullopt,
         const std::optional<std::string> &base_branch = std::nullopt,
         const std::optional<std::string> &subfolder = std::nullopt);

  /// Succeeds when the workspace is already gone.
  [[nodiscard]] common::Status
  remove(const std::filesystem::path &project_root, const std::string &name,
         const std::optional<std::string> &subfolder = std::nullopt);

  [[nodiscard]] common::Result<std::vector<WorktreeEntry>>
  list(const std::filesystem::path &project_root) const;

  /// Branches with a worktree first, then alphabetical.
  [[nodiscard]] common::Result<std::vector<BranchInfo>>
  list_branches(const std::filesystem::path &project_root) const;

  /// Current branch of the project root; fails when HEAD is detached.
  [[nodiscard]] common::Result<std::string>
  main_branch(const std::filesystem::path &project_root) const;

  /// Divergence of the workspace HEAD against the live base branch ref.
  [[nodiscard]] common::Result<AheadBehind>
  ahead_behind(const std::filesystem::path &workspace, const std::string &base_branch) const;

  [[nodiscard]] common::Result<std::string> head_commit(const std::filesystem::path &repo) const;

  [[nodiscard]] common::Result<std::vector<CommitSummary>>
  recent_commits(const std::filesystem::path &workspace, std::size_t count = 20) const;

  [[nodiscard]] const std::shared_ptr<GitRunner> &git() const { return git_; }

private:
  common::Status ensure_repository(const std::filesystem::path &project_root,
                                   GitTranscript &transcript);
  [[nodiscard]] bool branch_exists(const std::filesystem::path &project_root,
                                   const std::string &branch, GitTranscript *transcript) const;

  std::shared_ptr<GitRunner> git_;
  std::string default_folder_;
};

} // namespace forkyard::workspace
