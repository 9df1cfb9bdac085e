#pragma once

#include "forkyard/common/result.hpp"
#include "forkyard/sync/mutex_registry.hpp"
#include "forkyard/workspace/git.hpp"
#include "forkyard/workspace/manager.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace forkyard::workspace {

struct ConflictReport {
  bool has_conflicts = false;
  std::vector<std::string> conflicting_files;
  bool can_auto_merge = true;
  /// One-line summaries of commits only on the workspace side.
  std::vector<std::string> ours_commits;
  /// One-line summaries of commits only on the base branch side.
  std::vector<std::string> theirs_commits;
};

struct ReconcileOptions {
  std::chrono::milliseconds lock_timeout{std::chrono::seconds(30)};
  std::chrono::milliseconds post_timeout{std::chrono::seconds(30)};
  std::chrono::milliseconds lookup_timeout{std::chrono::seconds(30)};
  std::chrono::milliseconds rebase_timeout{std::chrono::seconds(120)};
  std::chrono::milliseconds squash_timeout{std::chrono::seconds(180)};
};

struct ReconcileOutcome {
  std::vector<std::string> commands;
  /// Refreshed divergence; empty when the refresh failed or timed out.
  std::optional<AheadBehind> divergence;
};

/// Rebase and squash between a workspace and its base branch. Mutating operations hold the
/// lock workspace:<path> and report failures with the full git transcript.
class Reconciler {
public:
  Reconciler(std::shared_ptr<GitRunner> git, std::shared_ptr<sync::MutexRegistry> locks,
             ReconcileOptions options = {});

  /// True when the base branch has commits the workspace does not.
  [[nodiscard]] common::Result<bool> has_changes(const std::filesystem::path &workspace,
                                                 const std::string &base_branch) const;

  /// Read-only: never touches HEAD, the branch pointer, the index or the working tree.
  /// Commands run are appended to `transcript` when one is given.
  [[nodiscard]] common::Result<ConflictReport>
  detect_conflicts(const std::filesystem::path &workspace, const std::string &base_branch,
                   GitTranscript *transcript = nullptr) const;

  [[nodiscard]] common::Result<ReconcileOutcome>
  rebase_main_into_workspace(const std::filesystem::path &workspace,
                             const std::string &base_branch);

  [[nodiscard]] common::Status abort_rebase(const std::filesystem::path &workspace);

  [[nodiscard]] common::Result<ReconcileOutcome>
  rebase_to_main(const std::filesystem::path &project_root, const std::filesystem::path &workspace,
                 const std::string &base_branch);

  [[nodiscard]] common::Result<ReconcileOutcome>
  squash_and_rebase_to_main(const std::filesystem::path &project_root,
                            const std::filesystem::path &workspace,
                            const std::string &base_branch, const std::string &message);

  [[nodiscard]] static std::vector<std::string>
  generate_rebase_commands(const std::string &base_branch);
  [[nodiscard]] static std::vector<std::string>
  generate_squash_commands(const std::string &base_branch, const std::string &branch);

private:
  std::optional<AheadBehind> refresh_divergence(const std::filesystem::path &workspace,
                                                const std::string &base_branch) const;
  [[nodiscard]] common::Result<std::vector<std::string>>
  changed_files(const std::filesystem::path &workspace, const std::string &from,
                const std::string &to, GitTranscript *transcript) const;
  [[nodiscard]] common::Result<std::vector<std::string>>
  commit_summaries(const std::filesystem::path &workspace, const std::string &range,
                   GitTranscript *transcript) const;

  std::shared_ptr<GitRunner> git_;
  std::shared_ptr<sync::MutexRegistry> locks_;
  ReconcileOptions options_;
};

} // namespace forkyard::workspace
