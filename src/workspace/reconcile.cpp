#include "forkyard/workspace/reconcile.hpp"

#include "forkyard/common/fs.hpp"
#include "forkyard/observability/global.hpp"

#include <algorithm>
#include <charconv>
#include <iterator>
#include <set>

namespace forkyard::workspace {

namespace {

constexpr const char *kComponent = "reconcile";

std::string normalized(const std::filesystem::path &path) {
  return std::filesystem::absolute(path).lexically_normal().string();
}

common::Error with_transcript(common::Error error, const GitTranscript &transcript,
                              const std::filesystem::path &working_directory,
                              const std::filesystem::path &project_path) {
  error.diagnostics = transcript.diagnostics(working_directory, project_path);
  return error;
}

// Files inside "changed in both" sections of legacy merge-tree output that carry markers.
std::vector<std::string> files_with_markers(const std::string &merge_tree_output,
                                            bool &saw_markers) {
  std::set<std::string> files;
  std::string current_path;
  bool in_both = false;
  for (const auto &line : common::split_lines(merge_tree_output)) {
    if (!line.empty() && line.front() != ' ' && line.front() != '@' && line.front() != '+' &&
        line.front() != '-') {
      in_both = line == "changed in both";
      current_path.clear();
      continue;
    }
    if (common::starts_with(line, "  our ") || common::starts_with(line, "  their ") ||
        common::starts_with(line, "  base ")) {
      const auto last_space = line.find_last_of(" \t");
      if (last_space != std::string::npos) {
        current_path = line.substr(last_space + 1);
      }
      continue;
    }
    if (common::contains(line, "<<<<<<<")) {
      saw_markers = true;
      if (in_both && !current_path.empty()) {
        files.insert(current_path);
      }
    }
  }
  return {files.begin(), files.end()};
}

std::uint32_t parse_count(const std::string &text) {
  std::uint32_t value = 0;
  const auto trimmed = common::trim(text);
  std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), value);
  return value;
}

} // namespace

Reconciler::Reconciler(std::shared_ptr<GitRunner> git, std::shared_ptr<sync::MutexRegistry> locks,
                       const ReconcileOptions options)
    : git_(std::move(git)), locks_(std::move(locks)), options_(options) {}

common::Result<bool> Reconciler::has_changes(const std::filesystem::path &workspace,
                                             const std::string &base_branch) const {
  auto count = git_->run(workspace, {"rev-list", "--count", "HEAD.." + base_branch}, nullptr,
                         options_.lookup_timeout);
  if (!count.ok()) {
    return common::Result<bool>::failure(count.details());
  }
  return common::Result<bool>::success(parse_count(count.value().text()) > 0);
}

common::Result<std::vector<std::string>>
Reconciler::changed_files(const std::filesystem::path &workspace, const std::string &from,
                          const std::string &to, GitTranscript *transcript) const {
  auto diff = git_->run(workspace, {"diff", "--name-only", from, to}, transcript,
                        options_.lookup_timeout);
  if (!diff.ok()) {
    return common::Result<std::vector<std::string>>::failure(diff.details());
  }
  std::vector<std::string> files;
  for (const auto &line : common::split_lines(diff.value().stdout_text)) {
    if (!common::trim(line).empty()) {
      files.push_back(common::trim(line));
    }
  }
  std::sort(files.begin(), files.end());
  return common::Result<std::vector<std::string>>::success(std::move(files));
}

common::Result<std::vector<std::string>>
Reconciler::commit_summaries(const std::filesystem::path &workspace, const std::string &range,
                             GitTranscript *transcript) const {
  auto log = git_->run(workspace, {"log", "--oneline", range}, transcript, options_.lookup_timeout);
  if (!log.ok()) {
    return common::Result<std::vector<std::string>>::failure(log.details());
  }
  std::vector<std::string> commits;
  for (const auto &line : common::split_lines(log.value().stdout_text)) {
    if (!common::trim(line).empty()) {
      commits.push_back(line);
    }
  }
  return common::Result<std::vector<std::string>>::success(std::move(commits));
}

common::Result<ConflictReport>
Reconciler::detect_conflicts(const std::filesystem::path &workspace,
                             const std::string &base_branch, GitTranscript *transcript) const {
  using Report = common::Result<ConflictReport>;

  auto merge_base = git_->run(workspace, {"merge-base", "HEAD", base_branch}, transcript,
                              options_.lookup_timeout);
  if (!merge_base.ok()) {
    return Report::failure(merge_base.details());
  }
  auto ours = git_->run(workspace, {"rev-parse", "HEAD"}, transcript, options_.lookup_timeout);
  if (!ours.ok()) {
    return Report::failure(ours.details());
  }
  auto theirs = git_->run(workspace, {"rev-parse", base_branch + "^{commit}"}, transcript,
                          options_.lookup_timeout);
  if (!theirs.ok()) {
    return Report::failure(theirs.details());
  }

  const std::string base = merge_base.value().text();
  const std::string ours_sha = ours.value().text();
  const std::string theirs_sha = theirs.value().text();

  ConflictReport report;
  if (base == theirs_sha || base == ours_sha) {
    return Report::success(std::move(report));
  }

  auto tree = git_->probe(workspace, {"merge-tree", base, ours_sha, theirs_sha}, transcript,
                          options_.lookup_timeout);
  const bool merge_tree_available = tree.ok() && tree.value().ok();

  std::vector<std::string> marked_files;
  bool saw_markers = false;
  if (merge_tree_available) {
    marked_files = files_with_markers(tree.value().stdout_text, saw_markers);
  }

  if (!merge_tree_available || saw_markers) {
    auto ours_files = changed_files(workspace, base, ours_sha, transcript);
    if (!ours_files.ok()) {
      return Report::failure(ours_files.details());
    }
    auto theirs_files = changed_files(workspace, base, theirs_sha, transcript);
    if (!theirs_files.ok()) {
      return Report::failure(theirs_files.details());
    }
    std::vector<std::string> overlap;
    std::set_intersection(ours_files.value().begin(), ours_files.value().end(),
                          theirs_files.value().begin(), theirs_files.value().end(),
                          std::back_inserter(overlap));

    if (!merge_tree_available) {
      observability::log_debug(kComponent, "merge-tree unavailable, using changed-file overlap");
      report.has_conflicts = !overlap.empty();
      report.conflicting_files = std::move(overlap);
    } else {
      report.has_conflicts = true;
      report.conflicting_files = marked_files.empty() ? std::move(overlap) : std::move(marked_files);
    }
  }

  report.can_auto_merge = !report.has_conflicts;
  if (report.has_conflicts) {
    auto ours_commits = commit_summaries(workspace, base + ".." + ours_sha, transcript);
    if (!ours_commits.ok()) {
      return Report::failure(ours_commits.details());
    }
    auto theirs_commits = commit_summaries(workspace, base + ".." + theirs_sha, transcript);
    if (!theirs_commits.ok()) {
      return Report::failure(theirs_commits.details());
    }
    report.ours_commits = std::move(ours_commits.value());
    report.theirs_commits = std::move(theirs_commits.value());
  }
  return Report::success(std::move(report));
}

common::Result<ReconcileOutcome>
Reconciler::rebase_main_into_workspace(const std::filesystem::path &workspace,
                                       const std::string &base_branch) {
  using Outcome = common::Result<ReconcileOutcome>;
  const auto started = std::chrono::steady_clock::now();
  const std::string path = normalized(workspace);

  auto result = locks_->with_lock(
      sync::workspace_lock_key(path),
      [&]() -> Outcome {
        GitTranscript transcript;
        auto conflicts = detect_conflicts(workspace, base_branch, &transcript);
        if (!conflicts.ok()) {
          return Outcome::failure(with_transcript(conflicts.details(), transcript, workspace, {}));
        }
        if (conflicts.value().has_conflicts) {
          std::string files;
          for (const auto &file : conflicts.value().conflicting_files) {
            files += (files.empty() ? "" : ", ") + file;
          }
          return Outcome::failure(with_transcript(
              common::Error{.kind = common::ErrorKind::Conflict,
                            .message = "Rebasing " + base_branch +
                                       " would conflict in: " + (files.empty() ? "unknown" : files)},
              transcript, workspace, {}));
        }

        auto rebase =
            git_->run(workspace, {"rebase", base_branch}, &transcript, options_.rebase_timeout);
        if (!rebase.ok()) {
          common::Error error = rebase.details();
          (void)git_->probe(workspace, {"rebase", "--abort"}, &transcript);
          if (common::contains(transcript.output(), "CONFLICT")) {
            error.kind = common::ErrorKind::Conflict;
          }
          error.message = "Failed to rebase " + base_branch + " into workspace: " + error.message;
          return Outcome::failure(with_transcript(std::move(error), transcript, workspace, {}));
        }
        return Outcome::success(ReconcileOutcome{.commands = transcript.commands(),
                                                 .divergence = std::nullopt});
      },
      options_.lock_timeout);

  observability::record_reconcile("rebase_from_main", path,
                                  std::chrono::duration_cast<std::chrono::milliseconds>(
                                      std::chrono::steady_clock::now() - started),
                                  result.ok());
  if (result.ok()) {
    result.value().divergence = refresh_divergence(workspace, base_branch);
  }
  return result;
}

common::Status Reconciler::abort_rebase(const std::filesystem::path &workspace) {
  const std::string path = normalized(workspace);
  return locks_->with_lock(
      sync::workspace_lock_key(path),
      [&]() -> common::Status {
        GitTranscript transcript;
        (void)git_->probe(workspace, {"status", "--porcelain=v1"}, &transcript,
                          options_.lookup_timeout);
        auto abort = git_->run(workspace, {"rebase", "--abort"}, &transcript,
                               options_.lookup_timeout);
        if (!abort.ok()) {
          common::Error error = abort.details();
          error.message = "Failed to abort rebase: " + error.message;
          return common::Status::error(with_transcript(std::move(error), transcript, workspace, {}));
        }
        return common::Status::success();
      },
      options_.lock_timeout);
}

common::Result<ReconcileOutcome>
Reconciler::rebase_to_main(const std::filesystem::path &project_root,
                           const std::filesystem::path &workspace,
                           const std::string &base_branch) {
  using Outcome = common::Result<ReconcileOutcome>;
  const auto started = std::chrono::steady_clock::now();
  const std::string path = normalized(workspace);

  auto result = locks_->with_lock(
      sync::workspace_lock_key(path),
      [&]() -> Outcome {
        GitTranscript transcript;
        const auto fail = [&](common::Error error) {
          return Outcome::failure(
              with_transcript(std::move(error), transcript, workspace, project_root));
        };

        auto branch = git_->run(workspace, {"branch", "--show-current"}, &transcript,
                                options_.lookup_timeout);
        if (!branch.ok()) {
          return fail(branch.details());
        }
        const std::string branch_name = branch.value().text();
        if (branch_name.empty()) {
          return fail(common::Error{.kind = common::ErrorKind::External,
                                    .message = "Workspace HEAD is detached"});
        }

        auto ahead = commit_summaries(workspace, base_branch + "..HEAD", &transcript);
        if (!ahead.ok()) {
          return fail(ahead.details());
        }
        if (ahead.value().empty()) {
          return fail(common::Error{.kind = common::ErrorKind::NothingToDo,
                                    .message = "No commits to rebase. The branch is already up "
                                               "to date with " +
                                               base_branch + "."});
        }

        if (auto checkout = git_->run(project_root, {"checkout", base_branch}, &transcript,
                                      options_.lookup_timeout);
            !checkout.ok()) {
          return fail(checkout.details());
        }
        if (auto rebase = git_->run(project_root, {"rebase", branch_name}, &transcript,
                                    options_.rebase_timeout);
            !rebase.ok()) {
          common::Error error = rebase.details();
          (void)git_->probe(project_root, {"rebase", "--abort"}, &transcript);
          if (common::contains(transcript.output(), "CONFLICT")) {
            error.kind = common::ErrorKind::Conflict;
          }
          return fail(std::move(error));
        }
        return Outcome::success(ReconcileOutcome{.commands = transcript.commands(),
                                                 .divergence = std::nullopt});
      },
      options_.lock_timeout);

  observability::record_reconcile("rebase_to_main", path,
                                  std::chrono::duration_cast<std::chrono::milliseconds>(
                                      std::chrono::steady_clock::now() - started),
                                  result.ok());
  if (result.ok()) {
    result.value().divergence = refresh_divergence(workspace, base_branch);
  }
  return result;
}

common::Result<ReconcileOutcome>
Reconciler::squash_and_rebase_to_main(const std::filesystem::path &project_root,
                                      const std::filesystem::path &workspace,
                                      const std::string &base_branch,
                                      const std::string &message) {
  using Outcome = common::Result<ReconcileOutcome>;
  if (common::trim(message).empty()) {
    return Outcome::failure(common::ErrorKind::Configuration, "Commit message must not be empty");
  }
  const auto started = std::chrono::steady_clock::now();
  const std::string path = normalized(workspace);

  auto result = locks_->with_lock(
      sync::workspace_lock_key(path),
      [&]() -> Outcome {
        GitTranscript transcript;
        const auto fail = [&](common::Error error) {
          return Outcome::failure(
              with_transcript(std::move(error), transcript, workspace, project_root));
        };

        auto branch = git_->run(workspace, {"branch", "--show-current"}, &transcript,
                                options_.lookup_timeout);
        if (!branch.ok()) {
          return fail(branch.details());
        }
        const std::string branch_name = branch.value().text();
        if (branch_name.empty()) {
          return fail(common::Error{.kind = common::ErrorKind::External,
                                    .message = "Workspace HEAD is detached"});
        }

        auto merge_base = git_->run(workspace, {"merge-base", base_branch, "HEAD"}, &transcript,
                                    options_.lookup_timeout);
        if (!merge_base.ok()) {
          return fail(merge_base.details());
        }
        const std::string base = merge_base.value().text();

        auto commits = commit_summaries(workspace, base + "..HEAD", &transcript);
        if (!commits.ok()) {
          return fail(commits.details());
        }
        if (commits.value().empty()) {
          return fail(common::Error{.kind = common::ErrorKind::NothingToDo,
                                    .message = "No commits to squash. The branch is already up "
                                               "to date with " +
                                               base_branch + "."});
        }

        if (auto reset = git_->run(workspace, {"reset", "--soft", base}, &transcript,
                                   options_.squash_timeout);
            !reset.ok()) {
          return fail(reset.details());
        }
        if (auto commit = git_->run(workspace, {"commit", "-m", message}, &transcript,
                                    options_.squash_timeout);
            !commit.ok()) {
          return fail(commit.details());
        }
        if (auto checkout = git_->run(project_root, {"checkout", base_branch}, &transcript,
                                      options_.lookup_timeout);
            !checkout.ok()) {
          return fail(checkout.details());
        }
        if (auto rebase = git_->run(project_root, {"rebase", branch_name}, &transcript,
                                    options_.squash_timeout);
            !rebase.ok()) {
          common::Error error = rebase.details();
          (void)git_->probe(project_root, {"rebase", "--abort"}, &transcript);
          if (common::contains(transcript.output(), "CONFLICT")) {
            error.kind = common::ErrorKind::Conflict;
          }
          return fail(std::move(error));
        }
        observability::log_info(kComponent, "Squashed " + std::to_string(commits.value().size()) +
                                                " commit(s) from " + branch_name + " onto " +
                                                base_branch);
        return Outcome::success(ReconcileOutcome{.commands = transcript.commands(),
                                                 .divergence = std::nullopt});
      },
      options_.lock_timeout);

  observability::record_reconcile("squash_to_main", path,
                                  std::chrono::duration_cast<std::chrono::milliseconds>(
                                      std::chrono::steady_clock::now() - started),
                                  result.ok());
  if (result.ok()) {
    result.value().divergence = refresh_divergence(workspace, base_branch);
  }
  return result;
}

std::optional<AheadBehind> Reconciler::refresh_divergence(const std::filesystem::path &workspace,
                                                          const std::string &base_branch) const {
  auto counts = git_->run(workspace, {"rev-list", "--left-right", "--count", base_branch + "...HEAD"},
                          nullptr, options_.post_timeout);
  if (!counts.ok()) {
    observability::log_warn(kComponent, "Post-reconcile refresh for " + workspace.string() +
                                            " skipped: " + counts.error());
    return std::nullopt;
  }
  const std::string text = counts.value().text();
  const auto split = text.find_first_of(" \t");
  if (split == std::string::npos) {
    return std::nullopt;
  }
  return AheadBehind{.ahead = parse_count(text.substr(split + 1)),
                     .behind = parse_count(text.substr(0, split))};
}

std::vector<std::string> Reconciler::generate_rebase_commands(const std::string &base_branch) {
  return {"git rebase " + base_branch};
}

std::vector<std::string> Reconciler::generate_squash_commands(const std::string &base_branch,
                                                              const std::string &branch) {
  return {"git merge-base " + base_branch + " HEAD",
          "git reset --soft <base-commit>",
          "git commit -m \"Squashed commit message\"",
          "git checkout " + base_branch,
          "git rebase " + branch};
}

} // namespace forkyard::workspace
