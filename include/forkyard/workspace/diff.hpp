#pragma once

#include "forkyard/common/result.hpp"
#include "forkyard/workspace/git.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace forkyard::workspace {

struct DiffStats {
  std::int64_t additions = 0;
  std::int64_t deletions = 0;
  std::int64_t files_changed = 0;
};

struct DiffResult {
  std::string diff;
  std::vector<std::string> changed_files;
  DiffStats stats;
  std::string before_hash;
  std::string after_hash;
  /// The patch text hit the git output cap and ends with a truncation trailer; stats and
  /// changed files are still complete.
  bool truncated = false;
};

/// Parses `git diff --numstat` output; binary files count as changed without line totals.
[[nodiscard]] DiffStats parse_numstat(const std::string &numstat, std::vector<std::string> *files);

class DiffCapture {
public:
  explicit DiffCapture(std::shared_ptr<GitRunner> git);

  [[nodiscard]] common::Result<std::string> current_commit(const std::filesystem::path &repo) const;

  /// Staged and unstaged changes against HEAD, plus untracked files shown as additions.
  [[nodiscard]] common::Result<DiffResult>
  working_directory(const std::filesystem::path &repo) const;

  [[nodiscard]] common::Result<DiffResult> between(const std::filesystem::path &repo,
                                                   const std::string &from,
                                                   const std::string &to) const;

  /// Everything the workspace changed since its fixed base commit, uncommitted work included.
  [[nodiscard]] common::Result<DiffResult> since_base(const std::filesystem::path &repo,
                                                      const std::string &base_commit) const;

private:
  [[nodiscard]] common::Result<DiffResult> capture(const std::filesystem::path &repo,
                                                   const std::vector<std::string> &range) const;
  [[nodiscard]] common::Status append_new_file(const std::filesystem::path &repo,
                                               const std::string &file, DiffResult &result) const;

  std::shared_ptr<GitRunner> git_;
};

} // namespace forkyard::workspace
