#include "forkyard/workspace/diff.hpp"

#include "forkyard/common/fs.hpp"
#include "forkyard/observability/global.hpp"

#include <charconv>

namespace forkyard::workspace {

namespace {

std::int64_t parse_int(const std::string &text) {
  std::int64_t value = 0;
  std::from_chars(text.data(), text.data() + text.size(), value);
  return value;
}

constexpr const char *kTruncatedTrailer = "\n[forkyard: diff output truncated]\n";

void mark_truncated(DiffResult &result, const std::filesystem::path &repo) {
  if (!result.truncated) {
    observability::log_warn("diff", "Diff output truncated in " + repo.string());
  }
  result.truncated = true;
}

} // namespace

DiffStats parse_numstat(const std::string &numstat, std::vector<std::string> *files) {
  DiffStats stats;
  for (const auto &line : common::split_lines(numstat)) {
    const auto first_tab = line.find('\t');
    if (first_tab == std::string::npos) {
      continue;
    }
    const auto second_tab = line.find('\t', first_tab + 1);
    if (second_tab == std::string::npos) {
      continue;
    }
    const std::string added = line.substr(0, first_tab);
    const std::string removed = line.substr(first_tab + 1, second_tab - first_tab - 1);
    if (added != "-") {
      stats.additions += parse_int(added);
    }
    if (removed != "-") {
      stats.deletions += parse_int(removed);
    }
    ++stats.files_changed;
    if (files != nullptr) {
      files->push_back(line.substr(second_tab + 1));
    }
  }
  return stats;
}

DiffCapture::DiffCapture(std::shared_ptr<GitRunner> git) : git_(std::move(git)) {}

common::Result<std::string> DiffCapture::current_commit(const std::filesystem::path &repo) const {
  auto head = git_->run(repo, {"rev-parse", "HEAD"});
  if (!head.ok()) {
    return common::Result<std::string>::failure(head.details());
  }
  return common::Result<std::string>::success(head.value().text());
}

common::Result<DiffResult> DiffCapture::capture(const std::filesystem::path &repo,
                                                const std::vector<std::string> &range) const {
  std::vector<std::string> diff_args = {"diff"};
  diff_args.insert(diff_args.end(), range.begin(), range.end());
  auto diff = git_->run(repo, diff_args);
  if (!diff.ok()) {
    return common::Result<DiffResult>::failure(diff.details());
  }

  std::vector<std::string> numstat_args = {"diff", "--numstat"};
  numstat_args.insert(numstat_args.end(), range.begin(), range.end());
  auto numstat = git_->run(repo, numstat_args);
  if (!numstat.ok()) {
    return common::Result<DiffResult>::failure(numstat.details());
  }

  // Stats must cover the whole change, a partial patch is kept but flagged.
  if (numstat.value().truncated) {
    return common::Result<DiffResult>::failure(
        common::ErrorKind::External, "git diff --numstat output exceeded the capture limit in " +
                                         repo.string());
  }

  DiffResult result;
  result.diff = diff.value().stdout_text;
  if (diff.value().truncated) {
    mark_truncated(result, repo);
    result.diff += kTruncatedTrailer;
  }
  result.stats = parse_numstat(numstat.value().stdout_text, &result.changed_files);
  return common::Result<DiffResult>::success(std::move(result));
}

common::Result<DiffResult> DiffCapture::working_directory(const std::filesystem::path &repo) const {
  auto head = current_commit(repo);
  if (!head.ok()) {
    return common::Result<DiffResult>::failure(head.details());
  }
  auto result = capture(repo, {"HEAD"});
  if (!result.ok()) {
    return result;
  }
  result.value().before_hash = head.value();
  result.value().after_hash = head.value();

  auto untracked = git_->run(repo, {"ls-files", "--others", "--exclude-standard"});
  if (!untracked.ok()) {
    return common::Result<DiffResult>::failure(untracked.details());
  }
  for (const auto &file : common::split_lines(untracked.value().stdout_text)) {
    if (file.empty()) {
      continue;
    }
    if (auto status = append_new_file(repo, file, result.value()); !status.ok()) {
      return common::Result<DiffResult>::failure(status.details());
    }
  }
  return result;
}

// `git diff --no-index` exits 1 when the inputs differ, which is always the case here.
common::Status DiffCapture::append_new_file(const std::filesystem::path &repo,
                                            const std::string &file, DiffResult &result) const {
  auto patch = git_->probe(repo, {"diff", "--no-index", "--", "/dev/null", file});
  if (!patch.ok()) {
    return common::Status::error(patch.details());
  }
  if (patch.value().exit_code > 1) {
    return common::Status::error(common::ErrorKind::External,
                                 "git diff failed for " + file + ": " + patch.value().stderr_text);
  }
  auto numstat = git_->probe(repo, {"diff", "--no-index", "--numstat", "--", "/dev/null", file});
  if (!numstat.ok()) {
    return common::Status::error(numstat.details());
  }
  if (numstat.value().truncated) {
    return common::Status::error(common::ErrorKind::External,
                                 "git diff --numstat output exceeded the capture limit for " + file);
  }
  const auto stats = parse_numstat(numstat.value().stdout_text, nullptr);
  // Once truncated, the patch ends with the trailer and takes no more text.
  if (!result.truncated) {
    result.diff += patch.value().stdout_text;
    if (patch.value().truncated) {
      mark_truncated(result, repo);
      result.diff += kTruncatedTrailer;
    }
  }
  result.stats.additions += stats.additions;
  result.stats.files_changed += 1;
  result.changed_files.push_back(file);
  return common::Status::success();
}

common::Result<DiffResult> DiffCapture::between(const std::filesystem::path &repo,
                                                const std::string &from,
                                                const std::string &to) const {
  auto result = capture(repo, {from + ".." + to});
  if (result.ok()) {
    result.value().before_hash = from;
    result.value().after_hash = to;
  }
  return result;
}

common::Result<DiffResult> DiffCapture::since_base(const std::filesystem::path &repo,
                                                   const std::string &base_commit) const {
  auto head = current_commit(repo);
  if (!head.ok()) {
    return common::Result<DiffResult>::failure(head.details());
  }
  auto result = capture(repo, {base_commit});
  if (result.ok()) {
    result.value().before_hash = base_commit;
    result.value().after_hash = head.value();
  }
  return result;
}

} // namespace forkyard::workspace
