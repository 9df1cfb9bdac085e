#include "forkyard/sessions/checkpoint.hpp"

#include "forkyard/common/fs.hpp"
#include "forkyard/observability/global.hpp"

namespace forkyard::sessions {

namespace {

constexpr std::size_t kMaxSubjectLength = 50;

} // namespace

std::string checkpoint_message(const std::string &prompt, const std::int64_t sequence) {
  std::string subject = common::trim(prompt.substr(0, prompt.find('\n')));
  if (subject.empty()) {
    subject = "execution " + std::to_string(sequence);
  }
  if (subject.size() > kMaxSubjectLength) {
    subject = subject.substr(0, kMaxSubjectLength - 3) + "...";
  }
  return kCheckpointPrefix + subject;
}

common::Result<std::optional<std::string>>
commit_checkpoint(const workspace::GitRunner &git, const Session &session,
                  const std::string &message) {
  using CommitResult = common::Result<std::optional<std::string>>;
  if (session.commit_mode != CommitMode::Checkpoint || !session.auto_commit) {
    return CommitResult::success(std::nullopt);
  }

  const std::filesystem::path workspace = session.workspace_path;
  auto status = git.run(workspace, {"status", "--porcelain"});
  if (!status.ok()) {
    return CommitResult::failure(status.details());
  }
  if (status.value().text().empty()) {
    return CommitResult::success(std::nullopt);
  }

  if (auto staged = git.run(workspace, {"add", "-A"}); !staged.ok()) {
    return CommitResult::failure(staged.details());
  }
  if (auto committed = git.run(workspace, {"commit", "-q", "--no-verify", "-m", message});
      !committed.ok()) {
    return CommitResult::failure(committed.details());
  }
  auto head = git.run(workspace, {"rev-parse", "HEAD"});
  if (!head.ok()) {
    return CommitResult::failure(head.details());
  }
  observability::log_info("sessions", "Checkpoint " + head.value().text().substr(0, 8) +
                                          " for session " + session.id);
  return CommitResult::success(head.value().text());
}

} // namespace forkyard::sessions
