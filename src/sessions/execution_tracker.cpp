#include "forkyard/sessions/execution_tracker.hpp"

#include "forkyard/observability/global.hpp"

namespace forkyard::sessions {

ExecutionTracker::ExecutionTracker(std::shared_ptr<SessionStore> store,
                                   std::shared_ptr<workspace::DiffCapture> diffs,
                                   std::shared_ptr<sync::MutexRegistry> locks)
    : store_(std::move(store)), diffs_(std::move(diffs)), locks_(std::move(locks)) {}

common::Status ExecutionTracker::start(const std::string &session_id,
                                       const std::filesystem::path &workspace_path,
                                       const std::optional<std::string> &since_commit) {
  std::string origin;
  if (since_commit.has_value() && !since_commit->empty()) {
    origin = *since_commit;
  } else {
    auto head = diffs_->current_commit(workspace_path);
    if (!head.ok()) {
      return common::Status::error(head.details());
    }
    origin = head.value();
  }
  std::lock_guard<std::mutex> lock(mutex_);
  turns_[session_id] = Turn{.workspace_path = workspace_path, .before_commit = origin};
  observability::log_debug("execution", "Tracking session " + session_id + " from " + origin);
  return common::Status::success();
}

common::Result<ExecutionDiff> ExecutionTracker::finish(const std::string &session_id) {
  Turn turn;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = turns_.find(session_id);
    if (it == turns_.end()) {
      return common::Result<ExecutionDiff>::failure(
          common::ErrorKind::NotFound, "No execution in progress for session " + session_id);
    }
    turn = std::move(it->second);
    turns_.erase(it);
  }

  auto after = diffs_->current_commit(turn.workspace_path);
  if (!after.ok()) {
    return common::Result<ExecutionDiff>::failure(after.details());
  }
  auto captured = after.value() == turn.before_commit
                      ? diffs_->working_directory(turn.workspace_path)
                      : diffs_->between(turn.workspace_path, turn.before_commit, after.value());
  if (!captured.ok()) {
    return common::Result<ExecutionDiff>::failure(captured.details());
  }
  const auto &result = captured.value();

  return locks_->with_lock(sync::session_lock_key(session_id), [&]() {
    auto sequence = store_->next_execution_sequence(session_id);
    if (!sequence.ok()) {
      return common::Result<ExecutionDiff>::failure(sequence.details());
    }
    ExecutionDiff diff;
    diff.session_id = session_id;
    diff.sequence = sequence.value();
    diff.diff = result.diff;
    diff.files_changed = result.changed_files;
    diff.additions = result.stats.additions;
    diff.deletions = result.stats.deletions;
    diff.files_changed_count = result.stats.files_changed;
    diff.before_commit = turn.before_commit;
    diff.after_commit = after.value();
    return store_->add_execution_diff(std::move(diff));
  }, sync::kWaitIndefinitely);
}

void ExecutionTracker::cancel(const std::string &session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  turns_.erase(session_id);
}

bool ExecutionTracker::is_tracking(const std::string &session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return turns_.contains(session_id);
}

} // namespace forkyard::sessions
