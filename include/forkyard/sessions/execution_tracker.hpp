#pragma once

#include "forkyard/common/result.hpp"
#include "forkyard/sessions/store.hpp"
#include "forkyard/sync/mutex_registry.hpp"
#include "forkyard/workspace/diff.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace forkyard::sessions {

/// Records one execution diff per completed agent turn.
class ExecutionTracker {
public:
  ExecutionTracker(std::shared_ptr<SessionStore> store,
                   std::shared_ptr<workspace::DiffCapture> diffs,
                   std::shared_ptr<sync::MutexRegistry> locks);

  /// Opens a turn. `since_commit` replaces HEAD as the turn's origin, e.g. the last
  /// recorded commit when a turn happened outside this process.
  [[nodiscard]] common::Status start(const std::string &session_id,
                                     const std::filesystem::path &workspace_path,
                                     const std::optional<std::string> &since_commit = std::nullopt);

  /// Captures the turn's changes and stores them with the next sequence number.
  /// Commits made during the turn are diffed commit to commit; otherwise the
  /// uncommitted working tree is diffed against HEAD.
  [[nodiscard]] common::Result<ExecutionDiff> finish(const std::string &session_id);

  void cancel(const std::string &session_id);
  [[nodiscard]] bool is_tracking(const std::string &session_id) const;

private:
  struct Turn {
    std::filesystem::path workspace_path;
    std::string before_commit;
  };

  std::shared_ptr<SessionStore> store_;
  std::shared_ptr<workspace::DiffCapture> diffs_;
  std::shared_ptr<sync::MutexRegistry> locks_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Turn> turns_;
};

} // namespace forkyard::sessions
