#pragma once

#include "forkyard/common/result.hpp"
#include "forkyard/events/notifier.hpp"
#include "forkyard/sessions/store.hpp"
#include "forkyard/workspace/manager.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace forkyard::sessions {

/// Status transitions, viewed/archive markers and history on top of a SessionStore.
/// Every mutation is followed by a notification.
class SessionManager {
public:
  SessionManager(std::shared_ptr<SessionStore> store,
                 std::shared_ptr<workspace::WorkspaceManager> workspaces,
                 std::shared_ptr<events::NotificationSink> sink);

  /// Stops sessions left running or pending by a previous process.
  [[nodiscard]] common::Result<std::vector<std::string>> initialize();

  [[nodiscard]] common::Result<Session> get(const std::string &id) const;
  [[nodiscard]] common::Result<std::vector<Session>>
  list(std::optional<std::int64_t> project_id = std::nullopt,
       bool include_archived = false) const;

  [[nodiscard]] common::Result<Session>
  set_status(const std::string &id, VisibleStatus status,
             std::optional<std::string> message = std::nullopt);
  [[nodiscard]] common::Result<Session> set_status_message(const std::string &id,
                                                           const std::string &message);
  [[nodiscard]] common::Result<Session> mark_viewed(const std::string &id);

  /// Soft delete; the workspace directory and its registration are removed.
  [[nodiscard]] common::Status archive(const std::string &id);

  [[nodiscard]] common::Result<ConversationMessage>
  record_message(const std::string &id, const std::optional<std::string> &panel_id,
                 const std::string &role, const std::string &content);
  [[nodiscard]] common::Result<std::vector<ConversationMessage>>
  history(const std::string &id, const std::optional<std::string> &panel_id = std::nullopt) const;

  [[nodiscard]] const std::shared_ptr<SessionStore> &store() const { return store_; }

private:
  void publish_active_count() const;

  std::shared_ptr<SessionStore> store_;
  std::shared_ptr<workspace::WorkspaceManager> workspaces_;
  std::shared_ptr<events::NotificationSink> sink_;
};

} // namespace forkyard::sessions
