#include "forkyard/sessions/manager.hpp"

#include "forkyard/observability/global.hpp"
#include "forkyard/sessions/state_machine.hpp"

namespace forkyard::sessions {

SessionManager::SessionManager(std::shared_ptr<SessionStore> store,
                               std::shared_ptr<workspace::WorkspaceManager> workspaces,
                               std::shared_ptr<events::NotificationSink> sink)
    : store_(std::move(store)), workspaces_(std::move(workspaces)), sink_(std::move(sink)) {}

common::Result<std::vector<std::string>> SessionManager::initialize() {
  auto stopped = store_->stop_active_sessions();
  if (!stopped.ok()) {
    return stopped;
  }
  for (const auto &id : stopped.value()) {
    auto session = store_->get_session(id);
    if (session.ok() && sink_ != nullptr) {
      sink_->session_updated(session.value());
    }
  }
  if (!stopped.value().empty()) {
    observability::log_info("sessions", "Stopped " + std::to_string(stopped.value().size()) +
                                            " session(s) left active by a previous run");
  }
  publish_active_count();
  return stopped;
}

common::Result<Session> SessionManager::get(const std::string &id) const {
  return store_->get_session(id);
}

common::Result<std::vector<Session>> SessionManager::list(std::optional<std::int64_t> project_id,
                                                          const bool include_archived) const {
  return store_->list_sessions(project_id, include_archived);
}

common::Result<Session> SessionManager::set_status(const std::string &id,
                                                   const VisibleStatus status,
                                                   std::optional<std::string> message) {
  auto updated = store_->update_status(id, persisted_status(status), std::move(message));
  if (!updated.ok()) {
    return updated;
  }
  if (sink_ != nullptr) {
    sink_->session_updated(updated.value());
  }
  publish_active_count();
  return updated;
}

common::Result<Session> SessionManager::set_status_message(const std::string &id,
                                                           const std::string &message) {
  auto updated = store_->set_status_message(id, message);
  if (updated.ok() && sink_ != nullptr) {
    sink_->session_updated(updated.value());
  }
  return updated;
}

common::Result<Session> SessionManager::mark_viewed(const std::string &id) {
  auto updated = store_->mark_viewed(id);
  if (updated.ok() && sink_ != nullptr) {
    sink_->session_updated(updated.value());
  }
  return updated;
}

common::Status SessionManager::archive(const std::string &id) {
  auto session = store_->get_session(id);
  if (!session.ok()) {
    return common::Status::error(session.details());
  }
  if (session.value().archived) {
    return common::Status::success();
  }
  auto project = store_->get_project(session.value().project_id);
  if (!project.ok()) {
    return common::Status::error(project.details());
  }

  auto archived = store_->archive(id);
  if (!archived.ok()) {
    return common::Status::error(archived.details());
  }

  if (workspaces_ != nullptr && !session.value().workspace_name.empty()) {
    auto removed = workspaces_->remove(project.value().path, session.value().workspace_name,
                                       project.value().worktree_folder);
    if (!removed.ok()) {
      observability::log_warn("sessions", "Archived session " + id +
                                              " but its workspace could not be removed: " +
                                              removed.error());
      return removed;
    }
  }

  if (sink_ != nullptr) {
    sink_->session_deleted(id);
  }
  publish_active_count();
  return common::Status::success();
}

common::Result<ConversationMessage>
SessionManager::record_message(const std::string &id, const std::optional<std::string> &panel_id,
                               const std::string &role, const std::string &content) {
  return store_->add_conversation_message(id, panel_id, role, content);
}

common::Result<std::vector<ConversationMessage>>
SessionManager::history(const std::string &id, const std::optional<std::string> &panel_id) const {
  return store_->conversation_history(id, panel_id);
}

void SessionManager::publish_active_count() const {
  auto sessions = store_->list_sessions(std::nullopt, false);
  if (!sessions.ok()) {
    return;
  }
  std::uint64_t active = 0;
  for (const auto &session : sessions.value()) {
    if (is_active(session.status)) {
      ++active;
    }
  }
  observability::record_metric(observability::ActiveSessionsMetric{.count = active});
}

} // namespace forkyard::sessions
