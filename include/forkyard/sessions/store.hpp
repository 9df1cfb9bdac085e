#pragma once

#include "forkyard/common/result.hpp"
#include "forkyard/sessions/session.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace forkyard::sessions {

struct NewProject {
  std::string name;
  std::string path;
  std::optional<std::string> worktree_folder;
  std::optional<std::string> build_script;
  std::optional<std::string> main_branch;
};

/// Persistence for projects, sessions, folders, execution diffs and conversation history.
/// Implementations must be safe to call from several worker threads. Missing rows are
/// reported as ErrorKind::NotFound.
class SessionStore {
public:
  virtual ~SessionStore() = default;

  [[nodiscard]] virtual common::Result<Project> create_project(const NewProject &project) = 0;
  [[nodiscard]] virtual common::Result<Project> get_project(std::int64_t id) const = 0;
  [[nodiscard]] virtual common::Result<std::vector<Project>> list_projects() const = 0;
  [[nodiscard]] virtual common::Result<std::optional<Project>> active_project() const = 0;
  [[nodiscard]] virtual common::Status set_active_project(std::int64_t id) = 0;

  [[nodiscard]] virtual common::Result<Folder> create_folder(const std::string &name,
                                                             std::int64_t project_id) = 0;
  [[nodiscard]] virtual common::Result<std::vector<Folder>>
  list_folders(std::int64_t project_id) const = 0;

  /// Persists a new row; created_at and updated_at are assigned by the store.
  [[nodiscard]] virtual common::Result<Session> create_session(Session session) = 0;
  [[nodiscard]] virtual common::Result<Session> get_session(const std::string &id) const = 0;
  [[nodiscard]] virtual common::Result<std::vector<Session>>
  list_sessions(std::optional<std::int64_t> project_id, bool include_archived) const = 0;
  [[nodiscard]] virtual common::Result<Session>
  update_status(const std::string &id, PersistedStatus status,
                std::optional<std::string> status_message = std::nullopt) = 0;
  [[nodiscard]] virtual common::Result<Session> set_status_message(const std::string &id,
                                                                   const std::string &message) = 0;
  /// Sets last_viewed_at and updated_at to the same instant.
  [[nodiscard]] virtual common::Result<Session> mark_viewed(const std::string &id) = 0;
  [[nodiscard]] virtual common::Result<Session> archive(const std::string &id) = 0;
  /// Moves every running or pending session to stopped; returns the affected ids.
  [[nodiscard]] virtual common::Result<std::vector<std::string>> stop_active_sessions() = 0;

  /// Display names, archived sessions included.
  [[nodiscard]] virtual common::Result<bool> display_name_exists(std::int64_t project_id,
                                                                 const std::string &name) const = 0;
  /// Matches either a session name or a workspace name.
  [[nodiscard]] virtual common::Result<bool>
  workspace_name_exists(std::int64_t project_id, const std::string &name) const = 0;

  [[nodiscard]] virtual common::Result<std::int64_t>
  next_execution_sequence(const std::string &session_id) const = 0;
  [[nodiscard]] virtual common::Result<ExecutionDiff> add_execution_diff(ExecutionDiff diff) = 0;
  [[nodiscard]] virtual common::Result<std::vector<ExecutionDiff>>
  list_execution_diffs(const std::string &session_id) const = 0;

  [[nodiscard]] virtual common::Result<ConversationMessage>
  add_conversation_message(const std::string &session_id,
                           const std::optional<std::string> &panel_id, const std::string &role,
                           const std::string &content) = 0;
  /// With a panel id only that panel's messages are returned, otherwise the whole session's.
  [[nodiscard]] virtual common::Result<std::vector<ConversationMessage>>
  conversation_history(const std::string &session_id,
                       const std::optional<std::string> &panel_id) const = 0;
};

} // namespace forkyard::sessions
