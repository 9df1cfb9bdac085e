#pragma once

#include "forkyard/sessions/store.hpp"

#include <chrono>
#include <filesystem>
#include <mutex>
#include <sqlite3.h>

namespace forkyard::sessions {

class SqliteSessionStore final : public SessionStore {
public:
  explicit SqliteSessionStore(std::filesystem::path db_path);
  ~SqliteSessionStore() override;

  SqliteSessionStore(const SqliteSessionStore &) = delete;
  SqliteSessionStore &operator=(const SqliteSessionStore &) = delete;

  /// Result of opening the database and creating the schema.
  [[nodiscard]] common::Status status() const;
  [[nodiscard]] const std::filesystem::path &path() const { return db_path_; }

  common::Result<Project> create_project(const NewProject &project) override;
  common::Result<Project> get_project(std::int64_t id) const override;
  common::Result<std::vector<Project>> list_projects() const override;
  common::Result<std::optional<Project>> active_project() const override;
  common::Status set_active_project(std::int64_t id) override;

  common::Result<Folder> create_folder(const std::string &name, std::int64_t project_id) override;
  common::Result<std::vector<Folder>> list_folders(std::int64_t project_id) const override;

  common::Result<Session> create_session(Session session) override;
  common::Result<Session> get_session(const std::string &id) const override;
  common::Result<std::vector<Session>> list_sessions(std::optional<std::int64_t> project_id,
                                                     bool include_archived) const override;
  common::Result<Session>
  update_status(const std::string &id, PersistedStatus status,
                std::optional<std::string> status_message = std::nullopt) override;
  common::Result<Session> set_status_message(const std::string &id,
                                             const std::string &message) override;
  common::Result<Session> mark_viewed(const std::string &id) override;
  common::Result<Session> archive(const std::string &id) override;
  common::Result<std::vector<std::string>> stop_active_sessions() override;

  common::Result<bool> display_name_exists(std::int64_t project_id,
                                           const std::string &name) const override;
  common::Result<bool> workspace_name_exists(std::int64_t project_id,
                                             const std::string &name) const override;

  common::Result<std::int64_t> next_execution_sequence(const std::string &session_id) const override;
  common::Result<ExecutionDiff> add_execution_diff(ExecutionDiff diff) override;
  common::Result<std::vector<ExecutionDiff>>
  list_execution_diffs(const std::string &session_id) const override;

  common::Result<ConversationMessage>
  add_conversation_message(const std::string &session_id,
                           const std::optional<std::string> &panel_id, const std::string &role,
                           const std::string &content) override;
  common::Result<std::vector<ConversationMessage>>
  conversation_history(const std::string &session_id,
                       const std::optional<std::string> &panel_id) const override;

private:
  [[nodiscard]] common::Status init_schema();
  /// Strictly increasing across calls so updated_at ordering is never ambiguous.
  [[nodiscard]] std::string next_timestamp();
  [[nodiscard]] common::Result<Session> load_session(const std::string &id) const;
  [[nodiscard]] common::Result<Project> load_project(std::int64_t id) const;
  [[nodiscard]] common::Status execute(const std::string &sql, const std::vector<std::string> &text_args,
                                       int *changes = nullptr);

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  std::string open_error_;
  std::chrono::system_clock::time_point last_timestamp_{};
  mutable std::mutex mutex_;
};

} // namespace forkyard::sessions
