#include "forkyard/sessions/sqlite_store.hpp"

#include "forkyard/common/fs.hpp"
#include "forkyard/common/json_util.hpp"

namespace forkyard::sessions {

namespace {

constexpr const char *kNotInitialized = "session db not initialized";

constexpr const char *kSessionColumns =
    "id, name, workspace_name, workspace_path, initial_prompt, base_branch, base_commit, status, "
    "project_id, folder_id, tool, commit_mode, auto_commit, archived, last_viewed_at, created_at, "
    "updated_at, status_message";

constexpr const char *kProjectColumns =
    "id, name, path, worktree_folder, build_script, main_branch, active, created_at";

constexpr const char *kDiffColumns =
    "id, session_id, execution_sequence, git_diff, files_changed, stats_additions, "
    "stats_deletions, stats_files_changed, before_commit_hash, after_commit_hash, created_at";

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string message = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(message);
  }
  return common::Status::success();
}

void bind_text(sqlite3_stmt *stmt, const int index, const std::string &value) {
  sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bind_optional(sqlite3_stmt *stmt, const int index, const std::optional<std::string> &value) {
  if (value.has_value()) {
    bind_text(stmt, index, *value);
  } else {
    sqlite3_bind_null(stmt, index);
  }
}

std::string column_text(sqlite3_stmt *stmt, const int column) {
  const auto *text = sqlite3_column_text(stmt, column);
  return text == nullptr ? std::string() : std::string(reinterpret_cast<const char *>(text));
}

std::optional<std::string> column_optional(sqlite3_stmt *stmt, const int column) {
  if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
    return std::nullopt;
  }
  return column_text(stmt, column);
}

Session row_to_session(sqlite3_stmt *stmt) {
  Session session;
  session.id = column_text(stmt, 0);
  session.name = column_text(stmt, 1);
  session.workspace_name = column_text(stmt, 2);
  session.workspace_path = column_text(stmt, 3);
  session.initial_prompt = column_text(stmt, 4);
  session.base_branch = column_text(stmt, 5);
  session.base_commit = column_text(stmt, 6);
  session.status = parse_persisted_status(column_text(stmt, 7)).value_or(PersistedStatus::Failed);
  session.project_id = sqlite3_column_int64(stmt, 8);
  session.folder_id = column_optional(stmt, 9);
  session.tool = parse_tool_kind(column_text(stmt, 10)).value_or(ToolKind::None);
  session.commit_mode = parse_commit_mode(column_text(stmt, 11)).value_or(CommitMode::Disabled);
  session.auto_commit = sqlite3_column_int(stmt, 12) != 0;
  session.archived = sqlite3_column_int(stmt, 13) != 0;
  session.last_viewed_at = column_optional(stmt, 14);
  session.created_at = column_text(stmt, 15);
  session.updated_at = column_text(stmt, 16);
  session.status_message = column_text(stmt, 17);
  return session;
}

Project row_to_project(sqlite3_stmt *stmt) {
  Project project;
  project.id = sqlite3_column_int64(stmt, 0);
  project.name = column_text(stmt, 1);
  project.path = column_text(stmt, 2);
  project.worktree_folder = column_optional(stmt, 3);
  project.build_script = column_optional(stmt, 4);
  project.main_branch = column_optional(stmt, 5);
  project.active = sqlite3_column_int(stmt, 6) != 0;
  project.created_at = column_text(stmt, 7);
  return project;
}

ExecutionDiff row_to_diff(sqlite3_stmt *stmt) {
  ExecutionDiff diff;
  diff.id = sqlite3_column_int64(stmt, 0);
  diff.session_id = column_text(stmt, 1);
  diff.sequence = sqlite3_column_int64(stmt, 2);
  diff.diff = column_text(stmt, 3);
  diff.files_changed = common::json_parse_string_array(column_text(stmt, 4));
  diff.additions = sqlite3_column_int64(stmt, 5);
  diff.deletions = sqlite3_column_int64(stmt, 6);
  diff.files_changed_count = sqlite3_column_int64(stmt, 7);
  diff.before_commit = column_text(stmt, 8);
  diff.after_commit = column_text(stmt, 9);
  diff.created_at = column_text(stmt, 10);
  return diff;
}

} // namespace

SqliteSessionStore::SqliteSessionStore(std::filesystem::path db_path)
    : db_path_(std::move(db_path)) {
  std::error_code ec;
  if (!db_path_.parent_path().empty()) {
    std::filesystem::create_directories(db_path_.parent_path(), ec);
  }
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(db_path_.string().c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    open_error_ = db_ == nullptr ? "sqlite open failed" : sqlite3_errmsg(db_);
    if (db_ != nullptr) {
      sqlite3_close(db_);
    }
    db_ = nullptr;
    return;
  }
  sqlite3_busy_timeout(db_, 5000);
  if (auto schema = init_schema(); !schema.ok()) {
    open_error_ = schema.error();
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

SqliteSessionStore::~SqliteSessionStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status SqliteSessionStore::status() const {
  if (db_ == nullptr) {
    return common::Status::error(common::ErrorKind::Configuration,
                                 "Cannot open session database " + db_path_.string() + ": " +
                                     open_error_);
  }
  return common::Status::success();
}

common::Status SqliteSessionStore::init_schema() {
  if (db_ == nullptr) {
    return common::Status::error(kNotInitialized);
  }
  return exec_sql(db_, R"(
PRAGMA journal_mode = WAL;
PRAGMA foreign_keys = ON;
CREATE TABLE IF NOT EXISTS projects (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  name TEXT NOT NULL,
  path TEXT NOT NULL UNIQUE,
  worktree_folder TEXT,
  build_script TEXT,
  main_branch TEXT,
  active INTEGER NOT NULL DEFAULT 0,
  created_at TEXT NOT NULL
);
CREATE TABLE IF NOT EXISTS folders (
  id TEXT PRIMARY KEY,
  name TEXT NOT NULL,
  project_id INTEGER NOT NULL REFERENCES projects(id),
  created_at TEXT NOT NULL
);
CREATE TABLE IF NOT EXISTS sessions (
  id TEXT PRIMARY KEY,
  name TEXT NOT NULL,
  workspace_name TEXT NOT NULL,
  workspace_path TEXT NOT NULL,
  initial_prompt TEXT NOT NULL DEFAULT '',
  base_branch TEXT,
  base_commit TEXT,
  status TEXT NOT NULL,
  project_id INTEGER NOT NULL REFERENCES projects(id),
  folder_id TEXT REFERENCES folders(id),
  tool TEXT NOT NULL DEFAULT 'claude',
  commit_mode TEXT NOT NULL DEFAULT 'checkpoint',
  auto_commit INTEGER NOT NULL DEFAULT 1,
  archived INTEGER NOT NULL DEFAULT 0,
  last_viewed_at TEXT,
  created_at TEXT NOT NULL,
  updated_at TEXT NOT NULL,
  status_message TEXT NOT NULL DEFAULT ''
);
CREATE INDEX IF NOT EXISTS idx_sessions_project_name ON sessions(project_id, name);
CREATE INDEX IF NOT EXISTS idx_sessions_project_workspace ON sessions(project_id, workspace_name);
CREATE TABLE IF NOT EXISTS execution_diffs (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  session_id TEXT NOT NULL REFERENCES sessions(id),
  execution_sequence INTEGER NOT NULL,
  git_diff TEXT NOT NULL DEFAULT '',
  files_changed TEXT NOT NULL DEFAULT '[]',
  stats_additions INTEGER NOT NULL DEFAULT 0,
  stats_deletions INTEGER NOT NULL DEFAULT 0,
  stats_files_changed INTEGER NOT NULL DEFAULT 0,
  before_commit_hash TEXT,
  after_commit_hash TEXT,
  created_at TEXT NOT NULL,
  UNIQUE(session_id, execution_sequence)
);
CREATE TABLE IF NOT EXISTS conversation_messages (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  session_id TEXT NOT NULL REFERENCES sessions(id),
  panel_id TEXT,
  message_type TEXT NOT NULL,
  content TEXT NOT NULL,
  timestamp TEXT NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_conversation_session ON conversation_messages(session_id);
)");
}

std::string SqliteSessionStore::next_timestamp() {
  auto now = std::chrono::system_clock::now();
  const auto floor_ms = std::chrono::time_point_cast<std::chrono::milliseconds>(now);
  now = floor_ms;
  if (now <= last_timestamp_) {
    now = last_timestamp_ + std::chrono::milliseconds(1);
  }
  last_timestamp_ = now;
  return common::format_rfc3339_millis(now);
}

common::Status SqliteSessionStore::execute(const std::string &sql,
                                           const std::vector<std::string> &text_args,
                                           int *changes) {
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  for (std::size_t i = 0; i < text_args.size(); ++i) {
    bind_text(stmt, static_cast<int>(i + 1), text_args[i]);
  }
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  if (changes != nullptr) {
    *changes = sqlite3_changes(db_);
  }
  return common::Status::success();
}

common::Result<Project> SqliteSessionStore::load_project(const std::int64_t id) const {
  sqlite3_stmt *stmt = nullptr;
  const std::string sql = std::string("SELECT ") + kProjectColumns + " FROM projects WHERE id = ?1";
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<Project>::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_int64(stmt, 1, id);
  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    Project project = row_to_project(stmt);
    sqlite3_finalize(stmt);
    return common::Result<Project>::success(std::move(project));
  }
  sqlite3_finalize(stmt);
  if (rc == SQLITE_DONE) {
    return common::Result<Project>::failure(common::ErrorKind::NotFound,
                                            "Project " + std::to_string(id) + " not found");
  }
  return common::Result<Project>::failure(sqlite3_errmsg(db_));
}

common::Result<Session> SqliteSessionStore::load_session(const std::string &id) const {
  sqlite3_stmt *stmt = nullptr;
  const std::string sql = std::string("SELECT ") + kSessionColumns + " FROM sessions WHERE id = ?1";
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<Session>::failure(sqlite3_errmsg(db_));
  }
  bind_text(stmt, 1, id);
  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    Session session = row_to_session(stmt);
    sqlite3_finalize(stmt);
    return common::Result<Session>::success(std::move(session));
  }
  sqlite3_finalize(stmt);
  if (rc == SQLITE_DONE) {
    return common::Result<Session>::failure(common::ErrorKind::NotFound,
                                            "Session " + id + " not found");
  }
  return common::Result<Session>::failure(sqlite3_errmsg(db_));
}

common::Result<Project> SqliteSessionStore::create_project(const NewProject &project) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<Project>::failure(kNotInitialized);
  }
  if (common::trim(project.name).empty() || common::trim(project.path).empty()) {
    return common::Result<Project>::failure(common::ErrorKind::Configuration,
                                            "Project name and path are required");
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "INSERT INTO projects(name, path, worktree_folder, build_script, main_branch, "
                    "active, created_at) VALUES(?1, ?2, ?3, ?4, ?5, "
                    "(SELECT COUNT(*) = 0 FROM projects), ?6)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<Project>::failure(sqlite3_errmsg(db_));
  }
  bind_text(stmt, 1, project.name);
  bind_text(stmt, 2, project.path);
  bind_optional(stmt, 3, project.worktree_folder);
  bind_optional(stmt, 4, project.build_script);
  bind_optional(stmt, 5, project.main_branch);
  const std::string now = next_timestamp();
  bind_text(stmt, 6, now);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc == SQLITE_CONSTRAINT) {
    return common::Result<Project>::failure(common::ErrorKind::Configuration,
                                            "A project already exists at " + project.path);
  }
  if (rc != SQLITE_DONE) {
    return common::Result<Project>::failure(sqlite3_errmsg(db_));
  }
  return load_project(sqlite3_last_insert_rowid(db_));
}

common::Result<Project> SqliteSessionStore::get_project(const std::int64_t id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<Project>::failure(kNotInitialized);
  }
  return load_project(id);
}

common::Result<std::vector<Project>> SqliteSessionStore::list_projects() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::vector<Project>>::failure(kNotInitialized);
  }
  sqlite3_stmt *stmt = nullptr;
  const std::string sql = std::string("SELECT ") + kProjectColumns + " FROM projects ORDER BY id";
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::vector<Project>>::failure(sqlite3_errmsg(db_));
  }
  std::vector<Project> projects;
  while (sqlite3_step(stmt) == SQLITE_ROW) {
    projects.push_back(row_to_project(stmt));
  }
  sqlite3_finalize(stmt);
  return common::Result<std::vector<Project>>::success(std::move(projects));
}

common::Result<std::optional<Project>> SqliteSessionStore::active_project() const {
  using Active = common::Result<std::optional<Project>>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return Active::failure(kNotInitialized);
  }
  sqlite3_stmt *stmt = nullptr;
  const std::string sql =
      std::string("SELECT ") + kProjectColumns + " FROM projects WHERE active = 1 LIMIT 1";
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return Active::failure(sqlite3_errmsg(db_));
  }
  std::optional<Project> project;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    project = row_to_project(stmt);
  }
  sqlite3_finalize(stmt);
  return Active::success(std::move(project));
}

common::Status SqliteSessionStore::set_active_project(const std::int64_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error(kNotInitialized);
  }
  if (auto project = load_project(id); !project.ok()) {
    return common::Status::error(project.details());
  }
  return execute("UPDATE projects SET active = CASE WHEN id = ?1 THEN 1 ELSE 0 END",
                 {std::to_string(id)});
}

common::Result<Folder> SqliteSessionStore::create_folder(const std::string &name,
                                                         const std::int64_t project_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<Folder>::failure(kNotInitialized);
  }
  Folder folder{.id = common::generate_id(),
                .name = name,
                .project_id = project_id,
                .created_at = next_timestamp()};
  if (auto inserted = execute("INSERT INTO folders(id, name, project_id, created_at) "
                              "VALUES(?1, ?2, ?3, ?4)",
                              {folder.id, folder.name, std::to_string(project_id),
                               folder.created_at});
      !inserted.ok()) {
    return common::Result<Folder>::failure(inserted.details());
  }
  return common::Result<Folder>::success(std::move(folder));
}

common::Result<std::vector<Folder>>
SqliteSessionStore::list_folders(const std::int64_t project_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::vector<Folder>>::failure(kNotInitialized);
  }
  sqlite3_stmt *stmt = nullptr;
  const char *sql = "SELECT id, name, project_id, created_at FROM folders WHERE project_id = ?1 "
                    "ORDER BY created_at";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::vector<Folder>>::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_int64(stmt, 1, project_id);
  std::vector<Folder> folders;
  while (sqlite3_step(stmt) == SQLITE_ROW) {
    folders.push_back(Folder{.id = column_text(stmt, 0),
                             .name = column_text(stmt, 1),
                             .project_id = sqlite3_column_int64(stmt, 2),
                             .created_at = column_text(stmt, 3)});
  }
  sqlite3_finalize(stmt);
  return common::Result<std::vector<Folder>>::success(std::move(folders));
}

common::Result<Session> SqliteSessionStore::create_session(Session session) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<Session>::failure(kNotInitialized);
  }
  if (session.id.empty()) {
    session.id = common::generate_id();
  }
  session.created_at = next_timestamp();
  session.updated_at = session.created_at;

  sqlite3_stmt *stmt = nullptr;
  const std::string sql = std::string("INSERT INTO sessions(") + kSessionColumns +
                          ") VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14, "
                          "?15, ?16, ?17, ?18)";
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<Session>::failure(sqlite3_errmsg(db_));
  }
  bind_text(stmt, 1, session.id);
  bind_text(stmt, 2, session.name);
  bind_text(stmt, 3, session.workspace_name);
  bind_text(stmt, 4, session.workspace_path);
  bind_text(stmt, 5, session.initial_prompt);
  bind_text(stmt, 6, session.base_branch);
  bind_text(stmt, 7, session.base_commit);
  bind_text(stmt, 8, std::string(to_string(session.status)));
  sqlite3_bind_int64(stmt, 9, session.project_id);
  bind_optional(stmt, 10, session.folder_id);
  bind_text(stmt, 11, std::string(to_string(session.tool)));
  bind_text(stmt, 12, std::string(to_string(session.commit_mode)));
  sqlite3_bind_int(stmt, 13, session.auto_commit ? 1 : 0);
  sqlite3_bind_int(stmt, 14, session.archived ? 1 : 0);
  bind_optional(stmt, 15, session.last_viewed_at);
  bind_text(stmt, 16, session.created_at);
  bind_text(stmt, 17, session.updated_at);
  bind_text(stmt, 18, session.status_message);

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<Session>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<Session>::success(std::move(session));
}

common::Result<Session> SqliteSessionStore::get_session(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<Session>::failure(kNotInitialized);
  }
  return load_session(id);
}

common::Result<std::vector<Session>>
SqliteSessionStore::list_sessions(const std::optional<std::int64_t> project_id,
                                  const bool include_archived) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::vector<Session>>::failure(kNotInitialized);
  }
  std::string sql = std::string("SELECT ") + kSessionColumns + " FROM sessions WHERE 1 = 1";
  if (project_id.has_value()) {
    sql += " AND project_id = ?1";
  }
  if (!include_archived) {
    sql += " AND archived = 0";
  }
  sql += " ORDER BY created_at";

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::vector<Session>>::failure(sqlite3_errmsg(db_));
  }
  if (project_id.has_value()) {
    sqlite3_bind_int64(stmt, 1, *project_id);
  }
  std::vector<Session> sessions;
  while (sqlite3_step(stmt) == SQLITE_ROW) {
    sessions.push_back(row_to_session(stmt));
  }
  sqlite3_finalize(stmt);
  return common::Result<std::vector<Session>>::success(std::move(sessions));
}

common::Result<Session> SqliteSessionStore::update_status(const std::string &id,
                                                          const PersistedStatus status,
                                                          std::optional<std::string> status_message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<Session>::failure(kNotInitialized);
  }
  int changes = 0;
  common::Status updated = status_message.has_value()
                               ? execute("UPDATE sessions SET status = ?1, status_message = ?2, "
                                         "updated_at = ?3 WHERE id = ?4",
                                         {std::string(to_string(status)), *status_message,
                                          next_timestamp(), id},
                                         &changes)
                               : execute("UPDATE sessions SET status = ?1, updated_at = ?2 "
                                         "WHERE id = ?3",
                                         {std::string(to_string(status)), next_timestamp(), id},
                                         &changes);
  if (!updated.ok()) {
    return common::Result<Session>::failure(updated.details());
  }
  if (changes == 0) {
    return common::Result<Session>::failure(common::ErrorKind::NotFound,
                                            "Session " + id + " not found");
  }
  return load_session(id);
}

common::Result<Session> SqliteSessionStore::set_status_message(const std::string &id,
                                                               const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<Session>::failure(kNotInitialized);
  }
  int changes = 0;
  if (auto updated = execute("UPDATE sessions SET status_message = ?1, updated_at = ?2 "
                             "WHERE id = ?3",
                             {message, next_timestamp(), id}, &changes);
      !updated.ok()) {
    return common::Result<Session>::failure(updated.details());
  }
  if (changes == 0) {
    return common::Result<Session>::failure(common::ErrorKind::NotFound,
                                            "Session " + id + " not found");
  }
  return load_session(id);
}

common::Result<Session> SqliteSessionStore::mark_viewed(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<Session>::failure(kNotInitialized);
  }
  const std::string now = next_timestamp();
  int changes = 0;
  if (auto updated = execute("UPDATE sessions SET last_viewed_at = ?1, updated_at = ?1 "
                             "WHERE id = ?2",
                             {now, id}, &changes);
      !updated.ok()) {
    return common::Result<Session>::failure(updated.details());
  }
  if (changes == 0) {
    return common::Result<Session>::failure(common::ErrorKind::NotFound,
                                            "Session " + id + " not found");
  }
  return load_session(id);
}

common::Result<Session> SqliteSessionStore::archive(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<Session>::failure(kNotInitialized);
  }
  int changes = 0;
  if (auto updated = execute("UPDATE sessions SET archived = 1, updated_at = ?1 WHERE id = ?2",
                             {next_timestamp(), id}, &changes);
      !updated.ok()) {
    return common::Result<Session>::failure(updated.details());
  }
  if (changes == 0) {
    return common::Result<Session>::failure(common::ErrorKind::NotFound,
                                            "Session " + id + " not found");
  }
  return load_session(id);
}

common::Result<std::vector<std::string>> SqliteSessionStore::stop_active_sessions() {
  using Ids = common::Result<std::vector<std::string>>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return Ids::failure(kNotInitialized);
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "SELECT id FROM sessions WHERE status IN ('running', 'pending')";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return Ids::failure(sqlite3_errmsg(db_));
  }
  std::vector<std::string> ids;
  while (sqlite3_step(stmt) == SQLITE_ROW) {
    ids.push_back(column_text(stmt, 0));
  }
  sqlite3_finalize(stmt);

  for (const auto &id : ids) {
    if (auto updated = execute("UPDATE sessions SET status = 'stopped', updated_at = ?1 "
                               "WHERE id = ?2",
                               {next_timestamp(), id});
        !updated.ok()) {
      return Ids::failure(updated.details());
    }
  }
  return Ids::success(std::move(ids));
}

common::Result<bool> SqliteSessionStore::display_name_exists(const std::int64_t project_id,
                                                             const std::string &name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<bool>::failure(kNotInitialized);
  }
  sqlite3_stmt *stmt = nullptr;
  const char *sql = "SELECT 1 FROM sessions WHERE project_id = ?1 AND name = ?2 LIMIT 1";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<bool>::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_int64(stmt, 1, project_id);
  bind_text(stmt, 2, name);
  const bool found = sqlite3_step(stmt) == SQLITE_ROW;
  sqlite3_finalize(stmt);
  return common::Result<bool>::success(found);
}

common::Result<bool> SqliteSessionStore::workspace_name_exists(const std::int64_t project_id,
                                                               const std::string &name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<bool>::failure(kNotInitialized);
  }
  sqlite3_stmt *stmt = nullptr;
  const char *sql = "SELECT 1 FROM sessions WHERE project_id = ?1 AND "
                    "(name = ?2 OR workspace_name = ?2) LIMIT 1";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<bool>::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_int64(stmt, 1, project_id);
  bind_text(stmt, 2, name);
  const bool found = sqlite3_step(stmt) == SQLITE_ROW;
  sqlite3_finalize(stmt);
  return common::Result<bool>::success(found);
}

common::Result<std::int64_t>
SqliteSessionStore::next_execution_sequence(const std::string &session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::int64_t>::failure(kNotInitialized);
  }
  sqlite3_stmt *stmt = nullptr;
  const char *sql =
      "SELECT COALESCE(MAX(execution_sequence), 0) + 1 FROM execution_diffs WHERE session_id = ?1";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::int64_t>::failure(sqlite3_errmsg(db_));
  }
  bind_text(stmt, 1, session_id);
  std::int64_t next = 1;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    next = sqlite3_column_int64(stmt, 0);
  }
  sqlite3_finalize(stmt);
  return common::Result<std::int64_t>::success(next);
}

common::Result<ExecutionDiff> SqliteSessionStore::add_execution_diff(ExecutionDiff diff) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<ExecutionDiff>::failure(kNotInitialized);
  }
  diff.created_at = next_timestamp();

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "INSERT INTO execution_diffs(session_id, execution_sequence, git_diff, "
                    "files_changed, stats_additions, stats_deletions, stats_files_changed, "
                    "before_commit_hash, after_commit_hash, created_at) "
                    "VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<ExecutionDiff>::failure(sqlite3_errmsg(db_));
  }
  bind_text(stmt, 1, diff.session_id);
  sqlite3_bind_int64(stmt, 2, diff.sequence);
  bind_text(stmt, 3, diff.diff);
  bind_text(stmt, 4, common::json_string_array(diff.files_changed));
  sqlite3_bind_int64(stmt, 5, diff.additions);
  sqlite3_bind_int64(stmt, 6, diff.deletions);
  sqlite3_bind_int64(stmt, 7, diff.files_changed_count);
  bind_text(stmt, 8, diff.before_commit);
  bind_text(stmt, 9, diff.after_commit);
  bind_text(stmt, 10, diff.created_at);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc == SQLITE_CONSTRAINT) {
    return common::Result<ExecutionDiff>::failure(
        common::ErrorKind::Contention, "Execution sequence " + std::to_string(diff.sequence) +
                                           " already recorded for session " + diff.session_id);
  }
  if (rc != SQLITE_DONE) {
    return common::Result<ExecutionDiff>::failure(sqlite3_errmsg(db_));
  }
  diff.id = sqlite3_last_insert_rowid(db_);
  return common::Result<ExecutionDiff>::success(std::move(diff));
}

common::Result<std::vector<ExecutionDiff>>
SqliteSessionStore::list_execution_diffs(const std::string &session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::vector<ExecutionDiff>>::failure(kNotInitialized);
  }
  sqlite3_stmt *stmt = nullptr;
  const std::string sql = std::string("SELECT ") + kDiffColumns +
                          " FROM execution_diffs WHERE session_id = ?1 ORDER BY execution_sequence";
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::vector<ExecutionDiff>>::failure(sqlite3_errmsg(db_));
  }
  bind_text(stmt, 1, session_id);
  std::vector<ExecutionDiff> diffs;
  while (sqlite3_step(stmt) == SQLITE_ROW) {
    diffs.push_back(row_to_diff(stmt));
  }
  sqlite3_finalize(stmt);
  return common::Result<std::vector<ExecutionDiff>>::success(std::move(diffs));
}

common::Result<ConversationMessage>
SqliteSessionStore::add_conversation_message(const std::string &session_id,
                                             const std::optional<std::string> &panel_id,
                                             const std::string &role,
                                             const std::string &content) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<ConversationMessage>::failure(kNotInitialized);
  }
  ConversationMessage message{.id = 0,
                              .session_id = session_id,
                              .panel_id = panel_id,
                              .role = role,
                              .content = content,
                              .created_at = next_timestamp()};

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "INSERT INTO conversation_messages(session_id, panel_id, message_type, "
                    "content, timestamp) VALUES(?1, ?2, ?3, ?4, ?5)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<ConversationMessage>::failure(sqlite3_errmsg(db_));
  }
  bind_text(stmt, 1, session_id);
  bind_optional(stmt, 2, panel_id);
  bind_text(stmt, 3, role);
  bind_text(stmt, 4, content);
  bind_text(stmt, 5, message.created_at);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<ConversationMessage>::failure(sqlite3_errmsg(db_));
  }
  message.id = sqlite3_last_insert_rowid(db_);
  return common::Result<ConversationMessage>::success(std::move(message));
}

common::Result<std::vector<ConversationMessage>>
SqliteSessionStore::conversation_history(const std::string &session_id,
                                         const std::optional<std::string> &panel_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::vector<ConversationMessage>>::failure(kNotInitialized);
  }
  std::string sql = "SELECT id, session_id, panel_id, message_type, content, timestamp FROM "
                    "conversation_messages WHERE session_id = ?1";
  if (panel_id.has_value()) {
    sql += " AND panel_id = ?2";
  }
  sql += " ORDER BY id";

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::vector<ConversationMessage>>::failure(sqlite3_errmsg(db_));
  }
  bind_text(stmt, 1, session_id);
  if (panel_id.has_value()) {
    bind_text(stmt, 2, *panel_id);
  }
  std::vector<ConversationMessage> messages;
  while (sqlite3_step(stmt) == SQLITE_ROW) {
    messages.push_back(ConversationMessage{.id = sqlite3_column_int64(stmt, 0),
                                           .session_id = column_text(stmt, 1),
                                           .panel_id = column_optional(stmt, 2),
                                           .role = column_text(stmt, 3),
                                           .content = column_text(stmt, 4),
                                           .created_at = column_text(stmt, 5)});
  }
  sqlite3_finalize(stmt);
  return common::Result<std::vector<ConversationMessage>>::success(std::move(messages));
}

} // namespace forkyard::sessions
