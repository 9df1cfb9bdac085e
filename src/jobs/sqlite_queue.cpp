#include "forkyard/jobs/sqlite_queue.hpp"

#include "forkyard/common/fs.hpp"
#include "forkyard/observability/global.hpp"

#include <array>

namespace forkyard::jobs {

namespace {

constexpr const char *kNotInitialized = "job queue db not initialized";

constexpr std::array<JobKind, 3> kKinds = {JobKind::CreateSession, JobKind::SendInput,
                                           JobKind::ContinueSession};

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

std::string column_text(sqlite3_stmt *stmt, const int column) {
  const auto *text = sqlite3_column_text(stmt, column);
  return text == nullptr ? std::string{} : reinterpret_cast<const char *>(text);
}

std::optional<JobState> parse_state(const std::string &text) {
  for (const auto state : {JobState::Waiting, JobState::Active, JobState::Completed,
                           JobState::Failed}) {
    if (to_string(state) == text) {
      return state;
    }
  }
  return std::nullopt;
}

} // namespace

SqliteJobQueue::SqliteJobQueue(std::filesystem::path db_path, const PoolWidths widths,
                               const std::chrono::milliseconds poll_interval)
    : db_path_(std::move(db_path)), widths_(widths), poll_interval_(poll_interval) {
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

SqliteJobQueue::~SqliteJobQueue() {
  shutdown();
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status SqliteJobQueue::status() const {
  if (db_ == nullptr) {
    return common::Status::error(common::ErrorKind::Configuration,
                                 "Cannot open job queue " + db_path_.string() + ": " +
                                     open_error_);
  }
  return common::Status::success();
}

common::Status SqliteJobQueue::init_schema() {
  return exec_sql(db_, R"(
PRAGMA journal_mode = WAL;
CREATE TABLE IF NOT EXISTS jobs (
  seq INTEGER PRIMARY KEY AUTOINCREMENT,
  id TEXT NOT NULL UNIQUE,
  kind TEXT NOT NULL,
  payload TEXT NOT NULL,
  state TEXT NOT NULL DEFAULT 'waiting',
  error TEXT NOT NULL DEFAULT '',
  session_id TEXT,
  created_at TEXT NOT NULL,
  updated_at TEXT NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_jobs_kind_state ON jobs(kind, state, seq);
)");
}

common::Status SqliteJobQueue::fail_interrupted() {
  std::lock_guard<std::mutex> lock(db_mutex_);
  sqlite3_stmt *stmt = nullptr;
  const char *sql = "UPDATE jobs SET state = 'failed', error = 'Interrupted before completion', "
                    "updated_at = ?1 WHERE state = 'active'";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  bind_text(stmt, 1, common::now_rfc3339());
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  if (const int changed = sqlite3_changes(db_); changed > 0) {
    observability::log_warn("jobs", "Marked " + std::to_string(changed) +
                                        " interrupted job(s) as failed");
  }
  return common::Status::success();
}

common::Status SqliteJobQueue::start(JobProcessor processor) {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (auto opened = status(); !opened.ok()) {
    return opened;
  }
  if (running_.load()) {
    return common::Status::error(common::ErrorKind::Internal, "Job queue already started");
  }
  for (const auto kind : kKinds) {
    if (widths_.for_kind(kind) == 0) {
      return common::Status::error(common::ErrorKind::Configuration,
                                   std::string("Worker pool width for ") +
                                       std::string(to_string(kind)) + " must be positive");
    }
  }
  if (auto recovered = fail_interrupted(); !recovered.ok()) {
    return recovered;
  }
  processor_ = std::move(processor);
  stopping_ = false;
  running_ = true;
  for (const auto kind : kKinds) {
    for (std::uint32_t i = 0; i < widths_.for_kind(kind); ++i) {
      threads_.emplace_back([this, kind] { worker_loop(kind); });
    }
  }
  observability::log_debug("jobs", "SQLite job queue started at " + db_path_.string());
  return common::Status::success();
}

common::Result<JobHandle> SqliteJobQueue::enqueue(Job job) {
  if (!running_.load() || stopping_.load()) {
    return common::Result<JobHandle>::failure(common::ErrorKind::Internal,
                                              "Job queue is not accepting jobs");
  }
  const JobKind kind = job_kind(job);
  std::string id = common::generate_id();
  auto completion = std::make_shared<JobCompletion>();
  {
    std::lock_guard<std::mutex> lock(completions_mutex_);
    completions_[id] = completion;
  }

  {
    std::lock_guard<std::mutex> lock(db_mutex_);
    sqlite3_stmt *stmt = nullptr;
    const char *sql = "INSERT INTO jobs(id, kind, payload, state, created_at, updated_at) "
                      "VALUES(?1, ?2, ?3, 'waiting', ?4, ?4)";
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
      std::lock_guard<std::mutex> drop(completions_mutex_);
      completions_.erase(id);
      return common::Result<JobHandle>::failure(sqlite3_errmsg(db_));
    }
    bind_text(stmt, 1, id);
    bind_text(stmt, 2, std::string(to_string(kind)));
    bind_text(stmt, 3, job_to_json(job));
    bind_text(stmt, 4, common::now_rfc3339());
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
      std::lock_guard<std::mutex> drop(completions_mutex_);
      completions_.erase(id);
      return common::Result<JobHandle>::failure(sqlite3_errmsg(db_));
    }
  }

  {
    std::lock_guard<std::mutex> lock(wake_mutex_);
  }
  wake_.notify_all();
  observability::record_metric(
      observability::QueueDepthMetric{.kind = std::string(to_string(kind)), .depth = depth(kind)});
  return common::Result<JobHandle>::success(JobHandle(std::move(id), kind, std::move(completion)));
}

common::Result<std::optional<SqliteJobQueue::Claimed>>
SqliteJobQueue::claim_next(const JobKind kind) {
  using ClaimResult = common::Result<std::optional<Claimed>>;
  std::lock_guard<std::mutex> lock(db_mutex_);
  if (db_ == nullptr) {
    return ClaimResult::failure(kNotInitialized);
  }
  if (auto begin = exec_sql(db_, "BEGIN IMMEDIATE"); !begin.ok()) {
    return ClaimResult::failure(begin.details());
  }

  sqlite3_stmt *stmt = nullptr;
  const char *select_sql = "SELECT id, payload FROM jobs WHERE kind = ?1 AND state = 'waiting' "
                           "ORDER BY seq LIMIT 1";
  if (sqlite3_prepare_v2(db_, select_sql, -1, &stmt, nullptr) != SQLITE_OK) {
    const std::string message = sqlite3_errmsg(db_);
    (void)exec_sql(db_, "ROLLBACK");
    return ClaimResult::failure(message);
  }
  bind_text(stmt, 1, std::string(to_string(kind)));
  std::optional<std::pair<std::string, std::string>> row;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    row.emplace(column_text(stmt, 0), column_text(stmt, 1));
  }
  sqlite3_finalize(stmt);
  if (!row.has_value()) {
    if (auto commit = exec_sql(db_, "COMMIT"); !commit.ok()) {
      return ClaimResult::failure(commit.details());
    }
    return ClaimResult::success(std::nullopt);
  }

  auto job = job_from_json(kind, row->second);
  const char *update_sql = "UPDATE jobs SET state = ?1, error = ?2, updated_at = ?3 WHERE id = ?4";
  if (sqlite3_prepare_v2(db_, update_sql, -1, &stmt, nullptr) != SQLITE_OK) {
    const std::string message = sqlite3_errmsg(db_);
    (void)exec_sql(db_, "ROLLBACK");
    return ClaimResult::failure(message);
  }
  bind_text(stmt, 1, job.ok() ? "active" : "failed");
  bind_text(stmt, 2, job.ok() ? "" : job.error());
  bind_text(stmt, 3, common::now_rfc3339());
  bind_text(stmt, 4, row->first);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    const std::string message = sqlite3_errmsg(db_);
    (void)exec_sql(db_, "ROLLBACK");
    return ClaimResult::failure(message);
  }
  if (auto commit = exec_sql(db_, "COMMIT"); !commit.ok()) {
    (void)exec_sql(db_, "ROLLBACK");
    return ClaimResult::failure(commit.details());
  }
  if (!job.ok()) {
    observability::log_error("jobs", "Dropping job " + row->first + ": " + job.error());
    return ClaimResult::success(std::nullopt);
  }
  return ClaimResult::success(Claimed{.id = row->first, .job = std::move(job.value())});
}

common::Status SqliteJobQueue::finish(const std::string &id, const JobOutcome &outcome) {
  std::lock_guard<std::mutex> lock(db_mutex_);
  sqlite3_stmt *stmt = nullptr;
  const char *sql =
      "UPDATE jobs SET state = ?1, error = ?2, session_id = ?3, updated_at = ?4 WHERE id = ?5";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  bind_text(stmt, 1, std::string(to_string(outcome.state)));
  bind_text(stmt, 2, outcome.error.has_value() ? outcome.error->message : "");
  if (outcome.session_id.has_value()) {
    bind_text(stmt, 3, *outcome.session_id);
  } else {
    sqlite3_bind_null(stmt, 3);
  }
  bind_text(stmt, 4, common::now_rfc3339());
  bind_text(stmt, 5, id);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

void SqliteJobQueue::worker_loop(const JobKind kind) {
  while (true) {
    auto claimed = claim_next(kind);
    if (!claimed.ok()) {
      observability::log_error("jobs", "Claiming " + std::string(to_string(kind)) +
                                           " job failed: " + claimed.error());
    } else if (claimed.value().has_value()) {
      const auto &next = *claimed.value();
      JobOutcome outcome = processor_(next.id, next.job);
      if (auto stored = finish(next.id, outcome); !stored.ok()) {
        observability::log_error("jobs", "Recording result of job " + next.id +
                                             " failed: " + stored.error());
      }
      std::shared_ptr<JobCompletion> completion;
      {
        std::lock_guard<std::mutex> lock(completions_mutex_);
        if (auto it = completions_.find(next.id); it != completions_.end()) {
          completion = it->second;
          completions_.erase(it);
        }
      }
      if (completion != nullptr) {
        completion->complete(std::move(outcome));
      }
      continue;
    }

    if (stopping_.load()) {
      return;
    }
    std::unique_lock<std::mutex> lock(wake_mutex_);
    wake_.wait_for(lock, poll_interval_, [&] { return stopping_.load(); });
  }
}

void SqliteJobQueue::shutdown() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (!running_.load()) {
    return;
  }
  {
    std::lock_guard<std::mutex> wake_lock(wake_mutex_);
    stopping_ = true;
  }
  wake_.notify_all();
  for (auto &thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  threads_.clear();
  running_ = false;

  std::lock_guard<std::mutex> completions_lock(completions_mutex_);
  for (auto &[id, completion] : completions_) {
    common::Error error{.kind = common::ErrorKind::Internal,
                        .message = "Job queue shut down before job " + id + " ran"};
    completion->complete(JobOutcome{.state = JobState::Failed, .error = std::move(error)});
  }
  completions_.clear();
}

std::size_t SqliteJobQueue::depth(const JobKind kind) const {
  std::lock_guard<std::mutex> lock(db_mutex_);
  if (db_ == nullptr) {
    return 0;
  }
  sqlite3_stmt *stmt = nullptr;
  const char *sql = "SELECT COUNT(*) FROM jobs WHERE kind = ?1 AND state = 'waiting'";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return 0;
  }
  bind_text(stmt, 1, std::string(to_string(kind)));
  std::size_t count = 0;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    count = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
  }
  sqlite3_finalize(stmt);
  return count;
}

common::Result<JobRecord> SqliteJobQueue::record(const std::string &id) const {
  std::lock_guard<std::mutex> lock(db_mutex_);
  if (db_ == nullptr) {
    return common::Result<JobRecord>::failure(kNotInitialized);
  }
  sqlite3_stmt *stmt = nullptr;
  const char *sql = "SELECT id, kind, state, error, session_id FROM jobs WHERE id = ?1";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<JobRecord>::failure(sqlite3_errmsg(db_));
  }
  bind_text(stmt, 1, id);
  if (sqlite3_step(stmt) != SQLITE_ROW) {
    sqlite3_finalize(stmt);
    return common::Result<JobRecord>::failure(common::ErrorKind::NotFound,
                                              "Job not found: " + id);
  }
  JobRecord out;
  out.id = column_text(stmt, 0);
  out.kind = parse_job_kind(column_text(stmt, 1)).value_or(JobKind::CreateSession);
  out.state = parse_state(column_text(stmt, 2)).value_or(JobState::Failed);
  out.error = column_text(stmt, 3);
  if (sqlite3_column_type(stmt, 4) != SQLITE_NULL) {
    out.session_id = column_text(stmt, 4);
  }
  sqlite3_finalize(stmt);
  return common::Result<JobRecord>::success(std::move(out));
}

} // namespace forkyard::jobs
