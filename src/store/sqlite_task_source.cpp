#include "tasknag/store/sqlite_task_source.hpp"

#include <spdlog/spdlog.h>

#include "tasknag/util/time.hpp"

namespace tasknag::store {

namespace sql {

// Same layout the task manager writes; created only for a fresh database
constexpr const char* kCreateTasksTable = R"(
CREATE TABLE IF NOT EXISTS tasks (
  id TEXT PRIMARY KEY,
  title TEXT NOT NULL,
  description TEXT,
  status TEXT NOT NULL CHECK(status IN ('inbox', 'todo', 'in_progress', 'done')),
  parent_id TEXT,
  due_date TEXT,
  completed_at TEXT,
  created_at TEXT NOT NULL,
  updated_at TEXT NOT NULL,
  progress INTEGER DEFAULT 0,
  notification_type TEXT DEFAULT 'none' CHECK(notification_type IN ('none', 'due_date_based', 'recurring')),
  notification_days_before INTEGER DEFAULT NULL,
  notification_time TEXT DEFAULT NULL,
  notification_days_of_week TEXT DEFAULT NULL,
  notification_level INTEGER DEFAULT 1 CHECK(notification_level IN (1, 2, 3)),
  browser_actions TEXT DEFAULT NULL
)
)";

constexpr const char* kCreateIndexes = R"(
CREATE INDEX IF NOT EXISTS idx_tasks_status ON tasks(status);
CREATE INDEX IF NOT EXISTS idx_tasks_notification_type ON tasks(notification_type);
)";

// The database is shared with the task manager process
constexpr const char* kConnectionPragmas = R"(
PRAGMA busy_timeout = 5000;
PRAGMA journal_mode = WAL;
)";

constexpr const char* kListActiveColumns =
    "SELECT id, title, status, due_date, notification_type, notification_days_before, "
    "notification_time, notification_days_of_week, notification_level, created_at, ";

constexpr const char* kListActiveWhere = R"(
  FROM tasks
  WHERE status != 'done'
    AND notification_type IS NOT NULL
    AND notification_type != 'none'
  ORDER BY notification_level DESC, created_at DESC, id ASC
)";

constexpr const char* kUpsertWithActions = R"(
INSERT INTO tasks (id, title, status, due_date, notification_type, notification_days_before,
                   notification_time, notification_days_of_week, notification_level,
                   created_at, updated_at, browser_actions)
VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
ON CONFLICT(id) DO UPDATE SET
  title = excluded.title,
  status = excluded.status,
  due_date = excluded.due_date,
  notification_type = excluded.notification_type,
  notification_days_before = excluded.notification_days_before,
  notification_time = excluded.notification_time,
  notification_days_of_week = excluded.notification_days_of_week,
  notification_level = excluded.notification_level,
  updated_at = excluded.updated_at,
  browser_actions = excluded.browser_actions
)";

constexpr const char* kUpsertWithoutActions = R"(
INSERT INTO tasks (id, title, status, due_date, notification_type, notification_days_before,
                   notification_time, notification_days_of_week, notification_level,
                   created_at, updated_at)
VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
ON CONFLICT(id) DO UPDATE SET
  title = excluded.title,
  status = excluded.status,
  due_date = excluded.due_date,
  notification_type = excluded.notification_type,
  notification_days_before = excluded.notification_days_before,
  notification_time = excluded.notification_time,
  notification_days_of_week = excluded.notification_days_of_week,
  notification_level = excluded.notification_level,
  updated_at = excluded.updated_at
)";

}  // namespace sql

namespace {

std::optional<std::string> columnText(sqlite3_stmt* stmt, int column) {
  if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
    return std::nullopt;
  }
  const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
  return text ? std::optional<std::string>(text) : std::nullopt;
}

std::optional<int> columnInt(sqlite3_stmt* stmt, int column) {
  if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
    return std::nullopt;
  }
  return sqlite3_column_int(stmt, column);
}

void bindOptionalText(sqlite3_stmt* stmt, int index, const std::optional<std::string>& value) {
  if (value) {
    sqlite3_bind_text(stmt, index, value->c_str(), -1, SQLITE_TRANSIENT);
  } else {
    sqlite3_bind_null(stmt, index);
  }
}

void bindOptionalInt(sqlite3_stmt* stmt, int index, const std::optional<int>& value) {
  if (value) {
    sqlite3_bind_int(stmt, index, *value);
  } else {
    sqlite3_bind_null(stmt, index);
  }
}

}  // namespace

SqliteTaskSource::SqliteTaskSource(std::filesystem::path db_path)
    : db_path_(std::move(db_path)) {
}

SqliteTaskSource::~SqliteTaskSource() {
  finalizeStatements();
  if (db_) {
    sqlite3_close(db_);
  }
}

Result<void> SqliteTaskSource::initialize() {
  std::lock_guard<std::mutex> lock(db_mutex_);

  auto parent = db_path_.parent_path();
  if (!parent.empty() && !std::filesystem::exists(parent)) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      return std::unexpected(makeError(ErrorCode::kDirectoryCreateError,
                                       "Failed to create database directory: " + ec.message()));
    }
  }

  int result = sqlite3_open(db_path_.c_str(), &db_);
  if (result != SQLITE_OK) {
    return std::unexpected(makeSqliteError("Failed to open database " + db_path_.string()));
  }

  auto pragma_result = checkSqliteResult(
      sqlite3_exec(db_, sql::kConnectionPragmas, nullptr, nullptr, nullptr),
      "Configure database pragmas");
  if (!pragma_result.has_value()) {
    return pragma_result;
  }

  auto tables_result = createTables();
  if (!tables_result.has_value()) {
    return tables_result;
  }

  auto compat_result = ensureCompatibility();
  if (!compat_result.has_value()) {
    return compat_result;
  }

  return prepareStatements();
}

Result<void> SqliteTaskSource::createTables() {
  const char* schemas[] = {
    sql::kCreateTasksTable,
    sql::kCreateIndexes,
  };

  for (const char* schema : schemas) {
    auto result = checkSqliteResult(
        sqlite3_exec(db_, schema, nullptr, nullptr, nullptr),
        "Create tables");
    if (!result.has_value()) {
      return result;
    }
  }
  return {};
}

Result<void> SqliteTaskSource::ensureCompatibility() {
  // Databases created before browser actions existed lack that column
  sqlite3_stmt* stmt = nullptr;
  int result = sqlite3_prepare_v2(db_, "PRAGMA table_info(tasks)", -1, &stmt, nullptr);
  if (result != SQLITE_OK) {
    return std::unexpected(makeSqliteError("Inspect tasks table"));
  }

  has_browser_actions_column_ = false;
  while ((result = sqlite3_step(stmt)) == SQLITE_ROW) {
    auto name = columnText(stmt, 1);
    if (name && *name == "browser_actions") {
      has_browser_actions_column_ = true;
    }
  }
  sqlite3_finalize(stmt);

  if (result != SQLITE_DONE) {
    return std::unexpected(makeSqliteError("Inspect tasks table"));
  }

  if (!has_browser_actions_column_) {
    spdlog::info("tasks table has no browser_actions column, browser actions are disabled");
  }
  return {};
}

Result<void> SqliteTaskSource::prepareStatements() {
  std::string list_sql = std::string(sql::kListActiveColumns) +
                         (has_browser_actions_column_ ? "browser_actions" : "NULL AS browser_actions") +
                         sql::kListActiveWhere;

  struct StatementDef {
    const char* sql;
    sqlite3_stmt** stmt;
  };

  StatementDef statements[] = {
    {list_sql.c_str(), &stmt_list_active_},
    {has_browser_actions_column_ ? sql::kUpsertWithActions : sql::kUpsertWithoutActions, &stmt_upsert_},
  };

  for (const auto& stmt_def : statements) {
    int result = sqlite3_prepare_v2(db_, stmt_def.sql, -1, stmt_def.stmt, nullptr);
    if (result != SQLITE_OK) {
      return std::unexpected(makeSqliteError("Failed to prepare statement"));
    }
  }

  return {};
}

void SqliteTaskSource::finalizeStatements() {
  sqlite3_stmt* statements[] = {stmt_list_active_, stmt_upsert_};

  for (auto stmt : statements) {
    if (stmt) {
      sqlite3_finalize(stmt);
    }
  }
  stmt_list_active_ = nullptr;
  stmt_upsert_ = nullptr;
}

Result<std::vector<core::TaskRecord>> SqliteTaskSource::listActiveNotifiable() {
  std::lock_guard<std::mutex> lock(db_mutex_);

  if (!stmt_list_active_) {
    return std::unexpected(makeError(ErrorCode::kDatabaseError, "Statement not prepared"));
  }

  sqlite3_reset(stmt_list_active_);

  std::vector<core::TaskRecord> records;
  int result;
  while ((result = sqlite3_step(stmt_list_active_)) == SQLITE_ROW) {
    records.push_back(extractRecord(stmt_list_active_));
  }

  if (result != SQLITE_DONE) {
    return std::unexpected(makeSqliteError("Failed to list active tasks"));
  }

  return records;
}

core::TaskRecord SqliteTaskSource::extractRecord(sqlite3_stmt* stmt) const {
  core::TaskRecord record;
  record.id = columnText(stmt, 0).value_or("");
  record.title = columnText(stmt, 1).value_or("");
  record.status = columnText(stmt, 2).value_or("");
  record.due_date = columnText(stmt, 3);
  record.notification_type = columnText(stmt, 4);
  record.notification_days_before = columnInt(stmt, 5);
  record.notification_time = columnText(stmt, 6);
  record.notification_days_of_week = columnText(stmt, 7);
  record.notification_level = columnInt(stmt, 8);
  record.created_at = columnText(stmt, 9);
  record.browser_actions = columnText(stmt, 10);
  return record;
}

Result<void> SqliteTaskSource::upsert(const core::TaskRecord& record) {
  std::lock_guard<std::mutex> lock(db_mutex_);

  if (!stmt_upsert_) {
    return std::unexpected(makeError(ErrorCode::kDatabaseError, "Statement not prepared"));
  }

  std::string now = util::Time::toRfc3339(util::Time::now());

  sqlite3_reset(stmt_upsert_);
  sqlite3_clear_bindings(stmt_upsert_);
  sqlite3_bind_text(stmt_upsert_, 1, record.id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt_upsert_, 2, record.title.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt_upsert_, 3, record.status.c_str(), -1, SQLITE_TRANSIENT);
  bindOptionalText(stmt_upsert_, 4, record.due_date);
  bindOptionalText(stmt_upsert_, 5, record.notification_type);
  bindOptionalInt(stmt_upsert_, 6, record.notification_days_before);
  bindOptionalText(stmt_upsert_, 7, record.notification_time);
  bindOptionalText(stmt_upsert_, 8, record.notification_days_of_week);
  bindOptionalInt(stmt_upsert_, 9, record.notification_level);
  sqlite3_bind_text(stmt_upsert_, 10, record.created_at.value_or(now).c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt_upsert_, 11, now.c_str(), -1, SQLITE_TRANSIENT);
  if (has_browser_actions_column_) {
    bindOptionalText(stmt_upsert_, 12, record.browser_actions);
  }

  int result = sqlite3_step(stmt_upsert_);
  if (result != SQLITE_DONE) {
    return std::unexpected(makeSqliteError("Failed to store task " + record.id));
  }
  return {};
}

Error SqliteTaskSource::makeSqliteError(const std::string& operation) {
  std::string message = operation;
  if (db_) {
    message += ": " + std::string(sqlite3_errmsg(db_));
  }
  return makeError(ErrorCode::kDatabaseError, message);
}

Result<void> SqliteTaskSource::checkSqliteResult(int result, const std::string& operation) {
  if (result == SQLITE_OK || result == SQLITE_DONE || result == SQLITE_ROW) {
    return {};
  }
  return std::unexpected(makeSqliteError(operation));
}

}  // namespace tasknag::store
