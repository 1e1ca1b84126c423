#pragma once

#include <sqlite3.h>

#include <filesystem>
#include <mutex>

#include "tasknag/store/task_snapshot_provider.hpp"

namespace tasknag::store {

// Reads reminders from the task manager's SQLite database (tasks table)
class SqliteTaskSource : public TaskSnapshotProvider {
public:
  explicit SqliteTaskSource(std::filesystem::path db_path);
  ~SqliteTaskSource() override;

  SqliteTaskSource(const SqliteTaskSource&) = delete;
  SqliteTaskSource& operator=(const SqliteTaskSource&) = delete;

  // Open the database, creating the tasks table when it does not exist yet
  Result<void> initialize();

  Result<std::vector<core::TaskRecord>> listActiveNotifiable() override;

  // Insert or replace a task row
  Result<void> upsert(const core::TaskRecord& record);

  const std::filesystem::path& path() const noexcept { return db_path_; }

private:
  Result<void> createTables();
  Result<void> ensureCompatibility();
  Result<void> prepareStatements();
  void finalizeStatements();

  core::TaskRecord extractRecord(sqlite3_stmt* stmt) const;

  // Error handling
  Error makeSqliteError(const std::string& operation);
  Result<void> checkSqliteResult(int result, const std::string& operation);

  std::filesystem::path db_path_;
  sqlite3* db_ = nullptr;
  std::mutex db_mutex_;
  bool has_browser_actions_column_ = true;

  sqlite3_stmt* stmt_list_active_ = nullptr;
  sqlite3_stmt* stmt_upsert_ = nullptr;
};

}  // namespace tasknag::store
