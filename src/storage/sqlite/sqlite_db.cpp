#include "deptcat/storage/sqlite/sqlite_db.h"

#include <sqlite3.h>

namespace deptcat::storage::sqlite {

void SqliteDb::SqliteDeleter::operator()(sqlite3* db) const {
  if (db != nullptr) {
    sqlite3_close(db);
  }
}

void PreparedStatement::StmtDeleter::operator()(sqlite3_stmt* stmt) const {
  if (stmt != nullptr) {
    sqlite3_finalize(stmt);
  }
}

// Embedded schema v1 SQL.
// NOCASE on departments.name makes the unique constraint, lookups and ORDER BY all
// ASCII case-insensitive. AUTOINCREMENT keeps ids strictly increasing across deletes.
constexpr const char* kSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS schema_version (
  version INTEGER PRIMARY KEY,
  applied_at TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS departments (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  name TEXT NOT NULL COLLATE NOCASE UNIQUE
    CHECK(length(name) BETWEEN 1 AND 100),
  description TEXT NOT NULL DEFAULT ''
    CHECK(length(description) <= 500)
);

CREATE TABLE IF NOT EXISTS audit_events (
  event_id TEXT PRIMARY KEY,
  trace_id TEXT NOT NULL,
  event_type TEXT NOT NULL,
  payload TEXT NOT NULL,
  created_at TEXT NOT NULL,
  entity_ids_json TEXT NOT NULL,
  idx INTEGER NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_audit_events_trace ON audit_events(trace_id, idx);

INSERT OR IGNORE INTO schema_version (version, applied_at)
VALUES (1, datetime('now'));
)";

SqliteDb::SqliteDb(sqlite3* db) : db_(db) {}

core::Result<std::shared_ptr<SqliteDb>, std::string> SqliteDb::open(const std::string& path) {
  sqlite3* db = nullptr;
  int rc = sqlite3_open(path.c_str(), &db);
  if (rc != SQLITE_OK) {
    std::string error = db != nullptr ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    return core::Result<std::shared_ptr<SqliteDb>, std::string>::err("Failed to open database: " +
                                                                     error);
  }

  // Surface SQLITE_BUSY as an error after a bounded wait instead of immediately.
  sqlite3_busy_timeout(db, 5000);

  return core::Result<std::shared_ptr<SqliteDb>, std::string>::ok(
      std::shared_ptr<SqliteDb>(new SqliteDb(db)));
}

int SqliteDb::get_schema_version() const {
  sqlite3_stmt* stmt = nullptr;
  const char* sql = "SELECT version FROM schema_version ORDER BY version DESC LIMIT 1";
  int rc = sqlite3_prepare_v2(db_.get(), sql, -1, &stmt, nullptr);
  if (rc != SQLITE_OK) {
    return 0;  // Table doesn't exist yet
  }

  int version = 0;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    version = sqlite3_column_int(stmt, 0);
  }

  sqlite3_finalize(stmt);
  return version;
}

core::Result<bool, std::string> SqliteDb::ensure_schema_v1() {
  if (get_schema_version() >= 1) {
    return core::Result<bool, std::string>::ok(true);
  }

  char* err_msg = nullptr;
  int rc = sqlite3_exec(db_.get(), kSchemaV1, nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = err_msg != nullptr ? err_msg : "Unknown error";
    sqlite3_free(err_msg);
    return core::Result<bool, std::string>::err("Failed to apply schema v1: " + error);
  }

  return core::Result<bool, std::string>::ok(true);
}

core::Result<bool, std::string> SqliteDb::exec(const std::string& sql) {
  char* err_msg = nullptr;
  int rc = sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = err_msg != nullptr ? err_msg : "Unknown error";
    sqlite3_free(err_msg);
    return core::Result<bool, std::string>::err("SQL execution failed: " + error);
  }

  return core::Result<bool, std::string>::ok(true);
}

PreparedStatement::PreparedStatement(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* raw_stmt = nullptr;
  int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &raw_stmt, nullptr);
  if (rc != SQLITE_OK) {
    error_ = sqlite3_errmsg(db);
  } else {
    stmt_.reset(raw_stmt);
  }
}

void PreparedStatement::reset() {
  if (stmt_) {
    sqlite3_reset(stmt_.get());
    sqlite3_clear_bindings(stmt_.get());
  }
}

}  // namespace deptcat::storage::sqlite
