#include "deptcat/storage/sqlite/sqlite_audit_log.h"

#include <nlohmann/json.hpp>

#include <sqlite3.h>

#include <iostream>

namespace deptcat::storage::sqlite {

SqliteAuditLog::SqliteAuditLog(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

void SqliteAuditLog::append(const AuditEvent& event) {
  const int idx = next_index(event.trace_id);

  nlohmann::json refs_json = event.refs;

  const char* sql = R"(
    INSERT INTO audit_events
      (event_id, trace_id, event_type, payload, created_at, entity_ids_json, idx)
    VALUES (?, ?, ?, ?, ?, ?, ?)
  )";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    std::cerr << "Audit append failed to prepare: " << stmt.error() << "\n";
    return;
  }

  const std::string refs_text = refs_json.dump();
  sqlite3_bind_text(stmt.get(), 1, event.event_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 2, event.trace_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 3, event.event_type.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 4, event.payload.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 5, event.created_at.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 6, refs_text.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int(stmt.get(), 7, idx);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    std::cerr << "Audit append failed for " << event.event_id << ": "
              << sqlite3_errmsg(db_->connection()) << "\n";
  }
}

std::vector<AuditEvent> SqliteAuditLog::query(const std::string& trace_id) const {
  const char* sql =
      "SELECT event_id, trace_id, event_type, payload, created_at, entity_ids_json"
      "  FROM audit_events WHERE (?1 = '' OR trace_id = ?1) ORDER BY rowid";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return {};
  }

  sqlite3_bind_text(stmt.get(), 1, trace_id.c_str(), -1, SQLITE_TRANSIENT);

  std::vector<AuditEvent> result;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    AuditEvent event;
    event.event_id = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 0));
    event.trace_id = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 1));
    event.event_type = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 2));
    event.payload = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 3));
    event.created_at = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 4));

    const std::string refs_str = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 5));
    event.refs = nlohmann::json::parse(refs_str).get<std::vector<std::string>>();

    result.push_back(event);
  }

  return result;
}

int SqliteAuditLog::next_index(const std::string& trace_id) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = trace_indices_.find(trace_id);
  if (it != trace_indices_.end()) {
    return it->second++;
  }

  // New trace in this process: continue after whatever the database already holds.
  const char* idx_sql = "SELECT MAX(idx) FROM audit_events WHERE trace_id = ?";
  PreparedStatement idx_stmt(db_->connection(), idx_sql);
  int max_idx = -1;
  if (idx_stmt.is_valid()) {
    sqlite3_bind_text(idx_stmt.get(), 1, trace_id.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(idx_stmt.get()) == SQLITE_ROW &&
        sqlite3_column_type(idx_stmt.get(), 0) != SQLITE_NULL) {
      max_idx = sqlite3_column_int(idx_stmt.get(), 0);
    }
  }

  const int idx = max_idx + 1;
  trace_indices_[trace_id] = idx + 1;
  return idx;
}

}  // namespace deptcat::storage::sqlite
