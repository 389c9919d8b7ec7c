#include "deptcat/storage/sqlite/sqlite_department_gateway.h"

#include <sqlite3.h>

#include <stdexcept>

namespace deptcat::storage::sqlite {

namespace {

std::string text_column(sqlite3_stmt* stmt, const int col) {
  const auto* raw = sqlite3_column_text(stmt, col);
  return raw != nullptr ? reinterpret_cast<const char*>(raw) : std::string{};  // NOLINT
}

}  // namespace

SqliteDepartmentGateway::SqliteDepartmentGateway(std::shared_ptr<SqliteDb> db)
    : db_(std::move(db)) {}

void SqliteDepartmentGateway::begin_if_needed() {
  // autocommit == 0 means a transaction is already open on this connection.
  if (sqlite3_get_autocommit(db_->connection()) == 0) {
    return;
  }

  auto begin = db_->exec("BEGIN IMMEDIATE");
  if (!begin.has_value()) {
    throw std::runtime_error("SqliteDepartmentGateway: failed to begin transaction: " +
                             begin.error());
  }
  staged_changes_ = 0;
}

int SqliteDepartmentGateway::step_write(sqlite3_stmt* stmt, const char* operation) {
  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_DONE) {
    return sqlite3_changes(db_->connection());
  }

  const std::string message = sqlite3_errmsg(db_->connection());
  if (sqlite3_extended_errcode(db_->connection()) == SQLITE_CONSTRAINT_UNIQUE) {
    throw DuplicateNameError(message);
  }
  throw std::runtime_error(std::string("SqliteDepartmentGateway::") + operation +
                           " failed: " + message);
}

domain::Department SqliteDepartmentGateway::add(const domain::Department& department) {
  begin_if_needed();

  const char* sql = "INSERT INTO departments (name, description) VALUES (?, ?)";
  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    throw std::runtime_error("SqliteDepartmentGateway::add failed to prepare: " + stmt.error());
  }

  sqlite3_bind_text(stmt.get(), 1, department.name.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 2, department.description.c_str(), -1, SQLITE_TRANSIENT);

  staged_changes_ += step_write(stmt.get(), "add");

  domain::Department stored = department;
  stored.id = sqlite3_last_insert_rowid(db_->connection());
  return stored;
}

domain::Department SqliteDepartmentGateway::update(const domain::Department& department) {
  begin_if_needed();

  const char* sql = "UPDATE departments SET name = ?, description = ? WHERE id = ?";
  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    throw std::runtime_error("SqliteDepartmentGateway::update failed to prepare: " +
                             stmt.error());
  }

  sqlite3_bind_text(stmt.get(), 1, department.name.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 2, department.description.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt.get(), 3, department.id);

  staged_changes_ += step_write(stmt.get(), "update");
  return department;
}

bool SqliteDepartmentGateway::remove(const std::int64_t id) {
  if (!get_by_id(id).has_value()) {
    return false;
  }

  begin_if_needed();

  const char* sql = "DELETE FROM departments WHERE id = ?";
  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    throw std::runtime_error("SqliteDepartmentGateway::remove failed to prepare: " +
                             stmt.error());
  }

  sqlite3_bind_int64(stmt.get(), 1, id);
  staged_changes_ += step_write(stmt.get(), "remove");
  return true;
}

std::optional<domain::Department> SqliteDepartmentGateway::get_by_id(const std::int64_t id) const {
  const char* sql = "SELECT id, name, description FROM departments WHERE id = ?";
  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    throw std::runtime_error("SqliteDepartmentGateway::get_by_id failed to prepare: " +
                             stmt.error());
  }

  sqlite3_bind_int64(stmt.get(), 1, id);
  if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    return row_to_department(stmt.get());
  }
  return std::nullopt;
}

std::optional<domain::Department> SqliteDepartmentGateway::get_by_name(
    const std::string& name) const {
  // departments.name is declared COLLATE NOCASE, so "=" is case-insensitive.
  const char* sql = "SELECT id, name, description FROM departments WHERE name = ? LIMIT 1";
  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    throw std::runtime_error("SqliteDepartmentGateway::get_by_name failed to prepare: " +
                             stmt.error());
  }

  sqlite3_bind_text(stmt.get(), 1, name.c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    return row_to_department(stmt.get());
  }
  return std::nullopt;
}

std::vector<domain::Department> SqliteDepartmentGateway::get_all() const {
  return query_list("SELECT id, name, description FROM departments ORDER BY name, id", nullptr);
}

std::vector<domain::Department> SqliteDepartmentGateway::search_by_name(
    const std::string& keyword) const {
  // instr() instead of LIKE so '%' and '_' in the keyword match literally.
  return query_list(
      "SELECT id, name, description FROM departments"
      " WHERE instr(lower(name), lower(?)) > 0 ORDER BY name, id",
      &keyword);
}

bool SqliteDepartmentGateway::exists_by_name(const std::string& name) const {
  return get_by_name(name).has_value();
}

bool SqliteDepartmentGateway::exists_by_name(const std::string& name,
                                             const std::int64_t exclude_id) const {
  const char* sql = "SELECT 1 FROM departments WHERE name = ? AND id <> ? LIMIT 1";
  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    throw std::runtime_error("SqliteDepartmentGateway::exists_by_name failed to prepare: " +
                             stmt.error());
  }

  sqlite3_bind_text(stmt.get(), 1, name.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt.get(), 2, exclude_id);
  return sqlite3_step(stmt.get()) == SQLITE_ROW;
}

int SqliteDepartmentGateway::commit() {
  if (sqlite3_get_autocommit(db_->connection()) != 0) {
    return 0;  // nothing staged
  }

  auto result = db_->exec("COMMIT");
  if (!result.has_value()) {
    throw std::runtime_error("SqliteDepartmentGateway: failed to commit: " + result.error());
  }

  const int affected = staged_changes_;
  staged_changes_ = 0;
  return affected;
}

void SqliteDepartmentGateway::rollback() {
  staged_changes_ = 0;
  if (sqlite3_get_autocommit(db_->connection()) != 0) {
    return;
  }

  auto result = db_->exec("ROLLBACK");
  if (!result.has_value()) {
    throw std::runtime_error("SqliteDepartmentGateway: failed to roll back: " + result.error());
  }
}

domain::Department SqliteDepartmentGateway::row_to_department(sqlite3_stmt* stmt) {
  domain::Department department;
  department.id = sqlite3_column_int64(stmt, 0);
  department.name = text_column(stmt, 1);
  department.description = text_column(stmt, 2);
  return department;
}

std::vector<domain::Department> SqliteDepartmentGateway::query_list(
    const char* sql, const std::string* bind_text) const {
  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    throw std::runtime_error("SqliteDepartmentGateway: failed to prepare query: " + stmt.error());
  }

  if (bind_text != nullptr) {
    sqlite3_bind_text(stmt.get(), 1, bind_text->c_str(), -1, SQLITE_TRANSIENT);
  }

  std::vector<domain::Department> result;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    result.push_back(row_to_department(stmt.get()));
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error("SqliteDepartmentGateway: query failed: " +
                             std::string(sqlite3_errmsg(db_->connection())));
  }

  return result;
}

}  // namespace deptcat::storage::sqlite
