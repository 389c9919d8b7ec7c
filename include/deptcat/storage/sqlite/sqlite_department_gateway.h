#pragma once

#ifdef DEPTCAT_TRANSPORT_BOUNDARY_GUARD
#error "Concrete storage/redis header included in a guarded translation unit. Use interfaces only."
#endif

#include "deptcat/storage/department_gateway.h"
#include "deptcat/storage/sqlite/sqlite_db.h"

#include <memory>

// Forward declare sqlite3_stmt to avoid including sqlite3.h in this header.
struct sqlite3_stmt;

namespace deptcat::storage::sqlite {

// SqliteDepartmentGateway implements IDepartmentGateway on the departments table (schema v1).
//
// The first add/update/remove opens a BEGIN IMMEDIATE transaction; commit() issues COMMIT and
// returns the rows changed inside it, rollback() issues ROLLBACK. Reads on the same connection
// see the open transaction.
//
// Uniqueness is enforced by the table (UNIQUE COLLATE NOCASE); a violation surfaces as
// DuplicateNameError. Every other SQLite failure throws std::runtime_error.
class SqliteDepartmentGateway final : public IDepartmentGateway {
 public:
  explicit SqliteDepartmentGateway(std::shared_ptr<SqliteDb> db);

  domain::Department add(const domain::Department& department) override;
  domain::Department update(const domain::Department& department) override;
  bool remove(std::int64_t id) override;

  [[nodiscard]] std::optional<domain::Department> get_by_id(std::int64_t id) const override;
  [[nodiscard]] std::optional<domain::Department> get_by_name(
      const std::string& name) const override;
  [[nodiscard]] std::vector<domain::Department> get_all() const override;
  [[nodiscard]] std::vector<domain::Department> search_by_name(
      const std::string& keyword) const override;

  [[nodiscard]] bool exists_by_name(const std::string& name) const override;
  [[nodiscard]] bool exists_by_name(const std::string& name,
                                    std::int64_t exclude_id) const override;

  int commit() override;
  void rollback() override;

 private:
  std::shared_ptr<SqliteDb> db_;
  // Rows changed since the current transaction began.
  int staged_changes_{0};

  void begin_if_needed();
  // Steps a write statement and maps constraint failures; returns sqlite3_changes().
  int step_write(sqlite3_stmt* stmt, const char* operation);

  // Column order: id(0), name(1), description(2)
  [[nodiscard]] static domain::Department row_to_department(sqlite3_stmt* stmt);
  [[nodiscard]] std::vector<domain::Department> query_list(const char* sql,
                                                           const std::string* bind_text) const;
};

}  // namespace deptcat::storage::sqlite
