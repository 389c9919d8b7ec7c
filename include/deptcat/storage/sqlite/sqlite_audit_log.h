#pragma once

#ifdef DEPTCAT_TRANSPORT_BOUNDARY_GUARD
#error "Concrete storage/redis header included in a guarded translation unit. Use interfaces only."
#endif

#include "deptcat/storage/audit_log.h"
#include "deptcat/storage/sqlite/sqlite_db.h"

#include <map>
#include <memory>
#include <mutex>

namespace deptcat::storage::sqlite {

// SqliteAuditLog implements IAuditLog on the audit_events table.
// Per-trace ordering is kept in the idx column; the next idx per trace is cached under mutex_.
// A failed insert is reported on stderr and never raised (the log is observational).
class SqliteAuditLog final : public IAuditLog {
 public:
  explicit SqliteAuditLog(std::shared_ptr<SqliteDb> db);

  void append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;

 private:
  std::shared_ptr<SqliteDb> db_;

  std::mutex mutex_;
  std::map<std::string, int> trace_indices_;

  int next_index(const std::string& trace_id);
};

}  // namespace deptcat::storage::sqlite
