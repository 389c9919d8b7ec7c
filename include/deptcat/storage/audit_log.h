#pragma once

#include "deptcat/storage/audit_event.h"

#include <string>
#include <vector>

namespace deptcat::storage {

// IAuditLog is append-only and observational: append() never reports failure to the caller,
// so writing an audit event can not change the outcome of the operation being audited.
class IAuditLog {
 public:
  virtual ~IAuditLog() = default;
  virtual void append(const AuditEvent& event) = 0;
  // Events of one trace in append order; an empty trace_id returns every event.
  [[nodiscard]] virtual std::vector<AuditEvent> query(const std::string& trace_id) const = 0;
};

class InMemoryAuditLog final : public IAuditLog {
 public:
  void append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;

 private:
  std::vector<AuditEvent> events_;
};

}  // namespace deptcat::storage
