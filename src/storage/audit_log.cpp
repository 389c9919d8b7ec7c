#include "deptcat/storage/audit_log.h"

#include <algorithm>
#include <iterator>

namespace deptcat::storage {

void InMemoryAuditLog::append(const AuditEvent& event) {
  events_.push_back(event);
}

// Each department call appends exactly one event under its trace id.
std::vector<AuditEvent> InMemoryAuditLog::query(const std::string& trace_id) const {
  if (trace_id.empty()) {
    return events_;
  }

  std::vector<AuditEvent> trace;
  std::copy_if(events_.begin(), events_.end(), std::back_inserter(trace),
               [&trace_id](const AuditEvent& event) { return event.trace_id == trace_id; });
  return trace;
}

}  // namespace deptcat::storage
