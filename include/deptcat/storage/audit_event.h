#pragma once

#include <string>
#include <vector>

namespace deptcat::storage {

// AuditEvent records one observed service outcome.
// payload is a compact JSON object; refs lists the department ids involved.
struct AuditEvent {
  std::string event_id;
  std::string trace_id;
  std::string event_type;
  std::string payload;
  std::string created_at;
  std::vector<std::string> refs;
};

}  // namespace deptcat::storage
