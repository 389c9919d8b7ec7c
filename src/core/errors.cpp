#include "deptcat/core/errors.h"

namespace deptcat::core {

std::string_view error_kind_to_string(const ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::kInvalidInput:
      return "invalid_input";
    case ErrorKind::kNotFound:
      return "not_found";
    case ErrorKind::kConflict:
      return "conflict";
    case ErrorKind::kPersistenceFailure:
      return "persistence_failure";
  }
  return "unknown";
}

}  // namespace deptcat::core
