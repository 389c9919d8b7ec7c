#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace deptcat::core {

// ErrorKind is the complete error taxonomy of the department service.
// kInvalidInput, kNotFound and kConflict are caller-correctable and never retried.
// kPersistenceFailure wraps a storage failure and may be transient.
enum class ErrorKind {
  kInvalidInput,
  kNotFound,
  kConflict,
  kPersistenceFailure,
};

// ServiceError is the failure half of every DepartmentService result.
struct ServiceError {
  ErrorKind kind{ErrorKind::kInvalidInput};
  std::string message;
  // Every field violation found in collect-all validation mode, in rule order.
  // message repeats the first one as the headline.
  std::vector<std::string> violations;
  // Underlying storage error text, kept for diagnostics.
  std::optional<std::string> cause;
};

[[nodiscard]] std::string_view error_kind_to_string(ErrorKind kind) noexcept;

inline ServiceError invalid_input(std::string message) {
  return ServiceError{ErrorKind::kInvalidInput, std::move(message), {}, std::nullopt};
}

inline ServiceError not_found(std::string message) {
  return ServiceError{ErrorKind::kNotFound, std::move(message), {}, std::nullopt};
}

inline ServiceError conflict(std::string message) {
  return ServiceError{ErrorKind::kConflict, std::move(message), {}, std::nullopt};
}

inline ServiceError persistence_failure(std::string message,
                                        std::optional<std::string> cause = std::nullopt) {
  return ServiceError{ErrorKind::kPersistenceFailure, std::move(message), {}, std::move(cause)};
}

}  // namespace deptcat::core
