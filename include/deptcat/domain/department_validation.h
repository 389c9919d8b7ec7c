#pragma once

#include "deptcat/core/errors.h"
#include "deptcat/domain/department.h"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace deptcat::domain {

// ValidationMode selects how field violations are reported.
// kFailFast   - the first failing rule is the only reported error
// kCollectAll - every rule runs; the first violation is the headline and the rest stay
//               available in ServiceError::violations (annotation-style messages)
enum class ValidationMode {
  kFailFast,
  kCollectAll,
};

// FieldRule is one field constraint on a Department.
// Rules are evaluated in the fixed order returned by department_field_rules().
struct FieldRule {
  std::string_view rule_id;
  std::string_view field;
  bool (*violated)(const Department& department);
  std::string_view fail_fast_message;
  std::string_view annotation_message;
};

struct FieldViolation {
  std::string rule_id;
  std::string field;
  std::string message;
};

// Name blank, name length, description length - in that order.
[[nodiscard]] std::span<const FieldRule> department_field_rules();

// Runs the rule list. kFailFast stops at the first violation; kCollectAll visits every
// rule but reports at most one violation per field.
[[nodiscard]] std::vector<FieldViolation> validate_department_fields(const Department& department,
                                                                     ValidationMode mode);

// Folds the violations into a kInvalidInput ServiceError, or nullopt when the record is valid.
[[nodiscard]] std::optional<core::ServiceError> check_department_fields(
    const Department& department, ValidationMode mode);

}  // namespace deptcat::domain
