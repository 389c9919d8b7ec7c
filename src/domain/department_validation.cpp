#include "deptcat/domain/department_validation.h"

#include "deptcat/core/normalization.h"

#include <array>
#include <set>

namespace deptcat::domain {

namespace {

bool name_blank(const Department& department) {
  return core::is_blank(department.name);
}

bool name_malformed(const Department& department) {
  return !core::is_valid_utf8(department.name);
}

bool name_too_long(const Department& department) {
  return core::utf8_length(department.name) > kMaxNameLength;
}

bool description_malformed(const Department& department) {
  return !core::is_valid_utf8(department.description);
}

bool description_too_long(const Department& department) {
  return core::utf8_length(department.description) > kMaxDescriptionLength;
}

constexpr std::array<FieldRule, 5> kFieldRules{{
    {"name.required", "name", name_blank, "Department name cannot be null or empty.",
     "Department name is required."},
    {"name.encoding", "name", name_malformed, "Department name must be valid UTF-8 text.",
     "Department name must be valid UTF-8 text."},
    {"name.length", "name", name_too_long, "Department name cannot exceed 100 characters.",
     "Department name must be between 1 and 100 characters."},
    {"description.encoding", "description", description_malformed,
     "Department description must be valid UTF-8 text.",
     "Department description must be valid UTF-8 text."},
    {"description.length", "description", description_too_long,
     "Department description cannot exceed 500 characters.",
     "Department description cannot exceed 500 characters."},
}};

constexpr std::string_view kCollectAllHeadline = "Validation failed for department: ";

}  // namespace

std::span<const FieldRule> department_field_rules() {
  return kFieldRules;
}

std::vector<FieldViolation> validate_department_fields(const Department& department,
                                                       const ValidationMode mode) {
  std::vector<FieldViolation> violations;
  std::set<std::string_view> failed_fields;

  for (const auto& rule : kFieldRules) {
    if (failed_fields.contains(rule.field)) {
      continue;  // one violation per field, like attribute validation
    }
    if (!rule.violated(department)) {
      continue;
    }

    const std::string_view message =
        mode == ValidationMode::kFailFast ? rule.fail_fast_message : rule.annotation_message;
    violations.push_back(
        {std::string(rule.rule_id), std::string(rule.field), std::string(message)});

    if (mode == ValidationMode::kFailFast) {
      break;
    }
    failed_fields.insert(rule.field);
  }

  return violations;
}

std::optional<core::ServiceError> check_department_fields(const Department& department,
                                                          const ValidationMode mode) {
  const auto violations = validate_department_fields(department, mode);
  if (violations.empty()) {
    return std::nullopt;
  }

  if (mode == ValidationMode::kFailFast) {
    return core::invalid_input(violations.front().message);
  }

  core::ServiceError error =
      core::invalid_input(std::string(kCollectAllHeadline) + violations.front().message);
  error.violations.reserve(violations.size());
  for (const auto& violation : violations) {
    error.violations.push_back(violation.message);
  }
  return error;
}

}  // namespace deptcat::domain
