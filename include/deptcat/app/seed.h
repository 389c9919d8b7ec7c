#pragma once

#include "deptcat/app/department_service.h"

#include <span>
#include <string_view>

namespace deptcat::app {

struct SampleDepartment {
  std::string_view name;
  std::string_view description;
};

// Human Resources, Information Technology, Finance.
[[nodiscard]] std::span<const SampleDepartment> sample_departments();

// seed_sample_departments adds the sample departments through the service when the catalog is
// empty. Returns the number added; a non-empty catalog is left untouched and yields 0.
[[nodiscard]] ServiceResult<int> seed_sample_departments(DepartmentService& service);

}  // namespace deptcat::app
