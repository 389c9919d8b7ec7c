#include "deptcat/app/seed.h"

#include <array>
#include <string>

namespace deptcat::app {

namespace {

constexpr std::array<SampleDepartment, 3> kSampleDepartments{{
    {"Human Resources", "HR operations and employee management"},
    {"Information Technology", "IT infrastructure and software development"},
    {"Finance", "Financial planning and accounting"},
}};

}  // namespace

std::span<const SampleDepartment> sample_departments() {
  return kSampleDepartments;
}

ServiceResult<int> seed_sample_departments(DepartmentService& service) {
  const auto existing = service.get_all_departments();
  if (!existing.has_value()) {
    return ServiceResult<int>::err(existing.error());
  }
  if (!existing.value().empty()) {
    return ServiceResult<int>::ok(0);
  }

  int added = 0;
  for (const auto& sample : kSampleDepartments) {
    domain::Department department;
    department.name = std::string(sample.name);
    department.description = std::string(sample.description);
    const auto result = service.add_department(department);
    if (!result.has_value()) {
      return ServiceResult<int>::err(result.error());
    }
    ++added;
  }
  return ServiceResult<int>::ok(added);
}

}  // namespace deptcat::app
