#include "deptcat/domain/department.h"

namespace deptcat::domain {

namespace {

std::string optional_string(const nlohmann::json& payload, const char* key) {
  if (!payload.contains(key) || payload.at(key).is_null()) {
    return "";
  }
  return payload.at(key).get<std::string>();
}

}  // namespace

nlohmann::json department_to_json(const Department& department) {
  return nlohmann::json{
      {"id", department.id},
      {"name", department.name},
      {"description", department.description},
  };
}

Department department_from_json(const nlohmann::json& payload) {
  Department department;
  if (payload.contains("id") && !payload.at("id").is_null()) {
    department.id = payload.at("id").get<std::int64_t>();
  }
  department.name = optional_string(payload, "name");
  department.description = optional_string(payload, "description");
  return department;
}

}  // namespace deptcat::domain
