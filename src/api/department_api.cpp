#include "deptcat/api/department_api.h"

#include "deptcat/core/normalization.h"

#include <optional>
#include <vector>

namespace deptcat::api {

namespace {

constexpr const char* kInternalError = "An error occurred while processing your request";
constexpr const char* kInvalidPathId = "Department ID must be a positive number";

ApiResponse error_response(const int status, const std::string& message) {
  return ApiResponse{status, nlohmann::json{{"error", message}}};
}

ApiResponse from_error(const core::ServiceError& error) {
  const int status = status_for(error.kind);
  if (status == 500) {
    return error_response(status, kInternalError);
  }
  ApiResponse response = error_response(status, error.message);
  if (!error.violations.empty()) {
    response.body["violations"] = error.violations;
  }
  return response;
}

nlohmann::json list_to_json(const std::vector<domain::Department>& departments) {
  nlohmann::json items = nlohmann::json::array();
  for (const auto& department : departments) {
    items.push_back(domain::department_to_json(department));
  }
  return items;
}

// Parses a create/update body. The id field of the body is ignored.
std::optional<ApiResponse> parse_body(const nlohmann::json& request, domain::Department& out) {
  if (!request.is_object()) {
    return error_response(400, "Request body must be a JSON object");
  }
  try {
    out = domain::department_from_json(request);
  } catch (const nlohmann::json::exception& e) {
    return error_response(400, std::string("Invalid department payload: ") + e.what());
  }
  out.id = 0;
  return std::nullopt;
}

}  // namespace

int status_for(const core::ErrorKind kind) noexcept {
  switch (kind) {
    case core::ErrorKind::kInvalidInput:
      return 400;
    case core::ErrorKind::kNotFound:
      return 404;
    case core::ErrorKind::kConflict:
      return 409;
    case core::ErrorKind::kPersistenceFailure:
      return 500;
  }
  return 500;
}

ApiResponse DepartmentApi::list() {
  const auto result = service_.get_all_departments();
  if (!result.has_value()) {
    return from_error(result.error());
  }
  return ApiResponse{200, list_to_json(result.value())};
}

ApiResponse DepartmentApi::get_by_id(const std::int64_t id) {
  if (id <= 0) {
    return error_response(400, kInvalidPathId);
  }
  const auto result = service_.get_department_by_id(id);
  if (!result.has_value()) {
    return from_error(result.error());
  }
  if (!result.value().has_value()) {
    return error_response(404, "Department with ID " + std::to_string(id) + " not found");
  }
  return ApiResponse{200, domain::department_to_json(result.value().value())};
}

ApiResponse DepartmentApi::get_by_name(const std::string& name) {
  if (core::is_blank(name)) {
    return error_response(400, "Department name cannot be empty");
  }
  const auto result = service_.get_department_by_name(name);
  if (!result.has_value()) {
    return from_error(result.error());
  }
  if (!result.value().has_value()) {
    return error_response(404, "Department with name '" + name + "' not found");
  }
  return ApiResponse{200, domain::department_to_json(result.value().value())};
}

ApiResponse DepartmentApi::search(const std::string& keyword) {
  if (core::is_blank(keyword)) {
    return error_response(400, "Search keyword cannot be empty");
  }
  const auto result = service_.search_departments_by_name(keyword);
  if (!result.has_value()) {
    return from_error(result.error());
  }
  return ApiResponse{200, list_to_json(result.value())};
}

ApiResponse DepartmentApi::create(const nlohmann::json& request) {
  domain::Department department;
  if (auto bad_request = parse_body(request, department)) {
    return bad_request.value();
  }
  const auto result = service_.add_department(department);
  if (!result.has_value()) {
    return from_error(result.error());
  }
  return ApiResponse{201, domain::department_to_json(result.value())};
}

ApiResponse DepartmentApi::update(const std::int64_t id, const nlohmann::json& request) {
  if (id <= 0) {
    return error_response(400, kInvalidPathId);
  }
  domain::Department department;
  if (auto bad_request = parse_body(request, department)) {
    return bad_request.value();
  }
  department.id = id;
  const auto result = service_.update_department(department);
  if (!result.has_value()) {
    return from_error(result.error());
  }
  return ApiResponse{200, domain::department_to_json(result.value())};
}

ApiResponse DepartmentApi::remove(const std::int64_t id) {
  if (id <= 0) {
    return error_response(400, kInvalidPathId);
  }
  const auto result = service_.delete_department(id);
  if (!result.has_value()) {
    return from_error(result.error());
  }
  return ApiResponse{204, nullptr};
}

}  // namespace deptcat::api
