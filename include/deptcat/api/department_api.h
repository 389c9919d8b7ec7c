#pragma once

#include "deptcat/app/department_service.h"
#include "deptcat/core/errors.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace deptcat::api {

// ApiResponse is a transport-neutral reply: an HTTP-style status code and a JSON body.
// Error bodies are {"error": message} plus "violations" when validation collected several.
struct ApiResponse {
  int status{200};
  nlohmann::json body;
};

// Status codes for each ErrorKind:
//   kInvalidInput -> 400, kNotFound -> 404, kConflict -> 409, kPersistenceFailure -> 500
[[nodiscard]] int status_for(core::ErrorKind kind) noexcept;

// DepartmentApi adapts DepartmentService to request/response semantics.
// Input checks owned by the transport (positive path id, non-empty query) run before the
// service is called; storage details never reach a 500 body.
class DepartmentApi {
 public:
  explicit DepartmentApi(app::DepartmentService& service) : service_(service) {}

  [[nodiscard]] ApiResponse list();
  [[nodiscard]] ApiResponse get_by_id(std::int64_t id);
  [[nodiscard]] ApiResponse get_by_name(const std::string& name);
  [[nodiscard]] ApiResponse search(const std::string& keyword);
  // request: {"name": ..., "description": ...}; 201 with the stored record.
  [[nodiscard]] ApiResponse create(const nlohmann::json& request);
  [[nodiscard]] ApiResponse update(std::int64_t id, const nlohmann::json& request);
  // 204 with a null body.
  [[nodiscard]] ApiResponse remove(std::int64_t id);

 private:
  app::DepartmentService& service_;
};

}  // namespace deptcat::api
