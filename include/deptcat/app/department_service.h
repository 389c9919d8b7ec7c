#pragma once

#include "deptcat/coordination/name_lock.h"
#include "deptcat/core/clock.h"
#include "deptcat/core/errors.h"
#include "deptcat/core/id_generator.h"
#include "deptcat/core/result.h"
#include "deptcat/domain/department.h"
#include "deptcat/domain/department_validation.h"
#include "deptcat/storage/audit_log.h"
#include "deptcat/storage/department_gateway.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace deptcat::app {

template <typename T>
using ServiceResult = core::Result<T, core::ServiceError>;

// DepartmentService owns every rule of the department catalog: field validation, the
// case-insensitive unique name rule, and translation of storage failures.
//
// Mutations check in a fixed order and stop at the first failure:
//   add:    absent, field rules, unique name, persist
//   update: absent, id > 0, field rules, exists, unique name (own id excluded), persist
//   delete: id > 0, exists, persist
//
// kInvalidInput, kNotFound and kConflict pass through untouched. Any other storage failure
// becomes kPersistenceFailure with the storage message kept as cause, and staged changes are
// rolled back.
//
// When a name lock is supplied, add and update hold the lock on the case-folded target name
// from the uniqueness check until commit returns.
//
// Every call runs under a fresh trace id and appends its outcome to the audit log. A failed
// audit append is reported on stderr and never changes the returned result.
class DepartmentService {
 public:
  DepartmentService(storage::IDepartmentGateway& gateway, storage::IAuditLog& audit_log,
                    core::IIdGenerator& id_gen, core::IClock& clock,
                    coordination::INameLock* name_lock = nullptr,
                    domain::ValidationMode mode = domain::ValidationMode::kFailFast);

  [[nodiscard]] ServiceResult<domain::Department> add_department(
      const std::optional<domain::Department>& department);

  [[nodiscard]] ServiceResult<domain::Department> update_department(
      const std::optional<domain::Department>& department);

  [[nodiscard]] ServiceResult<bool> delete_department(std::int64_t id);

  // Absence is a successful empty result, not kNotFound.
  [[nodiscard]] ServiceResult<std::optional<domain::Department>> get_department_by_id(
      std::int64_t id);
  [[nodiscard]] ServiceResult<std::optional<domain::Department>> get_department_by_name(
      const std::string& name);

  [[nodiscard]] ServiceResult<std::vector<domain::Department>> search_departments_by_name(
      const std::string& keyword);
  [[nodiscard]] ServiceResult<std::vector<domain::Department>> get_all_departments();

  [[nodiscard]] domain::ValidationMode validation_mode() const { return mode_; }

  // Trace id of the most recent call; empty before the first call.
  [[nodiscard]] const std::string& last_trace_id() const { return last_trace_id_; }

 private:
  std::string begin_trace();
  void emit(const std::string& trace_id, const std::string& event_type,
            const nlohmann::json& payload, std::vector<std::string> refs) noexcept;
  core::ServiceError reject(const std::string& trace_id, const std::string& operation,
                            core::ServiceError error);
  void rollback_staged() noexcept;

  storage::IDepartmentGateway& gateway_;
  storage::IAuditLog& audit_log_;
  core::IIdGenerator& id_gen_;
  core::IClock& clock_;
  coordination::INameLock* name_lock_;
  domain::ValidationMode mode_;
  std::string last_trace_id_;
};

}  // namespace deptcat::app
