#include "deptcat/app/department_service.h"

#include "deptcat/core/normalization.h"

#include <nlohmann/json.hpp>

#include <iostream>
#include <stdexcept>

namespace deptcat::app {

namespace {

constexpr const char* kAbsentRecord = "Department cannot be null.";
constexpr const char* kInvalidId = "Department ID must be greater than zero.";
constexpr const char* kBlankName = "Department name cannot be null or empty.";
constexpr const char* kBlankKeyword = "Search keyword cannot be null or empty.";
constexpr const char* kReadFailure = "An unexpected error occurred while reading departments.";

std::string conflict_message(const std::string& name) {
  return "A department with name '" + name + "' already exists.";
}

std::string missing_message(const std::int64_t id) {
  return "Department with ID " + std::to_string(id) + " does not exist.";
}

std::string name_lock_key(const std::string& name) {
  return "department:name:" + core::normalize_ascii_lower(name);
}

}  // namespace

DepartmentService::DepartmentService(storage::IDepartmentGateway& gateway,
                                     storage::IAuditLog& audit_log, core::IIdGenerator& id_gen,
                                     core::IClock& clock, coordination::INameLock* name_lock,
                                     const domain::ValidationMode mode)
    : gateway_(gateway),
      audit_log_(audit_log),
      id_gen_(id_gen),
      clock_(clock),
      name_lock_(name_lock),
      mode_(mode) {}

std::string DepartmentService::begin_trace() {
  last_trace_id_ = id_gen_.next(core::kTraceIdPrefix);
  return last_trace_id_;
}

void DepartmentService::emit(const std::string& trace_id, const std::string& event_type,
                             const nlohmann::json& payload,
                             std::vector<std::string> refs) noexcept {
  try {
    audit_log_.append({id_gen_.next(core::kEventIdPrefix), trace_id, event_type,
                       payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                       clock_.now_iso8601(), std::move(refs)});
  } catch (const std::exception& e) {
    std::cerr << "Audit event " << event_type << " dropped for " << trace_id << ": " << e.what()
              << "\n";
  }
}

core::ServiceError DepartmentService::reject(const std::string& trace_id,
                                             const std::string& operation,
                                             core::ServiceError error) {
  nlohmann::json payload{
      {"operation", operation},
      {"kind", core::error_kind_to_string(error.kind)},
      {"message", error.message},
  };
  if (!error.violations.empty()) {
    payload["violations"] = error.violations;
  }
  if (error.cause.has_value()) {
    payload["cause"] = error.cause.value();
  }
  emit(trace_id, "DepartmentRejected", payload, {});
  return error;
}

void DepartmentService::rollback_staged() noexcept {
  try {
    gateway_.rollback();
  } catch (const std::exception& e) {
    std::cerr << "Rollback failed: " << e.what() << "\n";
  }
}

ServiceResult<domain::Department> DepartmentService::add_department(
    const std::optional<domain::Department>& department) {
  using R = ServiceResult<domain::Department>;
  const std::string trace_id = begin_trace();
  const std::string op = "add";

  if (!department.has_value()) {
    return R::err(reject(trace_id, op, core::invalid_input(kAbsentRecord)));
  }

  domain::Department candidate = department.value();
  candidate.id = 0;

  if (auto invalid = domain::check_department_fields(candidate, mode_)) {
    return R::err(reject(trace_id, op, std::move(invalid.value())));
  }

  domain::Department stored;
  try {
    std::optional<coordination::NameLockGuard> guard;
    if (name_lock_ != nullptr) {
      const std::string key = name_lock_key(candidate.name);
      if (!name_lock_->try_acquire(key, trace_id)) {
        return R::err(reject(trace_id, op, core::conflict(conflict_message(candidate.name))));
      }
      guard.emplace(*name_lock_, key, trace_id);
    }

    if (gateway_.exists_by_name(candidate.name)) {
      return R::err(reject(trace_id, op, core::conflict(conflict_message(candidate.name))));
    }

    stored = gateway_.add(candidate);
    if (gateway_.commit() == 0) {
      rollback_staged();
      return R::err(
          reject(trace_id, op, core::persistence_failure("Failed to add department to database.")));
    }
  } catch (const storage::DuplicateNameError& e) {
    rollback_staged();
    auto error = core::conflict(conflict_message(candidate.name));
    error.cause = e.what();
    return R::err(reject(trace_id, op, std::move(error)));
  } catch (const std::exception& e) {
    rollback_staged();
    return R::err(reject(
        trace_id, op,
        core::persistence_failure("An unexpected error occurred while adding the department.",
                                  e.what())));
  }

  emit(trace_id, "DepartmentCreated", domain::department_to_json(stored),
       {std::to_string(stored.id)});
  return R::ok(stored);
}

ServiceResult<domain::Department> DepartmentService::update_department(
    const std::optional<domain::Department>& department) {
  using R = ServiceResult<domain::Department>;
  const std::string trace_id = begin_trace();
  const std::string op = "update";

  if (!department.has_value()) {
    return R::err(reject(trace_id, op, core::invalid_input(kAbsentRecord)));
  }

  const domain::Department& candidate = department.value();
  if (candidate.id <= 0) {
    return R::err(reject(trace_id, op, core::invalid_input(kInvalidId)));
  }

  if (auto invalid = domain::check_department_fields(candidate, mode_)) {
    return R::err(reject(trace_id, op, std::move(invalid.value())));
  }

  domain::Department before;
  domain::Department stored;
  try {
    const auto existing = gateway_.get_by_id(candidate.id);
    if (!existing.has_value()) {
      return R::err(reject(trace_id, op, core::not_found(missing_message(candidate.id))));
    }
    before = existing.value();

    std::optional<coordination::NameLockGuard> guard;
    if (name_lock_ != nullptr) {
      const std::string key = name_lock_key(candidate.name);
      if (!name_lock_->try_acquire(key, trace_id)) {
        return R::err(reject(trace_id, op, core::conflict(conflict_message(candidate.name))));
      }
      guard.emplace(*name_lock_, key, trace_id);
    }

    if (gateway_.exists_by_name(candidate.name, candidate.id)) {
      return R::err(reject(trace_id, op, core::conflict(conflict_message(candidate.name))));
    }

    domain::Department changed = before;
    changed.name = candidate.name;
    changed.description = candidate.description;

    stored = gateway_.update(changed);
    if (gateway_.commit() == 0) {
      rollback_staged();
      return R::err(reject(trace_id, op,
                           core::persistence_failure("Failed to update department in database.")));
    }
  } catch (const storage::DuplicateNameError& e) {
    rollback_staged();
    auto error = core::conflict(conflict_message(candidate.name));
    error.cause = e.what();
    return R::err(reject(trace_id, op, std::move(error)));
  } catch (const std::exception& e) {
    rollback_staged();
    return R::err(reject(
        trace_id, op,
        core::persistence_failure("An unexpected error occurred while updating the department.",
                                  e.what())));
  }

  const nlohmann::json payload{
      {"before", domain::department_to_json(before)},
      {"after", domain::department_to_json(stored)},
  };
  emit(trace_id, "DepartmentUpdated", payload, {std::to_string(stored.id)});
  return R::ok(stored);
}

ServiceResult<bool> DepartmentService::delete_department(const std::int64_t id) {
  using R = ServiceResult<bool>;
  const std::string trace_id = begin_trace();
  const std::string op = "delete";

  if (id <= 0) {
    return R::err(reject(trace_id, op, core::invalid_input(kInvalidId)));
  }

  domain::Department removed;
  try {
    const auto existing = gateway_.get_by_id(id);
    if (!existing.has_value() || !gateway_.remove(id)) {
      return R::err(reject(trace_id, op, core::not_found(missing_message(id))));
    }
    removed = existing.value();

    if (gateway_.commit() == 0) {
      rollback_staged();
      return R::err(reject(
          trace_id, op, core::persistence_failure("Failed to delete department from database.")));
    }
  } catch (const std::exception& e) {
    rollback_staged();
    return R::err(reject(
        trace_id, op,
        core::persistence_failure("An unexpected error occurred while deleting the department.",
                                  e.what())));
  }

  emit(trace_id, "DepartmentDeleted", domain::department_to_json(removed), {std::to_string(id)});
  return R::ok(true);
}

ServiceResult<std::optional<domain::Department>> DepartmentService::get_department_by_id(
    const std::int64_t id) {
  using R = ServiceResult<std::optional<domain::Department>>;
  const std::string trace_id = begin_trace();

  if (id <= 0) {
    return R::err(reject(trace_id, "get_by_id", core::invalid_input(kInvalidId)));
  }

  try {
    return R::ok(gateway_.get_by_id(id));
  } catch (const std::exception& e) {
    return R::err(reject(trace_id, "get_by_id", core::persistence_failure(kReadFailure, e.what())));
  }
}

ServiceResult<std::optional<domain::Department>> DepartmentService::get_department_by_name(
    const std::string& name) {
  using R = ServiceResult<std::optional<domain::Department>>;
  const std::string trace_id = begin_trace();

  if (core::is_blank(name)) {
    return R::err(reject(trace_id, "get_by_name", core::invalid_input(kBlankName)));
  }

  try {
    return R::ok(gateway_.get_by_name(name));
  } catch (const std::exception& e) {
    return R::err(
        reject(trace_id, "get_by_name", core::persistence_failure(kReadFailure, e.what())));
  }
}

ServiceResult<std::vector<domain::Department>> DepartmentService::search_departments_by_name(
    const std::string& keyword) {
  using R = ServiceResult<std::vector<domain::Department>>;
  const std::string trace_id = begin_trace();

  if (core::is_blank(keyword)) {
    return R::err(reject(trace_id, "search", core::invalid_input(kBlankKeyword)));
  }

  try {
    return R::ok(gateway_.search_by_name(keyword));
  } catch (const std::exception& e) {
    return R::err(reject(trace_id, "search", core::persistence_failure(kReadFailure, e.what())));
  }
}

ServiceResult<std::vector<domain::Department>> DepartmentService::get_all_departments() {
  using R = ServiceResult<std::vector<domain::Department>>;
  const std::string trace_id = begin_trace();

  try {
    return R::ok(gateway_.get_all());
  } catch (const std::exception& e) {
    return R::err(reject(trace_id, "list", core::persistence_failure(kReadFailure, e.what())));
  }
}

}  // namespace deptcat::app
