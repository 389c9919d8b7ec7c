#include "deptcat/storage/inmemory_department_gateway.h"

#include "deptcat/core/normalization.h"

#include <algorithm>
#include <set>

namespace deptcat::storage {

namespace {

// Same ordering as "ORDER BY name COLLATE NOCASE, id".
void sort_by_name(std::vector<domain::Department>& departments) {
  std::sort(departments.begin(), departments.end(),
            [](const domain::Department& a, const domain::Department& b) {
              const auto a_key = core::normalize_ascii_lower(a.name);
              const auto b_key = core::normalize_ascii_lower(b.name);
              if (a_key != b_key) {
                return a_key < b_key;
              }
              return a.id < b.id;
            });
}

}  // namespace

domain::Department InMemoryDepartmentGateway::add(const domain::Department& department) {
  domain::Department staged = department;
  staged.id = last_id_ + (++reserved_ids_);
  pending_.push_back({PendingKind::kInsert, staged});
  return staged;
}

domain::Department InMemoryDepartmentGateway::update(const domain::Department& department) {
  pending_.push_back({PendingKind::kUpdate, department});
  return department;
}

bool InMemoryDepartmentGateway::remove(const std::int64_t id) {
  auto it = departments_.find(id);
  if (it == departments_.end()) {
    return false;
  }
  pending_.push_back({PendingKind::kDelete, it->second});
  return true;
}

std::optional<domain::Department> InMemoryDepartmentGateway::get_by_id(
    const std::int64_t id) const {
  auto it = departments_.find(id);
  if (it != departments_.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::optional<domain::Department> InMemoryDepartmentGateway::get_by_name(
    const std::string& name) const {
  for (const auto& [id, department] : departments_) {
    if (core::equals_ignore_case(department.name, name)) {
      return department;
    }
  }
  return std::nullopt;
}

std::vector<domain::Department> InMemoryDepartmentGateway::get_all() const {
  std::vector<domain::Department> result;
  result.reserve(departments_.size());
  for (const auto& [id, department] : departments_) {
    result.push_back(department);
  }
  sort_by_name(result);
  return result;
}

std::vector<domain::Department> InMemoryDepartmentGateway::search_by_name(
    const std::string& keyword) const {
  std::vector<domain::Department> result;
  for (const auto& [id, department] : departments_) {
    if (core::contains_ignore_case(department.name, keyword)) {
      result.push_back(department);
    }
  }
  sort_by_name(result);
  return result;
}

bool InMemoryDepartmentGateway::exists_by_name(const std::string& name) const {
  return get_by_name(name).has_value();
}

bool InMemoryDepartmentGateway::exists_by_name(const std::string& name,
                                               const std::int64_t exclude_id) const {
  return std::any_of(departments_.begin(), departments_.end(), [&](const auto& entry) {
    return entry.first != exclude_id && core::equals_ignore_case(entry.second.name, name);
  });
}

int InMemoryDepartmentGateway::commit() {
  // Apply to a working copy so a constraint failure leaves committed state untouched.
  auto working = departments_;
  int affected = 0;

  for (const auto& change : pending_) {
    switch (change.kind) {
      case PendingKind::kInsert:
        working[change.department.id] = change.department;
        ++affected;
        break;
      case PendingKind::kUpdate: {
        auto it = working.find(change.department.id);
        if (it != working.end()) {
          it->second.name = change.department.name;
          it->second.description = change.department.description;
          ++affected;
        }
        break;
      }
      case PendingKind::kDelete:
        affected += static_cast<int>(working.erase(change.department.id));
        break;
    }
  }

  std::set<std::string> folded_names;
  for (const auto& [id, department] : working) {
    if (!folded_names.insert(core::normalize_ascii_lower(department.name)).second) {
      throw DuplicateNameError("UNIQUE constraint failed: departments.name ('" + department.name +
                               "')");
    }
  }

  departments_ = std::move(working);
  last_id_ += reserved_ids_;
  reserved_ids_ = 0;
  pending_.clear();
  return affected;
}

void InMemoryDepartmentGateway::rollback() {
  pending_.clear();
  reserved_ids_ = 0;
}

}  // namespace deptcat::storage
