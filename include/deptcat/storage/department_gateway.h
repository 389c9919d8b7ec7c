#pragma once

#include "deptcat/domain/department.h"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace deptcat::storage {

// DuplicateNameError is raised when the storage engine itself rejects a second record with
// the same case-insensitive name. The service treats it as the authoritative conflict signal.
class DuplicateNameError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// IDepartmentGateway is the only way the service touches storage.
//
// add/update/remove stage a change; commit() makes every staged change durable and returns
// the number of rows it affected; rollback() discards them. Reads see committed state plus
// whatever the engine exposes of the current unit of work.
//
// Backend failures are raised as std::runtime_error (DuplicateNameError for the unique name
// constraint). Name comparisons are ASCII case-insensitive; list results are ordered by
// name ascending, ties broken by id.
class IDepartmentGateway {
 public:
  virtual ~IDepartmentGateway() = default;

  // Returns the staged record with its storage-assigned id.
  virtual domain::Department add(const domain::Department& department) = 0;
  virtual domain::Department update(const domain::Department& department) = 0;
  // False when no record has this id.
  virtual bool remove(std::int64_t id) = 0;

  [[nodiscard]] virtual std::optional<domain::Department> get_by_id(std::int64_t id) const = 0;
  [[nodiscard]] virtual std::optional<domain::Department> get_by_name(
      const std::string& name) const = 0;
  [[nodiscard]] virtual std::vector<domain::Department> get_all() const = 0;
  [[nodiscard]] virtual std::vector<domain::Department> search_by_name(
      const std::string& keyword) const = 0;

  [[nodiscard]] virtual bool exists_by_name(const std::string& name) const = 0;
  // Same as exists_by_name(name) but ignores the record with exclude_id.
  [[nodiscard]] virtual bool exists_by_name(const std::string& name,
                                            std::int64_t exclude_id) const = 0;

  virtual int commit() = 0;
  virtual void rollback() = 0;

 protected:
  IDepartmentGateway() = default;
  IDepartmentGateway(const IDepartmentGateway&) = default;
  IDepartmentGateway& operator=(const IDepartmentGateway&) = default;
  IDepartmentGateway(IDepartmentGateway&&) = default;
  IDepartmentGateway& operator=(IDepartmentGateway&&) = default;
};

}  // namespace deptcat::storage
