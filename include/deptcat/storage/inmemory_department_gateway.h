#pragma once

#include "deptcat/storage/department_gateway.h"

#include <map>
#include <vector>

namespace deptcat::storage {

// InMemoryDepartmentGateway keeps committed records in a std::map keyed by id and queues
// staged changes until commit(). Reads only see committed records.
// The unique name constraint is enforced at commit(), mirroring the SQLite schema.
// Not thread-safe; intended for tests and ephemeral server runs.
class InMemoryDepartmentGateway final : public IDepartmentGateway {
 public:
  domain::Department add(const domain::Department& department) override;
  domain::Department update(const domain::Department& department) override;
  bool remove(std::int64_t id) override;

  [[nodiscard]] std::optional<domain::Department> get_by_id(std::int64_t id) const override;
  [[nodiscard]] std::optional<domain::Department> get_by_name(
      const std::string& name) const override;
  [[nodiscard]] std::vector<domain::Department> get_all() const override;
  [[nodiscard]] std::vector<domain::Department> search_by_name(
      const std::string& keyword) const override;

  [[nodiscard]] bool exists_by_name(const std::string& name) const override;
  [[nodiscard]] bool exists_by_name(const std::string& name,
                                    std::int64_t exclude_id) const override;

  int commit() override;
  void rollback() override;

 private:
  enum class PendingKind { kInsert, kUpdate, kDelete };

  struct PendingChange {
    PendingKind kind;
    domain::Department department;
  };

  std::map<std::int64_t, domain::Department> departments_;
  std::vector<PendingChange> pending_;
  std::int64_t last_id_{0};
  // Ids handed out by add() but not yet committed.
  std::int64_t reserved_ids_{0};
};

}  // namespace deptcat::storage
