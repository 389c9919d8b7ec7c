#pragma once

#include "deptcat/coordination/name_lock.h"

#include <map>
#include <mutex>
#include <string>

namespace deptcat::coordination {

// InMemoryNameLock arbitrates writers within one process.
// Locks have no expiry; every acquisition is paired with a NameLockGuard.
class InMemoryNameLock final : public INameLock {
 public:
  InMemoryNameLock() = default;
  ~InMemoryNameLock() override = default;

  InMemoryNameLock(const InMemoryNameLock&) = delete;
  InMemoryNameLock& operator=(const InMemoryNameLock&) = delete;
  InMemoryNameLock(InMemoryNameLock&&) = delete;
  InMemoryNameLock& operator=(InMemoryNameLock&&) = delete;

  [[nodiscard]] bool try_acquire(const std::string& key, const std::string& owner) override;
  void release(const std::string& key, const std::string& owner) noexcept override;

  [[nodiscard]] bool is_held(const std::string& key) const;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, std::string> holders_;  // key -> owner
};

}  // namespace deptcat::coordination
