#include "deptcat/coordination/inmemory_name_lock.h"

namespace deptcat::coordination {

bool InMemoryNameLock::try_acquire(const std::string& key, const std::string& owner) {
  std::lock_guard<std::mutex> lock(mutex_);
  return holders_.emplace(key, owner).second;
}

void InMemoryNameLock::release(const std::string& key, const std::string& owner) noexcept {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = holders_.find(key);
  if (it != holders_.end() && it->second == owner) {
    holders_.erase(it);
  }
}

bool InMemoryNameLock::is_held(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return holders_.contains(key);
}

}  // namespace deptcat::coordination
