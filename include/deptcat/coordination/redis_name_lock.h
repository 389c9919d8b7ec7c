#pragma once

#ifdef DEPTCAT_TRANSPORT_BOUNDARY_GUARD
#error "Concrete storage/redis header included in a guarded translation unit. Use interfaces only."
#endif

#include "deptcat/coordination/name_lock.h"
#include "deptcat/coordination/redis_config.h"

#include <chrono>
#include <memory>
#include <string>

// Forward declare Redis++ types to avoid exposing them in header
namespace sw {
namespace redis {
class Redis;
}
}  // namespace sw

namespace deptcat::coordination {

// RedisNameLock arbitrates writers across processes that share a Redis instance.
//
// Redis data model:
// - Lock: deptcat:lock:{key} (string), value = owner, PX = ttl
//
// Acquire is a single SET NX PX. Release runs a Lua compare-and-delete so that an owner whose
// lock already expired can not delete a lock re-acquired by another writer.
class RedisNameLock final : public INameLock {
 public:
  // Throws std::runtime_error if the connection or script load fails.
  explicit RedisNameLock(const RedisConfig& config,
                         std::chrono::milliseconds ttl = kDefaultLockTtl);

  ~RedisNameLock() override;

  RedisNameLock(const RedisNameLock&) = delete;
  RedisNameLock& operator=(const RedisNameLock&) = delete;
  RedisNameLock(RedisNameLock&&) = delete;
  RedisNameLock& operator=(RedisNameLock&&) = delete;

  [[nodiscard]] bool try_acquire(const std::string& key, const std::string& owner) override;
  void release(const std::string& key, const std::string& owner) noexcept override;

 private:
  std::unique_ptr<sw::redis::Redis> redis_;
  std::chrono::milliseconds ttl_;

  // Lua script SHA for compare-and-delete release
  std::string release_script_sha_;
};

}  // namespace deptcat::coordination
