#include "deptcat/coordination/redis_name_lock.h"

#include <iostream>
#include <stdexcept>
#include <sw/redis++/redis++.h>
#include <vector>

namespace deptcat::coordination {

namespace {

constexpr const char* kKeyPrefix = "deptcat:lock:";

// Args: KEYS[1] = lock key, ARGV[1] = owner
// Returns: 1 if the lock was deleted, 0 if it was absent or held by another owner
constexpr const char* kReleaseScript = R"LUA(
if redis.call('GET', KEYS[1]) == ARGV[1] then
  return redis.call('DEL', KEYS[1])
end
return 0
)LUA";

}  // namespace

RedisNameLock::RedisNameLock(const RedisConfig& config, const std::chrono::milliseconds ttl)
    : ttl_(ttl) {
  try {
    sw::redis::ConnectionOptions options;
    options.host = config.host;
    options.port = config.port;
    options.db = config.redis_db;
    redis_ = std::make_unique<sw::redis::Redis>(options);
    redis_->ping();
    release_script_sha_ = redis_->script_load(kReleaseScript);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to connect to Redis: " + std::string(e.what()));
  }
}

RedisNameLock::~RedisNameLock() = default;

bool RedisNameLock::try_acquire(const std::string& key, const std::string& owner) {
  try {
    return redis_->set(kKeyPrefix + key, owner, ttl_, sw::redis::UpdateType::NOT_EXIST);
  } catch (const std::exception& e) {
    throw std::runtime_error("Redis lock acquire failed: " + std::string(e.what()));
  }
}

void RedisNameLock::release(const std::string& key, const std::string& owner) noexcept {
  try {
    std::vector<std::string> keys = {kKeyPrefix + key};
    std::vector<std::string> args = {owner};
    sw::redis::StringView script_sha{release_script_sha_};
    (void)redis_->evalsha<long long>(script_sha, keys.begin(), keys.end(), args.begin(),
                                     args.end());
  } catch (const std::exception& e) {
    // The TTL frees the key eventually.
    std::cerr << "Redis lock release failed for " << key << ": " << e.what() << "\n";
  }
}

}  // namespace deptcat::coordination
