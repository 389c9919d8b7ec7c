#include "deptcat/coordination/redis_health.h"

#include <sw/redis++/redis++.h>

namespace deptcat::coordination {

RedisHealthResult redis_ping(const RedisConfig& config) {
  try {
    sw::redis::ConnectionOptions options;
    options.host = config.host;
    options.port = config.port;
    options.db = config.redis_db;
    sw::redis::Redis redis(options);
    redis.ping();
    return RedisHealthResult{true, ""};
  } catch (const std::exception& e) {
    return RedisHealthResult{false, e.what()};
  }
}

}  // namespace deptcat::coordination
