#pragma once

#include "deptcat/coordination/redis_config.h"

#include <string>

namespace deptcat::coordination {

// RedisHealthResult holds the outcome of a redis_ping() call.
struct RedisHealthResult {
  bool reachable{false};
  std::string error;
};

// redis_ping opens a direct Redis connection, sends PING, and returns the result.
// Never throws; all errors are reported in RedisHealthResult.error.
[[nodiscard]] RedisHealthResult redis_ping(const RedisConfig& config);

}  // namespace deptcat::coordination
