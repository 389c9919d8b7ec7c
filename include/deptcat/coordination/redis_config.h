#pragma once

#include <optional>
#include <string>

namespace deptcat::coordination {

// RedisConfig holds a parsed and validated Redis URI.
//
// URI formats accepted:
//   tcp://host:port
//   redis://host:port
//   tcp://host          (port defaults to 6379)
//   redis://host:port/N (N = database index, redis:// scheme only)
struct RedisConfig {
  std::string uri;
  std::string host;
  int port{6379};
  int redis_db{0};
};

// parse_redis_uri attempts to parse a Redis URI string.
// Returns RedisConfig on success, nullopt if the format is not recognised.
//
// Rejects: empty string, no recognised scheme, missing host, invalid port,
// a /N suffix on a tcp:// URI, a non-numeric database index.
//
// No dependency on redis++, pure string parsing.
[[nodiscard]] std::optional<RedisConfig> parse_redis_uri(const std::string& uri);

// redis_config_to_log_string returns a deterministic, human-readable
// representation of a RedisConfig for startup diagnostics.
// Format: "host:port/db"
[[nodiscard]] std::string redis_config_to_log_string(const RedisConfig& config);

}  // namespace deptcat::coordination
