#include "startup_guard.h"

#include "deptcat/coordination/redis_config.h"

namespace deptcat::server {

std::string validate_server_config(const ServerConfig& config) {
  if (!config.parse_errors.empty()) {
    return "Error: " + config.parse_errors.front() + "\n       Run with --help for usage.";
  }

  if (config.db_path.has_value() && config.db_path.value().empty()) {
    return "Error: --db requires a non-empty path.";
  }

  // Validate Redis URI format before attempting to connect.
  if (config.redis_uri.has_value() &&
      !coordination::parse_redis_uri(config.redis_uri.value()).has_value()) {
    return "Error: --redis URI '" + config.redis_uri.value() +
           "' is not a valid Redis URI.\n"
           "       Accepted formats: tcp://host:port, redis://host:port, tcp://host, "
           "redis://host:port/N";
  }

  return "";
}

}  // namespace deptcat::server
