#include "deptcat/coordination/redis_config.h"

#include <string>
#include <string_view>

namespace deptcat::coordination {

namespace {

// Parses a non-empty run of decimal digits. Values above max are rejected.
std::optional<int> parse_decimal(const std::string_view text, const int max) {
  if (text.empty() || text.size() > 5) {
    return std::nullopt;
  }
  int value = 0;
  for (const char c : text) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    value = value * 10 + (c - '0');
  }
  if (value > max) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

std::optional<RedisConfig> parse_redis_uri(const std::string& uri) {
  if (uri.empty()) {
    return std::nullopt;
  }

  std::string_view view{uri};
  std::string_view host_port_view;
  bool allows_db = false;

  if (view.starts_with("tcp://")) {
    host_port_view = view.substr(6);
  } else if (view.starts_with("redis://")) {
    host_port_view = view.substr(8);
    allows_db = true;
  } else {
    return std::nullopt;
  }

  int redis_db = 0;
  const auto slash_pos = host_port_view.find('/');
  if (slash_pos != std::string_view::npos) {
    if (!allows_db) {
      return std::nullopt;
    }
    const auto db = parse_decimal(host_port_view.substr(slash_pos + 1), 15);
    if (!db.has_value()) {
      return std::nullopt;
    }
    redis_db = *db;
    host_port_view = host_port_view.substr(0, slash_pos);
  }

  if (host_port_view.empty()) {
    return std::nullopt;
  }

  // Split on last colon to separate host from port.
  const auto colon_pos = host_port_view.rfind(':');
  std::string host;
  int port = 6379;

  if (colon_pos == std::string_view::npos) {
    host = std::string{host_port_view};
  } else {
    host = std::string{host_port_view.substr(0, colon_pos)};
    const auto parsed_port = parse_decimal(host_port_view.substr(colon_pos + 1), 65535);
    if (!parsed_port.has_value() || *parsed_port < 1) {
      return std::nullopt;
    }
    port = *parsed_port;
  }

  if (host.empty()) {
    return std::nullopt;
  }

  return RedisConfig{uri, host, port, redis_db};
}

std::string redis_config_to_log_string(const RedisConfig& config) {
  return config.host + ":" + std::to_string(config.port) + "/" + std::to_string(config.redis_db);
}

}  // namespace deptcat::coordination
