#include "config.h"

#include <utility>

namespace deptcat::server {

namespace {

bool handle_db(ServerConfig& config, const std::string& value) {
  config.db_path = value;
  return true;
}

bool handle_redis(ServerConfig& config, const std::string& value) {
  config.redis_uri = value;
  return true;
}

bool handle_validation_mode(ServerConfig& config, const std::string& value) {
  const auto mode = parse_validation_mode(value);
  if (!mode.has_value()) {
    return false;  // valid: fail-fast, collect-all
  }
  config.validation_mode = mode.value();
  return true;
}

bool handle_seed(ServerConfig& config, const std::string& /*value*/) {
  config.seed = true;
  return true;
}

bool handle_help(ServerConfig& config, const std::string& /*value*/) {
  config.help = true;
  return true;
}

}  // namespace

std::optional<domain::ValidationMode> parse_validation_mode(const std::string& value) {
  if (value == "fail-fast") {
    return domain::ValidationMode::kFailFast;
  }
  if (value == "collect-all") {
    return domain::ValidationMode::kCollectAll;
  }
  return std::nullopt;
}

std::vector<apps::Option<ServerConfig>> build_option_registry() {
  return {
      {"--db", true, "Path to SQLite database file", handle_db},
      {"--redis", true, "Redis URI for the department name lock", handle_redis},
      {"--validation-mode", true, "Field validation reporting (fail-fast|collect-all)",
       handle_validation_mode},
      {"--seed", false, "Insert sample departments when the catalog is empty", handle_seed},
      {"--help", false, "Print this help and exit", handle_help},
  };
}

ServerConfig parse_args(int argc, char* argv[]) {
  auto parsed = apps::parse_options<ServerConfig>(argc, argv, build_option_registry());
  parsed.config.parse_errors = std::move(parsed.errors);
  return parsed.config;
}

}  // namespace deptcat::server
