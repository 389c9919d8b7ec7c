#pragma once

#include "deptcat/domain/department_validation.h"

#include "../shared/arg_parser.h"
#include <optional>
#include <string>
#include <vector>

namespace deptcat::server {

// ServerConfig holds all parsed startup flags for the department server.
// Every field has an explicit default; optional fields mean "not configured".
struct ServerConfig {
  // SQLite database file. Absent means ephemeral in-memory storage.
  std::optional<std::string> db_path;  // NOLINT(readability-identifier-naming)
  // Redis URI for the cross-process name lock. Absent means a process-local lock.
  std::optional<std::string> redis_uri;  // NOLINT(readability-identifier-naming)
  domain::ValidationMode validation_mode{  // NOLINT(readability-identifier-naming)
                                         domain::ValidationMode::kFailFast};
  bool seed{false};  // NOLINT(readability-identifier-naming)
  bool help{false};  // NOLINT(readability-identifier-naming)
  // Messages for every flag that failed to parse.
  std::vector<std::string> parse_errors;  // NOLINT(readability-identifier-naming)
};

[[nodiscard]] std::vector<apps::Option<ServerConfig>> build_option_registry();

ServerConfig parse_args(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// "fail-fast" or "collect-all"
[[nodiscard]] std::optional<domain::ValidationMode> parse_validation_mode(const std::string& value);

}  // namespace deptcat::server
