#pragma once

#include "config.h"
#include <string>

namespace deptcat::server {

// validate_server_config checks startup preconditions for the department server.
//
// Returns: "" on success, non-empty error message on failure.
// Caller is responsible for printing the error and exiting with code 1.
//
// Preconditions checked (first failure is returned):
// - every command-line flag parsed
// - db_path, when present, is not empty
// - redis_uri, when present, is accepted by parse_redis_uri()
[[nodiscard]] std::string validate_server_config(const ServerConfig& config);

}  // namespace deptcat::server
