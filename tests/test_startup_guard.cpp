#include <catch2/catch_test_macros.hpp>

#include "config.h"
#include "startup_guard.h"
#include <initializer_list>
#include <string>
#include <vector>

using namespace deptcat::server;

namespace {

// parse_args takes a mutable argv; keep the storage alive for the call.
ServerConfig parse(std::initializer_list<const char*> args) {
  std::vector<std::string> storage{"deptcat_server"};
  storage.insert(storage.end(), args.begin(), args.end());
  std::vector<char*> argv;
  for (auto& arg : storage) {
    argv.push_back(arg.data());
  }
  return parse_args(static_cast<int>(argv.size()), argv.data());
}

}  // namespace

// ── parse_args ──────────────────────────────────────────────────────────────

TEST_CASE("parse_args: defaults", "[startup][config]") {
  const auto config = parse({});
  CHECK_FALSE(config.db_path.has_value());
  CHECK_FALSE(config.redis_uri.has_value());
  CHECK(config.validation_mode == deptcat::domain::ValidationMode::kFailFast);
  CHECK_FALSE(config.seed);
  CHECK(config.parse_errors.empty());
}

TEST_CASE("parse_args: every flag", "[startup][config]") {
  const auto config = parse({"--db", "catalog.db", "--redis", "tcp://127.0.0.1:6379",
                             "--validation-mode", "collect-all", "--seed"});
  CHECK(config.db_path == "catalog.db");
  CHECK(config.redis_uri == "tcp://127.0.0.1:6379");
  CHECK(config.validation_mode == deptcat::domain::ValidationMode::kCollectAll);
  CHECK(config.seed);
  CHECK(config.parse_errors.empty());
}

TEST_CASE("parse_args: bad values and unknown flags are recorded", "[startup][config]") {
  const auto config = parse({"--validation-mode", "strict", "--verbose", "--db"});
  CHECK(config.parse_errors.size() == 3);
  CHECK(config.validation_mode == deptcat::domain::ValidationMode::kFailFast);
}

// ── validate_server_config ──────────────────────────────────────────────────

TEST_CASE("validate_server_config: in-memory defaults are valid", "[startup][config]") {
  ServerConfig config;
  CHECK(validate_server_config(config).empty());
}

TEST_CASE("validate_server_config: valid redis URI and db path", "[startup][config]") {
  ServerConfig config;
  config.db_path = "catalog.db";
  config.redis_uri = "redis://127.0.0.1:6379/1";
  CHECK(validate_server_config(config).empty());
}

TEST_CASE("validate_server_config: invalid redis URI format returns error", "[startup][config]") {
  ServerConfig config;
  config.redis_uri = "not-a-valid-uri";
  const auto error = validate_server_config(config);
  CHECK_FALSE(error.empty());
  CHECK(error.find("not-a-valid-uri") != std::string::npos);
}

TEST_CASE("validate_server_config: empty db path returns error", "[startup][config]") {
  ServerConfig config;
  config.db_path = "";
  CHECK_FALSE(validate_server_config(config).empty());
}

TEST_CASE("validate_server_config: parse errors block startup", "[startup][config]") {
  ServerConfig config;
  config.parse_errors.push_back("Unknown option: --verbose");
  const auto error = validate_server_config(config);
  CHECK(error.find("--verbose") != std::string::npos);
}
