#include "deptcat/coordination/redis_config.h"
#include "deptcat/coordination/redis_health.h"
#include "deptcat/coordination/redis_name_lock.h"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <thread>

using namespace deptcat;

// Helper: Check if Redis integration tests should run
static bool should_run_redis_tests() {
  const char* env = std::getenv("DEPTCAT_TEST_REDIS");
  return env != nullptr && std::string(env) == "1";
}

// Helper: Get Redis URI from environment or use default
static coordination::RedisConfig get_redis_config() {
  const char* env = std::getenv("DEPTCAT_REDIS_URI");
  const std::string uri = env != nullptr ? std::string(env) : "tcp://127.0.0.1:6379";
  const auto config = coordination::parse_redis_uri(uri);
  REQUIRE(config.has_value());
  return config.value();
}

TEST_CASE("redis_ping: unreachable server reports an error", "[coordination][redis]") {
  const coordination::RedisConfig config{"tcp://127.0.0.1:1", "127.0.0.1", 1, 0};
  const auto result = coordination::redis_ping(config);
  CHECK_FALSE(result.reachable);
  CHECK_FALSE(result.error.empty());
}

TEST_CASE("RedisNameLock: unreachable server throws on construction", "[coordination][redis]") {
  const coordination::RedisConfig config{"tcp://127.0.0.1:1", "127.0.0.1", 1, 0};
  CHECK_THROWS_AS(coordination::RedisNameLock(config), std::runtime_error);
}

TEST_CASE("RedisNameLock: one owner at a time", "[coordination][redis][integration]") {
  if (!should_run_redis_tests()) {
    SKIP("Redis integration tests disabled (set DEPTCAT_TEST_REDIS=1 to enable)");
  }

  coordination::RedisNameLock lock(get_redis_config());
  const std::string key = "test:name:finance";

  REQUIRE(lock.try_acquire(key, "writer-a"));
  CHECK_FALSE(lock.try_acquire(key, "writer-b"));

  // Release by a non-holder is a no-op.
  lock.release(key, "writer-b");
  CHECK_FALSE(lock.try_acquire(key, "writer-b"));

  lock.release(key, "writer-a");
  CHECK(lock.try_acquire(key, "writer-b"));
  lock.release(key, "writer-b");
}

TEST_CASE("RedisNameLock: expired lock can be re-acquired", "[coordination][redis][integration]") {
  if (!should_run_redis_tests()) {
    SKIP("Redis integration tests disabled (set DEPTCAT_TEST_REDIS=1 to enable)");
  }

  coordination::RedisNameLock lock(get_redis_config(), std::chrono::milliseconds(100));
  const std::string key = "test:name:expiring";

  REQUIRE(lock.try_acquire(key, "writer-a"));
  std::this_thread::sleep_for(std::chrono::milliseconds(250));
  CHECK(lock.try_acquire(key, "writer-b"));

  // The stale owner must not free the new holder's lock.
  lock.release(key, "writer-a");
  CHECK_FALSE(lock.try_acquire(key, "writer-c"));
  lock.release(key, "writer-b");
}
