#include "deptcat/coordination/inmemory_name_lock.h"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace deptcat;

TEST_CASE("InMemoryNameLock: one owner at a time", "[coordination][lock]") {
  coordination::InMemoryNameLock lock;

  REQUIRE(lock.try_acquire("department:name:finance", "writer-a"));
  CHECK_FALSE(lock.try_acquire("department:name:finance", "writer-b"));
  CHECK(lock.try_acquire("department:name:legal", "writer-b"));

  // Only the holder can release.
  lock.release("department:name:finance", "writer-b");
  CHECK(lock.is_held("department:name:finance"));

  lock.release("department:name:finance", "writer-a");
  CHECK_FALSE(lock.is_held("department:name:finance"));
  CHECK(lock.try_acquire("department:name:finance", "writer-b"));
}

TEST_CASE("NameLockGuard releases on scope exit", "[coordination][lock]") {
  coordination::InMemoryNameLock lock;
  {
    REQUIRE(lock.try_acquire("k", "owner"));
    coordination::NameLockGuard guard(lock, "k", "owner");
    CHECK(lock.is_held("k"));
  }
  CHECK_FALSE(lock.is_held("k"));
}

TEST_CASE("InMemoryNameLock: concurrent writers, single winner", "[coordination][lock]") {
  coordination::InMemoryNameLock lock;
  std::atomic<int> winners{0};

  std::vector<std::thread> writers;
  for (int i = 0; i < 8; ++i) {
    writers.emplace_back([&lock, &winners, i] {
      if (lock.try_acquire("department:name:finance", "writer-" + std::to_string(i))) {
        ++winners;
      }
    });
  }
  for (auto& writer : writers) {
    writer.join();
  }

  CHECK(winners == 1);
}
