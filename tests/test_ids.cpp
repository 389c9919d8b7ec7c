#include "deptcat/core/clock.h"
#include "deptcat/core/id_generator.h"

#include <catch2/catch_test_macros.hpp>

#include <set>

TEST_CASE("ID generators produce prefixed, unique values", "[ids]") {
  SECTION("SystemIdGenerator") {
    deptcat::core::SystemIdGenerator gen;
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
      const auto id = gen.next("trace");
      REQUIRE(id.starts_with("trace-"));
      REQUIRE(seen.insert(id).second);
    }
  }

  SECTION("DeterministicIdGenerator repeats the same sequence") {
    deptcat::core::DeterministicIdGenerator first;
    deptcat::core::DeterministicIdGenerator second;
    CHECK(first.next("evt") == "evt-0");
    CHECK(first.next("trace") == "trace-1");
    CHECK(second.next("evt") == "evt-0");
  }
}

TEST_CASE("Service traces and audit events use distinct prefixes", "[ids]") {
  deptcat::core::DeterministicIdGenerator gen;
  CHECK(gen.next(deptcat::core::kTraceIdPrefix) == "trace-0");
  CHECK(gen.next(deptcat::core::kEventIdPrefix) == "evt-1");
}

TEST_CASE("Clocks report ISO 8601 UTC", "[ids][clock]") {
  deptcat::core::FixedClock fixed("2026-01-01T00:00:00Z");
  CHECK(fixed.now_iso8601() == "2026-01-01T00:00:00Z");

  deptcat::core::SystemClock system;
  const auto now = system.now_iso8601();
  REQUIRE(now.size() == 20);
  CHECK(now[4] == '-');
  CHECK(now[10] == 'T');
  CHECK(now.back() == 'Z');
}
