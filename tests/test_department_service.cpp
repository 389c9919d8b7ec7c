#include "deptcat/app/department_service.h"
#include "deptcat/coordination/inmemory_name_lock.h"
#include "deptcat/storage/inmemory_department_gateway.h"
#include "deptcat/storage/sqlite/sqlite_db.h"
#include "deptcat/storage/sqlite/sqlite_department_gateway.h"

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace deptcat;

namespace {

struct Catalog {
  storage::InMemoryDepartmentGateway gateway;
  storage::InMemoryAuditLog audit_log;
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock{"2026-01-01T00:00:00Z"};
  app::DepartmentService service{gateway, audit_log, id_gen, clock};

  domain::Department add(const std::string& name, const std::string& description = "") {
    auto result = service.add_department(domain::Department{0, name, description});
    REQUIRE(result.has_value());
    return result.value();
  }
};

domain::Department make(const std::string& name, const std::string& description = "") {
  return domain::Department{0, name, description};
}

}  // namespace

// ── add_department ──────────────────────────────────────────────────────────

TEST_CASE("add_department: valid record gets a positive id", "[service][add]") {
  Catalog catalog;

  SECTION("shortest name, no description") {
    const auto stored = catalog.add("A");
    CHECK(stored.id > 0);
    CHECK(stored.name == "A");
    CHECK(stored.description.empty());
  }

  SECTION("longest name and description") {
    const auto stored = catalog.add(std::string(100, 'n'), std::string(500, 'd'));
    CHECK(stored.id > 0);
    CHECK(catalog.gateway.get_by_id(stored.id).has_value());
  }
}

TEST_CASE("add_department: sequential adds get consecutive ids", "[service][add]") {
  Catalog catalog;
  const auto first = catalog.add("Finance");
  const auto second = catalog.add("Legal");
  const auto third = catalog.add("Marketing");
  CHECK(second.id == first.id + 1);
  CHECK(third.id == second.id + 1);
}

TEST_CASE("add_department: absent record is invalid input", "[service][add]") {
  Catalog catalog;
  const auto result = catalog.service.add_department(std::nullopt);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().kind == core::ErrorKind::kInvalidInput);
  CHECK(result.error().message == "Department cannot be null.");
}

TEST_CASE("add_department: field checks run in order", "[service][add][ordering]") {
  Catalog catalog;
  (void)catalog.add("Finance");

  SECTION("blank name wins over an oversized description") {
    const auto result = catalog.service.add_department(make("  ", std::string(501, 'd')));
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().message == "Department name cannot be null or empty.");
  }

  SECTION("name length wins over an oversized description") {
    const auto result =
        catalog.service.add_department(make(std::string(101, 'n'), std::string(501, 'd')));
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().kind == core::ErrorKind::kInvalidInput);
    CHECK(result.error().message == "Department name cannot exceed 100 characters.");
  }

  SECTION("field checks win over the duplicate name") {
    const auto result = catalog.service.add_department(make("Finance", std::string(501, 'd')));
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().kind == core::ErrorKind::kInvalidInput);
    CHECK(result.error().message == "Department description cannot exceed 500 characters.");
  }
}

TEST_CASE("add_department: case-insensitive duplicate is a conflict", "[service][add]") {
  Catalog catalog;
  (void)catalog.add("Finance");

  const auto result = catalog.service.add_department(make("FINANCE"));
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().kind == core::ErrorKind::kConflict);
  CHECK(result.error().message == "A department with name 'FINANCE' already exists.");

  const auto all = catalog.service.get_all_departments();
  REQUIRE(all.has_value());
  CHECK(all.value().size() == 1);
}

TEST_CASE("add_department: the id on input is ignored", "[service][add]") {
  Catalog catalog;
  const auto result = catalog.service.add_department(domain::Department{42, "Finance", ""});
  REQUIRE(result.has_value());
  CHECK(result.value().id == 1);
}

TEST_CASE("add_department: collect-all mode reports every violation", "[service][add]") {
  storage::InMemoryDepartmentGateway gateway;
  storage::InMemoryAuditLog audit_log;
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock("2026-01-01T00:00:00Z");
  app::DepartmentService service(gateway, audit_log, id_gen, clock, nullptr,
                                 domain::ValidationMode::kCollectAll);

  const auto result = service.add_department(make("", std::string(501, 'd')));
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().message ==
        "Validation failed for department: Department name is required.");
  REQUIRE(result.error().violations.size() == 2);
  CHECK(result.error().violations[1] == "Department description cannot exceed 500 characters.");
}

// ── update_department ───────────────────────────────────────────────────────

TEST_CASE("update_department: changes name and description", "[service][update]") {
  Catalog catalog;
  const auto stored = catalog.add("Finance", "old");

  const auto result =
      catalog.service.update_department(domain::Department{stored.id, "Accounting", "new"});
  REQUIRE(result.has_value());
  CHECK(result.value().id == stored.id);
  CHECK(result.value().name == "Accounting");

  const auto reread = catalog.service.get_department_by_id(stored.id);
  REQUIRE(reread.has_value());
  REQUIRE(reread.value().has_value());
  CHECK(reread.value()->description == "new");
}

TEST_CASE("update_department: keeping its own name never conflicts", "[service][update]") {
  Catalog catalog;
  const auto stored = catalog.add("Finance");

  SECTION("same name") {
    const auto result =
        catalog.service.update_department(domain::Department{stored.id, "Finance", "x"});
    CHECK(result.has_value());
  }

  SECTION("same name in another case") {
    const auto result =
        catalog.service.update_department(domain::Department{stored.id, "FINANCE", "x"});
    REQUIRE(result.has_value());
    CHECK(result.value().name == "FINANCE");
  }
}

TEST_CASE("update_department: taking another record's name is a conflict",
          "[service][update]") {
  Catalog catalog;
  (void)catalog.add("Finance");
  const auto legal = catalog.add("Legal");

  const auto result =
      catalog.service.update_department(domain::Department{legal.id, "finance", ""});
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().kind == core::ErrorKind::kConflict);
  CHECK(result.error().message == "A department with name 'finance' already exists.");
  CHECK(catalog.gateway.get_by_id(legal.id)->name == "Legal");
}

TEST_CASE("update_department: check order", "[service][update][ordering]") {
  Catalog catalog;
  (void)catalog.add("Finance");

  SECTION("absent record") {
    const auto result = catalog.service.update_department(std::nullopt);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().kind == core::ErrorKind::kInvalidInput);
  }

  SECTION("non-positive id comes before field checks") {
    const auto result = catalog.service.update_department(domain::Department{0, "", ""});
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().message == "Department ID must be greater than zero.");
  }

  SECTION("field checks come before existence") {
    const auto result =
        catalog.service.update_department(domain::Department{99, std::string(101, 'n'), ""});
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().kind == core::ErrorKind::kInvalidInput);
    CHECK(result.error().message == "Department name cannot exceed 100 characters.");
  }

  SECTION("existence comes before uniqueness") {
    const auto result =
        catalog.service.update_department(domain::Department{99, "Finance", ""});
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().kind == core::ErrorKind::kNotFound);
    CHECK(result.error().message == "Department with ID 99 does not exist.");
  }
}

// ── delete_department ───────────────────────────────────────────────────────

TEST_CASE("delete_department: removed record reads back as absent", "[service][delete]") {
  Catalog catalog;
  const auto stored = catalog.add("Finance");

  const auto deleted = catalog.service.delete_department(stored.id);
  REQUIRE(deleted.has_value());
  CHECK(deleted.value());

  const auto reread = catalog.service.get_department_by_id(stored.id);
  REQUIRE(reread.has_value());
  CHECK_FALSE(reread.value().has_value());
}

TEST_CASE("delete_department: invalid and unknown ids", "[service][delete]") {
  Catalog catalog;

  const auto invalid = catalog.service.delete_department(-1);
  REQUIRE_FALSE(invalid.has_value());
  CHECK(invalid.error().kind == core::ErrorKind::kInvalidInput);

  const auto missing = catalog.service.delete_department(5);
  REQUIRE_FALSE(missing.has_value());
  CHECK(missing.error().kind == core::ErrorKind::kNotFound);
  CHECK(missing.error().message == "Department with ID 5 does not exist.");
}

TEST_CASE("delete_department: a deleted name can be reused", "[service][delete]") {
  Catalog catalog;
  const auto stored = catalog.add("Finance");
  REQUIRE(catalog.service.delete_department(stored.id).has_value());

  const auto again = catalog.service.add_department(make("finance"));
  REQUIRE(again.has_value());
  CHECK(again.value().id == stored.id + 1);
}

// ── reads ───────────────────────────────────────────────────────────────────

TEST_CASE("get_department_by_id: absence is not an error", "[service][read]") {
  Catalog catalog;
  const auto result = catalog.service.get_department_by_id(1);
  REQUIRE(result.has_value());
  CHECK_FALSE(result.value().has_value());

  const auto invalid = catalog.service.get_department_by_id(0);
  REQUIRE_FALSE(invalid.has_value());
  CHECK(invalid.error().kind == core::ErrorKind::kInvalidInput);
}

TEST_CASE("get_department_by_name: case-insensitive exact match", "[service][read]") {
  Catalog catalog;
  (void)catalog.add("Human Resources");

  const auto found = catalog.service.get_department_by_name("HUMAN RESOURCES");
  REQUIRE(found.has_value());
  REQUIRE(found.value().has_value());
  CHECK(found.value()->name == "Human Resources");

  const auto partial = catalog.service.get_department_by_name("Human");
  REQUIRE(partial.has_value());
  CHECK_FALSE(partial.value().has_value());

  const auto blank = catalog.service.get_department_by_name(" ");
  REQUIRE_FALSE(blank.has_value());
  CHECK(blank.error().kind == core::ErrorKind::kInvalidInput);
}

TEST_CASE("search_departments_by_name: substring match ordered by name", "[service][read]") {
  Catalog catalog;
  (void)catalog.add("Human Resources");
  (void)catalog.add("Human Capital");
  (void)catalog.add("Finance");

  const auto result = catalog.service.search_departments_by_name("Human");
  REQUIRE(result.has_value());
  REQUIRE(result.value().size() == 2);
  CHECK(result.value()[0].name == "Human Capital");
  CHECK(result.value()[1].name == "Human Resources");

  const auto blank = catalog.service.search_departments_by_name("");
  REQUIRE_FALSE(blank.has_value());
  CHECK(blank.error().kind == core::ErrorKind::kInvalidInput);
}

TEST_CASE("get_all_departments: repeated reads are identical", "[service][read]") {
  Catalog catalog;
  (void)catalog.add("Legal");
  (void)catalog.add("finance");
  (void)catalog.add("Marketing");

  const auto first = catalog.service.get_all_departments();
  const auto second = catalog.service.get_all_departments();
  REQUIRE(first.has_value());
  REQUIRE(second.has_value());
  CHECK(first.value() == second.value());
  REQUIRE(first.value().size() == 3);
  CHECK(first.value()[0].name == "finance");
  CHECK(first.value()[2].name == "Marketing");
}

// ── audit trail ─────────────────────────────────────────────────────────────

TEST_CASE("Every call leaves an audit trace", "[service][audit]") {
  Catalog catalog;
  const auto stored = catalog.add("Finance");
  const std::string created_trace = catalog.service.last_trace_id();

  const auto created = catalog.audit_log.query(created_trace);
  REQUIRE(created.size() == 1);
  CHECK(created[0].event_type == "DepartmentCreated");
  CHECK(created[0].created_at == "2026-01-01T00:00:00Z");
  REQUIRE(created[0].refs.size() == 1);
  CHECK(created[0].refs[0] == std::to_string(stored.id));

  (void)catalog.service.add_department(make("finance"));
  const auto rejected = catalog.audit_log.query(catalog.service.last_trace_id());
  REQUIRE(rejected.size() == 1);
  CHECK(rejected[0].event_type == "DepartmentRejected");
  CHECK(rejected[0].payload.find("\"conflict\"") != std::string::npos);

  REQUIRE(catalog.service.update_department(domain::Department{stored.id, "Finance", "x"})
              .has_value());
  const auto updated = catalog.audit_log.query(catalog.service.last_trace_id());
  REQUIRE(updated.size() == 1);
  CHECK(updated[0].event_type == "DepartmentUpdated");

  REQUIRE(catalog.service.delete_department(stored.id).has_value());
  const auto deleted = catalog.audit_log.query(catalog.service.last_trace_id());
  REQUIRE(deleted.size() == 1);
  CHECK(deleted[0].event_type == "DepartmentDeleted");
}

// ── name lock ───────────────────────────────────────────────────────────────

TEST_CASE("A name held by another writer is a conflict", "[service][lock]") {
  storage::InMemoryDepartmentGateway gateway;
  storage::InMemoryAuditLog audit_log;
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock("2026-01-01T00:00:00Z");
  coordination::InMemoryNameLock name_lock;
  app::DepartmentService service(gateway, audit_log, id_gen, clock, &name_lock);

  REQUIRE(name_lock.try_acquire("department:name:finance", "other-writer"));

  const auto blocked = service.add_department(make("FINANCE"));
  REQUIRE_FALSE(blocked.has_value());
  CHECK(blocked.error().kind == core::ErrorKind::kConflict);
  CHECK(gateway.get_all().empty());

  name_lock.release("department:name:finance", "other-writer");

  const auto added = service.add_department(make("FINANCE"));
  REQUIRE(added.has_value());
  // The service releases its own lock once the call returns.
  CHECK_FALSE(name_lock.is_held("department:name:finance"));
}

// ── SQLite-backed service ───────────────────────────────────────────────────

TEST_CASE("DepartmentService on SQLite keeps the same contract", "[service][sqlite]") {
  auto db_result = storage::sqlite::SqliteDb::open(":memory:");
  REQUIRE(db_result.has_value());
  auto db = db_result.value();
  REQUIRE(db->ensure_schema_v1().has_value());

  storage::sqlite::SqliteDepartmentGateway gateway(db);
  storage::InMemoryAuditLog audit_log;
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock("2026-01-01T00:00:00Z");
  app::DepartmentService service(gateway, audit_log, id_gen, clock);

  const auto first = service.add_department(make("Finance"));
  const auto second = service.add_department(make("Legal"));
  REQUIRE(first.has_value());
  REQUIRE(second.has_value());
  CHECK(second.value().id == first.value().id + 1);

  const auto duplicate = service.add_department(make("LEGAL"));
  REQUIRE_FALSE(duplicate.has_value());
  CHECK(duplicate.error().kind == core::ErrorKind::kConflict);

  const auto third = service.add_department(make("Marketing"));
  REQUIRE(third.has_value());
  CHECK(third.value().id == second.value().id + 1);

  const auto renamed =
      service.update_department(domain::Department{first.value().id, "Treasury", ""});
  REQUIRE(renamed.has_value());

  const auto removed = service.delete_department(second.value().id);
  REQUIRE(removed.has_value());

  const auto all = service.get_all_departments();
  REQUIRE(all.has_value());
  REQUIRE(all.value().size() == 2);
  CHECK(all.value()[0].name == "Marketing");
  CHECK(all.value()[1].name == "Treasury");
}
