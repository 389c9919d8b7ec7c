#include "deptcat/api/department_api.h"
#include "deptcat/app/department_service.h"
#include "deptcat/app/seed.h"
#include "deptcat/coordination/inmemory_name_lock.h"
#include "deptcat/coordination/redis_config.h"
#include "deptcat/coordination/redis_health.h"
#include "deptcat/coordination/redis_name_lock.h"
#include "deptcat/core/clock.h"
#include "deptcat/core/id_generator.h"
#include "deptcat/storage/audit_log.h"
#include "deptcat/storage/inmemory_department_gateway.h"
#include "deptcat/storage/sqlite/sqlite_audit_log.h"
#include "deptcat/storage/sqlite/sqlite_db.h"
#include "deptcat/storage/sqlite/sqlite_department_gateway.h"

#include "config.h"
#include "server_context.h"
#include "server_loop.h"
#include "startup_guard.h"
#include <iostream>
#include <memory>
#include <string>

using namespace deptcat;

int main(int argc, char* argv[]) {
  auto config = server::parse_args(argc, argv);

  if (config.help) {
    std::cerr << apps::usage_text("deptcat_server", server::build_option_registry());
    return 0;
  }

  // Validate config before emitting any startup output so no partial messages appear on error.
  const std::string config_error = server::validate_server_config(config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return 1;
  }

  // ── Startup diagnostic block ──────────────────────────────────────────────
  std::cerr << "department-catalog server v0.1\n";

  std::unique_ptr<storage::IDepartmentGateway> gateway;
  std::unique_ptr<storage::IAuditLog> audit_log;

  if (config.db_path.has_value()) {
    auto db_result = storage::sqlite::SqliteDb::open(config.db_path.value());
    if (!db_result.has_value()) {
      std::cerr << "Failed to open database: " << db_result.error() << "\n";
      return 1;
    }

    auto db = db_result.value();
    auto schema_result = db->ensure_schema_v1();
    if (!schema_result.has_value()) {
      std::cerr << "Failed to initialize schema: " << schema_result.error() << "\n";
      return 1;
    }

    gateway = std::make_unique<storage::sqlite::SqliteDepartmentGateway>(db);
    audit_log = std::make_unique<storage::sqlite::SqliteAuditLog>(db);
    std::cerr << "Storage:     SQLite -- " << config.db_path.value() << "\n";
  } else {
    gateway = std::make_unique<storage::InMemoryDepartmentGateway>();
    audit_log = std::make_unique<storage::InMemoryAuditLog>();
    std::cerr << "WARNING: No --db path specified. Running with EPHEMERAL in-memory storage.\n"
                 "         All departments and audit events will be LOST on process exit.\n"
                 "         Pass --db <path> to enable persistence.\n";
  }

  std::unique_ptr<coordination::INameLock> name_lock;
  if (config.redis_uri.has_value()) {
    // Format was validated above.
    const auto redis_cfg = coordination::parse_redis_uri(config.redis_uri.value()).value();
    const auto health = coordination::redis_ping(redis_cfg);
    if (!health.reachable) {
      std::cerr << "Failed to reach Redis at "
                << coordination::redis_config_to_log_string(redis_cfg) << ": " << health.error
                << "\n";
      return 1;
    }
    try {
      name_lock = std::make_unique<coordination::RedisNameLock>(redis_cfg);
    } catch (const std::exception& e) {
      std::cerr << e.what() << "\n";
      return 1;
    }
    std::cerr << "Name lock:   Redis -- " << coordination::redis_config_to_log_string(redis_cfg)
              << "\n";
  } else {
    name_lock = std::make_unique<coordination::InMemoryNameLock>();
    std::cerr << "Name lock:   in-process (pass --redis <uri> to share it across processes)\n";
  }

  const bool collect_all = config.validation_mode == domain::ValidationMode::kCollectAll;
  std::cerr << "Validation:  " << (collect_all ? "collect-all" : "fail-fast") << "\n";

  core::SystemIdGenerator id_gen;
  core::SystemClock clock;

  app::DepartmentService service(*gateway, *audit_log, id_gen, clock, name_lock.get(),
                                 config.validation_mode);
  api::DepartmentApi api(service);

  if (config.seed) {
    const auto seeded = app::seed_sample_departments(service);
    if (!seeded.has_value()) {
      std::cerr << "Failed to seed departments: " << seeded.error().message << "\n";
      return 1;
    }
    std::cerr << "Seed:        " << seeded.value() << " sample departments added\n";
  }

  std::cerr << "Listening on stdio for JSON-RPC requests...\n";
  // ─────────────────────────────────────────────────────────────────────────

  server::ServerContext ctx{service, api, *audit_log, config};
  server::run_server_loop(ctx, std::cin, std::cout);

  return 0;
}
