#pragma once

#include "deptcat/api/department_api.h"
#include "deptcat/app/department_service.h"
#include "deptcat/storage/audit_log.h"

#include "config.h"

namespace deptcat::server {

// ServerContext holds all process-lifetime service references passed to every method handler.
// All references must remain valid for the lifetime of run_server_loop().
struct ServerContext {
  app::DepartmentService& service;  // NOLINT(readability-identifier-naming)
  api::DepartmentApi& api;          // NOLINT(readability-identifier-naming)
  storage::IAuditLog& audit_log;    // NOLINT(readability-identifier-naming)
  const ServerConfig& config;       // NOLINT(readability-identifier-naming)
};

}  // namespace deptcat::server
