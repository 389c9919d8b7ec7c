#pragma once

#include <nlohmann/json.hpp>

#include "jsonrpc.h"
#include "server_context.h"
#include <functional>
#include <string>
#include <unordered_map>

namespace deptcat::server {

using MethodHandler = std::function<nlohmann::json(const JsonRpcRequest& req, ServerContext& ctx)>;

// Department methods answer {"status", "body", "trace_id"}; status follows the API adapter.
// Missing or mistyped params throw InvalidParams.
nlohmann::json handle_initialize(const JsonRpcRequest& req, ServerContext& ctx);
nlohmann::json handle_departments_list(const JsonRpcRequest& req, ServerContext& ctx);
nlohmann::json handle_departments_get(const JsonRpcRequest& req, ServerContext& ctx);
nlohmann::json handle_departments_get_by_name(const JsonRpcRequest& req, ServerContext& ctx);
nlohmann::json handle_departments_search(const JsonRpcRequest& req, ServerContext& ctx);
nlohmann::json handle_departments_create(const JsonRpcRequest& req, ServerContext& ctx);
nlohmann::json handle_departments_update(const JsonRpcRequest& req, ServerContext& ctx);
nlohmann::json handle_departments_delete(const JsonRpcRequest& req, ServerContext& ctx);
nlohmann::json handle_audit_trace(const JsonRpcRequest& req, ServerContext& ctx);

std::unordered_map<std::string, MethodHandler> build_method_registry();

}  // namespace deptcat::server
