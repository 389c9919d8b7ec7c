#include "method_handlers.h"

#include <cstdint>

namespace deptcat::server {

using json = nlohmann::json;

namespace {

std::int64_t required_id(const json& params) {
  if (!params.contains("id") || !params["id"].is_number_integer()) {
    throw InvalidParams("params.id must be an integer");
  }
  return params["id"].get<std::int64_t>();
}

std::string required_string(const json& params, const char* key) {
  if (!params.contains(key) || !params[key].is_string()) {
    throw InvalidParams(std::string("params.") + key + " must be a string");
  }
  return params[key].get<std::string>();
}

json to_result(const api::ApiResponse& response, const ServerContext& ctx) {
  return json{
      {"status", response.status},
      {"body", response.body},
      {"trace_id", ctx.service.last_trace_id()},
  };
}

}  // namespace

json handle_initialize(const JsonRpcRequest& /*req*/, ServerContext& ctx) {
  const bool collect_all = ctx.config.validation_mode == domain::ValidationMode::kCollectAll;
  return json{
      {"serverInfo", {{"name", "department-catalog"}, {"version", "0.1.0"}}},
      {"storage", ctx.config.db_path.has_value() ? "sqlite" : "inmemory"},
      {"nameLock", ctx.config.redis_uri.has_value() ? "redis" : "inmemory"},
      {"validationMode", collect_all ? "collect-all" : "fail-fast"},
  };
}

json handle_departments_list(const JsonRpcRequest& /*req*/, ServerContext& ctx) {
  return to_result(ctx.api.list(), ctx);
}

json handle_departments_get(const JsonRpcRequest& req, ServerContext& ctx) {
  return to_result(ctx.api.get_by_id(required_id(req.params)), ctx);
}

json handle_departments_get_by_name(const JsonRpcRequest& req, ServerContext& ctx) {
  return to_result(ctx.api.get_by_name(required_string(req.params, "name")), ctx);
}

json handle_departments_search(const JsonRpcRequest& req, ServerContext& ctx) {
  return to_result(ctx.api.search(required_string(req.params, "keyword")), ctx);
}

json handle_departments_create(const JsonRpcRequest& req, ServerContext& ctx) {
  return to_result(ctx.api.create(req.params), ctx);
}

json handle_departments_update(const JsonRpcRequest& req, ServerContext& ctx) {
  const std::int64_t id = required_id(req.params);
  json body = req.params;
  body.erase("id");
  return to_result(ctx.api.update(id, body), ctx);
}

json handle_departments_delete(const JsonRpcRequest& req, ServerContext& ctx) {
  return to_result(ctx.api.remove(required_id(req.params)), ctx);
}

json handle_audit_trace(const JsonRpcRequest& req, ServerContext& ctx) {
  const std::string trace_id = required_string(req.params, "trace_id");
  const auto events = ctx.audit_log.query(trace_id);

  json result;
  result["trace_id"] = trace_id;
  result["events"] = json::array();

  for (const auto& event : events) {
    result["events"].push_back({
        {"event_id", event.event_id},
        {"trace_id", event.trace_id},
        {"event_type", event.event_type},
        {"payload", json::parse(event.payload, nullptr, false)},
        {"created_at", event.created_at},
        {"refs", event.refs},
    });
  }

  return result;
}

std::unordered_map<std::string, MethodHandler> build_method_registry() {
  return {
      {"initialize", handle_initialize},
      {"departments/list", handle_departments_list},
      {"departments/get", handle_departments_get},
      {"departments/get_by_name", handle_departments_get_by_name},
      {"departments/search", handle_departments_search},
      {"departments/create", handle_departments_create},
      {"departments/update", handle_departments_update},
      {"departments/delete", handle_departments_delete},
      {"audit/trace", handle_audit_trace},
  };
}

}  // namespace deptcat::server
