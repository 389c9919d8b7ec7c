#include "jsonrpc.h"

namespace deptcat::server {

namespace {

nlohmann::json id_or_null(const std::optional<nlohmann::json>& id) {
  return id.has_value() ? id.value() : nlohmann::json(nullptr);
}

}  // namespace

std::optional<JsonRpcRequest> parse_request(const std::string& json_str) {
  try {
    auto json = nlohmann::json::parse(json_str);
    if (!json.is_object()) {
      return std::nullopt;
    }

    JsonRpcRequest request;
    request.jsonrpc = json.value("jsonrpc", "2.0");

    if (json.contains("id") && (json["id"].is_string() || json["id"].is_number())) {
      request.id = json["id"];
    }

    request.method = json.value("method", "");
    request.params = json.value("params", nlohmann::json::object());

    return request;
  } catch (const nlohmann::json::exception&) {
    return std::nullopt;
  }
}

std::string make_response(const std::optional<nlohmann::json>& id, const nlohmann::json& result) {
  nlohmann::json response;
  response["jsonrpc"] = "2.0";
  response["id"] = id_or_null(id);
  response["result"] = result;
  return response.dump();
}

std::string make_error_response(const std::optional<nlohmann::json>& id, int code,
                                const std::string& message, const nlohmann::json& data) {
  nlohmann::json response;
  response["jsonrpc"] = "2.0";
  response["id"] = id_or_null(id);
  response["error"] = {
      {"code", code},
      {"message", message},
      {"data", data},
  };
  return response.dump();
}

}  // namespace deptcat::server
