#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <stdexcept>
#include <string>

namespace deptcat::server {

// JSON-RPC 2.0 message types
struct JsonRpcRequest {
  std::string jsonrpc{"2.0"};     // NOLINT(readability-identifier-naming)
  // String or number; echoed back unchanged.
  std::optional<nlohmann::json> id;  // NOLINT(readability-identifier-naming)
  std::string method;                // NOLINT(readability-identifier-naming)
  nlohmann::json params;             // NOLINT(readability-identifier-naming)
};

// Error codes (JSON-RPC 2.0)
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

// InvalidParams is thrown by method handlers when params are missing or mistyped.
class InvalidParams : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

// Parse JSON-RPC request from string; nullopt on malformed JSON or a non-object message.
std::optional<JsonRpcRequest> parse_request(const std::string& json_str);

// Create JSON-RPC success response
std::string make_response(const std::optional<nlohmann::json>& id, const nlohmann::json& result);

// Create JSON-RPC error response
std::string make_error_response(const std::optional<nlohmann::json>& id, int code,
                                const std::string& message,
                                const nlohmann::json& data = nlohmann::json::object());

}  // namespace deptcat::server
