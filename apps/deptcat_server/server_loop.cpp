#include "server_loop.h"

#include <nlohmann/json.hpp>

#include "jsonrpc.h"
#include "method_handlers.h"
#include <iostream>
#include <string>

namespace deptcat::server {

using json = nlohmann::json;

std::string handle_line(const std::string& line, ServerContext& ctx) {
  static const auto method_registry = build_method_registry();

  if (line.empty()) {
    return "";
  }

  auto request_opt = parse_request(line);
  if (!request_opt.has_value()) {
    return make_error_response(std::nullopt, kParseError, "Invalid JSON");
  }

  const auto& request = request_opt.value();
  std::cerr << "Received: " << request.method << "\n";

  if (request.method.empty()) {
    return make_error_response(request.id, kInvalidRequest, "Missing method");
  }

  auto it = method_registry.find(request.method);
  if (it == method_registry.end()) {
    return make_error_response(request.id, kMethodNotFound, "Unknown method: " + request.method);
  }

  try {
    const json result = it->second(request, ctx);
    return make_response(request.id, result);
  } catch (const InvalidParams& e) {
    return make_error_response(request.id, kInvalidParams, e.what());
  } catch (const std::exception& e) {
    std::cerr << "Handler " << request.method << " failed: " << e.what() << "\n";
    return make_error_response(request.id, kInternalError, "Internal error");
  }
}

void run_server_loop(ServerContext& ctx, std::istream& in, std::ostream& out) {
  std::string line;
  while (std::getline(in, line)) {
    const std::string response = handle_line(line, ctx);
    if (!response.empty()) {
      out << response << "\n" << std::flush;
    }
  }

  std::cerr << "Department server shutting down\n";
}

}  // namespace deptcat::server
