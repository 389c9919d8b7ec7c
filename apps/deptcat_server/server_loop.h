#pragma once

#include "server_context.h"
#include <iosfwd>
#include <string>

namespace deptcat::server {

// handle_line answers one JSON-RPC request line. Returns "" for a blank line.
[[nodiscard]] std::string handle_line(const std::string& line, ServerContext& ctx);

// run_server_loop reads one request per line from in and writes one response per line to out
// until in is exhausted.
void run_server_loop(ServerContext& ctx, std::istream& in, std::ostream& out);

}  // namespace deptcat::server
