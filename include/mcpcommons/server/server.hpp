#pragma once
#include "mcpcommons/config.hpp"

#include <iosfwd>

namespace mcpcommons::server
{

/// Serve the configured tools over stdin/stdout until EOF.
///
/// Logs the start-up banner, builds the JSON-RPC handler and runs a StdioServerWrapper to
/// completion. Returns false when the loop ended because of a transport failure.
bool run_stdio_server(const McpConfig& config);

/// Same as run_stdio_server(config) over caller-supplied streams.
bool run_stdio_server(const McpConfig& config, std::istream& in, std::ostream& out);

} // namespace mcpcommons::server
