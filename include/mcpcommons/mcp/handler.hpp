#pragma once
#include "mcpcommons/config.hpp"
#include "mcpcommons/types.hpp"

#include <functional>

namespace mcpcommons::mcp
{

/// JSON-RPC message in, JSON-RPC response out. A null result means "send nothing"
/// (the message was a notification).
using McpHandler = std::function<mcpcommons::Json(const mcpcommons::Json&)>;

// Factory that produces the JSON-RPC handler of a tool server. Supported methods:
// - "initialize"  (server name/version from the config)
// - "ping"
// - "tools/list"  (descriptors in registry order)
// - "tools/call"  (dispatched through execute_tool)
// Tool failures are answered with {"code", "message"} error objects; the handler itself never
// throws. The config is captured by reference and must outlive the handler.
McpHandler make_mcp_handler(const McpConfig& config);

} // namespace mcpcommons::mcp
