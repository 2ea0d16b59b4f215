#pragma once
#include "mcpcommons/config.hpp"
#include "mcpcommons/content.hpp"

#include <string>
#include <vector>

namespace mcpcommons
{

/// Runs the tool `name` against the configured registry.
///
/// The first controller whose can_execute(name) is true handles the call. A CommonsError
/// thrown by that controller is offered to the registry's error_handler, whose result becomes
/// the answer; if the handler lets the error escape it propagates from here unchanged.
///
/// @throws McpError code 404 "Unknown tool." when no controller accepts the name
/// @throws McpError code 500 carrying what() for any other failure of the controller
std::vector<Content> execute_tool(const std::string& name, const Json& arguments,
                                  const McpConfig& config);

} // namespace mcpcommons
