#include "mcpcommons/server/server.hpp"

#include "mcpcommons/mcp/handler.hpp"
#include "mcpcommons/server/stdio_server.hpp"

#include <iostream>

namespace mcpcommons::server
{

bool run_stdio_server(const McpConfig& config)
{
    return run_stdio_server(config, std::cin, std::cout);
}

bool run_stdio_server(const McpConfig& config, std::istream& in, std::ostream& out)
{
    const Logger logger = config.logger.child("mcpcommons.server");
    logger.info("Starting " + config.server_name + " v" +
                config.server_version.value_or(mcpcommons::version()) + " (MCP Commons v" +
                mcpcommons::version() + ")");

    StdioServerWrapper server(mcp::make_mcp_handler(config), in, out,
                              config.logger.child("mcpcommons.stdio"));
    logger.info("Server initialized, starting main loop");
    return server.run();
}

} // namespace mcpcommons::server
