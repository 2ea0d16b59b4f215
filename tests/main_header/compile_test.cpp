/// @file tests/main_header/compile_test.cpp
/// @brief Compile test for the main mcpcommons.hpp header
///
/// Including just <mcpcommons.hpp> must be enough to assemble and drive a deployment.

#include "mcpcommons.hpp"

#include <cassert>
#include <iostream>

using namespace mcpcommons;

int main()
{
    std::cout << "=== Main Header Compile Test ===" << std::endl;

    std::cout << "test_framework_types_accessible..." << std::endl;
    {
        using Runner = cli::CommandRunner;
        using Registry = tools::ControllerRegistry;
        using Server = server::StdioServerWrapper;
        (void)sizeof(Runner);
        (void)sizeof(Registry);
        (void)sizeof(Server);
        McpError error(404, "Unknown tool.");
        assert(error.code() == 404);
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_devkit_deployment_through_umbrella..." << std::endl;
    {
        Settings settings;
        settings.log_level = "ERROR";
        auto config = devkit::make_config(settings);
        assert(config.server_name == "Devkit MCP Server");
        assert(config.registry().get_registry().size() == 5);

        auto content = execute_tool("url_encode", Json{{"value", "a b"}}, config);
        assert(content.size() == 1);
        assert(std::get<TextContent>(content[0]).text == "a%20b");
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "\n=== All main header tests passed ===" << std::endl;
    return 0;
}
