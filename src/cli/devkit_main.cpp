#include "mcpcommons/devkit/controllers.hpp"
#include "mcpcommons/cli/launcher.hpp"

int main(int argc, char** argv)
{
    return mcpcommons::cli::run_server_main(argc, argv, "mcp-server-devkit",
                                            [](const mcpcommons::Settings& settings)
                                            { return mcpcommons::devkit::make_config(settings); });
}
