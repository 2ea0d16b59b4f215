#include "mcpcommons/choco/controllers.hpp"
#include "mcpcommons/cli/launcher.hpp"

int main(int argc, char** argv)
{
    return mcpcommons::cli::run_server_main(argc, argv, "mcp-server-choco",
                                            [](const mcpcommons::Settings& settings)
                                            { return mcpcommons::choco::make_config(settings); });
}
