#include "mcpcommons/winget/controllers.hpp"
#include "mcpcommons/cli/launcher.hpp"

int main(int argc, char** argv)
{
    return mcpcommons::cli::run_server_main(argc, argv, "mcp-server-winget",
                                            [](const mcpcommons::Settings& settings)
                                            { return mcpcommons::winget::make_config(settings); });
}
