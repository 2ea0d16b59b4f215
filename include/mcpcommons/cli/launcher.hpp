#pragma once
#include "mcpcommons/config.hpp"
#include "mcpcommons/settings.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace mcpcommons::cli
{

/// Command line shared by the server executables.
struct LaunchOptions
{
    bool show_help = false;
    bool show_version = false;
    std::optional<std::string> log_level;
    std::optional<std::string> config_path;
};

/// Parses `--help`/`-h`, `--version`, `--log-level <LEVEL>` and `--config <file>`.
/// @throws ValidationError on an unknown argument or a flag missing its value
LaunchOptions parse_launch_options(std::vector<std::string> args);

/// Environment first, then the settings file (which replaces it), then --log-level.
Settings resolve_settings(const LaunchOptions& options);

using ConfigFactory = std::function<McpConfig(const Settings&)>;

/// Entry point of a server executable: parse the command line, build the config and serve
/// stdio until EOF. Returns the process exit code (0 clean shutdown, 1 transport failure or
/// start-up error, 2 bad command line).
int run_server_main(int argc, char** argv, const std::string& program,
                    const ConfigFactory& make_config);

} // namespace mcpcommons::cli
