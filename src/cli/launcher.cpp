#include "mcpcommons/cli/launcher.hpp"

#include "mcpcommons/exceptions.hpp"
#include "mcpcommons/server/server.hpp"

#include <iostream>

namespace mcpcommons::cli
{

namespace
{
int usage(const std::string& program, std::ostream& os, int exit_code)
{
    os << program << " " << mcpcommons::version() << "\n";
    os << "Usage:\n";
    os << "  " << program << " [--log-level <LEVEL>] [--config <file>]\n";
    os << "  " << program << " --version\n";
    os << "  " << program << " --help\n";
    os << "\n";
    os << "Options:\n";
    os << "  --log-level <LEVEL>   DEBUG, INFO, WARNING or ERROR (overrides MCPCOMMONS_LOG_LEVEL)\n";
    os << "  --config <file>       JSON settings file, e.g. {\"log_level\": \"DEBUG\"}\n";
    os << "\n";
    os << "Speaks MCP JSON-RPC over stdin/stdout; logs go to stderr.\n";
    return exit_code;
}
} // namespace

LaunchOptions parse_launch_options(std::vector<std::string> args)
{
    LaunchOptions options;
    for (size_t i = 0; i < args.size(); ++i)
    {
        const std::string& arg = args[i];
        if (arg == "--help" || arg == "-h")
        {
            options.show_help = true;
        }
        else if (arg == "--version")
        {
            options.show_version = true;
        }
        else if (arg == "--log-level" || arg == "--config")
        {
            if (i + 1 >= args.size())
                throw ValidationError("Missing value for " + arg);
            if (arg == "--log-level")
                options.log_level = args[++i];
            else
                options.config_path = args[++i];
        }
        else
        {
            throw ValidationError("Unknown argument: " + arg);
        }
    }
    return options;
}

Settings resolve_settings(const LaunchOptions& options)
{
    Settings settings = Settings::from_env();
    if (options.config_path)
        settings = Settings::from_file(*options.config_path);
    if (options.log_level)
        settings.log_level = *options.log_level;
    return settings;
}

int run_server_main(int argc, char** argv, const std::string& program,
                    const ConfigFactory& make_config)
{
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
        args.emplace_back(argv[i]);

    LaunchOptions options;
    try
    {
        options = parse_launch_options(std::move(args));
    }
    catch (const ValidationError& e)
    {
        std::cerr << program << ": " << e.what() << "\n";
        return usage(program, std::cerr, 2);
    }

    if (options.show_help)
        return usage(program, std::cout, 0);
    if (options.show_version)
    {
        std::cout << program << " " << mcpcommons::version() << "\n";
        return 0;
    }

    try
    {
        McpConfig config = make_config(resolve_settings(options));
        return server::run_stdio_server(config) ? 0 : 1;
    }
    catch (const std::exception& e)
    {
        std::cerr << program << ": " << e.what() << "\n";
        return 1;
    }
}

} // namespace mcpcommons::cli
