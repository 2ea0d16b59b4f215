#include "mcpcommons/cli/launcher.hpp"

#include "mcpcommons/exceptions.hpp"

#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

static void set_env(const char* name, const char* value)
{
#ifdef _WIN32
    _putenv_s(name, value);
#else
    setenv(name, value, 1);
#endif
}

template <typename Fn>
static bool rejects(Fn fn)
{
    try
    {
        fn();
    }
    catch (const mcpcommons::ValidationError&)
    {
        return true;
    }
    return false;
}

int main()
{
    using namespace mcpcommons;
    using cli::parse_launch_options;

    // Flags
    auto none = parse_launch_options({});
    assert(!none.show_help && !none.show_version);
    assert(!none.log_level && !none.config_path);

    auto all = parse_launch_options({"--log-level", "debug", "--config", "s.json", "--version"});
    assert(*all.log_level == "debug");
    assert(*all.config_path == "s.json");
    assert(all.show_version);
    assert(parse_launch_options({"-h"}).show_help);
    assert(parse_launch_options({"--help"}).show_help);

    assert(rejects([] { parse_launch_options({"--log-level"}); }));
    assert(rejects([] { parse_launch_options({"--config"}); }));
    assert(rejects([] { parse_launch_options({"--port", "80"}); }));
    assert(rejects([] { parse_launch_options({"serve"}); }));

    // Environment, then file, then flag
    set_env("MCPCOMMONS_LOG_LEVEL", "error");
    assert(cli::resolve_settings(none).level() == LogLevel::Error);

    const std::string path = "mcpcommons_launcher_test.json";
    {
        std::ofstream out(path);
        out << R"({"log_level": "warning"})";
    }
    cli::LaunchOptions with_file;
    with_file.config_path = path;
    assert(cli::resolve_settings(with_file).level() == LogLevel::Warning);

    with_file.log_level = "debug";
    assert(cli::resolve_settings(with_file).level() == LogLevel::Debug);
    std::remove(path.c_str());

    // Entry point: help, version and bad arguments never start a server
    int factory_calls = 0;
    cli::ConfigFactory factory = [&factory_calls](const Settings&)
    {
        ++factory_calls;
        return McpConfig{};
    };
    {
        char prog[] = "mcp-server-test";
        char help[] = "--help";
        char* argv[] = {prog, help, nullptr};
        assert(cli::run_server_main(2, argv, "mcp-server-test", factory) == 0);
    }
    {
        char prog[] = "mcp-server-test";
        char version[] = "--version";
        char* argv[] = {prog, version, nullptr};
        assert(cli::run_server_main(2, argv, "mcp-server-test", factory) == 0);
    }
    {
        char prog[] = "mcp-server-test";
        char bogus[] = "--bogus";
        char* argv[] = {prog, bogus, nullptr};
        assert(cli::run_server_main(2, argv, "mcp-server-test", factory) == 2);
    }
    {
        char prog[] = "mcp-server-test";
        char config[] = "--config";
        char missing[] = "does/not/exist.json";
        char* argv[] = {prog, config, missing, nullptr};
        assert(cli::run_server_main(3, argv, "mcp-server-test", factory) == 1);
    }
    assert(factory_calls == 0);

    return 0;
}
