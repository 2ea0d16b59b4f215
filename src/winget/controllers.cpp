#include "mcpcommons/winget/controllers.hpp"

namespace mcpcommons::winget
{

namespace
{
using mcpcommons::Json;
using tools::FunctionController;
using tools::optional_string;
using tools::require_string;

Json string_property(const std::string& description)
{
    return Json{{"type", "string"}, {"description", description}};
}

Json object_schema(Json properties, std::vector<std::string> required)
{
    return Json{{"type", "object"}, {"required", required}, {"properties", std::move(properties)}};
}

std::string join_lines(const std::vector<std::string>& lines)
{
    std::string text;
    for (size_t i = 0; i < lines.size(); ++i)
    {
        if (i > 0)
            text += "\n";
        text += lines[i];
    }
    return text;
}

std::optional<std::string> non_empty(std::optional<std::string> value)
{
    if (value && value->empty())
        return std::nullopt;
    return value;
}
} // namespace

WingetControllerRegistry::WingetControllerRegistry(std::shared_ptr<const WingetService> service,
                                                   Logger logger)
{
    auto log = logger.child("mcpcommons.winget.controller");

    controllers_.push_back(std::make_unique<FunctionController>(
        "wg_list_installed_packages", "Lists all installed Winget packages.",
        object_schema(Json::object(), {}),
        [service, log](const Json&) -> std::vector<Content>
        {
            log.info("Executing wg_list_installed_packages");
            auto packages = service->list_installed_packages();
            log.debug("Found " + std::to_string(packages.size()) + " installed packages");
            return {make_text(join_lines(packages))};
        }));

    controllers_.push_back(std::make_unique<FunctionController>(
        "wg_list_sources", "Lists all Winget sources.", object_schema(Json::object(), {}),
        [service, log](const Json&) -> std::vector<Content>
        {
            log.info("Executing wg_list_sources");
            auto sources = service->list_sources();
            log.debug("Found " + std::to_string(sources.size()) + " sources");
            return {make_text(join_lines(sources))};
        }));

    controllers_.push_back(std::make_unique<FunctionController>(
        "wg_install_package", "Installs a Winget package.",
        object_schema({{"package_name", string_property("The name of the package to install.")},
                       {"version", string_property("Optional specific version to install")}},
                      {"package_name"}),
        [service, log](const Json& arguments) -> std::vector<Content>
        {
            auto package_name =
                require_string(arguments, "package_name", "Package name is required.");
            auto version = non_empty(optional_string(arguments, "version"));

            log.info("Installing package: " + package_name);
            bool result = service->install_package(package_name, version);
            std::string version_text = version ? " version " + *version : "";
            return {make_text(package_name + version_text + " " +
                              (result ? "installed" : "installation failed."))};
        }));

    controllers_.push_back(std::make_unique<FunctionController>(
        "wg_uninstall_package", "Uninstalls a Winget package.",
        object_schema({{"package_name", string_property("The name of the package to uninstall.")}},
                      {"package_name"}),
        [service, log](const Json& arguments) -> std::vector<Content>
        {
            auto package_name =
                require_string(arguments, "package_name", "Package name is required.");

            log.info("Uninstalling package: " + package_name);
            bool result = service->uninstall_package(package_name);
            return {make_text(result ? package_name + " uninstalled"
                                     : "Failed to uninstall " + package_name + ".")};
        }));

    controllers_.push_back(std::make_unique<FunctionController>(
        "wg_list_available_packages", "Lists available Winget packages filtered by search term.",
        object_schema({{"search_term", string_property("Search term to filter packages")}},
                      {"search_term"}),
        [service, log](const Json& arguments) -> std::vector<Content>
        {
            log.info("Executing wg_list_available_packages");
            auto search_term = require_string(arguments, "search_term", "Search term is required.");

            auto packages = service->list_available_packages(search_term);
            log.debug("Found " + std::to_string(packages.size()) + " available packages");
            return {make_text(join_lines(packages))};
        }));

    controllers_.push_back(std::make_unique<FunctionController>(
        "wg_upgrade_package", "Upgrades a Winget package.",
        object_schema({{"package_name", string_property("The name of the package to upgrade.")},
                       {"version", string_property("Optional specific version to upgrade to")}},
                      {"package_name"}),
        [service, log](const Json& arguments) -> std::vector<Content>
        {
            auto package_name =
                require_string(arguments, "package_name", "Package name is required.");
            auto version = non_empty(optional_string(arguments, "version"));

            log.info("Upgrading package: " + package_name +
                     (version ? " to version " + *version : std::string()));
            bool result = service->upgrade_package(package_name, version);
            std::string version_text = version ? " version " + *version : "";
            return {make_text(package_name + version_text + " " +
                              (result ? "upgraded successfully" : "upgrade failed."))};
        }));

    controllers_.push_back(std::make_unique<FunctionController>(
        "wg_add_source", "Adds a new Winget source repository.",
        object_schema({{"source_name", string_property("The name of the source to add.")},
                       {"source_url", string_property("URL of the package source.")},
                       {"type", string_property("The type of the package source (optional).")}},
                      {"source_name", "source_url"}),
        [service, log](const Json& arguments) -> std::vector<Content>
        {
            auto source_name = require_string(arguments, "source_name", "Source name is required.");
            auto source_url = require_string(arguments, "source_url", "Source URL is required.");
            auto source_type = non_empty(optional_string(arguments, "type"));

            log.info("Adding source: " + source_name + " with URL: " + source_url);
            bool result = service->add_source(source_name, source_url, source_type);
            return {make_text(result ? "Source '" + source_name + "' added successfully"
                                     : "Failed to add source '" + source_name + "'")};
        }));

    controllers_.push_back(std::make_unique<FunctionController>(
        "wg_remove_source", "Removes a Winget source repository.",
        object_schema({{"source_name", string_property("The name of the source to remove.")}},
                      {"source_name"}),
        [service, log](const Json& arguments) -> std::vector<Content>
        {
            auto source_name = require_string(arguments, "source_name", "Source name is required.");

            log.info("Removing source: " + source_name);
            bool result = service->remove_source(source_name);
            return {make_text(result ? "Source '" + source_name + "' removed successfully"
                                     : "Failed to remove source '" + source_name + "'")};
        }));
}

std::vector<Content> WingetControllerRegistry::error_handler(std::exception_ptr error,
                                                             const tools::Controller&,
                                                             const std::string&,
                                                             const mcpcommons::Json&) const
{
    try
    {
        std::rethrow_exception(error);
    }
    catch (const WingetNotInstalledError&)
    {
        return {make_text(
            "Winget is not installed. Please run the 'install_winget' command first.")};
    }
}

McpConfig make_config(const Settings& settings, std::shared_ptr<const cli::CommandRunner> runner)
{
    if (!runner)
        runner = std::make_shared<cli::ProcessCommandRunner>();

    McpConfig config;
    config.server_name = "Winget MCP Server";
    config.logger = Logger("mcp_server_winget", settings.level());
    auto service = std::make_shared<WingetService>(
        std::move(runner), config.logger.child("mcpcommons.winget.service"));
    config.controller_registry =
        std::make_unique<WingetControllerRegistry>(std::move(service), config.logger);
    return config;
}

} // namespace mcpcommons::winget
