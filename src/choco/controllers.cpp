#include "mcpcommons/choco/controllers.hpp"

namespace mcpcommons::choco
{

namespace
{
using mcpcommons::Json;
using tools::optional_int;
using tools::optional_string;
using tools::require_string;

const Json kNoArguments = {
    {"type", "object"}, {"required", Json::array()}, {"properties", Json::object()}};

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

// A version of "" means "no specific version"
std::optional<std::string> optional_version(const Json& arguments)
{
    auto version = optional_string(arguments, "version");
    if (version && version->empty())
        return std::nullopt;
    return version;
}

class ChocolateyController : public tools::Controller
{
  public:
    ChocolateyController(std::string name, std::string description, Json input_schema,
                         std::shared_ptr<const ChocolateyService> service, Logger logger)
        : Controller(std::move(name), std::move(description), std::move(input_schema)),
          service_(std::move(service)), logger_(std::move(logger))
    {
    }

  protected:
    std::shared_ptr<const ChocolateyService> service_;
    Logger logger_;
};

class ListInstalledPackagesController : public ChocolateyController
{
  public:
    ListInstalledPackagesController(std::shared_ptr<const ChocolateyService> service, Logger logger)
        : ChocolateyController("list_installed_packages", "Lists all installed Chocolatey packages.",
                               kNoArguments, std::move(service), std::move(logger))
    {
    }

    std::vector<Content> execute(const std::string&, const Json&) const override
    {
        logger_.info("Executing list_installed_packages");
        auto packages = service_->list_installed_packages();
        logger_.debug("Found " + std::to_string(packages.size()) + " installed packages");
        return {make_text(join_lines(packages))};
    }
};

class ListSourcesController : public ChocolateyController
{
  public:
    ListSourcesController(std::shared_ptr<const ChocolateyService> service, Logger logger)
        : ChocolateyController("list_sources", "Lists all Chocolatey sources.", kNoArguments,
                               std::move(service), std::move(logger))
    {
    }

    std::vector<Content> execute(const std::string&, const Json&) const override
    {
        logger_.info("Executing list_sources");
        auto sources = service_->list_sources();
        logger_.debug("Found " + std::to_string(sources.size()) + " sources");
        return {make_text(join_lines(sources))};
    }
};

class InstallPackageController : public ChocolateyController
{
  public:
    InstallPackageController(std::shared_ptr<const ChocolateyService> service, Logger logger)
        : ChocolateyController(
              "install_package", "Installs a Chocolatey package.",
              Json{{"type", "object"},
                   {"required", Json::array({"package_name"})},
                   {"properties",
                    {{"package_name",
                      {{"type", "string"}, {"description", "The name of the package to install."}}},
                     {"version",
                      {{"type", "string"},
                       {"description", "Optional specific version to install"}}}}}},
              std::move(service), std::move(logger))
    {
    }

    std::vector<Content> execute(const std::string&, const Json& arguments) const override
    {
        auto package_name = require_string(arguments, "package_name", "Package name is required.");
        auto version = optional_version(arguments);

        logger_.info("Installing package: " + package_name);
        bool result = service_->install_package(package_name, version);
        std::string version_text = version ? " version " + *version : "";
        std::string status = result ? "installed" : "installation failed.";
        return {make_text(package_name + version_text + " " + status)};
    }
};

class UninstallPackageController : public ChocolateyController
{
  public:
    UninstallPackageController(std::shared_ptr<const ChocolateyService> service, Logger logger)
        : ChocolateyController(
              "uninstall_package", "Uninstalls a Chocolatey package.",
              Json{{"type", "object"},
                   {"required", Json::array({"package_name"})},
                   {"properties",
                    {{"package_name",
                      {{"type", "string"},
                       {"description", "The name of the package to uninstall."}}}}}},
              std::move(service), std::move(logger))
    {
    }

    std::vector<Content> execute(const std::string&, const Json& arguments) const override
    {
        auto package_name = require_string(arguments, "package_name", "Package name is required.");

        logger_.info("Uninstalling package: " + package_name);
        bool result = service_->uninstall_package(package_name);
        return {make_text(result ? package_name + " uninstalled"
                                 : "Failed to uninstall " + package_name + ".")};
    }
};

class ListAvailablePackagesController : public ChocolateyController
{
  public:
    ListAvailablePackagesController(std::shared_ptr<const ChocolateyService> service, Logger logger)
        : ChocolateyController(
              "list_available_packages",
              "Lists available Chocolatey packages filtered by search term.",
              Json{{"type", "object"},
                   {"required", Json::array({"search_term"})},
                   {"properties",
                    {{"search_term",
                      {{"type", "string"}, {"description", "Search term to filter packages"}}}}}},
              std::move(service), std::move(logger))
    {
    }

    std::vector<Content> execute(const std::string&, const Json& arguments) const override
    {
        logger_.info("Executing list_available_packages");
        auto search_term = require_string(arguments, "search_term", "Search term is required.");

        auto packages = service_->list_available_packages(search_term);
        logger_.debug("Found " + std::to_string(packages.size()) + " available packages");
        return {make_text(join_lines(packages))};
    }
};

class UpgradePackageController : public ChocolateyController
{
  public:
    UpgradePackageController(std::shared_ptr<const ChocolateyService> service, Logger logger)
        : ChocolateyController(
              "upgrade_package", "Upgrades a Chocolatey package.",
              Json{{"type", "object"},
                   {"required", Json::array({"package_name"})},
                   {"properties",
                    {{"package_name",
                      {{"type", "string"}, {"description", "The name of the package to upgrade."}}},
                     {"version",
                      {{"type", "string"},
                       {"description", "Optional specific version to upgrade to"}}}}}},
              std::move(service), std::move(logger))
    {
    }

    std::vector<Content> execute(const std::string&, const Json& arguments) const override
    {
        auto package_name = require_string(arguments, "package_name", "Package name is required.");
        auto version = optional_version(arguments);

        logger_.info("Upgrading package: " + package_name);
        bool result = service_->upgrade_package(package_name, version);
        std::string version_text = version ? " version " + *version : "";
        std::string upgrade_text = result ? "upgraded successfully" : "upgrade failed.";
        return {make_text(package_name + version_text + " " + upgrade_text)};
    }
};

class InstallChocolateyController : public ChocolateyController
{
  public:
    InstallChocolateyController(std::shared_ptr<const ChocolateyService> service, Logger logger)
        : ChocolateyController("install_chocolatey",
                               "Installs Chocolatey package manager if it's not already installed.",
                               kNoArguments, std::move(service), std::move(logger))
    {
    }

    std::vector<Content> execute(const std::string&, const Json&) const override
    {
        logger_.info("Executing install_chocolatey");
        bool result = service_->install_chocolatey();
        return {make_text(result ? "Chocolatey installed successfully"
                                 : "Failed to install Chocolatey")};
    }
};

class AddSourceController : public ChocolateyController
{
  public:
    AddSourceController(std::shared_ptr<const ChocolateyService> service, Logger logger)
        : ChocolateyController(
              "add_source", "Adds a new Chocolatey source repository.",
              Json{{"type", "object"},
                   {"required", Json::array({"source_name", "source_url"})},
                   {"properties",
                    {{"source_name",
                      {{"type", "string"}, {"description", "The name of the source to add."}}},
                     {"source_url",
                      {{"type", "string"}, {"description", "URL of the package source."}}},
                     {"username",
                      {{"type", "string"},
                       {"description", "Optional username for authenticated sources."}}},
                     {"password",
                      {{"type", "string"},
                       {"description", "Optional password for authenticated sources."}}},
                     {"priority",
                      {{"type", "integer"},
                       {"description", "Optional priority for the source."}}}}}},
              std::move(service), std::move(logger))
    {
    }

    std::vector<Content> execute(const std::string&, const Json& arguments) const override
    {
        auto source_name = require_string(arguments, "source_name", "Source name is required.");
        auto source_url = require_string(arguments, "source_url", "Source URL is required.");
        auto username = optional_string(arguments, "username");
        auto password = optional_string(arguments, "password");
        auto priority = optional_int(arguments, "priority");

        logger_.info("Adding source: " + source_name + " with URL: " + source_url);
        bool result = service_->add_source(source_name, source_url, username, password, priority);
        return {make_text(result ? "Source '" + source_name + "' added successfully"
                                 : "Failed to add source '" + source_name + "'")};
    }
};

class RemoveSourceController : public ChocolateyController
{
  public:
    RemoveSourceController(std::shared_ptr<const ChocolateyService> service, Logger logger)
        : ChocolateyController(
              "remove_source", "Removes a Chocolatey source repository.",
              Json{{"type", "object"},
                   {"required", Json::array({"source_name"})},
                   {"properties",
                    {{"source_name",
                      {{"type", "string"}, {"description", "The name of the source to remove."}}}}}},
              std::move(service), std::move(logger))
    {
    }

    std::vector<Content> execute(const std::string&, const Json& arguments) const override
    {
        auto source_name = require_string(arguments, "source_name", "Source name is required.");

        logger_.info("Removing source: " + source_name);
        bool result = service_->remove_source(source_name);
        return {make_text(result ? "Source '" + source_name + "' removed successfully"
                                 : "Failed to remove source '" + source_name + "'")};
    }
};
} // namespace

ChocolateyControllerRegistry::ChocolateyControllerRegistry(
    std::shared_ptr<const ChocolateyService> service, Logger logger)
{
    auto log = logger.child("mcpcommons.choco.controller");
    controllers_.push_back(std::make_unique<ListInstalledPackagesController>(service, log));
    controllers_.push_back(std::make_unique<ListSourcesController>(service, log));
    controllers_.push_back(std::make_unique<InstallPackageController>(service, log));
    controllers_.push_back(std::make_unique<UninstallPackageController>(service, log));
    controllers_.push_back(std::make_unique<ListAvailablePackagesController>(service, log));
    controllers_.push_back(std::make_unique<UpgradePackageController>(service, log));
    controllers_.push_back(std::make_unique<InstallChocolateyController>(service, log));
    controllers_.push_back(std::make_unique<AddSourceController>(service, log));
    controllers_.push_back(std::make_unique<RemoveSourceController>(service, log));
}

std::vector<Content> ChocolateyControllerRegistry::error_handler(
    std::exception_ptr error, const tools::Controller& controller, const std::string& tool_name,
    const mcpcommons::Json& arguments) const
{
    try
    {
        std::rethrow_exception(error);
    }
    catch (const ChocolateyNotInstalledError&)
    {
        // install_chocolatey is the one tool that works without Chocolatey; retry it
        if (tool_name == "install_chocolatey")
            return controller.execute(tool_name, arguments);
        return {make_text("Chocolatey is not installed. Please run the 'install_chocolatey' "
                          "command first.")};
    }
}

McpConfig make_config(const Settings& settings, std::shared_ptr<const cli::CommandRunner> runner)
{
    if (!runner)
        runner = std::make_shared<cli::ProcessCommandRunner>();

    McpConfig config;
    config.server_name = "Chocolatey MCP Server";
    config.logger = Logger("mcp_server_choco", settings.level());
    auto service = std::make_shared<ChocolateyService>(
        std::move(runner), config.logger.child("mcpcommons.choco.service"));
    config.controller_registry =
        std::make_unique<ChocolateyControllerRegistry>(std::move(service), config.logger);
    return config;
}

} // namespace mcpcommons::choco
