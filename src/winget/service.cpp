#include "mcpcommons/winget/service.hpp"

namespace mcpcommons::winget
{

namespace
{
constexpr const char* kWinget = "winget";
constexpr const char* kPowerShell = "powershell.exe";
constexpr const char* kDefaultSourceType = "Microsoft.Rest";

// Table decoration and progress output. "\xC3\xA2" is the box-drawing lead byte after a
// cp1252 round trip; "\xE2" is the lead byte of the box-drawing characters themselves.
bool is_decoration(const std::string& line)
{
    if (line.empty())
        return true;
    const char first = line.front();
    if (first == '|' || first == '/' || first == '\\' || first == ' ')
        return true;
    if (line.rfind("\xC3\xA2", 0) == 0)
        return true;
    return static_cast<unsigned char>(first) == 0xE2;
}

void require_name(const std::string& value, const char* what, const Logger& logger)
{
    if (cli::trim(value).empty())
    {
        logger.error(std::string(what) + " cannot be empty");
        throw WingetCommandError(std::string(what) + " cannot be empty");
    }
}
} // namespace

WingetService::WingetService(std::shared_ptr<const cli::CommandRunner> runner, Logger logger)
    : runner_(std::move(runner)), logger_(std::move(logger))
{
}

void WingetService::validate_winget_command() const
{
    if (!runner_->which(kWinget))
    {
        logger_.error("Winget command is not available in PATH");
        throw WingetNotInstalledError("Winget is not installed or not available in PATH");
    }
}

std::string WingetService::run_winget_command(const std::vector<std::string>& args) const
{
    validate_winget_command();

    if (args.empty())
    {
        logger_.error("No command arguments provided");
        throw WingetCommandError("No command arguments provided");
    }

    try
    {
        logger_.debug("Running Winget command: " + cli::format_command(kWinget, args));
        auto output = cli::run_command(*runner_, kWinget, args);
        logger_.debug("Command completed successfully. Output: " + output);
        return output;
    }
    catch (const cli::CommandNotFoundError& e)
    {
        logger_.error(std::string("Failed to start Winget: ") + e.what());
        throw WingetNotInstalledError("Winget is not installed or not available in PATH");
    }
    catch (const cli::CommandFailedError& e)
    {
        logger_.error(std::string("Failed to run Winget command: ") + e.what());
        throw WingetCommandError(std::string("Failed to run Winget command: ") + e.what());
    }
}

std::string WingetService::run_elevated_winget_command(const std::vector<std::string>& args) const
{
    validate_winget_command();

    if (args.empty())
    {
        logger_.error("No command arguments provided");
        throw WingetCommandError("No command arguments provided");
    }

    logger_.debug("Running elevated Winget command: " + cli::format_command(kWinget, args));

    // Arguments with spaces are wrapped in escaped quotes inside the -ArgumentList string
    std::string winget_args;
    for (const auto& arg : args)
    {
        if (!winget_args.empty())
            winget_args += " ";
        const std::string escaped = cli::powershell_escape(arg);
        winget_args += arg.find(' ') != std::string::npos ? "`\"" + escaped + "`\"" : escaped;
    }
    const std::string script =
        "Start-Process winget -ArgumentList \"" + winget_args + "\" -Verb runas -Wait";

    cli::CommandResult result;
    try
    {
        result =
            runner_->run(kPowerShell, {"-NoProfile", "-NonInteractive", "-Command", script});
    }
    catch (const cli::CommandNotFoundError& e)
    {
        logger_.error(std::string("Failed to run elevated Winget command: ") + e.what());
        throw WingetCommandError(std::string("Failed to run elevated Winget command: ") +
                                 e.what());
    }

    if (result.exit_code != 0)
    {
        std::string error = cli::trim(result.error_output);
        if (error.empty())
            error = "Command '" + cli::format_command(kPowerShell, {"-Command", script}) +
                    "' returned non-zero exit status " + std::to_string(result.exit_code) + ".";
        logger_.error("Failed to run elevated Winget command: " + error);
        throw WingetCommandError("Failed to run elevated Winget command: " + error);
    }

    logger_.debug("Elevated command completed successfully");
    return "Command completed successfully";
}

std::vector<std::string> WingetService::list_installed_packages() const
{
    try
    {
        logger_.info("Retrieving list of installed packages");
        auto output = run_winget_command({"list"});
        if (output.empty())
        {
            logger_.debug("No packages found");
            return {};
        }

        std::vector<std::string> packages;
        for (const auto& line : cli::split_lines(output))
        {
            const std::string pkg = cli::trim(line);
            if (!is_decoration(pkg))
                packages.push_back(pkg);
        }

        logger_.debug("Found " + std::to_string(packages.size()) + " packages");
        return packages;
    }
    catch (const WingetNotInstalledError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        logger_.error(std::string("Failed to list Winget packages: ") + e.what());
        throw WingetCommandError(std::string("Failed to list Winget packages: ") + e.what());
    }
}

std::vector<std::string> WingetService::list_sources() const
{
    try
    {
        logger_.info("Retrieving list of Winget sources");
        auto output = run_winget_command({"source", "list"});
        if (output.empty())
        {
            logger_.debug("No sources found");
            return {};
        }

        std::vector<std::string> sources;
        for (const auto& line : cli::split_lines(output))
        {
            std::string source = cli::trim(line);
            if (!source.empty())
                sources.push_back(std::move(source));
        }

        logger_.debug("Found " + std::to_string(sources.size()) + " sources");
        return sources;
    }
    catch (const WingetNotInstalledError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        logger_.error(std::string("Failed to list Winget sources: ") + e.what());
        throw WingetCommandError(std::string("Failed to list Winget sources: ") + e.what());
    }
}

std::vector<std::string> WingetService::list_available_packages(const std::string& search_term) const
{
    try
    {
        logger_.info("Searching for available packages with term: " + search_term);
        std::vector<std::string> args = {"search"};
        if (!search_term.empty())
            args.push_back(search_term);

        auto output = run_winget_command(args);
        if (output.empty())
        {
            logger_.debug("No packages found");
            return {};
        }

        std::vector<std::string> packages;
        for (const auto& line : cli::split_lines(output))
        {
            const std::string pkg = cli::trim(line);
            if (is_decoration(pkg) || pkg.rfind("No package found matching", 0) == 0)
                continue;
            packages.push_back(pkg);
        }

        logger_.debug("Found " + std::to_string(packages.size()) + " available packages");
        return packages;
    }
    catch (const WingetNotInstalledError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        logger_.error(std::string("Failed to list available Winget packages: ") + e.what());
        throw WingetCommandError(std::string("Failed to list available Winget packages: ") +
                                 e.what());
    }
}

bool WingetService::install_package(const std::string& package_name,
                                    const std::optional<std::string>& version) const
{
    require_name(package_name, "Package name", logger_);

    try
    {
        logger_.info("Installing package: " + package_name +
                     (version ? " version " + *version : std::string()));
        std::vector<std::string> args = {"install", package_name};
        if (version)
        {
            args.push_back("--version");
            args.push_back(*version);
        }
        run_winget_command(args);
        logger_.info("Package " + package_name + " installed successfully");
        return true;
    }
    catch (const WingetNotInstalledError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        logger_.error("Failed to install package " + package_name + ": " + e.what());
        throw WingetCommandError("Failed to install package " + package_name + ": " + e.what());
    }
}

bool WingetService::uninstall_package(const std::string& package_name) const
{
    require_name(package_name, "Package name", logger_);

    try
    {
        logger_.info("Uninstalling package: " + package_name);
        run_winget_command({"uninstall", package_name});
        logger_.info("Package " + package_name + " uninstalled successfully");
        return true;
    }
    catch (const WingetNotInstalledError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        logger_.error("Failed to uninstall package " + package_name + ": " + e.what());
        throw WingetCommandError("Failed to uninstall package " + package_name + ": " +
                                 e.what());
    }
}

bool WingetService::upgrade_package(const std::string& package_name,
                                    const std::optional<std::string>& version) const
{
    require_name(package_name, "Package name", logger_);

    try
    {
        logger_.info("Upgrading package: " + package_name +
                     (version ? " to version " + *version : std::string()));
        std::vector<std::string> args = {"upgrade", package_name};
        if (version)
        {
            args.push_back("--version");
            args.push_back(*version);
        }
        run_winget_command(args);
        logger_.info("Package " + package_name + " upgraded successfully");
        return true;
    }
    catch (const WingetNotInstalledError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        logger_.error("Failed to upgrade package " + package_name + ": " + e.what());
        throw WingetCommandError("Failed to upgrade package " + package_name + ": " + e.what());
    }
}

bool WingetService::add_source(const std::string& source_name, const std::string& source_url,
                               const std::optional<std::string>& source_type) const
{
    require_name(source_name, "Source name", logger_);
    require_name(source_url, "Source URL", logger_);

    try
    {
        const std::string type = source_type.value_or(kDefaultSourceType);
        logger_.info("Adding source: " + source_name + " with URL: " + source_url +
                     " and type: " + type);
        run_elevated_winget_command(
            {"source", "add", "--name", source_name, "--arg", source_url, "--type", type});
        logger_.info("Source " + source_name + " added successfully");
        return true;
    }
    catch (const WingetNotInstalledError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        logger_.error("Failed to add source " + source_name + ": " + e.what());
        throw WingetCommandError("Failed to add source " + source_name + ": " + e.what());
    }
}

bool WingetService::remove_source(const std::string& source_name) const
{
    require_name(source_name, "Source name", logger_);

    try
    {
        logger_.info("Removing source: " + source_name);
        run_elevated_winget_command({"source", "remove", "--name", source_name});
        logger_.info("Source " + source_name + " removed successfully");
        return true;
    }
    catch (const WingetNotInstalledError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        logger_.error("Failed to remove source " + source_name + ": " + e.what());
        throw WingetCommandError("Failed to remove source " + source_name + ": " + e.what());
    }
}

} // namespace mcpcommons::winget
