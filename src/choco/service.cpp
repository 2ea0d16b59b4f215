#include "mcpcommons/choco/service.hpp"

#include <regex>

namespace mcpcommons::choco
{

namespace
{
constexpr const char* kChoco = "choco";
constexpr const char* kPowerShell = "powershell.exe";
constexpr int kTls12Protocol = 3072;

void require_name(const std::string& value, const char* what, const Logger& logger)
{
    if (cli::trim(value).empty())
    {
        logger.error(std::string(what) + " cannot be empty");
        throw ChocolateyCommandError(std::string(what) + " cannot be empty");
    }
}

std::vector<std::string> split(const std::string& text, char delimiter)
{
    std::vector<std::string> parts;
    size_t start = 0;
    size_t end;
    while ((end = text.find(delimiter, start)) != std::string::npos)
    {
        parts.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    parts.push_back(text.substr(start));
    return parts;
}
} // namespace

ChocolateyService::ChocolateyService(std::shared_ptr<const cli::CommandRunner> runner,
                                     Logger logger)
    : runner_(std::move(runner)), logger_(std::move(logger))
{
}

void ChocolateyService::validate_choco_command() const
{
    if (!runner_->which(kChoco))
    {
        logger_.error("Chocolatey (choco) command is not available in PATH");
        throw ChocolateyNotInstalledError("Chocolatey is not installed or not available in PATH");
    }
}

std::string ChocolateyService::run_choco_command(const std::vector<std::string>& args) const
{
    validate_choco_command();

    if (args.empty())
    {
        logger_.error("No command arguments provided");
        throw ChocolateyCommandError("No command arguments provided");
    }

    try
    {
        logger_.debug("Running Chocolatey command: " + cli::format_command(kChoco, args));
        auto output = cli::run_command(*runner_, kChoco, args);
        logger_.debug("Command completed successfully. Output: " + output);
        return output;
    }
    catch (const cli::CommandNotFoundError& e)
    {
        logger_.error(std::string("Failed to start Chocolatey: ") + e.what());
        throw ChocolateyNotInstalledError("Chocolatey is not installed or not available in PATH");
    }
    catch (const cli::CommandFailedError& e)
    {
        logger_.error(std::string("Failed to run Chocolatey command: ") + e.what());
        throw ChocolateyCommandError(std::string("Failed to run Chocolatey command: ") + e.what());
    }
}

bool ChocolateyService::run_elevated_choco_command(const std::string& command,
                                                   const std::string& log_text) const
{
    if (cli::trim(command).empty())
    {
        logger_.error("Empty command provided");
        throw ChocolateyCommandError("Empty command provided");
    }

    validate_choco_command();

    try
    {
        logger_.info("Running elevated Chocolatey command: " +
                     (log_text.empty() ? command : log_text));
        const std::string script =
            "Start-Process -FilePath \"choco\" -ArgumentList \"" + cli::powershell_escape(command) +
            "\" -Verb RunAs -Wait";
        auto result = runner_->run(kPowerShell, {"-Command", script});
        logger_.debug("Elevated command completed with return code: " +
                      std::to_string(result.exit_code));
        return result.exit_code == 0;
    }
    catch (const cli::CommandNotFoundError& e)
    {
        logger_.error(std::string("Failed to run elevated Chocolatey command: ") + e.what());
        throw ChocolateyCommandError(std::string("Failed to run elevated Chocolatey command: ") +
                                     e.what());
    }
}

std::vector<std::string> ChocolateyService::list_installed_packages() const
{
    try
    {
        logger_.info("Retrieving list of installed packages");
        auto output = run_choco_command({"list"});
        if (output.empty() || output.find("No packages found.") != std::string::npos)
        {
            logger_.debug("No packages found");
            return {};
        }

        static const std::regex pattern(R"(^([a-zA-Z0-9.-]+)\s+([\d.]+)$)");
        std::vector<std::string> packages;
        for (const auto& line : cli::split_lines(output))
        {
            std::smatch match;
            const std::string pkg = cli::trim(line);
            if (std::regex_match(pkg, match, pattern))
                packages.push_back(match[1].str() + " (" + match[2].str() + ")");
        }

        logger_.debug("Found " + std::to_string(packages.size()) + " packages");
        return packages;
    }
    catch (const ChocolateyNotInstalledError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        logger_.error(std::string("Failed to list Chocolatey packages: ") + e.what());
        throw ChocolateyCommandError(std::string("Failed to list Chocolatey packages: ") +
                                     e.what());
    }
}

std::vector<std::string> ChocolateyService::list_sources() const
{
    try
    {
        logger_.info("Retrieving list of Chocolatey sources");
        auto output = run_choco_command({"source", "list"});
        if (output.empty())
        {
            logger_.debug("No sources found");
            return {};
        }

        auto lines = cli::split_lines(output);
        std::vector<std::string> sources;
        // First line is the Chocolatey banner
        for (size_t i = 1; i < lines.size(); ++i)
        {
            const auto& line = lines[i];
            if (line.empty() || line.rfind("Chocolatey", 0) == 0)
                continue;
            auto parts = split(line, '|');
            // name|url|priority...
            if (parts.size() >= 3)
                sources.push_back(cli::trim(parts[0]));
        }

        logger_.debug("Found " + std::to_string(sources.size()) + " sources");
        return sources;
    }
    catch (const ChocolateyNotInstalledError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        logger_.error(std::string("Failed to list Chocolatey sources: ") + e.what());
        throw ChocolateyCommandError(std::string("Failed to list Chocolatey sources: ") +
                                     e.what());
    }
}

std::vector<std::string>
ChocolateyService::list_available_packages(const std::string& search_term) const
{
    try
    {
        logger_.info("Searching for available packages with term: " + search_term);
        std::vector<std::string> args = {"search", "--limit-output"};
        if (!search_term.empty())
            args.push_back(search_term);

        auto output = run_choco_command(args);
        if (output.empty())
        {
            logger_.debug("No packages found");
            return {};
        }

        std::vector<std::string> packages;
        for (const auto& line : cli::split_lines(output))
        {
            const std::string pkg = cli::trim(line);
            if (pkg.empty())
                continue;
            // --limit-output prints name|version
            auto parts = split(pkg, '|');
            if (parts.size() >= 2)
                packages.push_back(parts[0] + " (" + parts[1] + ")");
        }

        logger_.debug("Found " + std::to_string(packages.size()) + " available packages");
        return packages;
    }
    catch (const ChocolateyNotInstalledError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        logger_.error(std::string("Failed to list available Chocolatey packages: ") + e.what());
        throw ChocolateyCommandError(
            std::string("Failed to list available Chocolatey packages: ") + e.what());
    }
}

bool ChocolateyService::install_package(const std::string& package_name,
                                        const std::optional<std::string>& version) const
{
    require_name(package_name, "Package name", logger_);

    try
    {
        logger_.info("Installing package: " + package_name +
                     (version ? " version " + *version : std::string()));
        std::string command = "install -y " + package_name;
        if (version)
            command += " --version=" + *version;
        bool result = run_elevated_choco_command(command);
        logger_.debug(std::string("Package installation ") + (result ? "succeeded" : "failed"));
        return result;
    }
    catch (const ChocolateyNotInstalledError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        logger_.error("Failed to install package " + package_name + ": " + e.what());
        throw ChocolateyCommandError("Failed to install package " + package_name + ": " +
                                     e.what());
    }
}

bool ChocolateyService::uninstall_package(const std::string& package_name) const
{
    require_name(package_name, "Package name", logger_);

    try
    {
        logger_.info("Uninstalling package: " + package_name);
        bool result = run_elevated_choco_command("uninstall -y " + package_name);
        logger_.debug(std::string("Package uninstallation ") + (result ? "succeeded" : "failed"));
        return result;
    }
    catch (const ChocolateyNotInstalledError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        logger_.error("Failed to uninstall package " + package_name + ": " + e.what());
        throw ChocolateyCommandError("Failed to uninstall package " + package_name + ": " +
                                     e.what());
    }
}

bool ChocolateyService::upgrade_package(const std::string& package_name,
                                        const std::optional<std::string>& version) const
{
    require_name(package_name, "Package name", logger_);

    try
    {
        logger_.info("Upgrading package: " + package_name +
                     (version ? " to version " + *version : std::string()));
        std::string command = "upgrade -y " + package_name;
        if (version)
            command += " --version=" + *version;
        bool result = run_elevated_choco_command(command);
        logger_.debug(std::string("Package upgrade ") + (result ? "succeeded" : "failed"));
        return result;
    }
    catch (const ChocolateyNotInstalledError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        logger_.error("Failed to upgrade package " + package_name + ": " + e.what());
        throw ChocolateyCommandError("Failed to upgrade package " + package_name + ": " +
                                     e.what());
    }
}

bool ChocolateyService::install_chocolatey() const
{
    try
    {
        if (runner_->which(kChoco))
        {
            logger_.info("Chocolatey is already installed");
            return true;
        }

        logger_.info("Installing Chocolatey...");
        const std::string install_command =
            "[System.Net.ServicePointManager]::SecurityProtocol = "
            "[System.Net.ServicePointManager]::SecurityProtocol -bor " +
            std::to_string(kTls12Protocol) +
            "; iex ((New-Object System.Net.WebClient).DownloadString("
            "'https://community.chocolatey.org/install.ps1'))";
        const std::string elevated_command = "Start-Process -FilePath \"powershell.exe\" "
                                             "-ArgumentList \"-Command " +
                                             install_command + "\" -Verb RunAs -Wait";

        auto result = runner_->run(kPowerShell, {"-Command", elevated_command});
        if (result.exit_code == 0)
        {
            logger_.info("Chocolatey installation completed successfully");
            return true;
        }

        logger_.error("Failed to install Chocolatey: Installation returned non-zero status code");
        return false;
    }
    catch (const std::exception& e)
    {
        logger_.error(std::string("Error installing Chocolatey: ") + e.what());
        throw ChocolateyCommandError(std::string("Failed to install Chocolatey: ") + e.what());
    }
}

bool ChocolateyService::add_source(const std::string& source_name, const std::string& source_url,
                                   const std::optional<std::string>& username,
                                   const std::optional<std::string>& password,
                                   const std::optional<int>& priority) const
{
    require_name(source_name, "Source name", logger_);
    require_name(source_url, "Source URL", logger_);

    try
    {
        logger_.info("Adding source: " + source_name + " with URL: " + source_url);
        std::string command = "source add -n=" + source_name + " -s=" + source_url;
        std::string log_text = command;
        if (username)
        {
            command += " -u=" + *username;
            log_text += " -u=" + *username;
        }
        if (password)
        {
            command += " -p=" + *password;
            log_text += " -p=****";
        }
        if (priority)
        {
            command += " --priority=" + std::to_string(*priority);
            log_text += " --priority=" + std::to_string(*priority);
        }
        bool result = run_elevated_choco_command(command, log_text);
        logger_.debug(std::string("Add source ") + (result ? "succeeded" : "failed"));
        return result;
    }
    catch (const ChocolateyNotInstalledError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        logger_.error("Failed to add source " + source_name + ": " + e.what());
        throw ChocolateyCommandError("Failed to add source " + source_name + ": " + e.what());
    }
}

bool ChocolateyService::remove_source(const std::string& source_name) const
{
    require_name(source_name, "Source name", logger_);

    try
    {
        logger_.info("Removing source: " + source_name);
        bool result = run_elevated_choco_command("source remove -n=" + source_name);
        logger_.debug(std::string("Remove source ") + (result ? "succeeded" : "failed"));
        return result;
    }
    catch (const ChocolateyNotInstalledError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        logger_.error("Failed to remove source " + source_name + ": " + e.what());
        throw ChocolateyCommandError("Failed to remove source " + source_name + ": " + e.what());
    }
}

} // namespace mcpcommons::choco
