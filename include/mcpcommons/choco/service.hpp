#pragma once
#include "mcpcommons/cli/command_runner.hpp"
#include "mcpcommons/exceptions.hpp"
#include "mcpcommons/logging.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcpcommons::choco
{

/// Chocolatey is not installed or not available in PATH.
struct ChocolateyNotInstalledError : public CommonsError
{
    using CommonsError::CommonsError;
};

/// A Chocolatey command could not be run or did not succeed.
struct ChocolateyCommandError : public CommonsError
{
    using CommonsError::CommonsError;
};

/// Thin layer over the `choco` CLI.
///
/// Read-only queries run `choco` directly and parse its output. Commands that modify the
/// machine go through an elevated PowerShell `Start-Process ... -Verb RunAs -Wait`, and only
/// their exit status is reported.
class ChocolateyService
{
  public:
    explicit ChocolateyService(std::shared_ptr<const cli::CommandRunner> runner,
                               Logger logger = Logger("mcpcommons.choco.service"));

    /// Installed packages as "name (version)".
    std::vector<std::string> list_installed_packages() const;

    /// Names of the configured package sources.
    std::vector<std::string> list_sources() const;

    /// Packages matching `search_term` (all packages when empty) as "name (version)".
    std::vector<std::string> list_available_packages(const std::string& search_term = "") const;

    bool install_package(const std::string& package_name,
                         const std::optional<std::string>& version = std::nullopt) const;
    bool uninstall_package(const std::string& package_name) const;
    bool upgrade_package(const std::string& package_name,
                         const std::optional<std::string>& version = std::nullopt) const;

    /// True when Chocolatey is already present or the community installer succeeded.
    bool install_chocolatey() const;

    bool add_source(const std::string& source_name, const std::string& source_url,
                    const std::optional<std::string>& username = std::nullopt,
                    const std::optional<std::string>& password = std::nullopt,
                    const std::optional<int>& priority = std::nullopt) const;
    bool remove_source(const std::string& source_name) const;

  private:
    void validate_choco_command() const;
    std::string run_choco_command(const std::vector<std::string>& args) const;
    bool run_elevated_choco_command(const std::string& command,
                                    const std::string& log_text = "") const;

    std::shared_ptr<const cli::CommandRunner> runner_;
    Logger logger_;
};

} // namespace mcpcommons::choco
