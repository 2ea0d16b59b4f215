#pragma once
#include "mcpcommons/cli/command_runner.hpp"
#include "mcpcommons/exceptions.hpp"
#include "mcpcommons/logging.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcpcommons::winget
{

/// Winget is not installed or not available in PATH.
struct WingetNotInstalledError : public CommonsError
{
    using CommonsError::CommonsError;
};

/// A Winget command could not be run or exited with an error.
struct WingetCommandError : public CommonsError
{
    using CommonsError::CommonsError;
};

/// Thin layer over the `winget` CLI.
///
/// Listings return winget's own table rows with the decoration lines removed. Source changes
/// need administrator rights and are run through an elevated PowerShell `Start-Process`.
class WingetService
{
  public:
    explicit WingetService(std::shared_ptr<const cli::CommandRunner> runner,
                           Logger logger = Logger("mcpcommons.winget.service"));

    std::vector<std::string> list_installed_packages() const;
    std::vector<std::string> list_sources() const;
    std::vector<std::string> list_available_packages(const std::string& search_term = "") const;

    bool install_package(const std::string& package_name,
                         const std::optional<std::string>& version = std::nullopt) const;
    bool uninstall_package(const std::string& package_name) const;
    bool upgrade_package(const std::string& package_name,
                         const std::optional<std::string>& version = std::nullopt) const;

    /// `source_type` defaults to "Microsoft.Rest".
    bool add_source(const std::string& source_name, const std::string& source_url,
                    const std::optional<std::string>& source_type = std::nullopt) const;
    bool remove_source(const std::string& source_name) const;

  private:
    void validate_winget_command() const;
    std::string run_winget_command(const std::vector<std::string>& args) const;
    std::string run_elevated_winget_command(const std::vector<std::string>& args) const;

    std::shared_ptr<const cli::CommandRunner> runner_;
    Logger logger_;
};

} // namespace mcpcommons::winget
