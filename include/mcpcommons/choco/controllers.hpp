#pragma once
#include "mcpcommons/choco/service.hpp"
#include "mcpcommons/config.hpp"
#include "mcpcommons/settings.hpp"
#include "mcpcommons/tools/registry.hpp"

#include <memory>

namespace mcpcommons::choco
{

/// The nine Chocolatey tools, in listing order:
/// list_installed_packages, list_sources, install_package, uninstall_package,
/// list_available_packages, upgrade_package, install_chocolatey, add_source, remove_source.
///
/// Recovery policy: a missing Chocolatey installation is answered with a hint to run
/// install_chocolatey; every other domain error fails the call.
class ChocolateyControllerRegistry : public tools::ControllerRegistry
{
  public:
    ChocolateyControllerRegistry(std::shared_ptr<const ChocolateyService> service, Logger logger);

    const tools::ControllerList& get_registry() const override
    {
        return controllers_;
    }

    std::vector<Content> error_handler(std::exception_ptr error,
                                       const tools::Controller& controller,
                                       const std::string& tool_name,
                                       const mcpcommons::Json& arguments) const override;

  private:
    tools::ControllerList controllers_;
};

/// Config for the Chocolatey server. `runner` defaults to real child processes.
McpConfig make_config(const Settings& settings,
                      std::shared_ptr<const cli::CommandRunner> runner = nullptr);

} // namespace mcpcommons::choco
