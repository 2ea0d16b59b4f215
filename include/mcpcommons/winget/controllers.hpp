#pragma once
#include "mcpcommons/config.hpp"
#include "mcpcommons/settings.hpp"
#include "mcpcommons/tools/registry.hpp"
#include "mcpcommons/winget/service.hpp"

#include <memory>

namespace mcpcommons::winget
{

/// The eight winget tools, all prefixed "wg_" so they can sit next to the Chocolatey ones in
/// a client: wg_list_installed_packages, wg_list_sources, wg_install_package,
/// wg_uninstall_package, wg_list_available_packages, wg_upgrade_package, wg_add_source,
/// wg_remove_source.
class WingetControllerRegistry : public tools::ControllerRegistry
{
  public:
    WingetControllerRegistry(std::shared_ptr<const WingetService> service, Logger logger);

    const tools::ControllerList& get_registry() const override
    {
        return controllers_;
    }

    /// WingetNotInstalledError becomes an install hint; anything else fails the call.
    std::vector<Content> error_handler(std::exception_ptr error,
                                       const tools::Controller& controller,
                                       const std::string& tool_name,
                                       const mcpcommons::Json& arguments) const override;

  private:
    tools::ControllerList controllers_;
};

McpConfig make_config(const Settings& settings,
                      std::shared_ptr<const cli::CommandRunner> runner = nullptr);

} // namespace mcpcommons::winget
