#pragma once
#include "mcpcommons/config.hpp"
#include "mcpcommons/settings.hpp"
#include "mcpcommons/tools/registry.hpp"

namespace mcpcommons::devkit
{

/// Developer utilities: decode_jwt, generate_guid, url_encode, encode_base64, decode_base64.
class DevkitControllerRegistry : public tools::ControllerRegistry
{
  public:
    explicit DevkitControllerRegistry(Logger logger = Logger("mcpcommons.devkit"));

    const tools::ControllerList& get_registry() const override
    {
        return controllers_;
    }

    /// Nothing here is recoverable; every error fails the call.
    std::vector<Content> error_handler(std::exception_ptr error,
                                       const tools::Controller& controller,
                                       const std::string& tool_name,
                                       const mcpcommons::Json& arguments) const override;

  private:
    tools::ControllerList controllers_;
};

McpConfig make_config(const Settings& settings);

} // namespace mcpcommons::devkit
