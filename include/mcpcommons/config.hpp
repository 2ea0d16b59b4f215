#pragma once
#include "mcpcommons/logging.hpp"
#include "mcpcommons/tools/registry.hpp"

#include <memory>
#include <optional>
#include <string>

namespace mcpcommons
{

/// Everything a server process needs, built once at startup.
///
/// The config is the sole owner of the controller registry; the executor and the protocol
/// server only borrow it, so it must outlive both.
struct McpConfig
{
    std::string server_name{"MCP Server"};
    std::optional<std::string> server_version;
    std::unique_ptr<tools::ControllerRegistry> controller_registry{
        std::make_unique<tools::EmptyControllerRegistry>()};
    Logger logger{"mcpcommons"};

    const tools::ControllerRegistry& registry() const
    {
        return *controller_registry;
    }
};

} // namespace mcpcommons
