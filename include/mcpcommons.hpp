#pragma once

/// @file mcpcommons.hpp
/// @brief Main header for mcpcommons - includes the framework and the bundled deployments
///
/// Usage:
/// @code
/// #include <mcpcommons.hpp>
///
/// int main() {
///     auto config = mcpcommons::devkit::make_config(mcpcommons::Settings::from_env());
///     return mcpcommons::server::run_stdio_server(config) ? 0 : 1;
/// }
/// @endcode

// Core types and exceptions
#include "mcpcommons/types.hpp"
#include "mcpcommons/exceptions.hpp"
#include "mcpcommons/content.hpp"
#include "mcpcommons/logging.hpp"
#include "mcpcommons/settings.hpp"
#include "mcpcommons/config.hpp"

// Tools
#include "mcpcommons/tools/tool.hpp"
#include "mcpcommons/tools/controller.hpp"
#include "mcpcommons/tools/registry.hpp"
#include "mcpcommons/executor.hpp"

// Protocol and server
#include "mcpcommons/mcp/handler.hpp"
#include "mcpcommons/server/stdio_server.hpp"
#include "mcpcommons/server/server.hpp"

// Command-line plumbing
#include "mcpcommons/cli/command_runner.hpp"
#include "mcpcommons/cli/launcher.hpp"

// Deployments (each defines its own make_config)
#include "mcpcommons/choco/controllers.hpp"
#include "mcpcommons/winget/controllers.hpp"
#include "mcpcommons/devkit/controllers.hpp"
#include "mcpcommons/devkit/service.hpp"
