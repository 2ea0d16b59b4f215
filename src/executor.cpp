#include "mcpcommons/executor.hpp"

#include "mcpcommons/exceptions.hpp"

#include <exception>

namespace mcpcommons
{

std::vector<Content> execute_tool(const std::string& name, const Json& arguments,
                                  const McpConfig& config)
{
    const Logger logger = config.logger.child("mcpcommons.executor");
    const auto& registry = config.registry();

    logger.debug("Looking for controller to execute tool: " + name);
    for (const auto& controller : registry.get_registry())
    {
        if (!controller->can_execute(name))
            continue;

        logger.info("Found controller " + controller->name() + " for tool " + name);
        try
        {
            return controller->execute(name, arguments);
        }
        catch (const CommonsError&)
        {
            return registry.error_handler(std::current_exception(), *controller, name,
                                          arguments);
        }
        catch (const std::exception& e)
        {
            logger.error("Error executing tool " + name + ": " + e.what());
            throw McpError(error_code::Internal, e.what());
        }
        catch (...)
        {
            logger.error("Error executing tool " + name + ": non-standard exception");
            throw McpError(error_code::Internal, "Unknown error");
        }
    }

    logger.error("No controller found for tool: " + name);
    throw McpError(error_code::UnknownTool, "Unknown tool.");
}

} // namespace mcpcommons
