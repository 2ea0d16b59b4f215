#include "mcpcommons/mcp/handler.hpp"

#include "mcpcommons/content.hpp"
#include "mcpcommons/exceptions.hpp"
#include "mcpcommons/executor.hpp"
#include "mcpcommons/tools/tool.hpp"

#include <string>

namespace mcpcommons::mcp
{

namespace
{
constexpr const char* kProtocolVersion = "2024-11-05";

// JSON-RPC 2.0 framing errors
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;

mcpcommons::Json jsonrpc_error(const mcpcommons::Json& id, int code, const std::string& message)
{
    return mcpcommons::Json{
        {"jsonrpc", "2.0"},
        {"id", id.is_null() ? mcpcommons::Json() : id},
        {"error", mcpcommons::Json{{"code", code}, {"message", message}}}};
}

mcpcommons::Json jsonrpc_result(const mcpcommons::Json& id, mcpcommons::Json result)
{
    return mcpcommons::Json{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

mcpcommons::Json list_tools(const McpConfig& config, const Logger& logger)
{
    logger.info("Listing available tools");
    mcpcommons::Json tools_array = mcpcommons::Json::array();
    for (const auto& controller : config.registry().get_registry())
        tools_array.push_back(mcpcommons::Json(controller->tool()));
    logger.info("Found " + std::to_string(tools_array.size()) + " tools");
    return mcpcommons::Json{{"tools", tools_array}};
}

mcpcommons::Json call_tool(const mcpcommons::Json& id, const std::string& name,
                           const mcpcommons::Json& arguments, const McpConfig& config,
                           const Logger& logger)
{
    try
    {
        logger.info("Executing tool: " + name);
        logger.debug("Tool arguments: " + arguments.dump());
        auto content = execute_tool(name, arguments, config);
        logger.debug("Tool execution successful");
        return jsonrpc_result(id, mcpcommons::Json{{"content", to_json_array(content)},
                                                   {"isError", false}});
    }
    catch (const McpError& e)
    {
        logger.error("Error executing tool " + name + ": " + e.what());
        return jsonrpc_error(id, e.code(), e.what());
    }
    catch (const std::exception& e)
    {
        logger.error("Error executing tool " + name + ": " + e.what());
        return jsonrpc_error(id, error_code::Internal, e.what());
    }
    catch (...)
    {
        logger.error("Error executing tool " + name + ": non-standard exception");
        return jsonrpc_error(id, error_code::Internal, "Unknown error");
    }
}
} // namespace

McpHandler make_mcp_handler(const McpConfig& config)
{
    const Logger logger = config.logger.child("mcpcommons.server");
    return [&config, logger](const mcpcommons::Json& message) -> mcpcommons::Json
    {
        const auto id =
            message.is_object() && message.contains("id") ? message.at("id") : mcpcommons::Json();
        try
        {
            if (!message.is_object() || !message.contains("method") ||
                !message["method"].is_string())
                return jsonrpc_error(id, kInvalidRequest, "Invalid request");

            const std::string method = message["method"].get<std::string>();

            // Notifications (no id) never get a response
            if (!message.contains("id"))
            {
                logger.debug("Notification received: " + method);
                return mcpcommons::Json();
            }

            mcpcommons::Json params = message.value("params", mcpcommons::Json::object());
            if (!params.is_object())
                params = mcpcommons::Json::object();

            if (method == "initialize")
            {
                mcpcommons::Json server_info = {{"name", config.server_name}};
                server_info["version"] = config.server_version.value_or(mcpcommons::version());
                return jsonrpc_result(
                    id, mcpcommons::Json{
                            {"protocolVersion", kProtocolVersion},
                            {"capabilities", mcpcommons::Json{{"tools", mcpcommons::Json::object()}}},
                            {"serverInfo", server_info},
                        });
            }

            if (method == "ping")
                return jsonrpc_result(id, mcpcommons::Json::object());

            if (method == "tools/list")
                return jsonrpc_result(id, list_tools(config, logger));

            if (method == "tools/call")
            {
                std::string name;
                if (params.contains("name") && params["name"].is_string())
                    name = params["name"].get<std::string>();
                if (name.empty())
                    return jsonrpc_error(id, kInvalidParams, "Missing tool name");

                mcpcommons::Json args = params.value("arguments", mcpcommons::Json::object());
                if (args.is_null())
                    args = mcpcommons::Json::object();
                return call_tool(id, name, args, config, logger);
            }

            return jsonrpc_error(id, kMethodNotFound,
                                 std::string("Method '") + method + "' not found");
        }
        catch (const std::exception& e)
        {
            logger.error(std::string("Error handling request: ") + e.what());
            return jsonrpc_error(id, error_code::Internal, e.what());
        }
        catch (...)
        {
            logger.error("Error handling request: non-standard exception");
            return jsonrpc_error(id, error_code::Internal, "Unknown error");
        }
    };
}

} // namespace mcpcommons::mcp
