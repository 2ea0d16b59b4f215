#include "mcpcommons/devkit/controllers.hpp"

#include "mcpcommons/devkit/service.hpp"
#include "mcpcommons/exceptions.hpp"

namespace mcpcommons::devkit
{

namespace
{
using mcpcommons::Json;
using tools::FunctionController;
using tools::optional_string;
using tools::require_string;

Json string_property(const std::string& description, bool nullable = false)
{
    Json property{{"type", "string"}, {"description", description}};
    if (nullable)
        property["nullable"] = true;
    return property;
}

Json object_schema(Json properties, std::vector<std::string> required)
{
    return Json{{"type", "object"}, {"required", required}, {"properties", std::move(properties)}};
}

std::string encoding_argument(const Json& arguments)
{
    auto encoding = optional_string(arguments, "encoding");
    return encoding && !encoding->empty() ? *encoding : "utf-8";
}
} // namespace

DevkitControllerRegistry::DevkitControllerRegistry(Logger logger)
{
    auto log = logger.child("mcpcommons.devkit.controller");

    controllers_.push_back(std::make_unique<FunctionController>(
        "decode_jwt", "Decodes a JWT token and returns its components.",
        object_schema(
            {{"token", string_property("The JWT token to decode.")},
             {"public_key", string_property("The PEM public key to verify the JWT signature.", true)},
             {"certificate",
              string_property("The PEM certificate to extract the public key for verification.",
                              true)}},
            {"token"}),
        [log](const Json& arguments) -> std::vector<Content>
        {
            auto token = optional_string(arguments, "token");
            if (!token || token->empty())
            {
                log.error("Token is required but not provided");
                throw ValidationError("Token is required.");
            }
            log.info("Decoding JWT token");
            try
            {
                auto decoded = decode_jwt(*token, optional_string(arguments, "public_key"),
                                          optional_string(arguments, "certificate"));
                OrderedJson result = decoded;
                log.debug("Decoded JWT: headers=" + decoded.headers.dump() +
                          ", data=" + decoded.data.dump() + ", signature_verified=" +
                          result["signature_verified"].dump());
                return {make_text(
                    result.dump(-1, ' ', false, OrderedJson::error_handler_t::replace))};
            }
            catch (const std::exception& e)
            {
                log.error(std::string("Failed to decode JWT: ") + e.what());
                throw;
            }
        }));

    controllers_.push_back(std::make_unique<FunctionController>(
        "generate_guid", "Generates a random GUID (UUID version 4).",
        object_schema({{"delimiter",
                        string_property("Optional delimiter to use instead of '-'.", true)}},
                      {}),
        [log](const Json& arguments) -> std::vector<Content>
        {
            log.info("Generating GUID");
            return {make_text(generate_guid(optional_string(arguments, "delimiter")))};
        }));

    controllers_.push_back(std::make_unique<FunctionController>(
        "url_encode", "URL-encodes a string.",
        object_schema({{"value", string_property("The string to URL-encode.")}}, {"value"}),
        [log](const Json& arguments) -> std::vector<Content>
        {
            auto value = require_string(arguments, "value", "Value is required.", true);
            log.info("URL-encoding value");
            return {make_text(url_encode(value))};
        }));

    controllers_.push_back(std::make_unique<FunctionController>(
        "encode_base64", "Encodes text to a base64 string.",
        object_schema({{"text", string_property("The text to encode.")},
                       {"encoding", string_property("Text encoding (default utf-8).")}},
                      {"text"}),
        [log](const Json& arguments) -> std::vector<Content>
        {
            auto text = require_string(arguments, "text", "Text is required.", true);
            auto encoding = encoding_argument(arguments);
            log.info("Encoding text to base64 using " + encoding);
            return {make_text(encode_base64(text, encoding))};
        }));

    controllers_.push_back(std::make_unique<FunctionController>(
        "decode_base64", "Decodes a base64 string to text.",
        object_schema({{"b64_string", string_property("The base64 string to decode.")},
                       {"encoding", string_property("Text encoding (default utf-8).")}},
                      {"b64_string"}),
        [log](const Json& arguments) -> std::vector<Content>
        {
            auto b64_string =
                require_string(arguments, "b64_string", "Base64 string is required.", true);
            auto encoding = encoding_argument(arguments);
            log.info("Decoding base64 string using " + encoding);
            return {make_text(decode_base64(b64_string, encoding))};
        }));
}

std::vector<Content> DevkitControllerRegistry::error_handler(std::exception_ptr error,
                                                             const tools::Controller&,
                                                             const std::string&,
                                                             const mcpcommons::Json&) const
{
    std::rethrow_exception(error);
}

McpConfig make_config(const Settings& settings)
{
    McpConfig config;
    config.server_name = "Devkit MCP Server";
    config.logger = Logger("mcp_server_devkit", settings.level());
    config.controller_registry = std::make_unique<DevkitControllerRegistry>(config.logger);
    return config;
}

} // namespace mcpcommons::devkit
