#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace mcpcommons
{

using Json = nlohmann::json;
/// Keeps object keys in insertion order (claims echoed back as received)
using OrderedJson = nlohmann::ordered_json;

/// Error payload of a failed tool call (mirrors mcp.types.ErrorData)
struct ErrorData
{
    int code{0};
    std::string message;
};

inline void to_json(Json& j, const ErrorData& e)
{
    j = Json{{"code", e.code}, {"message", e.message}};
}

inline void from_json(const Json& j, ErrorData& e)
{
    e.code = j.at("code").get<int>();
    e.message = j.at("message").get<std::string>();
}

/// Version string of the mcpcommons runtime, fixed at build time.
const char* version();

} // namespace mcpcommons
