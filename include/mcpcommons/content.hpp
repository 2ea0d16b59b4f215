#pragma once
#include "mcpcommons/types.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mcpcommons
{

struct TextContent
{
    std::string type{"text"};
    std::string text;
};

struct ImageContent
{
    std::string type{"image"};
    std::string data;     // base64-encoded image bytes
    std::string mimeType; // e.g., "image/png"
};

struct EmbeddedResource
{
    std::string type{"resource"};
    std::string uri;
    std::optional<std::string> text; // text resources
    std::optional<std::string> blob; // binary resources (base64)
    std::optional<std::string> mimeType;
};

/// One unit of tool output (matches mcp.types content blocks)
using Content = std::variant<TextContent, ImageContent, EmbeddedResource>;

inline Content make_text(std::string text)
{
    TextContent c;
    c.text = std::move(text);
    return c;
}

// nlohmann::json adapters
inline void to_json(Json& j, const TextContent& c)
{
    j = Json{{"type", c.type}, {"text", c.text}};
}

inline void to_json(Json& j, const ImageContent& c)
{
    j = Json{{"type", c.type}, {"data", c.data}, {"mimeType", c.mimeType}};
}

inline void to_json(Json& j, const EmbeddedResource& c)
{
    Json resource = {{"uri", c.uri}};
    if (c.text)
        resource["text"] = *c.text;
    if (c.blob)
        resource["blob"] = *c.blob;
    if (c.mimeType)
        resource["mimeType"] = *c.mimeType;
    j = Json{{"type", c.type}, {"resource", resource}};
}

inline void to_json(Json& j, const Content& c)
{
    std::visit([&j](const auto& block) { to_json(j, block); }, c);
}

inline Json to_json_array(const std::vector<Content>& content)
{
    Json arr = Json::array();
    for (const auto& c : content)
    {
        Json item;
        to_json(item, c);
        arr.push_back(std::move(item));
    }
    return arr;
}

/// Text of a content item, or empty when it is not a text block.
inline std::string text_of(const Content& c)
{
    if (const auto* t = std::get_if<TextContent>(&c))
        return t->text;
    return {};
}

} // namespace mcpcommons
