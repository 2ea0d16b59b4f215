#include "mcpcommons/tools/controller.hpp"

#include "mcpcommons/exceptions.hpp"

#include <cstdint>
#include <limits>

namespace mcpcommons::tools
{

std::string require_string(const mcpcommons::Json& arguments, const std::string& key,
                           const std::string& message, bool allow_empty)
{
    auto value = optional_string(arguments, key);
    if (!value || (value->empty() && !allow_empty))
        throw ValidationError(message);
    return *value;
}

std::optional<std::string> optional_string(const mcpcommons::Json& arguments,
                                           const std::string& key)
{
    if (!arguments.is_object())
        return std::nullopt;
    auto it = arguments.find(key);
    if (it == arguments.end() || it->is_null())
        return std::nullopt;
    if (!it->is_string())
        throw ValidationError("Argument '" + key + "' must be a string.");
    return it->get<std::string>();
}

std::optional<int> optional_int(const mcpcommons::Json& arguments, const std::string& key)
{
    if (!arguments.is_object())
        return std::nullopt;
    auto it = arguments.find(key);
    if (it == arguments.end() || it->is_null())
        return std::nullopt;
    if (!it->is_number_integer())
        throw ValidationError("Argument '" + key + "' must be an integer.");
    // Wider JSON integers must not wrap into a different int
    const bool in_range =
        it->is_number_unsigned()
            ? it->get<std::uint64_t>() <=
                  static_cast<std::uint64_t>(std::numeric_limits<int>::max())
            : it->get<std::int64_t>() >= std::numeric_limits<int>::min() &&
                  it->get<std::int64_t>() <= std::numeric_limits<int>::max();
    if (!in_range)
        throw ValidationError("Argument '" + key + "' is out of range.");
    return it->get<int>();
}

} // namespace mcpcommons::tools
