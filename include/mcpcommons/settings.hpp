#pragma once
#include "mcpcommons/logging.hpp"
#include "mcpcommons/types.hpp"

#include <string>

namespace mcpcommons
{

struct Settings
{
    std::string log_level{"INFO"};

    LogLevel level() const
    {
        return log_level_from_string(log_level);
    }

    /// Reads MCPCOMMONS_LOG_LEVEL.
    static Settings from_env();
    static Settings from_json(const Json& j);
    /// Loads a JSON settings file. Throws mcpcommons::Error if it cannot be read or parsed.
    static Settings from_file(const std::string& path);
};

} // namespace mcpcommons
