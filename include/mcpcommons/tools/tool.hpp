#pragma once
#include "mcpcommons/types.hpp"

#include <string>

namespace mcpcommons::tools
{

/// Immutable description of one callable tool, as advertised by tools/list.
class Tool
{
  public:
    Tool() = default;

    Tool(std::string name, std::string description, mcpcommons::Json input_schema)
        : name_(std::move(name)), description_(std::move(description)),
          input_schema_(std::move(input_schema))
    {
    }

    const std::string& name() const
    {
        return name_;
    }
    const std::string& description() const
    {
        return description_;
    }
    const mcpcommons::Json& input_schema() const
    {
        return input_schema_;
    }

    bool operator==(const Tool& other) const
    {
        return name_ == other.name_ && description_ == other.description_ &&
               input_schema_ == other.input_schema_;
    }
    bool operator!=(const Tool& other) const
    {
        return !(*this == other);
    }

  private:
    std::string name_;
    std::string description_;
    mcpcommons::Json input_schema_;
};

inline void to_json(mcpcommons::Json& j, const Tool& t)
{
    j = mcpcommons::Json{{"name", t.name()}};
    if (!t.description().empty())
        j["description"] = t.description();
    // Schema may be empty
    if (!t.input_schema().is_null() && !t.input_schema().empty())
        j["inputSchema"] = t.input_schema();
    else
        j["inputSchema"] = mcpcommons::Json{{"type", "object"}};
}

} // namespace mcpcommons::tools
