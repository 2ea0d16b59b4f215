#pragma once
#include "mcpcommons/content.hpp"
#include "mcpcommons/tools/tool.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace mcpcommons::tools
{

/// One tool implementation. Built once with the registry and stateless afterwards, so a
/// single instance may serve any number of calls, including concurrent ones.
///
/// execute() reports failures by throwing:
/// - ValidationError for a missing or malformed argument,
/// - a CommonsError subtype for a failure the owning registry may recover from,
/// - anything else for unexpected failures, which reach the client as internal errors.
class Controller
{
  public:
    Controller(std::string name, std::string description, mcpcommons::Json input_schema)
        : tool_(std::move(name), std::move(description), std::move(input_schema))
    {
    }
    virtual ~Controller() = default;

    Controller(const Controller&) = delete;
    Controller& operator=(const Controller&) = delete;

    const std::string& name() const
    {
        return tool_.name();
    }

    virtual Tool tool() const
    {
        return tool_;
    }

    virtual bool can_execute(const std::string& name) const
    {
        return tool_.name() == name;
    }

    virtual std::vector<Content> execute(const std::string& name,
                                         const mcpcommons::Json& arguments) const = 0;

  private:
    Tool tool_;
};

/// Controller whose behaviour is a callable, for tools that need no state of their own.
class FunctionController : public Controller
{
  public:
    using Fn = std::function<std::vector<Content>(const mcpcommons::Json&)>;

    FunctionController(std::string name, std::string description, mcpcommons::Json input_schema,
                       Fn fn)
        : Controller(std::move(name), std::move(description), std::move(input_schema)),
          fn_(std::move(fn))
    {
    }

    std::vector<Content> execute(const std::string& /*name*/,
                                 const mcpcommons::Json& arguments) const override
    {
        return fn_(arguments);
    }

  private:
    Fn fn_;
};

// Argument helpers shared by controllers. A JSON null counts as absent.

/// Returns the string argument, or throws ValidationError(message) when it is absent, or
/// empty unless `allow_empty` is set.
std::string require_string(const mcpcommons::Json& arguments, const std::string& key,
                           const std::string& message, bool allow_empty = false);

std::optional<std::string> optional_string(const mcpcommons::Json& arguments,
                                           const std::string& key);

/// @throws ValidationError when the value is not an integer or does not fit an int
std::optional<int> optional_int(const mcpcommons::Json& arguments, const std::string& key);

} // namespace mcpcommons::tools
