#pragma once
#include "mcpcommons/content.hpp"
#include "mcpcommons/tools/controller.hpp"

#include <exception>
#include <memory>
#include <string>
#include <vector>

namespace mcpcommons::tools
{

using ControllerList = std::vector<std::unique_ptr<Controller>>;

/// Fixed, ordered set of controllers for one server deployment plus its recovery policy.
///
/// Registration order is dispatch priority: when two controllers accept the same name the
/// earlier one wins. Implementations build their list once in the constructor and never
/// change it afterwards.
class ControllerRegistry
{
  public:
    virtual ~ControllerRegistry() = default;

    virtual const ControllerList& get_registry() const = 0;

    /// Called by the executor when a controller throws a CommonsError.
    ///
    /// `error` holds the thrown exception; use std::rethrow_exception to inspect its type.
    /// Return content to answer the call normally, or let the exception escape to fail it.
    /// The default wraps the error message into a single text item.
    virtual std::vector<Content> error_handler(std::exception_ptr error,
                                               const Controller& controller,
                                               const std::string& tool_name,
                                               const mcpcommons::Json& arguments) const;
};

/// Registry with no controllers.
class EmptyControllerRegistry : public ControllerRegistry
{
  public:
    const ControllerList& get_registry() const override
    {
        return controllers_;
    }

  private:
    ControllerList controllers_;
};

} // namespace mcpcommons::tools
