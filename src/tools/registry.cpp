#include "mcpcommons/tools/registry.hpp"

namespace mcpcommons::tools
{

std::vector<Content> ControllerRegistry::error_handler(std::exception_ptr error,
                                                       const Controller& /*controller*/,
                                                       const std::string& /*tool_name*/,
                                                       const mcpcommons::Json& /*arguments*/) const
{
    try
    {
        std::rethrow_exception(error);
    }
    catch (const std::exception& e)
    {
        return {make_text(e.what())};
    }
}

} // namespace mcpcommons::tools
