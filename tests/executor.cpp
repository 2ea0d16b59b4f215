#include "mcpcommons/executor.hpp"

#include "mcpcommons/exceptions.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>

using namespace mcpcommons;

namespace
{
struct DomainError : public CommonsError
{
    using CommonsError::CommonsError;
};

struct FatalDomainError : public CommonsError
{
    using CommonsError::CommonsError;
};

// Accepts every name starting with its prefix
class PrefixController : public tools::Controller
{
  public:
    PrefixController(std::string prefix, std::string reply)
        : Controller(prefix + "*", "", Json{{"type", "object"}}), prefix_(std::move(prefix)),
          reply_(std::move(reply))
    {
    }

    bool can_execute(const std::string& name) const override
    {
        return name.rfind(prefix_, 0) == 0;
    }

    std::vector<Content> execute(const std::string& name, const Json&) const override
    {
        return {make_text(reply_ + ":" + name)};
    }

  private:
    std::string prefix_;
    std::string reply_;
};

class TestRegistry : public tools::ControllerRegistry
{
  public:
    TestRegistry()
    {
        add("ok", [](const Json& args) -> std::vector<Content>
            { return {make_text("ok " + args.value("v", std::string()))}; });
        add("invalid", [](const Json&) -> std::vector<Content>
            { throw ValidationError("Value is required."); });
        add("recoverable", [](const Json&) -> std::vector<Content>
            { throw DomainError("tool not installed"); });
        add("fatal", [](const Json&) -> std::vector<Content>
            { throw FatalDomainError("cannot recover"); });
        add("crash", [](const Json&) -> std::vector<Content>
            { throw std::runtime_error("boom"); });
        add("odd", [](const Json&) -> std::vector<Content> { throw 42; });
        controllers_.push_back(std::make_unique<PrefixController>("dup", "first"));
        controllers_.push_back(std::make_unique<PrefixController>("dup", "second"));
    }

    const tools::ControllerList& get_registry() const override
    {
        return controllers_;
    }

    std::vector<Content> error_handler(std::exception_ptr error, const tools::Controller&,
                                       const std::string& tool_name, const Json&) const override
    {
        try
        {
            std::rethrow_exception(error);
        }
        catch (const DomainError& e)
        {
            return {make_text(std::string("handled ") + tool_name + ": " + e.what())};
        }
    }

  private:
    void add(const std::string& name, tools::FunctionController::Fn fn)
    {
        controllers_.push_back(std::make_unique<tools::FunctionController>(
            name, "", Json{{"type", "object"}}, std::move(fn)));
    }

    tools::ControllerList controllers_;
};

McpConfig make_test_config()
{
    McpConfig config;
    config.server_name = "test";
    config.logger = Logger("executor-test", LogLevel::Error);
    config.controller_registry = std::make_unique<TestRegistry>();
    return config;
}

template <typename Fn>
int mcp_error_code(Fn fn, std::string* message = nullptr)
{
    try
    {
        fn();
    }
    catch (const McpError& e)
    {
        if (message)
            *message = e.what();
        return e.code();
    }
    return 0;
}
} // namespace

int main()
{
    auto config = make_test_config();

    std::cout << "Test: dispatch..." << std::endl;
    {
        auto out = execute_tool("ok", Json{{"v", "1"}}, config);
        assert(out.size() == 1);
        assert(text_of(out[0]) == "ok 1");
    }
    std::cout << "  [PASS]" << std::endl;

    std::cout << "Test: first matching controller wins..." << std::endl;
    {
        auto out = execute_tool("dup-x", Json::object(), config);
        assert(text_of(out[0]) == "first:dup-x");
    }
    std::cout << "  [PASS]" << std::endl;

    std::cout << "Test: unknown tool..." << std::endl;
    {
        std::string message;
        assert(mcp_error_code([&] { execute_tool("nope", Json::object(), config); }, &message) ==
               404);
        assert(message == "Unknown tool.");

        McpConfig empty;
        empty.logger = Logger("empty", LogLevel::Error);
        assert(mcp_error_code([&] { execute_tool("ok", Json::object(), empty); }) == 404);
    }
    std::cout << "  [PASS]" << std::endl;

    std::cout << "Test: validation and unexpected errors become internal errors..." << std::endl;
    {
        std::string message;
        assert(mcp_error_code([&] { execute_tool("invalid", Json::object(), config); },
                              &message) == 500);
        assert(message == "Value is required.");

        assert(mcp_error_code([&] { execute_tool("crash", Json::object(), config); }, &message) ==
               500);
        assert(message == "boom");

        assert(mcp_error_code([&] { execute_tool("odd", Json::object(), config); }, &message) ==
               500);
        assert(message == "Unknown error");
    }
    std::cout << "  [PASS]" << std::endl;

    std::cout << "Test: registry recovers domain errors..." << std::endl;
    {
        auto out = execute_tool("recoverable", Json::object(), config);
        assert(out.size() == 1);
        assert(text_of(out[0]) == "handled recoverable: tool not installed");
    }
    std::cout << "  [PASS]" << std::endl;

    std::cout << "Test: errors the registry re-raises propagate unchanged..." << std::endl;
    {
        bool caught = false;
        try
        {
            execute_tool("fatal", Json::object(), config);
        }
        catch (const FatalDomainError& e)
        {
            caught = std::string(e.what()) == "cannot recover";
        }
        assert(caught);
    }
    std::cout << "  [PASS]" << std::endl;

    std::cout << "\n[OK] executor tests passed" << std::endl;
    return 0;
}
