#include "mcpcommons/exceptions.hpp"
#include "mcpcommons/tools/controller.hpp"

#include <cassert>
#include <cctype>
#include <cstdint>
#include <iostream>
#include <limits>
#include <string>

using namespace mcpcommons;

namespace
{
class EchoController : public tools::Controller
{
  public:
    EchoController()
        : Controller("echo", "Echoes its input.",
                     Json{{"type", "object"},
                          {"required", Json::array({"message"})},
                          {"properties", {{"message", {{"type", "string"}}}}}})
    {
    }

    std::vector<Content> execute(const std::string&, const Json& arguments) const override
    {
        return {make_text(tools::require_string(arguments, "message", "Message is required."))};
    }
};

template <typename Fn>
bool throws_validation(Fn fn, const std::string& expected = "")
{
    try
    {
        fn();
    }
    catch (const ValidationError& e)
    {
        return expected.empty() || e.what() == expected;
    }
    return false;
}
} // namespace

int main()
{
    std::cout << "Test: descriptor..." << std::endl;
    {
        EchoController echo;
        auto tool = echo.tool();
        assert(tool.name() == "echo");
        assert(echo.name() == "echo");
        assert(tool.description() == "Echoes its input.");
        assert(tool.input_schema()["required"][0] == "message");

        Json j = tool;
        assert(j["name"] == "echo");
        assert(j["inputSchema"]["type"] == "object");

        // Descriptors are stable across calls
        assert(echo.tool() == tool);
    }
    std::cout << "  [PASS]" << std::endl;

    std::cout << "Test: can_execute matches exactly..." << std::endl;
    {
        EchoController echo;
        assert(echo.can_execute("echo"));
        assert(!echo.can_execute("Echo"));
        assert(!echo.can_execute("echo2"));
        assert(!echo.can_execute(""));
    }
    std::cout << "  [PASS]" << std::endl;

    std::cout << "Test: execute..." << std::endl;
    {
        EchoController echo;
        auto out = echo.execute("echo", Json{{"message", "hi"}});
        assert(out.size() == 1);
        assert(text_of(out[0]) == "hi");
        assert(throws_validation([&] { echo.execute("echo", Json::object()); },
                                 "Message is required."));
    }
    std::cout << "  [PASS]" << std::endl;

    std::cout << "Test: function controller..." << std::endl;
    {
        tools::FunctionController upper("upper", "", Json{{"type", "object"}},
                                         [](const Json& args) -> std::vector<Content>
                                         {
                                             std::string s = args.value("s", "");
                                             for (auto& c : s)
                                                 c = static_cast<char>(std::toupper(c));
                                             return {make_text(s)};
                                         });
        assert(upper.can_execute("upper"));
        assert(text_of(upper.execute("upper", Json{{"s", "abc"}})[0]) == "ABC");

        // Empty description is left out of the descriptor
        Json j = upper.tool();
        assert(!j.contains("description"));
    }
    std::cout << "  [PASS]" << std::endl;

    std::cout << "Test: argument helpers..." << std::endl;
    {
        Json args = {{"name", "x"}, {"empty", ""}, {"none", nullptr}, {"num", 7}};
        assert(tools::require_string(args, "name", "m") == "x");
        assert(throws_validation([&] { tools::require_string(args, "empty", "m"); }, "m"));
        assert(tools::require_string(args, "empty", "m", true).empty());
        assert(throws_validation([&] { tools::require_string(args, "missing", "m", true); }, "m"));
        assert(throws_validation([&] { tools::require_string(args, "none", "m", true); }, "m"));

        assert(!tools::optional_string(args, "missing"));
        assert(!tools::optional_string(args, "none"));
        assert(*tools::optional_string(args, "empty") == "");
        assert(throws_validation([&] { tools::optional_string(args, "num"); }));

        assert(*tools::optional_int(args, "num") == 7);
        assert(!tools::optional_int(args, "missing"));
        assert(throws_validation([&] { tools::optional_int(args, "name"); }));

        // Integers that do not fit an int are rejected, not wrapped
        Json wide = {{"big", 4294967297LL},
                     {"huge", std::numeric_limits<std::uint64_t>::max()},
                     {"low", -4294967297LL},
                     {"max", std::numeric_limits<int>::max()},
                     {"min", std::numeric_limits<int>::min()}};
        assert(throws_validation([&] { tools::optional_int(wide, "big"); },
                                 "Argument 'big' is out of range."));
        assert(throws_validation([&] { tools::optional_int(wide, "huge"); },
                                 "Argument 'huge' is out of range."));
        assert(throws_validation([&] { tools::optional_int(wide, "low"); },
                                 "Argument 'low' is out of range."));
        assert(*tools::optional_int(wide, "max") == std::numeric_limits<int>::max());
        assert(*tools::optional_int(wide, "min") == std::numeric_limits<int>::min());

        // Non-object arguments carry nothing
        assert(!tools::optional_string(Json::array(), "name"));
    }
    std::cout << "  [PASS]" << std::endl;

    std::cout << "\n[OK] controller tests passed" << std::endl;
    return 0;
}
