#include "mcpcommons/cli/command_runner.hpp"

#include <cassert>
#include <iostream>
#include <string>

using namespace mcpcommons::cli;

int main()
{
    ProcessCommandRunner runner;

    std::cout << "Test: PATH lookup..." << std::endl;
    {
        auto sh = runner.which("sh");
        assert(sh.has_value());
        assert(sh->find("sh") != std::string::npos);
        assert(!runner.which("mcpcommons-no-such-program"));
    }
    std::cout << "  [PASS]" << std::endl;

    std::cout << "Test: stdout is captured and trimmed..." << std::endl;
    {
        assert(run_command(runner, "sh", {"-c", "echo '  hello  '"}) == "hello");

        // Arguments reach the child untouched, spaces included
        assert(run_command(runner, "sh", {"-c", "printf '%s|%s' \"$0\" \"$1\"", "a b", "c"}) ==
               "a b|c");
    }
    std::cout << "  [PASS]" << std::endl;

    std::cout << "Test: raw result keeps both streams..." << std::endl;
    {
        auto result = runner.run("sh", {"-c", "echo out; echo err >&2; exit 4"});
        assert(result.exit_code == 4);
        assert(result.output == "out\n");
        assert(result.error_output == "err\n");
    }
    std::cout << "  [PASS]" << std::endl;

    std::cout << "Test: non-zero exit..." << std::endl;
    {
        bool caught = false;
        try
        {
            run_command(runner, "sh", {"-c", "echo oops >&2; exit 3"});
        }
        catch (const CommandFailedError& e)
        {
            caught = true;
            assert(e.exit_code() == 3);
            assert(e.error_output() == "oops");
            assert(std::string(e.what()) ==
                   "Command 'sh -c echo oops >&2; exit 3' returned non-zero exit status 3.");
        }
        assert(caught);
    }
    std::cout << "  [PASS]" << std::endl;

    std::cout << "Test: missing programs..." << std::endl;
    {
        bool caught = false;
        try
        {
            run_command(runner, "mcpcommons-no-such-program", {});
        }
        catch (const CommandNotFoundError& e)
        {
            caught = true;
            assert(e.program() == "mcpcommons-no-such-program");
            assert(std::string(e.what()) ==
                   "'mcpcommons-no-such-program' is not available in PATH");
        }
        assert(caught);

        caught = false;
        try
        {
            runner.run("/nonexistent/mcpcommons-no-such-program", {});
        }
        catch (const CommandNotFoundError&)
        {
            caught = true;
        }
        assert(caught);
    }
    std::cout << "  [PASS]" << std::endl;

    std::cout << "Test: signals, stdin and large output..." << std::endl;
    {
        auto killed = runner.run("sh", {"-c", "kill -9 $$"});
        assert(killed.exit_code == 128 + 9);

        // stdin is the null device, so this returns at once
        auto cat = runner.run("sh", {"-c", "cat"});
        assert(cat.exit_code == 0);
        assert(cat.output.empty());

        // More than a pipe buffer on both streams at once
        auto big = runner.run(
            "sh", {"-c", "i=0; while [ $i -lt 20000 ]; do echo line$i; echo err$i >&2; "
                         "i=$((i+1)); done"});
        assert(big.exit_code == 0);
        auto lines = split_lines(trim(big.output));
        assert(lines.size() == 20000);
        assert(lines.front() == "line0");
        assert(lines.back() == "line19999");
        assert(split_lines(trim(big.error_output)).size() == 20000);
    }
    std::cout << "  [PASS]" << std::endl;

    std::cout << "Test: text helpers..." << std::endl;
    {
        assert(format_command("choco", {"list"}) == "choco list");
        assert(format_command("choco", {}) == "choco");
        assert(trim(" \t a b \r\n") == "a b");
        assert(trim("   ").empty());

        assert(powershell_escape("plain text") == "plain text");
        assert(powershell_escape("say \"hi\" to $env:USER `now`") ==
               "say `\"hi`\" to `$env:USER ``now``");

        auto lines = split_lines("a\r\nb\n\nc");
        assert(lines.size() == 4);
        assert(lines[0] == "a");
        assert(lines[1] == "b");
        assert(lines[2].empty());
        assert(lines[3] == "c");
        assert(split_lines("").size() == 1);
    }
    std::cout << "  [PASS]" << std::endl;

    std::cout << "\n[OK] command runner tests passed" << std::endl;
    return 0;
}
