// Drives the built mcp-server-devkit binary over real pipes.

#include "mcpcommons/types.hpp"

#include <cassert>
#include <iostream>
#include <sstream>
#include <string>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

using mcpcommons::Json;

namespace
{
struct Finished
{
    int exit_code = -1;
    std::string output;
};

// Runs `binary args...` with `input` on stdin and collects stdout
Finished run_server(const std::string& binary, const std::vector<std::string>& args,
                    const std::string& input)
{
    int in_pipe[2];
    int out_pipe[2];
    if (pipe(in_pipe) != 0 || pipe(out_pipe) != 0)
    {
        std::cerr << "pipe failed\n";
        return {};
    }

    pid_t pid = fork();
    if (pid == 0)
    {
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        close(in_pipe[0]);
        close(in_pipe[1]);
        close(out_pipe[0]);
        close(out_pipe[1]);

        std::vector<char*> argv;
        argv.push_back(const_cast<char*>(binary.c_str()));
        for (const auto& arg : args)
            argv.push_back(const_cast<char*>(arg.c_str()));
        argv.push_back(nullptr);
        execv(binary.c_str(), argv.data());
        _exit(127);
    }

    close(in_pipe[0]);
    close(out_pipe[1]);

    // Requests are small enough to fit the pipe buffer, so write everything up front
    size_t written = 0;
    while (written < input.size())
    {
        ssize_t n = write(in_pipe[1], input.data() + written, input.size() - written);
        if (n <= 0)
            break;
        written += static_cast<size_t>(n);
    }
    close(in_pipe[1]);

    Finished finished;
    char buffer[4096];
    ssize_t n;
    while ((n = read(out_pipe[0], buffer, sizeof(buffer))) > 0)
        finished.output.append(buffer, static_cast<size_t>(n));
    close(out_pipe[0]);

    int status = 0;
    waitpid(pid, &status, 0);
    finished.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return finished;
}

std::vector<Json> responses(const std::string& output)
{
    std::vector<Json> parsed;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line))
        parsed.push_back(Json::parse(line));
    return parsed;
}
} // namespace

int main(int argc, char** argv)
{
    if (argc < 2)
    {
        std::cerr << "usage: mcpcommons_stdio_e2e <path to mcp-server-devkit>\n";
        return 1;
    }
    const std::string binary = argv[1];

    std::cout << "Test: full session..." << std::endl;
    {
        std::string input;
        input += R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2024-11-05","capabilities":{},"clientInfo":{"name":"e2e","version":"1"}}})"
                 "\n";
        input += R"({"jsonrpc":"2.0","method":"notifications/initialized"})"
                 "\n";
        input += R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})"
                 "\n";
        input += R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"encode_base64","arguments":{"text":"hello"}}})"
                 "\n";
        input += "this is not json\n";
        input += R"({"jsonrpc":"2.0","id":4,"method":"tools/call","params":{"name":"nope","arguments":{}}})"
                 "\n";
        input += R"({"jsonrpc":"2.0","id":5,"method":"tools/call","params":{"name":"decode_jwt","arguments":{"token":"eyJhbGciOiJub25lIiwidHlwIjoiSldUIn0.eyJ1c2VyIjoicm9uIn0."}}})"
                 "\n";

        auto finished = run_server(binary, {"--log-level", "ERROR"}, input);
        assert(finished.exit_code == 0);

        auto lines = responses(finished.output);
        assert(lines.size() == 6);

        assert(lines[0]["id"] == 1);
        assert(lines[0]["result"]["serverInfo"]["name"] == "Devkit MCP Server");

        assert(lines[1]["id"] == 2);
        assert(lines[1]["result"]["tools"].size() == 5);

        assert(lines[2]["id"] == 3);
        assert(lines[2]["result"]["content"][0]["text"] == "aGVsbG8=");

        assert(lines[3]["id"].is_null());
        assert(lines[3]["error"]["code"] == -32700);

        assert(lines[4]["id"] == 4);
        assert(lines[4]["error"]["code"] == 404);
        assert(lines[4]["error"]["message"] == "Unknown tool.");

        assert(lines[5]["id"] == 5);
        auto decoded = Json::parse(lines[5]["result"]["content"][0]["text"].get<std::string>());
        assert(decoded["data"]["user"] == "ron");
    }
    std::cout << "  [PASS]" << std::endl;

    std::cout << "Test: immediate EOF is a clean shutdown..." << std::endl;
    {
        auto finished = run_server(binary, {}, "");
        assert(finished.exit_code == 0);
        assert(finished.output.empty());
    }
    std::cout << "  [PASS]" << std::endl;

    std::cout << "Test: command line..." << std::endl;
    {
        auto version = run_server(binary, {"--version"}, "");
        assert(version.exit_code == 0);
        assert(version.output.find("mcp-server-devkit") == 0);

        auto bad = run_server(binary, {"--bogus"}, "");
        assert(bad.exit_code == 2);
        assert(bad.output.empty());
    }
    std::cout << "  [PASS]" << std::endl;

    std::cout << "\n[OK] stdio end-to-end tests passed" << std::endl;
    return 0;
}
