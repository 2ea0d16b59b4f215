#include "mcpcommons/cli/command_runner.hpp"

#include "process.hpp"

namespace mcpcommons::cli
{

std::optional<std::string> ProcessCommandRunner::which(const std::string& program) const
{
    return process::find_executable(program);
}

CommandResult ProcessCommandRunner::run(const std::string& program,
                                        const std::vector<std::string>& args) const
{
    try
    {
        auto finished = process::run(program, args);
        return CommandResult{finished.exit_code, std::move(finished.output),
                             std::move(finished.error_output)};
    }
    catch (const process::ProcessError& e)
    {
        throw CommandNotFoundError(program, e.what());
    }
}

std::string run_command(const CommandRunner& runner, const std::string& program,
                        const std::vector<std::string>& args)
{
    if (!runner.which(program))
        throw CommandNotFoundError(program, "'" + program + "' is not available in PATH");

    auto result = runner.run(program, args);
    if (result.exit_code != 0)
    {
        std::string message = "Command '" + format_command(program, args) +
                              "' returned non-zero exit status " +
                              std::to_string(result.exit_code) + ".";
        throw CommandFailedError(message, result.exit_code, trim(result.error_output));
    }
    return trim(result.output);
}

std::string format_command(const std::string& program, const std::vector<std::string>& args)
{
    std::string line = program;
    for (const auto& arg : args)
        line += " " + arg;
    return line;
}

std::string trim(const std::string& text)
{
    const char* whitespace = " \t\r\n\f\v";
    auto begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos)
        return {};
    auto end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

std::string powershell_escape(const std::string& text)
{
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text)
    {
        if (c == '`' || c == '"' || c == '$')
            escaped.push_back('`');
        escaped.push_back(c);
    }
    return escaped;
}

std::vector<std::string> split_lines(const std::string& text)
{
    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= text.size())
    {
        size_t end = text.find('\n', start);
        if (end == std::string::npos)
            end = text.size();
        std::string line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        lines.push_back(std::move(line));
        start = end + 1;
    }
    return lines;
}

} // namespace mcpcommons::cli
