#pragma once
#include "mcpcommons/exceptions.hpp"

#include <optional>
#include <string>
#include <vector>

namespace mcpcommons::cli
{

/// Exit status and captured output of one external command
struct CommandResult
{
    int exit_code{0};
    std::string output;
    std::string error_output;
};

/// The program is not on PATH or could not be started.
class CommandNotFoundError : public Error
{
  public:
    explicit CommandNotFoundError(std::string program, const std::string& message)
        : Error(message), program_(std::move(program))
    {
    }

    const std::string& program() const
    {
        return program_;
    }

  private:
    std::string program_;
};

/// The program ran and exited with a non-zero status.
class CommandFailedError : public Error
{
  public:
    CommandFailedError(const std::string& message, int exit_code, std::string error_output)
        : Error(message), exit_code_(exit_code), error_output_(std::move(error_output))
    {
    }

    int exit_code() const
    {
        return exit_code_;
    }
    const std::string& error_output() const
    {
        return error_output_;
    }

  private:
    int exit_code_;
    std::string error_output_;
};

/// Seam between the package-manager services and the operating system.
///
/// Services only ever talk to a CommandRunner, so tests substitute a scripted fake for the
/// real process layer.
class CommandRunner
{
  public:
    virtual ~CommandRunner() = default;

    /// Full path of `program` when it can be found on PATH.
    virtual std::optional<std::string> which(const std::string& program) const = 0;

    /// Runs `program args...` to completion.
    /// @throws CommandNotFoundError when the program cannot be started
    virtual CommandResult run(const std::string& program,
                              const std::vector<std::string>& args) const = 0;
};

/// CommandRunner spawning real child processes.
class ProcessCommandRunner : public CommandRunner
{
  public:
    std::optional<std::string> which(const std::string& program) const override;
    CommandResult run(const std::string& program,
                      const std::vector<std::string>& args) const override;
};

/// Runs the command and returns its stdout with surrounding whitespace removed.
/// @throws CommandNotFoundError, CommandFailedError (non-zero exit)
std::string run_command(const CommandRunner& runner, const std::string& program,
                        const std::vector<std::string>& args);

/// "program arg1 arg2" for log and error messages.
std::string format_command(const std::string& program, const std::vector<std::string>& args);

std::string trim(const std::string& text);

/// Backtick-escapes '`', '"' and '$' so `text` stays literal inside a double-quoted
/// PowerShell string.
std::string powershell_escape(const std::string& text);

/// Splits on '\n', dropping a trailing '\r' from each line.
std::vector<std::string> split_lines(const std::string& text);

} // namespace mcpcommons::cli
