// Blocking subprocess execution for the package-manager adapters.
// POSIX and Win32 implementations live in process_posix.cpp / process_win32.cpp.

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace mcpcommons::process
{

/// Exception thrown when a process cannot be spawned or waited for
class ProcessError : public std::runtime_error
{
  public:
    explicit ProcessError(const std::string& message) : std::runtime_error(message) {}
};

/// Outcome of a finished process
struct ProcessResult
{
    int exit_code = -1;
    std::string output;       // everything written to stdout
    std::string error_output; // everything written to stderr
};

/// Spawn `executable` with `args`, wait for it to exit and collect its output.
///
/// The child's stdin is the null device. On POSIX a child killed by a signal reports
/// 128 + signal number as its exit code.
/// @throws ProcessError if the process could not be started (including exec failures)
ProcessResult run(const std::string& executable, const std::vector<std::string>& args);

/// Find an executable in the system PATH
std::optional<std::string> find_executable(const std::string& name);

} // namespace mcpcommons::process
