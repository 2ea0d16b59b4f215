#pragma once
#include "mcpcommons/cli/command_runner.hpp"

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace mcpcommons::test
{

/// Scripted CommandRunner: programs listed in `installed` are found on PATH, run() answers
/// from `results` keyed by "program arg1 arg2" and records every call.
class FakeRunner : public cli::CommandRunner
{
  public:
    struct Call
    {
        std::string program;
        std::vector<std::string> args;
    };

    std::set<std::string> installed;
    std::map<std::string, cli::CommandResult> results;
    /// Programs whose run() fails to start
    std::set<std::string> unlaunchable;
    /// Answer for command lines nobody scripted
    cli::CommandResult fallback{0, "", ""};

    std::optional<std::string> which(const std::string& program) const override
    {
        if (installed.count(program) == 0)
            return std::nullopt;
        return "/usr/bin/" + program;
    }

    cli::CommandResult run(const std::string& program,
                           const std::vector<std::string>& args) const override
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back(Call{program, args});
        }
        if (unlaunchable.count(program))
            throw cli::CommandNotFoundError(program, "cannot start " + program);

        auto it = results.find(cli::format_command(program, args));
        if (it != results.end())
            return it->second;
        return fallback;
    }

    void respond(const std::string& command_line, int exit_code, const std::string& output,
                 const std::string& error_output = "")
    {
        results[command_line] = cli::CommandResult{exit_code, output, error_output};
    }

    std::vector<Call> calls() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    Call last_call() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_.back();
    }

  private:
    mutable std::mutex mutex_;
    mutable std::vector<Call> calls_;
};

} // namespace mcpcommons::test
