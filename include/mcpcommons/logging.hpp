#pragma once

#include <functional>
#include <memory>
#include <string>

namespace mcpcommons
{

enum class LogLevel
{
    Debug,
    Info,
    Warning,
    Error
};

std::string to_string(LogLevel level);

/// Parses "DEBUG", "INFO", "WARNING"/"WARN", "ERROR" (case-insensitive). Unknown names map to Info.
LogLevel log_level_from_string(const std::string& name);

/// Receives every record at or above the logger's level.
using LogSink =
    std::function<void(LogLevel level, const std::string& logger, const std::string& message)>;

/// Sink writing "<timestamp> - <logger> - <LEVEL> - <message>" lines to stderr.
/// stdout carries the protocol, so nothing here ever writes to it.
LogSink stderr_sink();

/// Named logger passed by value into the components that log.
class Logger
{
  public:
    explicit Logger(std::string name = "mcpcommons", LogLevel level = LogLevel::Info,
                    LogSink sink = stderr_sink());

    /// Logger with the same level and sink under another name.
    Logger child(const std::string& name) const;

    const std::string& name() const
    {
        return name_;
    }
    LogLevel level() const
    {
        return level_;
    }
    bool enabled(LogLevel level) const
    {
        return level >= level_;
    }

    void log(LogLevel level, const std::string& message) const;
    void debug(const std::string& message) const
    {
        log(LogLevel::Debug, message);
    }
    void info(const std::string& message) const
    {
        log(LogLevel::Info, message);
    }
    void warning(const std::string& message) const
    {
        log(LogLevel::Warning, message);
    }
    void error(const std::string& message) const
    {
        log(LogLevel::Error, message);
    }

  private:
    std::string name_;
    LogLevel level_;
    LogSink sink_;
};

} // namespace mcpcommons
