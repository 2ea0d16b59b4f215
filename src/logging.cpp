#include "mcpcommons/logging.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace mcpcommons
{

namespace
{
std::string to_iso8601_now()
{
    using clock = std::chrono::system_clock;
    auto now = clock::now();
    std::time_t t = clock::to_time_t(now);
#ifdef _WIN32
    std::tm tm;
    gmtime_s(&tm, &t);
#else
    std::tm tm;
    gmtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}
} // namespace

std::string to_string(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

LogLevel log_level_from_string(const std::string& name)
{
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG")
        return LogLevel::Debug;
    if (upper == "WARNING" || upper == "WARN")
        return LogLevel::Warning;
    if (upper == "ERROR")
        return LogLevel::Error;
    return LogLevel::Info;
}

LogSink stderr_sink()
{
    // Shared so that interleaved lines from a background server thread stay whole
    auto mutex = std::make_shared<std::mutex>();
    return [mutex](LogLevel level, const std::string& logger, const std::string& message)
    {
        std::lock_guard<std::mutex> lock(*mutex);
        std::cerr << to_iso8601_now() << " - " << logger << " - " << to_string(level) << " - "
                  << message << std::endl;
    };
}

Logger::Logger(std::string name, LogLevel level, LogSink sink)
    : name_(std::move(name)), level_(level), sink_(std::move(sink))
{
}

Logger Logger::child(const std::string& name) const
{
    return Logger(name, level_, sink_);
}

void Logger::log(LogLevel level, const std::string& message) const
{
    if (!enabled(level) || !sink_)
        return;
    sink_(level, name_, message);
}

} // namespace mcpcommons
