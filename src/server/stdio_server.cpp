#include "mcpcommons/server/stdio_server.hpp"

#include "mcpcommons/exceptions.hpp"

#include <iostream>
#include <string>

namespace mcpcommons::server
{

namespace
{
constexpr int kParseError = -32700;

std::string to_line(const mcpcommons::Json& message)
{
    // Tool output is not guaranteed to be valid UTF-8
    return message.dump(-1, ' ', false, mcpcommons::Json::error_handler_t::replace);
}

mcpcommons::Json error_response(const mcpcommons::Json& id, int code, const std::string& message)
{
    mcpcommons::Json response;
    response["jsonrpc"] = "2.0";
    response["id"] = id;
    response["error"] = {{"code", code}, {"message", message}};
    return response;
}

// Moves the wrapper through Draining to Closed however serve() is left.
class CloseGuard
{
  public:
    CloseGuard(std::atomic<StdioServerWrapper::State>& state, std::ostream& out,
               const Logger& logger)
        : state_(state), out_(out), logger_(logger)
    {
    }

    ~CloseGuard()
    {
        state_ = StdioServerWrapper::State::Draining;
        out_.flush();
        logger_.info("Server shutting down");
        state_ = StdioServerWrapper::State::Closed;
    }

    CloseGuard(const CloseGuard&) = delete;
    CloseGuard& operator=(const CloseGuard&) = delete;

  private:
    std::atomic<StdioServerWrapper::State>& state_;
    std::ostream& out_;
    const Logger& logger_;
};
} // namespace

const char* to_string(StdioServerWrapper::State state)
{
    switch (state)
    {
    case StdioServerWrapper::State::Created:
        return "created";
    case StdioServerWrapper::State::Bound:
        return "bound";
    case StdioServerWrapper::State::Running:
        return "running";
    case StdioServerWrapper::State::Draining:
        return "draining";
    case StdioServerWrapper::State::Closed:
        return "closed";
    }
    return "closed";
}

StdioServerWrapper::StdioServerWrapper(mcp::McpHandler handler, Logger logger)
    : StdioServerWrapper(std::move(handler), std::cin, std::cout, std::move(logger))
{
}

StdioServerWrapper::StdioServerWrapper(mcp::McpHandler handler, std::istream& in,
                                       std::ostream& out, Logger logger)
    : handler_(std::move(handler)), in_(in), out_(out), logger_(std::move(logger))
{
}

StdioServerWrapper::~StdioServerWrapper()
{
    stop();
}

bool StdioServerWrapper::bind()
{
    State expected = State::Created;
    if (!state_.compare_exchange_strong(expected, State::Bound))
    {
        logger_.warning(std::string("Server cannot start from state ") + to_string(expected));
        return false;
    }
    stop_requested_ = false;
    failed_ = false;
    return true;
}

std::string StdioServerWrapper::process_line(const std::string& line)
{
    mcpcommons::Json request;
    try
    {
        request = mcpcommons::Json::parse(line);
    }
    catch (const mcpcommons::Json::parse_error& e)
    {
        logger_.error(std::string("Invalid JSON received: ") + e.what());
        return to_line(error_response(mcpcommons::Json(), kParseError, "Parse error"));
    }

    mcpcommons::Json response;
    try
    {
        response = handler_(request);
    }
    catch (const std::exception& e)
    {
        logger_.error(std::string("Unhandled error processing request: ") + e.what());
        const auto id = request.is_object() && request.contains("id") ? request["id"]
                                                                      : mcpcommons::Json();
        response = error_response(id, error_code::Internal, e.what());
    }
    catch (...)
    {
        logger_.error("Unhandled non-standard exception processing request");
        const auto id = request.is_object() && request.contains("id") ? request["id"]
                                                                      : mcpcommons::Json();
        response = error_response(id, error_code::Internal, "Unknown error");
    }

    if (response.is_null())
        return std::string();
    return to_line(response);
}

void StdioServerWrapper::run_loop()
{
    std::string line;

    while (!stop_requested_ && std::getline(in_, line))
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty())
            continue;

        const std::string payload = process_line(line);
        if (payload.empty())
            continue;

        // Write JSON-RPC response (line-delimited)
        out_ << payload << '\n';
        out_.flush();
        if (!out_)
            throw TransportError("Failed to write response to output stream");
    }

    if (in_.bad())
        throw TransportError("Failed to read from input stream");
}

bool StdioServerWrapper::serve()
{
    CloseGuard guard(state_, out_, logger_);
    state_ = State::Running;
    logger_.debug("Server loop running");
    try
    {
        run_loop();
    }
    catch (const TransportError& e)
    {
        logger_.error(std::string("Transport failure: ") + e.what());
        failed_ = true;
    }
    return !failed_;
}

bool StdioServerWrapper::run()
{
    if (!bind())
        return false;
    return serve();
}

bool StdioServerWrapper::start_async()
{
    if (!bind())
        return false;

    thread_ = std::thread([this]() { serve(); });

    return true;
}

void StdioServerWrapper::stop()
{
    stop_requested_ = true;

    // If running in background thread, join it
    if (thread_.joinable())
        thread_.join();

    State expected = State::Created;
    state_.compare_exchange_strong(expected, State::Closed);
}

} // namespace mcpcommons::server
