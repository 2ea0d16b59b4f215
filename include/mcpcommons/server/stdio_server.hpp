#pragma once
#include "mcpcommons/logging.hpp"
#include "mcpcommons/mcp/handler.hpp"
#include "mcpcommons/types.hpp"

#include <atomic>
#include <iosfwd>
#include <thread>

namespace mcpcommons::server
{

/**
 * STDIO-based MCP server wrapper for line-delimited JSON-RPC communication.
 *
 * Reads one JSON-RPC message per line from the input stream, hands it to the handler and
 * writes the response (if any) as one line to the output stream. Requests are handled to
 * completion one at a time, so responses come out in request order.
 *
 * Usage:
 *   auto handler = mcpcommons::mcp::make_mcp_handler(config);
 *   StdioServerWrapper server(handler);
 *   server.run();  // Blocking - runs until EOF or stop() is called
 *
 * Lifecycle: Created -> Bound -> Running -> Draining -> Closed. A wrapper runs at most once;
 * the Draining -> Closed step (flush, shutdown log) happens however the loop ended.
 */
class StdioServerWrapper
{
  public:
    enum class State
    {
        Created,
        Bound,
        Running,
        Draining,
        Closed
    };

    /**
     * Construct a server bound to std::cin / std::cout.
     *
     * @param handler Function that processes JSON-RPC requests and returns responses.
     *                A null response means nothing is written.
     */
    explicit StdioServerWrapper(mcp::McpHandler handler, Logger logger = Logger("mcpcommons.stdio"));

    /// Construct a server over arbitrary streams (tests, pipes).
    StdioServerWrapper(mcp::McpHandler handler, std::istream& in, std::ostream& out,
                       Logger logger = Logger("mcpcommons.stdio"));

    ~StdioServerWrapper();

    StdioServerWrapper(const StdioServerWrapper&) = delete;
    StdioServerWrapper& operator=(const StdioServerWrapper&) = delete;

    /**
     * Start the server (blocking mode).
     *
     * Runs until:
     * - EOF on the input stream
     * - stop() is called from another thread (checked between messages)
     * - the transport fails (unreadable input, unwritable output)
     *
     * A single bad request never ends the loop; it is answered with an error response.
     *
     * @return true if the loop ended normally, false on transport failure or if the
     *         server was already started once
     */
    bool run();

    /**
     * Start the server in background (non-blocking mode).
     *
     * @return true if thread started successfully
     */
    bool start_async();

    /**
     * Stop the server.
     *
     * Signals the loop to exit after the current message. If start_async() was used, joins
     * the background thread. Safe to call multiple times.
     */
    void stop();

    bool running() const
    {
        return state_.load() == State::Running;
    }

    State state() const
    {
        return state_.load();
    }

    /// True once the loop has ended because of a transport failure.
    bool failed() const
    {
        return failed_.load();
    }

  private:
    bool bind();
    bool serve();
    void run_loop();
    std::string process_line(const std::string& line);

    mcp::McpHandler handler_;
    std::istream& in_;
    std::ostream& out_;
    Logger logger_;
    std::atomic<State> state_{State::Created};
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> failed_{false};
    std::thread thread_;
};

const char* to_string(StdioServerWrapper::State state);

} // namespace mcpcommons::server
