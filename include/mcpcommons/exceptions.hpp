#pragma once
#include "mcpcommons/types.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace mcpcommons
{

/// Tool error codes reported in JSON-RPC error objects.
namespace error_code
{
constexpr int UnknownTool = 404;
constexpr int Internal = 500;
} // namespace error_code

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/// A caller-supplied argument is missing or malformed.
struct ValidationError : public Error
{
    using Error::Error;
};

struct TransportError : public Error
{
    using Error::Error;
};

/// Root of the recoverable, registry-specific errors. A controller that throws one of these
/// hands the failure to its registry's error_handler instead of failing the call.
struct CommonsError : public Error
{
    using Error::Error;
};

/// Protocol-level failure carrying the code sent back to the client.
class McpError : public Error
{
  public:
    explicit McpError(ErrorData error) : Error(error.message), error_(std::move(error)) {}
    McpError(int code, const std::string& message) : McpError(ErrorData{code, message}) {}

    const ErrorData& error() const
    {
        return error_;
    }
    int code() const
    {
        return error_.code;
    }

  private:
    ErrorData error_;
};

} // namespace mcpcommons
