#pragma once
#include <stdexcept>
#include <string>

namespace termineer {

enum class McpErrorKind {
    connection_error,
    server_disconnected,
    protocol_error,
    tool_not_found,
    tool_execution_error,
    initialization_error,
    json_rpc_error,
    timeout,
    cancelled
};

class McpError : public std::runtime_error {
public:
    McpError(McpErrorKind kind, const std::string& msg, int code = 0)
        : std::runtime_error(msg), kind_(kind), code_(code) {}

    McpErrorKind kind() const { return kind_; }
    // JSON-RPC error code for json_rpc_error.
    int code() const { return code_; }

private:
    McpErrorKind kind_;
    int code_;
};

} // namespace termineer
