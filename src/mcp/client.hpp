#pragma once
#include "connection.hpp"
#include <vector>
#include <mutex>

namespace termineer {

constexpr const char* MCP_PROTOCOL_VERSION = "2024-11-05";
constexpr const char* CLIENT_NAME = "termineer";
constexpr const char* CLIENT_VERSION = "0.1.0";

struct McpToolInfo {
    std::string server_name;
    std::string name;
    std::string description;
    nlohmann::json input_schema;
};

// MCP session on top of a connection: handshake, tools/list, tools/call.
class McpClient {
public:
    explicit McpClient(std::shared_ptr<McpConnection> conn) : conn_(std::move(conn)) {}

    // initialize + notifications/initialized. Returns the server's result.
    nlohmann::json initialize(const CancelCheck& cancelled = nullptr);
    bool initialized() const;
    nlohmann::json server_info() const;

    // Throws McpError(protocol_error) before initialize().
    std::vector<McpToolInfo> list_tools();
    // Raw tools/call result ({content[], isError?}).
    nlohmann::json call_tool(const std::string& name, const nlohmann::json& arguments,
                             const CancelCheck& cancelled = nullptr);

    McpConnection& connection() { return *conn_; }

private:
    std::shared_ptr<McpConnection> conn_;
    mutable std::mutex mutex_;
    bool initialized_ = false;
    nlohmann::json server_info_;

    void require_initialized() const;
};

} // namespace termineer
