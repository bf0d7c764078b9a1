#pragma once
#include "client.hpp"
#include "content.hpp"
#include <optional>

namespace termineer {

// One MCP server: connection, session and its tool catalog.
class McpProvider {
public:
    McpProvider(std::string server_name, McpServerConfig cfg);
    ~McpProvider();

    McpProvider(const McpProvider&) = delete;
    McpProvider& operator=(const McpProvider&) = delete;

    // Connect, initialize and load the catalog. Throws McpError.
    void start();
    void shutdown();

    void refresh_tools();
    std::vector<McpToolInfo> list_tools() const;
    std::optional<McpToolInfo> get_tool(const std::string& name) const;

    // Throws McpError(tool_not_found | tool_execution_error | ...).
    std::vector<Content> get_tool_content(const std::string& name, const nlohmann::json& args,
                                          const CancelCheck& cancelled = nullptr);

    const std::string& server_name() const { return server_name_; }
    nlohmann::json server_info() const;
    bool connected() const { return conn_ && conn_->connected(); }

private:
    std::string server_name_;
    McpServerConfig config_;
    std::shared_ptr<McpConnection> conn_;
    std::unique_ptr<McpClient> client_;

    mutable std::mutex catalog_mutex_;
    std::vector<McpToolInfo> tools_;
};

using McpProviderPtr = std::shared_ptr<McpProvider>;

} // namespace termineer
