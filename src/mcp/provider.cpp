#include "provider.hpp"
#include <iostream>

namespace termineer {

McpProvider::McpProvider(std::string server_name, McpServerConfig cfg)
    : server_name_(std::move(server_name)), config_(std::move(cfg)) {}

McpProvider::~McpProvider() {
    shutdown();
}

void McpProvider::start() {
    conn_ = std::make_shared<McpConnection>(server_name_, config_);
    conn_->connect();
    client_ = std::make_unique<McpClient>(conn_);
    try {
        client_->initialize();
        refresh_tools();
    } catch (const McpError& e) {
        conn_->close();
        if (e.kind() == McpErrorKind::initialization_error) throw;
        throw McpError(McpErrorKind::initialization_error,
                       "MCP server '" + server_name_ + "' failed to start: " + e.what());
    }
}

void McpProvider::shutdown() {
    if (conn_) conn_->close();
}

void McpProvider::refresh_tools() {
    if (!client_) {
        throw McpError(McpErrorKind::protocol_error, "MCP server '" + server_name_ + "' not started");
    }
    auto tools = client_->list_tools();
    std::lock_guard<std::mutex> lock(catalog_mutex_);
    tools_ = std::move(tools);
}

std::vector<McpToolInfo> McpProvider::list_tools() const {
    std::lock_guard<std::mutex> lock(catalog_mutex_);
    return tools_;
}

std::optional<McpToolInfo> McpProvider::get_tool(const std::string& name) const {
    std::lock_guard<std::mutex> lock(catalog_mutex_);
    for (auto& t : tools_) {
        if (t.name == name) return t;
    }
    return std::nullopt;
}

std::vector<Content> McpProvider::get_tool_content(const std::string& name, const nlohmann::json& args,
                                                   const CancelCheck& cancelled) {
    if (!client_) {
        throw McpError(McpErrorKind::protocol_error, "MCP server '" + server_name_ + "' not started");
    }
    if (!get_tool(name)) {
        throw McpError(McpErrorKind::tool_not_found,
                       "Tool '" + name + "' not found on MCP server '" + server_name_ + "'");
    }

    auto result = client_->call_tool(name, args, cancelled);
    if (!result.is_object()) {
        throw McpError(McpErrorKind::protocol_error,
                       "MCP server '" + server_name_ + "' returned a non-object result for tool '" + name + "'");
    }
    auto content = result.find("content");
    auto contents = convert_mcp_contents(content != result.end() ? *content : nlohmann::json::array());
    auto is_error = result.find("isError");
    if (is_error != result.end() && is_error->is_boolean() && is_error->get<bool>()) {
        std::string msg = contents_text(contents);
        throw McpError(McpErrorKind::tool_execution_error,
                       msg.empty() ? "MCP tool '" + name + "' failed" : msg);
    }
    return contents;
}

nlohmann::json McpProvider::server_info() const {
    return client_ ? client_->server_info() : nlohmann::json::object();
}

} // namespace termineer
