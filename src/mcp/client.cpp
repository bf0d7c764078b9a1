#include "client.hpp"

namespace termineer {

nlohmann::json McpClient::initialize(const CancelCheck& cancelled) {
    nlohmann::json params = {
        {"protocolVersion", MCP_PROTOCOL_VERSION},
        {"capabilities", {{"roots", {{"listChanged", true}}}}},
        {"clientInfo", {{"name", CLIENT_NAME}, {"version", CLIENT_VERSION}}}
    };

    nlohmann::json result;
    try {
        result = conn_->send_request("initialize", params, cancelled, std::chrono::seconds(30));
    } catch (const McpError& e) {
        throw McpError(McpErrorKind::initialization_error,
                       "MCP server '" + conn_->name() + "' failed to initialize: " + e.what());
    }
    if (!result.is_object() || !result.contains("protocolVersion")) {
        throw McpError(McpErrorKind::initialization_error,
                       "MCP server '" + conn_->name() + "' returned an invalid initialize result");
    }

    conn_->send_notification("notifications/initialized");

    std::lock_guard<std::mutex> lock(mutex_);
    server_info_ = result;
    initialized_ = true;
    return result;
}

bool McpClient::initialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

nlohmann::json McpClient::server_info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return server_info_;
}

void McpClient::require_initialized() const {
    if (!initialized()) {
        throw McpError(McpErrorKind::protocol_error,
                       "MCP server '" + conn_->name() + "' used before initialization");
    }
}

std::vector<McpToolInfo> McpClient::list_tools() {
    require_initialized();
    std::vector<McpToolInfo> tools;
    std::string cursor;
    do {
        nlohmann::json params = nlohmann::json::object();
        if (!cursor.empty()) params["cursor"] = cursor;
        auto result = conn_->send_request("tools/list", params);
        if (!result.is_object() || !result.contains("tools") || !result["tools"].is_array()) {
            throw McpError(McpErrorKind::protocol_error,
                           "MCP server '" + conn_->name() + "': tools/list result has no tools array");
        }
        for (auto& t : result["tools"]) {
            if (!t.is_object()) {
                throw McpError(McpErrorKind::protocol_error,
                               "MCP server '" + conn_->name() + "': tools/list entry is not an object");
            }
            McpToolInfo info;
            info.server_name = conn_->name();
            info.name = t.contains("name") && t["name"].is_string() ? t["name"].get<std::string>() : "";
            info.description = t.contains("description") && t["description"].is_string()
                               ? t["description"].get<std::string>() : "";
            if (t.contains("inputSchema")) {
                info.input_schema = t["inputSchema"];
            } else {
                info.input_schema = {{"type", "object"}, {"properties", nlohmann::json::object()}};
            }
            if (!info.name.empty()) tools.push_back(std::move(info));
        }
        cursor = result.contains("nextCursor") && result["nextCursor"].is_string()
                 ? result["nextCursor"].get<std::string>() : "";
    } while (!cursor.empty());
    return tools;
}

nlohmann::json McpClient::call_tool(const std::string& name, const nlohmann::json& arguments,
                                    const CancelCheck& cancelled) {
    require_initialized();
    return conn_->send_request("tools/call", {{"name", name}, {"arguments", arguments}}, cancelled);
}

} // namespace termineer
