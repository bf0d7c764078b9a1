#include "mcp_config.hpp"
#include "../utils.hpp"
#include <iostream>

namespace termineer {

nlohmann::json McpServerConfig::to_json() const {
    nlohmann::json j;
    j["command"] = command;
    if (!args.empty()) j["args"] = args;
    if (!env.empty()) j["env"] = env;
    return j;
}

McpServerConfig McpServerConfig::from_json(const nlohmann::json& j) {
    McpServerConfig c;
    c.command = j.value("command", "");
    if (j.contains("args") && j["args"].is_array()) {
        for (auto& a : j["args"]) {
            if (a.is_string()) c.args.push_back(a.get<std::string>());
        }
    }
    if (j.contains("env") && j["env"].is_object()) {
        for (auto& [k, v] : j["env"].items()) {
            if (v.is_string()) c.env[k] = v.get<std::string>();
        }
    }
    return c;
}

McpConfig McpConfig::from_json(const nlohmann::json& j) {
    McpConfig c;
    if (!j.is_object() || !j.contains("mcpServers") || !j["mcpServers"].is_object()) return c;
    for (auto& [name, srv] : j["mcpServers"].items()) {
        if (!srv.is_object()) continue;
        c.servers[name] = McpServerConfig::from_json(srv);
    }
    return c;
}

nlohmann::json McpConfig::to_json() const {
    nlohmann::json j;
    j["mcpServers"] = nlohmann::json::object();
    for (auto& [name, srv] : servers) j["mcpServers"][name] = srv.to_json();
    return j;
}

McpConfig McpConfig::load(const std::string& path) {
    if (!fs::exists(path)) return {};
    try {
        return from_json(nlohmann::json::parse(read_file(path)));
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[warn] Failed to parse MCP config " << path << ": " << e.what() << "\n";
        return {};
    }
}

McpConfig McpConfig::merge(const McpConfig& user, const McpConfig& local) {
    McpConfig merged = user;
    for (auto& [name, srv] : local.servers) merged.servers[name] = srv;
    return merged;
}

McpConfig McpConfig::load_default() {
    return merge(load(user_mcp_config_path()), load(local_mcp_config_path()));
}

std::string local_mcp_config_path() {
    return ".termineer/config.json";
}

std::string user_mcp_config_path() {
    return home_dir() + "/.termineer/mcp/config.json";
}

} // namespace termineer
