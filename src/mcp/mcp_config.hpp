#pragma once
#include <string>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>

namespace termineer {

struct McpServerConfig {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;

    nlohmann::json to_json() const;
    static McpServerConfig from_json(const nlohmann::json& j);
};

struct McpConfig {
    std::map<std::string, McpServerConfig> servers;

    // { "mcpServers": { NAME: {command, args, env} } }
    static McpConfig from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    // Missing file gives an empty config; a malformed one logs a warning.
    static McpConfig load(const std::string& path);

    // Entries in local replace same-named entries in user.
    static McpConfig merge(const McpConfig& user, const McpConfig& local);

    // ~/.termineer/mcp/config.json merged with ./.termineer/config.json
    static McpConfig load_default();
};

std::string local_mcp_config_path();
std::string user_mcp_config_path();

} // namespace termineer
