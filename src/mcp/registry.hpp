#pragma once
#include "provider.hpp"
#include <set>
#include <map>

namespace termineer {

// A server tool exposed under a flat name the agent can call directly.
struct NativeMcpTool {
    std::string native_name;
    std::string server_name;
    std::string tool_name;
};

struct McpServerResult {
    std::string name;
    bool ok = false;
    std::string error;
    size_t tool_count = 0;
};

// Process-wide set of started MCP servers and their native tool names.
class McpRegistry {
public:
    // reserved: built-in tool names; servers and tools may not shadow them.
    explicit McpRegistry(std::set<std::string> reserved);
    ~McpRegistry();

    static McpRegistry& instance();

    // Throws McpError. A server named like a built-in tool is rejected
    // before anything is spawned.
    void register_server(const std::string& name, const McpServerConfig& cfg);

    // Starts every configured server; failures are reported, not thrown.
    std::vector<McpServerResult> initialize_from_config(const McpConfig& cfg);

    std::optional<NativeMcpTool> find_native(const std::string& name) const;
    McpProviderPtr get_provider(const std::string& server_name) const;
    std::vector<std::string> server_names() const;
    std::vector<NativeMcpTool> native_tools() const;

    void shutdown();

private:
    std::set<std::string> reserved_;
    mutable std::mutex mutex_;
    std::map<std::string, McpProviderPtr> providers_;
    std::map<std::string, NativeMcpTool> natives_;

    void register_natives(const std::string& server_name, const std::vector<McpToolInfo>& tools);
};

} // namespace termineer
