#include "registry.hpp"
#include "../tool_registry.hpp"
#include "../utils.hpp"
#include <iostream>

namespace termineer {

McpRegistry::McpRegistry(std::set<std::string> reserved) {
    for (auto& r : reserved) reserved_.insert(to_lower(r));
}

McpRegistry::~McpRegistry() {
    shutdown();
}

McpRegistry& McpRegistry::instance() {
    static McpRegistry registry(builtin_tool_names());
    return registry;
}

void McpRegistry::register_server(const std::string& name, const McpServerConfig& cfg) {
    if (reserved_.count(to_lower(name))) {
        throw McpError(McpErrorKind::initialization_error,
                       "MCP server name '" + name + "' conflicts with a built-in tool");
    }

    // Start outside the lock: spawning and the handshake can take a while.
    auto provider = std::make_shared<McpProvider>(name, cfg);
    provider->start();
    auto tools = provider->list_tools();

    McpProviderPtr previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = providers_.find(name);
        if (it != providers_.end()) {
            previous = it->second;
            for (auto n = natives_.begin(); n != natives_.end();) {
                if (n->second.server_name == name) n = natives_.erase(n);
                else ++n;
            }
        }
        providers_[name] = provider;
        register_natives(name, tools);
    }
    if (previous) previous->shutdown();

    std::cerr << "[mcp] Connected to server: " << name << " (" << tools.size() << " tools)\n";
}

void McpRegistry::register_natives(const std::string& server_name, const std::vector<McpToolInfo>& tools) {
    for (auto& t : tools) {
        std::string native = to_lower(t.name);
        if (reserved_.count(native) || natives_.count(native)) {
            native = to_lower(server_name + "_" + t.name);
        }
        if (reserved_.count(native) || natives_.count(native)) {
            std::cerr << "[mcp:" << server_name << "] tool '" << t.name << "' skipped: name in use\n";
            continue;
        }
        natives_[native] = NativeMcpTool{native, server_name, t.name};
    }
}

std::vector<McpServerResult> McpRegistry::initialize_from_config(const McpConfig& cfg) {
    std::vector<McpServerResult> results;
    for (auto& [name, server] : cfg.servers) {
        McpServerResult r;
        r.name = name;
        try {
            register_server(name, server);
            auto p = get_provider(name);
            r.ok = true;
            r.tool_count = p ? p->list_tools().size() : 0;
        } catch (const McpError& e) {
            r.error = e.what();
            std::cerr << "[mcp] Failed to connect to server: " << name << ": " << e.what() << "\n";
        }
        results.push_back(std::move(r));
    }
    return results;
}

std::optional<NativeMcpTool> McpRegistry::find_native(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = natives_.find(to_lower(name));
    if (it == natives_.end()) return std::nullopt;
    return it->second;
}

McpProviderPtr McpRegistry::get_provider(const std::string& server_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = providers_.find(server_name);
    if (it != providers_.end()) return it->second;
    for (auto& [n, p] : providers_) {
        if (to_lower(n) == to_lower(server_name)) return p;
    }
    return nullptr;
}

std::vector<std::string> McpRegistry::server_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (auto& [n, _] : providers_) names.push_back(n);
    return names;
}

std::vector<NativeMcpTool> McpRegistry::native_tools() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<NativeMcpTool> tools;
    for (auto& [_, t] : natives_) tools.push_back(t);
    return tools;
}

void McpRegistry::shutdown() {
    std::map<std::string, McpProviderPtr> providers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        providers.swap(providers_);
        natives_.clear();
    }
    for (auto& [name, p] : providers) {
        p->shutdown();
        std::cerr << "[mcp] Disconnected from server: " << name << "\n";
    }
}

} // namespace termineer
