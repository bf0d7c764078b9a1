#pragma once
#include "tool_registry.hpp"
#include <nlohmann/json.hpp>

namespace termineer {

class McpRegistry;

struct ToolInvocation {
    std::string name;  // lowercased
    std::string args;  // rest of the first line
    std::string body;  // following lines
};

// "name args\nbody" -> parts. The name is the first whitespace-delimited token.
ToolInvocation split_invocation(const std::string& text);

// MCP arguments: body as JSON, else args as a JSON object, else {args, body}.
nlohmann::json mcp_arguments(const std::string& args, const std::string& body);

// Runs built-in tools, then native MCP tools, then MCP servers by name
// (first args token is the tool).
class ToolExecutor {
public:
    explicit ToolExecutor(ToolContext ctx, McpRegistry* mcp = nullptr);

    ToolResult execute(const std::string& name, const std::string& args, const std::string& body);
    ToolResult execute(const std::string& invocation);

    bool is_interruptible(const std::string& name) const;
    bool is_known(const std::string& name) const;

    bool readonly() const { return ctx_.readonly; }
    void set_readonly(bool ro) { ctx_.readonly = ro; }
    ToolContext& context() { return ctx_; }
    ToolRegistry& registry() { return registry_; }
    const ToolRegistry& registry() const { return registry_; }

    // Tool list for the system prompt, MCP tools included.
    std::string describe() const;

private:
    ToolContext ctx_;
    McpRegistry* mcp_;
    ToolRegistry registry_;

    ToolResult dispatch(const std::string& name, const std::string& args, const std::string& body);
    ToolResult run_mcp(const std::string& server, const std::string& tool,
                       const std::string& args, const std::string& body);
};

} // namespace termineer
