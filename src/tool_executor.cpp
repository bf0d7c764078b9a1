#include "tool_executor.hpp"
#include "tools/builtin_tools.hpp"
#include "mcp/registry.hpp"
#include "interrupt_coordinator.hpp"
#include "buffer.hpp"

namespace termineer {

ToolInvocation split_invocation(const std::string& text) {
    ToolInvocation inv;
    std::string s = text;
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return inv;
    s = s.substr(start);

    auto nl = s.find('\n');
    std::string first = nl == std::string::npos ? s : s.substr(0, nl);
    inv.body = nl == std::string::npos ? "" : s.substr(nl + 1);

    auto ws = first.find_first_of(" \t");
    inv.name = to_lower(ws == std::string::npos ? trim(first) : first.substr(0, ws));
    inv.args = ws == std::string::npos ? "" : trim(first.substr(ws + 1));
    return inv;
}

nlohmann::json mcp_arguments(const std::string& args, const std::string& body) {
    std::string b = trim(body);
    if (!b.empty()) {
        auto j = nlohmann::json::parse(b, nullptr, false);
        if (!j.is_discarded() && j.is_object()) return j;
    }
    std::string a = trim(args);
    if (!a.empty()) {
        auto j = nlohmann::json::parse(a, nullptr, false);
        if (!j.is_discarded() && j.is_object()) return j;
    }
    nlohmann::json j = nlohmann::json::object();
    if (!a.empty()) j["args"] = a;
    if (!b.empty()) j["body"] = body;
    return j;
}

ToolExecutor::ToolExecutor(ToolContext ctx, McpRegistry* mcp)
    : ctx_(std::move(ctx)), mcp_(mcp) {
    register_builtin_tools(registry_);
}

bool ToolExecutor::is_known(const std::string& name) const {
    if (registry_.has(name)) return true;
    if (!mcp_) return false;
    return mcp_->find_native(name).has_value() || mcp_->get_provider(name) != nullptr;
}

bool ToolExecutor::is_interruptible(const std::string& name) const {
    if (auto* def = registry_.find(name)) return def->interruptible;
    return is_known(name);  // MCP calls poll for interrupts
}

ToolResult ToolExecutor::execute(const std::string& invocation) {
    auto inv = split_invocation(invocation);
    return execute(inv.name, inv.args, inv.body);
}

ToolResult ToolExecutor::execute(const std::string& raw_name, const std::string& args, const std::string& body) {
    std::string name = to_lower(trim(raw_name));
    if (name.empty()) {
        return ToolResult::error(ToolErrorKind::bad_invocation, "No tool name specified");
    }

    if (ctx_.readonly && !readonly_tool_names().count(name)) {
        return ToolResult::error(ToolErrorKind::permission_denied,
                                 "Permission denied: tool '" + name + "' is not available in read-only mode");
    }

    // A tool that throws fails its own call, never the agent thread.
    try {
        return dispatch(name, args, body);
    } catch (const std::exception& e) {
        out::error("Tool '" + name + "' raised: " + e.what());
        return ToolResult::failed("Tool '" + name + "' failed: " + e.what());
    }
}

ToolResult ToolExecutor::dispatch(const std::string& name, const std::string& args, const std::string& body) {
    if (auto* def = registry_.find(name)) {
        return def->func(args, body, ctx_);
    }

    if (mcp_) {
        if (auto native = mcp_->find_native(name)) {
            return run_mcp(native->server_name, native->tool_name, args, body);
        }
        if (mcp_->get_provider(name)) {
            auto tokens = split_ws(args);
            if (tokens.empty()) {
                return ToolResult::error(ToolErrorKind::bad_invocation,
                                         "MCP server '" + name + "' needs a tool name as the first argument");
            }
            std::string tool = tokens[0];
            std::string rest = trim(args.substr(args.find(tool) + tool.size()));
            return run_mcp(name, tool, rest, body);
        }
    }

    return ToolResult::error(ToolErrorKind::bad_invocation, "Unknown tool: " + name);
}

ToolResult ToolExecutor::run_mcp(const std::string& server, const std::string& tool,
                                 const std::string& args, const std::string& body) {
    auto provider = mcp_->get_provider(server);
    if (!provider) {
        return ToolResult::error(ToolErrorKind::bad_invocation, "MCP server not found: " + server);
    }

    if (!ctx_.silent) out::tool(server, "Calling MCP tool " + tool);

    ToolInterruptScope scope(ctx_.interrupts);
    std::optional<std::string> interrupt_reason;
    CancelCheck cancelled = [&]() {
        if (interrupt_reason) return true;
        if (auto sig = scope.poll()) {
            interrupt_reason = sig->reason_or_default();
            return true;
        }
        return false;
    };

    try {
        auto contents = provider->get_tool_content(tool, mcp_arguments(args, body), cancelled);
        auto r = ToolResult::ok(contents_text(contents));
        r.contents = std::move(contents);
        return r;
    } catch (const McpError& e) {
        if (e.kind() == McpErrorKind::cancelled) {
            auto r = ToolResult::ok("(interrupted)\n[TOOL INTERRUPTED: " +
                                    interrupt_reason.value_or(DEFAULT_INTERRUPT_REASON) + "]");
            r.interrupted = true;
            return r;
        }
        if (e.kind() == McpErrorKind::tool_not_found) {
            return ToolResult::error(ToolErrorKind::bad_invocation, e.what());
        }
        return ToolResult::failed(std::string("MCP error: ") + e.what());
    }
}

std::string ToolExecutor::describe() const {
    std::string text = registry_.describe(ctx_.readonly);
    if (mcp_ && !ctx_.readonly) {
        for (auto& t : mcp_->native_tools()) {
            std::string desc;
            if (auto p = mcp_->get_provider(t.server_name)) {
                if (auto info = p->get_tool(t.tool_name)) desc = info->description;
            }
            text += "- " + t.native_name + ": [MCP:" + t.server_name + "] " + desc + "\n";
        }
    }
    return text;
}

} // namespace termineer
