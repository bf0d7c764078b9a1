#include "builtin_tools.hpp"
#include "../agent_manager.hpp"
#include "../buffer.hpp"

namespace termineer {

static ToolResult create_agent(const std::string& args, const std::string& body, ToolContext& ctx) {
    std::vector<std::string> name_parts;
    std::optional<std::string> kind;
    for (auto& tok : split_ws(args)) {
        if (starts_with(tok, "kind=")) kind = tok.substr(5);
        else name_parts.push_back(tok);
    }
    std::string name;
    for (auto& p : name_parts) name += (name.empty() ? "" : " ") + p;

    if (name.empty()) {
        return ToolResult::error(ToolErrorKind::bad_invocation, "agent create needs a name: agent create NAME [kind=K]");
    }
    std::string instructions = trim(body);
    if (instructions.empty()) {
        return ToolResult::error(ToolErrorKind::bad_invocation, "agent create needs instructions in the body");
    }

    Config cfg = *ctx.config;
    cfg.system_prompt.clear();
    cfg.workdir = ctx.workdir.string();
    // Peers of a read-only agent stay read-only.
    cfg.readonly = ctx.readonly;
    if (kind) cfg.kind = *kind;

    if (!ctx.silent) {
        out::tool("agent", "Creating agent '" + name + "'" + (kind ? " with kind '" + *kind + "'" : ""));
    }

    AgentId id = 0;
    try {
        id = ctx.manager->create(name, cfg);
    } catch (const AgentError& e) {
        return ToolResult::failed(std::string("Failed to create agent: ") + e.what());
    }
    try {
        ctx.manager->send_user_input(id, instructions);
    } catch (const AgentError& e) {
        return ToolResult::failed(std::string("Failed to send instructions to new agent: ") + e.what());
    }

    if (!ctx.silent) out::tool("agent", "Agent created: " + name + " [ID: " + std::to_string(id) + "]");
    return ToolResult::ok("Agent '" + name + "' created with ID: " + std::to_string(id) +
                          "\nInitial instructions sent to the agent.");
}

// Numeric targets are ids, anything else is a name.
static std::optional<AgentId> resolve_target(const AgentManager& manager, const std::string& target) {
    bool numeric = !target.empty() && std::all_of(target.begin(), target.end(),
                                                  [](unsigned char c) { return std::isdigit(c); });
    if (numeric) {
        try {
            AgentId id = std::stoull(target);
            if (manager.exists(id)) return id;
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
        return std::nullopt;
    }
    return manager.id_by_name(target);
}

static ToolResult send_to_agent(const std::string& args, const std::string& body, ToolContext& ctx) {
    std::string target = trim(args);
    if (target.empty()) {
        return ToolResult::error(ToolErrorKind::bad_invocation, "agent send needs a target agent (name or ID)");
    }
    std::string content = trim(body);
    if (content.empty()) {
        return ToolResult::error(ToolErrorKind::bad_invocation, "agent send needs the message in the body");
    }

    auto id = resolve_target(*ctx.manager, target);
    if (!id) return ToolResult::failed("Agent '" + target + "' not found");

    std::string source = ctx.agent_name.empty() ? "agent-" + std::to_string(ctx.agent_id) : ctx.agent_name;
    try {
        ctx.manager->send(*id, AgentMessage::agent_input(content, ctx.agent_id, source));
    } catch (const AgentError& e) {
        return ToolResult::failed(std::string("Failed to send message to agent: ") + e.what());
    }

    if (!ctx.silent) out::tool("agent", "Message sent to agent " + target);
    return ToolResult::ok("Message sent to agent " + target + " [ID: " + std::to_string(*id) + "]");
}

void register_agent_tool(ToolRegistry& reg) {
    ToolDef def;
    def.name = "agent";
    def.description = "Talk to peer agents. Args: create NAME [kind=K] (body: instructions) "
                      "or send NAME|ID (body: message).";
    def.readonly_safe = true;

    def.func = [](const std::string& args, const std::string& body, ToolContext& ctx) -> ToolResult {
        if (!ctx.manager || !ctx.config) {
            return ToolResult::failed("Agents are not available in this context");
        }
        std::string rest = trim(args);
        auto ws = rest.find_first_of(" \t");
        std::string sub = to_lower(rest.substr(0, ws));
        std::string sub_args = ws == std::string::npos ? "" : trim(rest.substr(ws + 1));

        if (sub == "create") return create_agent(sub_args, body, ctx);
        if (sub == "send") return send_to_agent(sub_args, body, ctx);
        return ToolResult::error(ToolErrorKind::bad_invocation,
                                 "Unknown agent subcommand: '" + sub + "'. Available subcommands: create, send");
    };

    reg.register_tool(std::move(def));
}

} // namespace termineer
