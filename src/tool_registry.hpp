#pragma once
#include "message.hpp"
#include "utils.hpp"
#include <string>
#include <map>
#include <set>
#include <vector>
#include <optional>
#include <functional>

namespace termineer {

class InterruptCoordinator;
class AgentManager;
struct Config;

enum class StateChange {
    none,
    wait,
    done
};

enum class ToolErrorKind {
    none,
    permission_denied,
    bad_invocation,
    failed
};

struct ToolResult {
    bool success = true;
    std::string agent_output;
    StateChange state_change = StateChange::none;
    ToolErrorKind error_kind = ToolErrorKind::none;
    std::optional<int> exit_code;
    std::vector<Content> contents;  // structured payload (MCP)
    bool interrupted = false;       // the tool consumed an interrupt

    static ToolResult ok(std::string output) {
        ToolResult r;
        r.agent_output = std::move(output);
        return r;
    }

    static ToolResult error(ToolErrorKind kind, std::string output) {
        ToolResult r;
        r.success = false;
        r.error_kind = kind;
        r.agent_output = std::move(output);
        return r;
    }

    static ToolResult failed(std::string output, std::optional<int> code = std::nullopt) {
        auto r = error(ToolErrorKind::failed, std::move(output));
        r.exit_code = code;
        return r;
    }
};

// What a tool may touch while it runs.
struct ToolContext {
    fs::path workdir = fs::current_path();
    bool readonly = false;
    bool silent = false;
    InterruptCoordinator* interrupts = nullptr;
    AgentManager* manager = nullptr;  // for task
    const Config* config = nullptr;   // parent settings, inherited by sub-agents
    std::string agent_name;
    uint64_t agent_id = 0;            // sender id for agent messages
};

using ToolFunction = std::function<ToolResult(const std::string& args, const std::string& body, ToolContext& ctx)>;

struct ToolDef {
    std::string name;
    std::string description;
    bool readonly_safe = false;
    bool interruptible = false;
    ToolFunction func;
};

class ToolRegistry {
public:
    void register_tool(ToolDef def) {
        std::string key = to_lower(def.name);
        tools_[key] = std::move(def);
    }

    bool has(const std::string& name) const {
        return tools_.count(to_lower(name)) > 0;
    }

    const ToolDef* find(const std::string& name) const {
        auto it = tools_.find(to_lower(name));
        return it == tools_.end() ? nullptr : &it->second;
    }

    std::vector<std::string> tool_names() const {
        std::vector<std::string> names;
        for (auto& [n, _] : tools_) names.push_back(n);
        return names;
    }

    // "- name: description" per tool, for the system prompt.
    std::string describe(bool readonly) const {
        std::string out;
        for (auto& [n, def] : tools_) {
            if (readonly && !def.readonly_safe) continue;
            out += "- " + n + ": " + def.description + "\n";
        }
        return out;
    }

private:
    std::map<std::string, ToolDef> tools_;
};

inline std::set<std::string> builtin_tool_names() {
    return {"shell", "read", "write", "patch", "fetch", "search", "task", "agent", "done", "wait"};
}

inline std::set<std::string> readonly_tool_names() {
    return {"read", "shell", "fetch", "search", "done", "task", "agent"};
}

} // namespace termineer
