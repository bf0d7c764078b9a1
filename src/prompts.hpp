#pragma once
#include <string>
#include <vector>
#include <optional>

namespace termineer {

class Grammar;

struct AgentKind {
    std::string name;
    std::string description;
    bool readonly = false;
    std::string guidance;  // kind-specific part of the system prompt
};

const std::vector<AgentKind>& available_kinds();
std::optional<AgentKind> find_kind(const std::string& name);

// Kind names containing query (case-insensitive).
std::vector<std::string> kind_suggestions(const std::string& query);

// Throws std::invalid_argument for an unknown kind, listing suggestions.
std::string build_system_prompt(const std::string& kind, bool minimal, bool tools_enabled,
                                const Grammar& grammar, const std::string& tool_list);

} // namespace termineer
