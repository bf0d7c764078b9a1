#include "prompts.hpp"
#include "grammar.hpp"
#include "utils.hpp"
#include <stdexcept>

namespace termineer {

const std::vector<AgentKind>& available_kinds() {
    static const std::vector<AgentKind> kinds = {
        {"general", "General-purpose software engineering assistant", false,
         "You help with software engineering tasks in the user's working directory. "
         "Inspect files before changing them, keep edits minimal and explain what you changed."},
        {"minimal", "Short prompt, same tools", false,
         "You are a concise assistant with access to tools."},
        {"researcher", "Read-only investigation and reporting", true,
         "You investigate and report. You cannot modify files. Gather evidence with read, shell "
         "and fetch, then answer with specific file and line references."},
        {"coder", "Implementation-focused engineer", false,
         "You implement changes. Read the relevant code, make focused edits with patch or write, "
         "and run the build or tests with shell to confirm the change works."},
    };
    return kinds;
}

std::optional<AgentKind> find_kind(const std::string& name) {
    std::string n = to_lower(trim(name));
    for (auto& k : available_kinds()) {
        if (k.name == n) return k;
    }
    return std::nullopt;
}

std::vector<std::string> kind_suggestions(const std::string& query) {
    std::vector<std::string> out;
    std::string q = to_lower(query);
    for (auto& k : available_kinds()) {
        if (k.name.find(q) != std::string::npos || q.find(k.name) != std::string::npos) {
            out.push_back(k.name);
        }
    }
    return out;
}

std::string build_system_prompt(const std::string& kind, bool minimal, bool tools_enabled,
                                const Grammar& grammar, const std::string& tool_list) {
    auto k = find_kind(minimal && kind.empty() ? "minimal" : (kind.empty() ? "general" : kind));
    if (!k) {
        std::string msg = "Invalid agent kind: '" + kind + "'";
        auto sugg = kind_suggestions(kind);
        if (!sugg.empty()) {
            msg += ". Did you mean:";
            for (auto& s : sugg) msg += " " + s;
        }
        throw std::invalid_argument(msg);
    }
    if (minimal) k = find_kind("minimal");

    std::string prompt = k->guidance + "\n";
    if (!tools_enabled) {
        prompt += "\nTools are disabled for this session. Answer directly.\n";
        return prompt;
    }

    prompt += "\n# Tools\n\n" + grammar.describe() + "\n";
    prompt += "Available tools:\n" + tool_list;
    if (!minimal) {
        prompt += "\nCall one tool at a time and wait for its result. "
                  "When the task is finished, call the done tool with a short summary.\n";
        prompt += "To edit a file with patch, use this body:\n" +
                  grammar.format_patch("exact text currently in the file", "replacement text") + "\n";
    }
    return prompt;
}

} // namespace termineer
