#include "builtin_tools.hpp"

namespace termineer {

void register_control_tools(ToolRegistry& reg) {
    // ── done ──
    {
        ToolDef def;
        def.name = "done";
        def.description = "Finish the current task. Body (or args): a summary for the user.";
        def.readonly_safe = true;

        def.func = [](const std::string& args, const std::string& body, ToolContext&) -> ToolResult {
            std::string summary = trim(body);
            if (summary.empty()) summary = trim(args);
            if (summary.empty()) summary = "Task completed successfully.";
            auto r = ToolResult::ok(summary);
            r.state_change = StateChange::done;
            return r;
        };
        reg.register_tool(std::move(def));
    }

    // ── wait ──
    {
        ToolDef def;
        def.name = "wait";
        def.description = "Pause until another agent or the user sends a message.";

        def.func = [](const std::string&, const std::string&, ToolContext&) -> ToolResult {
            auto r = ToolResult::ok("Resumed");
            r.state_change = StateChange::wait;
            return r;
        };
        reg.register_tool(std::move(def));
    }
}

} // namespace termineer
