#include "builtin_tools.hpp"
#include "path_utils.hpp"
#include "../agent_manager.hpp"
#include "../interrupt_coordinator.hpp"
#include "../buffer.hpp"

namespace termineer {

static std::string included_files(const fs::path& workdir, const std::vector<std::string>& globs) {
    std::string text;
    for (auto& g : globs) {
        auto files = glob_files(workdir, g);
        if (files.empty()) {
            text += "(no files matched " + g + ")\n\n";
            continue;
        }
        for (auto& f : files) {
            std::error_code ec;
            std::string rel = fs::relative(f, workdir, ec).generic_string();
            text += "<file path=\"" + (ec ? f.string() : rel) + "\">\n" + read_file(f.string()) + "\n</file>\n\n";
        }
    }
    return text;
}

void register_task_tool(ToolRegistry& reg) {
    ToolDef def;
    def.name = "task";
    def.description = "Run a read-only sub-agent. Args: NAME [kind=K] [include=GLOB]...; body: instructions.";
    def.readonly_safe = true;
    def.interruptible = true;

    def.func = [](const std::string& args, const std::string& body, ToolContext& ctx) -> ToolResult {
        if (!ctx.manager || !ctx.config) {
            return ToolResult::failed("Sub-agents are not available in this context");
        }
        auto tokens = split_ws(args);
        if (tokens.empty()) {
            return ToolResult::error(ToolErrorKind::bad_invocation, "task needs a name: task NAME [kind=K] [include=GLOB]");
        }
        if (trim(body).empty()) {
            return ToolResult::error(ToolErrorKind::bad_invocation, "task needs instructions in the body");
        }

        std::string name = tokens[0];
        Config sub = *ctx.config;
        sub.readonly = true;
        sub.silent = true;
        sub.system_prompt.clear();
        sub.workdir = ctx.workdir.string();
        std::vector<std::string> includes;
        for (size_t i = 1; i < tokens.size(); i++) {
            if (starts_with(tokens[i], "kind=")) sub.kind = tokens[i].substr(5);
            else if (starts_with(tokens[i], "include=")) includes.push_back(tokens[i].substr(8));
        }

        std::string prompt;
        if (!includes.empty()) prompt += included_files(ctx.workdir, includes);
        prompt += body;

        AgentId id = 0;
        try {
            id = ctx.manager->create("task_" + name, sub);
        } catch (const AgentError& e) {
            return ToolResult::failed(std::string("Failed to start sub-agent: ") + e.what());
        }
        if (!ctx.silent) out::tool("task", "Started sub-agent task_" + name + " (#" + std::to_string(id) + ")");

        ToolInterruptScope scope(ctx.interrupts);
        std::optional<std::string> interrupted;
        ToolResult result;
        try {
            ctx.manager->send_user_input(id, prompt);
            auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(TASK_TIMEOUT_SECONDS);
            bool finished = false;
            while (std::chrono::steady_clock::now() < deadline) {
                if (auto sig = scope.poll()) {
                    interrupted = sig->reason_or_default();
                    break;
                }
                if (ctx.manager->wait_for_turn(id, 0, std::chrono::milliseconds(500))) {
                    finished = true;
                    break;
                }
                if (ctx.manager->state(id).kind == AgentStateKind::terminated) {
                    finished = true;
                    break;
                }
            }

            if (interrupted) {
                result = ToolResult::ok("(interrupted)\n[TASK INTERRUPTED: " + *interrupted + "]");
                result.interrupted = true;
            } else if (!finished) {
                result = ToolResult::failed("Sub-agent task_" + name + " timed out after " +
                                            std::to_string(TASK_TIMEOUT_SECONDS) + " seconds");
            } else {
                std::string response = ctx.manager->last_response(id);
                result = ToolResult::ok("Task '" + name + "' result:\n" +
                                        (response.empty() ? "(no response)" : response));
            }
        } catch (const AgentError& e) {
            result = ToolResult::failed(std::string("Sub-agent failed: ") + e.what());
        }

        try {
            ctx.manager->terminate(id);
        } catch (const AgentError& e) {
            out::debug(std::string("task cleanup: ") + e.what());
        }
        return result;
    };

    reg.register_tool(std::move(def));
}

} // namespace termineer
