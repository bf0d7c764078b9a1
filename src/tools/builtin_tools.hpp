#pragma once
#include "../tool_registry.hpp"
#include <chrono>
#include <nlohmann/json.hpp>

namespace termineer {

void register_shell_tool(ToolRegistry& reg);
void register_fs_tools(ToolRegistry& reg);      // read, write, patch
void register_fetch_tool(ToolRegistry& reg);
void register_search_tool(ToolRegistry& reg);
void register_task_tool(ToolRegistry& reg);
void register_agent_tool(ToolRegistry& reg);    // agent create, agent send
void register_control_tools(ToolRegistry& reg); // done, wait

inline void register_builtin_tools(ToolRegistry& reg) {
    register_shell_tool(reg);
    register_fs_tools(reg);
    register_fetch_tool(reg);
    register_search_tool(reg);
    register_task_tool(reg);
    register_agent_tool(reg);
    register_control_tools(reg);
}

// ── shell ──
constexpr size_t MAX_SHELL_OUTPUT = 50000;

struct ShellOutcome {
    int exit_code = -1;
    std::string output;          // combined stdout/stderr
    bool interrupted = false;
    std::string interrupt_reason;
};

// Runs `sh -c command` in workdir, streaming lines to the current buffer
// unless silent. Polls the coordinator's tool channel every 10ms.
ShellOutcome run_shell(const std::string& command, const fs::path& workdir,
                       InterruptCoordinator* interrupts, bool silent);

// Keeps head and tail when text exceeds max_chars.
std::string clip_middle(const std::string& text, size_t max_chars);

// ── read ──
constexpr int MAX_READ_LINES = 1000;

struct ReadArgs {
    std::vector<std::string> paths;
    int offset = 0;               // 0-based first line
    std::optional<int> limit;
};

// Parses "PATH... [offset=N] [limit=N] [lines=START-END]" (lines are 1-based).
ReadArgs parse_read_args(const std::string& args);

// ── patch ──
struct PatchSpec {
    std::string before;
    std::string after;
};

// Parses the <<<<BEFORE / <<<<AFTER / <<<<END body. Throws std::invalid_argument.
PatchSpec parse_patch_body(const std::string& body);

// ── fetch ──
constexpr size_t MAX_FETCH_CHARS = 100000;

// Drops tags, scripts and styles; keeps links as "text [url]".
std::string html_to_text(const std::string& html);

// ── search ──
constexpr size_t MAX_SEARCH_RESULTS = 10;

struct SearchHit {
    std::string title;
    std::string url;
    std::string snippet;
};

// Google Custom Search JSON "items" -> hits.
std::vector<SearchHit> parse_google_results(const nlohmann::json& response);
// DuckDuckGo's HTML endpoint, first MAX_SEARCH_RESULTS results.
std::vector<SearchHit> parse_duckduckgo_html(const std::string& html);
std::string format_search_results(const std::string& query, const std::vector<SearchHit>& hits,
                                  const std::string& engine);

// ── task ──
constexpr int TASK_TIMEOUT_SECONDS = 300;

} // namespace termineer
