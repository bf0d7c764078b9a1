#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "utils.hpp"
#include "llm/retry.hpp"
#include "token_manager.hpp"

namespace termineer {

constexpr const char* DEFAULT_MODEL = "claude-3-7-sonnet-20250219";

struct Config {
    std::string model = DEFAULT_MODEL;
    std::string kind = "general";      // system prompt template
    std::string system_prompt;         // overrides the kind when set
    bool enable_tools = true;
    int thinking_budget = 8192;
    bool use_minimal_prompt = false;
    bool resume_last_session = false;
    std::string grammar = "auto";      // auto | xml | markdown
    int max_tokens = 32768;
    int max_iterations = 50;           // backend calls per user turn
    bool readonly = false;
    bool silent = false;
    std::string workdir;               // empty = current directory

    RetryConfig retry;
    TruncationConfig truncation;

    fs::path workdir_path() const {
        return workdir.empty() ? fs::current_path() : fs::path(expand_path(workdir));
    }

    // AUTOSWE_MODEL, AUTOSWE_THINKING_BUDGET, AUTOSWE_ENABLE_TOOLS
    void apply_env();

    static Config make_default();
    static Config load(const std::string& path);
    void save(const std::string& path) const;
    nlohmann::json to_json() const;
    static Config from_json(const nlohmann::json& j);
};

// .termineer/settings.json in the current directory
std::string settings_path();

// Defaults, then settings.json when present, then the environment.
Config load_effective_config();

} // namespace termineer
