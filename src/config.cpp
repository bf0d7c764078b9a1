#include "config.hpp"
#include <fstream>
#include <iostream>

namespace termineer {

Config Config::make_default() {
    return Config{};
}

nlohmann::json Config::to_json() const {
    nlohmann::json j;
    j["model"] = model;
    j["kind"] = kind;
    if (!system_prompt.empty()) j["system_prompt"] = system_prompt;
    j["enable_tools"] = enable_tools;
    j["thinking_budget"] = thinking_budget;
    j["use_minimal_prompt"] = use_minimal_prompt;
    j["resume_last_session"] = resume_last_session;
    j["grammar"] = grammar;
    j["max_tokens"] = max_tokens;
    j["max_iterations"] = max_iterations;
    j["readonly"] = readonly;
    j["silent"] = silent;
    if (!workdir.empty()) j["workdir"] = workdir;
    j["retry"] = retry.to_json();
    j["truncation"] = truncation.to_json();
    return j;
}

Config Config::from_json(const nlohmann::json& j) {
    Config c;
    c.model = j.value("model", c.model);
    c.kind = j.value("kind", c.kind);
    c.system_prompt = j.value("system_prompt", c.system_prompt);
    c.enable_tools = j.value("enable_tools", c.enable_tools);
    c.thinking_budget = j.value("thinking_budget", c.thinking_budget);
    c.use_minimal_prompt = j.value("use_minimal_prompt", c.use_minimal_prompt);
    c.resume_last_session = j.value("resume_last_session", c.resume_last_session);
    c.grammar = j.value("grammar", c.grammar);
    c.max_tokens = j.value("max_tokens", c.max_tokens);
    c.max_iterations = j.value("max_iterations", c.max_iterations);
    c.readonly = j.value("readonly", c.readonly);
    c.silent = j.value("silent", c.silent);
    c.workdir = j.value("workdir", c.workdir);

    if (j.contains("retry") && j["retry"].is_object()) {
        c.retry = RetryConfig::from_json(j["retry"]);
    }
    if (j.contains("truncation") && j["truncation"].is_object()) {
        c.truncation = TruncationConfig::from_json(j["truncation"]);
    }

    if (c.grammar != "auto" && c.grammar != "xml" && c.grammar != "markdown") {
        std::cerr << "[config] Unknown grammar '" << c.grammar << "', using auto\n";
        c.grammar = "auto";
    }
    if (c.max_iterations < 1) c.max_iterations = 1;
    if (c.thinking_budget < 0) c.thinking_budget = 0;
    return c;
}

void Config::apply_env() {
    std::string m = env_or("AUTOSWE_MODEL");
    if (!m.empty()) model = m;

    std::string budget = env_or("AUTOSWE_THINKING_BUDGET");
    if (!budget.empty()) {
        try {
            thinking_budget = std::max(0, std::stoi(budget));
        } catch (const std::logic_error&) {
            std::cerr << "[warn] Ignoring invalid AUTOSWE_THINKING_BUDGET: " << budget << "\n";
        }
    }

    std::string tools = to_lower(env_or("AUTOSWE_ENABLE_TOOLS"));
    if (!tools.empty()) enable_tools = !(tools == "0" || tools == "false");
}

Config Config::load(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        std::cerr << "[warn] Config not found at " << path << ", using defaults\n";
        return make_default();
    }
    try {
        nlohmann::json j = nlohmann::json::parse(f);
        return from_json(j);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[warn] Failed to parse config: " << e.what() << ", using defaults\n";
        return make_default();
    }
}

void Config::save(const std::string& path) const {
    auto parent = fs::path(path).parent_path();
    if (!parent.empty()) fs::create_directories(parent);
    std::ofstream f(path);
    f << to_json().dump(2) << std::endl;
}

std::string settings_path() {
    return ".termineer/settings.json";
}

Config load_effective_config() {
    Config c = fs::exists(settings_path()) ? Config::load(settings_path()) : Config::make_default();
    c.apply_env();
    return c;
}

} // namespace termineer
