#pragma once
#include "config.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace termineer {

class AgentManager;

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct CliOptions {
    std::string command;                 // empty, login, list-kinds, workflow, sessions
    std::optional<std::string> query;
    std::optional<std::string> model;
    std::optional<std::string> kind;
    std::optional<std::string> grammar;
    std::optional<int> thinking_budget;
    bool no_tools = false;
    bool minimal_prompt = false;
    bool resume = false;
    bool skip_auth = false;
    bool help = false;

    // workflow
    std::optional<std::string> workflow_name;
    std::vector<std::string> params;     // K=V
    std::optional<std::string> extra_query;
};

// Throws UsageError.
CliOptions parse_cli(const std::vector<std::string>& args);

// CLI flags override settings and environment.
void apply_cli(const CliOptions& opts, Config& cfg);

void print_usage(std::ostream& os);

int cmd_query(const Config& cfg, const std::string& query);
// One turn on an existing manager; 1 if the agent could not answer.
int run_query(AgentManager& manager, const Config& cfg, const std::string& query);
int cmd_interactive(const Config& cfg);
int cmd_workflow(const Config& cfg, const CliOptions& opts);
int cmd_list_kinds();
int cmd_sessions();
int cmd_login();

// Exit codes: 0 ok, 1 error, 2 usage.
int run_cli(int argc, char* argv[]);

} // namespace termineer
