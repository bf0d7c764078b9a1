#pragma once
#include "context.hpp"
#include "../agent_manager.hpp"
#include <iostream>

namespace termineer {

// Runs a workflow's steps in order against one target agent. Steps that
// create agents (agent steps) use the same manager.
class WorkflowExecutor {
public:
    static constexpr std::chrono::seconds AGENT_TIMEOUT{300};
    static constexpr size_t PREVIEW_CHARS = 500;

    // target may be 0 when no message steps are used.
    WorkflowExecutor(AgentManager& manager, AgentId target, Config cfg,
                     std::ostream& out = std::cout, std::istream& in = std::cin);

    // Ctrl+C during shell steps.
    void set_interrupts(InterruptCoordinator* interrupts) { interrupts_ = interrupts; }
    void set_agent_timeout(std::chrono::milliseconds t) { agent_timeout_ = t; }

    // Returns the final context. Throws WorkflowError on the first failing
    // step whose fail_on_error is set.
    WorkflowContext execute(const Workflow& wf, nlohmann::json parameters = nlohmann::json::object(),
                            std::optional<std::string> query = std::nullopt);

private:
    AgentManager& manager_;
    AgentId target_;
    Config cfg_;
    std::ostream& out_;
    std::istream& in_;
    InterruptCoordinator* interrupts_ = nullptr;
    std::chrono::milliseconds agent_timeout_ = AGENT_TIMEOUT;

    void run_step(const WorkflowStep& step, WorkflowContext& ctx);
    void run_shell_step(const WorkflowStep& step, WorkflowContext& ctx);
    void run_message_step(const WorkflowStep& step, WorkflowContext& ctx);
    void run_file_step(const WorkflowStep& step, WorkflowContext& ctx);
    void run_output_step(const WorkflowStep& step, WorkflowContext& ctx);
    void run_wait_step(const WorkflowStep& step, WorkflowContext& ctx);
    void run_agent_step(const WorkflowStep& step, WorkflowContext& ctx);

    // Waits for the turn after `before` and returns the reply text.
    std::string await_reply(AgentId id, uint64_t before);
};

} // namespace termineer
