#include "executor.hpp"
#include "../tools/builtin_tools.hpp"
#include "../tools/path_utils.hpp"
#include <fstream>
#include <iterator>

namespace termineer {

static std::string preview(const std::string& text, size_t max_chars) {
    if (text.size() <= max_chars) return text;
    return text.substr(0, max_chars) + "... [truncated " + std::to_string(text.size() - max_chars) +
           " more characters]";
}

static std::string rule(char c, size_t n = 60) { return std::string(n, c); }

static void release_agent(AgentManager& manager, AgentId id) {
    try {
        manager.terminate(id);
    } catch (const AgentError& e) {
        std::cerr << "[workflow] " << e.what() << "\n";
    }
}

WorkflowExecutor::WorkflowExecutor(AgentManager& manager, AgentId target, Config cfg,
                                   std::ostream& out, std::istream& in)
    : manager_(manager), target_(target), cfg_(std::move(cfg)), out_(out), in_(in) {}

WorkflowContext WorkflowExecutor::execute(const Workflow& wf, nlohmann::json parameters,
                                          std::optional<std::string> query) {
    WorkflowContext ctx(std::move(parameters), query);
    ctx.apply_parameters(wf);

    if (query && wf.query_template) {
        ctx.set_variable("raw_query", *query);
        ctx.set_query(ctx.render(*wf.query_template));
    }

    out_ << "Starting workflow: " << wf.name;
    if (wf.description) out_ << " - " << *wf.description;
    out_ << "\n";

    for (size_t i = 0; i < wf.steps.size(); i++) {
        auto& step = wf.steps[i];
        out_ << "\n" << rule('=') << "\n"
             << "STEP " << (i + 1) << "/" << wf.steps.size() << ": " << step_type_name(step.type)
             << " " << step.id;
        if (step.description) out_ << " - " << *step.description;
        out_ << "\n" << rule('-') << "\n";

        try {
            run_step(step, ctx);
        } catch (const WorkflowError& e) {
            if (step.fail_on_error) throw;
            out_ << "[warn] step '" << step.id << "' failed, continuing: " << e.what() << "\n";
        }
    }

    out_ << "\n" << rule('=') << "\nWorkflow completed: " << wf.name << "\n";
    return ctx;
}

void WorkflowExecutor::run_step(const WorkflowStep& step, WorkflowContext& ctx) {
    switch (step.type) {
        case StepType::shell:   run_shell_step(step, ctx); break;
        case StepType::message: run_message_step(step, ctx); break;
        case StepType::file:    run_file_step(step, ctx); break;
        case StepType::output:  run_output_step(step, ctx); break;
        case StepType::wait:    run_wait_step(step, ctx); break;
        case StepType::agent:   run_agent_step(step, ctx); break;
    }
}

void WorkflowExecutor::run_shell_step(const WorkflowStep& step, WorkflowContext& ctx) {
    std::string command = ctx.render(step.command);
    out_ << "$ " << command << "\n";

    auto outcome = run_shell(command, cfg_.workdir_path(), interrupts_, true);
    if (outcome.interrupted) {
        throw WorkflowError(WorkflowErrorKind::shell_error, "interrupted: " + outcome.interrupt_reason);
    }

    std::string output = outcome.output;
    while (!output.empty() && output.back() == '\n') output.pop_back();

    if (step.store_output) {
        ctx.set_variable(*step.store_output, output);
        out_ << preview(output, PREVIEW_CHARS) << "\n(stored in " << *step.store_output << ")\n";
    } else {
        out_ << output << "\n";
    }

    if (outcome.exit_code != 0 && step.fail_on_error) {
        throw WorkflowError(WorkflowErrorKind::shell_error,
                            "'" + command + "' exited with code " + std::to_string(outcome.exit_code));
    }
}

std::string WorkflowExecutor::await_reply(AgentId id, uint64_t before) {
    try {
        if (!manager_.wait_for_turn(id, before, agent_timeout_)) {
            throw WorkflowError(WorkflowErrorKind::agent_error,
                                "agent " + std::to_string(id) + " did not complete its turn");
        }
        return manager_.last_response(id);
    } catch (const AgentError& e) {
        throw WorkflowError(WorkflowErrorKind::agent_error, e.what());
    }
}

void WorkflowExecutor::run_message_step(const WorkflowStep& step, WorkflowContext& ctx) {
    if (target_ == 0) {
        throw WorkflowError(WorkflowErrorKind::agent_error, "message step '" + step.id + "' has no target agent");
    }
    std::string content = ctx.render(step.content);
    out_ << "-> " << preview(content, PREVIEW_CHARS) << "\n";

    uint64_t before = 0;
    try {
        before = manager_.completed_turns(target_);
        manager_.send_user_input(target_, content);
    } catch (const AgentError& e) {
        throw WorkflowError(WorkflowErrorKind::agent_error, e.what());
    }

    if (step.store_response) {
        std::string reply = await_reply(target_, before);
        ctx.set_variable(*step.store_response, reply);
        ctx.set_agent_response(reply);
        out_ << "<- " << preview(reply, PREVIEW_CHARS) << "\n(stored in " << *step.store_response << ")\n";
    }
}

void WorkflowExecutor::run_file_step(const WorkflowStep& step, WorkflowContext& ctx) {
    std::string path = ctx.render(step.path);
    fs::path resolved;
    try {
        resolved = validate_path(cfg_.workdir_path(), path);
    } catch (const PathError& e) {
        throw WorkflowError(e.denied() ? WorkflowErrorKind::permission_denied : WorkflowErrorKind::io_error,
                            std::string(e.what()) + " (" + path + ")");
    }

    if (step.action == FileAction::read) {
        std::ifstream f(resolved, std::ios::binary);
        if (!f) throw WorkflowError(WorkflowErrorKind::io_error, "cannot read " + path);
        std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        if (step.store_as) ctx.set_variable(*step.store_as, text);
        out_ << "Read " << text.size() << " bytes from " << path << "\n";
        return;
    }

    std::string content = ctx.render(step.content);
    auto mode = step.action == FileAction::append ? std::ios::app : std::ios::trunc;
    std::ofstream f(resolved, std::ios::binary | std::ios::out | mode);
    if (!f) throw WorkflowError(WorkflowErrorKind::io_error, "cannot write " + path);
    f << content;
    f.close();
    if (!f) throw WorkflowError(WorkflowErrorKind::io_error, "write failed: " + path);
    out_ << (step.action == FileAction::append ? "Appended " : "Wrote ") << content.size()
         << " bytes to " << path << "\n";
}

void WorkflowExecutor::run_output_step(const WorkflowStep& step, WorkflowContext& ctx) {
    out_ << ctx.render(step.content) << "\n";
}

void WorkflowExecutor::run_wait_step(const WorkflowStep& step, WorkflowContext& ctx) {
    out_ << (step.wait_message ? ctx.render(*step.wait_message) : std::string("Press Enter to continue...")) << "\n";
    out_.flush();

    std::string line;
    if (!std::getline(in_, line)) {
        throw WorkflowError(WorkflowErrorKind::io_error, "input closed while waiting");
    }
    if (step.store_input) ctx.set_variable(*step.store_input, line);
}

void WorkflowExecutor::run_agent_step(const WorkflowStep& step, WorkflowContext& ctx) {
    std::string prompt = ctx.render(step.prompt);

    Config sub = cfg_;
    sub.kind = step.kind.value_or("general");
    sub.system_prompt.clear();

    std::string name = "workflow_agent_" + (step.id.empty() ? std::string("step") : step.id);
    out_ << "Creating agent " << name << " (kind " << sub.kind << ")\n"
         << "Prompt:\n" << preview(prompt, PREVIEW_CHARS) << "\n";

    AgentId id = 0;
    try {
        id = manager_.create(name, sub);
        manager_.send_user_input(id, prompt);
    } catch (const AgentError& e) {
        if (id) release_agent(manager_, id);
        throw WorkflowError(WorkflowErrorKind::agent_error, e.what());
    }

    std::string reply;
    try {
        reply = await_reply(id, 0);
    } catch (const WorkflowError&) {
        release_agent(manager_, id);
        throw;
    }
    release_agent(manager_, id);

    ctx.set_agent_response(reply);
    if (step.into) {
        ctx.set_variable(*step.into, reply);
        out_ << "Response stored in " << *step.into << ":\n" << preview(reply, PREVIEW_CHARS) << "\n";
    } else {
        out_ << "Agent response:\n" << reply << "\n";
    }
}

} // namespace termineer
