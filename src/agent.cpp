#include "agent.hpp"
#include "prompts.hpp"
#include "mcp/registry.hpp"
#include <future>
#include <iostream>

namespace termineer {

std::string AgentState::describe() const {
    switch (kind) {
        case AgentStateKind::idle: return "idle";
        case AgentStateKind::processing: return "processing";
        case AgentStateKind::running_tool:
            return "running tool " + tool_name + (interruptible ? " (interruptible)" : "");
        case AgentStateKind::done: return "done";
        case AgentStateKind::terminated: return "terminated";
    }
    return "unknown";
}

std::string format_agent_input(const std::string& content, AgentId source_id, const std::string& source_name) {
    return "<agent_message source=\"" + source_name + "\" source_id=\"" + std::to_string(source_id) + "\">\n" +
           content + "\n</agent_message>";
}

Agent::Agent(AgentId id, std::string name, Config cfg, BackendPtr backend, BackendFactory factory,
             AgentManager* manager, McpRegistry* mcp)
    : id_(id), name_(std::move(name)), config_(std::move(cfg)), backend_(std::move(backend)),
      factory_(std::move(factory)), manager_(manager), mcp_(mcp),
      buffer_(std::make_shared<Buffer>()),
      inbox_(std::make_shared<Channel<AgentMessage>>(INBOX_CAPACITY)),
      interrupt_channel_(make_interrupt_channel(INTERRUPT_CAPACITY)),
      coordinator_(std::make_shared<InterruptCoordinator>(interrupt_channel_)),
      tokens_(config_.truncation) {
    select_grammar();
    rebuild_executor();
}

Agent::~Agent() {
    stop_ = true;
    if (thread_.joinable()) {
        if (thread_.get_id() == std::this_thread::get_id()) {
            thread_.detach();
        } else {
            thread_.join();
        }
    }
}

void Agent::start() {
    auto self = shared_from_this();
    thread_ = std::thread([self] { self->run(); });
}

bool Agent::join_for(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!finished_ && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if (!thread_.joinable()) return finished_;
    if (finished_) {
        thread_.join();
        return true;
    }
    thread_.detach();
    set_state(AgentState::terminated());
    return false;
}

AgentState Agent::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::string Agent::last_response() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_response_;
}

std::vector<Message> Agent::conversation_snapshot() const {
    std::lock_guard<std::mutex> lock(conv_mutex_);
    return conversation_.messages();
}

void Agent::set_state(AgentState s) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_ = std::move(s);
}

void Agent::finish_turn(AgentState s) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (s.kind == AgentStateKind::done && s.response) {
            last_response_ = *s.response;
        } else {
            std::lock_guard<std::mutex> conv_lock(conv_mutex_);
            last_response_ = conversation_.last_assistant_text();
        }
        state_ = std::move(s);
    }
    completed_turns_++;
}

void Agent::push_message(Message m) {
    std::lock_guard<std::mutex> lock(conv_mutex_);
    conversation_.push(std::move(m));
}

void Agent::select_grammar() {
    GrammarType type = GrammarType::xml;
    if (config_.grammar == "auto") {
        type = backend_ ? default_grammar_for(backend_->name(), backend_->model()) : GrammarType::xml;
    } else {
        type = parse_grammar_type(config_.grammar);
    }
    grammar_ = make_grammar(type);
}

void Agent::rebuild_executor() {
    ToolContext ctx;
    ctx.workdir = config_.workdir_path();
    auto kind = find_kind(config_.kind);
    ctx.readonly = config_.readonly || (kind && kind->readonly);
    ctx.silent = config_.silent;
    ctx.interrupts = coordinator_.get();
    ctx.manager = manager_;
    ctx.config = &config_;
    ctx.agent_name = name_;
    ctx.agent_id = id_;
    executor_ = std::make_unique<ToolExecutor>(std::move(ctx), mcp_);
}

std::string Agent::system_prompt() const {
    if (!config_.system_prompt.empty()) return config_.system_prompt;
    try {
        return build_system_prompt(config_.kind, config_.use_minimal_prompt, config_.enable_tools,
                                   *grammar_, executor_->describe());
    } catch (const std::invalid_argument& e) {
        out::error(e.what());
        return build_system_prompt("general", config_.use_minimal_prompt, config_.enable_tools,
                                   *grammar_, executor_->describe());
    }
}

bool Agent::drain_interrupts() {
    bool any = false;
    while (auto sig = interrupt_channel_->try_recv()) {
        *sig->acknowledged = true;
        any = true;
    }
    return any;
}

void Agent::run() {
    ScopedBuffer scoped(buffer_);
    out::debug("Agent " + name_ + " (#" + std::to_string(id_) + ") started");

    while (!stop_) {
        if (auto sig = interrupt_channel_->try_recv()) {
            *sig->acknowledged = true;
            out::debug("Interrupt received while idle");
        }

        auto msg = inbox_->recv_for(std::chrono::milliseconds(50));
        if (!msg) {
            if (inbox_->closed()) break;
            continue;
        }
        if (msg->type == AgentMessageType::terminate) break;
        handle(*msg);
    }

    set_state(AgentState::terminated());
    out::debug("Agent " + name_ + " terminated");
    finished_ = true;
}

void Agent::handle(const AgentMessage& msg) {
    switch (msg.type) {
        case AgentMessageType::user_input:
            push_message(Message::user(msg.content));
            process_turn();
            break;
        case AgentMessageType::agent_input:
            push_message(Message::user(format_agent_input(msg.content, msg.source_id, msg.source_name)));
            process_turn();
            break;
        case AgentMessageType::command:
            apply_command(msg.command);
            break;
        case AgentMessageType::interrupt:
            drain_interrupts();
            out::debug("Interrupt received while idle");
            break;
        case AgentMessageType::terminate:
            stop_ = true;
            break;
    }
}

void Agent::apply_command(const AgentCommand& cmd) {
    switch (cmd.type) {
        case AgentCommandType::set_model: {
            Config next = config_;
            next.model = cmd.text;
            try {
                backend_ = factory_(next);
                config_ = next;
                last_input_tokens_.reset();
                select_grammar();
                out::system("Model set to " + backend_->model() + " (" + backend_->name() + ")");
            } catch (const LlmError& e) {
                out::error(std::string("Cannot switch model: ") + e.what());
            }
            break;
        }
        case AgentCommandType::enable_tools:
            config_.enable_tools = cmd.flag;
            out::system(std::string("Tools ") + (cmd.flag ? "enabled" : "disabled"));
            break;
        case AgentCommandType::set_system_prompt:
            config_.system_prompt = cmd.text;
            out::system("System prompt updated");
            break;
        case AgentCommandType::reset_conversation: {
            std::lock_guard<std::mutex> lock(conv_mutex_);
            conversation_.clear();
            tokens_.clear();
            last_input_tokens_.reset();
            out::system("Conversation reset");
            break;
        }
        case AgentCommandType::set_thinking_budget:
            config_.thinking_budget = std::max(0, cmd.number);
            out::system("Thinking budget set to " + std::to_string(config_.thinking_budget));
            break;
        case AgentCommandType::replace_conversation: {
            std::lock_guard<std::mutex> lock(conv_mutex_);
            conversation_.replace(cmd.messages);
            tokens_.rebuild(conversation_);
            last_input_tokens_.reset();
            out::system("Loaded conversation with " + std::to_string(conversation_.size()) + " messages");
            break;
        }
    }
    // A finished agent stays finished.
    if (!state().is_terminal()) set_state(AgentState::idle());
}

void Agent::prepare_conversation() {
    std::lock_guard<std::mutex> lock(conv_mutex_);
    size_t removed = conversation_.sanitize();
    if (removed > 0) {
        tokens_.rebuild(conversation_);
        conversation_.reset_cache_points();
        out::debug("Removed " + std::to_string(removed) + " empty messages");
    }

    size_t used = last_input_tokens_ ? *last_input_tokens_
                                     : conversation_.estimate_tokens() + estimate_tokens(system_prompt());
    if (used >= backend_->safe_input_token_limit()) {
        auto result = tokens_.truncate(conversation_);
        if (result.truncated_messages > 0) {
            out::system("Truncated " + std::to_string(result.truncated_messages) +
                        " tool outputs (~" + std::to_string(result.estimated_tokens_saved) + " tokens saved)");
        }
        last_input_tokens_.reset();
    }
}

Agent::CallOutcome Agent::call_backend(const LlmRequest& req, LlmResponse& resp, std::string& error) {
    auto promise = std::make_shared<std::promise<LlmResponse>>();
    auto fut = promise->get_future();
    BackendPtr backend = backend_;
    BufferPtr buf = buffer_;

    std::thread([backend, req, promise, buf]() {
        ScopedBuffer scoped(buf);
        try {
            promise->set_value(backend->send(req));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    while (fut.wait_for(std::chrono::milliseconds(50)) != std::future_status::ready) {
        if (stop_) return CallOutcome::stopped;
        if (drain_interrupts()) return CallOutcome::interrupted;
    }

    try {
        resp = fut.get();
        return CallOutcome::ok;
    } catch (const LlmError& e) {
        error = e.what();
    } catch (const std::exception& e) {
        error = e.what();
    }
    return CallOutcome::failed;
}

std::vector<Segment> Agent::parse_response(const LlmResponse& resp, std::string& text) const {
    text = resp.text();
    std::string close = grammar_->tool_close_sequence();
    if (close.empty()) return grammar_->parse(text);

    if (resp.stop_sequence && *resp.stop_sequence == close) {
        text += close;
        return grammar_->parse(text);
    }

    auto segments = grammar_->parse(text);
    bool has_call = false;
    for (auto& s : segments) has_call = has_call || s.type == SegmentType::tool_call;

    // Some backends stop on the sequence without reporting which one.
    std::string reason = resp.stop_reason.value_or("");
    if (!has_call && reason != "length" && reason != "max_tokens" && reason != "MAX_TOKENS") {
        auto retry = grammar_->parse(text + close);
        for (auto& s : retry) {
            if (s.type == SegmentType::tool_call) {
                text += close;
                return retry;
            }
        }
    }
    return segments;
}

void Agent::process_turn() {
    drain_interrupts();
    last_turn_failed_ = false;
    set_state(AgentState::processing());

    int iterations = 0;
    while (!stop_) {
        if (iterations >= config_.max_iterations) {
            out::system("Stopped after " + std::to_string(config_.max_iterations) + " model calls");
            break;
        }
        iterations++;
        set_state(AgentState::processing());

        prepare_conversation();

        LlmRequest req;
        {
            std::lock_guard<std::mutex> lock(conv_mutex_);
            req.messages = conversation_.messages();
            req.cache_points = conversation_.cache_points();
        }
        req.system = system_prompt();
        if (config_.enable_tools) req.stop_sequences = grammar_->stop_sequences();
        req.thinking_budget = config_.thinking_budget;
        req.max_tokens = config_.max_tokens;

        LlmResponse resp;
        std::string error;
        auto outcome = call_backend(req, resp, error);

        if (outcome == CallOutcome::stopped) return;
        if (outcome == CallOutcome::interrupted) {
            push_message(Message::assistant("(interrupted)"));
            out::system("Interrupted");
            break;
        }
        if (outcome == CallOutcome::failed) {
            out::error(error);
            push_message(Message::assistant("(error)"));
            last_turn_failed_ = true;
            break;
        }

        if (resp.usage) {
            last_input_tokens_ = resp.usage->input_tokens + resp.usage->cache_read_input_tokens +
                                 resp.usage->cache_creation_input_tokens;
        }

        std::string text;
        std::vector<Segment> segments = config_.enable_tools
            ? parse_response(resp, text) : std::vector<Segment>{};
        if (!config_.enable_tools) text = resp.text();

        bool has_call = false;
        for (auto& s : segments) has_call = has_call || s.type == SegmentType::tool_call;

        if (!has_call) {
            Message m{"assistant", resp.content, {MessageKind::assistant, "", 0}};
            push_message(std::move(m));
            if (resp.usage) {
                std::lock_guard<std::mutex> lock(conv_mutex_);
                tokens_.update_token_usage(conversation_.size() - 1, resp.usage->input_tokens,
                                           resp.usage->output_tokens);
            }
            if (!trim(text).empty()) out::info(text);
            break;
        }

        // Thinking blocks travel with the first tool call of the response.
        std::vector<Content> thinking;
        for (auto& c : resp.content) {
            if (c.type == ContentType::thinking || c.type == ContentType::redacted_thinking) thinking.push_back(c);
        }

        std::string preceding;
        bool interrupted = false;
        for (auto& seg : segments) {
            if (seg.type != SegmentType::tool_call) {
                if (seg.type == SegmentType::text) preceding += seg.text;
                continue;
            }

            if (!trim(preceding).empty()) out::info(trim(preceding));

            uint64_t index;
            {
                std::lock_guard<std::mutex> lock(conv_mutex_);
                index = conversation_.next_tool_index();
                Message call;
                call.role = "assistant";
                call.content = std::move(thinking);
                thinking.clear();
                call.content.push_back(Content::make_text(preceding + grammar_->format_tool_call(seg.name, seg.args, seg.body)));
                call.info = {MessageKind::tool_call, seg.name, index};
                conversation_.push(std::move(call));
                if (resp.usage) {
                    tokens_.update_token_usage(conversation_.size() - 1, resp.usage->input_tokens,
                                               resp.usage->output_tokens);
                }
            }
            preceding.clear();

            std::string tool_name = to_lower(seg.name);
            set_state(AgentState::running_tool(tool_name, executor_->is_interruptible(tool_name)));
            ToolResult result = executor_->execute(tool_name, seg.args, seg.body);

            {
                std::lock_guard<std::mutex> lock(conv_mutex_);
                Message reply;
                if (result.success) {
                    reply = Message::tool_result(grammar_->format_tool_result(tool_name, index, result.agent_output),
                                                 tool_name, index);
                } else {
                    reply = Message::tool_error(grammar_->format_tool_error(tool_name, index, result.agent_output),
                                                tool_name, index);
                    out::error(tool_name + ": " + result.agent_output.substr(0, 500));
                }
                for (auto& c : result.contents) {
                    if (c.type != ContentType::text) reply.content.push_back(c);
                }
                conversation_.push(std::move(reply));
                tokens_.register_tool_output(conversation_.size() - 1, tool_name);
                if (result.agent_output.size() > CACHE_RESULT_CHARS) conversation_.cache_here();
            }

            if (result.state_change == StateChange::done) {
                out::system("Done: " + result.agent_output);
                finish_turn(AgentState::done(result.agent_output));
                return;
            }
            if (result.state_change == StateChange::wait) {
                finish_turn(AgentState::idle());
                return;
            }
            if (result.interrupted || drain_interrupts() || stop_) {
                interrupted = true;
                break;
            }
        }

        if (interrupted) {
            out::system("Interrupted");
            break;
        }
    }

    finish_turn(AgentState::idle());
}

} // namespace termineer
