#pragma once
#include "config.hpp"
#include "conversation.hpp"
#include "token_manager.hpp"
#include "grammar.hpp"
#include "buffer.hpp"
#include "channel.hpp"
#include "interrupt_coordinator.hpp"
#include "tool_executor.hpp"
#include "llm/backend.hpp"
#include <string>
#include <memory>
#include <thread>
#include <atomic>
#include <mutex>
#include <functional>

namespace termineer {

class AgentManager;
class McpRegistry;

using AgentId = uint64_t;

enum class AgentStateKind {
    idle,
    processing,
    running_tool,
    done,
    terminated
};

struct AgentState {
    AgentStateKind kind = AgentStateKind::idle;
    std::string tool_name;                 // running_tool
    bool interruptible = false;            // running_tool
    std::optional<std::string> response;   // done

    static AgentState idle() { return {}; }
    static AgentState processing() { return {AgentStateKind::processing, "", false, std::nullopt}; }
    static AgentState running_tool(std::string name, bool interruptible) {
        return {AgentStateKind::running_tool, std::move(name), interruptible, std::nullopt};
    }
    static AgentState done(std::optional<std::string> response) {
        return {AgentStateKind::done, "", false, std::move(response)};
    }
    static AgentState terminated() { return {AgentStateKind::terminated, "", false, std::nullopt}; }

    bool is_terminal() const { return kind == AgentStateKind::done || kind == AgentStateKind::terminated; }
    bool is_busy() const { return kind == AgentStateKind::processing || kind == AgentStateKind::running_tool; }
    std::string describe() const;
};

enum class AgentCommandType {
    set_model,
    enable_tools,
    set_system_prompt,
    reset_conversation,
    set_thinking_budget,
    replace_conversation
};

struct AgentCommand {
    AgentCommandType type = AgentCommandType::reset_conversation;
    std::string text;               // set_model, set_system_prompt
    bool flag = false;              // enable_tools
    int number = 0;                 // set_thinking_budget
    std::vector<Message> messages;  // replace_conversation

    static AgentCommand set_model(std::string name) { return {AgentCommandType::set_model, std::move(name), false, 0, {}}; }
    static AgentCommand enable_tools(bool on) { return {AgentCommandType::enable_tools, "", on, 0, {}}; }
    static AgentCommand set_system_prompt(std::string p) { return {AgentCommandType::set_system_prompt, std::move(p), false, 0, {}}; }
    static AgentCommand reset_conversation() { return {}; }
    static AgentCommand set_thinking_budget(int n) { return {AgentCommandType::set_thinking_budget, "", false, n, {}}; }
    static AgentCommand replace_conversation(std::vector<Message> msgs) {
        return {AgentCommandType::replace_conversation, "", false, 0, std::move(msgs)};
    }
};

enum class AgentMessageType {
    user_input,
    agent_input,
    command,
    interrupt,
    terminate
};

struct AgentMessage {
    AgentMessageType type = AgentMessageType::user_input;
    std::string content;
    AgentId source_id = 0;      // agent_input
    std::string source_name;    // agent_input
    AgentCommand command;

    static AgentMessage user_input(std::string text) {
        AgentMessage m;
        m.content = std::move(text);
        return m;
    }
    static AgentMessage agent_input(std::string text, AgentId from, std::string from_name) {
        AgentMessage m;
        m.type = AgentMessageType::agent_input;
        m.content = std::move(text);
        m.source_id = from;
        m.source_name = std::move(from_name);
        return m;
    }
    static AgentMessage make_command(AgentCommand cmd) {
        AgentMessage m;
        m.type = AgentMessageType::command;
        m.command = std::move(cmd);
        return m;
    }
    static AgentMessage interrupt() {
        AgentMessage m;
        m.type = AgentMessageType::interrupt;
        return m;
    }
    static AgentMessage terminate() {
        AgentMessage m;
        m.type = AgentMessageType::terminate;
        return m;
    }
};

// <agent_message source="NAME" source_id="ID">\ncontent\n</agent_message>
std::string format_agent_input(const std::string& content, AgentId source_id, const std::string& source_name);

using BackendFactory = std::function<BackendPtr(const Config&)>;

// One conversational loop on its own thread: model call, tool calls,
// repeat until the model stops calling tools.
class Agent : public std::enable_shared_from_this<Agent> {
public:
    static constexpr size_t INBOX_CAPACITY = 100;
    static constexpr size_t INTERRUPT_CAPACITY = 10;
    static constexpr size_t CACHE_RESULT_CHARS = 500;

    Agent(AgentId id, std::string name, Config cfg, BackendPtr backend, BackendFactory factory,
          AgentManager* manager = nullptr, McpRegistry* mcp = nullptr);
    ~Agent();

    Agent(const Agent&) = delete;
    Agent& operator=(const Agent&) = delete;

    void start();
    // Asks the loop to exit at its next check.
    void request_stop() { stop_ = true; }
    // Waits up to timeout for the thread to exit; joins it if so, detaches otherwise.
    bool join_for(std::chrono::milliseconds timeout);

    AgentId id() const { return id_; }
    const std::string& name() const { return name_; }
    const ChannelPtr<AgentMessage>& inbox() const { return inbox_; }
    InterruptCoordinator& interrupts() { return *coordinator_; }
    BufferPtr buffer() const { return buffer_; }

    AgentState state() const;
    std::vector<Message> conversation_snapshot() const;
    uint64_t completed_turns() const { return completed_turns_; }
    std::string last_response() const;
    bool finished() const { return finished_; }
    // True when the latest turn ended on an unrecoverable backend error.
    bool last_turn_failed() const { return last_turn_failed_; }

private:
    AgentId id_;
    std::string name_;
    Config config_;
    BackendPtr backend_;
    BackendFactory factory_;
    AgentManager* manager_;
    McpRegistry* mcp_;

    BufferPtr buffer_;
    ChannelPtr<AgentMessage> inbox_;
    InterruptChannel interrupt_channel_;
    InterruptCoordinatorPtr coordinator_;
    std::unique_ptr<ToolExecutor> executor_;
    std::shared_ptr<Grammar> grammar_;

    mutable std::mutex conv_mutex_;
    Conversation conversation_;
    TokenManager tokens_;
    std::optional<size_t> last_input_tokens_;

    mutable std::mutex state_mutex_;
    AgentState state_;
    std::string last_response_;
    std::atomic<uint64_t> completed_turns_{0};
    std::atomic<bool> last_turn_failed_{false};

    std::atomic<bool> stop_{false};
    std::atomic<bool> finished_{false};
    std::thread thread_;

    enum class CallOutcome { ok, interrupted, failed, stopped };

    void run();
    void handle(const AgentMessage& msg);
    void apply_command(const AgentCommand& cmd);
    void process_turn();
    CallOutcome call_backend(const LlmRequest& req, LlmResponse& resp, std::string& error);
    void prepare_conversation();
    std::vector<Segment> parse_response(const LlmResponse& resp, std::string& text) const;
    bool drain_interrupts();

    void set_state(AgentState s);
    void finish_turn(AgentState s);
    void push_message(Message m);
    void select_grammar();
    void rebuild_executor();
    std::string system_prompt() const;
};

using AgentPtr = std::shared_ptr<Agent>;

} // namespace termineer
