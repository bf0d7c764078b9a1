#pragma once
#include "agent.hpp"
#include <map>
#include <stdexcept>

namespace termineer {

enum class AgentErrorKind {
    agent_not_found,
    message_delivery_failed,
    terminated,
    termination_timeout,
    creation_failed
};

class AgentError : public std::runtime_error {
public:
    AgentError(AgentErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}
    AgentErrorKind kind() const { return kind_; }
private:
    AgentErrorKind kind_;
};

struct AgentInfo {
    AgentId id = 0;
    std::string name;
    AgentState state;
};

// Builds backends with create_backend(model, retry).
BackendPtr default_backend_factory(const Config& cfg);

// Owns all agents, indexed by id and by name (the newest agent owns a name).
class AgentManager {
public:
    static constexpr std::chrono::milliseconds TERMINATE_GRACE{2000};

    explicit AgentManager(BackendFactory factory = default_backend_factory, McpRegistry* mcp = nullptr);
    ~AgentManager();

    AgentManager(const AgentManager&) = delete;
    AgentManager& operator=(const AgentManager&) = delete;

    // Throws AgentError(creation_failed).
    AgentId create(const std::string& name, const Config& cfg);

    // Non-blocking. Throws AgentError(agent_not_found | message_delivery_failed).
    void send(AgentId id, AgentMessage msg);
    void send_user_input(AgentId id, const std::string& text) { send(id, AgentMessage::user_input(text)); }

    bool interrupt(AgentId id, std::optional<std::string> reason = std::nullopt);

    // Interrupt, Terminate, wait up to TERMINATE_GRACE, drop from both indices.
    void terminate(AgentId id);
    void terminate_all();

    BufferPtr buffer(AgentId id) const;
    AgentState state(AgentId id) const;
    std::vector<AgentInfo> list() const;
    std::optional<AgentId> id_by_name(const std::string& name) const;
    std::vector<Message> conversation(AgentId id) const;
    uint64_t completed_turns(AgentId id) const;
    std::string last_response(AgentId id) const;
    bool last_turn_failed(AgentId id) const;
    bool is_shell_running(AgentId id) const;
    bool exists(AgentId id) const;

    // Blocks until completed_turns(id) > after, the agent ends, the timeout
    // passes or cancelled() returns true. Returns true on a completed turn.
    bool wait_for_turn(AgentId id, uint64_t after, std::chrono::milliseconds timeout,
                       const std::function<bool()>& cancelled = nullptr) const;

    const BackendFactory& factory() const { return factory_; }

private:
    BackendFactory factory_;
    McpRegistry* mcp_;
    mutable std::mutex mutex_;
    AgentId next_id_ = 1;
    std::map<AgentId, AgentPtr> agents_;
    std::map<std::string, AgentId> names_;

    AgentPtr get(AgentId id) const;
    AgentPtr detach_agent(AgentId id);
    static void stop_agent(const AgentPtr& agent);
};

} // namespace termineer
