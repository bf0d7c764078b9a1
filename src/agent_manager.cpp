#include "agent_manager.hpp"
#include "prompts.hpp"
#include "llm/factory.hpp"
#include "mcp/registry.hpp"
#include <iostream>

namespace termineer {

BackendPtr default_backend_factory(const Config& cfg) {
    return create_backend(cfg.model, cfg.retry);
}

AgentManager::AgentManager(BackendFactory factory, McpRegistry* mcp)
    : factory_(std::move(factory)), mcp_(mcp) {}

AgentManager::~AgentManager() {
    std::map<AgentId, AgentPtr> agents;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        agents.swap(agents_);
        names_.clear();
    }
    for (auto& [id, a] : agents) stop_agent(a);
}

AgentId AgentManager::create(const std::string& name, const Config& cfg) {
    if (!cfg.kind.empty() && !find_kind(cfg.kind)) {
        throw AgentError(AgentErrorKind::creation_failed, "Invalid agent kind: '" + cfg.kind + "'");
    }

    BackendPtr backend;
    try {
        backend = factory_(cfg);
    } catch (const LlmError& e) {
        throw AgentError(AgentErrorKind::creation_failed, std::string("Failed to create backend: ") + e.what());
    }
    if (!backend) {
        throw AgentError(AgentErrorKind::creation_failed, "Failed to create backend for " + cfg.model);
    }

    AgentId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_id_++;
    }

    std::string display = name.empty() ? "agent_" + std::to_string(id) : name;
    AgentPtr agent;
    try {
        agent = std::make_shared<Agent>(id, display, cfg, backend, factory_, this, mcp_);
    } catch (const std::invalid_argument& e) {
        throw AgentError(AgentErrorKind::creation_failed, e.what());
    }
    agent->start();

    std::lock_guard<std::mutex> lock(mutex_);
    agents_[id] = agent;
    names_[display] = id;
    return id;
}

AgentPtr AgentManager::get(AgentId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = agents_.find(id);
    if (it == agents_.end()) {
        throw AgentError(AgentErrorKind::agent_not_found, "Agent not found: " + std::to_string(id));
    }
    return it->second;
}

bool AgentManager::exists(AgentId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return agents_.count(id) > 0;
}

void AgentManager::send(AgentId id, AgentMessage msg) {
    auto agent = get(id);
    if (!agent->inbox()->try_send(std::move(msg))) {
        throw AgentError(AgentErrorKind::message_delivery_failed,
                         "Failed to deliver message to agent " + std::to_string(id));
    }
}

bool AgentManager::interrupt(AgentId id, std::optional<std::string> reason) {
    return get(id)->interrupts().handle_interrupt(std::move(reason));
}

void AgentManager::stop_agent(const AgentPtr& agent) {
    agent->interrupts().handle_interrupt(std::string("Agent terminated"));
    agent->request_stop();
    // A full inbox is fine here: the stop flag ends the loop as well.
    agent->inbox()->try_send(AgentMessage::terminate());
    if (!agent->join_for(TERMINATE_GRACE)) {
        std::cerr << "[agent:" << agent->name() << "] did not stop within "
                  << TERMINATE_GRACE.count() << "ms, detached\n";
    }
    agent->inbox()->close();
}

AgentPtr AgentManager::detach_agent(AgentId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = agents_.find(id);
    if (it == agents_.end()) {
        throw AgentError(AgentErrorKind::agent_not_found, "Agent not found: " + std::to_string(id));
    }
    AgentPtr agent = it->second;
    agents_.erase(it);
    auto n = names_.find(agent->name());
    if (n != names_.end() && n->second == id) names_.erase(n);
    return agent;
}

void AgentManager::terminate(AgentId id) {
    stop_agent(detach_agent(id));
}

void AgentManager::terminate_all() {
    std::map<AgentId, AgentPtr> agents;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        agents.swap(agents_);
        names_.clear();
    }

    std::vector<std::thread> stoppers;
    for (auto& [id, a] : agents) {
        stoppers.emplace_back([agent = a] { stop_agent(agent); });
    }
    for (auto& t : stoppers) t.join();

    if (mcp_) mcp_->shutdown();
}

BufferPtr AgentManager::buffer(AgentId id) const {
    return get(id)->buffer();
}

AgentState AgentManager::state(AgentId id) const {
    return get(id)->state();
}

std::vector<AgentInfo> AgentManager::list() const {
    std::vector<AgentPtr> agents;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, a] : agents_) agents.push_back(a);
    }
    std::vector<AgentInfo> infos;
    for (auto& a : agents) infos.push_back({a->id(), a->name(), a->state()});
    return infos;
}

std::optional<AgentId> AgentManager::id_by_name(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = names_.find(name);
    if (it == names_.end()) return std::nullopt;
    return it->second;
}

std::vector<Message> AgentManager::conversation(AgentId id) const {
    return get(id)->conversation_snapshot();
}

uint64_t AgentManager::completed_turns(AgentId id) const {
    return get(id)->completed_turns();
}

std::string AgentManager::last_response(AgentId id) const {
    return get(id)->last_response();
}

bool AgentManager::last_turn_failed(AgentId id) const {
    return get(id)->last_turn_failed();
}

bool AgentManager::is_shell_running(AgentId id) const {
    return get(id)->interrupts().is_shell_running();
}

bool AgentManager::wait_for_turn(AgentId id, uint64_t after, std::chrono::milliseconds timeout,
                                 const std::function<bool()>& cancelled) const {
    auto agent = get(id);
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (agent->completed_turns() > after) return true;
        if (agent->finished()) return false;
        if (cancelled && cancelled()) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return agent->completed_turns() > after;
}

} // namespace termineer
