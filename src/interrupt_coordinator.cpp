#include "interrupt_coordinator.hpp"

namespace termineer {

void InterruptCoordinator::set_shell_running(InterruptChannel tool_channel) {
    std::lock_guard<std::mutex> lock(mutex_);
    tool_channel_ = std::move(tool_channel);
}

bool InterruptCoordinator::is_shell_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tool_channel_ != nullptr;
}

bool InterruptCoordinator::handle_interrupt(std::optional<std::string> reason) {
    InterruptSignal sig;
    sig.reason = reason ? reason : std::optional<std::string>(DEFAULT_INTERRUPT_REASON);

    InterruptChannel tool;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tool = tool_channel_;
    }
    if (tool && tool->try_send(sig)) return true;
    return agent_channel_ && agent_channel_->try_send(sig);
}

ToolInterruptScope::~ToolInterruptScope() {
    if (!coord_) return;
    coord_->set_shell_running(nullptr);
    // A sender that raced the close sees try_send fail and falls back itself.
    channel_->close();
    while (auto sig = channel_->try_recv()) {
        if (coord_->agent_channel()) coord_->agent_channel()->try_send(*sig);
    }
}

} // namespace termineer
