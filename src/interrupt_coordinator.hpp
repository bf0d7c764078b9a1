#pragma once
#include "channel.hpp"
#include <string>
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>

namespace termineer {

constexpr const char* DEFAULT_INTERRUPT_REASON = "User requested interruption (Ctrl+C)";

struct InterruptSignal {
    std::optional<std::string> reason;
    std::shared_ptr<std::atomic<bool>> acknowledged = std::make_shared<std::atomic<bool>>(false);

    std::string reason_or_default() const { return reason ? *reason : DEFAULT_INTERRUPT_REASON; }
};

using InterruptChannel = ChannelPtr<InterruptSignal>;

inline InterruptChannel make_interrupt_channel(size_t capacity = 10) {
    return std::make_shared<Channel<InterruptSignal>>(capacity);
}

// Routes an interrupt to the running interruptible tool when there is one,
// otherwise to the agent loop.
class InterruptCoordinator {
public:
    explicit InterruptCoordinator(InterruptChannel agent_channel)
        : agent_channel_(std::move(agent_channel)) {}

    void set_shell_running(InterruptChannel tool_channel);
    bool is_shell_running() const;

    // Returns false if neither channel accepted the signal.
    bool handle_interrupt(std::optional<std::string> reason = std::nullopt);

    const InterruptChannel& agent_channel() const { return agent_channel_; }

private:
    InterruptChannel agent_channel_;
    mutable std::mutex mutex_;
    InterruptChannel tool_channel_;
};

using InterruptCoordinatorPtr = std::shared_ptr<InterruptCoordinator>;

// Registers a fresh tool channel for the lifetime of an interruptible tool.
class ToolInterruptScope {
public:
    explicit ToolInterruptScope(InterruptCoordinator* coord)
        : coord_(coord), channel_(make_interrupt_channel()) {
        if (coord_) coord_->set_shell_running(channel_);
    }
    // Signals the tool never polled go back to the agent loop.
    ~ToolInterruptScope();
    ToolInterruptScope(const ToolInterruptScope&) = delete;
    ToolInterruptScope& operator=(const ToolInterruptScope&) = delete;

    // Non-blocking; marks the signal acknowledged.
    std::optional<InterruptSignal> poll() {
        auto sig = channel_->try_recv();
        if (sig) *sig->acknowledged = true;
        return sig;
    }

private:
    InterruptCoordinator* coord_;
    InterruptChannel channel_;
};

} // namespace termineer
