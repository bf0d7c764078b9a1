#pragma once
#include "llm/backend.hpp"
#include <deque>
#include <functional>
#include <mutex>

namespace termineer {
namespace test_support {

inline LlmResponse text_response(const std::string& text,
                                 std::optional<std::string> stop_sequence = std::nullopt,
                                 std::optional<size_t> input_tokens = std::nullopt) {
    LlmResponse r;
    r.content.push_back(Content::make_text(text));
    if (stop_sequence) {
        r.stop_reason = "stop_sequence";
        r.stop_sequence = stop_sequence;
    } else {
        r.stop_reason = "end_turn";
    }
    if (input_tokens) {
        TokenUsage u;
        u.input_tokens = *input_tokens;
        u.output_tokens = 10;
        r.usage = u;
    }
    return r;
}

// Backend that replays queued responses and records every request.
// With an empty queue it answers with the fallback function, or a fixed text.
class ScriptedBackend : public Backend {
public:
    using Step = std::function<LlmResponse(const LlmRequest&)>;

    explicit ScriptedBackend(size_t token_limit = 200000, std::string model = "scripted-model")
        : token_limit_(token_limit), model_(std::move(model)) {}

    void push(LlmResponse resp) {
        push_step([resp](const LlmRequest&) { return resp; });
    }
    void push_text(const std::string& text) { push(text_response(text)); }
    void push_step(Step step) {
        std::lock_guard<std::mutex> lock(mutex_);
        steps_.push_back(std::move(step));
    }
    void set_fallback(Step step) {
        std::lock_guard<std::mutex> lock(mutex_);
        fallback_ = std::move(step);
    }

    LlmResponse send(const LlmRequest& req) override {
        Step step;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(req);
            if (!steps_.empty()) {
                step = std::move(steps_.front());
                steps_.pop_front();
            } else {
                step = fallback_;
            }
        }
        if (step) return step(req);
        return text_response("(no more scripted responses)");
    }

    size_t max_token_limit() const override { return token_limit_; }
    std::string name() const override { return "scripted"; }
    std::string model() const override { return model_; }

    std::vector<LlmRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }
    size_t request_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

private:
    size_t token_limit_;
    std::string model_;
    mutable std::mutex mutex_;
    std::deque<Step> steps_;
    Step fallback_;
    std::vector<LlmRequest> requests_;
};

// Text of the last user message in a request.
inline std::string last_user_text(const LlmRequest& req) {
    for (auto it = req.messages.rbegin(); it != req.messages.rend(); ++it) {
        if (it->role == "user") return it->text();
    }
    return "";
}

} // namespace test_support
} // namespace termineer
