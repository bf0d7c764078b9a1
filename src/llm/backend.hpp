#pragma once
#include "../message.hpp"
#include <string>
#include <vector>
#include <set>
#include <optional>
#include <stdexcept>
#include <memory>

namespace termineer {

struct TokenUsage {
    size_t input_tokens = 0;
    size_t output_tokens = 0;
    size_t cache_creation_input_tokens = 0;
    size_t cache_read_input_tokens = 0;
};

struct LlmResponse {
    std::vector<Content> content;
    std::optional<TokenUsage> usage;
    std::optional<std::string> stop_reason;
    std::optional<std::string> stop_sequence;

    // Concatenated text elements.
    std::string text() const {
        std::string out;
        for (auto& c : content) {
            if (c.type == ContentType::text) out += c.text;
        }
        return out;
    }
};

enum class LlmErrorKind {
    rate_limit,
    api_error,
    config_error,
    other
};

class LlmError : public std::runtime_error {
public:
    LlmError(LlmErrorKind kind, const std::string& msg, std::optional<int> retry_after = std::nullopt)
        : std::runtime_error(msg), kind_(kind), retry_after_(retry_after) {}

    LlmErrorKind kind() const { return kind_; }
    // Seconds, from the server's retry-after header.
    std::optional<int> retry_after() const { return retry_after_; }

private:
    LlmErrorKind kind_;
    std::optional<int> retry_after_;
};

struct LlmRequest {
    std::vector<Message> messages;
    std::string system;
    std::vector<std::string> stop_sequences;
    int thinking_budget = 0;        // 0 disables extended thinking
    std::set<size_t> cache_points;
    int max_tokens = 32768;
};

// Uniform request/response over one vendor's wire format.
class Backend {
public:
    virtual ~Backend() = default;

    virtual LlmResponse send(const LlmRequest& req) = 0;

    // Backends without a counting endpoint estimate from characters.
    virtual TokenUsage count_tokens(const std::vector<Message>& messages, const std::string& system);

    virtual size_t max_token_limit() const = 0;
    virtual size_t safe_input_token_limit() const { return max_token_limit() * 8 / 10; }

    virtual std::string name() const = 0;
    virtual std::string model() const = 0;
};

using BackendPtr = std::shared_ptr<Backend>;

} // namespace termineer
