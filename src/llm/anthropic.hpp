#pragma once
#include "backend.hpp"
#include "retry.hpp"
#include <nlohmann/json.hpp>

namespace termineer {

class AnthropicBackend : public Backend {
public:
    static constexpr const char* API_URL = "https://api.anthropic.com/v1/messages";
    static constexpr const char* COUNT_URL = "https://api.anthropic.com/v1/messages/count_tokens";
    static constexpr const char* API_VERSION = "2023-06-01";

    AnthropicBackend(std::string api_key, std::string model, RetryConfig retry = {});

    LlmResponse send(const LlmRequest& req) override;
    TokenUsage count_tokens(const std::vector<Message>& messages, const std::string& system) override;
    size_t max_token_limit() const override;
    std::string name() const override { return "anthropic"; }
    std::string model() const override { return model_; }

    // Request body, exposed for tests.
    nlohmann::json build_body(const LlmRequest& req) const;
    static LlmResponse parse_response(const nlohmann::json& j);

private:
    std::string api_key_;
    std::string model_;
    RetryConfig retry_;

    HttpHeaders headers() const;
};

size_t anthropic_token_limit(const std::string& model);

} // namespace termineer
