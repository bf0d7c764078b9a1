#pragma once
#include "backend.hpp"
#include "retry.hpp"
#include <nlohmann/json.hpp>

namespace termineer {

class GeminiBackend : public Backend {
public:
    static constexpr const char* API_BASE = "https://generativelanguage.googleapis.com/v1beta/models/";

    GeminiBackend(std::string api_key, std::string model, RetryConfig retry = {});

    LlmResponse send(const LlmRequest& req) override;
    size_t max_token_limit() const override;
    std::string name() const override { return "google"; }
    std::string model() const override { return model_; }

    nlohmann::json build_body(const LlmRequest& req) const;
    static LlmResponse parse_response(const nlohmann::json& j);

private:
    std::string api_key_;
    std::string model_;
    RetryConfig retry_;
};

size_t gemini_token_limit(const std::string& model);

} // namespace termineer
