#pragma once
#include "backend.hpp"
#include "retry.hpp"
#include <nlohmann/json.hpp>

namespace termineer {

class CohereBackend : public Backend {
public:
    static constexpr const char* API_URL = "https://api.cohere.ai/v1/chat";

    CohereBackend(std::string api_key, std::string model, RetryConfig retry = {});

    LlmResponse send(const LlmRequest& req) override;
    size_t max_token_limit() const override;
    std::string name() const override { return "cohere"; }
    std::string model() const override { return model_; }

    nlohmann::json build_body(const LlmRequest& req) const;
    static LlmResponse parse_response(const nlohmann::json& j);

private:
    std::string api_key_;
    std::string model_;
    RetryConfig retry_;
};

size_t cohere_token_limit(const std::string& model);

} // namespace termineer
