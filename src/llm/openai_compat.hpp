#pragma once
#include "backend.hpp"
#include "retry.hpp"
#include <nlohmann/json.hpp>
#include <functional>

namespace termineer {

// Vendor settings for a /chat/completions API.
struct OpenAiCompatProfile {
    std::string name;           // "openai", "deepseek", "grok", "openrouter"
    std::string base_url;       // without trailing /chat/completions
    HttpHeaders extra_headers;
    std::function<size_t(const std::string&)> token_limit;
};

class OpenAiCompatBackend : public Backend {
public:
    OpenAiCompatBackend(OpenAiCompatProfile profile, std::string api_key, std::string model,
                        RetryConfig retry = {});

    LlmResponse send(const LlmRequest& req) override;
    size_t max_token_limit() const override { return profile_.token_limit(model_); }
    std::string name() const override { return profile_.name; }
    std::string model() const override { return model_; }

    nlohmann::json build_body(const LlmRequest& req) const;
    static LlmResponse parse_response(const nlohmann::json& j);

private:
    OpenAiCompatProfile profile_;
    std::string api_key_;
    std::string model_;
    RetryConfig retry_;
};

size_t openai_token_limit(const std::string& model);
size_t deepseek_token_limit(const std::string& model);
size_t grok_token_limit(const std::string& model);
size_t openrouter_token_limit(const std::string& model);

OpenAiCompatProfile openai_profile();
OpenAiCompatProfile deepseek_profile();
OpenAiCompatProfile grok_profile();
// site_url/site_name become HTTP-Referer/X-Title when set.
OpenAiCompatProfile openrouter_profile(const std::string& site_url, const std::string& site_name);

// Flattens a message's content to the plain text vendors without content
// blocks accept. Thinking blocks are dropped.
std::string flatten_message_text(const Message& m);

} // namespace termineer
