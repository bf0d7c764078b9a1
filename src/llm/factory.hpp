#pragma once
#include "backend.hpp"
#include "retry.hpp"
#include <string>

namespace termineer {

enum class Provider {
    anthropic,
    openai,
    google,
    deepseek,
    cohere,
    grok,
    openrouter,
    unknown
};

struct ModelSpec {
    Provider provider = Provider::unknown;
    std::string model;
};

// "provider/model" overrides inference from the model prefix.
ModelSpec parse_model_string(const std::string& model_string);

std::string provider_name(Provider p);
// Environment variable holding the provider's API key.
std::string provider_env_key(Provider p);

// Throws LlmError(config_error) for unknown providers or missing keys.
BackendPtr create_backend(const std::string& model_string, const RetryConfig& retry = {});

} // namespace termineer
