#include "factory.hpp"
#include "anthropic.hpp"
#include "openai_compat.hpp"
#include "gemini.hpp"
#include "cohere.hpp"
#include "../utils.hpp"

namespace termineer {

static Provider provider_from_name(const std::string& name) {
    std::string n = to_lower(name);
    if (n == "anthropic") return Provider::anthropic;
    if (n == "openai") return Provider::openai;
    if (n == "google" || n == "gemini") return Provider::google;
    if (n == "deepseek") return Provider::deepseek;
    if (n == "cohere") return Provider::cohere;
    if (n == "grok" || n == "xai") return Provider::grok;
    if (n == "openrouter") return Provider::openrouter;
    return Provider::unknown;
}

ModelSpec parse_model_string(const std::string& model_string) {
    size_t slash = model_string.find('/');
    if (slash != std::string::npos) {
        Provider p = provider_from_name(model_string.substr(0, slash));
        if (p != Provider::unknown) return {p, model_string.substr(slash + 1)};
    }

    const std::string& m = model_string;
    if (starts_with(m, "claude-")) return {Provider::anthropic, m};
    if (starts_with(m, "gpt-") || starts_with(m, "text-") || starts_with(m, "davinci") || starts_with(m, "o1"))
        return {Provider::openai, m};
    if (starts_with(m, "gemini-")) return {Provider::google, m};
    if (starts_with(m, "or-")) return {Provider::openrouter, m.substr(3)};
    if (starts_with(m, "deepseek-")) return {Provider::deepseek, m};
    if (starts_with(m, "command")) return {Provider::cohere, m};
    if (starts_with(m, "grok-")) return {Provider::grok, m};
    return {Provider::unknown, m};
}

std::string provider_name(Provider p) {
    switch (p) {
        case Provider::anthropic: return "anthropic";
        case Provider::openai: return "openai";
        case Provider::google: return "google";
        case Provider::deepseek: return "deepseek";
        case Provider::cohere: return "cohere";
        case Provider::grok: return "grok";
        case Provider::openrouter: return "openrouter";
        case Provider::unknown: break;
    }
    return "unknown";
}

std::string provider_env_key(Provider p) {
    switch (p) {
        case Provider::anthropic: return "ANTHROPIC_API_KEY";
        case Provider::openai: return "OPENAI_API_KEY";
        case Provider::google: return "GOOGLE_API_KEY";
        case Provider::deepseek: return "DEEPSEEK_API_KEY";
        case Provider::cohere: return "COHERE_API_KEY";
        case Provider::grok: return "GROK_API_KEY";
        case Provider::openrouter: return "OPENROUTER_API_KEY";
        case Provider::unknown: break;
    }
    return "";
}

BackendPtr create_backend(const std::string& model_string, const RetryConfig& retry) {
    ModelSpec spec = parse_model_string(model_string);
    if (spec.provider == Provider::unknown) {
        throw LlmError(LlmErrorKind::config_error, "Unknown model or provider: " + model_string);
    }

    std::string key_var = provider_env_key(spec.provider);
    std::string key = env_or(key_var.c_str());
    if (key.empty()) {
        throw LlmError(LlmErrorKind::config_error,
                       key_var + " is not set (required for " + provider_name(spec.provider) + ")");
    }

    switch (spec.provider) {
        case Provider::anthropic:
            return std::make_shared<AnthropicBackend>(key, spec.model, retry);
        case Provider::openai:
            return std::make_shared<OpenAiCompatBackend>(openai_profile(), key, spec.model, retry);
        case Provider::google:
            return std::make_shared<GeminiBackend>(key, spec.model, retry);
        case Provider::deepseek:
            return std::make_shared<OpenAiCompatBackend>(deepseek_profile(), key, spec.model, retry);
        case Provider::cohere:
            return std::make_shared<CohereBackend>(key, spec.model, retry);
        case Provider::grok:
            return std::make_shared<OpenAiCompatBackend>(grok_profile(), key, spec.model, retry);
        case Provider::openrouter:
            return std::make_shared<OpenAiCompatBackend>(
                openrouter_profile(env_or("OPENROUTER_SITE_URL"), env_or("OPENROUTER_SITE_NAME")),
                key, spec.model, retry);
        case Provider::unknown:
            break;
    }
    throw LlmError(LlmErrorKind::config_error, "Unknown model or provider: " + model_string);
}

} // namespace termineer
