#include "anthropic.hpp"
#include "../utils.hpp"

namespace termineer {

size_t anthropic_token_limit(const std::string& model) {
    if (model.find("claude-3") != std::string::npos) return 200000;
    if (model.find("claude-2.1") != std::string::npos) return 200000;
    return 100000;
}

AnthropicBackend::AnthropicBackend(std::string api_key, std::string model, RetryConfig retry)
    : api_key_(std::move(api_key)), model_(std::move(model)), retry_(retry) {}

size_t AnthropicBackend::max_token_limit() const {
    return anthropic_token_limit(model_);
}

HttpHeaders AnthropicBackend::headers() const {
    return {
        {"x-api-key", api_key_},
        {"anthropic-version", API_VERSION}
    };
}

static nlohmann::json content_to_json(const Content& c) {
    switch (c.type) {
        case ContentType::text:
            return {{"type", "text"}, {"text", c.text}};
        case ContentType::image:
            return {{"type", "image"},
                    {"source", {{"type", "base64"}, {"media_type", c.media_type}, {"data", c.data}}}};
        case ContentType::document:
            return {{"type", "text"}, {"text", "Document: " + c.source}};
        case ContentType::thinking: {
            nlohmann::json j = {{"type", "thinking"}, {"thinking", c.thinking.value_or("")}};
            if (c.signature) j["signature"] = *c.signature;
            return j;
        }
        case ContentType::redacted_thinking:
            return {{"type", "redacted_thinking"}, {"data", c.redacted.value_or("")}};
    }
    return {{"type", "text"}, {"text", ""}};
}

nlohmann::json AnthropicBackend::build_body(const LlmRequest& req) const {
    nlohmann::json body;
    body["model"] = model_;
    body["max_tokens"] = req.max_tokens > 0 ? req.max_tokens : 32768;

    auto msgs = nlohmann::json::array();
    for (size_t i = 0; i < req.messages.size(); i++) {
        auto& m = req.messages[i];
        nlohmann::json content = nlohmann::json::array();
        for (auto& c : m.content) content.push_back(content_to_json(c));
        if (req.cache_points.count(i) && !content.empty()) {
            content.back()["cache_control"] = {{"type", "ephemeral"}};
        }
        msgs.push_back({{"role", m.role == "assistant" ? "assistant" : "user"}, {"content", content}});
    }
    body["messages"] = std::move(msgs);

    if (!req.system.empty()) body["system"] = req.system;
    if (!req.stop_sequences.empty()) body["stop_sequences"] = req.stop_sequences;
    if (req.thinking_budget > 0) {
        body["thinking"] = {{"type", "enabled"}, {"budget_tokens", req.thinking_budget}};
        if (body["max_tokens"].get<int>() <= req.thinking_budget) {
            body["max_tokens"] = req.thinking_budget + 4096;
        }
    }
    return body;
}

LlmResponse AnthropicBackend::parse_response(const nlohmann::json& j) {
    LlmResponse resp;
    if (j.contains("content") && j["content"].is_array()) {
        for (auto& c : j["content"]) {
            std::string type = c.value("type", "");
            if (type == "text") {
                resp.content.push_back(Content::make_text(c.value("text", "")));
            } else if (type == "thinking") {
                Content t;
                t.type = ContentType::thinking;
                t.thinking = c.value("thinking", "");
                if (c.contains("signature") && c["signature"].is_string()) t.signature = c["signature"].get<std::string>();
                resp.content.push_back(std::move(t));
            } else if (type == "redacted_thinking") {
                Content t;
                t.type = ContentType::redacted_thinking;
                t.redacted = c.value("data", "");
                resp.content.push_back(std::move(t));
            }
        }
    }
    if (j.contains("usage") && j["usage"].is_object()) {
        auto& u = j["usage"];
        TokenUsage usage;
        usage.input_tokens = u.value("input_tokens", static_cast<size_t>(0));
        usage.output_tokens = u.value("output_tokens", static_cast<size_t>(0));
        if (u.contains("cache_creation_input_tokens") && u["cache_creation_input_tokens"].is_number())
            usage.cache_creation_input_tokens = u["cache_creation_input_tokens"].get<size_t>();
        if (u.contains("cache_read_input_tokens") && u["cache_read_input_tokens"].is_number())
            usage.cache_read_input_tokens = u["cache_read_input_tokens"].get<size_t>();
        resp.usage = usage;
    }
    if (j.contains("stop_reason") && j["stop_reason"].is_string()) resp.stop_reason = j["stop_reason"].get<std::string>();
    if (j.contains("stop_sequence") && j["stop_sequence"].is_string()) resp.stop_sequence = j["stop_sequence"].get<std::string>();
    return resp;
}

LlmResponse AnthropicBackend::send(const LlmRequest& req) {
    std::string payload = build_body(req).dump();
    auto resp = send_with_retry(retry_, [&] {
        return https_post(API_URL, headers(), payload, "application/json", retry_.request_timeout_secs);
    }, name());

    try {
        return parse_response(nlohmann::json::parse(resp.body));
    } catch (const nlohmann::json::exception& e) {
        throw LlmError(LlmErrorKind::api_error, std::string("anthropic: failed to parse response: ") + e.what());
    }
}

TokenUsage AnthropicBackend::count_tokens(const std::vector<Message>& messages, const std::string& system) {
    LlmRequest req;
    req.messages = messages;
    req.system = system;
    auto body = build_body(req);
    body.erase("max_tokens");

    auto resp = send_with_retry(retry_, [&] {
        return https_post(COUNT_URL, headers(), body.dump(), "application/json", retry_.request_timeout_secs);
    }, name());

    TokenUsage usage;
    try {
        auto j = nlohmann::json::parse(resp.body);
        usage.input_tokens = j.value("input_tokens", static_cast<size_t>(0));
    } catch (const nlohmann::json::exception& e) {
        throw LlmError(LlmErrorKind::api_error, std::string("anthropic: failed to parse token count: ") + e.what());
    }
    return usage;
}

} // namespace termineer
