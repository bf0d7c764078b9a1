#include "openai_compat.hpp"
#include "../utils.hpp"

namespace termineer {

static bool has(const std::string& model, const char* needle) {
    return model.find(needle) != std::string::npos;
}

size_t openai_token_limit(const std::string& model) {
    if (has(model, "gpt-4o")) return 128000;
    if (has(model, "gpt-4-turbo") || has(model, "gpt-4-1106") || has(model, "gpt-4-0125")) return 128000;
    if (has(model, "gpt-4-32k")) return 32768;
    if (has(model, "gpt-4")) return 8192;
    if (has(model, "gpt-3.5-turbo")) return 16384;
    return 8000;
}

size_t deepseek_token_limit(const std::string&) {
    return 32768;
}

size_t grok_token_limit(const std::string& model) {
    if (has(model, "grok-2")) return 128000;
    if (has(model, "grok-beta")) return 32000;
    return 32000;
}

size_t openrouter_token_limit(const std::string& model) {
    if (has(model, "gpt-4o")) return 128000;
    if (has(model, "claude-3")) return 200000;
    return 8192;
}

OpenAiCompatProfile openai_profile() {
    return {"openai", "https://api.openai.com/v1", {}, openai_token_limit};
}

OpenAiCompatProfile deepseek_profile() {
    return {"deepseek", "https://api.deepseek.com", {}, deepseek_token_limit};
}

OpenAiCompatProfile grok_profile() {
    return {"grok", "https://api.x.ai/v1", {}, grok_token_limit};
}

OpenAiCompatProfile openrouter_profile(const std::string& site_url, const std::string& site_name) {
    OpenAiCompatProfile p{"openrouter", "https://openrouter.ai/api/v1", {}, openrouter_token_limit};
    if (!site_url.empty()) p.extra_headers["HTTP-Referer"] = site_url;
    if (!site_name.empty()) p.extra_headers["X-Title"] = site_name;
    return p;
}

std::string flatten_message_text(const Message& m) {
    std::string out;
    for (auto& c : m.content) {
        std::string part;
        switch (c.type) {
            case ContentType::text: part = c.text; break;
            case ContentType::document: part = "Document: " + c.source; break;
            case ContentType::image: part = "[image: " + c.media_type + "]"; break;
            default: break;
        }
        if (part.empty()) continue;
        if (!out.empty()) out += "\n";
        out += part;
    }
    return out;
}

OpenAiCompatBackend::OpenAiCompatBackend(OpenAiCompatProfile profile, std::string api_key,
                                         std::string model, RetryConfig retry)
    : profile_(std::move(profile)), api_key_(std::move(api_key)), model_(std::move(model)), retry_(retry) {}

nlohmann::json OpenAiCompatBackend::build_body(const LlmRequest& req) const {
    bool reasoning = starts_with(model_, "o1");

    nlohmann::json body;
    body["model"] = model_;
    if (reasoning) body["max_completion_tokens"] = req.max_tokens;
    else body["max_tokens"] = req.max_tokens;

    auto msgs = nlohmann::json::array();
    if (!req.system.empty()) {
        msgs.push_back({{"role", reasoning ? "user" : "system"}, {"content", req.system}});
    }
    for (auto& m : req.messages) {
        std::string text = flatten_message_text(m);
        if (text.empty()) continue;
        msgs.push_back({{"role", m.role == "assistant" ? "assistant" : "user"}, {"content", text}});
    }
    body["messages"] = std::move(msgs);

    if (!req.stop_sequences.empty() && !reasoning) body["stop"] = req.stop_sequences;
    return body;
}

LlmResponse OpenAiCompatBackend::parse_response(const nlohmann::json& j) {
    LlmResponse resp;
    if (j.contains("choices") && j["choices"].is_array() && !j["choices"].empty()) {
        auto& choice = j["choices"][0];
        if (choice.contains("message")) {
            auto& msg = choice["message"];
            if (msg.contains("content") && msg["content"].is_string()) {
                resp.content.push_back(Content::make_text(msg["content"].get<std::string>()));
            }
        }
        if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
            resp.stop_reason = choice["finish_reason"].get<std::string>();
        }
    }
    if (j.contains("usage") && j["usage"].is_object()) {
        TokenUsage usage;
        usage.input_tokens = j["usage"].value("prompt_tokens", static_cast<size_t>(0));
        usage.output_tokens = j["usage"].value("completion_tokens", static_cast<size_t>(0));
        resp.usage = usage;
    }
    return resp;
}

LlmResponse OpenAiCompatBackend::send(const LlmRequest& req) {
    HttpHeaders headers = profile_.extra_headers;
    headers["Authorization"] = "Bearer " + api_key_;
    std::string url = profile_.base_url + "/chat/completions";
    std::string payload = build_body(req).dump();

    auto resp = send_with_retry(retry_, [&] {
        return https_post(url, headers, payload, "application/json", retry_.request_timeout_secs);
    }, name());

    try {
        return parse_response(nlohmann::json::parse(resp.body));
    } catch (const nlohmann::json::exception& e) {
        throw LlmError(LlmErrorKind::api_error, name() + ": failed to parse response: " + e.what());
    }
}

} // namespace termineer
