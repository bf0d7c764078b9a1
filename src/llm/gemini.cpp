#include "gemini.hpp"
#include "openai_compat.hpp"
#include "../utils.hpp"

namespace termineer {

size_t gemini_token_limit(const std::string& model) {
    if (starts_with(model, "gemini-2")) return 2097152;
    if (starts_with(model, "gemini-1.5")) return 1048576;
    if (starts_with(model, "gemini-1.0-pro") || model == "gemini-pro") return 32768;
    return 32000;
}

static nlohmann::json text_part(const std::string& text) {
    nlohmann::json p;
    p["text"] = text;
    return p;
}

GeminiBackend::GeminiBackend(std::string api_key, std::string model, RetryConfig retry)
    : api_key_(std::move(api_key)), model_(std::move(model)), retry_(retry) {}

size_t GeminiBackend::max_token_limit() const {
    return gemini_token_limit(model_);
}

nlohmann::json GeminiBackend::build_body(const LlmRequest& req) const {
    auto contents = nlohmann::json::array();
    for (auto& m : req.messages) {
        std::string text = flatten_message_text(m);
        if (text.empty()) continue;
        std::string role = m.role == "assistant" ? "model" : "user";
        // Consecutive turns of one role are merged.
        if (!contents.empty() && contents.back()["role"] == role) {
            contents.back()["parts"].push_back(text_part(text));
            continue;
        }
        if (contents.empty() && role == "model") {
            contents.push_back({{"role", "user"}, {"parts", nlohmann::json::array({text_part("(conversation start)")})}});
        }
        contents.push_back({{"role", role}, {"parts", nlohmann::json::array({text_part(text)})}});
    }

    nlohmann::json body;
    body["contents"] = std::move(contents);
    if (!req.system.empty()) {
        body["systemInstruction"] = {{"parts", nlohmann::json::array({text_part(req.system)})}};
    }
    nlohmann::json gen;
    gen["maxOutputTokens"] = req.max_tokens;
    if (!req.stop_sequences.empty()) gen["stopSequences"] = req.stop_sequences;
    body["generationConfig"] = std::move(gen);
    return body;
}

LlmResponse GeminiBackend::parse_response(const nlohmann::json& j) {
    LlmResponse resp;
    if (j.contains("candidates") && j["candidates"].is_array() && !j["candidates"].empty()) {
        auto& cand = j["candidates"][0];
        if (cand.contains("content") && cand["content"].contains("parts")) {
            std::string text;
            for (auto& p : cand["content"]["parts"]) text += p.value("text", "");
            resp.content.push_back(Content::make_text(text));
        }
        if (cand.contains("finishReason") && cand["finishReason"].is_string()) {
            resp.stop_reason = cand["finishReason"].get<std::string>();
        }
    }
    if (j.contains("usageMetadata") && j["usageMetadata"].is_object()) {
        TokenUsage usage;
        usage.input_tokens = j["usageMetadata"].value("promptTokenCount", static_cast<size_t>(0));
        usage.output_tokens = j["usageMetadata"].value("candidatesTokenCount", static_cast<size_t>(0));
        resp.usage = usage;
    }
    return resp;
}

LlmResponse GeminiBackend::send(const LlmRequest& req) {
    std::string url = std::string(API_BASE) + model_ + ":generateContent?key=" + api_key_;
    std::string payload = build_body(req).dump();

    auto resp = send_with_retry(retry_, [&] {
        return https_post(url, {}, payload, "application/json", retry_.request_timeout_secs);
    }, name());

    try {
        return parse_response(nlohmann::json::parse(resp.body));
    } catch (const nlohmann::json::exception& e) {
        throw LlmError(LlmErrorKind::api_error, std::string("google: failed to parse response: ") + e.what());
    }
}

} // namespace termineer
