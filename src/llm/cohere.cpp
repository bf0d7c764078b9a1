#include "cohere.hpp"
#include "openai_compat.hpp"
#include "../utils.hpp"

namespace termineer {

size_t cohere_token_limit(const std::string& model) {
    if (starts_with(model, "command-r")) return 128000;
    if (starts_with(model, "command-light")) return 4000;
    if (starts_with(model, "command")) return 4096;
    return 8000;
}

CohereBackend::CohereBackend(std::string api_key, std::string model, RetryConfig retry)
    : api_key_(std::move(api_key)), model_(std::move(model)), retry_(retry) {}

size_t CohereBackend::max_token_limit() const {
    return cohere_token_limit(model_);
}

nlohmann::json CohereBackend::build_body(const LlmRequest& req) const {
    // The final user turn is the message; everything before is history.
    size_t last_user = req.messages.size();
    for (size_t i = req.messages.size(); i-- > 0;) {
        if (req.messages[i].role != "assistant") { last_user = i; break; }
    }

    auto history = nlohmann::json::array();
    std::string message;
    for (size_t i = 0; i < req.messages.size(); i++) {
        std::string text = flatten_message_text(req.messages[i]);
        if (i == last_user) { message = text; continue; }
        if (text.empty()) continue;
        history.push_back({{"role", req.messages[i].role == "assistant" ? "CHATBOT" : "USER"},
                           {"message", text}});
    }

    nlohmann::json body;
    body["model"] = model_;
    body["message"] = message;
    body["chat_history"] = std::move(history);
    body["max_tokens"] = req.max_tokens;
    if (!req.system.empty()) body["preamble"] = req.system;
    if (!req.stop_sequences.empty()) body["stop_sequences"] = req.stop_sequences;
    return body;
}

LlmResponse CohereBackend::parse_response(const nlohmann::json& j) {
    LlmResponse resp;
    resp.content.push_back(Content::make_text(j.value("text", "")));
    if (j.contains("finish_reason") && j["finish_reason"].is_string()) {
        resp.stop_reason = j["finish_reason"].get<std::string>();
    }
    TokenUsage usage;
    bool have_usage = false;
    if (j.contains("meta") && j["meta"].contains("billed_units")) {
        auto& b = j["meta"]["billed_units"];
        usage.input_tokens = b.value("input_tokens", static_cast<size_t>(0));
        usage.output_tokens = b.value("output_tokens", static_cast<size_t>(0));
        have_usage = true;
    } else if (j.contains("token_count")) {
        auto& t = j["token_count"];
        usage.input_tokens = t.value("prompt_tokens", static_cast<size_t>(0));
        usage.output_tokens = t.value("response_tokens", static_cast<size_t>(0));
        have_usage = true;
    }
    if (have_usage) resp.usage = usage;
    return resp;
}

LlmResponse CohereBackend::send(const LlmRequest& req) {
    HttpHeaders headers = {{"Authorization", "Bearer " + api_key_}};
    std::string payload = build_body(req).dump();

    auto resp = send_with_retry(retry_, [&] {
        return https_post(API_URL, headers, payload, "application/json", retry_.request_timeout_secs);
    }, name());

    try {
        return parse_response(nlohmann::json::parse(resp.body));
    } catch (const nlohmann::json::exception& e) {
        throw LlmError(LlmErrorKind::api_error, std::string("cohere: failed to parse response: ") + e.what());
    }
}

} // namespace termineer
