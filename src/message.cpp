#include "message.hpp"
#include "utils.hpp"

namespace termineer {

bool Content::is_empty() const {
    switch (type) {
        case ContentType::text: return trim(text).empty();
        case ContentType::image: return data.empty();
        case ContentType::document: return source.empty();
        case ContentType::thinking: return !thinking || thinking->empty();
        case ContentType::redacted_thinking: return !redacted || redacted->empty();
    }
    return true;
}

nlohmann::json Content::to_json() const {
    nlohmann::json j;
    switch (type) {
        case ContentType::text:
            j["type"] = "text";
            j["text"] = text;
            break;
        case ContentType::image:
            j["type"] = "image";
            j["source"] = {{"type", "base64"}, {"media_type", media_type}, {"data", data}};
            break;
        case ContentType::document:
            j["type"] = "document";
            j["source"] = source;
            break;
        case ContentType::thinking:
            j["type"] = "thinking";
            if (thinking) j["thinking"] = *thinking;
            if (signature) j["signature"] = *signature;
            break;
        case ContentType::redacted_thinking:
            j["type"] = "redacted_thinking";
            if (redacted) j["data"] = *redacted;
            break;
    }
    return j;
}

Content Content::from_json(const nlohmann::json& j) {
    Content c;
    std::string t = j.value("type", "text");
    if (t == "image") {
        c.type = ContentType::image;
        if (j.contains("source") && j["source"].is_object()) {
            c.media_type = j["source"].value("media_type", "");
            c.data = j["source"].value("data", "");
        }
    } else if (t == "document") {
        c.type = ContentType::document;
        if (j.contains("source") && j["source"].is_string()) c.source = j["source"].get<std::string>();
    } else if (t == "thinking") {
        c.type = ContentType::thinking;
        if (j.contains("thinking") && j["thinking"].is_string()) c.thinking = j["thinking"].get<std::string>();
        if (j.contains("signature") && j["signature"].is_string()) c.signature = j["signature"].get<std::string>();
    } else if (t == "redacted_thinking") {
        c.type = ContentType::redacted_thinking;
        if (j.contains("data") && j["data"].is_string()) c.redacted = j["data"].get<std::string>();
    } else {
        c.text = j.value("text", "");
    }
    return c;
}

static const char* kind_name(MessageKind k) {
    switch (k) {
        case MessageKind::user: return "user";
        case MessageKind::assistant: return "assistant";
        case MessageKind::system: return "system";
        case MessageKind::tool_call: return "tool_call";
        case MessageKind::tool_result: return "tool_result";
        case MessageKind::tool_error: return "tool_error";
    }
    return "user";
}

nlohmann::json MessageInfo::to_json() const {
    nlohmann::json j;
    j["type"] = kind_name(kind);
    if (is_tool()) {
        j["tool_name"] = tool_name;
        j["tool_index"] = tool_index;
    }
    return j;
}

MessageInfo MessageInfo::from_json(const nlohmann::json& j) {
    MessageInfo info;
    std::string t = j.value("type", "user");
    if (t == "assistant") info.kind = MessageKind::assistant;
    else if (t == "system") info.kind = MessageKind::system;
    else if (t == "tool_call") info.kind = MessageKind::tool_call;
    else if (t == "tool_result") info.kind = MessageKind::tool_result;
    else if (t == "tool_error") info.kind = MessageKind::tool_error;
    else info.kind = MessageKind::user;
    info.tool_name = j.value("tool_name", "");
    info.tool_index = j.value("tool_index", static_cast<uint64_t>(0));
    return info;
}

} // namespace termineer
