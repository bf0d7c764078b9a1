#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace termineer {

enum class ContentType {
    text,
    image,
    document,
    thinking,
    redacted_thinking
};

struct Content {
    ContentType type = ContentType::text;
    std::string text;                        // text
    std::string media_type;                  // image
    std::string data;                        // image base64 payload
    std::string source;                      // document
    std::optional<std::string> thinking;     // thinking
    std::optional<std::string> signature;    // thinking
    std::optional<std::string> redacted;     // redacted_thinking

    static Content make_text(std::string t) {
        Content c;
        c.text = std::move(t);
        return c;
    }

    static Content make_image(std::string media, std::string payload) {
        Content c;
        c.type = ContentType::image;
        c.media_type = std::move(media);
        c.data = std::move(payload);
        return c;
    }

    static Content make_document(std::string src) {
        Content c;
        c.type = ContentType::document;
        c.source = std::move(src);
        return c;
    }

    bool is_empty() const;
    nlohmann::json to_json() const;
    static Content from_json(const nlohmann::json& j);
};

enum class MessageKind {
    user,
    assistant,
    system,
    tool_call,
    tool_result,
    tool_error
};

struct MessageInfo {
    MessageKind kind = MessageKind::user;
    std::string tool_name;  // tool_* kinds
    uint64_t tool_index = 0;

    bool is_tool() const {
        return kind == MessageKind::tool_call || kind == MessageKind::tool_result ||
               kind == MessageKind::tool_error;
    }

    nlohmann::json to_json() const;
    static MessageInfo from_json(const nlohmann::json& j);
};

struct Message {
    std::string role;  // "user", "assistant", "system"
    std::vector<Content> content;
    MessageInfo info;

    static Message user(const std::string& text) {
        return Message{"user", {Content::make_text(text)}, {MessageKind::user, "", 0}};
    }

    static Message assistant(const std::string& text) {
        return Message{"assistant", {Content::make_text(text)}, {MessageKind::assistant, "", 0}};
    }

    static Message system_msg(const std::string& text) {
        return Message{"system", {Content::make_text(text)}, {MessageKind::system, "", 0}};
    }

    static Message tool_call(const std::string& text, const std::string& name, uint64_t index) {
        return Message{"assistant", {Content::make_text(text)}, {MessageKind::tool_call, name, index}};
    }

    static Message tool_result(const std::string& text, const std::string& name, uint64_t index) {
        return Message{"user", {Content::make_text(text)}, {MessageKind::tool_result, name, index}};
    }

    static Message tool_error(const std::string& text, const std::string& name, uint64_t index) {
        return Message{"user", {Content::make_text(text)}, {MessageKind::tool_error, name, index}};
    }

    // Concatenation of all text elements.
    std::string text() const {
        std::string result;
        for (auto& c : content) {
            if (c.type == ContentType::text) result += c.text;
        }
        return result;
    }

    // True when every content element is empty (or there are none).
    bool is_empty() const {
        for (auto& c : content) {
            if (!c.is_empty()) return false;
        }
        return true;
    }

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["role"] = role;
        auto arr = nlohmann::json::array();
        for (auto& c : content) arr.push_back(c.to_json());
        j["content"] = std::move(arr);
        j["info"] = info.to_json();
        return j;
    }

    static Message from_json(const nlohmann::json& j) {
        Message m;
        m.role = j.value("role", "user");
        if (j.contains("content")) {
            auto& c = j["content"];
            if (c.is_string()) {
                m.content.push_back(Content::make_text(c.get<std::string>()));
            } else if (c.is_array()) {
                for (auto& e : c) m.content.push_back(Content::from_json(e));
            }
        }
        if (j.contains("info")) {
            m.info = MessageInfo::from_json(j["info"]);
        } else {
            m.info.kind = m.role == "assistant" ? MessageKind::assistant
                        : m.role == "system" ? MessageKind::system : MessageKind::user;
        }
        return m;
    }
};

} // namespace termineer
