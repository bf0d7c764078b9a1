#include "conversation.hpp"
#include "utils.hpp"
#include <algorithm>

namespace termineer {

void Conversation::replace(std::vector<Message> messages) {
    messages_ = std::move(messages);
    recompute_tool_index();
    reset_cache_points();
}

void Conversation::clear() {
    messages_.clear();
    cache_points_.clear();
    last_tool_index_ = 0;
}

void Conversation::cache_here() {
    if (messages_.empty()) return;
    cache_points_.insert(messages_.size() - 1);
    while (cache_points_.size() > MAX_CACHE_POINTS) {
        cache_points_.erase(cache_points_.begin());
    }
}

void Conversation::reset_cache_points() {
    cache_points_.clear();
    if (!messages_.empty()) cache_points_.insert(messages_.size() - 1);
}

size_t Conversation::sanitize() {
    size_t before = messages_.size();
    messages_.erase(
        std::remove_if(messages_.begin(), messages_.end(),
                       [](const Message& m) { return m.is_empty(); }),
        messages_.end());
    size_t removed = before - messages_.size();
    if (removed > 0) {
        // Indices shifted; drop any point now past the end.
        for (auto it = cache_points_.begin(); it != cache_points_.end();) {
            if (*it >= messages_.size()) it = cache_points_.erase(it);
            else ++it;
        }
    }
    return removed;
}

std::string Conversation::last_assistant_text() const {
    for (auto it = messages_.rbegin(); it != messages_.rend(); ++it) {
        if (it->role == "assistant") return it->text();
    }
    return "";
}

size_t Conversation::estimate_tokens() const {
    size_t total = 0;
    for (auto& m : messages_) {
        for (auto& c : m.content) {
            switch (c.type) {
                case ContentType::text: total += termineer::estimate_tokens(c.text); break;
                case ContentType::thinking: total += termineer::estimate_tokens(c.thinking.value_or("")); break;
                case ContentType::image: total += 1000; break;
                default: break;
            }
        }
        total += 4;
    }
    return total;
}

nlohmann::json Conversation::to_json() const {
    auto arr = nlohmann::json::array();
    for (auto& m : messages_) arr.push_back(m.to_json());
    return arr;
}

std::vector<Message> Conversation::messages_from_json(const nlohmann::json& arr) {
    std::vector<Message> result;
    if (!arr.is_array()) return result;
    for (auto& j : arr) result.push_back(Message::from_json(j));
    return result;
}

void Conversation::recompute_tool_index() {
    last_tool_index_ = 0;
    for (auto& m : messages_) {
        if (m.info.is_tool()) last_tool_index_ = std::max(last_tool_index_, m.info.tool_index);
    }
}

} // namespace termineer
