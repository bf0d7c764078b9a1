#pragma once
#include "message.hpp"
#include <set>
#include <vector>

namespace termineer {

// Ordered message list plus the cache-point set handed to backends.
class Conversation {
public:
    static constexpr size_t MAX_CACHE_POINTS = 3;

    void push(Message msg) { messages_.push_back(std::move(msg)); }

    // Replaces all messages; cache points are reset.
    void replace(std::vector<Message> messages);
    void clear();

    const std::vector<Message>& messages() const { return messages_; }
    std::vector<Message>& messages() { return messages_; }
    size_t size() const { return messages_.size(); }
    bool empty() const { return messages_.empty(); }

    // Adds the last index; keeps at most MAX_CACHE_POINTS, dropping the smallest.
    void cache_here();
    // Clears the set and marks the last index.
    void reset_cache_points();
    const std::set<size_t>& cache_points() const { return cache_points_; }

    // Removes messages with empty content. Returns how many were removed.
    size_t sanitize();

    // Next tool index, starting at 1.
    uint64_t next_tool_index() { return ++last_tool_index_; }
    uint64_t last_tool_index() const { return last_tool_index_; }

    // Last assistant-authored text, or empty.
    std::string last_assistant_text() const;

    size_t estimate_tokens() const;

    nlohmann::json to_json() const;
    static std::vector<Message> messages_from_json(const nlohmann::json& arr);

private:
    std::vector<Message> messages_;
    std::set<size_t> cache_points_;
    uint64_t last_tool_index_ = 0;

    void recompute_tool_index();
};

} // namespace termineer
