#pragma once
#include "conversation.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace termineer {

struct ToolOutputMetadata {
    std::string tool_name;
    std::optional<size_t> input_tokens;
    bool relevant = true;
};

struct TruncationConfig {
    size_t preserve_initial_tools = 3;
    size_t preserve_recent_tools = 5;
    size_t max_preserved_chars = 200;
    std::string placeholder = "[Tool output truncated to save context space]";

    nlohmann::json to_json() const;
    static TruncationConfig from_json(const nlohmann::json& j);
};

struct TruncationResult {
    size_t truncated_messages = 0;
    size_t estimated_tokens_saved = 0;
    std::vector<size_t> truncated_indices;  // conversation positions
};

// Tracks tool outputs by conversation position and rewrites the
// middle of the tool-result history when context runs low.
class TokenManager {
public:
    static constexpr size_t WARNING_THRESHOLD = 5000;
    static constexpr size_t CRITICAL_THRESHOLD = 8000;
    static constexpr size_t LARGE_OUTPUT_CHARS = 500;
    static constexpr size_t MEDIUM_OUTPUT_CHARS = 200;

    explicit TokenManager(TruncationConfig cfg = {}) : config_(std::move(cfg)) {}

    void register_tool_output(size_t message_index, const std::string& tool_name);
    // Records input tokens only; output_tokens is accepted but not stored.
    void update_token_usage(size_t message_index, size_t input_tokens, size_t output_tokens);
    void mark_irrelevant(size_t message_index);
    bool is_irrelevant(size_t message_index) const;
    std::vector<size_t> tool_indices() const;
    std::string format_tool_details() const;
    void clear() { metadata_.clear(); }
    // Re-registers every tool result after positions shifted (sanitize, load).
    void rebuild(const Conversation& conv);

    const TruncationConfig& config() const { return config_; }
    void set_config(TruncationConfig cfg) { config_ = std::move(cfg); }

    TruncationResult truncate(Conversation& conv) const;

private:
    TruncationConfig config_;
    std::map<size_t, ToolOutputMetadata> metadata_;

    bool already_truncated(const Message& m) const;
    size_t rewrite(Message& m) const;
};

} // namespace termineer
