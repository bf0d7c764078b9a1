#include "token_manager.hpp"
#include "utils.hpp"
#include <algorithm>
#include <sstream>

namespace termineer {

nlohmann::json TruncationConfig::to_json() const {
    return {
        {"preserve_initial_tools", preserve_initial_tools},
        {"preserve_recent_tools", preserve_recent_tools},
        {"max_preserved_chars", max_preserved_chars},
        {"placeholder", placeholder}
    };
}

TruncationConfig TruncationConfig::from_json(const nlohmann::json& j) {
    TruncationConfig c;
    if (!j.is_object()) return c;
    c.preserve_initial_tools = j.value("preserve_initial_tools", c.preserve_initial_tools);
    c.preserve_recent_tools = j.value("preserve_recent_tools", c.preserve_recent_tools);
    c.max_preserved_chars = j.value("max_preserved_chars", c.max_preserved_chars);
    c.placeholder = j.value("placeholder", c.placeholder);
    return c;
}

void TokenManager::register_tool_output(size_t message_index, const std::string& tool_name) {
    auto& md = metadata_[message_index];
    md.tool_name = tool_name;
    md.relevant = true;
}

void TokenManager::update_token_usage(size_t message_index, size_t input_tokens, size_t /*output_tokens*/) {
    auto it = metadata_.find(message_index);
    if (it != metadata_.end()) it->second.input_tokens = input_tokens;
}

void TokenManager::mark_irrelevant(size_t message_index) {
    auto it = metadata_.find(message_index);
    if (it != metadata_.end()) it->second.relevant = false;
}

bool TokenManager::is_irrelevant(size_t message_index) const {
    auto it = metadata_.find(message_index);
    return it != metadata_.end() && !it->second.relevant;
}

std::vector<size_t> TokenManager::tool_indices() const {
    std::vector<size_t> result;
    for (auto& [idx, _] : metadata_) result.push_back(idx);
    return result;
}

std::string TokenManager::format_tool_details() const {
    std::ostringstream ss;
    for (auto& [idx, md] : metadata_) {
        ss << "#" << idx << " " << md.tool_name;
        if (md.input_tokens) {
            ss << " tokens=" << *md.input_tokens;
            if (*md.input_tokens >= CRITICAL_THRESHOLD) ss << " (critical)";
            else if (*md.input_tokens >= WARNING_THRESHOLD) ss << " (warning)";
        }
        if (!md.relevant) ss << " [irrelevant]";
        ss << "\n";
    }
    return ss.str();
}

void TokenManager::rebuild(const Conversation& conv) {
    std::map<size_t, ToolOutputMetadata> fresh;
    auto& msgs = conv.messages();
    for (size_t i = 0; i < msgs.size(); i++) {
        if (msgs[i].info.kind == MessageKind::tool_result) {
            fresh[i].tool_name = msgs[i].info.tool_name;
        }
    }
    metadata_ = std::move(fresh);
}

bool TokenManager::already_truncated(const Message& m) const {
    for (auto& c : m.content) {
        if (c.type == ContentType::text && c.text.find(config_.placeholder) != std::string::npos) {
            return true;
        }
    }
    return false;
}

size_t TokenManager::rewrite(Message& m) const {
    std::string original = m.text();
    auto lines = split_lines(original);
    auto clip = [this](const std::string& s) {
        return s.size() > config_.max_preserved_chars ? s.substr(0, config_.max_preserved_chars) : s;
    };

    std::string replacement = clip(lines.front()) + "\n" + config_.placeholder;
    if (lines.size() > 1) replacement += "\n" + clip(lines.back());

    size_t saved = original.size() > replacement.size() ? original.size() - replacement.size() : 0;
    m.content = {Content::make_text(replacement)};
    return saved;
}

TruncationResult TokenManager::truncate(Conversation& conv) const {
    TruncationResult result;
    auto& msgs = conv.messages();

    std::vector<size_t> results;
    for (size_t i = 0; i < msgs.size(); i++) {
        auto& info = msgs[i].info;
        if (info.kind == MessageKind::tool_result && info.tool_name != "done") results.push_back(i);
    }

    size_t n1 = config_.preserve_initial_tools;
    size_t n2 = config_.preserve_recent_tools;
    if (results.size() <= n1 + n2) return result;

    std::vector<size_t> range(results.begin() + n1, results.end() - n2);
    std::vector<size_t> selected;
    auto pick = [&](auto pred) {
        for (size_t idx : range) {
            if (std::find(selected.begin(), selected.end(), idx) != selected.end()) continue;
            if (already_truncated(msgs[idx])) continue;
            if (pred(idx)) selected.push_back(idx);
        }
    };

    pick([&](size_t idx) { return is_irrelevant(idx); });
    pick([&](size_t idx) { return msgs[idx].text().size() > LARGE_OUTPUT_CHARS; });
    if (selected.size() < range.size() / 2) {
        pick([&](size_t idx) { return msgs[idx].text().size() > MEDIUM_OUTPUT_CHARS; });
    }

    std::sort(selected.begin(), selected.end());
    size_t chars_saved = 0;
    for (size_t idx : selected) {
        chars_saved += rewrite(msgs[idx]);
    }

    result.truncated_messages = selected.size();
    result.estimated_tokens_saved = chars_saved / 4;
    result.truncated_indices = std::move(selected);
    if (result.truncated_messages > 0) conv.reset_cache_points();
    return result;
}

} // namespace termineer
