#include "backend.hpp"
#include "../utils.hpp"

namespace termineer {

TokenUsage Backend::count_tokens(const std::vector<Message>& messages, const std::string& system) {
    TokenUsage usage;
    size_t chars = system.size();
    for (auto& m : messages) {
        for (auto& c : m.content) {
            chars += c.text.size() + c.data.size() + c.source.size();
            if (c.thinking) chars += c.thinking->size();
        }
    }
    usage.input_tokens = chars / 4;
    return usage;
}

} // namespace termineer
