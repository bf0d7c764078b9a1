#include "buffer.hpp"
#include "utils.hpp"
#include <iostream>

namespace termineer {

namespace {
thread_local BufferPtr tl_buffer;
}

void Buffer::write(OutputType type, const std::string& text, const std::string& tool_name) {
    auto parts = split_lines(text);
    if (parts.size() > 1 && parts.back().empty()) parts.pop_back();

    int64_t now = epoch_now_ms();
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& p : parts) {
        OutputLine line;
        line.type = type;
        line.tool_name = tool_name;
        line.content = std::move(p);
        line.timestamp = now;
        line.seq = next_seq_++;
        lines_.push_back(std::move(line));
        while (lines_.size() > capacity_) lines_.pop_front();
    }
}

std::vector<OutputLine> Buffer::lines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<OutputLine>(lines_.begin(), lines_.end());
}

std::vector<OutputLine> Buffer::take_new(uint64_t since) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<OutputLine> result;
    for (auto& l : lines_) {
        if (l.seq > since) result.push_back(l);
    }
    return result;
}

uint64_t Buffer::last_seq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_seq_ - 1;
}

size_t Buffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_.size();
}

void Buffer::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
}

std::string Buffer::text() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string result;
    for (auto& l : lines_) {
        if (!result.empty()) result += "\n";
        result += l.content;
    }
    return result;
}

void set_current_buffer(BufferPtr buf) {
    tl_buffer = std::move(buf);
}

BufferPtr current_buffer() {
    return tl_buffer;
}

std::string output_type_name(const OutputLine& line) {
    switch (line.type) {
        case OutputType::standard: return "stdout";
        case OutputType::error: return "error";
        case OutputType::tool: return "tool:" + line.tool_name;
        case OutputType::system: return "system";
        case OutputType::debug: return "debug";
    }
    return "stdout";
}

namespace out {

void info(const std::string& text) {
    if (auto b = current_buffer()) b->stdout_line(text);
    else std::cerr << text << "\n";
}

void error(const std::string& text) {
    std::string line = starts_with(text, "error:") ? text : "error: " + text;
    if (auto b = current_buffer()) b->error(line);
    else std::cerr << line << "\n";
}

void tool(const std::string& name, const std::string& text) {
    if (auto b = current_buffer()) b->tool(name, text);
    else std::cerr << "[" << name << "] " << text << "\n";
}

void system(const std::string& text) {
    if (auto b = current_buffer()) b->system(text);
    else std::cerr << "[system] " << text << "\n";
}

void debug(const std::string& text) {
    if (auto b = current_buffer()) b->debug(text);
}

} // namespace out

} // namespace termineer
