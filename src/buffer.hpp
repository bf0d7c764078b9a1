#pragma once
#include <string>
#include <deque>
#include <vector>
#include <mutex>
#include <memory>
#include <cstdint>

namespace termineer {

enum class OutputType {
    standard,
    error,
    tool,
    system,
    debug
};

struct OutputLine {
    OutputType type = OutputType::standard;
    std::string tool_name;  // set when type == tool
    std::string content;
    int64_t timestamp = 0;  // epoch ms
    uint64_t seq = 0;       // per-buffer sequence number, starts at 1
};

// Bounded per-agent line log. Oldest lines are dropped past capacity.
class Buffer {
public:
    static constexpr size_t DEFAULT_CAPACITY = 100;

    explicit Buffer(size_t capacity = DEFAULT_CAPACITY) : capacity_(capacity) {}

    // Splits on '\n'; a trailing empty line is not stored.
    void write(OutputType type, const std::string& text, const std::string& tool_name = "");

    void stdout_line(const std::string& text) { write(OutputType::standard, text); }
    void error(const std::string& text) { write(OutputType::error, text); }
    void tool(const std::string& name, const std::string& text) { write(OutputType::tool, text, name); }
    void system(const std::string& text) { write(OutputType::system, text); }
    void debug(const std::string& text) { write(OutputType::debug, text); }

    std::vector<OutputLine> lines() const;
    // Lines with seq > since, oldest first.
    std::vector<OutputLine> take_new(uint64_t since) const;
    uint64_t last_seq() const;
    size_t size() const;
    size_t capacity() const { return capacity_; }
    void clear();

    // Joins all content lines with '\n'.
    std::string text() const;

private:
    size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<OutputLine> lines_;
    uint64_t next_seq_ = 1;
};

using BufferPtr = std::shared_ptr<Buffer>;

// Thread-local "current buffer" so helpers reach the right agent's stream.
void set_current_buffer(BufferPtr buf);
BufferPtr current_buffer();

// Installs a buffer for the lifetime of the guard, restoring the previous one.
class ScopedBuffer {
public:
    explicit ScopedBuffer(BufferPtr buf) : prev_(current_buffer()) { set_current_buffer(std::move(buf)); }
    ~ScopedBuffer() { set_current_buffer(prev_); }
    ScopedBuffer(const ScopedBuffer&) = delete;
    ScopedBuffer& operator=(const ScopedBuffer&) = delete;
private:
    BufferPtr prev_;
};

// Output helpers. Fall back to tagged std::cerr when no buffer is installed.
namespace out {
void info(const std::string& text);
void error(const std::string& text);
void tool(const std::string& name, const std::string& text);
void system(const std::string& text);
void debug(const std::string& text);
} // namespace out

std::string output_type_name(const OutputLine& line);

} // namespace termineer
