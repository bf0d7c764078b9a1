#pragma once
#include <string>
#include <vector>
#include <memory>
#include <cstdint>

namespace termineer {

enum class SegmentType {
    text,
    tool_call,
    tool_result,
    tool_error
};

struct Segment {
    SegmentType type = SegmentType::text;
    std::string text;      // text segments
    std::string name;      // tool name
    std::string args;      // tool_call: rest of the first line
    std::string body;      // tool_call body, or result/error payload
    uint64_t index = 0;    // result/error
};

enum class GrammarType {
    xml,
    markdown
};

// Encodes tool traffic in model text and parses it back.
class Grammar {
public:
    virtual ~Grammar() = default;

    virtual std::vector<Segment> parse(const std::string& text) const = 0;
    virtual std::string format_tool_call(const std::string& name, const std::string& args,
                                         const std::string& body) const = 0;
    virtual std::string format_tool_result(const std::string& name, uint64_t index,
                                           const std::string& payload) const = 0;
    virtual std::string format_tool_error(const std::string& name, uint64_t index,
                                          const std::string& payload) const = 0;
    virtual std::vector<std::string> stop_sequences() const = 0;
    virtual std::string name() const = 0;
    // Prompt fragment teaching the model this syntax.
    virtual std::string describe() const = 0;

    // Appended to a response that halted on it, so the call parses.
    virtual std::string tool_close_sequence() const { return ""; }

    std::string format_tool_call(const std::string& name, const std::string& body) const {
        return format_tool_call(name, "", body);
    }

    std::string format_patch(const std::string& before, const std::string& after) const;
};

class XmlGrammar : public Grammar {
public:
    std::vector<Segment> parse(const std::string& text) const override;
    using Grammar::format_tool_call;
    std::string format_tool_call(const std::string& name, const std::string& args,
                                 const std::string& body) const override;
    std::string format_tool_result(const std::string& name, uint64_t index,
                                   const std::string& payload) const override;
    std::string format_tool_error(const std::string& name, uint64_t index,
                                  const std::string& payload) const override;
    std::vector<std::string> stop_sequences() const override { return {"</tool>"}; }
    std::string name() const override { return "xml"; }
    std::string describe() const override;
    std::string tool_close_sequence() const override { return "</tool>"; }
};

class MarkdownGrammar : public Grammar {
public:
    std::vector<Segment> parse(const std::string& text) const override;
    using Grammar::format_tool_call;
    std::string format_tool_call(const std::string& name, const std::string& args,
                                 const std::string& body) const override;
    std::string format_tool_result(const std::string& name, uint64_t index,
                                   const std::string& payload) const override;
    std::string format_tool_error(const std::string& name, uint64_t index,
                                  const std::string& payload) const override;
    std::vector<std::string> stop_sequences() const override { return {"```result", "```error"}; }
    std::string name() const override { return "markdown"; }
    std::string describe() const override;
};

std::shared_ptr<Grammar> make_grammar(GrammarType type);

// "xml" / "markdown"; anything else throws std::invalid_argument.
GrammarType parse_grammar_type(const std::string& s);

// Markdown for Gemini, Cohere and OpenAI o1 models, XML otherwise.
GrammarType default_grammar_for(const std::string& backend_name, const std::string& model);

// Patch body delimiters.
constexpr const char* PATCH_BEFORE = "<<<<BEFORE";
constexpr const char* PATCH_AFTER = "<<<<AFTER";
constexpr const char* PATCH_END = "<<<<END";

} // namespace termineer
