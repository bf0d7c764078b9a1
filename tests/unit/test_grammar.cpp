#include <gtest/gtest.h>
#include "grammar.hpp"
#include <stdexcept>

using namespace termineer;

namespace {

std::vector<Segment> calls(const std::vector<Segment>& segs) {
    std::vector<Segment> out;
    for (auto& s : segs) {
        if (s.type == SegmentType::tool_call) out.push_back(s);
    }
    return out;
}

TEST(XmlGrammarTest, ParsesCallWithArgsAndBody) {
    XmlGrammar g;
    auto segs = g.parse("Let me look.\n<tool name=\"shell\">\nls -la\n</tool>");
    ASSERT_EQ(segs.size(), 2u);
    EXPECT_EQ(segs[0].type, SegmentType::text);
    EXPECT_EQ(segs[0].text, "Let me look.\n");
    EXPECT_EQ(segs[1].type, SegmentType::tool_call);
    EXPECT_EQ(segs[1].name, "shell");
    EXPECT_EQ(segs[1].args, "");
    EXPECT_EQ(segs[1].body, "ls -la");
}

TEST(XmlGrammarTest, FormattedCallParsesBack) {
    XmlGrammar g;
    std::string text = g.format_tool_call("read", "src/main.cpp lines=1-40", "");
    EXPECT_EQ(text, "<tool name=\"read\" src/main.cpp lines=1-40>\n\n</tool>");
    auto c = calls(g.parse(text));
    ASSERT_EQ(c.size(), 1u);
    EXPECT_EQ(c[0].name, "read");
    EXPECT_EQ(c[0].args, "src/main.cpp lines=1-40");
    EXPECT_EQ(c[0].body, "");
}

TEST(XmlGrammarTest, ResultAndErrorCarryIndex) {
    XmlGrammar g;
    EXPECT_EQ(g.format_tool_result("shell", 3, "ok"), "<result name=\"shell\" index=\"3\">\nok\n</result>");
    auto segs = g.parse(g.format_tool_result("shell", 3, "ok") + g.format_tool_error("read", 4, "missing"));
    ASSERT_EQ(segs.size(), 2u);
    EXPECT_EQ(segs[0].type, SegmentType::tool_result);
    EXPECT_EQ(segs[0].index, 3u);
    EXPECT_EQ(segs[0].body, "ok");
    EXPECT_EQ(segs[1].type, SegmentType::tool_error);
    EXPECT_EQ(segs[1].name, "read");
    EXPECT_EQ(segs[1].index, 4u);
}

TEST(XmlGrammarTest, UnterminatedCallStaysText) {
    XmlGrammar g;
    auto segs = g.parse("before <tool name=\"shell\">\nls");
    ASSERT_EQ(segs.size(), 1u);
    EXPECT_EQ(segs[0].type, SegmentType::text);
    EXPECT_TRUE(calls(segs).empty());
}

TEST(XmlGrammarTest, LegacyNameOnFirstLine) {
    XmlGrammar g;
    auto c = calls(g.parse("<tool>write notes.txt\nhello\n</tool>"));
    ASSERT_EQ(c.size(), 1u);
    EXPECT_EQ(c[0].name, "write");
    EXPECT_EQ(c[0].args, "notes.txt");
    EXPECT_EQ(c[0].body, "hello");
}

TEST(XmlGrammarTest, MultipleCallsInOrder) {
    XmlGrammar g;
    std::string text = g.format_tool_call("shell", "echo a") + "\nthen\n" + g.format_tool_call("shell", "echo b");
    auto c = calls(g.parse(text));
    ASSERT_EQ(c.size(), 2u);
    EXPECT_EQ(c[0].body, "echo a");
    EXPECT_EQ(c[1].body, "echo b");
}

TEST(XmlGrammarTest, ToolWordInsideTextIsNotATag) {
    XmlGrammar g;
    auto segs = g.parse("use <toolbox> carefully");
    ASSERT_EQ(segs.size(), 1u);
    EXPECT_EQ(segs[0].type, SegmentType::text);
}

TEST(MarkdownGrammarTest, ParsesFencedCall) {
    MarkdownGrammar g;
    auto segs = g.parse("Checking.\n```tool name=shell\nls -la\n```\n");
    auto c = calls(segs);
    ASSERT_EQ(c.size(), 1u);
    EXPECT_EQ(c[0].name, "shell");
    EXPECT_EQ(c[0].body, "ls -la");
    EXPECT_EQ(segs.front().type, SegmentType::text);
}

TEST(MarkdownGrammarTest, FormattedResultParsesBack) {
    MarkdownGrammar g;
    std::string text = g.format_tool_result("read", 7, "line one\nline two");
    EXPECT_EQ(text, "```result name=read index=7\nline one\nline two\n```");
    auto segs = g.parse(text);
    ASSERT_EQ(segs.size(), 1u);
    EXPECT_EQ(segs[0].type, SegmentType::tool_result);
    EXPECT_EQ(segs[0].name, "read");
    EXPECT_EQ(segs[0].index, 7u);
    EXPECT_EQ(segs[0].body, "line one\nline two");
}

TEST(MarkdownGrammarTest, OrdinaryCodeBlockIsText) {
    MarkdownGrammar g;
    auto segs = g.parse("Example:\n```cpp\nint main() {}\n```\n");
    EXPECT_TRUE(calls(segs).empty());
    ASSERT_EQ(segs.size(), 1u);
    EXPECT_EQ(segs[0].type, SegmentType::text);
}

TEST(MarkdownGrammarTest, LegacyToolUseFence) {
    MarkdownGrammar g;
    auto c = calls(g.parse("```tool_use\nshell\npwd\n```"));
    ASSERT_EQ(c.size(), 1u);
    EXPECT_EQ(c[0].name, "shell");
    EXPECT_EQ(c[0].body, "pwd");
}

TEST(MarkdownGrammarTest, UnterminatedFenceStaysText) {
    MarkdownGrammar g;
    auto segs = g.parse("```tool name=shell\nls");
    EXPECT_TRUE(calls(segs).empty());
}

TEST(MarkdownGrammarTest, StopSequencesMatchResultFences) {
    MarkdownGrammar g;
    auto stops = g.stop_sequences();
    ASSERT_EQ(stops.size(), 2u);
    EXPECT_EQ(stops[0], "```result");
    EXPECT_EQ(stops[1], "```error");
    EXPECT_EQ(g.tool_close_sequence(), "");
}

TEST(GrammarSelectionTest, DefaultsByBackend) {
    EXPECT_EQ(default_grammar_for("anthropic", "claude-3-5-sonnet"), GrammarType::xml);
    EXPECT_EQ(default_grammar_for("google", "gemini-1.5-pro"), GrammarType::markdown);
    EXPECT_EQ(default_grammar_for("cohere", "command-r"), GrammarType::markdown);
    EXPECT_EQ(default_grammar_for("openai", "o1-mini"), GrammarType::markdown);
    EXPECT_EQ(default_grammar_for("openai", "gpt-4o"), GrammarType::xml);
}

TEST(GrammarSelectionTest, ParseGrammarType) {
    EXPECT_EQ(parse_grammar_type("XML"), GrammarType::xml);
    EXPECT_EQ(parse_grammar_type("markdown"), GrammarType::markdown);
    EXPECT_THROW(parse_grammar_type("json"), std::invalid_argument);
    EXPECT_EQ(make_grammar(GrammarType::markdown)->name(), "markdown");
}

TEST(GrammarTest, PatchBodyLayout) {
    XmlGrammar g;
    EXPECT_EQ(g.format_patch("old", "new"), "<<<<BEFORE\nold\n<<<<AFTER\nnew\n<<<<END");
}

} // namespace
