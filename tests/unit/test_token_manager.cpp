#include <gtest/gtest.h>
#include "token_manager.hpp"

using namespace termineer;

namespace {

const std::string PLACEHOLDER = "[Tool output truncated to save context space]";

std::string big_output(size_t chars, char fill = 'x') {
    std::string head = "first line\n";
    std::string tail = "\nlast line";
    return head + std::string(chars - head.size() - tail.size(), fill) + tail;
}

// user prompt, then `count` call/result pairs; results land at 2, 4, 6, ...
Conversation make_history(TokenManager& tm, size_t count, size_t output_chars) {
    Conversation conv;
    conv.push(Message::user("start"));
    for (size_t i = 0; i < count; i++) {
        uint64_t idx = conv.next_tool_index();
        conv.push(Message::tool_call("<tool name=\"shell\">\nrun\n</tool>", "shell", idx));
        conv.push(Message::tool_result(big_output(output_chars), "shell", idx));
        tm.register_tool_output(conv.size() - 1, "shell");
    }
    return conv;
}

TEST(TokenManagerTest, TruncatesOnlyTheMiddleRange) {
    TokenManager tm(TruncationConfig{3, 5, 200, PLACEHOLDER});
    auto conv = make_history(tm, 10, 2000);

    auto result = tm.truncate(conv);
    EXPECT_EQ(result.truncated_messages, 2u);
    std::vector<size_t> expected{8, 10};
    EXPECT_EQ(result.truncated_indices, expected);
    EXPECT_GT(result.estimated_tokens_saved, 0u);

    auto& msgs = conv.messages();
    EXPECT_EQ(msgs[8].text(), "first line\n" + PLACEHOLDER + "\nlast line");
    EXPECT_EQ(msgs[10].info.kind, MessageKind::tool_result);
    EXPECT_EQ(msgs[6].text().size(), 2000u);
    EXPECT_EQ(msgs[12].text().size(), 2000u);
}

TEST(TokenManagerTest, SecondPassIsIdempotent) {
    TokenManager tm(TruncationConfig{3, 5, 200, PLACEHOLDER});
    auto conv = make_history(tm, 10, 2000);
    tm.truncate(conv);
    auto snapshot = conv.to_json();

    auto again = tm.truncate(conv);
    EXPECT_EQ(again.truncated_messages, 0u);
    EXPECT_EQ(conv.to_json(), snapshot);
}

TEST(TokenManagerTest, NothingToDoWithFewResults) {
    TokenManager tm(TruncationConfig{3, 5, 200, PLACEHOLDER});
    auto conv = make_history(tm, 8, 2000);
    EXPECT_EQ(tm.truncate(conv).truncated_messages, 0u);
}

TEST(TokenManagerTest, IrrelevantOutputsGoFirstEvenWhenSmall) {
    TokenManager tm(TruncationConfig{1, 1, 200, PLACEHOLDER});
    auto conv = make_history(tm, 4, 100);
    tm.mark_irrelevant(4);
    EXPECT_TRUE(tm.is_irrelevant(4));
    EXPECT_FALSE(tm.is_irrelevant(6));

    auto result = tm.truncate(conv);
    std::vector<size_t> expected{4};
    EXPECT_EQ(result.truncated_indices, expected);
    EXPECT_NE(conv.messages()[4].text().find(PLACEHOLDER), std::string::npos);
}

TEST(TokenManagerTest, MediumOutputsOnlyWhenFewSelected) {
    TokenManager tm(TruncationConfig{1, 1, 200, PLACEHOLDER});
    auto conv = make_history(tm, 6, 300);  // middle range: 4 medium outputs
    auto result = tm.truncate(conv);
    EXPECT_EQ(result.truncated_messages, 4u);
}

TEST(TokenManagerTest, MediumPassNeedsFewerThanHalfSelected) {
    TokenManager tm(TruncationConfig{0, 0, 200, PLACEHOLDER});
    Conversation conv;
    conv.push(Message::user("go"));
    const size_t sizes[] = {2000, 300, 300};
    for (size_t i = 0; i < 3; i++) {
        conv.push(Message::tool_call("call", "shell", i + 1));
        conv.push(Message::tool_result(big_output(sizes[i]), "shell", i + 1));
        tm.register_tool_output(conv.size() - 1, "shell");
    }

    // One large output out of three is already half when rounding down.
    auto result = tm.truncate(conv);
    std::vector<size_t> expected{2};
    EXPECT_EQ(result.truncated_indices, expected);
    EXPECT_EQ(conv.messages()[4].text().size(), 300u);
}

TEST(TokenManagerTest, DoneResultsAreNeverCounted) {
    TokenManager tm(TruncationConfig{0, 0, 200, PLACEHOLDER});
    Conversation conv;
    conv.push(Message::user("go"));
    conv.push(Message::tool_call("call", "done", 1));
    conv.push(Message::tool_result(big_output(1000), "done", 1));
    EXPECT_EQ(tm.truncate(conv).truncated_messages, 0u);
}

TEST(TokenManagerTest, LongEdgeLinesAreClipped) {
    TokenManager tm(TruncationConfig{0, 0, 10, PLACEHOLDER});
    Conversation conv;
    conv.push(Message::user("go"));
    conv.push(Message::tool_call("call", "read", 1));
    conv.push(Message::tool_result(std::string(600, 'a') + "\n" + std::string(600, 'b'), "read", 1));
    tm.register_tool_output(2, "read");

    tm.truncate(conv);
    EXPECT_EQ(conv.messages()[2].text(), std::string(10, 'a') + "\n" + PLACEHOLDER + "\n" + std::string(10, 'b'));
}

TEST(TokenManagerTest, TruncationResetsCachePoints) {
    TokenManager tm(TruncationConfig{3, 5, 200, PLACEHOLDER});
    auto conv = make_history(tm, 10, 2000);
    conv.cache_here();
    auto last = conv.size() - 1;
    tm.truncate(conv);
    std::set<size_t> expected{last};
    EXPECT_EQ(conv.cache_points(), expected);
}

TEST(TokenManagerTest, RebuildFollowsConversationPositions) {
    TokenManager tm;
    Conversation conv;
    conv.push(Message::user("go"));
    conv.push(Message::tool_call("call", "read", 1));
    conv.push(Message::tool_result("data", "read", 1));
    conv.push(Message::tool_error("bad", "read", 2));
    tm.rebuild(conv);
    std::vector<size_t> expected{2};
    EXPECT_EQ(tm.tool_indices(), expected);
}

TEST(TokenManagerTest, UsageIsReportedInDetails) {
    TokenManager tm;
    tm.register_tool_output(3, "shell");
    tm.update_token_usage(3, 9000, 50);
    tm.update_token_usage(99, 1, 1);
    EXPECT_EQ(tm.format_tool_details(), "#3 shell tokens=9000 (critical)\n");
}

TEST(TruncationConfigTest, JsonFillsDefaults) {
    auto cfg = TruncationConfig::from_json({{"preserve_recent_tools", 2}});
    EXPECT_EQ(cfg.preserve_initial_tools, 3u);
    EXPECT_EQ(cfg.preserve_recent_tools, 2u);
    EXPECT_EQ(cfg.placeholder, PLACEHOLDER);
}

} // namespace
