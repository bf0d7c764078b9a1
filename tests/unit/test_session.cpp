#include <gtest/gtest.h>
#include "session.hpp"
#include <fstream>
#include <random>

using namespace termineer;

namespace {

class TempWorkspace {
public:
    TempWorkspace() {
        std::random_device rd;
        root_ = fs::temp_directory_path() / ("termineer_session_" + std::to_string(rd()));
        fs::create_directories(root_);
    }
    ~TempWorkspace() {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }
    const fs::path& root() const { return root_; }
private:
    fs::path root_;
};

std::vector<Message> sample_conversation() {
    return {
        Message::user("list files"),
        Message::tool_call("<tool name=\"shell\">\nls\n</tool>", "shell", 1),
        Message::tool_result("<result name=\"shell\" index=\"1\">\na.txt\n</result>", "shell", 1),
        Message::assistant("There is one file."),
    };
}

TEST(SessionStoreTest, SaveThenLoadKeepsConversation) {
    TempWorkspace ws;
    SessionStore store(ws.root() / "sessions");
    auto saved = store.save("my work", "claude-3-7-sonnet", std::string("be brief"), sample_conversation());

    EXPECT_TRUE(starts_with(saved.id, "session_"));
    EXPECT_EQ(saved.name, "my work");
    EXPECT_EQ(saved.metadata.message_count, 4u);

    auto loaded = store.load(saved.id);
    EXPECT_EQ(loaded.id, saved.id);
    EXPECT_EQ(loaded.model, "claude-3-7-sonnet");
    ASSERT_TRUE(loaded.system_prompt.has_value());
    EXPECT_EQ(*loaded.system_prompt, "be brief");
    ASSERT_EQ(loaded.conversation.size(), 4u);
    EXPECT_EQ(loaded.conversation[1].info.kind, MessageKind::tool_call);
    EXPECT_EQ(loaded.conversation[2].info.tool_index, 1u);
    EXPECT_EQ(loaded.conversation[3].text(), "There is one file.");
}

TEST(SessionStoreTest, EmptyMessagesAreNotSaved) {
    TempWorkspace ws;
    SessionStore store(ws.root());
    auto conv = sample_conversation();
    conv.push_back(Message::assistant("  "));
    auto saved = store.save("", "m", std::nullopt, conv);
    EXPECT_EQ(saved.name, saved.id);
    EXPECT_EQ(store.load(saved.id).conversation.size(), 4u);
}

TEST(SessionStoreTest, IdsDoNotCollide) {
    TempWorkspace ws;
    SessionStore store(ws.root());
    auto a = store.save("a", "m", std::nullopt, sample_conversation());
    auto b = store.save("b", "m", std::nullopt, sample_conversation());
    EXPECT_NE(a.id, b.id);
    EXPECT_EQ(store.list().size(), 2u);
}

TEST(SessionStoreTest, LoadByNameIsCaseInsensitive) {
    TempWorkspace ws;
    SessionStore store(ws.root());
    auto saved = store.save("Refactor Parser", "m", std::nullopt, sample_conversation());
    EXPECT_EQ(store.load("refactor parser").id, saved.id);
}

TEST(SessionStoreTest, LastSessionFollowsSaveAndLoad) {
    TempWorkspace ws;
    SessionStore store(ws.root());
    EXPECT_FALSE(store.load_last().has_value());

    auto first = store.save("first", "m", std::nullopt, sample_conversation());
    auto second = store.save("second", "m", std::nullopt, sample_conversation());
    EXPECT_EQ(store.load_last()->id, second.id);

    store.load("first");
    EXPECT_EQ(store.load_last()->id, first.id);
}

TEST(SessionStoreTest, LoadFromExplicitPath) {
    TempWorkspace ws;
    SessionStore other(ws.root() / "other");
    auto saved = other.save("elsewhere", "m", std::nullopt, sample_conversation());

    SessionStore store(ws.root() / "main");
    auto loaded = store.load((ws.root() / "other" / (saved.id + ".json")).string());
    EXPECT_EQ(loaded.name, "elsewhere");
}

TEST(SessionStoreTest, UnknownSessionThrows) {
    TempWorkspace ws;
    SessionStore store(ws.root());
    try {
        store.load("nothing");
        FAIL() << "expected SessionError";
    } catch (const SessionError& e) {
        EXPECT_STREQ(e.what(), "No session found with ID or name 'nothing'");
    }
    EXPECT_THROW(store.remove("nothing"), SessionError);
}

TEST(SessionStoreTest, RemoveByNameClearsLast) {
    TempWorkspace ws;
    SessionStore store(ws.root());
    auto saved = store.save("scratch", "m", std::nullopt, sample_conversation());
    store.remove("scratch");
    EXPECT_TRUE(store.list().empty());
    EXPECT_FALSE(fs::exists(ws.root() / ".last"));
    EXPECT_FALSE(store.load_last().has_value());
    EXPECT_THROW(store.load(saved.id), SessionError);
}

TEST(SessionStoreTest, ListSkipsCorruptFiles) {
    TempWorkspace ws;
    SessionStore store(ws.root());
    store.save("good", "m", std::nullopt, sample_conversation());
    {
        std::ofstream bad(ws.root() / "broken.json");
        bad << "{not json";
    }
    auto sessions = store.list();
    ASSERT_EQ(sessions.size(), 1u);
    EXPECT_EQ(sessions[0].name, "good");
}

TEST(SessionTest, MetadataDefaultsFromOlderFiles) {
    auto s = Session::from_json({
        {"id", "session_1"}, {"timestamp", 1700000000}, {"model", "m"},
        {"conversation", nlohmann::json::array({{{"role", "user"}, {"content", "hi"}}})},
        {"metadata", nlohmann::json::object()}
    });
    EXPECT_EQ(s.metadata.created_at, 1700000000);
    EXPECT_EQ(s.metadata.message_count, 1u);
    EXPECT_FALSE(s.system_prompt.has_value());
    EXPECT_FALSE(s.metadata.token_count.has_value());
}

} // namespace
