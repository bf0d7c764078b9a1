#include <gtest/gtest.h>
#include "agent_manager.hpp"
#include "scripted_backend.hpp"

using namespace termineer;
using test_support::ScriptedBackend;
using test_support::text_response;
using test_support::last_user_text;

namespace {

BackendFactory echo_factory() {
    return [](const Config&) -> BackendPtr {
        auto b = std::make_shared<ScriptedBackend>();
        b->set_fallback([](const LlmRequest& req) { return text_response("echo: " + last_user_text(req)); });
        return b;
    };
}

Config quiet_config() {
    Config cfg;
    cfg.silent = true;
    cfg.workdir = fs::temp_directory_path().string();
    return cfg;
}

TEST(AgentManagerTest, IdsStartAtOneAndNamesResolve) {
    AgentManager mgr(echo_factory());
    auto a = mgr.create("alpha", quiet_config());
    auto b = mgr.create("", quiet_config());

    EXPECT_EQ(a, 1u);
    EXPECT_EQ(b, 2u);
    EXPECT_EQ(mgr.id_by_name("alpha"), std::optional<AgentId>(1));
    EXPECT_EQ(mgr.id_by_name("agent_2"), std::optional<AgentId>(2));
    EXPECT_FALSE(mgr.id_by_name("missing").has_value());

    auto infos = mgr.list();
    ASSERT_EQ(infos.size(), 2u);
    EXPECT_EQ(infos[0].name, "alpha");
    EXPECT_EQ(infos[1].name, "agent_2");
    EXPECT_EQ(infos[0].state.kind, AgentStateKind::idle);
}

TEST(AgentManagerTest, NewestAgentOwnsAName) {
    AgentManager mgr(echo_factory());
    auto first = mgr.create("dup", quiet_config());
    auto second = mgr.create("dup", quiet_config());
    EXPECT_EQ(mgr.id_by_name("dup"), std::optional<AgentId>(second));

    // Dropping the older agent keeps the name on the newer one.
    mgr.terminate(first);
    EXPECT_EQ(mgr.id_by_name("dup"), std::optional<AgentId>(second));
    mgr.terminate(second);
    EXPECT_FALSE(mgr.id_by_name("dup").has_value());
}

TEST(AgentManagerTest, InvalidKindFailsCreation) {
    AgentManager mgr(echo_factory());
    auto cfg = quiet_config();
    cfg.kind = "wizard";
    try {
        mgr.create("w", cfg);
        FAIL() << "expected AgentError";
    } catch (const AgentError& e) {
        EXPECT_EQ(e.kind(), AgentErrorKind::creation_failed);
        EXPECT_NE(std::string(e.what()).find("wizard"), std::string::npos);
    }
    EXPECT_TRUE(mgr.list().empty());
}

TEST(AgentManagerTest, BackendErrorFailsCreation) {
    AgentManager mgr([](const Config& cfg) -> BackendPtr {
        throw LlmError(LlmErrorKind::config_error, "Unknown model: " + cfg.model);
    });
    try {
        mgr.create("x", quiet_config());
        FAIL() << "expected AgentError";
    } catch (const AgentError& e) {
        EXPECT_EQ(e.kind(), AgentErrorKind::creation_failed);
        EXPECT_NE(std::string(e.what()).find("Failed to create backend"), std::string::npos);
    }
}

TEST(AgentManagerTest, UnknownIdThrowsNotFound) {
    AgentManager mgr(echo_factory());
    try {
        mgr.send_user_input(42, "hello");
        FAIL() << "expected AgentError";
    } catch (const AgentError& e) {
        EXPECT_EQ(e.kind(), AgentErrorKind::agent_not_found);
    }
    EXPECT_THROW(mgr.state(42), AgentError);
    EXPECT_THROW(mgr.terminate(42), AgentError);
    EXPECT_FALSE(mgr.exists(42));
}

TEST(AgentManagerTest, TurnsCompleteAndResponsesAreKept) {
    AgentManager mgr(echo_factory());
    auto id = mgr.create("echoer", quiet_config());

    mgr.send_user_input(id, "ping");
    ASSERT_TRUE(mgr.wait_for_turn(id, 0, std::chrono::seconds(10)));
    EXPECT_EQ(mgr.last_response(id), "echo: ping");
    EXPECT_EQ(mgr.completed_turns(id), 1u);
    EXPECT_EQ(mgr.conversation(id).size(), 2u);

    // No new input: the wait times out.
    EXPECT_FALSE(mgr.wait_for_turn(id, 1, std::chrono::milliseconds(100)));
}

TEST(AgentManagerTest, WaitHonoursCancellation) {
    AgentManager mgr(echo_factory());
    auto id = mgr.create("", quiet_config());
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(mgr.wait_for_turn(id, 0, std::chrono::seconds(10), [] { return true; }));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
}

TEST(AgentManagerTest, TerminateRemovesAgent) {
    AgentManager mgr(echo_factory());
    auto keep = mgr.create("keep", quiet_config());
    auto drop = mgr.create("drop", quiet_config());

    mgr.terminate(drop);
    EXPECT_FALSE(mgr.exists(drop));
    EXPECT_TRUE(mgr.exists(keep));
    EXPECT_THROW(mgr.send_user_input(drop, "anyone?"), AgentError);

    // Ids are never reused.
    EXPECT_EQ(mgr.create("next", quiet_config()), 3u);

    mgr.terminate_all();
    EXPECT_TRUE(mgr.list().empty());
}

TEST(AgentManagerTest, InterruptWithNothingRunningReachesAgentLoop) {
    AgentManager mgr(echo_factory());
    auto id = mgr.create("", quiet_config());
    EXPECT_FALSE(mgr.is_shell_running(id));
    EXPECT_TRUE(mgr.interrupt(id));

    // The stale interrupt does not cancel the next turn.
    mgr.send_user_input(id, "still there?");
    ASSERT_TRUE(mgr.wait_for_turn(id, 0, std::chrono::seconds(10)));
    EXPECT_EQ(mgr.last_response(id), "echo: still there?");
}

TEST(AgentStateTest, DescribesEachState) {
    EXPECT_EQ(AgentState::idle().describe(), "idle");
    EXPECT_EQ(AgentState::running_tool("shell", true).describe(), "running tool shell (interruptible)");
    EXPECT_EQ(AgentState::running_tool("read", false).describe(), "running tool read");
    EXPECT_TRUE(AgentState::done(std::string("ok")).is_terminal());
    EXPECT_TRUE(AgentState::processing().is_busy());
    EXPECT_FALSE(AgentState::terminated().is_busy());
}

} // namespace
