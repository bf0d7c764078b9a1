#include <gtest/gtest.h>
#include "tool_executor.hpp"
#include "tools/builtin_tools.hpp"
#include "interrupt_coordinator.hpp"
#include "mcp/registry.hpp"
#include <fstream>
#include <random>
#include <thread>

using namespace termineer;

namespace {

class TempWorkspace {
public:
    TempWorkspace() {
        std::random_device rd;
        root_ = fs::temp_directory_path() / ("termineer_tools_" + std::to_string(rd()));
        fs::create_directories(root_);
        root_ = fs::canonical(root_);
    }
    ~TempWorkspace() {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }
    const fs::path& path() const { return root_; }
    void write(const std::string& rel, const std::string& text) {
        std::ofstream f(root_ / rel);
        f << text;
    }
    std::string read(const std::string& rel) const { return read_file((root_ / rel).string()); }
private:
    fs::path root_;
};

ToolContext quiet_context(const fs::path& workdir, bool readonly = false) {
    ToolContext ctx;
    ctx.workdir = workdir;
    ctx.silent = true;
    ctx.readonly = readonly;
    return ctx;
}

TEST(ToolInvocationTest, SplitsNameArgsAndBody) {
    auto inv = split_invocation("  Write src/a.txt\nline one\nline two");
    EXPECT_EQ(inv.name, "write");
    EXPECT_EQ(inv.args, "src/a.txt");
    EXPECT_EQ(inv.body, "line one\nline two");

    auto bare = split_invocation("done");
    EXPECT_EQ(bare.name, "done");
    EXPECT_TRUE(bare.args.empty());
    EXPECT_TRUE(bare.body.empty());
}

TEST(ToolInvocationTest, McpArgumentsPreferJsonBody) {
    auto from_body = mcp_arguments("ignored", R"({"msg": "hi"})");
    EXPECT_EQ(from_body["msg"], "hi");

    auto from_args = mcp_arguments(R"({"n": 2})", "");
    EXPECT_EQ(from_args["n"], 2);

    auto fallback = mcp_arguments("plain words", "not json");
    EXPECT_EQ(fallback["args"], "plain words");
    EXPECT_EQ(fallback["body"], "not json");

    EXPECT_TRUE(mcp_arguments("", "").empty());
}

TEST(ReadArgsTest, ParsesOffsetLimitAndLineRanges) {
    auto ra = parse_read_args("a.txt b.txt offset=5 limit=10");
    ASSERT_EQ(ra.paths.size(), 2u);
    EXPECT_EQ(ra.offset, 5);
    ASSERT_TRUE(ra.limit.has_value());
    EXPECT_EQ(*ra.limit, 10);

    auto lines = parse_read_args("a.txt lines=3-7");
    EXPECT_EQ(lines.offset, 2);
    EXPECT_EQ(*lines.limit, 5);

    auto bad = parse_read_args("lines=9-2");
    ASSERT_EQ(bad.paths.size(), 1u);
    EXPECT_EQ(bad.paths[0], "lines=9-2");
}

TEST(PatchBodyTest, ExtractsBeforeAndAfter) {
    auto p = parse_patch_body("<<<<BEFORE\nold line\n<<<<AFTER\nnew line\nsecond\n<<<<END\n");
    EXPECT_EQ(p.before, "old line");
    EXPECT_EQ(p.after, "new line\nsecond");

    auto removal = parse_patch_body("<<<<BEFORE\ngone\n<<<<AFTER\n<<<<END");
    EXPECT_EQ(removal.before, "gone");
    EXPECT_TRUE(removal.after.empty());
}

TEST(PatchBodyTest, MissingMarkersThrow) {
    EXPECT_THROW(parse_patch_body("no markers here"), std::invalid_argument);
    EXPECT_THROW(parse_patch_body("<<<<BEFORE\nx\n<<<<END"), std::invalid_argument);
    EXPECT_THROW(parse_patch_body("<<<<BEFORE\n<<<<AFTER\ny\n<<<<END"), std::invalid_argument);
}

TEST(ToolExecutorTest, WriteThenReadRange) {
    TempWorkspace ws;
    ToolExecutor exec(quiet_context(ws.path()));

    auto w = exec.execute("write notes.txt\nalpha\nbeta\ngamma\n");
    ASSERT_TRUE(w.success) << w.agent_output;
    EXPECT_EQ(w.agent_output, "Successfully wrote to file 'notes.txt' (3 lines, line range: 1-3)");
    EXPECT_EQ(ws.read("notes.txt"), "alpha\nbeta\ngamma\n");

    auto r = exec.execute("read", "notes.txt lines=2-3", "");
    ASSERT_TRUE(r.success) << r.agent_output;
    EXPECT_NE(r.agent_output.find("(lines 2-3 of 3)"), std::string::npos);
    EXPECT_NE(r.agent_output.find("beta\ngamma\n"), std::string::npos);
    EXPECT_EQ(r.agent_output.find("alpha"), std::string::npos);
}

TEST(ToolExecutorTest, ReadListsDirectoriesAndReportsMissingFiles) {
    TempWorkspace ws;
    fs::create_directories(ws.path() / "sub");
    ws.write("a.txt", "x\n");
    ToolExecutor exec(quiet_context(ws.path()));

    auto dir = exec.execute("read", ".", "");
    ASSERT_TRUE(dir.success);
    EXPECT_NE(dir.agent_output.find("(2 entries)"), std::string::npos);
    EXPECT_NE(dir.agent_output.find("sub/"), std::string::npos);

    auto missing = exec.execute("read", "nope.txt", "");
    EXPECT_FALSE(missing.success);
    EXPECT_NE(missing.agent_output.find("Error: file not found"), std::string::npos);

    auto mixed = exec.execute("read", "nope.txt a.txt", "");
    EXPECT_TRUE(mixed.success);
}

TEST(ToolExecutorTest, PatchReplacesFirstOccurrence) {
    TempWorkspace ws;
    ws.write("main.cpp", "int a = 1;\nint b = 2;\nint c = 3;\n");
    ToolExecutor exec(quiet_context(ws.path()));

    auto r = exec.execute("patch", "main.cpp",
                          "<<<<BEFORE\nint b = 2;\n<<<<AFTER\nint b = 20;\nint bb = 21;\n<<<<END");
    ASSERT_TRUE(r.success) << r.agent_output;
    EXPECT_EQ(r.agent_output,
              "Successfully patched file 'main.cpp' at lines 2-3 (replaced 1 lines with 2 lines)");
    EXPECT_EQ(ws.read("main.cpp"), "int a = 1;\nint b = 20;\nint bb = 21;\nint c = 3;\n");
}

TEST(ToolExecutorTest, PatchWithUnknownTextLeavesFileAlone) {
    TempWorkspace ws;
    ws.write("main.cpp", "int a = 1;\n");
    ToolExecutor exec(quiet_context(ws.path()));

    auto r = exec.execute("patch", "main.cpp", "<<<<BEFORE\nint z;\n<<<<AFTER\nint y;\n<<<<END");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error_kind, ToolErrorKind::failed);
    EXPECT_EQ(r.agent_output, "Text to replace not found in the file");
    EXPECT_EQ(ws.read("main.cpp"), "int a = 1;\n");

    auto bad = exec.execute("patch", "main.cpp", "just text");
    EXPECT_EQ(bad.error_kind, ToolErrorKind::bad_invocation);
}

TEST(ToolExecutorTest, WriteOutsideWorkdirIsDenied) {
    TempWorkspace ws;
    fs::create_directories(ws.path() / "inner");
    ToolExecutor exec(quiet_context(ws.path() / "inner"));

    auto r = exec.execute("write", "../escape.txt", "data");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error_kind, ToolErrorKind::permission_denied);
    EXPECT_FALSE(fs::exists(ws.path() / "escape.txt"));
}

TEST(ToolExecutorTest, WriteThroughDanglingLinkIsDenied) {
    TempWorkspace ws;
    fs::create_directories(ws.path() / "inner");
    fs::create_symlink(ws.path() / "pwned.txt", ws.path() / "inner" / "link");
    ToolExecutor exec(quiet_context(ws.path() / "inner"));

    auto r = exec.execute("write", "link", "data");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error_kind, ToolErrorKind::permission_denied);
    EXPECT_FALSE(fs::exists(ws.path() / "pwned.txt"));
}

TEST(ToolExecutorTest, ReadonlyModeRejectsMutatingTools) {
    TempWorkspace ws;
    ws.write("a.txt", "keep\n");
    ToolExecutor exec(quiet_context(ws.path(), true));

    auto w = exec.execute("WRITE", "a.txt", "overwritten");
    EXPECT_FALSE(w.success);
    EXPECT_EQ(w.error_kind, ToolErrorKind::permission_denied);
    EXPECT_EQ(w.agent_output, "Permission denied: tool 'write' is not available in read-only mode");
    EXPECT_EQ(ws.read("a.txt"), "keep\n");

    EXPECT_EQ(exec.execute("wait", "", "").error_kind, ToolErrorKind::permission_denied);
    EXPECT_TRUE(exec.execute("read", "a.txt", "").success);

    std::string described = exec.describe();
    EXPECT_NE(described.find("- read:"), std::string::npos);
    EXPECT_EQ(described.find("- write:"), std::string::npos);
}

TEST(ToolExecutorTest, UnknownAndEmptyNames) {
    TempWorkspace ws;
    ToolExecutor exec(quiet_context(ws.path()));

    auto unknown = exec.execute("frobnicate", "", "");
    EXPECT_EQ(unknown.error_kind, ToolErrorKind::bad_invocation);
    EXPECT_EQ(unknown.agent_output, "Unknown tool: frobnicate");

    auto empty = exec.execute("  ", "", "");
    EXPECT_EQ(empty.error_kind, ToolErrorKind::bad_invocation);
    EXPECT_EQ(empty.agent_output, "No tool name specified");
}

TEST(ToolExecutorTest, ControlToolsChangeState) {
    TempWorkspace ws;
    ToolExecutor exec(quiet_context(ws.path()));

    auto done = exec.execute("done", "", "All tests pass.");
    EXPECT_TRUE(done.success);
    EXPECT_EQ(done.state_change, StateChange::done);
    EXPECT_EQ(done.agent_output, "All tests pass.");

    EXPECT_EQ(exec.execute("done", "", "").agent_output, "Task completed successfully.");
    EXPECT_EQ(exec.execute("wait", "", "").state_change, StateChange::wait);
}

TEST(ShellToolTest, ReportsOutputAndExitCode) {
    TempWorkspace ws;
    ws.write("marker.txt", "here\n");
    ToolExecutor exec(quiet_context(ws.path()));

    auto ok = exec.execute("shell", "", "cat marker.txt && echo second");
    ASSERT_TRUE(ok.success) << ok.agent_output;
    EXPECT_EQ(ok.agent_output, "here\nsecond\n[COMMAND COMPLETED SUCCESSFULLY]");
    EXPECT_EQ(ok.exit_code.value_or(-1), 0);

    auto failed = exec.execute("shell", "echo oops; exit 3", "");
    EXPECT_FALSE(failed.success);
    EXPECT_EQ(failed.exit_code.value_or(-1), 3);
    EXPECT_NE(failed.agent_output.find("oops\n[COMMAND FAILED WITH EXIT CODE 3]"), std::string::npos);

    EXPECT_EQ(exec.execute("shell", "", "").error_kind, ToolErrorKind::bad_invocation);
}

TEST(ShellToolTest, InterruptStopsLongCommand) {
    TempWorkspace ws;
    InterruptCoordinator coord(make_interrupt_channel());
    auto ctx = quiet_context(ws.path());
    ctx.interrupts = &coord;
    ToolExecutor exec(ctx);
    EXPECT_TRUE(exec.is_interruptible("shell"));

    ToolResult result;
    std::thread worker([&] { result = exec.execute("shell", "", "echo started; sleep 30"); });

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!coord.is_shell_running() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_TRUE(coord.is_shell_running());
    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(coord.handle_interrupt(std::string("stop now")));
    worker.join();

    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
    EXPECT_TRUE(result.interrupted);
    EXPECT_NE(result.agent_output.find("[COMMAND INTERRUPTED: stop now]"), std::string::npos);
    EXPECT_FALSE(coord.is_shell_running());
}

TEST(ShellToolTest, ClipMiddleKeepsHeadAndTail) {
    std::string text(100, 'a');
    text += std::string(100, 'b');
    auto clipped = clip_middle(text, 20);
    EXPECT_EQ(clipped.substr(0, 10), std::string(10, 'a'));
    EXPECT_EQ(clipped.substr(clipped.size() - 10), std::string(10, 'b'));
    EXPECT_NE(clipped.find("[180 characters truncated]"), std::string::npos);
    EXPECT_EQ(clip_middle("short", 20), "short");
}

TEST(FetchToolTest, HtmlToTextDropsScriptsAndKeepsLinks) {
    std::string html =
        "<html><head><style>body{}</style></head><body>"
        "<h1>Title</h1><p>See <a href=\"https://example.org/doc\">the docs</a></p>"
        "<script>alert('x')</script><!-- hidden --></body></html>";
    auto text = html_to_text(html);
    EXPECT_NE(text.find("Title"), std::string::npos);
    EXPECT_NE(text.find("the docs [https://example.org/doc]"), std::string::npos);
    EXPECT_EQ(text.find("alert"), std::string::npos);
    EXPECT_EQ(text.find("body{}"), std::string::npos);
    EXPECT_EQ(text.find("hidden"), std::string::npos);
}

TEST(ToolExecutorTest, RoutesToMcpTools) {
    TempWorkspace ws;
    McpRegistry registry(builtin_tool_names());
    McpServerConfig server;
    server.command = FAKE_MCP_SERVER_PATH;
    registry.register_server("fake", server);

    ToolExecutor exec(quiet_context(ws.path()), &registry);
    EXPECT_TRUE(exec.is_known("echo"));
    EXPECT_TRUE(exec.is_known("fake"));

    auto native = exec.execute("echo", "", R"({"msg": "native"})");
    ASSERT_TRUE(native.success) << native.agent_output;
    EXPECT_EQ(native.agent_output, "native");

    auto by_server = exec.execute("fake", R"(echo {"msg": "routed"})", "");
    ASSERT_TRUE(by_server.success) << by_server.agent_output;
    EXPECT_EQ(by_server.agent_output, "routed");

    // The built-in shell wins over the server's tool of the same name.
    auto shell = exec.execute("shell", "", "echo builtin");
    EXPECT_NE(shell.agent_output.find("builtin"), std::string::npos);
    EXPECT_EQ(exec.execute("fake_shell", "", "").agent_output, "fake shell");

    auto failed = exec.execute("fail", "", "");
    EXPECT_FALSE(failed.success);

    auto null_result = exec.execute("nullresult", "", "");
    EXPECT_FALSE(null_result.success);
    EXPECT_EQ(null_result.error_kind, ToolErrorKind::failed);
    EXPECT_NE(null_result.agent_output.find("non-object result"), std::string::npos);
    EXPECT_EQ(exec.execute("echo", "", R"({"msg": "still up"})").agent_output, "still up");

    auto missing = exec.execute("fake", "", "");
    EXPECT_EQ(missing.error_kind, ToolErrorKind::bad_invocation);

    EXPECT_NE(exec.describe().find("[MCP:fake]"), std::string::npos);

    ToolExecutor readonly(quiet_context(ws.path(), true), &registry);
    EXPECT_EQ(readonly.execute("echo", "", "{}").error_kind, ToolErrorKind::permission_denied);
    registry.shutdown();
}

TEST(ToolExecutorTest, ThrowingToolFailsOnlyItsCall) {
    TempWorkspace ws;
    ToolExecutor exec(quiet_context(ws.path()));
    ToolDef def;
    def.name = "explode";
    def.func = [](const std::string&, const std::string&, ToolContext&) -> ToolResult {
        throw std::out_of_range("index 7 past end");
    };
    exec.registry().register_tool(def);

    auto r = exec.execute("explode", "", "");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error_kind, ToolErrorKind::failed);
    EXPECT_NE(r.agent_output.find("index 7 past end"), std::string::npos);
    EXPECT_TRUE(exec.execute("write", "after.txt", "ok").success);
}

TEST(SearchToolTest, ParsesDuckDuckGoResults) {
    std::string html =
        "<div class=\"result\"><h2 class=\"result__title\">"
        "<a rel=\"nofollow\" class=\"result__a\" "
        "href=\"//duckduckgo.com/l/?uddg=https%3A%2F%2Fexample.com%2Fdocs%3Fa%3D1&amp;rut=abc\">"
        "Example <b>Docs</b></a></h2>"
        "<a class=\"result__snippet\" href=\"x\">Read the <b>docs</b> &amp; more</a></div>"
        "<div class=\"result\"><h2 class=\"result__title\">"
        "<a rel=\"nofollow\" class=\"result__a\" href=\"/about\">About</a></h2></div>";

    auto hits = parse_duckduckgo_html(html);
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].title, "Example Docs");
    EXPECT_EQ(hits[0].url, "https://example.com/docs?a=1");
    EXPECT_EQ(hits[0].snippet, "Read the docs & more");
    EXPECT_EQ(hits[1].url, "https://duckduckgo.com/about");
    EXPECT_EQ(hits[1].snippet, "No description");
}

TEST(SearchToolTest, ParsesGoogleItemsAndFormats) {
    auto hits = parse_google_results(nlohmann::json::parse(R"({
        "items": [
            {"title": "CMake", "link": "https://cmake.org", "snippet": "Build system"},
            {"title": "no link"},
            "junk"
        ]
    })"));
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(format_search_results("cmake", hits, ""),
              "Search results for \"cmake\":\n\n1. CMake\n   URL: https://cmake.org\n   Build system\n\n");
    EXPECT_EQ(format_search_results("nothing", {}, "DuckDuckGo"),
              "Search results for \"nothing\" (via DuckDuckGo):\n\nNo results found.\n");
    EXPECT_TRUE(parse_google_results(nlohmann::json::parse(R"({"kind": "empty"})")).empty());
}

TEST(SearchToolTest, EmptyQueryIsRejected) {
    TempWorkspace ws;
    ToolExecutor exec(quiet_context(ws.path(), true));
    EXPECT_EQ(exec.execute("search", "  ", "").error_kind, ToolErrorKind::bad_invocation);
    EXPECT_EQ(url_encode("a b&c/~"), "a%20b%26c%2F~");
    EXPECT_EQ(url_decode("a%20b+c%2"), "a b c%2");
}

} // namespace
