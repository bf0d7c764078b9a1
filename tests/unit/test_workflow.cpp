#include <gtest/gtest.h>
#include "workflow/executor.hpp"
#include "scripted_backend.hpp"
#include <fstream>
#include <random>
#include <sstream>

using namespace termineer;
using namespace termineer::test_support;

namespace {

class TempWorkspace {
public:
    TempWorkspace() {
        std::random_device rd;
        root_ = fs::temp_directory_path() / ("termineer_workflow_" + std::to_string(rd()));
        fs::create_directories(root_);
        root_ = fs::canonical(root_);
    }
    ~TempWorkspace() {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }
    const fs::path& root() const { return root_; }
    void write(const fs::path& rel, const std::string& text) {
        fs::create_directories((root_ / rel).parent_path());
        std::ofstream f(root_ / rel);
        f << text;
    }
    std::string read(const fs::path& rel) const { return read_file((root_ / rel).string()); }
private:
    fs::path root_;
};

Config workspace_config(const TempWorkspace& ws) {
    Config cfg;
    cfg.model = "scripted-model";
    cfg.workdir = ws.root().string();
    return cfg;
}

// Every agent answers "echo: <last user message>".
BackendFactory echo_factory() {
    return [](const Config&) {
        auto backend = std::make_shared<ScriptedBackend>();
        backend->set_fallback([](const LlmRequest& req) {
            return text_response("echo: " + last_user_text(req));
        });
        return backend;
    };
}

WorkflowErrorKind error_kind_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const WorkflowError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected WorkflowError";
    return WorkflowErrorKind::invalid_config;
}

const char* FULL_WORKFLOW = R"(
name: release-notes
description: Draft release notes
version: 1.2
parameters:
  - name: target
    description: Branch to describe
    required: true
  - name: retries
    default: 3
  - name: label
    default: "3"
query_template: "Task: {{ raw_query }}"
steps:
  - shell: list
    command: git log --oneline
    store_output: log
  - message: ask
    content: "Summarize {{ log }}"
    store_response: summary
  - file: save
    action: write
    path: notes.md
    content: "{{ summary }}"
  - output: show
    content: done
  - wait: confirm
    wait_message: Continue?
    store_input: answer
  - agent: review
    kind: researcher
    prompt: Check {{ parameters.target }}
    into: review
    fail_on_error: false
)";

TEST(WorkflowParseTest, ReadsEveryStepType) {
    auto wf = parse_workflow(FULL_WORKFLOW);
    EXPECT_EQ(wf.name, "release-notes");
    EXPECT_EQ(*wf.version, "1.2");
    ASSERT_EQ(wf.parameters.size(), 3u);
    EXPECT_TRUE(wf.parameters[0].required);
    EXPECT_TRUE(wf.parameters[1].default_value->is_number_integer());
    EXPECT_TRUE(wf.parameters[2].default_value->is_string());
    EXPECT_EQ(*wf.query_template, "Task: {{ raw_query }}");

    ASSERT_EQ(wf.steps.size(), 6u);
    EXPECT_EQ(wf.steps[0].type, StepType::shell);
    EXPECT_EQ(wf.steps[0].id, "list");
    EXPECT_EQ(*wf.steps[0].store_output, "log");
    EXPECT_EQ(wf.steps[1].type, StepType::message);
    EXPECT_EQ(wf.steps[2].action, FileAction::write);
    EXPECT_EQ(wf.steps[2].path, "notes.md");
    EXPECT_EQ(wf.steps[3].content, "done");
    EXPECT_EQ(*wf.steps[4].wait_message, "Continue?");
    EXPECT_EQ(wf.steps[5].type, StepType::agent);
    EXPECT_EQ(*wf.steps[5].kind, "researcher");
    EXPECT_TRUE(wf.steps[0].fail_on_error);
    EXPECT_FALSE(wf.steps[5].fail_on_error);
}

TEST(WorkflowParseTest, StructuralErrors) {
    EXPECT_EQ(error_kind_of([] { parse_workflow("name: x\nsteps:\n  - command: ls\n"); }),
              WorkflowErrorKind::invalid_step_type);
    EXPECT_EQ(error_kind_of([] { parse_workflow("name: x\nsteps:\n  - shell: a\n"); }),
              WorkflowErrorKind::missing_field);
    EXPECT_EQ(error_kind_of([] { parse_workflow("name: x\nsteps:\n  - file: a\n    action: move\n    path: p\n"); }),
              WorkflowErrorKind::invalid_config);
    EXPECT_EQ(error_kind_of([] { parse_workflow("name: x\nsteps:\n  - file: a\n    action: write\n    path: p\n"); }),
              WorkflowErrorKind::missing_field);
    EXPECT_EQ(error_kind_of([] { parse_workflow("steps: []\n"); }), WorkflowErrorKind::missing_field);
    EXPECT_EQ(error_kind_of([] { parse_workflow("name: x\n"); }), WorkflowErrorKind::missing_field);
}

TEST(WorkflowParseTest, MalformedYamlNamesSource) {
    try {
        parse_workflow("name: x\nsteps: [a, b\n", "broken.yaml");
        FAIL() << "expected WorkflowError";
    } catch (const WorkflowError& e) {
        EXPECT_EQ(e.kind(), WorkflowErrorKind::invalid_config);
        EXPECT_NE(std::string(e.what()).find("broken.yaml: line"), std::string::npos);
    }
}

TEST(WorkflowParseTest, ScalarTyping) {
    auto j = yaml_to_json("a: true\nb: 42\nc: 2.5\nd: \"42\"\ne: hello world\nf:\n");
    EXPECT_TRUE(j["a"].is_boolean());
    EXPECT_EQ(j["b"], 42);
    EXPECT_DOUBLE_EQ(j["c"].get<double>(), 2.5);
    EXPECT_EQ(j["d"], "42");
    EXPECT_EQ(j["e"], "hello world");
    EXPECT_TRUE(j["f"].is_null());
}

TEST(WorkflowTemplateTest, RendersPathsAndIndices) {
    nlohmann::json scope = {
        {"parameters", {{"name", "api"}, {"count", 2}, {"tags", {"x", "y"}}}},
        {"summary", "ok"},
    };
    EXPECT_EQ(render_template("{{ parameters.name }}/{{parameters.count}}", scope), "api/2");
    EXPECT_EQ(render_template("tag={{ parameters.tags.1 }}", scope), "tag=y");
    EXPECT_EQ(render_template("[{{ missing.value }}]", scope), "[]");
    EXPECT_EQ(render_template("{{{ summary }}}!", scope), "ok!");
    EXPECT_EQ(render_template("no templates here", scope), "no templates here");
}

TEST(WorkflowTemplateTest, MalformedTemplatesThrow) {
    EXPECT_EQ(error_kind_of([] { render_template("hello {{ name", nlohmann::json::object()); }),
              WorkflowErrorKind::template_error);
    EXPECT_EQ(error_kind_of([] { render_template("{{   }}", nlohmann::json::object()); }),
              WorkflowErrorKind::template_error);
}

TEST(WorkflowContextTest, DefaultsAndRequiredParameters) {
    auto wf = parse_workflow(FULL_WORKFLOW);

    WorkflowContext missing;
    try {
        missing.apply_parameters(wf);
        FAIL() << "expected WorkflowError";
    } catch (const WorkflowError& e) {
        EXPECT_EQ(e.kind(), WorkflowErrorKind::missing_parameter);
        EXPECT_STREQ(e.what(), "Missing required parameter: target");
    }

    nlohmann::json params = {{"target", "main"}, {"retries", "5"}};
    WorkflowContext ctx(params);
    ctx.apply_parameters(wf);
    EXPECT_EQ(ctx.parameters()["retries"], "5");
    EXPECT_EQ(ctx.parameters()["label"], "3");
    ctx.set_variable("log", "abc");
    ctx.set_agent_response("reply");
    EXPECT_EQ(ctx.render("{{ parameters.target }} {{ log }} {{ agent_response }}"), "main abc reply");
}

TEST(WorkflowLoadTest, FindsYamlAndYmlFiles) {
    TempWorkspace ws;
    ws.write("local/first.yaml", "name: first\nsteps: []\n");
    ws.write("home/second.yml", "name: second\nsteps: []\n");
    ws.write("home/first.yaml", "name: shadowed\nsteps: []\n");
    ws.write("home/readme.txt", "not a workflow");
    std::vector<fs::path> dirs{ws.root() / "local", ws.root() / "home"};

    EXPECT_EQ(load_workflow("first", dirs).name, "first");
    EXPECT_EQ(load_workflow("second", dirs).name, "second");
    std::vector<std::string> expected{"first", "second"};
    EXPECT_EQ(list_workflows(dirs), expected);

    try {
        load_workflow("third", dirs);
        FAIL() << "expected WorkflowError";
    } catch (const WorkflowError& e) {
        EXPECT_EQ(e.kind(), WorkflowErrorKind::invalid_config);
        EXPECT_NE(std::string(e.what()).find("Workflow file not found: third"), std::string::npos);
    }
}

TEST(WorkflowLoadTest, ParameterArguments) {
    auto params = parse_parameter_args({"target=main", "expr=a=b"});
    EXPECT_EQ(params["target"], "main");
    EXPECT_EQ(params["expr"], "a=b");
    EXPECT_EQ(error_kind_of([] { parse_parameter_args({"novalue"}); }), WorkflowErrorKind::invalid_config);
}

TEST(WorkflowExecutorTest, ShellFileAndOutputSteps) {
    TempWorkspace ws;
    AgentManager manager(echo_factory());
    std::ostringstream out;
    std::istringstream in;
    WorkflowExecutor exec(manager, 0, workspace_config(ws), out, in);

    auto wf = parse_workflow(R"(
name: pipeline
parameters:
  - name: greeting
    default: hello
steps:
  - shell: greet
    command: echo {{ parameters.greeting }}
    store_output: said
  - file: save
    action: write
    path: out.txt
    content: "{{ said }}!"
  - file: more
    action: append
    path: out.txt
    content: "?"
  - file: load
    action: read
    path: out.txt
    store_as: back
  - output: show
    content: "result={{ back }}"
)");

    auto ctx = exec.execute(wf);
    EXPECT_EQ(*ctx.variable("said"), "hello");
    EXPECT_EQ(*ctx.variable("back"), "hello!?");
    EXPECT_EQ(ws.read("out.txt"), "hello!?");
    std::string log = out.str();
    EXPECT_NE(log.find("Starting workflow: pipeline"), std::string::npos);
    EXPECT_NE(log.find("STEP 1/5: shell greet"), std::string::npos);
    EXPECT_NE(log.find("result=hello!?"), std::string::npos);
    EXPECT_NE(log.find("Workflow completed: pipeline"), std::string::npos);
}

TEST(WorkflowExecutorTest, FailingShellStopsTheWorkflow) {
    TempWorkspace ws;
    AgentManager manager(echo_factory());
    std::ostringstream out;
    std::istringstream in;
    WorkflowExecutor exec(manager, 0, workspace_config(ws), out, in);

    auto wf = parse_workflow("name: f\nsteps:\n  - shell: bad\n    command: exit 3\n  - output: never\n    content: reached\n");
    try {
        exec.execute(wf);
        FAIL() << "expected WorkflowError";
    } catch (const WorkflowError& e) {
        EXPECT_EQ(e.kind(), WorkflowErrorKind::shell_error);
        EXPECT_NE(std::string(e.what()).find("exited with code 3"), std::string::npos);
    }
    EXPECT_EQ(out.str().find("reached"), std::string::npos);
}

TEST(WorkflowExecutorTest, FailOnErrorFalseContinues) {
    TempWorkspace ws;
    AgentManager manager(echo_factory());
    std::ostringstream out;
    std::istringstream in;
    WorkflowExecutor exec(manager, 0, workspace_config(ws), out, in);

    auto wf = parse_workflow(R"(
name: tolerant
steps:
  - shell: soft
    command: "echo partial; exit 1"
    store_output: partial
    fail_on_error: false
  - file: missing
    action: read
    path: nope.txt
    fail_on_error: false
  - output: after
    content: "still here {{ partial }}"
)");
    auto ctx = exec.execute(wf);
    EXPECT_EQ(*ctx.variable("partial"), "partial");
    EXPECT_NE(out.str().find("[warn] step 'missing' failed, continuing"), std::string::npos);
    EXPECT_NE(out.str().find("still here partial"), std::string::npos);
}

TEST(WorkflowExecutorTest, FileStepsStayInsideWorkdir) {
    TempWorkspace ws;
    AgentManager manager(echo_factory());
    std::ostringstream out;
    std::istringstream in;
    WorkflowExecutor exec(manager, 0, workspace_config(ws), out, in);

    auto wf = parse_workflow("name: esc\nsteps:\n  - file: leak\n    action: write\n    path: ../leak.txt\n    content: x\n");
    EXPECT_EQ(error_kind_of([&] { exec.execute(wf); }), WorkflowErrorKind::permission_denied);
    EXPECT_FALSE(fs::exists(ws.root().parent_path() / "leak.txt"));
}

TEST(WorkflowExecutorTest, WaitStepReadsOneLine) {
    TempWorkspace ws;
    AgentManager manager(echo_factory());
    std::ostringstream out;
    std::istringstream in("yes please\nignored\n");
    WorkflowExecutor exec(manager, 0, workspace_config(ws), out, in);

    auto wf = parse_workflow("name: w\nsteps:\n  - wait: ask\n    wait_message: Ready?\n    store_input: answer\n");
    auto ctx = exec.execute(wf);
    EXPECT_EQ(*ctx.variable("answer"), "yes please");
    EXPECT_NE(out.str().find("Ready?"), std::string::npos);

    std::istringstream closed;
    WorkflowExecutor eof_exec(manager, 0, workspace_config(ws), out, closed);
    EXPECT_EQ(error_kind_of([&] { eof_exec.execute(wf); }), WorkflowErrorKind::io_error);
}

TEST(WorkflowExecutorTest, MessageStepStoresAgentReply) {
    TempWorkspace ws;
    AgentManager manager(echo_factory());
    auto cfg = workspace_config(ws);
    AgentId main = manager.create("main", cfg);
    std::ostringstream out;
    std::istringstream in;
    WorkflowExecutor exec(manager, main, cfg, out, in);
    exec.set_agent_timeout(std::chrono::seconds(10));

    auto wf = parse_workflow(R"(
name: ask
parameters:
  - name: topic
steps:
  - message: one
    content: "Explain {{ parameters.topic }}"
    store_response: answer
  - output: show
    content: "got {{ agent_response }}"
)");
    nlohmann::json params = {{"topic", "caching"}};
    auto ctx = exec.execute(wf, params);
    EXPECT_EQ(*ctx.variable("answer"), "echo: Explain caching");
    EXPECT_EQ(*ctx.agent_response(), "echo: Explain caching");
    EXPECT_NE(out.str().find("got echo: Explain caching"), std::string::npos);
    manager.terminate_all();
}

TEST(WorkflowExecutorTest, MessageStepWithoutTargetFails) {
    TempWorkspace ws;
    AgentManager manager(echo_factory());
    std::ostringstream out;
    std::istringstream in;
    WorkflowExecutor exec(manager, 0, workspace_config(ws), out, in);
    auto wf = parse_workflow("name: m\nsteps:\n  - message: lost\n    content: hi\n");
    EXPECT_EQ(error_kind_of([&] { exec.execute(wf); }), WorkflowErrorKind::agent_error);
}

TEST(WorkflowExecutorTest, AgentStepUsesThrowawayAgent) {
    TempWorkspace ws;
    AgentManager manager(echo_factory());
    std::ostringstream out;
    std::istringstream in;
    WorkflowExecutor exec(manager, 0, workspace_config(ws), out, in);
    exec.set_agent_timeout(std::chrono::seconds(10));

    auto wf = parse_workflow("name: a\nsteps:\n  - agent: review\n    kind: researcher\n    prompt: Look at {{ query }}\n    into: review\n");
    auto ctx = exec.execute(wf, nlohmann::json::object(), std::string("the parser"));
    EXPECT_EQ(*ctx.variable("review"), "echo: Look at the parser");
    EXPECT_TRUE(manager.list().empty());
    EXPECT_NE(out.str().find("Creating agent workflow_agent_review (kind researcher)"), std::string::npos);
}

TEST(WorkflowExecutorTest, AgentStepRejectsUnknownKind) {
    TempWorkspace ws;
    AgentManager manager(echo_factory());
    std::ostringstream out;
    std::istringstream in;
    WorkflowExecutor exec(manager, 0, workspace_config(ws), out, in);
    auto wf = parse_workflow("name: a\nsteps:\n  - agent: bad\n    kind: no-such-kind\n    prompt: hi\n");
    EXPECT_EQ(error_kind_of([&] { exec.execute(wf); }), WorkflowErrorKind::agent_error);
    EXPECT_TRUE(manager.list().empty());
}

TEST(WorkflowExecutorTest, QueryTemplateWrapsTheQuery) {
    TempWorkspace ws;
    AgentManager manager(echo_factory());
    std::ostringstream out;
    std::istringstream in;
    WorkflowExecutor exec(manager, 0, workspace_config(ws), out, in);
    auto wf = parse_workflow("name: q\nquery_template: \"Task: {{ raw_query }}\"\nsteps:\n  - output: show\n    content: \"{{ query }}\"\n");
    auto ctx = exec.execute(wf, nlohmann::json::object(), std::string("fix the bug"));
    EXPECT_EQ(*ctx.query(), "Task: fix the bug");
    EXPECT_EQ(*ctx.variable("raw_query"), "fix the bug");
}

} // namespace
