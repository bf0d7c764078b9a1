#include "cli.hpp"
#include "agent_manager.hpp"
#include "prompts.hpp"
#include "session.hpp"
#include "mcp/mcp_config.hpp"
#include "mcp/registry.hpp"
#include "workflow/executor.hpp"
#include <atomic>
#include <functional>
#include <signal.h>
#include <iostream>
#include <map>
#include <thread>

namespace termineer {

// ── Argument parsing ──

void print_usage(std::ostream& os) {
    os << "Usage: termineer [QUERY] [options]\n\n"
       << "Options:\n"
       << "  --model NAME            Model (provider/model or a known model name)\n"
       << "  --kind KIND             Agent kind (see list-kinds)\n"
       << "  --no-tools              Disable tool use\n"
       << "  --thinking-budget N     Thinking token budget\n"
       << "  --minimal-prompt        Use the minimal system prompt\n"
       << "  --resume                Resume the last saved session\n"
       << "  --grammar xml|markdown  Tool call grammar\n"
       << "  --skip-auth             Accepted for compatibility\n\n"
       << "Commands:\n"
       << "  login                   Authentication (not part of this build)\n"
       << "  list-kinds              Show available agent kinds\n"
       << "  workflow [NAME] [-p K=V]... [-- QUERY]\n"
       << "                          Run a workflow, or list workflows\n"
       << "  sessions                List saved sessions\n";
}

static std::string flag_value(const std::vector<std::string>& args, size_t& i) {
    if (i + 1 >= args.size()) throw UsageError("Missing value for " + args[i]);
    return args[++i];
}

CliOptions parse_cli(const std::vector<std::string>& args) {
    CliOptions opts;
    std::vector<std::string> positional;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& a = args[i];
        if (a == "--") {
            std::string rest;
            for (size_t k = i + 1; k < args.size(); k++) rest += (rest.empty() ? "" : " ") + args[k];
            if (!rest.empty()) opts.extra_query = rest;
            break;
        } else if (a == "-h" || a == "--help") {
            opts.help = true;
        } else if (a == "--model") {
            opts.model = flag_value(args, i);
        } else if (a == "--kind") {
            opts.kind = flag_value(args, i);
        } else if (a == "--no-tools") {
            opts.no_tools = true;
        } else if (a == "--thinking-budget") {
            std::string v = flag_value(args, i);
            try {
                size_t used = 0;
                int n = std::stoi(v, &used);
                if (used != v.size() || n < 0) throw std::invalid_argument(v);
                opts.thinking_budget = n;
            } catch (const std::logic_error&) {
                throw UsageError("Invalid thinking budget: " + v);
            }
        } else if (a == "--minimal-prompt") {
            opts.minimal_prompt = true;
        } else if (a == "--resume") {
            opts.resume = true;
        } else if (a == "--grammar") {
            std::string g = to_lower(flag_value(args, i));
            if (g != "xml" && g != "markdown") throw UsageError("Invalid grammar: " + g + " (expected xml or markdown)");
            opts.grammar = g;
        } else if (a == "--skip-auth") {
            opts.skip_auth = true;
        } else if (a == "--param" || a == "-p") {
            opts.params.push_back(flag_value(args, i));
        } else if (starts_with(a, "--param=")) {
            opts.params.push_back(a.substr(8));
        } else if (starts_with(a, "-") && a.size() > 1) {
            throw UsageError("Unknown option: " + a);
        } else {
            positional.push_back(a);
        }
    }

    size_t first = 0;
    if (!positional.empty()) {
        const std::string& p = positional[0];
        if (p == "login" || p == "list-kinds" || p == "workflow" || p == "sessions") {
            opts.command = p;
            first = 1;
        }
    }
    if (opts.command == "workflow" && first < positional.size()) {
        opts.workflow_name = positional[first++];
    }
    if (!opts.params.empty() && opts.command != "workflow") {
        throw UsageError("--param is only valid with the workflow command");
    }

    std::string query;
    for (size_t i = first; i < positional.size(); i++) query += (query.empty() ? "" : " ") + positional[i];
    if (!query.empty()) {
        if (!opts.command.empty() && opts.command != "workflow") {
            throw UsageError("Unexpected argument for " + opts.command + ": " + query);
        }
        opts.query = query;
    }
    return opts;
}

void apply_cli(const CliOptions& opts, Config& cfg) {
    if (opts.model) cfg.model = *opts.model;
    if (opts.kind) cfg.kind = *opts.kind;
    if (opts.grammar) cfg.grammar = *opts.grammar;
    if (opts.thinking_budget) cfg.thinking_budget = *opts.thinking_budget;
    if (opts.no_tools) cfg.enable_tools = false;
    if (opts.minimal_prompt) cfg.use_minimal_prompt = true;
    if (opts.resume) cfg.resume_last_session = true;
}

// ── Ctrl+C ──

static std::atomic<bool> g_sigint{false};

static void on_sigint(int) {
    g_sigint.store(true);
}

static void install_sigint() {
    struct sigaction sa {};
    sa.sa_handler = on_sigint;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    sigaction(SIGINT, &sa, nullptr);
}

// Calls on_interrupt from a watcher thread after each SIGINT.
class SigintWatcher {
public:
    explicit SigintWatcher(std::function<void()> on_interrupt) : on_interrupt_(std::move(on_interrupt)) {
        install_sigint();
        thread_ = std::thread([this] {
            while (!stop_) {
                if (g_sigint.exchange(false)) on_interrupt_();
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
        });
    }
    ~SigintWatcher() {
        stop_ = true;
        if (thread_.joinable()) thread_.join();
    }
    SigintWatcher(const SigintWatcher&) = delete;
    SigintWatcher& operator=(const SigintWatcher&) = delete;

private:
    std::function<void()> on_interrupt_;
    std::atomic<bool> stop_{false};
    std::thread thread_;
};

// ── Output ──

static void print_line(const OutputLine& line) {
    switch (line.type) {
        case OutputType::standard: std::cout << line.content << "\n"; break;
        case OutputType::error:    std::cerr << line.content << "\n"; break;
        case OutputType::tool:     std::cout << "[" << line.tool_name << "] " << line.content << "\n"; break;
        case OutputType::system:   std::cout << "* " << line.content << "\n"; break;
        case OutputType::debug:    break;
    }
}

// Prints lines newer than `since` and returns the new high-water mark.
static uint64_t flush_buffer(const BufferPtr& buf, uint64_t since) {
    for (auto& line : buf->take_new(since)) {
        print_line(line);
        since = line.seq;
    }
    std::cout.flush();
    return since;
}

static void connect_mcp_servers() {
    auto results = McpRegistry::instance().initialize_from_config(McpConfig::load_default());
    for (auto& r : results) {
        if (!r.ok) std::cerr << "[warn] MCP server '" << r.name << "' failed: " << r.error << "\n";
    }
}

static void resume_session(AgentManager& manager, AgentId id) {
    try {
        SessionStore store;
        auto s = store.load_last();
        if (!s) {
            std::cerr << "[warn] No previous session to resume\n";
            return;
        }
        manager.send(id, AgentMessage::make_command(AgentCommand::replace_conversation(s->conversation)));
        std::cout << "Resumed session " << s->name << " (" << s->conversation.size() << " messages)\n";
    } catch (const SessionError& e) {
        std::cerr << "[warn] " << e.what() << "\n";
    }
}

// ── Query mode ──

int cmd_query(const Config& cfg, const std::string& query) {
    connect_mcp_servers();
    AgentManager manager(default_backend_factory, &McpRegistry::instance());
    return run_query(manager, cfg, query);
}

int run_query(AgentManager& manager, const Config& cfg, const std::string& query) {
    AgentId id = 0;
    try {
        id = manager.create("main", cfg);
    } catch (const AgentError& e) {
        std::cerr << "error: " << e.what() << "\n";
        manager.terminate_all();
        return 1;
    }
    if (cfg.resume_last_session) resume_session(manager, id);

    SigintWatcher watcher([&] {
        try {
            manager.interrupt(id);
        } catch (const AgentError& e) {
            std::cerr << "[warn] " << e.what() << "\n";
        }
    });

    int rc = 0;
    try {
        manager.send_user_input(id, query);
        auto buf = manager.buffer(id);
        uint64_t seen = 0;
        while (!manager.wait_for_turn(id, 0, std::chrono::milliseconds(200))) {
            seen = flush_buffer(buf, seen);
            if (manager.state(id).kind == AgentStateKind::terminated) {
                rc = 1;
                break;
            }
        }
        flush_buffer(buf, seen);
        if (rc == 0 && manager.last_turn_failed(id)) rc = 1;
    } catch (const AgentError& e) {
        std::cerr << "error: " << e.what() << "\n";
        rc = 1;
    }

    manager.terminate_all();
    return rc;
}

// ── Interactive mode ──

namespace {

class Console {
public:
    Console(Config cfg, AgentManager& manager) : cfg_(std::move(cfg)), manager_(manager) {}

    int run();

private:
    Config cfg_;
    AgentManager& manager_;
    SessionStore store_;
    std::atomic<AgentId> current_{0};
    std::atomic<bool> stop_{false};
    std::string current_name_;

    void printer_loop();
    bool handle_command(const std::string& line);  // false on /exit
    void print_help() const;
    std::optional<AgentId> lookup(const std::string& name) const;
};

void Console::printer_loop() {
    std::map<AgentId, uint64_t> seen;
    while (!stop_) {
        AgentId id = current_.load();
        if (id != 0) {
            try {
                seen[id] = flush_buffer(manager_.buffer(id), seen[id]);
            } catch (const AgentError&) {
                seen.erase(id);
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
}

void Console::print_help() const {
    std::cout << "Commands:\n"
              << "  /help                 Show this help\n"
              << "  /exit                 Quit\n"
              << "  /interrupt            Interrupt the current agent\n"
              << "  /reset                Clear the conversation\n"
              << "  /model NAME           Switch model\n"
              << "  /tools on|off         Enable or disable tools\n"
              << "  /thinking N           Set the thinking budget\n"
              << "  /system TEXT          Set the system prompt\n"
              << "  /save [NAME]          Save the conversation\n"
              << "  /load ID              Load a saved conversation\n"
              << "  /sessions             List saved sessions\n"
              << "  /agents               List agents\n"
              << "  /new NAME             Create an agent and switch to it\n"
              << "  /switch NAME          Switch to an agent\n"
              << "  /kill NAME            Terminate an agent\n"
              << "  /send NAME TEXT       Send a message to another agent\n";
}

std::optional<AgentId> Console::lookup(const std::string& name) const {
    if (auto id = manager_.id_by_name(name)) return id;
    std::cout << "No agent named '" << name << "'\n";
    return std::nullopt;
}

bool Console::handle_command(const std::string& line) {
    auto space = line.find(' ');
    std::string cmd = line.substr(0, space);
    std::string arg = space == std::string::npos ? "" : trim(line.substr(space + 1));
    AgentId id = current_.load();

    if (cmd == "/exit" || cmd == "/quit") return false;

    if (cmd == "/help") {
        print_help();
    } else if (cmd == "/interrupt") {
        if (!manager_.interrupt(id, std::string("User requested interruption"))) {
            std::cout << "Nothing to interrupt\n";
        }
    } else if (cmd == "/reset") {
        manager_.send(id, AgentMessage::make_command(AgentCommand::reset_conversation()));
        std::cout << "Conversation reset\n";
    } else if (cmd == "/model") {
        if (arg.empty()) {
            std::cout << "Model: " << cfg_.model << "\n";
        } else {
            cfg_.model = arg;
            manager_.send(id, AgentMessage::make_command(AgentCommand::set_model(arg)));
        }
    } else if (cmd == "/tools") {
        if (arg != "on" && arg != "off") {
            std::cout << "Usage: /tools on|off\n";
        } else {
            cfg_.enable_tools = arg == "on";
            manager_.send(id, AgentMessage::make_command(AgentCommand::enable_tools(cfg_.enable_tools)));
        }
    } else if (cmd == "/thinking") {
        try {
            int n = std::stoi(arg);
            cfg_.thinking_budget = n;
            manager_.send(id, AgentMessage::make_command(AgentCommand::set_thinking_budget(n)));
        } catch (const std::logic_error&) {
            std::cout << "Usage: /thinking N\n";
        }
    } else if (cmd == "/system") {
        cfg_.system_prompt = arg;
        manager_.send(id, AgentMessage::make_command(AgentCommand::set_system_prompt(arg)));
    } else if (cmd == "/save") {
        try {
            std::optional<std::string> prompt;
            if (!cfg_.system_prompt.empty()) prompt = cfg_.system_prompt;
            auto s = store_.save(arg, cfg_.model, prompt, manager_.conversation(id));
            std::cout << "Saved session " << s.id << " (" << s.name << ", "
                      << s.metadata.message_count << " messages)\n";
        } catch (const SessionError& e) {
            std::cerr << "error: " << e.what() << "\n";
        }
    } else if (cmd == "/load") {
        if (arg.empty()) {
            std::cout << "Usage: /load ID\n";
        } else {
            try {
                auto s = store_.load(arg);
                manager_.send(id, AgentMessage::make_command(AgentCommand::replace_conversation(s.conversation)));
                std::cout << "Loaded session " << s.name << " (" << s.conversation.size() << " messages)\n";
            } catch (const SessionError& e) {
                std::cerr << "error: " << e.what() << "\n";
            }
        }
    } else if (cmd == "/sessions") {
        cmd_sessions();
    } else if (cmd == "/agents") {
        for (auto& info : manager_.list()) {
            bool shell = false;
            try {
                shell = manager_.is_shell_running(info.id);
            } catch (const AgentError&) {
                continue;  // terminated since list()
            }
            std::cout << (info.id == id ? "* " : "  ") << info.id << " " << info.name
                      << " [" << info.state.describe() << "]" << (shell ? " (shell running)" : "") << "\n";
        }
    } else if (cmd == "/new") {
        if (arg.empty()) {
            std::cout << "Usage: /new NAME\n";
        } else {
            AgentId created = manager_.create(arg, cfg_);
            current_ = created;
            current_name_ = arg;
            std::cout << "Created agent " << arg << " (#" << created << ")\n";
        }
    } else if (cmd == "/switch") {
        if (auto target = lookup(arg)) {
            current_ = *target;
            current_name_ = arg;
            std::cout << "Switched to " << arg << "\n";
        }
    } else if (cmd == "/kill") {
        if (auto target = lookup(arg)) {
            if (*target == id) {
                std::cout << "Cannot kill the current agent; /switch first\n";
            } else {
                manager_.terminate(*target);
                std::cout << "Terminated " << arg << "\n";
            }
        }
    } else if (cmd == "/send") {
        auto sp = arg.find(' ');
        if (sp == std::string::npos) {
            std::cout << "Usage: /send NAME TEXT\n";
        } else if (auto target = lookup(arg.substr(0, sp))) {
            manager_.send(*target, AgentMessage::agent_input(trim(arg.substr(sp + 1)), id, current_name_));
        }
    } else {
        std::cout << "Unknown command: " << cmd << " (try /help)\n";
    }
    return true;
}

int Console::run() {
    try {
        AgentId id = manager_.create("main", cfg_);
        current_ = id;
        current_name_ = "main";
    } catch (const AgentError& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
    if (cfg_.resume_last_session) resume_session(manager_, current_);

    std::cout << "Termineer (" << cfg_.model << "). Type /help for commands, /exit to quit.\n";

    SigintWatcher watcher([this] {
        AgentId id = current_.load();
        try {
            if (!manager_.interrupt(id)) std::cout << "\n(use /exit or Ctrl+D to quit)\n> " << std::flush;
        } catch (const AgentError& e) {
            std::cerr << "[warn] " << e.what() << "\n";
        }
    });
    std::thread printer([this] { printer_loop(); });

    std::string line;
    while (true) {
        std::cout << "> " << std::flush;
        if (!std::getline(std::cin, line)) break;
        line = trim(line);
        if (line.empty()) continue;

        try {
            if (line[0] == '/') {
                if (!handle_command(line)) break;
            } else {
                manager_.send_user_input(current_, line);
            }
        } catch (const AgentError& e) {
            std::cerr << "error: " << e.what() << "\n";
        }
    }

    stop_ = true;
    printer.join();
    return 0;
}

} // namespace

int cmd_interactive(const Config& cfg) {
    connect_mcp_servers();
    AgentManager manager(default_backend_factory, &McpRegistry::instance());
    int rc = Console(cfg, manager).run();
    manager.terminate_all();
    return rc;
}

// ── Other commands ──

int cmd_workflow(const Config& cfg, const CliOptions& opts) {
    if (!opts.workflow_name) {
        auto names = list_workflows();
        if (names.empty()) {
            std::cout << "No workflows found. Create one in .termineer/workflows/\n";
            return 0;
        }
        std::cout << "Available workflows:\n";
        for (auto& n : names) std::cout << "  - " << n << "\n";
        std::cout << "\nRun with: termineer workflow <name>\n";
        return 0;
    }

    Workflow wf;
    nlohmann::json params;
    try {
        wf = load_workflow(*opts.workflow_name);
        params = parse_parameter_args(opts.params);
    } catch (const WorkflowError& e) {
        std::cerr << "error: " << e.what() << "\n";
        return e.kind() == WorkflowErrorKind::invalid_config && !opts.params.empty() ? 2 : 1;
    }

    std::optional<std::string> query = opts.extra_query;
    if (!query) query = opts.query;

    connect_mcp_servers();
    AgentManager manager(default_backend_factory, &McpRegistry::instance());

    int rc = 0;
    try {
        AgentId target = 0;
        bool needs_agent = false;
        for (auto& s : wf.steps) needs_agent = needs_agent || s.type == StepType::message;
        if (needs_agent) target = manager.create("main", cfg);

        InterruptCoordinator interrupts(make_interrupt_channel());
        SigintWatcher watcher([&] { interrupts.handle_interrupt(std::string("User requested interruption (Ctrl+C)")); });

        WorkflowExecutor exec(manager, target, cfg);
        exec.set_interrupts(&interrupts);
        exec.execute(wf, params, query);
    } catch (const WorkflowError& e) {
        std::cerr << "error: " << e.what() << "\n";
        rc = 1;
    } catch (const AgentError& e) {
        std::cerr << "error: " << e.what() << "\n";
        rc = 1;
    }

    manager.terminate_all();
    return rc;
}

int cmd_list_kinds() {
    std::cout << "Available agent kinds:\n";
    for (auto& k : available_kinds()) {
        std::cout << "  " << k.name << (k.readonly ? " (read-only)" : "") << "\n"
                  << "      " << k.description << "\n";
    }
    return 0;
}

int cmd_sessions() {
    SessionStore store;
    auto sessions = store.list();
    if (sessions.empty()) {
        std::cout << "No saved sessions in " << store.dir().string() << "\n";
        return 0;
    }
    for (auto& s : sessions) {
        std::cout << s.id << "  " << iso_time(s.timestamp) << "  " << s.name
                  << " (" << s.metadata.message_count << " messages, " << s.model << ")\n";
    }
    return 0;
}

int cmd_login() {
    std::cout << "Authentication is not part of this build; configure provider API keys "
                 "through the environment (ANTHROPIC_API_KEY, OPENAI_API_KEY, ...).\n";
    return 0;
}

int run_cli(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    CliOptions opts;
    try {
        opts = parse_cli(args);
    } catch (const UsageError& e) {
        std::cerr << "error: " << e.what() << "\n\n";
        print_usage(std::cerr);
        return 2;
    }
    if (opts.help) {
        print_usage(std::cout);
        return 0;
    }

    if (opts.command == "login") return cmd_login();
    if (opts.command == "list-kinds") return cmd_list_kinds();
    if (opts.command == "sessions") return cmd_sessions();

    Config cfg = load_effective_config();
    apply_cli(opts, cfg);
    if (!cfg.kind.empty() && !find_kind(cfg.kind)) {
        std::cerr << "error: Invalid agent kind: '" << cfg.kind << "'";
        auto hints = kind_suggestions(cfg.kind);
        if (!hints.empty()) {
            std::cerr << " (did you mean";
            for (auto& h : hints) std::cerr << " " << h;
            std::cerr << "?)";
        }
        std::cerr << "\n";
        return 2;
    }

    if (opts.command == "workflow") return cmd_workflow(cfg, opts);
    if (opts.query) return cmd_query(cfg, *opts.query);
    return cmd_interactive(cfg);
}

} // namespace termineer
