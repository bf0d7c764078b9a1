#include "connection.hpp"
#include "../utils.hpp"
#include <iostream>
#include <vector>
#include <csignal>
#include <cerrno>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <signal.h>

namespace termineer {

McpConnection::McpConnection(std::string name, McpServerConfig cfg)
    : name_(std::move(name)), config_(std::move(cfg)) {}

McpConnection::~McpConnection() {
    close();
}

static void close_pair(int p[2]) {
    ::close(p[0]);
    ::close(p[1]);
}

void McpConnection::connect() {
    if (config_.command.empty()) {
        throw McpError(McpErrorKind::connection_error, "MCP server '" + name_ + "': no command specified");
    }
    if (connected_) return;

    // A server that dies mid-write must not take the process down.
    static std::once_flag sigpipe_once;
    std::call_once(sigpipe_once, [] { std::signal(SIGPIPE, SIG_IGN); });

    int pipe_in[2], pipe_out[2], pipe_err[2];
    if (pipe(pipe_in) != 0) {
        throw McpError(McpErrorKind::connection_error, "MCP server '" + name_ + "': failed to create pipes");
    }
    if (pipe(pipe_out) != 0) {
        close_pair(pipe_in);
        throw McpError(McpErrorKind::connection_error, "MCP server '" + name_ + "': failed to create pipes");
    }
    if (pipe(pipe_err) != 0) {
        close_pair(pipe_in);
        close_pair(pipe_out);
        throw McpError(McpErrorKind::connection_error, "MCP server '" + name_ + "': failed to create pipes");
    }

    pid_t pid = fork();
    if (pid < 0) {
        close_pair(pipe_in);
        close_pair(pipe_out);
        close_pair(pipe_err);
        throw McpError(McpErrorKind::connection_error, "MCP server '" + name_ + "': fork failed");
    }

    if (pid == 0) {
        // Child process
        dup2(pipe_in[0], STDIN_FILENO);
        dup2(pipe_out[1], STDOUT_FILENO);
        dup2(pipe_err[1], STDERR_FILENO);
        close_pair(pipe_in);
        close_pair(pipe_out);
        close_pair(pipe_err);

        for (auto& [k, v] : config_.env) {
            setenv(k.c_str(), v.c_str(), 1);
        }

        std::vector<const char*> argv;
        argv.push_back(config_.command.c_str());
        for (auto& arg : config_.args) argv.push_back(arg.c_str());
        argv.push_back(nullptr);

        execvp(config_.command.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);
    }

    // Parent process
    ::close(pipe_in[0]);
    ::close(pipe_out[1]);
    ::close(pipe_err[1]);
    for (int fd : {pipe_in[1], pipe_out[0], pipe_err[0]}) {
        fcntl(fd, F_SETFD, FD_CLOEXEC);
    }

    child_pid_ = pid;
    stdin_fd_ = pipe_in[1];
    stdout_fd_ = pipe_out[0];
    stderr_fd_ = pipe_err[0];
    log_buffer_ = current_buffer();
    stopping_ = false;
    connected_ = true;

    reader_ = std::thread(&McpConnection::reader_loop, this);
    stderr_reader_ = std::thread(&McpConnection::stderr_loop, this);
}

void McpConnection::close() {
    stopping_ = true;
    connected_ = false;
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (stdin_fd_ >= 0) {
            ::close(stdin_fd_);
            stdin_fd_ = -1;
        }
    }
    reap_child();
    if (reader_.joinable()) reader_.join();
    if (stderr_reader_.joinable()) stderr_reader_.join();
    if (stdout_fd_ >= 0) {
        ::close(stdout_fd_);
        stdout_fd_ = -1;
    }
    if (stderr_fd_ >= 0) {
        ::close(stderr_fd_);
        stderr_fd_ = -1;
    }
    fail_all("connection to MCP server '" + name_ + "' closed");
}

void McpConnection::reap_child() {
    if (child_pid_ <= 0) return;
    int status;
    if (waitpid(child_pid_, &status, WNOHANG) == 0) {
        kill(child_pid_, SIGTERM);
        // Wait up to 3 seconds
        for (int i = 0; i < 30; i++) {
            if (waitpid(child_pid_, &status, WNOHANG) != 0) {
                child_pid_ = -1;
                return;
            }
            usleep(100000);
        }
        kill(child_pid_, SIGKILL);
        waitpid(child_pid_, &status, 0);
    }
    child_pid_ = -1;
}

size_t McpConnection::pending_count() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.size();
}

void McpConnection::write_line(const std::string& json_str) {
    std::string line = json_str + "\n";
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (stdin_fd_ < 0) {
        throw McpError(McpErrorKind::server_disconnected, "MCP server '" + name_ + "' is not connected");
    }
    size_t total = 0;
    while (total < line.size()) {
        ssize_t n = write(stdin_fd_, line.c_str() + total, line.size() - total);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            throw McpError(McpErrorKind::server_disconnected, "MCP server '" + name_ + "': write failed");
        }
        total += static_cast<size_t>(n);
    }
}

nlohmann::json McpConnection::send_request(const std::string& method, const nlohmann::json& params,
                                           const CancelCheck& cancelled,
                                           std::optional<std::chrono::milliseconds> timeout) {
    uint64_t id = next_id_++;
    auto reply = std::make_shared<Reply>();
    auto fut = reply->get_future();
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (!connected_) {
            throw McpError(McpErrorKind::server_disconnected, "MCP server '" + name_ + "' is not connected");
        }
        pending_[id] = reply;
    }
    auto forget = [&] {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_.erase(id);
    };

    nlohmann::json req = {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method}
    };
    if (!params.is_null()) req["params"] = params;

    try {
        write_line(req.dump());
    } catch (const McpError&) {
        forget();
        throw;
    }

    auto start = std::chrono::steady_clock::now();
    while (fut.wait_for(std::chrono::milliseconds(50)) != std::future_status::ready) {
        if (cancelled && cancelled()) {
            forget();
            throw McpError(McpErrorKind::cancelled, "MCP request '" + method + "' cancelled");
        }
        if (timeout && std::chrono::steady_clock::now() - start > *timeout) {
            forget();
            throw McpError(McpErrorKind::timeout, "MCP request '" + method + "' timed out");
        }
    }

    nlohmann::json msg = fut.get();
    if (msg.contains("error") && msg["error"].is_object()) {
        auto& e = msg["error"];
        std::string message = e.contains("message") && e["message"].is_string()
                              ? e["message"].get<std::string>() : "JSON-RPC error";
        int code = e.contains("code") && e["code"].is_number_integer() ? e["code"].get<int>() : 0;
        throw McpError(McpErrorKind::json_rpc_error, message, code);
    }
    if (msg.contains("result")) return msg["result"];
    return nlohmann::json::object();
}

void McpConnection::send_notification(const std::string& method, const nlohmann::json& params) {
    nlohmann::json notif = {
        {"jsonrpc", "2.0"},
        {"method", method}
    };
    if (!params.is_null()) notif["params"] = params;
    write_line(notif.dump());
}

void McpConnection::dispatch(const nlohmann::json& msg) {
    if (!msg.is_object()) return;
    if (msg.contains("method")) {
        // Requests from the server carry an id; notifications are ignored.
        if (msg.contains("id")) answer_server_request(msg);
        return;
    }
    if (!msg.contains("id") || !msg["id"].is_number_integer()) return;
    int64_t raw = msg["id"].get<int64_t>();
    if (raw <= 0) return;

    std::shared_ptr<Reply> reply;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto it = pending_.find(static_cast<uint64_t>(raw));
        if (it == pending_.end()) {
            std::string note = "dropped reply for unknown id " + std::to_string(raw);
            if (log_buffer_) {
                log_buffer_->debug("MCP[" + name_ + "]: " + note);
            } else {
                std::cerr << "[mcp:" << name_ << "] " << note << "\n";
            }
            return;
        }
        reply = it->second;
        pending_.erase(it);
    }
    reply->set_value(msg);
}

void McpConnection::answer_server_request(const nlohmann::json& msg) {
    nlohmann::json resp = {{"jsonrpc", "2.0"}, {"id", msg["id"]}};
    std::string method = msg["method"].is_string() ? msg["method"].get<std::string>() : "";
    if (method == "roots/list") {
        resp["result"] = {{"roots", nlohmann::json::array({
            {{"uri", "file://" + fs::current_path().string()}, {"name", "workspace"}}
        })}};
    } else if (method == "ping") {
        resp["result"] = nlohmann::json::object();
    } else {
        resp["error"] = {{"code", -32601}, {"message", "Method not found: " + method}};
    }
    try {
        write_line(resp.dump());
    } catch (const McpError& e) {
        std::cerr << "[mcp:" << name_ << "] " << e.what() << "\n";
    }
}

void McpConnection::fail_all(const std::string& why) {
    std::map<uint64_t, std::shared_ptr<Reply>> failed;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        failed.swap(pending_);
    }
    for (auto& [id, reply] : failed) {
        reply->set_exception(std::make_exception_ptr(McpError(McpErrorKind::server_disconnected, why)));
    }
}

void McpConnection::reader_loop() {
    std::string buf;
    char chunk[4096];
    struct pollfd pfd;
    pfd.fd = stdout_fd_;
    pfd.events = POLLIN;
    std::string reason = "MCP server '" + name_ + "' disconnected";

    bool done = false;
    while (!done && !stopping_) {
        int ret = poll(&pfd, 1, 100);
        if (ret < 0 && errno == EINTR) continue;
        if (ret < 0) break;
        if (ret == 0) continue;

        ssize_t n = read(stdout_fd_, chunk, sizeof(chunk));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;  // EOF
        buf.append(chunk, static_cast<size_t>(n));

        size_t nl;
        while ((nl = buf.find('\n')) != std::string::npos) {
            std::string line = buf.substr(0, nl);
            buf.erase(0, nl + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (trim(line).empty()) continue;

            nlohmann::json msg;
            try {
                msg = nlohmann::json::parse(line);
            } catch (const nlohmann::json::parse_error&) {
                std::cerr << "[mcp:" << name_ << "] non-JSON output, disconnecting: "
                          << line.substr(0, 200) << "\n";
                reason = "MCP server '" + name_ + "' sent non-JSON output";
                done = true;
                break;
            }
            dispatch(msg);
        }
    }

    connected_ = false;
    fail_all(reason);
}

void McpConnection::stderr_loop() {
    std::string buf;
    char chunk[4096];
    struct pollfd pfd;
    pfd.fd = stderr_fd_;
    pfd.events = POLLIN;

    while (!stopping_) {
        int ret = poll(&pfd, 1, 100);
        if (ret < 0 && errno == EINTR) continue;
        if (ret < 0) break;
        if (ret == 0) continue;

        ssize_t n = read(stderr_fd_, chunk, sizeof(chunk));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        buf.append(chunk, static_cast<size_t>(n));

        size_t nl;
        while ((nl = buf.find('\n')) != std::string::npos) {
            std::string line = buf.substr(0, nl);
            buf.erase(0, nl + 1);
            if (trim(line).empty()) continue;
            if (log_buffer_) {
                log_buffer_->debug("MCP[" + name_ + "]: " + line);
            } else {
                std::cerr << "[mcp:" << name_ << "] " << line << "\n";
            }
        }
    }
}

} // namespace termineer
