#pragma once
#include "mcp_config.hpp"
#include "error.hpp"
#include "../buffer.hpp"
#include <string>
#include <map>
#include <memory>
#include <mutex>
#include <atomic>
#include <thread>
#include <future>
#include <functional>
#include <optional>
#include <chrono>
#include <nlohmann/json.hpp>
#include <unistd.h>
#include <sys/types.h>

namespace termineer {

// Polled while a request is outstanding; returning true abandons it.
using CancelCheck = std::function<bool()>;

// JSON-RPC 2.0 over a child process's stdio, one message per line.
// A reader thread resolves pending requests by id, so overlapping
// requests may complete in any order.
class McpConnection {
public:
    McpConnection(std::string name, McpServerConfig cfg);
    ~McpConnection();

    McpConnection(const McpConnection&) = delete;
    McpConnection& operator=(const McpConnection&) = delete;

    // Spawns the server. Throws McpError(connection_error).
    void connect();
    // Closes stdin, SIGTERM, SIGKILL after 3s; fails pending requests.
    void close();

    // Blocks for the reply's "result". Throws McpError: json_rpc_error for an
    // error reply, server_disconnected, cancelled, timeout.
    nlohmann::json send_request(const std::string& method, const nlohmann::json& params,
                                const CancelCheck& cancelled = nullptr,
                                std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    void send_notification(const std::string& method, const nlohmann::json& params = nullptr);

    bool connected() const { return connected_; }
    const std::string& name() const { return name_; }
    size_t pending_count() const;

private:
    using Reply = std::promise<nlohmann::json>;

    std::string name_;
    McpServerConfig config_;
    std::atomic<bool> connected_{false};
    std::atomic<bool> stopping_{false};
    std::atomic<uint64_t> next_id_{1};

    pid_t child_pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;

    std::thread reader_;
    std::thread stderr_reader_;
    BufferPtr log_buffer_;

    mutable std::mutex pending_mutex_;
    std::map<uint64_t, std::shared_ptr<Reply>> pending_;
    std::mutex write_mutex_;

    void write_line(const std::string& line);
    void reader_loop();
    void stderr_loop();
    void dispatch(const nlohmann::json& msg);
    void answer_server_request(const nlohmann::json& msg);
    void fail_all(const std::string& why);
    void reap_child();
};

} // namespace termineer
