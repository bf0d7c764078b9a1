#include "builtin_tools.hpp"
#include "../interrupt_coordinator.hpp"
#include "../buffer.hpp"
#include <cerrno>
#include <csignal>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace termineer {

std::string clip_middle(const std::string& text, size_t max_chars) {
    if (text.size() <= max_chars) return text;
    size_t half = max_chars / 2;
    size_t omitted = text.size() - 2 * half;
    return text.substr(0, half) + "\n...[" + std::to_string(omitted) + " characters truncated]...\n" +
           text.substr(text.size() - half);
}

static void emit_lines(std::string& pending, std::string& all, const char* data, size_t n, bool silent) {
    all.append(data, n);
    if (silent) return;
    pending.append(data, n);
    size_t nl;
    while ((nl = pending.find('\n')) != std::string::npos) {
        out::tool("shell", pending.substr(0, nl));
        pending.erase(0, nl + 1);
    }
}

static int wait_exit_code(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

ShellOutcome run_shell(const std::string& command, const fs::path& workdir,
                       InterruptCoordinator* interrupts, bool silent) {
    ShellOutcome result;

    int pipe_out[2];
    if (pipe(pipe_out) != 0) {
        result.output = "Failed to create pipe";
        return result;
    }

    ToolInterruptScope scope(interrupts);

    pid_t pid = fork();
    if (pid < 0) {
        ::close(pipe_out[0]);
        ::close(pipe_out[1]);
        result.output = "Failed to start shell";
        return result;
    }

    if (pid == 0) {
        // Own process group so an interrupt reaches the whole pipeline.
        setpgid(0, 0);
        dup2(pipe_out[1], STDOUT_FILENO);
        dup2(pipe_out[1], STDERR_FILENO);
        ::close(pipe_out[0]);
        ::close(pipe_out[1]);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        if (!workdir.empty() && chdir(workdir.c_str()) != 0) _exit(126);
        execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    ::close(pipe_out[1]);
    int fd = pipe_out[0];
    fcntl(fd, F_SETFD, FD_CLOEXEC);

    std::string pending;
    char chunk[4096];
    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN;
    bool eof = false;
    int status = 0;
    bool reaped = false;

    while (!eof) {
        if (auto sig = scope.poll()) {
            result.interrupted = true;
            result.interrupt_reason = sig->reason_or_default();
            kill(-pid, SIGTERM);
            kill(pid, SIGTERM);
            for (int i = 0; i < 20; i++) {
                if (waitpid(pid, &status, WNOHANG) == pid) {
                    reaped = true;
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            if (!reaped) {
                kill(-pid, SIGKILL);
                kill(pid, SIGKILL);
            }
            break;
        }

        int ret = poll(&pfd, 1, 10);
        if (ret < 0 && errno == EINTR) continue;
        if (ret < 0) break;
        if (ret == 0) continue;

        ssize_t n = read(fd, chunk, sizeof(chunk));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            eof = true;
            break;
        }
        emit_lines(pending, result.output, chunk, static_cast<size_t>(n), silent);
    }

    if (!silent && !pending.empty()) out::tool("shell", pending);
    ::close(fd);

    if (!reaped) {
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    }
    result.exit_code = wait_exit_code(status);
    return result;
}

void register_shell_tool(ToolRegistry& reg) {
    ToolDef def;
    def.name = "shell";
    def.description = "Run a shell command (body, or args when the body is empty) in the working directory.";
    def.readonly_safe = true;
    def.interruptible = true;

    def.func = [](const std::string& args, const std::string& body, ToolContext& ctx) -> ToolResult {
        std::string command = trim(body).empty() ? trim(args) : body;
        if (trim(command).empty()) {
            return ToolResult::error(ToolErrorKind::bad_invocation, "No command provided");
        }

        if (!ctx.silent) out::tool("shell", "$ " + trim(command));
        auto outcome = run_shell(command, ctx.workdir, ctx.interrupts, ctx.silent);
        std::string output = clip_middle(outcome.output, MAX_SHELL_OUTPUT);
        if (!output.empty() && output.back() != '\n') output += "\n";

        if (outcome.interrupted) {
            auto r = ToolResult::ok(output + "(interrupted)\n[COMMAND INTERRUPTED: " +
                                    outcome.interrupt_reason + "]");
            r.exit_code = outcome.exit_code;
            r.interrupted = true;
            return r;
        }
        if (outcome.exit_code != 0) {
            return ToolResult::failed(output + "[COMMAND FAILED WITH EXIT CODE " +
                                      std::to_string(outcome.exit_code) + "]", outcome.exit_code);
        }
        auto r = ToolResult::ok(output + "[COMMAND COMPLETED SUCCESSFULLY]");
        r.exit_code = 0;
        return r;
    };

    reg.register_tool(std::move(def));
}

} // namespace termineer
