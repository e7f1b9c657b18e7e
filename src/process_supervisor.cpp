#include "mcpbridge/process_supervisor.hpp"
#include "mcpbridge/error.hpp"

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <sstream>
#include <thread>

namespace mcpbridge {

namespace {

// Writes to a dead child must surface as EPIPE instead of killing us.
void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

std::string join_command(const std::vector<std::string>& command) {
    std::ostringstream oss;
    for (size_t i = 0; i < command.size(); ++i) {
        if (i) oss << ' ';
        oss << command[i];
    }
    return oss.str();
}

// Read whatever is left in a pipe whose writer has exited.
std::string drain_fd(int fd, std::chrono::milliseconds budget) {
    std::string out;
    if (fd < 0) return out;
    auto deadline = std::chrono::steady_clock::now() + budget;
    char chunk[4096];
    while (std::chrono::steady_clock::now() < deadline && out.size() < 64 * 1024) {
        struct pollfd pfd{fd, POLLIN, 0};
        int ret = ::poll(&pfd, 1, 50);
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ret == 0) break;
        ssize_t n = ::read(fd, chunk, sizeof(chunk));
        if (n <= 0) break;
        out.append(chunk, static_cast<size_t>(n));
    }
    return out;
}

} // anonymous namespace

ProcessSupervisor::ProcessSupervisor(Options opts)
    : opts_(std::move(opts)) {
}

ProcessSupervisor::~ProcessSupervisor() {
    stop();
}

void ProcessSupervisor::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (started_) return;
    if (opts_.command.empty()) {
        throw StartupError("No MCP server command configured");
    }

    ignore_sigpipe();

    int in_pipe[2]{-1, -1}, out_pipe[2]{-1, -1}, err_pipe[2]{-1, -1};
    if (::pipe2(in_pipe, O_CLOEXEC) < 0 || ::pipe2(out_pipe, O_CLOEXEC) < 0
        || ::pipe2(err_pipe, O_CLOEXEC) < 0) {
        int saved = errno;
        for (int* p : {in_pipe, out_pipe, err_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        throw StartupError(std::string("Failed to create pipes: ") + std::strerror(saved));
    }

    // Build argv before forking; the child only calls async-signal-safe functions.
    std::vector<std::string> args = opts_.command;
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        int saved = errno;
        for (int* p : {in_pipe, out_pipe, err_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        throw StartupError(std::string("Failed to fork process: ") + std::strerror(saved));
    }
    if (pid == 0) {
        // Child: dup2() clears FD_CLOEXEC on the standard descriptors
        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);

        ::execvp(argv[0], argv.data());

        static const char msg[] = "execvp failed\n";
        ssize_t n = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)n;
        ::_exit(127);
    }

    // Parent
    ::close(in_pipe[0]);
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    pid_ = pid;
    stdin_fd_ = in_pipe[1];
    stdout_fd_ = out_pipe[0];
    stderr_fd_ = err_pipe[0];
    started_ = true;

    std::this_thread::sleep_for(opts_.startup_probe);
    if (reap(false)) {
        std::string out = drain_fd(stdout_fd_, std::chrono::milliseconds(200));
        std::string err = drain_fd(stderr_fd_, std::chrono::milliseconds(200));
        stopped_ = true;
        close_fd(stdin_fd_);
        close_fd(stdout_fd_);
        close_fd(stderr_fd_);

        std::ostringstream oss;
        oss << "Process exited immediately. Exit code: "
            << exit_status().value_or(-1)
            << "\nSTDOUT: " << (out.empty() ? "No stdout" : out)
            << "\nSTDERR: " << (err.empty() ? "No stderr" : err);
        spdlog::error("Failed to start MCP server '{}': {}", join_command(opts_.command), oss.str());
        throw StartupError(oss.str());
    }

    stderr_reader_ = std::make_unique<LineReader>(stderr_fd_);
    stderr_reader_->start([this](std::string_view line) { record_stderr(line); });

    spdlog::info("Started MCP server (pid {}): {}", pid_, join_command(opts_.command));
}

void ProcessSupervisor::record_stderr(std::string_view line) {
    spdlog::debug("[upstream {}] {}", pid_, line);
    std::lock_guard<std::mutex> lock(stderr_mutex_);
    stderr_lines_.emplace_back(line);
    while (stderr_lines_.size() > opts_.stderr_history) {
        stderr_lines_.pop_front();
    }
}

void ProcessSupervisor::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!started_ || stopped_) return;
    stopped_ = true;

    // EOF on stdin is the polite request to exit
    close_fd(stdin_fd_);

    if (!reap(false)) {
        ::kill(pid_, SIGTERM);
        auto deadline = std::chrono::steady_clock::now() + opts_.stop_grace;
        while (!reap(false) && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        if (!reap(false)) {
            spdlog::warn("MCP server (pid {}) did not terminate gracefully, forcing kill", pid_);
            ::kill(pid_, SIGKILL);
            reap(true);
        }
    }

    if (stderr_reader_) stderr_reader_->stop();
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);

    spdlog::info("MCP server (pid {}) stopped, exit status {}", pid_, exit_status().value_or(-1));
}

bool ProcessSupervisor::reap(bool block) const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    if (exited_) return true;
    if (pid_ <= 0) return false;

    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (r < 0 && errno == EINTR);

    if (r == 0) return false;
    exited_ = true;
    if (r == pid_) {
        if (WIFEXITED(status)) {
            exit_status_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_status_ = 128 + WTERMSIG(status);
        }
    }
    return true;
}

bool ProcessSupervisor::is_running() const {
    return pid_ > 0 && !reap(false);
}

std::optional<int> ProcessSupervisor::exit_status() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return exit_status_;
}

std::vector<std::string> ProcessSupervisor::recent_stderr() const {
    std::lock_guard<std::mutex> lock(stderr_mutex_);
    return {stderr_lines_.begin(), stderr_lines_.end()};
}

} // namespace mcpbridge
