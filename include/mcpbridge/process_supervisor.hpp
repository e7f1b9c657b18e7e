#pragma once
#include "line_reader.hpp"
#include <sys/types.h>
#include <chrono>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcpbridge {

/// Owns one subprocess: spawn with piped stdin/stdout/stderr, liveness
/// polling, graceful-then-forced termination.
///
/// stdout is handed out as a raw descriptor for the Correlator to read;
/// stderr is drained internally, logged, and kept in a short history
/// for diagnostics. It is never parsed as protocol data.
class ProcessSupervisor {
public:
    struct Options {
        std::vector<std::string> command;                 // program + arguments
        std::chrono::milliseconds startup_probe{100};     // wait before the "exited immediately" check
        std::chrono::milliseconds stop_grace{5000};       // SIGTERM -> SIGKILL delay
        std::size_t stderr_history = 50;                  // lines kept for recent_stderr()
    };

    explicit ProcessSupervisor(Options opts);
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    /// Spawn the subprocess. Throws StartupError if spawning fails or the
    /// process is gone by the end of the startup probe.
    void start();

    /// Close stdin, SIGTERM, wait up to the grace period, then SIGKILL.
    /// Closes every pipe. Idempotent. Anything reading stdout_fd() must
    /// be stopped first.
    void stop();

    /// Polls the child without blocking.
    [[nodiscard]] bool is_running() const;

    /// Exit code, or 128 + signal number. Empty while running.
    [[nodiscard]] std::optional<int> exit_status() const;

    [[nodiscard]] pid_t pid() const { return pid_; }
    [[nodiscard]] int stdin_fd() const { return stdin_fd_; }
    [[nodiscard]] int stdout_fd() const { return stdout_fd_; }

    [[nodiscard]] std::vector<std::string> recent_stderr() const;

    [[nodiscard]] const Options& options() const { return opts_; }

private:
    bool reap(bool block) const;
    void record_stderr(std::string_view line);

    Options opts_;
    pid_t pid_{-1};
    int stdin_fd_{-1};
    int stdout_fd_{-1};
    int stderr_fd_{-1};

    std::mutex lifecycle_mutex_;
    bool started_{false};
    bool stopped_{false};

    mutable std::mutex status_mutex_;
    mutable bool exited_{false};
    mutable std::optional<int> exit_status_;

    std::unique_ptr<LineReader> stderr_reader_;
    mutable std::mutex stderr_mutex_;
    std::deque<std::string> stderr_lines_;
};

} // namespace mcpbridge
