#pragma once
#include <atomic>
#include <cstddef>
#include <functional>
#include <string_view>
#include <thread>

namespace mcpbridge {

/// LineReader consumes a file descriptor on a background thread and
/// hands every complete, non-blank line to a callback. A trailing '\r'
/// is stripped. The descriptor is not owned.
class LineReader {
public:
    using LineCallback = std::function<void(std::string_view line)>;
    using CloseCallback = std::function<void()>;

    static constexpr std::size_t DEFAULT_MAX_LINE_BYTES = 16 * 1024 * 1024;

    explicit LineReader(int fd, std::size_t max_line_bytes = DEFAULT_MAX_LINE_BYTES);
    ~LineReader();

    LineReader(const LineReader&) = delete;
    LineReader& operator=(const LineReader&) = delete;

    /// Launch the reader thread. `on_close` runs once on EOF or read
    /// error, but not when the loop was ended by stop().
    void start(LineCallback on_line, CloseCallback on_close = nullptr);

    /// Interrupt a blocked read and join the thread. Idempotent.
    void stop();

    [[nodiscard]] bool is_running() const { return running_; }

private:
    void read_loop(LineCallback on_line, CloseCallback on_close);

    int fd_;
    std::size_t max_line_bytes_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::thread thread_;
    int wakeup_pipe_[2]{-1, -1};  // pipe for interrupting poll()
};

} // namespace mcpbridge
