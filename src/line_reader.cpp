#include "mcpbridge/line_reader.hpp"
#include "mcpbridge/error.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <string>
#include <unistd.h>

namespace mcpbridge {

LineReader::LineReader(int fd, std::size_t max_line_bytes)
    : fd_(fd), max_line_bytes_(max_line_bytes) {
}

LineReader::~LineReader() {
    stop();
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

void LineReader::start(LineCallback on_line, CloseCallback on_close) {
    if (running_.exchange(true)) return;

    if (::pipe2(wakeup_pipe_, O_CLOEXEC) < 0) {
        running_ = false;
        throw TransportError(std::string("Failed to create wakeup pipe: ") + std::strerror(errno));
    }
    int flags = ::fcntl(wakeup_pipe_[1], F_GETFL, 0);
    ::fcntl(wakeup_pipe_[1], F_SETFL, flags | O_NONBLOCK);

    thread_ = std::thread([this, on_line = std::move(on_line), on_close = std::move(on_close)]() mutable {
        read_loop(std::move(on_line), std::move(on_close));
    });
}

void LineReader::stop() {
    stop_requested_ = true;
    if (wakeup_pipe_[1] >= 0) {
        char b = 1;
        ssize_t n = ::write(wakeup_pipe_[1], &b, 1);
        (void)n;  // a full pipe already holds a pending wakeup
    }
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

void LineReader::read_loop(LineCallback on_line, CloseCallback on_close) {
    std::string buffer;
    buffer.reserve(4096);
    bool discarding = false;  // inside an over-long line

    char chunk[4096];
    bool closed = false;

    while (!stop_requested_) {
        struct pollfd fds[2];
        fds[0].fd = fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            spdlog::error("LineReader: poll failed on fd {}: {}", fd_, std::strerror(errno));
            closed = true;
            break;
        }

        if (fds[1].revents & POLLIN) break;

        // POLLHUP without POLLIN still needs a read() to observe EOF
        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            spdlog::error("LineReader: read failed on fd {}: {}", fd_, std::strerror(errno));
            closed = true;
            break;
        }
        if (n == 0) {
            closed = true;
            break;
        }

        buffer.append(chunk, static_cast<std::size_t>(n));

        size_t pos = 0;
        while (true) {
            size_t nl = buffer.find('\n', pos);
            if (nl == std::string::npos) break;

            std::string_view line(buffer.data() + pos, nl - pos);
            pos = nl + 1;

            if (discarding) {
                discarding = false;
                continue;
            }
            if (!line.empty() && line.back() == '\r') {
                line.remove_suffix(1);
            }
            if (line.empty()) continue;

            on_line(line);
        }

        if (pos > 0) {
            buffer.erase(0, pos);
        }
        if (buffer.size() > max_line_bytes_) {
            spdlog::error("LineReader: dropping line longer than {} bytes on fd {}",
                          max_line_bytes_, fd_);
            buffer.clear();
            discarding = true;
        }
    }

    // A final line may arrive without its newline
    if (closed && !discarding && !buffer.empty()) {
        std::string_view line(buffer);
        if (line.back() == '\r') line.remove_suffix(1);
        if (!line.empty()) on_line(line);
    }

    running_ = false;
    if (closed && !stop_requested_ && on_close) {
        on_close();
    }
}

} // namespace mcpbridge
