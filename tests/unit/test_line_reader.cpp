#include <gtest/gtest.h>
#include "mcpbridge/line_reader.hpp"
#include <unistd.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace mcpbridge;

namespace {

class Pipe {
public:
    Pipe() {
        if (pipe(fds_) < 0) throw std::runtime_error("pipe failed");
    }
    ~Pipe() {
        close_write();
        if (fds_[0] >= 0) close(fds_[0]);
    }
    int read_fd() const { return fds_[0]; }
    void write(const std::string& s) {
        ssize_t n = ::write(fds_[1], s.data(), s.size());
        ASSERT_EQ(n, static_cast<ssize_t>(s.size()));
    }
    void close_write() {
        if (fds_[1] >= 0) { close(fds_[1]); fds_[1] = -1; }
    }

private:
    int fds_[2];
};

struct Collector {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::string> lines;
    bool closed = false;

    LineReader::LineCallback on_line() {
        return [this](std::string_view line) {
            std::lock_guard<std::mutex> lock(mutex);
            lines.emplace_back(line);
            cv.notify_all();
        };
    }
    LineReader::CloseCallback on_close() {
        return [this]() {
            std::lock_guard<std::mutex> lock(mutex);
            closed = true;
            cv.notify_all();
        };
    }
    bool wait_lines(size_t n) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, std::chrono::seconds(5), [&] { return lines.size() >= n; });
    }
    bool wait_closed() {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, std::chrono::seconds(5), [&] { return closed; });
    }
};

} // namespace

TEST(LineReader, SplitsLinesAcrossWrites) {
    Pipe p;
    Collector c;
    LineReader reader(p.read_fd());
    reader.start(c.on_line(), c.on_close());

    p.write("{\"a\":1}\n{\"b\"");
    p.write(":2}\n");
    ASSERT_TRUE(c.wait_lines(2));
    EXPECT_EQ(c.lines[0], "{\"a\":1}");
    EXPECT_EQ(c.lines[1], "{\"b\":2}");
    reader.stop();
}

TEST(LineReader, StripsCarriageReturnAndSkipsBlankLines) {
    Pipe p;
    Collector c;
    LineReader reader(p.read_fd());
    reader.start(c.on_line(), c.on_close());

    p.write("one\r\n\n\r\ntwo\n");
    ASSERT_TRUE(c.wait_lines(2));
    EXPECT_EQ(c.lines[0], "one");
    EXPECT_EQ(c.lines[1], "two");
    reader.stop();
    EXPECT_EQ(c.lines.size(), 2u);
}

TEST(LineReader, EofFlushesFinalLineAndReportsClose) {
    Pipe p;
    Collector c;
    LineReader reader(p.read_fd());
    reader.start(c.on_line(), c.on_close());

    p.write("first\nlast-without-newline");
    p.close_write();
    ASSERT_TRUE(c.wait_closed());
    ASSERT_EQ(c.lines.size(), 2u);
    EXPECT_EQ(c.lines[1], "last-without-newline");
    reader.stop();
}

TEST(LineReader, StopDoesNotReportClose) {
    Pipe p;
    Collector c;
    LineReader reader(p.read_fd());
    reader.start(c.on_line(), c.on_close());

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    reader.stop();
    EXPECT_FALSE(reader.is_running());
    EXPECT_FALSE(c.closed);
    reader.stop();  // idempotent
}

TEST(LineReader, DropsOverlongLine) {
    Pipe p;
    Collector c;
    LineReader reader(p.read_fd(), 64);
    reader.start(c.on_line(), c.on_close());

    p.write(std::string(200, 'x') + "\nshort\n");
    ASSERT_TRUE(c.wait_lines(1));
    reader.stop();
    ASSERT_EQ(c.lines.size(), 1u);
    EXPECT_EQ(c.lines[0], "short");
}
