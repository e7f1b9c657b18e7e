#pragma once
#include "json_rpc.hpp"
#include "line_reader.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace mcpbridge {

/// Correlates requests written to a line-delimited JSON-RPC peer with the
/// responses read back from it.
///
/// One LineReader thread owns the read side. Writers on any thread are
/// serialized so each envelope goes out as one whole line. Every request
/// gets a fresh integer id from a counter that starts at 1; a pending
/// entry (promise/future pair) exists per outstanding id until the caller
/// collects the response, times out, or the peer goes away.
///
/// The descriptors are not owned.
class Correlator {
public:
    using TerminatedCallback = std::function<void()>;

    Correlator(int read_fd, int write_fd);
    ~Correlator();

    Correlator(const Correlator&) = delete;
    Correlator& operator=(const Correlator&) = delete;

    /// Start the reader thread. `on_terminated` runs on the reader thread
    /// after the peer's output closed and every waiter was released.
    void start(TerminatedCallback on_terminated = nullptr);

    /// Stop the reader, fail every pending call and stop using the write
    /// descriptor, which the owner may close afterwards. Idempotent.
    void shutdown();

    /// Write one request and register it. Throws ProcessTerminatedError
    /// when the peer is gone or the write fails.
    [[nodiscard]] RequestId send(const std::string& method,
                                 std::optional<nlohmann::json> params = std::nullopt);

    /// Write a one-way notification (no id, nothing to correlate).
    void notify(const std::string& method,
                std::optional<nlohmann::json> params = std::nullopt);

    /// Block until the response for `id` arrives. Throws TimeoutError
    /// (the entry is dropped, so a late reply is discarded) or
    /// ProcessTerminatedError.
    [[nodiscard]] JsonRpcResponse await_response(const RequestId& id,
                                                 std::chrono::milliseconds timeout);

    /// send() followed by await_response().
    [[nodiscard]] JsonRpcResponse call(const std::string& method,
                                       std::optional<nlohmann::json> params,
                                       std::chrono::milliseconds timeout);

    [[nodiscard]] bool is_alive() const noexcept { return alive_; }
    [[nodiscard]] std::size_t pending_count() const;

    /// Lines dropped by the reader: unparsable, unsolicited, or for an
    /// id nobody is waiting on.
    [[nodiscard]] std::uint64_t discarded_count() const noexcept { return discarded_; }

private:
    struct PendingRequest {
        std::string method;
        std::chrono::steady_clock::time_point created_at;
        std::promise<JsonRpcResponse> promise;
        std::future<JsonRpcResponse> future;
        bool settled{false};
    };

    void on_line(std::string_view line);
    void on_closed();
    void fail_all(const std::string& reason);
    void write_line(const std::string& line);

    int write_fd_;
    LineReader reader_;

    std::atomic<bool> started_{false};
    std::atomic<bool> alive_{false};
    std::atomic<std::uint64_t> discarded_{0};
    TerminatedCallback on_terminated_;

    std::mutex write_mutex_;

    mutable std::mutex pending_mutex_;
    std::map<int64_t, PendingRequest> pending_;
    int64_t next_id_{1};
};

} // namespace mcpbridge
