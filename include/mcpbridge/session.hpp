#pragma once
#include <nlohmann/json.hpp>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace mcpbridge {

/// Per-session queue feeding one push stream.
///
/// Producers push from request threads; the single consumer (the stream's
/// HTTP worker) blocks in wait_next(). Once closed, a queue stays closed.
class DeliveryQueue {
public:
    enum class State {
        Created,    // registered, no consumer yet
        Active,     // a consumer has started reading
        Closed      // replaced, ended or disconnected
    };

    struct Item {
        enum class Kind { Message, Heartbeat, Closed };
        Kind kind{Kind::Closed};
        nlohmann::json payload;
    };

    /// False if the queue is already closed.
    bool push(nlohmann::json message);

    /// Wake the consumer and refuse further pushes. Idempotent.
    void close();

    /// Next queued message, a heartbeat if nothing arrives within
    /// `keepalive`, or Closed. Queued messages drain before Closed.
    [[nodiscard]] Item wait_next(std::chrono::milliseconds keepalive);

    [[nodiscard]] State state() const;
    [[nodiscard]] std::size_t size() const;

    [[nodiscard]] static nlohmann::json make_heartbeat();

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<nlohmann::json> items_;
    State state_{State::Created};
};

/// What the bridge knows about one external client.
struct SessionRecord {
    std::string id;
    std::shared_ptr<DeliveryQueue> stream;
    nlohmann::json client_info = nlohmann::json::object();
    nlohmann::json client_capabilities = nlohmann::json::object();
    std::string protocol_version;
    bool initialized{false};
    std::chrono::steady_clock::time_point last_activity;
};

/// Session table: id -> record, with at most one push stream per session.
class SessionManager {
public:
    SessionManager() = default;
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /// Look up `id` or create the record (minting an id when empty).
    /// Refreshes the activity time. Returns the session id.
    std::string ensure(const std::optional<std::string>& id);

    [[nodiscard]] bool exists(const std::string& id) const;

    /// Register a fresh queue for the session, closing any previous one.
    std::shared_ptr<DeliveryQueue> open_stream(const std::string& id);

    /// Drop `queue` if it is still the session's registered queue.
    void close_stream(const std::string& id, const std::shared_ptr<DeliveryQueue>& queue);

    /// Push onto the session's stream. False if it has none.
    bool deliver(const std::string& id, nlohmann::json message);

    [[nodiscard]] bool has_stream(const std::string& id) const;

    void set_init_metadata(const std::string& id,
                           nlohmann::json client_info,
                           nlohmann::json client_capabilities,
                           std::string protocol_version);
    void mark_initialized(const std::string& id);

    /// Snapshot of one record.
    [[nodiscard]] std::optional<SessionRecord> find(const std::string& id) const;

    /// Remove sessions with no stream and no activity for `idle`.
    /// Returns how many were removed.
    std::size_t expire_idle(std::chrono::milliseconds idle);

    /// End a session, closing its stream. False if unknown.
    bool erase(const std::string& id);

    /// Close every stream and forget every session.
    void clear();

    [[nodiscard]] std::size_t size() const;

    /// Random UUID v4.
    [[nodiscard]] static std::string generate_id();

private:
    mutable std::mutex mutex_;
    std::map<std::string, SessionRecord> sessions_;
};

} // namespace mcpbridge
