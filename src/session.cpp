#include "mcpbridge/session.hpp"

#include <spdlog/spdlog.h>

#include <iomanip>
#include <cstdint>
#include <random>
#include <sstream>
#include <utility>
#include <vector>

namespace mcpbridge {

// ---------- DeliveryQueue ----------

bool DeliveryQueue::push(nlohmann::json message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == State::Closed) return false;
        items_.push_back(std::move(message));
    }
    cv_.notify_one();
    return true;
}

void DeliveryQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = State::Closed;
    }
    cv_.notify_all();
}

DeliveryQueue::Item DeliveryQueue::wait_next(std::chrono::milliseconds keepalive) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (state_ == State::Created) state_ = State::Active;

    bool ready = cv_.wait_for(lock, keepalive, [this] {
        return !items_.empty() || state_ == State::Closed;
    });

    Item item;
    if (!items_.empty()) {
        item.kind = Item::Kind::Message;
        item.payload = std::move(items_.front());
        items_.pop_front();
    } else if (!ready) {
        item.kind = Item::Kind::Heartbeat;
        item.payload = make_heartbeat();
    }
    return item;
}

DeliveryQueue::State DeliveryQueue::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::size_t DeliveryQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

nlohmann::json DeliveryQueue::make_heartbeat() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return {{"type", "heartbeat"},
            {"timestamp", std::chrono::duration_cast<std::chrono::seconds>(now).count()}};
}

// ---------- SessionManager ----------

SessionManager::~SessionManager() {
    clear();
}

std::string SessionManager::generate_id() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;
    uint64_t a = dis(gen), b = dis(gen);
    a = (a & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
    b = (b & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    oss << std::setw(8)  << (a >> 32);
    oss << "-" << std::setw(4) << ((a >> 16) & 0xFFFF);
    oss << "-" << std::setw(4) << (a & 0xFFFF);
    oss << "-" << std::setw(4) << (b >> 48);
    oss << "-" << std::setw(12) << (b & 0xFFFFFFFFFFFFull);
    return oss.str();
}

std::string SessionManager::ensure(const std::optional<std::string>& id) {
    std::string key = (id && !id->empty()) ? *id : generate_id();
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = sessions_.try_emplace(key);
    if (inserted) {
        it->second.id = key;
        spdlog::debug("Session {} created", key);
    }
    it->second.last_activity = std::chrono::steady_clock::now();
    return key;
}

bool SessionManager::exists(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.count(id) > 0;
}

std::shared_ptr<DeliveryQueue> SessionManager::open_stream(const std::string& id) {
    auto queue = std::make_shared<DeliveryQueue>();
    std::shared_ptr<DeliveryQueue> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& rec = sessions_[id];
        rec.id = id;
        rec.last_activity = std::chrono::steady_clock::now();
        previous = std::exchange(rec.stream, queue);
    }
    if (previous) {
        spdlog::info("Session {}: stream replaced", id);
        previous->close();
    }
    return queue;
}

void SessionManager::close_stream(const std::string& id,
                                  const std::shared_ptr<DeliveryQueue>& queue) {
    if (queue) queue->close();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end() || it->second.stream != queue) return;
    it->second.stream.reset();
    it->second.last_activity = std::chrono::steady_clock::now();
    spdlog::debug("Session {}: stream closed", id);
}

bool SessionManager::deliver(const std::string& id, nlohmann::json message) {
    std::shared_ptr<DeliveryQueue> queue;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end() || !it->second.stream) return false;
        queue = it->second.stream;
    }
    return queue->push(std::move(message));
}

bool SessionManager::has_stream(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    return it != sessions_.end() && it->second.stream
        && it->second.stream->state() != DeliveryQueue::State::Closed;
}

void SessionManager::set_init_metadata(const std::string& id,
                                       nlohmann::json client_info,
                                       nlohmann::json client_capabilities,
                                       std::string protocol_version) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& rec = sessions_[id];
    rec.id = id;
    rec.client_info = std::move(client_info);
    rec.client_capabilities = std::move(client_capabilities);
    rec.protocol_version = std::move(protocol_version);
    rec.last_activity = std::chrono::steady_clock::now();
}

void SessionManager::mark_initialized(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it != sessions_.end()) it->second.initialized = true;
}

std::optional<SessionRecord> SessionManager::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return std::nullopt;
    return it->second;
}

std::size_t SessionManager::expire_idle(std::chrono::milliseconds idle) {
    auto cutoff = std::chrono::steady_clock::now() - idle;
    std::size_t removed = 0;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end(); ) {
        const auto& rec = it->second;
        bool streaming = rec.stream && rec.stream->state() != DeliveryQueue::State::Closed;
        if (!streaming && rec.last_activity < cutoff) {
            spdlog::debug("Session {} expired", it->first);
            it = sessions_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

bool SessionManager::erase(const std::string& id) {
    std::shared_ptr<DeliveryQueue> queue;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) return false;
        queue = std::move(it->second.stream);
        sessions_.erase(it);
    }
    if (queue) queue->close();
    spdlog::info("Session {} ended", id);
    return true;
}

void SessionManager::clear() {
    std::vector<std::shared_ptr<DeliveryQueue>> queues;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, rec] : sessions_) {
            if (rec.stream) queues.push_back(std::move(rec.stream));
        }
        sessions_.clear();
    }
    for (auto& q : queues) q->close();
}

std::size_t SessionManager::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

} // namespace mcpbridge
