#include "mcpbridge/correlator.hpp"
#include "mcpbridge/codec.hpp"
#include "mcpbridge/error.hpp"

#include <spdlog/spdlog.h>

#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace mcpbridge {

namespace {

std::string_view preview(std::string_view line) {
    constexpr std::size_t max_len = 200;
    return line.size() > max_len ? line.substr(0, max_len) : line;
}

// Servers are not always strict about the envelope; the id alone decides
// where a reply goes. An error object that does not fit JsonRpcError is
// passed on raw as the data of an internal error.
JsonRpcResponse loose_response(const nlohmann::json& doc, int64_t id) {
    JsonRpcResponse resp;
    resp.id = RequestId{id};
    auto err = doc.find("error");
    if (err != doc.end() && !err->is_null()) {
        try {
            resp.error = err->get<JsonRpcError>();
        } catch (const nlohmann::json::exception&) {
            resp.error = JsonRpcError{error::InternalError, "Internal error", *err};
        }
        return resp;
    }
    auto result = doc.find("result");
    resp.result = result != doc.end() ? *result : nlohmann::json(nullptr);
    return resp;
}

} // anonymous namespace

Correlator::Correlator(int read_fd, int write_fd)
    : write_fd_(write_fd), reader_(read_fd) {
}

Correlator::~Correlator() {
    shutdown();
}

void Correlator::start(TerminatedCallback on_terminated) {
    if (started_.exchange(true)) return;
    on_terminated_ = std::move(on_terminated);
    alive_ = true;
    reader_.start([this](std::string_view line) { on_line(line); },
                  [this]() { on_closed(); });
}

void Correlator::shutdown() {
    reader_.stop();
    fail_all("Connection to MCP server closed");
    // The owner closes the descriptor next and its number may be reused
    std::lock_guard<std::mutex> lock(write_mutex_);
    write_fd_ = -1;
}

RequestId Correlator::send(const std::string& method, std::optional<nlohmann::json> params) {
    int64_t id;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (!alive_) {
            throw ProcessTerminatedError("MCP server process has terminated");
        }
        id = next_id_++;
        auto& entry = pending_[id];
        entry.method = method;
        entry.created_at = std::chrono::steady_clock::now();
        entry.future = entry.promise.get_future();
    }

    JsonRpcRequest req;
    req.id = RequestId{id};
    req.method = method;
    req.params = std::move(params);

    try {
        write_line(Codec::serialize(req));
    } catch (const ProcessTerminatedError&) {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_.erase(id);
        throw;
    }
    spdlog::debug("-> {} (id {})", method, id);
    return RequestId{id};
}

void Correlator::notify(const std::string& method, std::optional<nlohmann::json> params) {
    if (!alive_) {
        throw ProcessTerminatedError("MCP server process has terminated");
    }
    JsonRpcNotification notif;
    notif.method = method;
    notif.params = std::move(params);
    write_line(Codec::serialize(notif));
    spdlog::debug("-> {} (notification)", method);
}

void Correlator::write_line(const std::string& line) {
    std::string data = line;
    data += '\n';

    // One whole envelope per lock hold; concurrent writers never interleave.
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (write_fd_ < 0 || !alive_) {
        throw ProcessTerminatedError("MCP server stdin is closed");
    }
    const char* p = data.data();
    size_t remaining = data.size();
    while (remaining > 0) {
        ssize_t written = ::write(write_fd_, p, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            throw ProcessTerminatedError(std::string("MCP server process closed stdin pipe: ")
                                         + std::strerror(errno));
        }
        p += written;
        remaining -= static_cast<size_t>(written);
    }
}

JsonRpcResponse Correlator::await_response(const RequestId& id, std::chrono::milliseconds timeout) {
    const auto* key = std::get_if<int64_t>(&id);
    if (!key) {
        throw BridgeError("Request ids issued by the correlator are integers");
    }

    std::future<JsonRpcResponse> fut;
    std::string method;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto it = pending_.find(*key);
        if (it == pending_.end()) {
            if (!alive_) throw ProcessTerminatedError("MCP server process has terminated");
            throw BridgeError("No pending request with id " + std::to_string(*key));
        }
        if (!it->second.future.valid()) {
            throw BridgeError("Request " + std::to_string(*key) + " is already being awaited");
        }
        fut = std::move(it->second.future);
        method = it->second.method;
    }

    if (fut.wait_for(timeout) == std::future_status::timeout) {
        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            pending_.erase(*key);
        }
        spdlog::warn("Request {} ({}) timed out after {} ms", *key, method, timeout.count());
        throw TimeoutError("No response received for message " + std::to_string(*key)
                           + " (" + method + ")");
    }

    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_.erase(*key);
    }
    return fut.get();
}

JsonRpcResponse Correlator::call(const std::string& method, std::optional<nlohmann::json> params,
                                 std::chrono::milliseconds timeout) {
    auto id = send(method, std::move(params));
    return await_response(id, timeout);
}

std::size_t Correlator::pending_count() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.size();
}

void Correlator::on_line(std::string_view line) {
    nlohmann::json doc;
    try {
        doc = Codec::parse_value(line);
    } catch (const ParseError& e) {
        ++discarded_;
        spdlog::warn("Discarding malformed line from MCP server: {} ({})", preview(line), e.what());
        return;
    }

    if (!doc.is_object()) {
        ++discarded_;
        spdlog::warn("Discarding non-object line from MCP server: {}", preview(line));
        return;
    }
    if (auto method = doc.find("method"); method != doc.end()) {
        ++discarded_;
        spdlog::debug("Ignoring {} from MCP server: {}",
                      doc.contains("id") ? "request" : "notification",
                      method->is_string() ? method->get<std::string>() : method->dump());
        return;
    }

    auto id = doc.find("id");
    if (id == doc.end() || !id->is_number_integer()) {
        ++discarded_;
        spdlog::debug("Received response without a usable id: {}", preview(line));
        return;
    }
    const auto key = id->get<int64_t>();

    std::lock_guard<std::mutex> lock(pending_mutex_);
    auto it = pending_.find(key);
    if (it == pending_.end() || it->second.settled) {
        ++discarded_;
        spdlog::debug("Received response for unknown message ID: {}", preview(line));
        return;
    }
    it->second.settled = true;
    it->second.promise.set_value(loose_response(doc, key));
    spdlog::debug("<- {} (id {})", it->second.method, it->first);
}

void Correlator::on_closed() {
    spdlog::warn("MCP server closed its output stream");
    fail_all("MCP server process terminated before response received");
    if (on_terminated_) on_terminated_();
}

void Correlator::fail_all(const std::string& reason) {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    alive_ = false;
    std::size_t released = 0;
    for (auto& [id, entry] : pending_) {
        if (entry.settled) continue;
        entry.settled = true;
        entry.promise.set_exception(std::make_exception_ptr(ProcessTerminatedError(reason)));
        ++released;
    }
    if (released > 0) {
        spdlog::warn("Released {} pending request(s): {}", released, reason);
    }
}

} // namespace mcpbridge
