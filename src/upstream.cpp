#include "mcpbridge/upstream.hpp"
#include "mcpbridge/correlator.hpp"
#include "mcpbridge/error.hpp"
#include "mcpbridge/version.hpp"

#include <spdlog/spdlog.h>

#include <set>

namespace mcpbridge {

namespace detail {

/// One spawned subprocess and the correlator speaking to it.
struct UpstreamConnection {
    ProcessSupervisor supervisor;
    std::unique_ptr<Correlator> correlator;

    explicit UpstreamConnection(ProcessSupervisor::Options opts)
        : supervisor(std::move(opts)) {}

    ~UpstreamConnection() { close(); }

    void open() {
        supervisor.start();
        correlator = std::make_unique<Correlator>(supervisor.stdout_fd(), supervisor.stdin_fd());
        pid_t pid = supervisor.pid();
        correlator->start([pid]() {
            spdlog::error("MCP server process {} is gone", pid);
        });
    }

    // The reader must stop before the supervisor closes the pipes.
    void close() {
        if (correlator) correlator->shutdown();
        supervisor.stop();
    }

    bool alive() const {
        return correlator && correlator->is_alive() && supervisor.is_running();
    }
};

} // namespace detail

namespace {

using detail::UpstreamConnection;

constexpr int max_list_pages = 1000;

std::string stderr_tail(const ProcessSupervisor& supervisor) {
    std::string out;
    for (const auto& line : supervisor.recent_stderr()) {
        out += line;
        out += '\n';
    }
    return out;
}

/// initialize + notifications/initialized. Returns the initialize result.
nlohmann::json handshake(UpstreamConnection& conn, std::chrono::milliseconds timeout) {
    nlohmann::json params = {
        {"protocolVersion", std::string(PROTOCOL_VERSION)},
        {"capabilities", nlohmann::json::object()},
        {"clientInfo", {{"name", std::string(BRIDGE_NAME)}, {"version", std::string(BRIDGE_VERSION)}}}
    };

    JsonRpcResponse resp;
    try {
        resp = conn.correlator->call("initialize", params, timeout);
    } catch (const BridgeError& e) {
        std::string msg = std::string("MCP server initialization failed: ") + e.what();
        auto tail = stderr_tail(conn.supervisor);
        if (!tail.empty()) msg += "\nSTDERR: " + tail;
        throw StartupError(msg);
    }
    if (resp.error) {
        throw StartupError("MCP server rejected initialize: " + nlohmann::json(*resp.error).dump());
    }

    try {
        conn.correlator->notify("notifications/initialized");
    } catch (const ProcessTerminatedError& e) {
        throw StartupError(std::string("MCP server exited during initialization: ") + e.what());
    }
    return resp.result.value_or(nlohmann::json::object());
}

/// Collect every page of a */list method. A server that answers with an
/// error simply does not offer that kind of capability.
nlohmann::json load_list(UpstreamConnection& conn, const std::string& method,
                         const std::string& key, std::chrono::milliseconds timeout) {
    auto items = nlohmann::json::array();
    std::optional<std::string> cursor;
    std::set<std::string> seen_cursors;

    for (int page = 0; page < max_list_pages; ++page) {
        nlohmann::json params = nlohmann::json::object();
        if (cursor) params["cursor"] = *cursor;

        JsonRpcResponse resp;
        try {
            resp = conn.correlator->call(method, params, timeout);
        } catch (const TimeoutError& e) {
            spdlog::warn("{} timed out during capability load: {}", method, e.what());
            return items;
        } catch (const ProcessTerminatedError& e) {
            throw StartupError(std::string("MCP server exited while loading capabilities: ")
                               + e.what() + "\nSTDERR: " + stderr_tail(conn.supervisor));
        }

        if (resp.error) {
            spdlog::info("MCP server does not provide {}: {}", method, resp.error->message);
            return items;
        }
        if (!resp.result || !resp.result->is_object()) return items;

        const auto& result = *resp.result;
        if (result.contains(key) && result[key].is_array()) {
            for (const auto& item : result[key]) items.push_back(item);
        }

        auto next = result.find("nextCursor");
        if (next == result.end() || !next->is_string()) return items;
        std::string c = next->get<std::string>();
        if (c.empty() || !seen_cursors.insert(c).second) return items;
        cursor = std::move(c);
    }
    spdlog::warn("{} returned more than {} pages; truncating", method, max_list_pages);
    return items;
}

std::shared_ptr<const CapabilityCache> load_capabilities(UpstreamConnection& conn,
                                                         std::chrono::milliseconds timeout) {
    auto cache = std::make_shared<CapabilityCache>();
    cache->tools = load_list(conn, "tools/list", "tools", timeout);
    cache->prompts = load_list(conn, "prompts/list", "prompts", timeout);
    cache->resources = load_list(conn, "resources/list", "resources", timeout);
    spdlog::info("Loaded {} tools, {} prompts, {} resources",
                 cache->tools.size(), cache->prompts.size(), cache->resources.size());
    return cache;
}

std::chrono::milliseconds timeout_for(const Upstream::Options& opts, const std::string& method,
                                      const nlohmann::json& params) {
    if (method == "tools/call" && params.is_object()) {
        auto it = params.find("name");
        if (it != params.end() && it->is_string()) {
            auto t = opts.tool_timeouts.find(it->get<std::string>());
            if (t != opts.tool_timeouts.end()) return t->second;
        }
    }
    return opts.request_timeout;
}

} // anonymous namespace

std::string_view to_string(UpstreamMode mode) {
    switch (mode) {
        case UpstreamMode::Persistent:   return "persistent";
        case UpstreamMode::SpawnPerCall: return "spawn-per-call";
    }
    return "unknown";
}

UpstreamMode upstream_mode_from_string(std::string_view name) {
    if (name == "persistent") return UpstreamMode::Persistent;
    if (name == "spawn-per-call") return UpstreamMode::SpawnPerCall;
    throw ConfigError("Unknown mode '" + std::string(name)
                      + "' (expected 'persistent' or 'spawn-per-call')");
}

std::unique_ptr<Upstream> make_upstream(UpstreamMode mode, Upstream::Options opts) {
    if (mode == UpstreamMode::SpawnPerCall) {
        return std::make_unique<SpawnPerCallUpstream>(std::move(opts));
    }
    return std::make_unique<PersistentUpstream>(std::move(opts));
}

// ---------------------------------------------------------------------------
// PersistentUpstream
// ---------------------------------------------------------------------------

PersistentUpstream::PersistentUpstream(Options opts)
    : opts_(std::move(opts)), cache_(std::make_shared<CapabilityCache>()) {
}

PersistentUpstream::~PersistentUpstream() {
    stop();
}

void PersistentUpstream::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (current()) return;
    open_locked();
}

void PersistentUpstream::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    close_locked();
}

void PersistentUpstream::restart() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    spdlog::info("Restarting MCP server");
    close_locked();
    open_locked();
}

void PersistentUpstream::open_locked() {
    auto conn = std::make_shared<UpstreamConnection>(opts_.process);
    conn->open();

    auto info = handshake(*conn, opts_.handshake_timeout);
    auto cache = load_capabilities(*conn, opts_.request_timeout);

    std::lock_guard<std::mutex> lock(state_mutex_);
    conn_ = std::move(conn);
    cache_ = std::move(cache);
    server_info_ = std::move(info);
}

void PersistentUpstream::close_locked() {
    std::shared_ptr<UpstreamConnection> old;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        old.swap(conn_);
    }
    if (old) old->close();
}

std::shared_ptr<UpstreamConnection> PersistentUpstream::current() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return conn_;
}

bool PersistentUpstream::ensure_running() {
    if (is_running()) return true;
    if (!opts_.auto_restart) return false;

    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    auto conn = current();
    if (conn && conn->alive()) return true;  // restarted by another caller

    {
        std::lock_guard<std::mutex> state(state_mutex_);
        if (restarts_ >= opts_.max_restarts) {
            spdlog::debug("Restart limit ({}) reached", opts_.max_restarts);
            return false;
        }
        ++restarts_;
    }

    spdlog::warn("MCP server is not running; restarting");
    close_locked();
    try {
        open_locked();
    } catch (const StartupError& e) {
        spdlog::error("Restart failed: {}", e.what());
        return false;
    }
    return true;
}

bool PersistentUpstream::is_running() const {
    auto conn = current();
    return conn && conn->alive();
}

JsonRpcResponse PersistentUpstream::call(const std::string& method, const nlohmann::json& params) {
    auto conn = current();
    if (!conn || !conn->correlator) {
        throw ProcessTerminatedError("MCP server not running");
    }
    return conn->correlator->call(method, params, timeout_for(opts_, method, params));
}

std::shared_ptr<const CapabilityCache> PersistentUpstream::capabilities() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return cache_;
}

nlohmann::json PersistentUpstream::server_info() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return server_info_;
}

int PersistentUpstream::restart_count() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return restarts_;
}

// ---------------------------------------------------------------------------
// SpawnPerCallUpstream
// ---------------------------------------------------------------------------

SpawnPerCallUpstream::SpawnPerCallUpstream(Options opts)
    : opts_(std::move(opts)), cache_(std::make_shared<CapabilityCache>()) {
}

void SpawnPerCallUpstream::start() {
    // One throwaway process fills the capability cache.
    UpstreamConnection conn(opts_.process);
    conn.open();
    auto info = handshake(conn, opts_.handshake_timeout);
    auto cache = load_capabilities(conn, opts_.request_timeout);
    conn.close();

    std::lock_guard<std::mutex> lock(state_mutex_);
    cache_ = std::move(cache);
    server_info_ = std::move(info);
    started_ = true;
}

void SpawnPerCallUpstream::stop() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    started_ = false;
}

void SpawnPerCallUpstream::restart() {
    stop();
    start();
}

bool SpawnPerCallUpstream::ensure_running() {
    return is_running();
}

bool SpawnPerCallUpstream::is_running() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return started_;
}

JsonRpcResponse SpawnPerCallUpstream::call(const std::string& method, const nlohmann::json& params) {
    UpstreamConnection conn(opts_.process);
    conn.open();
    handshake(conn, opts_.handshake_timeout);
    spdlog::debug("Spawned MCP server (pid {}) for {}", conn.supervisor.pid(), method);
    auto resp = conn.correlator->call(method, params, timeout_for(opts_, method, params));
    conn.close();
    return resp;
}

std::shared_ptr<const CapabilityCache> SpawnPerCallUpstream::capabilities() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return cache_;
}

nlohmann::json SpawnPerCallUpstream::server_info() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return server_info_;
}

} // namespace mcpbridge
