#include "mcpbridge/config.hpp"
#include "mcpbridge/codec.hpp"
#include "mcpbridge/error.hpp"

#include <fstream>
#include <optional>
#include <sstream>

namespace mcpbridge {

namespace {

template <typename T>
T get_as(const nlohmann::json& j, const char* key) {
    try {
        return j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

void require_positive(int value, const char* name) {
    if (value <= 0) {
        throw ConfigError(std::string(name) + " must be positive (got " + std::to_string(value) + ")");
    }
}

int parse_int(const std::string& text, const char* flag) {
    try {
        size_t used = 0;
        int value = std::stoi(text, &used);
        if (used != text.size()) throw std::invalid_argument(text);
        return value;
    } catch (const std::logic_error&) {
        throw ConfigError(std::string("Invalid number for ") + flag + ": " + text);
    }
}

} // anonymous namespace

void BridgeConfig::validate() const {
    if (command.empty()) {
        throw ConfigError("No MCP server command given");
    }
    if (port < 0 || port > 65535) {
        throw ConfigError("port out of range: " + std::to_string(port));
    }
    if (mcp_path.empty() || mcp_path.front() != '/') {
        throw ConfigError("mcp_path must start with '/'");
    }
    require_positive(request_timeout_ms, "request_timeout_ms");
    require_positive(startup_probe_ms, "startup_probe_ms");
    require_positive(stop_grace_ms, "stop_grace_ms");
    require_positive(keepalive_interval_ms, "keepalive_interval_ms");
    require_positive(session_idle_timeout_ms, "session_idle_timeout_ms");
    require_positive(worker_threads, "worker_threads");
    for (const auto& [tool, ms] : tool_timeouts_ms) {
        require_positive(ms, ("tool_timeouts_ms." + tool).c_str());
    }
    if (max_restarts < 0) {
        throw ConfigError("max_restarts must not be negative");
    }
}

Bridge::Options BridgeConfig::bridge_options() const {
    Bridge::Options opts;
    opts.mode = mode;
    opts.upstream.process.command = command;
    opts.upstream.process.startup_probe = std::chrono::milliseconds(startup_probe_ms);
    opts.upstream.process.stop_grace = std::chrono::milliseconds(stop_grace_ms);
    opts.upstream.request_timeout = std::chrono::milliseconds(request_timeout_ms);
    opts.upstream.handshake_timeout = std::chrono::milliseconds(request_timeout_ms);
    for (const auto& [tool, ms] : tool_timeouts_ms) {
        opts.upstream.tool_timeouts[tool] = std::chrono::milliseconds(ms);
    }
    opts.upstream.auto_restart = auto_restart;
    opts.upstream.max_restarts = max_restarts;
    opts.allowed_origins = allowed_origins;
    opts.keepalive_interval = std::chrono::milliseconds(keepalive_interval_ms);
    opts.session_idle_timeout = std::chrono::milliseconds(session_idle_timeout_ms);
    return opts;
}

HttpServer::Options BridgeConfig::server_options() const {
    HttpServer::Options opts;
    opts.host = host;
    opts.port = static_cast<uint16_t>(port);
    opts.mcp_path = mcp_path;
    opts.worker_threads = worker_threads;
    opts.rest_api = rest_api;
    return opts;
}

void apply_config_json(BridgeConfig& config, const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("Config must be a JSON object");
    }
    if (j.contains("host")) config.host = get_as<std::string>(j, "host");
    if (j.contains("port")) config.port = get_as<int>(j, "port");
    if (j.contains("mcp_path")) config.mcp_path = get_as<std::string>(j, "mcp_path");
    if (j.contains("command")) config.command = get_as<std::vector<std::string>>(j, "command");
    if (j.contains("mode")) config.mode = upstream_mode_from_string(get_as<std::string>(j, "mode"));
    if (j.contains("request_timeout_ms")) config.request_timeout_ms = get_as<int>(j, "request_timeout_ms");
    if (j.contains("startup_probe_ms")) config.startup_probe_ms = get_as<int>(j, "startup_probe_ms");
    if (j.contains("stop_grace_ms")) config.stop_grace_ms = get_as<int>(j, "stop_grace_ms");
    if (j.contains("tool_timeouts_ms")) {
        config.tool_timeouts_ms = get_as<std::map<std::string, int>>(j, "tool_timeouts_ms");
    }
    if (j.contains("keepalive_interval_ms")) config.keepalive_interval_ms = get_as<int>(j, "keepalive_interval_ms");
    if (j.contains("session_idle_timeout_ms")) config.session_idle_timeout_ms = get_as<int>(j, "session_idle_timeout_ms");
    if (j.contains("allowed_origins")) config.allowed_origins = get_as<std::vector<std::string>>(j, "allowed_origins");
    if (j.contains("log_level")) config.log_level = get_as<std::string>(j, "log_level");
    if (j.contains("auto_restart")) config.auto_restart = get_as<bool>(j, "auto_restart");
    if (j.contains("max_restarts")) config.max_restarts = get_as<int>(j, "max_restarts");
    if (j.contains("worker_threads")) config.worker_threads = get_as<int>(j, "worker_threads");
    if (j.contains("rest_api")) config.rest_api = get_as<bool>(j, "rest_api");
}

BridgeConfig load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Cannot open config file: " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();

    nlohmann::json j;
    try {
        j = Codec::parse_value(ss.str());
    } catch (const ParseError& e) {
        throw ConfigError("Invalid JSON in " + path + ": " + e.what());
    }

    BridgeConfig config;
    apply_config_json(config, j);
    return config;
}

CommandLine parse_command_line(int argc, const char* const argv[]) {
    CommandLine cl;
    std::optional<std::string> config_path, host, mode, log_level;
    std::optional<int> port;
    std::vector<std::string> command;

    int i = 1;
    auto value_of = [&](const std::string& flag) -> std::string {
        if (i + 1 >= argc) throw ConfigError("Missing value for " + flag);
        return argv[++i];
    };

    for (; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--") { ++i; break; }
        if (arg == "-h" || arg == "--help") { cl.show_help = true; return cl; }
        else if (arg == "--config") config_path = value_of(arg);
        else if (arg == "--host") host = value_of(arg);
        else if (arg == "--port") port = parse_int(value_of(arg), "--port");
        else if (arg == "--mode") mode = value_of(arg);
        else if (arg == "--log-level") log_level = value_of(arg);
        else if (arg.rfind("--", 0) == 0) throw ConfigError("Unknown option: " + arg);
        else break;
    }
    for (; i < argc; ++i) command.emplace_back(argv[i]);

    if (config_path) cl.config = load_config(*config_path);
    if (host) cl.config.host = *host;
    if (port) cl.config.port = *port;
    if (mode) cl.config.mode = upstream_mode_from_string(*mode);
    if (log_level) cl.config.log_level = *log_level;
    if (!command.empty()) cl.config.command = std::move(command);

    cl.config.validate();
    return cl;
}

std::string usage(const std::string& program) {
    return "Usage: " + program + " [options] [--] <command> [args...]\n"
           "Expose a stdio MCP server over Streamable HTTP.\n\n"
           "Options:\n"
           "  --config FILE      JSON config file\n"
           "  --host HOST        bind address (default 127.0.0.1)\n"
           "  --port PORT        bind port (default 5000)\n"
           "  --mode MODE        persistent | spawn-per-call\n"
           "  --log-level LEVEL  trace|debug|info|warn|error|critical|off\n"
           "  -h, --help         show this help\n";
}

} // namespace mcpbridge
