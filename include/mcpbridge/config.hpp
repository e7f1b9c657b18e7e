#pragma once
#include "bridge.hpp"
#include "transport/http_server.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace mcpbridge {

/// Everything the executable needs, with defaults for every field.
struct BridgeConfig {
    std::string host = "127.0.0.1";
    int port = 5000;
    std::string mcp_path = "/mcp";
    std::vector<std::string> command;
    UpstreamMode mode = UpstreamMode::Persistent;

    int request_timeout_ms = 30000;
    int startup_probe_ms = 100;
    int stop_grace_ms = 5000;
    std::map<std::string, int> tool_timeouts_ms;
    int keepalive_interval_ms = 30000;
    int session_idle_timeout_ms = 30 * 60 * 1000;

    std::vector<std::string> allowed_origins = {
        "http://localhost", "https://localhost",
        "http://127.0.0.1", "https://127.0.0.1"
    };
    std::string log_level = "info";
    bool auto_restart = false;
    int max_restarts = 3;
    int worker_threads = 8;
    bool rest_api = true;

    /// Throws ConfigError on out-of-range values or a missing command.
    void validate() const;

    [[nodiscard]] Bridge::Options bridge_options() const;
    [[nodiscard]] HttpServer::Options server_options() const;
};

/// Overlay the keys present in `j` onto `config`. Throws ConfigError on
/// unknown modes or wrongly-typed values.
void apply_config_json(BridgeConfig& config, const nlohmann::json& j);

/// Read a JSON config file. Throws ConfigError.
[[nodiscard]] BridgeConfig load_config(const std::string& path);

struct CommandLine {
    BridgeConfig config;
    bool show_help = false;
};

/// [--config FILE] [--host H] [--port P] [--mode M] [--log-level L]
/// [--] command [args...]. Flags override the file. Throws ConfigError.
[[nodiscard]] CommandLine parse_command_line(int argc, const char* const argv[]);

[[nodiscard]] std::string usage(const std::string& program);

} // namespace mcpbridge
