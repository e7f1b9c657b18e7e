/// mcp_bridge: expose a stdio MCP server over Streamable HTTP.
/// Usage: ./mcp_bridge [--port 5000] [--mode persistent] -- python my_server.py

#include <mcpbridge/mcpbridge.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

static std::atomic<bool> g_running{true};

static void handle_signal(int) {
    g_running.store(false);
}

int main(int argc, char* argv[]) {
    mcpbridge::CommandLine cl;
    try {
        cl = mcpbridge::parse_command_line(argc, argv);
        if (cl.show_help) {
            std::cout << mcpbridge::usage(argv[0]);
            return 0;
        }
        mcpbridge::init_logging(cl.config.log_level);
    } catch (const mcpbridge::ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << mcpbridge::usage(argv[0]);
        return 1;
    }

    ::signal(SIGTERM, handle_signal);
    ::signal(SIGINT, handle_signal);

    mcpbridge::Bridge bridge{cl.config.bridge_options()};
    try {
        bridge.start();
    } catch (const mcpbridge::StartupError& e) {
        spdlog::error("Failed to start MCP server: {}", e.what());
        return 1;
    }

    mcpbridge::HttpServer server{bridge, cl.config.server_options()};
    std::atomic<bool> failed{false};
    std::thread http([&] {
        try {
            server.listen();
        } catch (const mcpbridge::TransportError& e) {
            spdlog::error("{}", e.what());
            failed = true;
        }
        g_running = false;
    });

    while (g_running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    spdlog::info("Shutting down");
    server.stop();
    http.join();
    bridge.stop();
    return failed ? 1 : 0;
}
