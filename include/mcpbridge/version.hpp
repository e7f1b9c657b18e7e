#pragma once
#include <string_view>

namespace mcpbridge {

constexpr std::string_view BRIDGE_NAME         = "mcp-bridge";
constexpr std::string_view BRIDGE_VERSION      = "0.1.0";
constexpr std::string_view PROTOCOL_VERSION    = "2024-11-05";
constexpr std::string_view JSONRPC_VERSION     = "2.0";

} // namespace mcpbridge
