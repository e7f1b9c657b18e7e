#pragma once
#include <string>

namespace mcpbridge {

/// Install a stderr logger named "mcpbridge" as the spdlog default.
/// `level` is one of trace, debug, info, warn, error, critical, off.
/// Throws ConfigError on an unknown level name.
void init_logging(const std::string& level);

} // namespace mcpbridge
