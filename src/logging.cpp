#include "mcpbridge/logging.hpp"
#include "mcpbridge/error.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace mcpbridge {

void init_logging(const std::string& level) {
    auto lvl = spdlog::level::from_str(level);
    // from_str() maps unknown names to "off"
    if (lvl == spdlog::level::off && level != "off") {
        throw ConfigError("Unknown log level: " + level);
    }

    auto logger = spdlog::get("mcpbridge");
    if (!logger) {
        logger = spdlog::stderr_color_mt("mcpbridge");
    }
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    logger->set_level(lvl);
    spdlog::set_default_logger(logger);
}

} // namespace mcpbridge
