#include "core/logger.hpp"
#include "core/config.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace cachely::core {

namespace {
constexpr const char* kLoggerName = "cachely";
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
}

void init_logger() {
    auto logger = spdlog::get(kLoggerName);
    if (!logger) {
        logger = spdlog::stdout_color_mt(kLoggerName);
    }
    logger->set_pattern(kPattern);
    spdlog::set_default_logger(logger);

    auto level_name = config::get_env_or("CACHELY_LOG_LEVEL", "info");
    set_log_level(parse_log_level(level_name));
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

spdlog::level::level_enum parse_log_level(const std::string& name) {
    if (name == "warning") return spdlog::level::warn;
    auto level = spdlog::level::from_str(name);
    // from_str answers "off" for anything it does not know
    if (level == spdlog::level::off && name != "off") {
        return spdlog::level::info;
    }
    return level;
}

} // namespace cachely::core
