#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace cachely::core {

// Install the "cachely" console logger as the spdlog default.
// Level comes from CACHELY_LOG_LEVEL when set, info otherwise.
void init_logger();

// Set log level
void set_log_level(spdlog::level::level_enum level);

// Parse a level name ("debug", "warn", ...). Unknown names map to info.
spdlog::level::level_enum parse_log_level(const std::string& name);

} // namespace cachely::core
