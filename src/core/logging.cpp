#include "drop/core/logging.hpp"

#include <spdlog/spdlog.h>

namespace drop {

void configure_logging(const Config& config) {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");

    auto level = spdlog::level::from_str(config.log_level);
    if (level == spdlog::level::off && config.log_level != "off") {
        spdlog::set_level(spdlog::level::info);
        spdlog::warn("Unknown log level '{}', using info", config.log_level);
        return;
    }
    spdlog::set_level(level);
}

} // namespace drop
