#pragma once

#include "drop/core/config.hpp"

namespace drop {

/**
 * @brief Configure the global spdlog logger from Config::log_level
 *
 * Unknown level names fall back to "info" with a warning.
 */
void configure_logging(const Config& config);

} // namespace drop
