#pragma once

#include "drop/core/result.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace drop {

/**
 * @brief Runtime settings for one node
 *
 * Loaded from a JSON document such as:
 * {
 *   "bind_address": "0.0.0.0",
 *   "advertise_address": "192.168.1.20",
 *   "port": 4919,
 *   "chunk_size": 65536,
 *   "serve_workers": 4,
 *   "poll_interval_ms": 100,
 *   "store_dir": "/var/tmp/drop-store",
 *   "log_level": "debug"
 * }
 * Missing keys keep their defaults, unknown keys are ignored.
 */
struct Config {
    static constexpr std::size_t kDefaultChunkSize = 64 * 1024;

    std::string bind_address = "127.0.0.1";
    std::string advertise_address;             ///< Host written into tickets (bind_address when empty)
    std::uint16_t port = 0;                    ///< 0 picks an ephemeral port
    std::size_t chunk_size = kDefaultChunkSize;
    std::size_t serve_workers = 4;             ///< Threads claiming chunks of one file concurrently
    std::chrono::milliseconds poll_interval{100};
    std::filesystem::path store_dir;           ///< Engine working directory (temp dir when empty)
    std::string log_level = "info";

    const std::string& effective_advertise_address() const noexcept {
        return advertise_address.empty() ? bind_address : advertise_address;
    }
};

Result<Config> config_from_json(const nlohmann::json& document);

Result<Config> load_config(const std::filesystem::path& path);

nlohmann::json config_to_json(const Config& config);

/**
 * @brief Environment lookup, empty string when unset
 */
std::string get_env(const std::string& key);

/**
 * @brief Apply DROP_* environment overrides (currently DROP_LOG_LEVEL)
 */
void apply_env_overrides(Config& config);

} // namespace drop
