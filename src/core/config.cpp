#include "drop/core/config.hpp"

#include <cstdlib>
#include <fstream>

namespace drop {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

Result<void> check_type(const json& document, const char* key, json::value_t expected) {
    auto it = document.find(key);
    if (it == document.end()) {
        return Ok();
    }
    const bool matches = it->type() == expected ||
        (expected == json::value_t::number_unsigned && it->type() == json::value_t::number_integer &&
         it->get<std::int64_t>() >= 0);
    if (!matches) {
        return Err<void>(make_error(ErrorKind::ConfigError,
                                    std::string("wrong type for key '") + key + "'"));
    }
    return Ok();
}

} // namespace

Result<Config> config_from_json(const json& document) {
    if (!document.is_object()) {
        return Err<Config>(ErrorKind::ConfigError, "configuration root must be a JSON object");
    }

    const std::pair<const char*, json::value_t> schema[] = {
        {"bind_address", json::value_t::string},
        {"advertise_address", json::value_t::string},
        {"port", json::value_t::number_unsigned},
        {"chunk_size", json::value_t::number_unsigned},
        {"serve_workers", json::value_t::number_unsigned},
        {"poll_interval_ms", json::value_t::number_unsigned},
        {"store_dir", json::value_t::string},
        {"log_level", json::value_t::string},
    };
    for (const auto& [key, type] : schema) {
        if (auto res = check_type(document, key, type); res.is_error()) {
            return Err<Config>(res.error());
        }
    }

    Config config;
    config.bind_address = document.value("bind_address", config.bind_address);
    config.advertise_address = document.value("advertise_address", config.advertise_address);

    const auto port = document.value("port", static_cast<std::uint64_t>(config.port));
    if (port > 65535) {
        return Err<Config>(ErrorKind::ConfigError, "port out of range: " + std::to_string(port));
    }
    config.port = static_cast<std::uint16_t>(port);

    config.chunk_size = document.value("chunk_size", config.chunk_size);
    if (config.chunk_size == 0) {
        return Err<Config>(ErrorKind::ConfigError, "chunk_size must be > 0");
    }

    config.serve_workers = document.value("serve_workers", config.serve_workers);
    if (config.serve_workers == 0) {
        return Err<Config>(ErrorKind::ConfigError, "serve_workers must be > 0");
    }

    config.poll_interval = std::chrono::milliseconds(
        document.value("poll_interval_ms", static_cast<std::uint64_t>(config.poll_interval.count())));
    if (config.poll_interval.count() == 0) {
        return Err<Config>(ErrorKind::ConfigError, "poll_interval_ms must be > 0");
    }

    config.store_dir = fs::path(document.value("store_dir", std::string()));
    config.log_level = document.value("log_level", config.log_level);
    return Ok(config);
}

Result<Config> load_config(const fs::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<Config>(ErrorKind::ConfigError, "Failed to open config file: " + path.string());
    }

    json document;
    try {
        input >> document;
    } catch (const json::parse_error& e) {
        return Err<Config>(ErrorKind::ConfigError,
                           "Failed to parse " + path.string() + ": " + e.what());
    }

    auto config = config_from_json(document);
    if (config.is_error()) {
        return config;
    }
    apply_env_overrides(config.value());
    return config;
}

json config_to_json(const Config& config) {
    json j;
    j["bind_address"] = config.bind_address;
    j["advertise_address"] = config.advertise_address;
    j["port"] = config.port;
    j["chunk_size"] = config.chunk_size;
    j["serve_workers"] = config.serve_workers;
    j["poll_interval_ms"] = config.poll_interval.count();
    j["store_dir"] = config.store_dir.string();
    j["log_level"] = config.log_level;
    return j;
}

std::string get_env(const std::string& key) {
    const char* value = std::getenv(key.c_str());
    return value ? std::string(value) : std::string();
}

void apply_env_overrides(Config& config) {
    auto level = get_env("DROP_LOG_LEVEL");
    if (!level.empty()) {
        config.log_level = level;
    }
}

} // namespace drop
