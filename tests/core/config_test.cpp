#include "drop/core/config.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

fs::path write_temp_config(const std::string& content) {
    static std::atomic<uint64_t> counter{0};
    const auto path = fs::temp_directory_path() / ("drop_config_test_" + std::to_string(counter.fetch_add(1)) + ".json");
    std::ofstream out(path);
    out << content;
    return path;
}

} // namespace

TEST(ConfigTest, DefaultsWhenKeysAreMissing) {
    auto config = drop::config_from_json(json::object());
    ASSERT_TRUE(config.is_ok());

    EXPECT_EQ(config.value().bind_address, "127.0.0.1");
    EXPECT_EQ(config.value().port, 0);
    EXPECT_EQ(config.value().chunk_size, drop::Config::kDefaultChunkSize);
    EXPECT_EQ(config.value().effective_advertise_address(), "127.0.0.1");
}

TEST(ConfigTest, ParsesEveryKey) {
    json document = {
        {"bind_address", "0.0.0.0"},
        {"advertise_address", "192.168.1.20"},
        {"port", 4919},
        {"chunk_size", 4096},
        {"serve_workers", 2},
        {"poll_interval_ms", 25},
        {"store_dir", "/var/tmp/drop-store"},
        {"log_level", "debug"},
        {"unknown_key", true}
    };

    auto config = drop::config_from_json(document);
    ASSERT_TRUE(config.is_ok()) << config.error().to_string();

    const auto& c = config.value();
    EXPECT_EQ(c.bind_address, "0.0.0.0");
    EXPECT_EQ(c.effective_advertise_address(), "192.168.1.20");
    EXPECT_EQ(c.port, 4919);
    EXPECT_EQ(c.chunk_size, 4096u);
    EXPECT_EQ(c.serve_workers, 2u);
    EXPECT_EQ(c.poll_interval.count(), 25);
    EXPECT_EQ(c.store_dir, fs::path("/var/tmp/drop-store"));
    EXPECT_EQ(c.log_level, "debug");

    auto round_trip = drop::config_from_json(drop::config_to_json(c));
    ASSERT_TRUE(round_trip.is_ok());
    EXPECT_EQ(round_trip.value().port, 4919);
}

TEST(ConfigTest, RejectsInvalidValues) {
    EXPECT_EQ(drop::config_from_json(json::array()).error().kind, drop::ErrorKind::ConfigError);
    EXPECT_TRUE(drop::config_from_json({{"port", "80"}}).is_error());
    EXPECT_TRUE(drop::config_from_json({{"port", 70000}}).is_error());
    EXPECT_TRUE(drop::config_from_json({{"chunk_size", 0}}).is_error());
    EXPECT_TRUE(drop::config_from_json({{"serve_workers", -1}}).is_error());
}

TEST(ConfigTest, LoadConfigReportsMissingAndMalformedFiles) {
    auto missing = drop::load_config("/nonexistent/drop.json");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().kind, drop::ErrorKind::ConfigError);

    const auto path = write_temp_config("{ not json");
    auto malformed = drop::load_config(path);
    ASSERT_TRUE(malformed.is_error());
    EXPECT_EQ(malformed.error().kind, drop::ErrorKind::ConfigError);
    fs::remove(path);
}

TEST(ConfigTest, LoadConfigAppliesEnvironmentOverrides) {
    const auto path = write_temp_config(R"({"log_level": "warn", "port": 9000})");

    ::setenv("DROP_LOG_LEVEL", "trace", 1);
    auto config = drop::load_config(path);
    ::unsetenv("DROP_LOG_LEVEL");

    ASSERT_TRUE(config.is_ok());
    EXPECT_EQ(config.value().port, 9000);
    EXPECT_EQ(config.value().log_level, "trace");
    fs::remove(path);
}
