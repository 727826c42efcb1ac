#include "torgrab/config/EngineConfig.hpp"
#include "torgrab/util/JsonUtil.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace torgrab;
using namespace std::chrono_literals;

namespace {

boost::json::object parseObject(const std::string& text) {
    return util::parseJson(text).as_object();
}

} // namespace

TEST(EngineConfigTest, DefaultsMatchDocumentedValues) {
    config::EngineConfig cfg;
    EXPECT_EQ(cfg.pool.minSize, 2u);
    EXPECT_EQ(cfg.pool.maxSize, 5u);
    EXPECT_EQ(cfg.rotation.failureThreshold, 3u);
    EXPECT_EQ(cfg.scheduler.workers, 4u);
    EXPECT_EQ(cfg.runtime.portMin, 40001);
    EXPECT_EQ(cfg.runtime.portMax, 60001);
    EXPECT_FALSE(cfg.persistOutcomes);
}

TEST(EngineConfigTest, ParsesEverySection) {
    auto cfg = config::parseEngineConfig(parseObject(R"({
        "logLevel": "debug",
        "pool": {"min": 1, "max": 4, "checkoutTimeoutMs": 2500, "creationCooldownMs": 100},
        "rotation": {"maxAgeSeconds": 120, "failureThreshold": 2, "retireThreshold": 5},
        "health": {"intervalMs": 5000, "tickMs": 250, "targets": ["https://example.test/ip"]},
        "scheduler": {"workers": 8, "requestTimeoutMs": 7000, "maxAttempts": 4,
                      "backoff": {"baseMs": 10, "capMs": 80, "jitterMs": 3}},
        "runtime": {"image": "local/tor:1", "bindAddress": "0.0.0.0", "portMin": 50000,
                    "portMax": 50100, "controlPassword": "pw", "useSudo": true},
        "database": {"host": "db", "port": 33061, "database": "scrapes"},
        "sink": {"persistOutcomes": true}
    })"));

    EXPECT_EQ(cfg.logLevel, util::LogLevel::debug);
    EXPECT_EQ(cfg.pool.minSize, 1u);
    EXPECT_EQ(cfg.pool.maxSize, 4u);
    EXPECT_EQ(cfg.pool.checkoutTimeout, 2500ms);
    EXPECT_EQ(cfg.pool.creationCooldown, 100ms);
    EXPECT_EQ(cfg.rotation.maxAge, 120s);
    EXPECT_EQ(cfg.rotation.failureThreshold, 2u);
    EXPECT_EQ(cfg.rotation.retireThreshold, 5u);
    EXPECT_EQ(cfg.health.interval, 5000ms);
    EXPECT_EQ(cfg.health.tick, 250ms);
    ASSERT_EQ(cfg.probeTargets.size(), 1u);
    EXPECT_EQ(cfg.probeTargets.front(), "https://example.test/ip");
    EXPECT_EQ(cfg.scheduler.workers, 8u);
    EXPECT_EQ(cfg.scheduler.requestTimeout, 7000ms);
    EXPECT_EQ(cfg.scheduler.defaultMaxAttempts, 4u);
    EXPECT_EQ(cfg.scheduler.backoff.base, 10ms);
    EXPECT_EQ(cfg.scheduler.backoff.cap, 80ms);
    EXPECT_EQ(cfg.scheduler.backoff.jitter, 3ms);
    EXPECT_EQ(cfg.runtime.image, "local/tor:1");
    EXPECT_EQ(cfg.runtime.bindAddress, "0.0.0.0");
    EXPECT_EQ(cfg.runtime.portMin, 50000);
    EXPECT_EQ(cfg.runtime.portMax, 50100);
    EXPECT_EQ(cfg.runtime.controlPassword, "pw");
    EXPECT_TRUE(cfg.runtime.useSudo);
    EXPECT_EQ(cfg.database.host, "db");
    EXPECT_EQ(cfg.database.port, 33061);
    EXPECT_EQ(cfg.database.database, "scrapes");
    EXPECT_TRUE(cfg.persistOutcomes);
}

TEST(EngineConfigTest, NormalizeRepairsInconsistentValues) {
    auto cfg = config::parseEngineConfig(parseObject(R"({
        "pool": {"min": 9, "max": 3, "startupProbeAttempts": 0},
        "rotation": {"failureThreshold": 4, "retireThreshold": 2},
        "health": {"intervalMs": 100, "tickMs": 5000, "targets": []},
        "scheduler": {"workers": 0, "maxAttempts": 0, "backoff": {"baseMs": 500, "capMs": 100}}
    })"));
    config::normalize(cfg);

    EXPECT_EQ(cfg.pool.maxSize, 3u);
    EXPECT_EQ(cfg.pool.minSize, 3u);
    EXPECT_EQ(cfg.pool.startupProbeAttempts, 1u);
    EXPECT_EQ(cfg.rotation.failureThreshold, 4u);
    EXPECT_EQ(cfg.rotation.retireThreshold, 4u);
    EXPECT_EQ(cfg.health.tick, 100ms);
    EXPECT_FALSE(cfg.probeTargets.empty());
    EXPECT_EQ(cfg.scheduler.workers, 1u);
    EXPECT_EQ(cfg.scheduler.defaultMaxAttempts, 1u);
    EXPECT_EQ(cfg.scheduler.backoff.cap, 500ms);
    EXPECT_EQ(cfg.scheduler.checkoutTimeout, cfg.pool.checkoutTimeout);
}

TEST(EngineConfigTest, EnvironmentOverridesFile) {
    ::setenv("TORGRAB_POOL_MAX", "7", 1);
    ::setenv("TORGRAB_DOCKER_SUDO", "true", 1);
    ::setenv("TORGRAB_LOG_LEVEL", "error", 1);
    ::setenv("TORGRAB_DB_POOL", "0", 1);

    auto cfg = config::parseEngineConfig(parseObject(R"({"pool": {"max": 3}})"));
    config::applyEnvironment(cfg);

    ::unsetenv("TORGRAB_POOL_MAX");
    ::unsetenv("TORGRAB_DOCKER_SUDO");
    ::unsetenv("TORGRAB_LOG_LEVEL");
    ::unsetenv("TORGRAB_DB_POOL");

    EXPECT_EQ(cfg.pool.maxSize, 7u);
    EXPECT_TRUE(cfg.runtime.useSudo);
    EXPECT_EQ(cfg.logLevel, util::LogLevel::error);
    EXPECT_EQ(cfg.database.poolSize, 1u);
}

TEST(EngineConfigTest, MalformedFileFallsBackToDefaults) {
    auto dir = std::filesystem::temp_directory_path() / "torgrab_config_test";
    std::filesystem::create_directories(dir);
    auto file = dir / "broken.json";
    {
        std::ofstream out(file);
        out << "{ \"pool\": { \"max\": ";
    }

    auto cfg = config::loadEngineConfig(file);
    EXPECT_EQ(cfg.pool.maxSize, 5u);
    EXPECT_EQ(cfg.pool.minSize, 2u);
    std::filesystem::remove_all(dir);
}

TEST(EngineConfigTest, MissingFileUsesDefaults) {
    auto cfg = config::loadEngineConfig("/nonexistent/torgrab.json");
    EXPECT_EQ(cfg.pool.maxSize, 5u);
    EXPECT_FALSE(cfg.probeTargets.empty());
}
