#include "torgrab/config/EngineConfig.hpp"
#include "torgrab/health/ExitProbe.hpp"
#include "torgrab/util/JsonUtil.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <string_view>
#include <utility>

namespace torgrab::config {
namespace {

const boost::json::object* section(const boost::json::object& json, std::string_view key) {
    if (auto it = json.if_contains(key)) {
        return it->if_object();
    }
    return nullptr;
}

std::int64_t readInteger(const boost::json::value& value) {
    return value.to_number<std::int64_t>();
}

template <typename T>
void readUnsigned(const boost::json::object& json, std::string_view key, T& out) {
    if (auto it = json.if_contains(key)) {
        auto value = static_cast<std::uint64_t>(std::max<std::int64_t>(0, readInteger(*it)));
        out = static_cast<T>(std::min<std::uint64_t>(value, std::numeric_limits<T>::max()));
    }
}

template <typename Duration>
void readDuration(const boost::json::object& json, std::string_view key, Duration& out) {
    if (auto it = json.if_contains(key)) {
        out = Duration{std::max<std::int64_t>(0, readInteger(*it))};
    }
}

void readString(const boost::json::object& json, std::string_view key, std::string& out) {
    if (auto it = json.if_contains(key)) {
        out = std::string(it->as_string());
    }
}

void readBool(const boost::json::object& json, std::string_view key, bool& out) {
    if (auto it = json.if_contains(key)) {
        out = it->as_bool();
    }
}

bool parseFlag(std::string_view value) {
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

template <typename T>
void envUnsigned(const char* name, T& out) {
    if (const char* value = std::getenv(name)) {
        out = static_cast<T>(std::strtoul(value, nullptr, 10));
    }
}

void envMillis(const char* name, std::chrono::milliseconds& out) {
    if (const char* value = std::getenv(name)) {
        out = std::chrono::milliseconds{std::strtoll(value, nullptr, 10)};
    }
}

} // namespace

EngineConfig parseEngineConfig(const boost::json::object& json) {
    EngineConfig config;

    if (auto it = json.if_contains("logLevel")) {
        if (auto level = util::parseLogLevel(std::string(it->as_string()))) {
            config.logLevel = *level;
        } else {
            util::log(util::LogLevel::warn, "Unknown logLevel " + std::string(it->as_string()) + ", keeping info");
        }
    }

    if (auto pool = section(json, "pool")) {
        readUnsigned(*pool, "min", config.pool.minSize);
        readUnsigned(*pool, "max", config.pool.maxSize);
        readDuration(*pool, "checkoutTimeoutMs", config.pool.checkoutTimeout);
        readDuration(*pool, "probeTimeoutMs", config.pool.probeTimeout);
        readDuration(*pool, "controlTimeoutMs", config.pool.controlTimeout);
        readUnsigned(*pool, "startupProbeAttempts", config.pool.startupProbeAttempts);
        readDuration(*pool, "startupProbeIntervalMs", config.pool.startupProbeInterval);
        readDuration(*pool, "creationCooldownMs", config.pool.creationCooldown);
        readUnsigned(*pool, "runtimeFailureLimit", config.pool.runtimeFailureLimit);
    }

    if (auto rotation = section(json, "rotation")) {
        readDuration(*rotation, "maxAgeSeconds", config.rotation.maxAge);
        readUnsigned(*rotation, "failureThreshold", config.rotation.failureThreshold);
        readUnsigned(*rotation, "retireThreshold", config.rotation.retireThreshold);
        readDuration(*rotation, "quarantineCeilingSeconds", config.rotation.quarantineCeiling);
    }

    if (auto health = section(json, "health")) {
        readDuration(*health, "intervalMs", config.health.interval);
        readDuration(*health, "tickMs", config.health.tick);
        if (auto targets = health->if_contains("targets")) {
            config.probeTargets.clear();
            for (const auto& target : targets->as_array()) {
                config.probeTargets.emplace_back(target.as_string());
            }
        }
    }

    if (auto scheduler = section(json, "scheduler")) {
        readUnsigned(*scheduler, "workers", config.scheduler.workers);
        readDuration(*scheduler, "requestTimeoutMs", config.scheduler.requestTimeout);
        readDuration(*scheduler, "exhaustedDelayMs", config.scheduler.exhaustedDelay);
        readUnsigned(*scheduler, "maxAttempts", config.scheduler.defaultMaxAttempts);
        if (auto backoff = section(*scheduler, "backoff")) {
            readDuration(*backoff, "baseMs", config.scheduler.backoff.base);
            readDuration(*backoff, "capMs", config.scheduler.backoff.cap);
            readDuration(*backoff, "jitterMs", config.scheduler.backoff.jitter);
        }
    }

    if (auto docker = section(json, "runtime")) {
        readString(*docker, "image", config.runtime.image);
        readString(*docker, "namePrefix", config.runtime.namePrefix);
        readString(*docker, "bindAddress", config.runtime.bindAddress);
        readUnsigned(*docker, "portMin", config.runtime.portMin);
        readUnsigned(*docker, "portMax", config.runtime.portMax);
        readDuration(*docker, "startupTimeoutSeconds", config.runtime.startupTimeout);
        readDuration(*docker, "commandTimeoutSeconds", config.runtime.commandTimeout);
        readString(*docker, "controlPassword", config.runtime.controlPassword);
        readBool(*docker, "useSudo", config.runtime.useSudo);
    }

    if (auto database = section(json, "database")) {
        config.database = repository::loadConfig(*database);
    }

    if (auto sink = section(json, "sink")) {
        readBool(*sink, "persistOutcomes", config.persistOutcomes);
    }

    return config;
}

void applyEnvironment(EngineConfig& config) {
    if (const char* value = std::getenv("TORGRAB_LOG_LEVEL")) {
        if (auto level = util::parseLogLevel(value)) {
            config.logLevel = *level;
        }
    }
    envUnsigned("TORGRAB_POOL_MIN", config.pool.minSize);
    envUnsigned("TORGRAB_POOL_MAX", config.pool.maxSize);
    envMillis("TORGRAB_CHECKOUT_TIMEOUT_MS", config.pool.checkoutTimeout);
    envMillis("TORGRAB_PROBE_INTERVAL_MS", config.health.interval);
    envUnsigned("TORGRAB_FAILURE_THRESHOLD", config.rotation.failureThreshold);
    envUnsigned("TORGRAB_RETIRE_THRESHOLD", config.rotation.retireThreshold);
    envUnsigned("TORGRAB_WORKERS", config.scheduler.workers);
    envMillis("TORGRAB_REQUEST_TIMEOUT_MS", config.scheduler.requestTimeout);
    if (const char* value = std::getenv("TORGRAB_DOCKER_IMAGE")) config.runtime.image = value;
    if (const char* value = std::getenv("TORGRAB_BIND_ADDRESS")) config.runtime.bindAddress = value;
    if (const char* value = std::getenv("TORGRAB_CONTROL_PASSWORD")) config.runtime.controlPassword = value;
    if (const char* value = std::getenv("TORGRAB_DOCKER_SUDO")) config.runtime.useSudo = parseFlag(value);
    if (const char* value = std::getenv("TORGRAB_PERSIST_OUTCOMES")) config.persistOutcomes = parseFlag(value);

    if (const char* value = std::getenv("TORGRAB_DB_HOST")) config.database.host = value;
    if (const char* value = std::getenv("TORGRAB_DB_PORT")) config.database.port = static_cast<std::uint16_t>(std::strtoul(value, nullptr, 10));
    if (const char* value = std::getenv("TORGRAB_DB_USER")) config.database.user = value;
    if (const char* value = std::getenv("TORGRAB_DB_PASSWORD")) config.database.password = value;
    if (const char* value = std::getenv("TORGRAB_DB_NAME")) config.database.database = value;
    if (const char* value = std::getenv("TORGRAB_DB_CHARSET")) config.database.charset = value;
    if (const char* value = std::getenv("TORGRAB_DB_POOL")) {
        config.database.poolSize = std::max(1u, static_cast<unsigned int>(std::strtoul(value, nullptr, 10)));
    }
}

void normalize(EngineConfig& config) {
    config.pool.maxSize = std::max<std::size_t>(1, config.pool.maxSize);
    config.pool.minSize = std::min(config.pool.minSize, config.pool.maxSize);
    config.pool.startupProbeAttempts = std::max(1u, config.pool.startupProbeAttempts);
    config.pool.runtimeFailureLimit = std::max(1u, config.pool.runtimeFailureLimit);

    config.rotation.failureThreshold = std::max(1u, config.rotation.failureThreshold);
    // Retirement is the stricter response.
    config.rotation.retireThreshold = std::max(config.rotation.retireThreshold, config.rotation.failureThreshold);

    if (config.health.interval <= std::chrono::milliseconds::zero()) {
        config.health.interval = std::chrono::milliseconds{30000};
    }
    config.health.tick = std::clamp(config.health.tick, std::chrono::milliseconds{1}, config.health.interval);
    if (config.probeTargets.empty()) {
        config.probeTargets = health::defaultProbeTargets();
    }

    config.scheduler.workers = std::max(1u, config.scheduler.workers);
    config.scheduler.defaultMaxAttempts = std::max(1u, config.scheduler.defaultMaxAttempts);
    config.scheduler.checkoutTimeout = config.pool.checkoutTimeout;
    config.scheduler.backoff.cap = std::max(config.scheduler.backoff.cap, config.scheduler.backoff.base);

    if (config.runtime.portMin == 0) {
        config.runtime.portMin = 40001;
    }
    if (config.runtime.portMax == 0) {
        config.runtime.portMax = 60001;
    }
    if (config.runtime.portMax < config.runtime.portMin) {
        std::swap(config.runtime.portMin, config.runtime.portMax);
    }
}

EngineConfig loadEngineConfig(const std::filesystem::path& path) {
    EngineConfig config;
    try {
        if (auto json = util::readJsonFile(path)) {
            if (json->is_object()) {
                config = parseEngineConfig(json->as_object());
            } else {
                util::log(util::LogLevel::warn, "Configuration " + path.string() + " is not a JSON object, using defaults");
            }
        } else {
            util::log(util::LogLevel::info, "No configuration at " + path.string() + ", using defaults");
        }
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::warn, "Failed to parse configuration " + path.string() + ": " + ex.what());
        config = EngineConfig{};
    }

    applyEnvironment(config);
    normalize(config);
    return config;
}

} // namespace torgrab::config
