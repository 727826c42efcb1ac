#pragma once

#include "torgrab/health/HealthMonitor.hpp"
#include "torgrab/pool/ExitNodePool.hpp"
#include "torgrab/pool/RotationPolicy.hpp"
#include "torgrab/repository/DatabaseConfig.hpp"
#include "torgrab/runtime/DockerRuntime.hpp"
#include "torgrab/scheduler/ScrapeScheduler.hpp"
#include "torgrab/util/Logging.hpp"

#include <boost/json.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace torgrab::config {

struct EngineConfig {
    util::LogLevel logLevel{util::LogLevel::info};
    pool::PoolOptions pool;
    pool::RotationThresholds rotation;
    health::HealthOptions health;
    std::vector<std::string> probeTargets;
    scheduler::SchedulerOptions scheduler;
    runtime::DockerOptions runtime;
    repository::DatabaseConfig database;
    bool persistOutcomes{false};
};

// Overlays the sections present in `json` on the defaults.
EngineConfig parseEngineConfig(const boost::json::object& json);

// TORGRAB_* variables win over the file.
void applyEnvironment(EngineConfig& config);

// Clamps values into a consistent configuration (min <= max, cap >= base, ...).
void normalize(EngineConfig& config);

// File, then environment, then normalize. A missing file means defaults; a
// malformed one is logged and ignored.
EngineConfig loadEngineConfig(const std::filesystem::path& path);

} // namespace torgrab::config
