#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace torgrab::pool {
class RotationPolicy;
}

namespace torgrab::model {

enum class JobStatus {
    pending,
    dispatched,
    succeeded,
    failed,
    abandoned
};

inline const char* toString(JobStatus status) {
    switch (status) {
    case JobStatus::pending:    return "Pending";
    case JobStatus::dispatched: return "Dispatched";
    case JobStatus::succeeded:  return "Succeeded";
    case JobStatus::failed:     return "Failed";
    case JobStatus::abandoned:  return "Abandoned";
    }
    return "Unknown";
}

inline bool isTerminal(JobStatus status) {
    return status == JobStatus::succeeded || status == JobStatus::failed || status == JobStatus::abandoned;
}

struct ScrapeJob {
    std::string id;
    std::string targetUrl;
    int priority{};
    unsigned maxAttempts{1};
    unsigned attempt{};
    JobStatus status{JobStatus::pending};
    std::string assignedNodeId;
    std::string lastError;
    std::uint64_t jitterSeed{};
    std::chrono::system_clock::time_point submittedAt{};
    std::chrono::system_clock::time_point finishedAt{};
    // Consulted on checkin instead of the pool default when set.
    std::shared_ptr<const pool::RotationPolicy> policy;
};

} // namespace torgrab::model
