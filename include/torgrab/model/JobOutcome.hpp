#pragma once

#include "torgrab/model/ScrapeJob.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace torgrab::model {

// Row persisted per finished job. Page bodies are referenced by digest, never stored.
struct JobOutcome {
    std::string jobId;
    JobStatus status{JobStatus::abandoned};
    std::string targetUrl;
    std::string nodeId;
    std::string exitAddress;
    int statusCode{};
    std::uint64_t bodyBytes{};
    std::string contentDigest;
    unsigned attempts{};
    std::string reason;
    std::chrono::system_clock::time_point finishedAt{};
};

} // namespace torgrab::model
