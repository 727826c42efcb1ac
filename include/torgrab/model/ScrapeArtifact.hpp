#pragma once

#include <chrono>
#include <string>

namespace torgrab::model {

struct ScrapeArtifact {
    std::string jobId;
    std::string targetUrl;
    std::string effectiveUrl;
    std::string nodeId;
    std::string exitAddress;
    int statusCode{};
    std::string contentType;
    std::string body;
    unsigned attempts{};
    std::chrono::milliseconds elapsed{};
    std::chrono::system_clock::time_point fetchedAt{};
};

} // namespace torgrab::model
