#pragma once

#include "torgrab/model/ScrapeArtifact.hpp"

#include <string>

namespace torgrab::sink {

// Terminal job notifications. Implementations must return quickly; anything slow
// is handed off to their own executor.
class ResultSink {
public:
    virtual ~ResultSink() = default;

    virtual void onSucceeded(const std::string& jobId, const model::ScrapeArtifact& artifact) = 0;
    virtual void onAbandoned(const std::string& jobId, const std::string& reason) = 0;
};

} // namespace torgrab::sink
