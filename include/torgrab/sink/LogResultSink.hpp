#pragma once

#include "torgrab/sink/ResultSink.hpp"

namespace torgrab::sink {

class LogResultSink final : public ResultSink {
public:
    void onSucceeded(const std::string& jobId, const model::ScrapeArtifact& artifact) override;
    void onAbandoned(const std::string& jobId, const std::string& reason) override;
};

} // namespace torgrab::sink
