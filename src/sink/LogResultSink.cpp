#include "torgrab/sink/LogResultSink.hpp"
#include "torgrab/util/Digest.hpp"
#include "torgrab/util/Logging.hpp"

namespace torgrab::sink {

void LogResultSink::onSucceeded(const std::string& jobId, const model::ScrapeArtifact& artifact) {
    util::log(util::LogLevel::info,
              "Job " + jobId + " succeeded: " + artifact.effectiveUrl + " HTTP " + std::to_string(artifact.statusCode) +
                  " " + std::to_string(artifact.body.size()) + " bytes sha256=" + util::sha256Hex(artifact.body) +
                  " via " + artifact.nodeId +
                  (artifact.exitAddress.empty() ? std::string{} : " (" + artifact.exitAddress + ")") + " after " +
                  std::to_string(artifact.attempts) + " attempt(s)");
}

void LogResultSink::onAbandoned(const std::string& jobId, const std::string& reason) {
    util::log(util::LogLevel::warn, "Job " + jobId + " abandoned: " + reason);
}

} // namespace torgrab::sink
