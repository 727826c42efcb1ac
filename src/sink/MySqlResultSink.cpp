#include "torgrab/sink/MySqlResultSink.hpp"
#include "torgrab/util/Digest.hpp"
#include "torgrab/util/Logging.hpp"

#include <boost/asio/post.hpp>

namespace torgrab::sink {

MySqlResultSink::MySqlResultSink(repository::OutcomesRepository& repository, boost::asio::thread_pool& executor)
    : repository_(repository)
    , executor_(executor) {}

void MySqlResultSink::onSucceeded(const std::string& jobId, const model::ScrapeArtifact& artifact) {
    model::JobOutcome outcome;
    outcome.jobId = jobId;
    outcome.status = model::JobStatus::succeeded;
    outcome.targetUrl = artifact.targetUrl;
    outcome.nodeId = artifact.nodeId;
    outcome.exitAddress = artifact.exitAddress;
    outcome.statusCode = artifact.statusCode;
    outcome.bodyBytes = artifact.body.size();
    outcome.contentDigest = util::sha256Hex(artifact.body);
    outcome.attempts = artifact.attempts;
    outcome.finishedAt = artifact.fetchedAt;
    persist(std::move(outcome));
}

void MySqlResultSink::onAbandoned(const std::string& jobId, const std::string& reason) {
    model::JobOutcome outcome;
    outcome.jobId = jobId;
    outcome.status = model::JobStatus::abandoned;
    outcome.reason = reason;
    outcome.finishedAt = std::chrono::system_clock::now();
    persist(std::move(outcome));
}

void MySqlResultSink::persist(model::JobOutcome outcome) {
    boost::asio::post(executor_, [this, outcome = std::move(outcome)]() {
        try {
            repository_.insertOutcome(outcome);
        } catch (const std::exception& ex) {
            util::log(util::LogLevel::error, "Dropping outcome of " + outcome.jobId + ": " + ex.what());
        }
    });
}

} // namespace torgrab::sink
