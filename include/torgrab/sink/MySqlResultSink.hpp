#pragma once

#include "torgrab/repository/OutcomesRepository.hpp"
#include "torgrab/sink/ResultSink.hpp"

#include <boost/asio/thread_pool.hpp>

namespace torgrab::sink {

// Persists outcomes on the worker pool so the dispatching thread never waits on
// the database. Write failures are logged and dropped.
class MySqlResultSink final : public ResultSink {
public:
    MySqlResultSink(repository::OutcomesRepository& repository, boost::asio::thread_pool& executor);

    void onSucceeded(const std::string& jobId, const model::ScrapeArtifact& artifact) override;
    void onAbandoned(const std::string& jobId, const std::string& reason) override;

private:
    void persist(model::JobOutcome outcome);

    repository::OutcomesRepository& repository_;
    boost::asio::thread_pool& executor_;
};

} // namespace torgrab::sink
