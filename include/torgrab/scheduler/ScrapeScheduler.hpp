#pragma once

#include "torgrab/model/ScrapeJob.hpp"
#include "torgrab/pool/ExitNodePool.hpp"
#include "torgrab/scheduler/Backoff.hpp"
#include "torgrab/scheduler/Fetcher.hpp"
#include "torgrab/scheduler/JobQueue.hpp"
#include "torgrab/sink/ResultSink.hpp"

#include <boost/asio/thread_pool.hpp>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace torgrab::scheduler {

struct SchedulerOptions {
    unsigned workers{4};
    std::chrono::milliseconds requestTimeout{30000};
    std::chrono::milliseconds checkoutTimeout{10000};
    // Requeue delay after PoolExhausted; does not consume an attempt.
    std::chrono::milliseconds exhaustedDelay{1000};
    unsigned defaultMaxAttempts{3};
    BackoffOptions backoff;
};

// Job intake and dispatch. Jobs move Pending -> Dispatched -> Succeeded, back to
// Pending for a retry, or Abandoned once maxAttempts failures are spent. Every
// dispatch holds one node lease and returns it on every path.
class ScrapeScheduler {
public:
    ScrapeScheduler(pool::ExitNodePool& pool, Fetcher& fetcher, sink::ResultSink& sink, SchedulerOptions options);
    ~ScrapeScheduler();

    ScrapeScheduler(const ScrapeScheduler&) = delete;
    ScrapeScheduler& operator=(const ScrapeScheduler&) = delete;

    void start();
    // Lets in-flight dispatches finish, then abandons what is still queued.
    void stop();

    // Invalid jobs (empty URL, zero attempts) are recorded as Failed.
    std::string submit(const std::string& targetUrl,
                       int priority = 0,
                       std::optional<unsigned> maxAttempts = std::nullopt,
                       std::shared_ptr<const pool::RotationPolicy> policy = nullptr);

    std::optional<model::JobStatus> status(const std::string& jobId) const;
    std::optional<model::ScrapeJob> job(const std::string& jobId) const;
    std::vector<model::ScrapeJob> jobs() const;

    // True once every submitted job reached a terminal status.
    bool waitIdle(std::chrono::milliseconds timeout);

    const SchedulerOptions& options() const noexcept { return options_; }

private:
    void workerLoop();
    void dispatch(const std::string& jobId);
    void finish(const std::string& jobId, model::JobStatus status, const std::string& reason);
    void notifySucceeded(const std::string& jobId, const model::ScrapeArtifact& artifact);
    void notifyAbandoned(const std::string& jobId, const std::string& reason);

    pool::ExitNodePool& pool_;
    Fetcher& fetcher_;
    sink::ResultSink& sink_;
    SchedulerOptions options_;
    Backoff backoff_;
    JobQueue queue_;
    std::unique_ptr<boost::asio::thread_pool> workers_;

    mutable std::mutex mutex_;
    std::condition_variable idleCv_;
    std::unordered_map<std::string, model::ScrapeJob> jobs_;
    std::size_t outstanding_{};
    std::uint64_t nextId_{};
    std::mt19937_64 seeds_{std::random_device{}()};
    bool started_{false};
    bool stopped_{false};
};

} // namespace torgrab::scheduler
