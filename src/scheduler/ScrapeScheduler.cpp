#include "torgrab/scheduler/ScrapeScheduler.hpp"
#include "torgrab/util/Logging.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <utility>

namespace torgrab::scheduler {

using model::JobStatus;

ScrapeScheduler::ScrapeScheduler(pool::ExitNodePool& pool,
                                 Fetcher& fetcher,
                                 sink::ResultSink& sink,
                                 SchedulerOptions options)
    : pool_(pool)
    , fetcher_(fetcher)
    , sink_(sink)
    , options_(options)
    , backoff_(options.backoff) {
    options_.workers = std::max(1u, options_.workers);
}

ScrapeScheduler::~ScrapeScheduler() {
    stop();
}

void ScrapeScheduler::start() {
    std::scoped_lock lock(mutex_);
    if (started_ || stopped_) {
        return;
    }
    started_ = true;
    workers_ = std::make_unique<boost::asio::thread_pool>(options_.workers);
    for (unsigned i = 0; i < options_.workers; ++i) {
        boost::asio::post(*workers_, [this]() { workerLoop(); });
    }
    util::log(util::LogLevel::info, "Scrape scheduler started with " + std::to_string(options_.workers) + " worker(s)");
}

void ScrapeScheduler::stop() {
    {
        std::scoped_lock lock(mutex_);
        if (stopped_) {
            return;
        }
        stopped_ = true;
    }
    queue_.close();
    if (workers_) {
        workers_->join();
    }

    auto remaining = queue_.drain();
    for (const auto& jobId : remaining) {
        finish(jobId, JobStatus::abandoned, "scheduler stopped");
    }
    if (!remaining.empty()) {
        util::log(util::LogLevel::warn, "Scheduler stopped with " + std::to_string(remaining.size()) + " pending job(s)");
    }
}

std::string ScrapeScheduler::submit(const std::string& targetUrl,
                                    int priority,
                                    std::optional<unsigned> maxAttempts,
                                    std::shared_ptr<const pool::RotationPolicy> policy) {
    model::ScrapeJob job;
    job.targetUrl = targetUrl;
    job.priority = priority;
    job.maxAttempts = maxAttempts.value_or(options_.defaultMaxAttempts);
    job.policy = std::move(policy);
    job.submittedAt = std::chrono::system_clock::now();

    std::string rejection;
    if (targetUrl.empty()) {
        rejection = "empty target URL";
    } else if (job.maxAttempts == 0) {
        rejection = "maxAttempts must be at least 1";
    }

    std::scoped_lock lock(mutex_);
    job.id = "job-" + std::to_string(++nextId_);
    job.jitterSeed = seeds_();
    if (rejection.empty() && stopped_) {
        rejection = "scheduler stopped";
    }

    if (!rejection.empty()) {
        job.status = JobStatus::failed;
        job.lastError = rejection;
        job.finishedAt = job.submittedAt;
        util::log(util::LogLevel::warn, "Rejected " + job.id + ": " + rejection);
        auto id = job.id;
        jobs_.emplace(id, std::move(job));
        return id;
    }

    auto id = job.id;
    jobs_.emplace(id, std::move(job));
    ++outstanding_;
    queue_.push(id, priority);
    util::log(util::LogLevel::debug, "Queued " + id + " priority " + std::to_string(priority) + " " + targetUrl);
    return id;
}

std::optional<JobStatus> ScrapeScheduler::status(const std::string& jobId) const {
    std::scoped_lock lock(mutex_);
    auto it = jobs_.find(jobId);
    if (it == jobs_.end()) {
        return std::nullopt;
    }
    return it->second.status;
}

std::optional<model::ScrapeJob> ScrapeScheduler::job(const std::string& jobId) const {
    std::scoped_lock lock(mutex_);
    auto it = jobs_.find(jobId);
    if (it == jobs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<model::ScrapeJob> ScrapeScheduler::jobs() const {
    std::scoped_lock lock(mutex_);
    std::vector<model::ScrapeJob> result;
    result.reserve(jobs_.size());
    for (const auto& [id, job] : jobs_) {
        result.push_back(job);
    }
    return result;
}

bool ScrapeScheduler::waitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idleCv_.wait_for(lock, timeout, [this]() { return outstanding_ == 0; });
}

void ScrapeScheduler::workerLoop() {
    while (auto jobId = queue_.pop()) {
        try {
            dispatch(*jobId);
        } catch (const std::exception& ex) {
            util::log(util::LogLevel::error, "Dispatch of " + *jobId + " failed: " + ex.what());
            finish(*jobId, JobStatus::abandoned, std::string{"internal error: "} + ex.what());
        }
    }
}

void ScrapeScheduler::dispatch(const std::string& jobId) {
    std::string targetUrl;
    int priority = 0;
    std::shared_ptr<const pool::RotationPolicy> policy;
    {
        std::scoped_lock lock(mutex_);
        auto it = jobs_.find(jobId);
        if (it == jobs_.end() || it->second.status != JobStatus::pending) {
            return;
        }
        targetUrl = it->second.targetUrl;
        priority = it->second.priority;
        policy = it->second.policy;
    }

    pool::NodeLease lease;
    try {
        lease = pool_.checkout(options_.checkoutTimeout);
    } catch (const pool::PoolError& ex) {
        if (ex.type() == pool::PoolError::Type::exhausted) {
            util::log(util::LogLevel::debug, std::string{"PoolExhausted for "} + jobId + ", requeueing");
            queue_.pushDelayed(jobId, priority, JobQueue::Clock::now() + options_.exhaustedDelay);
            return;
        }
        finish(jobId, JobStatus::abandoned, ex.what());
        return;
    }

    {
        std::scoped_lock lock(mutex_);
        auto& job = jobs_.at(jobId);
        job.status = JobStatus::dispatched;
        job.assignedNodeId = lease.nodeId();
    }

    FetchResult result;
    try {
        result = fetcher_.fetch(FetchRequest{targetUrl, lease.proxyEndpoint(), options_.requestTimeout});
    } catch (const std::exception& ex) {
        result = FetchResult{};
        result.error = std::string{"RequestFailed: "} + ex.what();
    }
    if (!result.ok && result.error.empty()) {
        result.error = "RequestFailed";
    }

    const auto nodeId = lease.nodeId();
    std::string exitAddress;
    if (auto node = pool_.find(nodeId)) {
        exitAddress = node->exitAddress;
    }
    lease.checkin(result.ok ? pool::Outcome::success : pool::Outcome::failure, policy.get());

    if (result.ok) {
        model::ScrapeArtifact artifact;
        {
            std::scoped_lock lock(mutex_);
            auto& job = jobs_.at(jobId);
            job.status = JobStatus::succeeded;
            job.assignedNodeId.clear();
            job.lastError.clear();
            job.finishedAt = std::chrono::system_clock::now();

            artifact.jobId = jobId;
            artifact.targetUrl = job.targetUrl;
            artifact.effectiveUrl = result.effectiveUrl.empty() ? job.targetUrl : result.effectiveUrl;
            artifact.nodeId = nodeId;
            artifact.exitAddress = exitAddress;
            artifact.statusCode = result.statusCode;
            artifact.contentType = std::move(result.contentType);
            artifact.body = std::move(result.body);
            artifact.attempts = job.attempt + 1;
            artifact.elapsed = result.elapsed;
            artifact.fetchedAt = job.finishedAt;
        }
        notifySucceeded(jobId, artifact);
        std::scoped_lock lock(mutex_);
        --outstanding_;
        idleCv_.notify_all();
        return;
    }

    std::string reason;
    {
        std::scoped_lock lock(mutex_);
        auto& job = jobs_.at(jobId);
        ++job.attempt;
        job.lastError = result.error;
        job.assignedNodeId.clear();
        if (job.attempt < job.maxAttempts) {
            job.status = JobStatus::pending;
            auto delay = backoff_.delay(job.attempt, job.jitterSeed);
            util::log(util::LogLevel::info, jobId + " attempt " + std::to_string(job.attempt) + "/" +
                                                std::to_string(job.maxAttempts) + " via " + nodeId + " failed (" +
                                                result.error + "), retrying in " + std::to_string(delay.count()) + "ms");
            queue_.pushDelayed(jobId, job.priority, JobQueue::Clock::now() + delay);
            return;
        }
        reason = result.error + " after " + std::to_string(job.attempt) + " attempt(s)";
    }
    finish(jobId, JobStatus::abandoned, reason);
}

void ScrapeScheduler::finish(const std::string& jobId, JobStatus status, const std::string& reason) {
    {
        std::scoped_lock lock(mutex_);
        auto it = jobs_.find(jobId);
        if (it == jobs_.end() || model::isTerminal(it->second.status)) {
            return;
        }
        auto& job = it->second;
        job.status = status;
        job.assignedNodeId.clear();
        job.lastError = reason;
        job.finishedAt = std::chrono::system_clock::now();
    }
    if (status == JobStatus::abandoned) {
        notifyAbandoned(jobId, reason);
    }
    std::scoped_lock lock(mutex_);
    --outstanding_;
    idleCv_.notify_all();
}

void ScrapeScheduler::notifySucceeded(const std::string& jobId, const model::ScrapeArtifact& artifact) {
    try {
        sink_.onSucceeded(jobId, artifact);
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, "Result sink rejected " + jobId + ": " + ex.what());
    }
}

void ScrapeScheduler::notifyAbandoned(const std::string& jobId, const std::string& reason) {
    try {
        sink_.onAbandoned(jobId, reason);
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, "Result sink rejected " + jobId + ": " + ex.what());
    }
}

} // namespace torgrab::scheduler
