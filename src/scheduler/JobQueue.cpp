#include "torgrab/scheduler/JobQueue.hpp"

namespace torgrab::scheduler {

void JobQueue::push(const std::string& jobId, int priority) {
    {
        std::scoped_lock lock(mutex_);
        ready_.insert(Ready{priority, sequence_++, jobId});
    }
    cv_.notify_one();
}

void JobQueue::pushDelayed(const std::string& jobId, int priority, Clock::time_point readyAt) {
    {
        std::scoped_lock lock(mutex_);
        delayed_.push(Delayed{readyAt, Ready{priority, sequence_++, jobId}});
    }
    // A sleeping pop() may be waiting on a later deadline.
    cv_.notify_all();
}

std::optional<std::string> JobQueue::pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        if (closed_) {
            return std::nullopt;
        }
        promoteLocked(Clock::now());
        if (auto jobId = takeLocked()) {
            return jobId;
        }
        if (delayed_.empty()) {
            cv_.wait(lock);
        } else {
            cv_.wait_until(lock, delayed_.top().readyAt);
        }
    }
}

std::optional<std::string> JobQueue::tryPop() {
    std::scoped_lock lock(mutex_);
    if (closed_) {
        return std::nullopt;
    }
    promoteLocked(Clock::now());
    return takeLocked();
}

void JobQueue::close() {
    {
        std::scoped_lock lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

std::vector<std::string> JobQueue::drain() {
    std::scoped_lock lock(mutex_);
    std::vector<std::string> remaining;
    for (const auto& entry : ready_) {
        remaining.push_back(entry.jobId);
    }
    ready_.clear();
    while (!delayed_.empty()) {
        remaining.push_back(delayed_.top().entry.jobId);
        delayed_.pop();
    }
    return remaining;
}

std::size_t JobQueue::size() const {
    std::scoped_lock lock(mutex_);
    return ready_.size() + delayed_.size();
}

bool JobQueue::closed() const {
    std::scoped_lock lock(mutex_);
    return closed_;
}

void JobQueue::promoteLocked(Clock::time_point now) {
    while (!delayed_.empty() && delayed_.top().readyAt <= now) {
        auto entry = delayed_.top().entry;
        delayed_.pop();
        entry.sequence = sequence_++;
        ready_.insert(std::move(entry));
    }
}

std::optional<std::string> JobQueue::takeLocked() {
    if (ready_.empty()) {
        return std::nullopt;
    }
    auto it = ready_.begin();
    std::string jobId = it->jobId;
    ready_.erase(it);
    return jobId;
}

} // namespace torgrab::scheduler
