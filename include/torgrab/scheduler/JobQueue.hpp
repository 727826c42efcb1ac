#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <set>
#include <string>
#include <vector>

namespace torgrab::scheduler {

// Pending job ids ordered by priority (higher first), FIFO within a priority.
// Delayed entries become eligible at their readyAt time.
class JobQueue {
public:
    using Clock = std::chrono::steady_clock;

    void push(const std::string& jobId, int priority);
    void pushDelayed(const std::string& jobId, int priority, Clock::time_point readyAt);

    // Blocks until a job is due. Returns nullopt once the queue is closed.
    std::optional<std::string> pop();
    std::optional<std::string> tryPop();

    // Wakes every blocked pop(). Entries pushed afterwards are kept for drain().
    void close();
    // Removes and returns everything still queued, due or not.
    std::vector<std::string> drain();

    std::size_t size() const;
    bool closed() const;

private:
    struct Ready {
        int priority;
        std::uint64_t sequence;
        std::string jobId;

        bool operator<(const Ready& other) const {
            if (priority != other.priority) {
                return priority > other.priority;
            }
            return sequence < other.sequence;
        }
    };

    struct Delayed {
        Clock::time_point readyAt;
        Ready entry;

        bool operator>(const Delayed& other) const { return readyAt > other.readyAt; }
    };

    void promoteLocked(Clock::time_point now);
    std::optional<std::string> takeLocked();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::set<Ready> ready_;
    std::priority_queue<Delayed, std::vector<Delayed>, std::greater<Delayed>> delayed_;
    std::uint64_t sequence_{};
    bool closed_{false};
};

} // namespace torgrab::scheduler
