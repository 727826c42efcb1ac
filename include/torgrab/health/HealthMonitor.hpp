#pragma once

#include "torgrab/pool/ExitNodePool.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace torgrab::health {

struct HealthOptions {
    // Per-node probe cadence.
    std::chrono::milliseconds interval{30000};
    // How often the schedule is checked for due nodes.
    std::chrono::milliseconds tick{1000};
};

// Out-of-band probing of pool members. Probes run on the worker pool while the
// schedule lives on the io_context; each probe holds a probe lease on its node.
class HealthMonitor {
public:
    HealthMonitor(pool::ExitNodePool& pool,
                  boost::asio::io_context& io,
                  boost::asio::thread_pool& executor,
                  HealthOptions options);
    ~HealthMonitor();

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    void start();
    // Cancels the schedule and waits for a running tick and the probes it posted.
    // No timer handler touches the monitor afterwards, so it may be destroyed
    // while the io_context keeps running.
    void stop();

    // Probes every node that can be leased right now, on the calling thread.
    // Returns the number of nodes probed.
    std::size_t probeAll();
    // False when the node is leased, starting, retiring or gone.
    bool probeNode(const std::string& nodeId);

private:
    // Shared with every pending timer handler. A tick runs only while holding
    // `mutex` with `owner` set; stop() clears `owner` under the same mutex, so no
    // tick can start or still be running once stop() returns.
    struct Schedule {
        std::mutex mutex;
        HealthMonitor* owner{nullptr};
    };

    void scheduleTick();
    void tick();
    void handle(pool::NodeLease& lease);

    pool::ExitNodePool& pool_;
    boost::asio::thread_pool& executor_;
    HealthOptions options_;
    std::unique_ptr<boost::asio::steady_timer> timer_;
    std::shared_ptr<Schedule> schedule_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, model::Clock::time_point> nextProbe_;
    std::set<std::string> inFlight_;
    bool running_{false};
};

} // namespace torgrab::health
