#include "torgrab/health/HealthMonitor.hpp"
#include "torgrab/util/Logging.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <vector>

namespace torgrab::health {

using model::Clock;
using model::NodeState;

HealthMonitor::HealthMonitor(pool::ExitNodePool& pool,
                             boost::asio::io_context& io,
                             boost::asio::thread_pool& executor,
                             HealthOptions options)
    : pool_(pool)
    , executor_(executor)
    , options_(options)
    , timer_(std::make_unique<boost::asio::steady_timer>(io))
    , schedule_(std::make_shared<Schedule>()) {
    if (options_.tick <= std::chrono::milliseconds::zero()) {
        options_.tick = std::chrono::milliseconds{1000};
    }
    options_.tick = std::min(options_.tick, options_.interval);
}

HealthMonitor::~HealthMonitor() {
    stop();
}

void HealthMonitor::start() {
    std::scoped_lock guard(schedule_->mutex);
    {
        std::scoped_lock lock(mutex_);
        if (running_) {
            return;
        }
        running_ = true;
    }
    schedule_->owner = this;
    util::log(util::LogLevel::info, "Health monitor probing every " + std::to_string(options_.interval.count()) + "ms");
    scheduleTick();
}

void HealthMonitor::stop() {
    {
        std::scoped_lock guard(schedule_->mutex);
        schedule_->owner = nullptr;
        timer_->cancel();
        std::scoped_lock lock(mutex_);
        running_ = false;
    }
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return inFlight_.empty(); });
}

// Called with schedule_->mutex held.
void HealthMonitor::scheduleTick() {
    timer_->expires_after(options_.tick);
    timer_->async_wait([schedule = schedule_](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        std::scoped_lock guard(schedule->mutex);
        if (schedule->owner) {
            schedule->owner->tick();
        }
    });
}

void HealthMonitor::tick() {
    {
        std::scoped_lock lock(mutex_);
        if (!running_) {
            return;
        }
    }

    pool_.replenish();

    const auto now = Clock::now();
    auto ids = pool_.nodeIds();
    std::vector<std::string> due;
    {
        std::scoped_lock lock(mutex_);
        for (auto it = nextProbe_.begin(); it != nextProbe_.end();) {
            if (std::find(ids.begin(), ids.end(), it->first) == ids.end()) {
                it = nextProbe_.erase(it);
            } else {
                ++it;
            }
        }
        for (const auto& id : ids) {
            auto [it, inserted] = nextProbe_.try_emplace(id, now + options_.interval);
            if (inserted || it->second > now || inFlight_.count(id) != 0) {
                continue;
            }
            it->second = now + options_.interval;
            inFlight_.insert(id);
            due.push_back(id);
        }
    }

    for (const auto& id : due) {
        boost::asio::post(executor_, [this, id]() {
            try {
                probeNode(id);
            } catch (const std::exception& ex) {
                util::log(util::LogLevel::error, "Health probe of " + id + " failed: " + ex.what());
            }
            std::scoped_lock lock(mutex_);
            inFlight_.erase(id);
            cv_.notify_all();
        });
    }

    std::scoped_lock lock(mutex_);
    if (running_) {
        scheduleTick();
    }
}

std::size_t HealthMonitor::probeAll() {
    std::size_t probed = 0;
    for (const auto& id : pool_.nodeIds()) {
        if (probeNode(id)) {
            ++probed;
        }
    }
    return probed;
}

bool HealthMonitor::probeNode(const std::string& nodeId) {
    auto lease = pool_.leaseForProbe(nodeId);
    if (!lease) {
        return false;
    }
    handle(*lease);
    return true;
}

void HealthMonitor::handle(pool::NodeLease& lease) {
    auto outcome = pool_.probe(lease);
    auto policy = pool_.policy();
    const auto now = Clock::now();
    const auto& node = outcome.node;

    if (!outcome.healthy) {
        if (policy->shouldRetire(node, now)) {
            util::log(util::LogLevel::warn, "Retiring " + node.id + " after " +
                                                std::to_string(node.consecutiveFailures) + " failed probe(s)");
            pool_.retire(node.id);
            return;
        }
        pool_.quarantine(lease);
        if (policy->shouldRotate(node, now)) {
            pool_.rotate(lease);
        }
        return;
    }

    if (node.state == NodeState::ready && policy->shouldRotate(node, now)) {
        util::log(util::LogLevel::debug, "Rotating " + node.id + " by age");
        pool_.rotate(lease);
    }
}

} // namespace torgrab::health
