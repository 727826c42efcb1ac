#include "torgrab/health/HealthMonitor.hpp"
#include "support/Fakes.hpp"

#include <gtest/gtest.h>

#include <boost/asio/executor_work_guard.hpp>

#include <thread>

using namespace torgrab;
using namespace std::chrono_literals;
using model::NodeState;

class HealthMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        options_.minSize = 1;
        options_.maxSize = 1;
        options_.checkoutTimeout = 200ms;
        options_.probeTimeout = 100ms;
        options_.startupProbeAttempts = 1;
        options_.creationCooldown = 20ms;

        thresholds_.maxAge = 3600s;
        thresholds_.failureThreshold = 1;
        thresholds_.retireThreshold = 3;
        thresholds_.quarantineCeiling = 3600s;
    }

    void build(health::HealthOptions healthOptions = {}) {
        pool_ = std::make_unique<pool::ExitNodePool>(runtime_, control_, prober_,
                                                     std::make_shared<pool::ThresholdRotationPolicy>(thresholds_),
                                                     executor_, options_);
        monitor_ = std::make_unique<health::HealthMonitor>(*pool_, io_, executor_, healthOptions);
        ASSERT_EQ(pool_->start(), options_.minSize);
    }

    std::string onlyNode() { return pool_->nodeIds().front(); }

    boost::asio::thread_pool executor_{4};
    boost::asio::io_context io_;
    test::FakeRuntime runtime_;
    test::FakeControl control_;
    test::FakeProber prober_;
    pool::PoolOptions options_;
    pool::RotationThresholds thresholds_;
    std::unique_ptr<pool::ExitNodePool> pool_;
    std::unique_ptr<health::HealthMonitor> monitor_;
};

TEST_F(HealthMonitorTest, SuccessfulProbeRestoresQuarantinedNode) {
    build();
    const auto id = onlyNode();

    pool_->checkout().checkin(pool::Outcome::failure);
    ASSERT_EQ(pool_->find(id)->state, NodeState::quarantined);

    EXPECT_TRUE(monitor_->probeNode(id));
    auto node = pool_->find(id);
    EXPECT_EQ(node->state, NodeState::ready);
    EXPECT_EQ(node->consecutiveFailures, 0u);

    auto lease = pool_->checkout(100ms);
    EXPECT_EQ(lease.nodeId(), id);
}

TEST_F(HealthMonitorTest, FailedProbeQuarantinesAndRotates) {
    build();
    const auto id = onlyNode();
    const auto port = pool_->find(id)->proxyEndpoint.port;
    prober_.setHealthy(port, false);

    EXPECT_TRUE(monitor_->probeNode(id));
    auto node = pool_->find(id);
    EXPECT_EQ(node->state, NodeState::quarantined);
    EXPECT_EQ(node->rotations, 1u);
    EXPECT_EQ(node->consecutiveFailures, 0u);
    EXPECT_EQ(node->totalFailures, 1u);
    EXPECT_EQ(control_.rotations(), 1u);
    EXPECT_THROW(pool_->checkout(50ms), pool::PoolError);

    prober_.setHealthy(port, true);
    EXPECT_TRUE(monitor_->probeNode(id));
    EXPECT_EQ(pool_->find(id)->state, NodeState::ready);
}

TEST_F(HealthMonitorTest, FailedRotationLeavesNodeQuarantined) {
    build();
    const auto id = onlyNode();
    prober_.setHealthy(pool_->find(id)->proxyEndpoint.port, false);
    control_.setFailing(true);

    EXPECT_TRUE(monitor_->probeNode(id));
    auto node = pool_->find(id);
    EXPECT_EQ(node->state, NodeState::quarantined);
    EXPECT_EQ(node->rotations, 0u);
    EXPECT_EQ(node->consecutiveFailures, 1u);
}

TEST_F(HealthMonitorTest, RepeatedFailuresRetireAndReplenish) {
    thresholds_.failureThreshold = 10;
    thresholds_.retireThreshold = 2;
    build();
    const auto id = onlyNode();
    const auto runtimeName = pool_->find(id)->runtimeName;
    prober_.setHealthy(pool_->find(id)->proxyEndpoint.port, false);

    EXPECT_TRUE(monitor_->probeNode(id));
    EXPECT_EQ(pool_->find(id)->state, NodeState::quarantined);
    EXPECT_EQ(control_.rotations(), 0u);

    EXPECT_TRUE(monitor_->probeNode(id));
    EXPECT_FALSE(pool_->find(id).has_value());
    EXPECT_EQ(runtime_.stopCalls(runtimeName), 1);

    EXPECT_TRUE(test::waitUntil([&]() {
        auto nodes = pool_->snapshot();
        return nodes.size() == 1 && nodes.front().id != id && nodes.front().state == NodeState::ready;
    }));
}

TEST_F(HealthMonitorTest, DeadContainerCountsAsFailedProbe) {
    thresholds_.failureThreshold = 10;
    thresholds_.retireThreshold = 1;
    build();
    const auto node = pool_->find(onlyNode()).value();

    runtime_.crash(node.runtimeName);
    EXPECT_TRUE(monitor_->probeNode(node.id));

    EXPECT_FALSE(pool_->find(node.id).has_value());
    EXPECT_EQ(runtime_.stopCalls(node.runtimeName), 1);
}

TEST_F(HealthMonitorTest, NeverProbesLeasedNode) {
    build();
    const auto id = onlyNode();
    auto lease = pool_->checkout();
    const auto probesBefore = prober_.calls();

    EXPECT_FALSE(monitor_->probeNode(id));
    EXPECT_EQ(monitor_->probeAll(), 0u);
    EXPECT_EQ(prober_.calls(), probesBefore);
    EXPECT_EQ(pool_->find(id)->state, NodeState::in_use);
}

TEST_F(HealthMonitorTest, RotatesNodesPastMaximumAge) {
    thresholds_.maxAge = 0s;
    build();
    const auto id = onlyNode();
    std::this_thread::sleep_for(5ms);

    EXPECT_EQ(monitor_->probeAll(), 1u);
    auto node = pool_->find(id);
    EXPECT_EQ(node->state, NodeState::ready);
    EXPECT_EQ(node->rotations, 1u);
    EXPECT_EQ(control_.rotations(), 1u);
}

TEST_F(HealthMonitorTest, ScheduledProbesRunOnTheTimer) {
    health::HealthOptions healthOptions;
    healthOptions.interval = 20ms;
    healthOptions.tick = 5ms;
    build(healthOptions);
    const auto probesBefore = prober_.calls();

    monitor_->start();
    std::thread ioThread([this]() { io_.run(); });

    EXPECT_TRUE(test::waitUntil([&]() { return prober_.calls() >= probesBefore + 3; }));

    monitor_->stop();
    io_.stop();
    ioThread.join();
    EXPECT_EQ(pool_->find(onlyNode())->state, NodeState::ready);
}

TEST_F(HealthMonitorTest, StopAndDestroyWhileTimerIsLive) {
    build();
    auto guard = boost::asio::make_work_guard(io_);
    std::thread ioThread([this]() { io_.run(); });

    health::HealthOptions fast;
    fast.interval = 1ms;
    fast.tick = 1ms;
    for (int round = 0; round < 300; ++round) {
        auto monitor = std::make_unique<health::HealthMonitor>(*pool_, io_, executor_, fast);
        monitor->start();
        std::this_thread::sleep_for(std::chrono::microseconds(500 + (round % 8) * 400));
        monitor->stop();
        monitor.reset();
    }

    guard.reset();
    io_.stop();
    ioThread.join();

    auto node = pool_->find(onlyNode());
    ASSERT_TRUE(node.has_value());
    EXPECT_EQ(node->state, NodeState::ready);
    EXPECT_GT(prober_.calls(), 1);
}
