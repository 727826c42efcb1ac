#include "torgrab/pool/ExitNodePool.hpp"
#include "support/Fakes.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace torgrab;
using namespace std::chrono_literals;
using model::NodeState;

class ExitNodePoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        options_.minSize = 2;
        options_.maxSize = 3;
        options_.checkoutTimeout = 500ms;
        options_.probeTimeout = 100ms;
        options_.controlTimeout = 100ms;
        options_.startupProbeAttempts = 1;
        options_.startupProbeInterval = 5ms;
        options_.creationCooldown = 20ms;
        options_.runtimeFailureLimit = 2;

        thresholds_.maxAge = 3600s;
        thresholds_.failureThreshold = 2;
        thresholds_.retireThreshold = 4;
        thresholds_.quarantineCeiling = 3600s;
    }

    pool::ExitNodePool& makePool() {
        pool_ = std::make_unique<pool::ExitNodePool>(runtime_, control_, prober_,
                                                     std::make_shared<pool::ThresholdRotationPolicy>(thresholds_),
                                                     executor_, options_);
        pool_->setStateListener([this](const std::string& id, std::optional<NodeState>, NodeState to) {
            std::scoped_lock lock(transitionsMutex_);
            transitions_.emplace_back(id, to);
        });
        return *pool_;
    }

    bool sawState(const std::string& id, NodeState state) {
        std::scoped_lock lock(transitionsMutex_);
        for (const auto& [nodeId, to] : transitions_) {
            if (nodeId == id && to == state) {
                return true;
            }
        }
        return false;
    }

    std::size_t countInState(NodeState state) {
        std::size_t count = 0;
        for (const auto& node : pool_->snapshot()) {
            if (node.state == state) {
                ++count;
            }
        }
        return count;
    }

    boost::asio::thread_pool executor_{4};
    test::FakeRuntime runtime_;
    test::FakeControl control_;
    test::FakeProber prober_;
    pool::PoolOptions options_;
    pool::RotationThresholds thresholds_;
    std::mutex transitionsMutex_;
    std::vector<std::pair<std::string, NodeState>> transitions_;
    std::unique_ptr<pool::ExitNodePool> pool_;
};

TEST_F(ExitNodePoolTest, StartBringsUpMinimumReadyNodes) {
    auto& pool = makePool();

    EXPECT_EQ(pool.start(), 2u);
    EXPECT_EQ(pool.size(), 2u);
    EXPECT_EQ(runtime_.startCalls(), 2);
    for (const auto& node : pool.snapshot()) {
        EXPECT_EQ(node.state, NodeState::ready);
        EXPECT_FALSE(node.exitAddress.empty());
        EXPECT_FALSE(node.proxyEndpoint.empty());
        EXPECT_TRUE(sawState(node.id, NodeState::starting));
    }
}

TEST_F(ExitNodePoolTest, CheckoutLeasesAndCheckinReturns) {
    auto& pool = makePool();
    pool.start();

    auto lease = pool.checkout();
    ASSERT_TRUE(lease);
    const auto id = lease.nodeId();
    auto leased = pool.find(id);
    ASSERT_TRUE(leased.has_value());
    EXPECT_EQ(leased->state, NodeState::in_use);
    EXPECT_EQ(leased->totalRequests, 1u);
    EXPECT_EQ(lease.proxyEndpoint(), leased->proxyEndpoint);

    pool.checkin(lease, pool::Outcome::success);
    EXPECT_FALSE(lease);
    EXPECT_EQ(pool.find(id)->state, NodeState::ready);
}

TEST_F(ExitNodePoolTest, ExhaustedAtMaximumAfterTimeout) {
    options_.maxSize = 2;
    auto& pool = makePool();
    pool.start();

    auto first = pool.checkout();
    auto second = pool.checkout();

    const auto started = std::chrono::steady_clock::now();
    try {
        pool.checkout(100ms);
        FAIL() << "checkout should have reported exhaustion";
    } catch (const pool::PoolError& ex) {
        EXPECT_EQ(ex.type(), pool::PoolError::Type::exhausted);
    }
    const auto waited = std::chrono::steady_clock::now() - started;
    EXPECT_GE(waited, 90ms);
    EXPECT_LT(waited, 2s);
    EXPECT_EQ(pool.size(), 2u);
}

TEST_F(ExitNodePoolTest, GrowsOnDemandUpToMaximum) {
    options_.minSize = 1;
    options_.maxSize = 3;
    auto& pool = makePool();
    EXPECT_EQ(pool.start(), 1u);

    auto a = pool.checkout(2s);
    auto b = pool.checkout(2s);
    auto c = pool.checkout(2s);
    EXPECT_EQ(pool.size(), 3u);

    std::set<std::string> ids{a.nodeId(), b.nodeId(), c.nodeId()};
    EXPECT_EQ(ids.size(), 3u);

    EXPECT_THROW(pool.checkout(50ms), pool::PoolError);
    EXPECT_EQ(pool.size(), 3u);
    EXPECT_EQ(runtime_.startCalls(), 3);
}

TEST_F(ExitNodePoolTest, RetireTwiceIsNoop) {
    auto& pool = makePool();
    pool.start();
    const auto node = pool.snapshot().front();

    pool.retire(node.id);
    EXPECT_NO_THROW(pool.retire(node.id));

    EXPECT_FALSE(pool.find(node.id).has_value());
    EXPECT_EQ(runtime_.stopCalls(node.runtimeName), 1);
    EXPECT_TRUE(sawState(node.id, NodeState::retiring));
    EXPECT_TRUE(sawState(node.id, NodeState::dead));

    // The pool refills itself back to its minimum.
    EXPECT_TRUE(test::waitUntil([&]() { return countInState(NodeState::ready) == 2; }));
}

TEST_F(ExitNodePoolTest, RetiringLeasedNodeWaitsForCheckin) {
    auto& pool = makePool();
    pool.start();

    auto lease = pool.checkout();
    const auto node = *pool.find(lease.nodeId());
    pool.retire(node.id);

    EXPECT_EQ(pool.find(node.id)->state, NodeState::in_use);
    EXPECT_EQ(runtime_.stopCalls(node.runtimeName), 0);

    lease.checkin(pool::Outcome::success);
    EXPECT_FALSE(pool.find(node.id).has_value());
    EXPECT_EQ(runtime_.stopCalls(node.runtimeName), 1);
}

TEST_F(ExitNodePoolTest, FailuresQuarantineAtThresholdAndCheckoutSkipsIt) {
    options_.minSize = 1;
    options_.maxSize = 1;
    auto& pool = makePool();
    pool.start();

    auto lease = pool.checkout();
    const auto id = lease.nodeId();
    lease.checkin(pool::Outcome::failure);
    EXPECT_EQ(pool.find(id)->state, NodeState::ready);
    EXPECT_EQ(pool.find(id)->consecutiveFailures, 1u);

    lease = pool.checkout();
    lease.checkin(pool::Outcome::failure);
    auto node = pool.find(id);
    EXPECT_EQ(node->state, NodeState::quarantined);
    EXPECT_EQ(node->totalFailures, 2u);

    EXPECT_THROW(pool.checkout(50ms), pool::PoolError);
}

TEST_F(ExitNodePoolTest, SuccessResetsConsecutiveFailures) {
    auto& pool = makePool();
    pool.start();

    auto lease = pool.checkout();
    const auto id = lease.nodeId();
    lease.checkin(pool::Outcome::failure);
    EXPECT_EQ(pool.find(id)->consecutiveFailures, 1u);

    auto other = pool.checkout();
    ASSERT_NE(other.nodeId(), id);
    lease = pool.checkout();
    ASSERT_EQ(lease.nodeId(), id);
    lease.checkin(pool::Outcome::success);
    EXPECT_EQ(pool.find(id)->consecutiveFailures, 0u);
    EXPECT_EQ(pool.find(id)->totalFailures, 1u);
    EXPECT_EQ(pool.find(id)->totalRequests, 2u);
}

TEST_F(ExitNodePoolTest, JobPolicyOverridesPoolPolicy) {
    auto& pool = makePool();
    pool.start();

    pool::RotationThresholds strict;
    strict.failureThreshold = 1;
    strict.retireThreshold = 1;
    pool::ThresholdRotationPolicy strictPolicy{strict};

    auto lease = pool.checkout();
    const auto node = *pool.find(lease.nodeId());
    lease.checkin(pool::Outcome::failure, &strictPolicy);

    EXPECT_FALSE(pool.find(node.id).has_value());
    EXPECT_EQ(runtime_.stopCalls(node.runtimeName), 1);
}

TEST_F(ExitNodePoolTest, ReplacedPolicyAppliesToLaterCheckins) {
    auto& pool = makePool();
    pool.start();

    auto first = pool.checkout();
    const auto firstId = first.nodeId();
    first.checkin(pool::Outcome::failure);
    EXPECT_EQ(pool.find(firstId)->state, NodeState::ready);

    pool::RotationThresholds strict = thresholds_;
    strict.failureThreshold = 1;
    pool.setPolicy(std::make_shared<pool::ThresholdRotationPolicy>(strict));
    EXPECT_THROW(pool.setPolicy(nullptr), std::invalid_argument);

    auto second = pool.checkout();
    const auto secondId = second.nodeId();
    EXPECT_NE(secondId, firstId);
    second.checkin(pool::Outcome::failure);
    EXPECT_EQ(pool.find(secondId)->state, NodeState::quarantined);
}

TEST_F(ExitNodePoolTest, DroppedLeaseReturnsNodeUnjudged) {
    auto& pool = makePool();
    pool.start();

    std::string id;
    {
        auto lease = pool.checkout();
        id = lease.nodeId();
    }
    auto node = pool.find(id);
    EXPECT_EQ(node->state, NodeState::ready);
    EXPECT_EQ(node->consecutiveFailures, 0u);
    EXPECT_EQ(node->totalFailures, 0u);
}

TEST_F(ExitNodePoolTest, PicksLeastRecentlyUsedNode) {
    auto& pool = makePool();
    pool.start();

    auto first = pool.checkout();
    const auto firstId = first.nodeId();
    first.checkin(pool::Outcome::success);

    auto second = pool.checkout();
    EXPECT_NE(second.nodeId(), firstId);
    second.checkin(pool::Outcome::success);

    auto third = pool.checkout();
    EXPECT_EQ(third.nodeId(), firstId);
}

TEST_F(ExitNodePoolTest, DrainStopsEverythingAndRejectsCheckouts) {
    auto& pool = makePool();
    pool.start();

    EXPECT_TRUE(pool.drain(1s));
    EXPECT_TRUE(pool.draining());
    EXPECT_EQ(pool.size(), 0u);
    EXPECT_EQ(runtime_.running(), 0u);

    try {
        pool.checkout(50ms);
        FAIL() << "checkout should be rejected while draining";
    } catch (const pool::PoolError& ex) {
        EXPECT_EQ(ex.type(), pool::PoolError::Type::shutting_down);
    }
}

TEST_F(ExitNodePoolTest, DrainWaitsForOutstandingLease) {
    auto& pool = makePool();
    pool.start();

    auto lease = pool.checkout();
    std::thread worker([&lease]() {
        std::this_thread::sleep_for(50ms);
        lease.checkin(pool::Outcome::success);
    });

    EXPECT_TRUE(pool.drain(2s));
    worker.join();
    EXPECT_EQ(pool.size(), 0u);
    EXPECT_EQ(runtime_.running(), 0u);
}

TEST_F(ExitNodePoolTest, DestroyingPoolStopsNodeStillStarting) {
    options_.minSize = 1;
    options_.checkoutTimeout = 50ms;
    options_.startupProbeAttempts = 2;
    options_.startupProbeInterval = 1s;
    prober_.setAllUnhealthy(true);
    auto& pool = makePool();

    pool.replenish();
    ASSERT_TRUE(test::waitUntil([&]() { return pool.size() == 1; }));
    ASSERT_TRUE(test::waitUntil([&]() { return prober_.calls() >= 1; }));

    const auto begin = std::chrono::steady_clock::now();
    pool_.reset();
    const auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_LT(elapsed, 900ms);
    EXPECT_EQ(runtime_.stopCalls("fake_node-1"), 1);
    EXPECT_EQ(runtime_.running(), 0u);
    EXPECT_EQ(prober_.calls(), 1);
}

TEST_F(ExitNodePoolTest, CreationFailuresCoolDownAndRaiseHealthSignal) {
    options_.minSize = 1;
    options_.maxSize = 2;
    options_.creationCooldown = 200ms;
    auto& pool = makePool();

    std::mutex signalsMutex;
    std::vector<pool::PoolHealth> signals;
    pool.setHealthListener([&](pool::PoolHealth health, const std::string&) {
        std::scoped_lock lock(signalsMutex);
        signals.push_back(health);
    });
    auto signalled = [&](pool::PoolHealth health) {
        std::scoped_lock lock(signalsMutex);
        return std::find(signals.begin(), signals.end(), health) != signals.end();
    };

    runtime_.failStarts(true);
    EXPECT_EQ(pool.start(), 0u);
    EXPECT_EQ(runtime_.startCalls(), 1);

    // Inside the cooldown nothing new is attempted.
    pool.replenish();
    EXPECT_EQ(runtime_.startCalls(), 1);

    EXPECT_TRUE(test::waitUntil([&]() {
        pool.replenish();
        return signalled(pool::PoolHealth::runtime_unreachable);
    }));
    EXPECT_GE(runtime_.startCalls(), 2);

    runtime_.failStarts(false);
    EXPECT_TRUE(test::waitUntil([&]() {
        pool.replenish();
        return countInState(NodeState::ready) == 1;
    }));
    EXPECT_TRUE(test::waitUntil([&]() { return signalled(pool::PoolHealth::healthy); }));
}

TEST_F(ExitNodePoolTest, NodeFailingFirstProbeIsDiscarded) {
    options_.minSize = 1;
    options_.creationCooldown = 5s;
    prober_.setAllUnhealthy(true);
    auto& pool = makePool();

    EXPECT_EQ(pool.start(), 0u);
    EXPECT_TRUE(test::waitUntil([&]() { return pool.size() == 0; }));
    EXPECT_EQ(runtime_.startCalls(), 1);
    EXPECT_EQ(runtime_.stopCalls("fake_node-1"), 1);
    EXPECT_FALSE(sawState("node-1", NodeState::ready));
}

TEST_F(ExitNodePoolTest, ProbeLeaseExcludesJobs) {
    options_.minSize = 1;
    options_.maxSize = 1;
    auto& pool = makePool();
    pool.start();
    const auto id = pool.nodeIds().front();

    auto probeLease = pool.leaseForProbe(id);
    ASSERT_TRUE(probeLease.has_value());
    EXPECT_TRUE(probeLease->forProbe());
    EXPECT_FALSE(pool.leaseForProbe(id).has_value());
    EXPECT_THROW(pool.checkout(50ms), pool::PoolError);

    probeLease.reset();
    auto jobLease = pool.checkout(50ms);
    EXPECT_EQ(jobLease.nodeId(), id);
    EXPECT_FALSE(pool.leaseForProbe(id).has_value());
}

TEST_F(ExitNodePoolTest, ConcurrentCheckoutsNeverShareANode) {
    options_.minSize = 3;
    options_.maxSize = 3;
    auto& pool = makePool();
    ASSERT_EQ(pool.start(), 3u);

    std::mutex heldMutex;
    std::set<std::string> held;
    std::atomic<int> doubleLends{0};
    std::atomic<int> served{0};

    std::vector<std::thread> workers;
    for (int w = 0; w < 8; ++w) {
        workers.emplace_back([&]() {
            for (int i = 0; i < 40; ++i) {
                pool::NodeLease lease;
                try {
                    lease = pool.checkout(200ms);
                } catch (const pool::PoolError&) {
                    continue;
                }
                {
                    std::scoped_lock lock(heldMutex);
                    if (!held.insert(lease.nodeId()).second) {
                        ++doubleLends;
                    }
                }
                std::this_thread::sleep_for(1ms);
                {
                    std::scoped_lock lock(heldMutex);
                    held.erase(lease.nodeId());
                }
                lease.checkin(pool::Outcome::success);
                ++served;
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(doubleLends.load(), 0);
    EXPECT_GT(served.load(), 0);
    EXPECT_EQ(pool.size(), 3u);
    EXPECT_EQ(countInState(NodeState::ready), 3u);
}
