#pragma once

#include "torgrab/health/EndpointProber.hpp"
#include "torgrab/model/ExitNode.hpp"
#include "torgrab/pool/PoolError.hpp"
#include "torgrab/pool/RotationPolicy.hpp"
#include "torgrab/runtime/CircuitRuntime.hpp"

#include <boost/asio/thread_pool.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace torgrab::pool {

struct PoolOptions {
    std::size_t minSize{2};
    std::size_t maxSize{5};
    std::chrono::milliseconds checkoutTimeout{10000};
    std::chrono::milliseconds probeTimeout{15000};
    std::chrono::milliseconds controlTimeout{10000};
    unsigned startupProbeAttempts{3};
    std::chrono::milliseconds startupProbeInterval{2000};
    std::chrono::milliseconds creationCooldown{30000};
    unsigned runtimeFailureLimit{3};
};

enum class Outcome {
    success,
    failure,
    released,
};

enum class PoolHealth {
    healthy,
    runtime_unreachable,
};

struct ProbeOutcome {
    bool healthy{false};
    std::string error;
    model::ExitNode node;
};

class ExitNodePool;

// Exclusive hold on one node, either for a job dispatch or for a health probe.
// Destroying a lease that was not checked in returns the node unjudged.
class NodeLease {
public:
    NodeLease() = default;
    ~NodeLease();

    NodeLease(NodeLease&& other) noexcept;
    NodeLease& operator=(NodeLease&& other) noexcept;
    NodeLease(const NodeLease&) = delete;
    NodeLease& operator=(const NodeLease&) = delete;

    explicit operator bool() const noexcept { return pool_ != nullptr; }

    const std::string& nodeId() const noexcept { return nodeId_; }
    const model::Endpoint& proxyEndpoint() const noexcept { return proxy_; }
    bool forProbe() const noexcept { return probe_; }

    // `policy` overrides the pool policy for this checkin only.
    void checkin(Outcome outcome, const RotationPolicy* policy = nullptr);

private:
    friend class ExitNodePool;

    NodeLease(ExitNodePool* pool, std::string nodeId, model::Endpoint proxy, bool probe);

    ExitNodePool* pool_{nullptr};
    std::string nodeId_;
    model::Endpoint proxy_;
    bool probe_{false};
};

// Single owner of every ExitNode record and its circuit. All structural changes
// (creation, state transitions, retirement) happen under one mutex; runtime and
// network calls run outside it while the node is held by a lease.
class ExitNodePool {
public:
    // Called under the pool lock on every state change; must not call back into
    // the pool. `from` is empty for a freshly created node.
    using StateListener = std::function<void(const std::string& nodeId,
                                             std::optional<model::NodeState> from,
                                             model::NodeState to)>;
    using HealthListener = std::function<void(PoolHealth health, const std::string& detail)>;

    ExitNodePool(runtime::ContainerRuntime& runtime,
                 runtime::ControlChannel& control,
                 health::EndpointProber& prober,
                 std::shared_ptr<const RotationPolicy> policy,
                 boost::asio::thread_pool& executor,
                 PoolOptions options);
    ~ExitNodePool();

    ExitNodePool(const ExitNodePool&) = delete;
    ExitNodePool& operator=(const ExitNodePool&) = delete;

    // Creates minSize nodes and waits for their first probe. Returns how many
    // came up Ready.
    std::size_t start();

    // Throws PoolError (exhausted, shutting_down).
    NodeLease checkout();
    NodeLease checkout(std::chrono::milliseconds timeout);
    void checkin(NodeLease& lease, Outcome outcome, const RotationPolicy* policy = nullptr);

    // Idempotent. A leased node is torn down when its lease comes back.
    void retire(const std::string& nodeId);
    // Schedules creations until the pool is back at minSize.
    void replenish();
    // Rejects further checkouts and retires every node. Returns false when nodes
    // were still alive at the deadline.
    bool drain(std::chrono::milliseconds timeout);

    // Probe support. A probe lease is only granted on an idle Ready or
    // Quarantined node, so probing never overlaps a dispatch.
    std::optional<NodeLease> leaseForProbe(const std::string& nodeId);
    ProbeOutcome probe(NodeLease& lease);
    bool rotate(NodeLease& lease);
    void quarantine(NodeLease& lease);

    std::vector<model::ExitNode> snapshot() const;
    std::vector<std::string> nodeIds() const;
    std::optional<model::ExitNode> find(const std::string& nodeId) const;
    std::size_t size() const;
    bool draining() const;

    std::shared_ptr<const RotationPolicy> policy() const;
    void setPolicy(std::shared_ptr<const RotationPolicy> policy);

    // Install before start().
    void setStateListener(StateListener listener) { stateListener_ = std::move(listener); }
    void setHealthListener(HealthListener listener) { healthListener_ = std::move(listener); }

    const PoolOptions& options() const noexcept { return options_; }

private:
    friend class NodeLease;

    enum class LeaseKind {
        none,
        job,
        probe,
    };

    struct Entry {
        model::ExitNode node;
        std::unique_ptr<runtime::CircuitRuntime> circuit;
        LeaseKind lease{LeaseKind::none};
        bool retireOnRelease{false};
    };

    void release(const std::string& nodeId, bool probe, Outcome outcome, const RotationPolicy* policy);
    void runCreation(const std::string& nodeId);
    void createNode(const std::string& nodeId);
    void onCreationFailed(const std::string& nodeId, const std::string& reason, bool runtimeUnreachable);

    void growLocked(model::Clock::time_point now);
    void scheduleCreateLocked();
    Entry* pickReadyLocked();
    bool hasIdleReadyLocked() const;
    std::size_t liveCountLocked() const;
    std::size_t startingCountLocked() const;
    void setStateLocked(Entry& entry, model::NodeState to, model::Clock::time_point now);
    std::unique_ptr<runtime::CircuitRuntime> beginRetireLocked(Entry& entry, model::Clock::time_point now);
    void finishRetire(const std::string& nodeId, std::unique_ptr<runtime::CircuitRuntime> circuit);
    Entry& leasedEntryLocked(const NodeLease& lease, LeaseKind kind);

    runtime::ContainerRuntime& runtime_;
    runtime::ControlChannel& control_;
    health::EndpointProber& prober_;
    boost::asio::thread_pool& executor_;
    PoolOptions options_;
    std::shared_ptr<const RotationPolicy> policy_;
    StateListener stateListener_;
    HealthListener healthListener_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, Entry> nodes_;
    std::size_t launching_{};
    std::size_t activeTasks_{};
    std::size_t waiters_{};
    std::uint64_t nextId_{};
    bool draining_{false};
    model::Clock::time_point cooldownUntil_{};
    unsigned runtimeFailures_{};
    bool runtimeUnreachable_{false};
};

} // namespace torgrab::pool
