#include "torgrab/pool/ExitNodePool.hpp"
#include "torgrab/util/Logging.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace torgrab::pool {

using model::Clock;
using model::NodeState;

NodeLease::NodeLease(ExitNodePool* pool, std::string nodeId, model::Endpoint proxy, bool probe)
    : pool_(pool)
    , nodeId_(std::move(nodeId))
    , proxy_(std::move(proxy))
    , probe_(probe) {}

NodeLease::~NodeLease() {
    if (!pool_) {
        return;
    }
    try {
        pool_->release(nodeId_, probe_, Outcome::released, nullptr);
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, "Returning lease on " + nodeId_ + " failed: " + ex.what());
    }
}

NodeLease::NodeLease(NodeLease&& other) noexcept
    : pool_(std::exchange(other.pool_, nullptr))
    , nodeId_(std::move(other.nodeId_))
    , proxy_(std::move(other.proxy_))
    , probe_(other.probe_) {}

NodeLease& NodeLease::operator=(NodeLease&& other) noexcept {
    if (this != &other) {
        NodeLease discarded(std::move(*this));
        pool_ = std::exchange(other.pool_, nullptr);
        nodeId_ = std::move(other.nodeId_);
        proxy_ = std::move(other.proxy_);
        probe_ = other.probe_;
    }
    return *this;
}

void NodeLease::checkin(Outcome outcome, const RotationPolicy* policy) {
    if (!pool_) {
        throw std::logic_error("checkin on an empty lease");
    }
    auto* pool = std::exchange(pool_, nullptr);
    pool->release(nodeId_, probe_, outcome, policy);
}

ExitNodePool::ExitNodePool(runtime::ContainerRuntime& runtime,
                           runtime::ControlChannel& control,
                           health::EndpointProber& prober,
                           std::shared_ptr<const RotationPolicy> policy,
                           boost::asio::thread_pool& executor,
                           PoolOptions options)
    : runtime_(runtime)
    , control_(control)
    , prober_(prober)
    , executor_(executor)
    , options_(options)
    , policy_(std::move(policy)) {
    if (!policy_) {
        throw std::invalid_argument("ExitNodePool requires a rotation policy");
    }
    if (options_.maxSize == 0) {
        throw std::invalid_argument("Pool maximum must be positive");
    }
    if (options_.minSize > options_.maxSize) {
        options_.minSize = options_.maxSize;
    }
}

ExitNodePool::~ExitNodePool() {
    bool drained = false;
    {
        std::scoped_lock lock(mutex_);
        drained = draining_ && nodes_.empty() && activeTasks_ == 0;
    }
    if (!drained && !drain(options_.checkoutTimeout)) {
        util::log(util::LogLevel::warn, "Exit node pool drain timed out; waiting for creation tasks");
    }

    // Creation tasks run on the shared executor and use this pool until they finish.
    std::vector<std::pair<std::string, std::unique_ptr<runtime::CircuitRuntime>>> leftovers;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return activeTasks_ == 0; });
        for (auto& [id, entry] : nodes_) {
            if (entry.circuit) {
                leftovers.emplace_back(id, std::move(entry.circuit));
            }
        }
        nodes_.clear();
    }
    for (auto& [id, circuit] : leftovers) {
        util::log(util::LogLevel::warn, "Stopping " + id + " which was still leased at shutdown");
        try {
            circuit->stop();
        } catch (const std::exception& ex) {
            util::log(util::LogLevel::error, "Teardown of " + id + " (" + circuit->name() + ") failed: " + ex.what());
        }
    }
}

std::size_t ExitNodePool::start() {
    std::unique_lock<std::mutex> lock(mutex_);
    util::log(util::LogLevel::info, "Starting exit node pool (min=" + std::to_string(options_.minSize) +
                                        ", max=" + std::to_string(options_.maxSize) + ")");
    growLocked(Clock::now());
    cv_.wait(lock, [this]() { return launching_ == 0 && startingCountLocked() == 0; });

    auto ready = static_cast<std::size_t>(std::count_if(nodes_.begin(), nodes_.end(), [](const auto& item) {
        return item.second.node.state == NodeState::ready;
    }));
    util::log(ready < options_.minSize ? util::LogLevel::warn : util::LogLevel::info,
              "Exit node pool started with " + std::to_string(ready) + " ready node(s)");
    return ready;
}

NodeLease ExitNodePool::checkout() {
    return checkout(options_.checkoutTimeout);
}

NodeLease ExitNodePool::checkout(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    const auto deadline = Clock::now() + timeout;

    struct WaiterGuard {
        std::size_t& count;
        ~WaiterGuard() { --count; }
    };
    ++waiters_;
    WaiterGuard guard{waiters_};

    for (;;) {
        if (draining_) {
            throw PoolError(PoolError::Type::shutting_down, "Exit node pool is draining");
        }
        const auto now = Clock::now();
        if (auto* entry = pickReadyLocked()) {
            entry->lease = LeaseKind::job;
            entry->node.lastUsedAt = now;
            ++entry->node.totalRequests;
            setStateLocked(*entry, NodeState::in_use, now);
            return NodeLease(this, entry->node.id, entry->node.proxyEndpoint, false);
        }
        if (now >= deadline) {
            throw PoolError(PoolError::Type::exhausted,
                            "No ready exit node within " + std::to_string(timeout.count()) + "ms (" +
                                std::to_string(nodes_.size()) + "/" + std::to_string(options_.maxSize) + " nodes)");
        }
        growLocked(now);

        auto wakeAt = deadline;
        if (cooldownUntil_ > now && cooldownUntil_ < wakeAt) {
            wakeAt = cooldownUntil_;
        }
        cv_.wait_until(lock, wakeAt);
    }
}

void ExitNodePool::checkin(NodeLease& lease, Outcome outcome, const RotationPolicy* policy) {
    if (lease.pool_ != this) {
        throw std::logic_error("Lease does not belong to this pool");
    }
    lease.checkin(outcome, policy);
}

void ExitNodePool::release(const std::string& nodeId, bool probe, Outcome outcome, const RotationPolicy* policy) {
    std::unique_ptr<runtime::CircuitRuntime> circuit;
    {
        std::scoped_lock lock(mutex_);
        auto it = nodes_.find(nodeId);
        const auto expected = probe ? LeaseKind::probe : LeaseKind::job;
        if (it == nodes_.end() || it->second.lease != expected) {
            util::log(util::LogLevel::warn, "Lease returned for " + nodeId + " which is not leased");
            return;
        }

        auto& entry = it->second;
        auto& node = entry.node;
        const auto now = Clock::now();
        entry.lease = LeaseKind::none;
        bool retireNow = entry.retireOnRelease || draining_;

        if (!probe) {
            auto defaultPolicy = policy_;
            const RotationPolicy& active = policy ? *policy : *defaultPolicy;
            switch (outcome) {
            case Outcome::success:
                node.consecutiveFailures = 0;
                node.lastHealthyAt = now;
                setStateLocked(entry, NodeState::ready, now);
                break;
            case Outcome::failure:
                ++node.consecutiveFailures;
                ++node.totalFailures;
                if (active.shouldRetire(node, now)) {
                    util::log(util::LogLevel::info, "Retiring " + nodeId + " after " +
                                                        std::to_string(node.consecutiveFailures) + " failure(s)");
                    retireNow = true;
                } else if (active.shouldRotate(node, now)) {
                    setStateLocked(entry, NodeState::quarantined, now);
                } else {
                    setStateLocked(entry, NodeState::ready, now);
                }
                break;
            case Outcome::released:
                setStateLocked(entry, NodeState::ready, now);
                break;
            }
        }

        if (retireNow) {
            circuit = beginRetireLocked(entry, now);
        }
        cv_.notify_all();
    }
    finishRetire(nodeId, std::move(circuit));
}

void ExitNodePool::retire(const std::string& nodeId) {
    std::unique_ptr<runtime::CircuitRuntime> circuit;
    {
        std::scoped_lock lock(mutex_);
        auto it = nodes_.find(nodeId);
        if (it == nodes_.end()) {
            util::log(util::LogLevel::debug, "Retire of " + nodeId + " ignored, node is gone");
            return;
        }
        auto& entry = it->second;
        if (entry.node.state == NodeState::retiring || entry.node.state == NodeState::dead) {
            return;
        }
        if (entry.lease != LeaseKind::none) {
            if (!entry.retireOnRelease) {
                entry.retireOnRelease = true;
                util::log(util::LogLevel::info, "Node " + nodeId + " is leased; retiring on release");
            }
            return;
        }
        circuit = beginRetireLocked(entry, Clock::now());
    }
    finishRetire(nodeId, std::move(circuit));
}

void ExitNodePool::replenish() {
    std::scoped_lock lock(mutex_);
    growLocked(Clock::now());
}

bool ExitNodePool::drain(std::chrono::milliseconds timeout) {
    std::vector<std::pair<std::string, std::unique_ptr<runtime::CircuitRuntime>>> idle;
    {
        std::scoped_lock lock(mutex_);
        if (!draining_) {
            util::log(util::LogLevel::info, "Draining exit node pool (" + std::to_string(nodes_.size()) + " nodes)");
        }
        draining_ = true;
        const auto now = Clock::now();
        for (auto& [id, entry] : nodes_) {
            if (entry.lease != LeaseKind::none) {
                entry.retireOnRelease = true;
            } else if (auto circuit = beginRetireLocked(entry, now)) {
                idle.emplace_back(id, std::move(circuit));
            }
        }
        cv_.notify_all();
    }

    for (auto& [id, circuit] : idle) {
        finishRetire(id, std::move(circuit));
    }

    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]() { return nodes_.empty() && activeTasks_ == 0; });
}

std::optional<NodeLease> ExitNodePool::leaseForProbe(const std::string& nodeId) {
    std::scoped_lock lock(mutex_);
    auto it = nodes_.find(nodeId);
    if (it == nodes_.end() || draining_) {
        return std::nullopt;
    }
    auto& entry = it->second;
    const auto state = entry.node.state;
    if (entry.lease != LeaseKind::none || entry.retireOnRelease ||
        (state != NodeState::ready && state != NodeState::quarantined)) {
        return std::nullopt;
    }
    entry.lease = LeaseKind::probe;
    return NodeLease(this, nodeId, entry.node.proxyEndpoint, true);
}

ProbeOutcome ExitNodePool::probe(NodeLease& lease) {
    runtime::CircuitRuntime* circuit = nullptr;
    {
        std::scoped_lock lock(mutex_);
        circuit = leasedEntryLocked(lease, LeaseKind::probe).circuit.get();
    }

    ProbeOutcome outcome;
    std::string exitAddress;
    try {
        if (!circuit->alive()) {
            outcome.error = "container " + circuit->name() + " is not running";
        } else {
            auto report = prober_.probe(circuit->proxyEndpoint(), options_.probeTimeout);
            outcome.healthy = report.healthy;
            outcome.error = report.error;
            exitAddress = report.exitAddress;
        }
    } catch (const std::exception& ex) {
        outcome.healthy = false;
        outcome.error = ex.what();
    }

    {
        std::scoped_lock lock(mutex_);
        auto& entry = leasedEntryLocked(lease, LeaseKind::probe);
        const auto now = Clock::now();
        if (outcome.healthy) {
            entry.node.consecutiveFailures = 0;
            entry.node.lastHealthyAt = now;
            if (!exitAddress.empty()) {
                entry.node.exitAddress = exitAddress;
            }
            if (entry.node.state == NodeState::starting || entry.node.state == NodeState::quarantined) {
                setStateLocked(entry, NodeState::ready, now);
            }
        } else {
            ++entry.node.consecutiveFailures;
            ++entry.node.totalFailures;
        }
        outcome.node = entry.node;
    }

    if (!outcome.healthy) {
        util::log(util::LogLevel::warn, "Probe of " + lease.nodeId() + " failed: " + outcome.error);
    }
    return outcome;
}

bool ExitNodePool::rotate(NodeLease& lease) {
    runtime::CircuitRuntime* circuit = nullptr;
    {
        std::scoped_lock lock(mutex_);
        circuit = leasedEntryLocked(lease, LeaseKind::probe).circuit.get();
    }

    try {
        circuit->rotateIdentity();
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::warn, "Rotation of " + lease.nodeId() + " failed: " + ex.what());
        return false;
    }

    std::scoped_lock lock(mutex_);
    auto& node = leasedEntryLocked(lease, LeaseKind::probe).node;
    const auto now = Clock::now();
    node.consecutiveFailures = 0;
    node.lastRotatedAt = now;
    node.lastUsedAt = now;
    node.exitAddress.clear();
    ++node.rotations;
    util::log(util::LogLevel::info, "Rotated identity of " + node.id + " (rotation " + std::to_string(node.rotations) + ")");
    return true;
}

void ExitNodePool::quarantine(NodeLease& lease) {
    std::scoped_lock lock(mutex_);
    auto& entry = leasedEntryLocked(lease, LeaseKind::probe);
    if (entry.node.state == NodeState::ready) {
        setStateLocked(entry, NodeState::quarantined, Clock::now());
    }
}

std::vector<model::ExitNode> ExitNodePool::snapshot() const {
    std::scoped_lock lock(mutex_);
    std::vector<model::ExitNode> nodes;
    nodes.reserve(nodes_.size());
    for (const auto& [id, entry] : nodes_) {
        nodes.push_back(entry.node);
    }
    return nodes;
}

std::vector<std::string> ExitNodePool::nodeIds() const {
    std::scoped_lock lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(nodes_.size());
    for (const auto& [id, entry] : nodes_) {
        ids.push_back(id);
    }
    return ids;
}

std::optional<model::ExitNode> ExitNodePool::find(const std::string& nodeId) const {
    std::scoped_lock lock(mutex_);
    auto it = nodes_.find(nodeId);
    if (it == nodes_.end()) {
        return std::nullopt;
    }
    return it->second.node;
}

std::size_t ExitNodePool::size() const {
    std::scoped_lock lock(mutex_);
    return nodes_.size();
}

bool ExitNodePool::draining() const {
    std::scoped_lock lock(mutex_);
    return draining_;
}

std::shared_ptr<const RotationPolicy> ExitNodePool::policy() const {
    std::scoped_lock lock(mutex_);
    return policy_;
}

void ExitNodePool::setPolicy(std::shared_ptr<const RotationPolicy> policy) {
    if (!policy) {
        throw std::invalid_argument("Rotation policy must not be null");
    }
    std::scoped_lock lock(mutex_);
    policy_ = std::move(policy);
}

void ExitNodePool::runCreation(const std::string& nodeId) {
    try {
        createNode(nodeId);
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, "Creation task for " + nodeId + " failed: " + ex.what());
    }
    std::scoped_lock lock(mutex_);
    --activeTasks_;
    cv_.notify_all();
}

void ExitNodePool::createNode(const std::string& nodeId) {
    std::unique_ptr<runtime::CircuitRuntime> circuit;
    try {
        circuit = runtime::CircuitRuntime::launch(runtime_, control_, runtime::LaunchRequest{nodeId},
                                                  options_.controlTimeout);
    } catch (const runtime::RuntimeError& ex) {
        onCreationFailed(nodeId, ex.what(), ex.type() == runtime::RuntimeError::Type::unavailable);
        return;
    } catch (const std::exception& ex) {
        onCreationFailed(nodeId, ex.what(), false);
        return;
    }

    NodeLease lease;
    bool recovered = false;
    {
        std::scoped_lock lock(mutex_);
        if (!draining_) {
            --launching_;
            const auto now = Clock::now();
            Entry entry;
            entry.node.id = nodeId;
            entry.node.runtimeName = circuit->name();
            entry.node.proxyEndpoint = circuit->proxyEndpoint();
            entry.node.controlEndpoint = circuit->controlEndpoint();
            entry.node.state = NodeState::starting;
            entry.node.createdAt = now;
            entry.node.lastRotatedAt = now;
            entry.node.lastUsedAt = now;
            entry.circuit = std::move(circuit);
            entry.lease = LeaseKind::probe;
            auto& stored = nodes_.emplace(nodeId, std::move(entry)).first->second;
            if (stateListener_) {
                stateListener_(nodeId, std::nullopt, NodeState::starting);
            }
            lease = NodeLease(this, nodeId, stored.node.proxyEndpoint, true);
            runtimeFailures_ = 0;
            recovered = std::exchange(runtimeUnreachable_, false);
        }
    }

    if (circuit) {
        util::log(util::LogLevel::info, "Pool is draining; discarding new circuit " + circuit->name());
        try {
            circuit->stop();
        } catch (const std::exception& ex) {
            util::log(util::LogLevel::error, "Teardown of " + circuit->name() + " failed: " + ex.what());
        }
        std::scoped_lock lock(mutex_);
        --launching_;
        cv_.notify_all();
        return;
    }

    if (recovered) {
        util::log(util::LogLevel::info, "Container runtime reachable again");
        if (healthListener_) {
            healthListener_(PoolHealth::healthy, "container runtime reachable again");
        }
    }

    ProbeOutcome outcome;
    const unsigned attempts = std::max(1u, options_.startupProbeAttempts);
    for (unsigned attempt = 0; attempt < attempts; ++attempt) {
        if (attempt > 0) {
            std::unique_lock<std::mutex> lock(mutex_);
            if (cv_.wait_for(lock, options_.startupProbeInterval, [this]() { return draining_; })) {
                break;
            }
        }
        outcome = probe(lease);
        if (outcome.healthy || draining()) {
            break;
        }
    }

    if (outcome.healthy) {
        util::log(util::LogLevel::info, "Node " + nodeId + " ready via " + outcome.node.proxyEndpoint.toString() +
                                            (outcome.node.exitAddress.empty() ? std::string{}
                                                                              : " exit " + outcome.node.exitAddress));
        return;
    }

    {
        std::scoped_lock lock(mutex_);
        cooldownUntil_ = Clock::now() + options_.creationCooldown;
    }
    util::log(util::LogLevel::warn, std::string{toString(PoolError::Type::node_creation_failed)} + ": " + nodeId +
                                        " never passed its first probe: " + outcome.error);
    retire(nodeId);
}

void ExitNodePool::onCreationFailed(const std::string& nodeId, const std::string& reason, bool runtimeUnreachable) {
    bool signal = false;
    {
        std::scoped_lock lock(mutex_);
        --launching_;
        cooldownUntil_ = Clock::now() + options_.creationCooldown;
        if (runtimeUnreachable) {
            ++runtimeFailures_;
            if (runtimeFailures_ >= options_.runtimeFailureLimit && !runtimeUnreachable_) {
                runtimeUnreachable_ = true;
                signal = true;
            }
        } else {
            runtimeFailures_ = 0;
        }
        cv_.notify_all();
    }

    util::log(util::LogLevel::warn, std::string{toString(PoolError::Type::node_creation_failed)} + ": " + nodeId +
                                        ": " + reason);
    if (signal) {
        util::log(util::LogLevel::error, "Container runtime unreachable after " +
                                             std::to_string(options_.runtimeFailureLimit) + " attempts: " + reason);
        if (healthListener_) {
            healthListener_(PoolHealth::runtime_unreachable, reason);
        }
    }
}

void ExitNodePool::growLocked(Clock::time_point now) {
    if (draining_ || now < cooldownUntil_) {
        return;
    }
    auto live = liveCountLocked();
    auto total = nodes_.size() + launching_;
    auto pending = launching_ + startingCountLocked();

    while (live < options_.minSize && total < options_.maxSize) {
        scheduleCreateLocked();
        ++live;
        ++total;
        ++pending;
    }
    if (waiters_ == 0 || hasIdleReadyLocked()) {
        return;
    }
    while (total < options_.maxSize && pending < waiters_) {
        scheduleCreateLocked();
        ++total;
        ++pending;
    }
}

void ExitNodePool::scheduleCreateLocked() {
    auto nodeId = "node-" + std::to_string(++nextId_);
    ++launching_;
    ++activeTasks_;
    util::log(util::LogLevel::debug, "Scheduling creation of " + nodeId);
    boost::asio::post(executor_, [this, nodeId]() { runCreation(nodeId); });
}

ExitNodePool::Entry* ExitNodePool::pickReadyLocked() {
    Entry* best = nullptr;
    for (auto& [id, entry] : nodes_) {
        if (entry.node.state != NodeState::ready || entry.lease != LeaseKind::none || entry.retireOnRelease) {
            continue;
        }
        if (!best || entry.node.lastUsedAt < best->node.lastUsedAt) {
            best = &entry;
        }
    }
    return best;
}

bool ExitNodePool::hasIdleReadyLocked() const {
    return std::any_of(nodes_.begin(), nodes_.end(), [](const auto& item) {
        const auto& entry = item.second;
        return entry.node.state == NodeState::ready && entry.lease == LeaseKind::none && !entry.retireOnRelease;
    });
}

std::size_t ExitNodePool::liveCountLocked() const {
    auto retiring = std::count_if(nodes_.begin(), nodes_.end(), [](const auto& item) {
        return item.second.node.state == NodeState::retiring || item.second.retireOnRelease;
    });
    return nodes_.size() - static_cast<std::size_t>(retiring) + launching_;
}

std::size_t ExitNodePool::startingCountLocked() const {
    return static_cast<std::size_t>(std::count_if(nodes_.begin(), nodes_.end(), [](const auto& item) {
        return item.second.node.state == NodeState::starting;
    }));
}

void ExitNodePool::setStateLocked(Entry& entry, NodeState to, Clock::time_point now) {
    const auto from = entry.node.state;
    if (from == to) {
        return;
    }
    if (from == NodeState::quarantined) {
        entry.node.quarantinedFor += now - entry.node.quarantinedSince;
    }
    if (to == NodeState::quarantined) {
        entry.node.quarantinedSince = now;
    }
    entry.node.state = to;
    util::log(util::LogLevel::debug, entry.node.id + ": " + model::toString(from) + " -> " + model::toString(to));
    if (stateListener_) {
        stateListener_(entry.node.id, from, to);
    }
}

std::unique_ptr<runtime::CircuitRuntime> ExitNodePool::beginRetireLocked(Entry& entry, Clock::time_point now) {
    if (entry.node.state == NodeState::retiring || entry.node.state == NodeState::dead || !entry.circuit) {
        return nullptr;
    }
    entry.retireOnRelease = false;
    setStateLocked(entry, NodeState::retiring, now);
    return std::move(entry.circuit);
}

void ExitNodePool::finishRetire(const std::string& nodeId, std::unique_ptr<runtime::CircuitRuntime> circuit) {
    if (!circuit) {
        return;
    }
    try {
        circuit->stop();
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, "Teardown of " + nodeId + " (" + circuit->name() + ") failed: " + ex.what());
    }
    util::log(util::LogLevel::info, "Node " + nodeId + " retired");

    std::scoped_lock lock(mutex_);
    auto it = nodes_.find(nodeId);
    if (it != nodes_.end()) {
        setStateLocked(it->second, NodeState::dead, Clock::now());
        nodes_.erase(it);
    }
    growLocked(Clock::now());
    cv_.notify_all();
}

ExitNodePool::Entry& ExitNodePool::leasedEntryLocked(const NodeLease& lease, LeaseKind kind) {
    if (lease.pool_ != this) {
        throw std::logic_error("Lease does not belong to this pool");
    }
    auto it = nodes_.find(lease.nodeId());
    if (it == nodes_.end() || it->second.lease != kind) {
        throw std::logic_error("Node " + lease.nodeId() + " is not held by this lease");
    }
    return it->second;
}

} // namespace torgrab::pool
