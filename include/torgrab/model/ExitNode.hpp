#pragma once

#include "torgrab/model/Endpoint.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace torgrab::model {

using Clock = std::chrono::steady_clock;

enum class NodeState {
    starting,
    ready,
    in_use,
    quarantined,
    retiring,
    dead
};

inline const char* toString(NodeState state) {
    switch (state) {
    case NodeState::starting:    return "Starting";
    case NodeState::ready:       return "Ready";
    case NodeState::in_use:      return "InUse";
    case NodeState::quarantined: return "Quarantined";
    case NodeState::retiring:    return "Retiring";
    case NodeState::dead:        return "Dead";
    }
    return "Unknown";
}

// Bookkeeping for one managed exit identity. The runtime handle behind it stays
// inside ExitNodePool; copies of this record are what the rest of the engine sees.
struct ExitNode {
    std::string id;
    std::string runtimeName;
    Endpoint proxyEndpoint;
    Endpoint controlEndpoint;
    NodeState state{NodeState::starting};
    Clock::time_point createdAt{};
    Clock::time_point lastRotatedAt{};
    Clock::time_point lastHealthyAt{};
    Clock::time_point lastUsedAt{};
    Clock::time_point quarantinedSince{};
    Clock::duration quarantinedFor{};
    unsigned consecutiveFailures{};
    std::uint64_t totalRequests{};
    std::uint64_t totalFailures{};
    std::uint64_t rotations{};
    std::string exitAddress;
};

// Lifetime quarantine time, including the stretch in progress.
inline Clock::duration quarantineTime(const ExitNode& node, Clock::time_point now) {
    auto total = node.quarantinedFor;
    if (node.state == NodeState::quarantined && now > node.quarantinedSince) {
        total += now - node.quarantinedSince;
    }
    return total;
}

} // namespace torgrab::model
