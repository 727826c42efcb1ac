#pragma once

#include "torgrab/model/Endpoint.hpp"

#include <chrono>
#include <string>

namespace torgrab::health {

struct ProbeReport {
    bool healthy{false};
    std::string exitAddress;
    std::chrono::milliseconds latency{};
    std::string error;
};

// Checks that traffic sent through `proxy` reaches the outside world. Reports
// failures in ProbeReport::error instead of throwing.
class EndpointProber {
public:
    virtual ~EndpointProber() = default;

    virtual ProbeReport probe(const model::Endpoint& proxy, std::chrono::milliseconds timeout) = 0;
};

} // namespace torgrab::health
