#pragma once

#include "torgrab/health/EndpointProber.hpp"
#include "torgrab/util/HttpClient.hpp"

#include <string>
#include <vector>

namespace torgrab::health {

std::vector<std::string> defaultProbeTargets();

// Asks IP-echo services, in order, for the address traffic leaves from. The first
// service that answers with a valid address decides the report.
class ExitProbe final : public EndpointProber {
public:
    ExitProbe(util::HttpClient& client, std::vector<std::string> targets = defaultProbeTargets());

    ProbeReport probe(const model::Endpoint& proxy, std::chrono::milliseconds timeout) override;

private:
    util::HttpClient& client_;
    std::vector<std::string> targets_;
};

} // namespace torgrab::health
