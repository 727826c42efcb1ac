#pragma once

#include "torgrab/model/ExitNode.hpp"

#include <chrono>

namespace torgrab::pool {

class RotationPolicy {
public:
    virtual ~RotationPolicy() = default;

    // Replace the identity in place (new circuit, same resource).
    virtual bool shouldRotate(const model::ExitNode& node, model::Clock::time_point now) const = 0;
    // Destroy the resource.
    virtual bool shouldRetire(const model::ExitNode& node, model::Clock::time_point now) const = 0;
};

struct RotationThresholds {
    std::chrono::seconds maxAge{600};
    unsigned failureThreshold{3};
    unsigned retireThreshold{6};
    std::chrono::seconds quarantineCeiling{300};
};

// Rotation is the first answer to failures; retirement needs the stricter
// retireThreshold or too much time spent in quarantine.
class ThresholdRotationPolicy final : public RotationPolicy {
public:
    explicit ThresholdRotationPolicy(RotationThresholds thresholds);

    bool shouldRotate(const model::ExitNode& node, model::Clock::time_point now) const override;
    bool shouldRetire(const model::ExitNode& node, model::Clock::time_point now) const override;

    const RotationThresholds& thresholds() const noexcept { return thresholds_; }

private:
    RotationThresholds thresholds_;
};

} // namespace torgrab::pool
