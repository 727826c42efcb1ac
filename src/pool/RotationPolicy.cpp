#include "torgrab/pool/RotationPolicy.hpp"

#include <stdexcept>

namespace torgrab::pool {

ThresholdRotationPolicy::ThresholdRotationPolicy(RotationThresholds thresholds)
    : thresholds_(thresholds) {
    if (thresholds_.failureThreshold == 0 || thresholds_.retireThreshold == 0) {
        throw std::invalid_argument("Rotation thresholds must be positive");
    }
}

bool ThresholdRotationPolicy::shouldRotate(const model::ExitNode& node, model::Clock::time_point now) const {
    if (node.consecutiveFailures >= thresholds_.failureThreshold) {
        return true;
    }
    return now - node.lastRotatedAt > thresholds_.maxAge;
}

bool ThresholdRotationPolicy::shouldRetire(const model::ExitNode& node, model::Clock::time_point now) const {
    if (node.consecutiveFailures >= thresholds_.retireThreshold) {
        return true;
    }
    return model::quarantineTime(node, now) > thresholds_.quarantineCeiling;
}

} // namespace torgrab::pool
