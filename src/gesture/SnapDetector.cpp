/**
 * @file SnapDetector.cpp
 * @brief Edge-triggered and velocity-gated snap policies
 */

#include "masterhand/gesture/SnapDetector.hpp"
#include <cmath>

namespace masterhand {
namespace gesture {

std::string snap_policy_to_string(SnapPolicy policy) {
    switch (policy) {
        case SnapPolicy::EDGE_TRIGGERED: return "edge_triggered";
        case SnapPolicy::VELOCITY_GATED: return "velocity_gated";
        default: return "invalid";
    }
}

bool parse_snap_policy(const std::string& name, SnapPolicy& policy) {
    if (name == "edge_triggered" || name == "edge") {
        policy = SnapPolicy::EDGE_TRIGGERED;
        return true;
    }
    if (name == "velocity_gated" || name == "velocity") {
        policy = SnapPolicy::VELOCITY_GATED;
        return true;
    }
    return false;
}

SnapDecision SnapDetector::update(bool pinching, float middle_tip_y, HandTemporalState& state) const {
    SnapDecision decision;

    const bool has_previous = state.frames_observed > 0;
    if (has_previous) {
        decision.velocity = std::abs(middle_tip_y - state.prev_middle_tip_y);
        decision.fired = fires(pinching, decision.velocity, state);
    }

    state.is_pinching = pinching;
    state.prev_middle_tip_y = middle_tip_y;
    ++state.frames_observed;

    return decision;
}

bool EdgeTriggeredSnapDetector::fires(bool pinching, float /*velocity*/,
                                      const HandTemporalState& previous) const {
    return !previous.is_pinching && pinching;
}

bool VelocityGatedSnapDetector::fires(bool pinching, float velocity,
                                      const HandTemporalState& previous) const {
    return previous.is_pinching && !pinching && velocity > config_.velocity_threshold;
}

std::unique_ptr<SnapDetector> create_snap_detector(const SnapConfig& config) {
    switch (config.policy) {
        case SnapPolicy::EDGE_TRIGGERED:
            return std::make_unique<EdgeTriggeredSnapDetector>(config);
        case SnapPolicy::VELOCITY_GATED:
        default:
            return std::make_unique<VelocityGatedSnapDetector>(config);
    }
}

} // namespace gesture
} // namespace masterhand
