/**
 * @file SnapDetector.hpp
 * @brief Finger-snap event detection from per-frame pinch state
 *
 * A snap is a single-frame event derived from the thumb/middle pinch flag
 * and the vertical motion of the middle fingertip. Two policies exist and
 * are selected by SnapConfig:
 *
 * - EDGE_TRIGGERED: fires when the fingers first touch (apart -> pinching).
 * - VELOCITY_GATED: fires when the fingers spring apart (pinching -> apart)
 *   and the middle fingertip moved more than velocity_threshold in y since
 *   the previous frame.
 *
 * Neither policy fires on the first frame a hand side is observed, since no
 * previous sample exists yet.
 *
 * @copyright 2025 MasterHand Project
 * @license MIT License
 */

#ifndef MASTERHAND_GESTURE_SNAP_DETECTOR_HPP
#define MASTERHAND_GESTURE_SNAP_DETECTOR_HPP

#include <cstdint>
#include <memory>
#include <string>
#include "GestureTypes.hpp"

namespace masterhand {
namespace gesture {

/**
 * @brief Snap detection policy
 */
enum class SnapPolicy {
    EDGE_TRIGGERED,     ///< Fire on the not-pinching -> pinching edge
    VELOCITY_GATED      ///< Fire on a fast pinching -> not-pinching release
};

std::string snap_policy_to_string(SnapPolicy policy);

/**
 * @brief Parse "edge_triggered"/"edge" or "velocity_gated"/"velocity"
 * @return false if the name is unknown
 */
bool parse_snap_policy(const std::string& name, SnapPolicy& policy);

/**
 * @brief Snap detection configuration
 *
 * pinch_threshold_sq is compared directly against the squared thumb/middle
 * distance.
 */
struct SnapConfig {
    static constexpr float EDGE_PINCH_THRESHOLD_SQ = 0.002f;
    static constexpr float VELOCITY_PINCH_THRESHOLD_SQ = 0.004f;
    static constexpr float DEFAULT_VELOCITY_THRESHOLD = 0.04f;

    SnapPolicy policy = SnapPolicy::VELOCITY_GATED;

    /// Squared thumb-middle distance below which the hand counts as pinching
    float pinch_threshold_sq = VELOCITY_PINCH_THRESHOLD_SQ;

    /// Minimum |dy| of the middle fingertip per frame (VELOCITY_GATED only)
    float velocity_threshold = DEFAULT_VELOCITY_THRESHOLD;

    static SnapConfig edge_triggered() {
        SnapConfig config;
        config.policy = SnapPolicy::EDGE_TRIGGERED;
        config.pinch_threshold_sq = EDGE_PINCH_THRESHOLD_SQ;
        return config;
    }

    static SnapConfig velocity_gated() {
        SnapConfig config;
        config.policy = SnapPolicy::VELOCITY_GATED;
        config.pinch_threshold_sq = VELOCITY_PINCH_THRESHOLD_SQ;
        return config;
    }

    /**
     * @brief Validate configuration
     */
    bool is_valid() const {
        return pinch_threshold_sq > 0.0f && velocity_threshold >= 0.0f;
    }
};

/**
 * @brief Persistent per-hand-side state
 *
 * One instance per HandSide lives for the lifetime of the state machine.
 */
struct HandTemporalState {
    bool is_pinching = false;
    float prev_middle_tip_y = 0.0f;

    /// Number of frames in which this side has been observed
    uint64_t frames_observed = 0;

    bool operator==(const HandTemporalState& other) const {
        return is_pinching == other.is_pinching &&
               prev_middle_tip_y == other.prev_middle_tip_y &&
               frames_observed == other.frames_observed;
    }
    bool operator!=(const HandTemporalState& other) const { return !(*this == other); }
};

/**
 * @brief Outcome of one detector step
 */
struct SnapDecision {
    bool fired = false;
    float velocity = 0.0f;  ///< |dy| of the middle fingertip, 0 on the first sample
};

/**
 * @brief Snap detector strategy
 *
 * update() evaluates the policy against the previous state and then always
 * writes the new pinch flag and middle-tip y into the state, whether or not
 * a snap fired.
 */
class SnapDetector {
public:
    explicit SnapDetector(const SnapConfig& config) : config_(config) {}
    virtual ~SnapDetector() = default;

    SnapDetector(const SnapDetector&) = delete;
    SnapDetector& operator=(const SnapDetector&) = delete;

    /**
     * @brief Run one frame for one hand
     *
     * @param pinching Current pinch flag for this hand
     * @param middle_tip_y Current y of the middle fingertip (landmark 12)
     * @param state Persistent state of this hand's side, updated in place
     * @return Whether a snap fired and the measured velocity
     */
    SnapDecision update(bool pinching, float middle_tip_y, HandTemporalState& state) const;

    virtual SnapPolicy policy() const = 0;

    const SnapConfig& config() const { return config_; }

protected:
    /**
     * @brief Policy decision
     *
     * Only called when a previous sample exists for the side.
     */
    virtual bool fires(bool pinching, float velocity, const HandTemporalState& previous) const = 0;

    SnapConfig config_;
};

/**
 * @brief Fires on the apart -> touching transition
 */
class EdgeTriggeredSnapDetector : public SnapDetector {
public:
    explicit EdgeTriggeredSnapDetector(const SnapConfig& config) : SnapDetector(config) {}

    SnapPolicy policy() const override { return SnapPolicy::EDGE_TRIGGERED; }

protected:
    bool fires(bool pinching, float velocity, const HandTemporalState& previous) const override;
};

/**
 * @brief Fires on a touching -> apart release faster than the velocity gate
 */
class VelocityGatedSnapDetector : public SnapDetector {
public:
    explicit VelocityGatedSnapDetector(const SnapConfig& config) : SnapDetector(config) {}

    SnapPolicy policy() const override { return SnapPolicy::VELOCITY_GATED; }

protected:
    bool fires(bool pinching, float velocity, const HandTemporalState& previous) const override;
};

/**
 * @brief Create the detector for config.policy
 */
std::unique_ptr<SnapDetector> create_snap_detector(const SnapConfig& config);

} // namespace gesture
} // namespace masterhand

#endif // MASTERHAND_GESTURE_SNAP_DETECTOR_HPP
