/**
 * @file GestureStateMachine.cpp
 * @brief Implementation of the per-frame gesture state machine
 */

#include "masterhand/gesture/GestureStateMachine.hpp"
#include "masterhand/gesture/HandGeometry.hpp"
#include "masterhand/core/config.h"
#include "masterhand/core/exception.h"
#include "masterhand/core/Logger.hpp"
#include <cmath>
#include <initializer_list>
#include <mutex>
#include <vector>

namespace masterhand {
namespace gesture {

namespace {

// A key that is present must hold the expected kind of value
void require_type(bool present, bool matches, const char* key, const char* expected) {
    if (present && !matches) {
        MASTERHAND_THROW(core::ConfigException,
                         std::string("Config key '") + key + "' must be " + expected);
    }
}

} // namespace

EngineConfig make_engine_config(const core::Config& config) {
    namespace keys = core::config_keys;

    for (const char* key : {keys::GESTURE_CLASSIFY, keys::SNAP_ENABLED}) {
        require_type(config.hasKey(key), config.holdsType<bool>(key), key, "a boolean");
    }
    require_type(config.hasKey(keys::SNAP_POLICY), config.holdsType<std::string>(keys::SNAP_POLICY),
                 keys::SNAP_POLICY, "a policy name");
    for (const char* key : {keys::SNAP_PINCH_THRESHOLD_SQ, keys::SNAP_VELOCITY_THRESHOLD}) {
        require_type(config.hasKey(key), config.isNumeric(key), key, "a number");
    }

    EngineConfig engine;
    engine.classify_gestures = config.getValue<bool>(keys::GESTURE_CLASSIFY, true);
    engine.detect_snaps = config.getValue<bool>(keys::SNAP_ENABLED, true);

    const std::string policy_name =
        config.getValue<std::string>(keys::SNAP_POLICY, "velocity_gated");
    SnapPolicy policy;
    if (!parse_snap_policy(policy_name, policy)) {
        MASTERHAND_THROW(core::ConfigException, "Unknown snap policy '" + policy_name + "'");
    }

    engine.snap = (policy == SnapPolicy::EDGE_TRIGGERED) ? SnapConfig::edge_triggered()
                                                         : SnapConfig::velocity_gated();

    if (config.hasKey(keys::SNAP_PINCH_THRESHOLD_SQ)) {
        engine.snap.pinch_threshold_sq = static_cast<float>(
            config.getDouble(keys::SNAP_PINCH_THRESHOLD_SQ, engine.snap.pinch_threshold_sq));
    }
    engine.snap.velocity_threshold = static_cast<float>(
        config.getDouble(keys::SNAP_VELOCITY_THRESHOLD, engine.snap.velocity_threshold));

    if (!engine.is_valid()) {
        MASTERHAND_THROW(core::ConfigException,
                         "Invalid snap thresholds (pinch_threshold_sq=" +
                         std::to_string(engine.snap.pinch_threshold_sq) +
                         ", velocity_threshold=" + std::to_string(engine.snap.velocity_threshold) + ")");
    }
    return engine;
}

/**
 * @brief PIMPL implementation for GestureStateMachine
 */
class GestureStateMachine::Impl {
public:
    EngineConfig config;
    std::unique_ptr<SnapDetector> detector;
    HandStateStore store;
    uint64_t frames_processed = 0;

    SnapCallback callback = nullptr;
    void* user_data = nullptr;

    mutable std::mutex mutex;

    explicit Impl(const EngineConfig& cfg)
        : config(cfg)
        , detector(create_snap_detector(cfg.snap)) {
    }

    static void validate(const HandObservation& hand) {
        for (size_t i = 0; i < hand.landmarks.size(); ++i) {
            const cv::Point3f& p = hand.landmarks[i];
            if (!std::isfinite(p.x) || !std::isfinite(p.y) || !std::isfinite(p.z)) {
                MASTERHAND_THROW(core::InvalidObservationException,
                                 hand_side_to_string(hand.side) + " hand landmark " +
                                 std::to_string(i) + " is not finite");
            }
        }
    }

    /**
     * @brief Evaluate one frame against a scratch copy of the store
     *
     * The scratch copy is committed by the caller; nothing here touches
     * the live store.
     */
    FrameResult evaluate(const ObservationBatch& batch, HandStateStore& scratch,
                         std::vector<SnapEvent>& events) const {
        FrameResult result;
        result.frame_index = frames_processed;
        result.hands.reserve(batch.hands.size());

        for (const auto& hand : batch.hands) {
            HandResult hand_result;
            hand_result.side = hand.side;
            hand_result.landmarks = hand.landmarks;

            if (config.classify_gestures) {
                hand_result.gesture = classify_hand(hand.landmarks);
            }

            if (config.detect_snaps) {
                const bool pinching = is_pinching(hand.landmarks, config.snap.pinch_threshold_sq);
                const float middle_y = hand.landmarks[landmarks::MIDDLE_TIP].y;

                SnapDecision decision = detector->update(pinching, middle_y, scratch.get(hand.side));
                if (decision.fired) {
                    hand_result.snap_fired = true;
                    result.snap = true;

                    SnapEvent event;
                    event.side = hand.side;
                    event.middle_tip_velocity = decision.velocity;
                    event.frame_index = result.frame_index;
                    events.push_back(event);
                }
            }

            result.hands.push_back(std::move(hand_result));
        }

        return result;
    }
};

GestureStateMachine::GestureStateMachine(const EngineConfig& config)
    : pImpl(std::make_unique<Impl>(config)) {
    if (!config.is_valid()) {
        MASTERHAND_THROW(core::ConfigException, "Invalid gesture state machine configuration");
    }

    MASTERHAND_LOG_DEBUG("GestureStateMachine: policy=" + snap_policy_to_string(config.snap.policy) +
                         " pinch_threshold_sq=" + std::to_string(config.snap.pinch_threshold_sq) +
                         " velocity_threshold=" + std::to_string(config.snap.velocity_threshold) +
                         " classify=" + (config.classify_gestures ? "on" : "off") +
                         " snaps=" + (config.detect_snaps ? "on" : "off"));
}

GestureStateMachine::~GestureStateMachine() = default;

FrameResult GestureStateMachine::process_frame(const ObservationBatch& batch) {
    for (const auto& hand : batch.hands) {
        Impl::validate(hand);
    }

    std::vector<SnapEvent> events;
    FrameResult result;
    SnapCallback callback;
    void* user_data = nullptr;

    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);

        if (!batch.empty()) {
            HandStateStore scratch = pImpl->store;
            result = pImpl->evaluate(batch, scratch, events);
            pImpl->store = scratch;
        } else {
            result.frame_index = pImpl->frames_processed;
        }
        ++pImpl->frames_processed;

        callback = pImpl->callback;
        user_data = pImpl->user_data;
    }

    if (callback) {
        for (const auto& event : events) {
            callback(event, user_data);
        }
    }

    return result;
}

void GestureStateMachine::set_snap_callback(SnapCallback callback, void* user_data) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->callback = std::move(callback);
    pImpl->user_data = user_data;
}

HandTemporalState GestureStateMachine::state(HandSide side) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->store.get(side);
}

HandStateStore GestureStateMachine::states() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->store;
}

void GestureStateMachine::reset() {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->store.reset();
    pImpl->frames_processed = 0;
}

uint64_t GestureStateMachine::frame_count() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->frames_processed;
}

EngineConfig GestureStateMachine::get_config() const {
    return pImpl->config;
}

} // namespace gesture
} // namespace masterhand
