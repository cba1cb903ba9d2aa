/**
 * @file GestureStateMachine.hpp
 * @brief Per-frame hand classification and snap detection
 *
 * Turns one frame of hand observations into per-hand fist/open/neutral
 * classifications and a frame-level snap flag, carrying the per-hand-side
 * pinch state from frame to frame.
 *
 * @copyright 2025 MasterHand Project
 * @license MIT License
 */

#ifndef MASTERHAND_GESTURE_STATE_MACHINE_HPP
#define MASTERHAND_GESTURE_STATE_MACHINE_HPP

#include <cstdint>
#include <memory>
#include "GestureTypes.hpp"
#include "SnapDetector.hpp"
#include "HandStateStore.hpp"

namespace masterhand {
namespace core {
    class Config;
}
}

namespace masterhand {
namespace gesture {

/**
 * @brief State machine configuration
 */
struct EngineConfig {
    /// Run the fold classifier and report a gesture per hand
    bool classify_gestures = true;

    /// Run the snap detector and report the frame-level snap flag
    bool detect_snaps = true;

    SnapConfig snap = SnapConfig::velocity_gated();

    bool is_valid() const {
        return snap.is_valid();
    }
};

/**
 * @brief Build an EngineConfig from the configuration store
 *
 * Reads gesture.classify, snap.enabled, snap.policy, snap.pinch_threshold_sq
 * and snap.velocity_threshold. A missing pinch threshold takes the policy's
 * default.
 *
 * @throws core::ConfigException on an unknown policy or invalid threshold
 */
EngineConfig make_engine_config(const core::Config& config);

/**
 * @brief Gesture state machine
 *
 * For every hand in a frame, in the order received:
 * 1. Classify fist/open/neutral from the fold count
 * 2. Compute the thumb/middle pinch flag
 * 3. Step the snap detector against that hand side's persistent state
 * 4. OR the hand's snap into the frame-level flag
 *
 * A frame is applied atomically: every observation is validated first and
 * the per-side state is committed only after all hands were evaluated, so a
 * rejected frame leaves both sides exactly as they were. An empty frame
 * touches nothing.
 *
 * Thread-safety: process_frame() serializes whole frames internally.
 *
 * Example usage:
 * @code
 * GestureStateMachine machine(EngineConfig{});
 * machine.set_snap_callback([](const SnapEvent& event, void*) {
 *     std::cout << hand_side_to_string(event.side) << " snapped" << std::endl;
 * });
 * FrameResult result = machine.process_frame(batch);
 * @endcode
 */
class GestureStateMachine {
public:
    explicit GestureStateMachine(const EngineConfig& config = EngineConfig());

    ~GestureStateMachine();

    // Disable copy and move
    GestureStateMachine(const GestureStateMachine&) = delete;
    GestureStateMachine& operator=(const GestureStateMachine&) = delete;
    GestureStateMachine(GestureStateMachine&&) = delete;
    GestureStateMachine& operator=(GestureStateMachine&&) = delete;

    /**
     * @brief Process one frame
     *
     * @param batch Hands observed this frame (may be empty)
     * @return Per-hand results and the frame-level snap flag
     * @throws core::InvalidObservationException if any landmark is not finite;
     *         no state is modified in that case
     */
    FrameResult process_frame(const ObservationBatch& batch);

    /**
     * @brief Register the snap observability hook
     *
     * Called once per hand whose detector fired, after the frame has been
     * committed and outside the internal lock.
     *
     * @param callback Function to call on each snap
     * @param user_data Optional user data pointer passed to callback
     */
    void set_snap_callback(SnapCallback callback, void* user_data = nullptr);

    /**
     * @brief Snapshot of one side's persistent state
     */
    HandTemporalState state(HandSide side) const;

    /**
     * @brief Snapshot of both sides
     */
    HandStateStore states() const;

    /**
     * @brief Return both sides to their initial state and zero the frame counter
     */
    void reset();

    /**
     * @brief Number of frames processed (including empty ones)
     */
    uint64_t frame_count() const;

    EngineConfig get_config() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;  ///< PIMPL idiom for implementation hiding
};

} // namespace gesture
} // namespace masterhand

#endif // MASTERHAND_GESTURE_STATE_MACHINE_HPP
