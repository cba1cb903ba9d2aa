/**
 * @file GestureTypes.hpp
 * @brief Core data types for hand gesture and snap detection
 *
 * Defines hand sides, per-hand classifications, the 21-point MediaPipe
 * landmark layout and the per-frame input/output records.
 *
 * @copyright 2025 MasterHand Project
 * @license MIT License
 */

#ifndef MASTERHAND_GESTURE_TYPES_HPP
#define MASTERHAND_GESTURE_TYPES_HPP

#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

namespace masterhand {
namespace gesture {

/// Number of landmarks produced per hand by the upstream model
constexpr size_t NUM_HAND_LANDMARKS = 21;

/**
 * @brief MediaPipe hand landmark indices
 *
 * 0: Wrist
 * 1-4: Thumb (CMC, MCP, IP, TIP)
 * 5-8: Index finger (MCP, PIP, DIP, TIP)
 * 9-12: Middle finger (MCP, PIP, DIP, TIP)
 * 13-16: Ring finger (MCP, PIP, DIP, TIP)
 * 17-20: Pinky (MCP, PIP, DIP, TIP)
 */
namespace landmarks {
    constexpr int WRIST = 0;
    constexpr int THUMB_TIP = 4;
    constexpr int INDEX_MCP = 5;
    constexpr int INDEX_TIP = 8;
    constexpr int MIDDLE_MCP = 9;
    constexpr int MIDDLE_TIP = 12;
    constexpr int RING_MCP = 13;
    constexpr int RING_TIP = 16;
    constexpr int PINKY_MCP = 17;
    constexpr int PINKY_TIP = 20;
} // namespace landmarks

/**
 * @brief Which hand an observation belongs to
 */
enum class HandSide {
    LEFT = 0,
    RIGHT = 1
};

constexpr size_t NUM_HAND_SIDES = 2;

/**
 * @brief Coarse open/closed classification of one hand
 */
enum class HandGesture {
    FIST,       ///< Three or more fingers folded
    OPEN,       ///< No finger folded
    NEUTRAL     ///< One or two fingers folded
};

/// 21 landmark points in normalized camera space
using HandLandmarkArray = std::array<cv::Point3f, NUM_HAND_LANDMARKS>;

/**
 * @brief One detected hand in one frame
 *
 * Produced fresh every frame by the landmark source and never mutated by
 * the state machine.
 */
struct HandObservation {
    HandSide side = HandSide::RIGHT;
    HandLandmarkArray landmarks{};

    /**
     * @brief Build an observation from an upstream label and point list
     *
     * @param label "Left" or "Right"
     * @param points Landmarks in index order, exactly 21 entries
     * @throws core::InvalidObservationException on an unknown label or wrong count
     */
    static HandObservation from_points(const std::string& label,
                                       const std::vector<cv::Point3f>& points);
};

/**
 * @brief All hands observed in one frame (possibly none)
 */
struct ObservationBatch {
    std::vector<HandObservation> hands;

    bool empty() const { return hands.empty(); }
};

/**
 * @brief Per-hand output record
 */
struct HandResult {
    HandSide side = HandSide::RIGHT;
    HandLandmarkArray landmarks{};

    /// Set only when gesture classification is enabled
    std::optional<HandGesture> gesture;

    /// Whether this hand's snap detector fired this frame
    bool snap_fired = false;
};

/**
 * @brief Per-frame output, rebuilt from scratch every frame
 */
struct FrameResult {
    std::vector<HandResult> hands;

    /// OR of every hand's snap_fired
    bool snap = false;

    /// Sequence number of the frame inside its state machine
    uint64_t frame_index = 0;
};

/**
 * @brief Snap notification delivered to the observability hook
 */
struct SnapEvent {
    HandSide side = HandSide::RIGHT;
    float middle_tip_velocity = 0.0f;   ///< |dy| of the middle fingertip for this frame
    uint64_t frame_index = 0;
};

/**
 * @brief Snap callback function type
 *
 * @param event The snap that fired
 * @param user_data Optional user data pointer passed at registration
 */
using SnapCallback = std::function<void(const SnapEvent& event, void* user_data)>;

/**
 * @brief Convert HandSide to its wire label ("Left"/"Right")
 */
inline std::string hand_side_to_string(HandSide side) {
    switch (side) {
        case HandSide::LEFT: return "Left";
        case HandSide::RIGHT: return "Right";
        default: return "Invalid";
    }
}

/**
 * @brief Parse a wire label
 * @throws core::InvalidObservationException for anything but "Left"/"Right"
 */
HandSide parse_hand_side(const std::string& label);

/**
 * @brief Convert HandGesture to its wire name ("Fist"/"Open"/"Neutral")
 */
inline std::string hand_gesture_to_string(HandGesture gesture) {
    switch (gesture) {
        case HandGesture::FIST: return "Fist";
        case HandGesture::OPEN: return "Open";
        case HandGesture::NEUTRAL: return "Neutral";
        default: return "Invalid";
    }
}

} // namespace gesture
} // namespace masterhand

#endif // MASTERHAND_GESTURE_TYPES_HPP
