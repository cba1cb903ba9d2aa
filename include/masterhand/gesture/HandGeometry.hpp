/**
 * @file HandGeometry.hpp
 * @brief Per-frame geometric classifiers for a single hand
 *
 * Both classifiers are pure functions of one hand's 21 landmarks. They work
 * on squared distances only, so no square roots or joint angles are taken.
 *
 * @copyright 2025 MasterHand Project
 * @license MIT License
 */

#ifndef MASTERHAND_GESTURE_HAND_GEOMETRY_HPP
#define MASTERHAND_GESTURE_HAND_GEOMETRY_HPP

#include "GestureTypes.hpp"

namespace masterhand {
namespace gesture {

/// Squared 3-D Euclidean distance
inline float squared_distance(const cv::Point3f& a, const cv::Point3f& b) {
    const float dx = a.x - b.x;
    const float dy = a.y - b.y;
    const float dz = a.z - b.z;
    return dx * dx + dy * dy + dz * dz;
}

// ===== Fold / openness classifier =====

/**
 * @brief Count folded non-thumb fingers
 *
 * A finger is folded when its tip is closer to the wrist than its own MCP
 * knuckle: |wrist - tip|^2 < |wrist - mcp|^2. Index, middle, ring and
 * pinky are checked; the thumb is ignored.
 *
 * @return Number of folded fingers in [0, 4]
 */
int count_folded_fingers(const HandLandmarkArray& points);

/**
 * @brief Classify a hand as fist, open or neutral
 *
 * 3 or 4 folded -> FIST, 0 folded -> OPEN, otherwise NEUTRAL.
 */
HandGesture classify_hand(const HandLandmarkArray& points);

// ===== Pinch detector =====

/// Squared distance between thumb tip (4) and middle fingertip (12)
float thumb_middle_distance_sq(const HandLandmarkArray& points);

/**
 * @brief Thumb/middle pinch test for the current frame
 *
 * @param points Hand landmarks
 * @param threshold_sq Squared distance bound; the comparison is strict
 * @return true if thumb_middle_distance_sq(points) < threshold_sq
 */
bool is_pinching(const HandLandmarkArray& points, float threshold_sq);

} // namespace gesture
} // namespace masterhand

#endif // MASTERHAND_GESTURE_HAND_GEOMETRY_HPP
