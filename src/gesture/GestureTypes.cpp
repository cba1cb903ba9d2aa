/**
 * @file GestureTypes.cpp
 * @brief Validation helpers for gesture input records
 */

#include "masterhand/gesture/GestureTypes.hpp"
#include "masterhand/core/exception.h"
#include <algorithm>

namespace masterhand {
namespace gesture {

HandSide parse_hand_side(const std::string& label) {
    if (label == "Left") {
        return HandSide::LEFT;
    }
    if (label == "Right") {
        return HandSide::RIGHT;
    }
    MASTERHAND_THROW(core::InvalidObservationException,
                     "Unknown hand label '" + label + "' (expected \"Left\" or \"Right\")");
}

HandObservation HandObservation::from_points(const std::string& label,
                                             const std::vector<cv::Point3f>& points) {
    if (points.size() != NUM_HAND_LANDMARKS) {
        MASTERHAND_THROW(core::InvalidObservationException,
                         "Hand '" + label + "' has " + std::to_string(points.size()) +
                         " landmarks, expected " + std::to_string(NUM_HAND_LANDMARKS));
    }

    HandObservation observation;
    observation.side = parse_hand_side(label);
    std::copy(points.begin(), points.end(), observation.landmarks.begin());
    return observation;
}

} // namespace gesture
} // namespace masterhand
