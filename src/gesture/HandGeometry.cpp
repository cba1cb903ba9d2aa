/**
 * @file HandGeometry.cpp
 * @brief Fold counting and pinch detection
 */

#include "masterhand/gesture/HandGeometry.hpp"

namespace masterhand {
namespace gesture {

namespace {

struct FingerJoints {
    int mcp;
    int tip;
};

constexpr std::array<FingerJoints, 4> kFingers = {{
    {landmarks::INDEX_MCP, landmarks::INDEX_TIP},
    {landmarks::MIDDLE_MCP, landmarks::MIDDLE_TIP},
    {landmarks::RING_MCP, landmarks::RING_TIP},
    {landmarks::PINKY_MCP, landmarks::PINKY_TIP},
}};

constexpr int kFistMinFolded = 3;

} // namespace

int count_folded_fingers(const HandLandmarkArray& points) {
    const cv::Point3f& wrist = points[landmarks::WRIST];

    int folded = 0;
    for (const auto& finger : kFingers) {
        const float tip_sq = squared_distance(wrist, points[finger.tip]);
        const float mcp_sq = squared_distance(wrist, points[finger.mcp]);
        if (tip_sq < mcp_sq) {
            ++folded;
        }
    }
    return folded;
}

HandGesture classify_hand(const HandLandmarkArray& points) {
    const int folded = count_folded_fingers(points);

    if (folded >= kFistMinFolded) {
        return HandGesture::FIST;
    }
    if (folded == 0) {
        return HandGesture::OPEN;
    }
    return HandGesture::NEUTRAL;
}

float thumb_middle_distance_sq(const HandLandmarkArray& points) {
    return squared_distance(points[landmarks::THUMB_TIP], points[landmarks::MIDDLE_TIP]);
}

bool is_pinching(const HandLandmarkArray& points, float threshold_sq) {
    return thumb_middle_distance_sq(points) < threshold_sq;
}

} // namespace gesture
} // namespace masterhand
