/**
 * @file FramePayloadCodec.cpp
 * @brief nlohmann::json based encoder/decoder for the hand frame payload
 */

#include "masterhand/io/FramePayloadCodec.hpp"
#include "masterhand/core/exception.h"
#include <nlohmann/json.hpp>
#include <array>

namespace masterhand {
namespace io {

using nlohmann::json;

namespace {

json encode_landmarks(const gesture::HandLandmarkArray& points) {
    json list = json::array();
    for (size_t id = 0; id < points.size(); ++id) {
        list.push_back(json{
            {"id", static_cast<int>(id)},
            {"x", points[id].x},
            {"y", points[id].y},
            {"z", points[id].z}
        });
    }
    return list;
}

float coordinate(const json& landmark, const char* axis, size_t index) {
    auto it = landmark.find(axis);
    if (it == landmark.end() || !it->is_number()) {
        MASTERHAND_THROW(core::PayloadException,
                         "Landmark entry " + std::to_string(index) + " has no numeric '" + axis + "'");
    }
    return it->get<float>();
}

gesture::HandObservation decode_hand(const json& hand) {
    if (!hand.is_object()) {
        MASTERHAND_THROW(core::PayloadException, "Hand entry is not an object");
    }

    auto label_it = hand.find("label");
    if (label_it == hand.end() || !label_it->is_string()) {
        MASTERHAND_THROW(core::PayloadException, "Hand entry has no string 'label'");
    }
    const std::string label = label_it->get<std::string>();

    auto landmarks_it = hand.find("landmarks");
    if (landmarks_it == hand.end() || !landmarks_it->is_array()) {
        MASTERHAND_THROW(core::PayloadException, "Hand '" + label + "' has no 'landmarks' array");
    }
    const json& list = *landmarks_it;

    if (list.size() != gesture::NUM_HAND_LANDMARKS) {
        MASTERHAND_THROW(core::InvalidObservationException,
                         "Hand '" + label + "' has " + std::to_string(list.size()) +
                         " landmarks, expected " + std::to_string(gesture::NUM_HAND_LANDMARKS));
    }

    std::vector<cv::Point3f> points(gesture::NUM_HAND_LANDMARKS);
    std::array<bool, gesture::NUM_HAND_LANDMARKS> seen{};

    for (size_t i = 0; i < list.size(); ++i) {
        const json& entry = list[i];
        if (!entry.is_object()) {
            MASTERHAND_THROW(core::PayloadException, "Landmark entry " + std::to_string(i) + " is not an object");
        }

        auto id_it = entry.find("id");
        if (id_it == entry.end()) {
            MASTERHAND_THROW(core::InvalidObservationException,
                             "Hand '" + label + "' landmark entry " + std::to_string(i) + " has no id");
        }
        if (!id_it->is_number_integer()) {
            MASTERHAND_THROW(core::PayloadException, "Landmark entry " + std::to_string(i) + " has a non-integer id");
        }
        const int64_t raw_id = id_it->get<int64_t>();
        if (raw_id < 0 || raw_id >= static_cast<int64_t>(gesture::NUM_HAND_LANDMARKS)) {
            MASTERHAND_THROW(core::InvalidObservationException,
                             "Hand '" + label + "' landmark id " + std::to_string(raw_id) + " out of range");
        }
        const size_t id = static_cast<size_t>(raw_id);

        if (seen[id]) {
            MASTERHAND_THROW(core::InvalidObservationException,
                             "Hand '" + label + "' repeats landmark id " + std::to_string(id));
        }
        seen[id] = true;

        points[id] = cv::Point3f(coordinate(entry, "x", i),
                                 coordinate(entry, "y", i),
                                 coordinate(entry, "z", i));
    }

    return gesture::HandObservation::from_points(label, points);
}

json parse_root(const std::string& payload) {
    json root;
    try {
        root = json::parse(payload);
    } catch (const json::parse_error& e) {
        MASTERHAND_THROW(core::PayloadException, std::string("Malformed JSON payload: ") + e.what());
    }

    if (!root.is_object()) {
        MASTERHAND_THROW(core::PayloadException, "Payload is not a JSON object");
    }
    auto hands_it = root.find("hands");
    if (hands_it == root.end() || !hands_it->is_array()) {
        MASTERHAND_THROW(core::PayloadException, "Payload has no 'hands' array");
    }
    return root;
}

} // namespace

std::string encode_frame_payload(const gesture::FrameResult& frame, const PayloadOptions& options) {
    json hands = json::array();
    for (const auto& hand : frame.hands) {
        json entry = {
            {"label", gesture::hand_side_to_string(hand.side)},
            {"landmarks", encode_landmarks(hand.landmarks)}
        };
        if (options.include_gesture && hand.gesture) {
            entry["gesture"] = gesture::hand_gesture_to_string(*hand.gesture);
        }
        hands.push_back(std::move(entry));
    }

    json root;
    root["hands"] = std::move(hands);
    if (options.include_snap) {
        root["snap"] = frame.snap;
    }
    return root.dump();
}

gesture::ObservationBatch decode_observation_batch(const std::string& payload) {
    return decode_frame_packet(payload).observations;
}

DecodedPacket decode_frame_packet(const std::string& payload) {
    const json root = parse_root(payload);

    DecodedPacket packet;
    for (const auto& hand : root["hands"]) {
        packet.observations.hands.push_back(decode_hand(hand));

        std::string gesture_name;
        auto gesture_it = hand.find("gesture");
        if (gesture_it != hand.end() && gesture_it->is_string()) {
            gesture_name = gesture_it->get<std::string>();
        }
        packet.gestures.push_back(std::move(gesture_name));
    }

    auto snap_it = root.find("snap");
    if (snap_it != root.end()) {
        if (!snap_it->is_boolean()) {
            MASTERHAND_THROW(core::PayloadException, "'snap' is not a boolean");
        }
        packet.snap = snap_it->get<bool>();
    }

    return packet;
}

} // namespace io
} // namespace masterhand
