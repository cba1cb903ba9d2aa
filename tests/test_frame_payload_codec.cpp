/**
 * @file test_frame_payload_codec.cpp
 * @brief Unit tests for the JSON frame payload encoder/decoder
 */

#include <gtest/gtest.h>
#include <masterhand/io/FramePayloadCodec.hpp>
#include <masterhand/core/exception.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include "HandFixtures.hpp"

using namespace masterhand;
using namespace masterhand::gesture;
using nlohmann::json;

namespace {

json landmark_list(size_t count) {
    json list = json::array();
    for (size_t i = 0; i < count; ++i) {
        list.push_back(json{{"id", static_cast<int>(i)}, {"x", 0.01 * i}, {"y", 0.5}, {"z", 0.0}});
    }
    return list;
}

std::string payload_with(const json& landmarks, const std::string& label = "Right") {
    json root;
    root["hands"] = json::array();
    root["hands"].push_back(json{{"label", label}, {"landmarks", landmarks}});
    return root.dump();
}

FrameResult sample_frame() {
    FrameResult frame;

    HandResult left;
    left.side = HandSide::LEFT;
    left.landmarks = masterhand::testing::make_hand({{true, true, true, true}});
    left.gesture = HandGesture::FIST;
    frame.hands.push_back(left);

    HandResult right;
    right.side = HandSide::RIGHT;
    right.landmarks = masterhand::testing::make_hand();
    right.gesture = HandGesture::OPEN;
    right.snap_fired = true;
    frame.hands.push_back(right);

    frame.snap = true;
    return frame;
}

} // namespace

TEST(FramePayloadEncodeTest, WritesFullShape) {
    json root = json::parse(io::encode_frame_payload(sample_frame()));

    ASSERT_TRUE(root["hands"].is_array());
    ASSERT_EQ(root["hands"].size(), 2u);
    EXPECT_EQ(root["hands"][0]["label"].get<std::string>(), "Left");
    EXPECT_EQ(root["hands"][0]["gesture"].get<std::string>(), "Fist");
    EXPECT_EQ(root["hands"][1]["label"].get<std::string>(), "Right");
    EXPECT_EQ(root["hands"][1]["gesture"].get<std::string>(), "Open");
    EXPECT_EQ(root["snap"].get<bool>(), true);

    const json& points = root["hands"][1]["landmarks"];
    ASSERT_EQ(points.size(), NUM_HAND_LANDMARKS);
    for (size_t i = 0; i < points.size(); ++i) {
        EXPECT_EQ(points[i]["id"].get<int>(), static_cast<int>(i));
        EXPECT_TRUE(points[i].contains("x"));
        EXPECT_TRUE(points[i].contains("y"));
        EXPECT_TRUE(points[i].contains("z"));
    }
    EXPECT_NEAR(points[static_cast<size_t>(landmarks::MIDDLE_TIP)]["y"].get<double>(), 0.4, 1e-6);
}

TEST(FramePayloadEncodeTest, OptionalFieldsCanBeOmitted) {
    io::PayloadOptions options;
    options.include_gesture = false;
    options.include_snap = false;

    json root = json::parse(io::encode_frame_payload(sample_frame(), options));
    EXPECT_FALSE(root.contains("snap"));
    for (const auto& hand : root["hands"]) {
        EXPECT_FALSE(hand.contains("gesture"));
        EXPECT_TRUE(hand.contains("landmarks"));
    }
}

TEST(FramePayloadEncodeTest, UnclassifiedHandHasNoGesture) {
    FrameResult frame;
    HandResult hand;
    hand.landmarks = masterhand::testing::make_hand();
    frame.hands.push_back(hand);

    json root = json::parse(io::encode_frame_payload(frame));
    EXPECT_FALSE(root["hands"][0].contains("gesture"));
    EXPECT_EQ(root["snap"].get<bool>(), false);
}

TEST(FramePayloadEncodeTest, EmptyFrameStillHasHandsArray) {
    json root = json::parse(io::encode_frame_payload(FrameResult{}));
    ASSERT_TRUE(root["hands"].is_array());
    EXPECT_TRUE(root["hands"].empty());
}

TEST(FramePayloadDecodeTest, EncodedFrameDecodes) {
    FrameResult frame = sample_frame();
    io::DecodedPacket packet = io::decode_frame_packet(io::encode_frame_payload(frame));

    ASSERT_EQ(packet.observations.hands.size(), 2u);
    EXPECT_EQ(packet.observations.hands[0].side, HandSide::LEFT);
    EXPECT_EQ(packet.observations.hands[1].side, HandSide::RIGHT);
    ASSERT_EQ(packet.gestures.size(), 2u);
    EXPECT_EQ(packet.gestures[0], "Fist");
    EXPECT_EQ(packet.gestures[1], "Open");
    EXPECT_TRUE(packet.snap);

    for (size_t i = 0; i < NUM_HAND_LANDMARKS; ++i) {
        EXPECT_FLOAT_EQ(packet.observations.hands[1].landmarks[i].x, frame.hands[1].landmarks[i].x);
        EXPECT_FLOAT_EQ(packet.observations.hands[1].landmarks[i].y, frame.hands[1].landmarks[i].y);
        EXPECT_FLOAT_EQ(packet.observations.hands[1].landmarks[i].z, frame.hands[1].landmarks[i].z);
    }
}

TEST(FramePayloadDecodeTest, MissingSnapDefaultsToFalse) {
    io::DecodedPacket packet = io::decode_frame_packet(payload_with(landmark_list(21)));
    EXPECT_FALSE(packet.snap);
    ASSERT_EQ(packet.gestures.size(), 1u);
    EXPECT_TRUE(packet.gestures[0].empty());
}

TEST(FramePayloadDecodeTest, LandmarksPlacedById) {
    json list = landmark_list(21);
    std::reverse(list.begin(), list.end());

    ObservationBatch batch = io::decode_observation_batch(payload_with(list));
    ASSERT_EQ(batch.hands.size(), 1u);
    for (size_t i = 0; i < NUM_HAND_LANDMARKS; ++i) {
        EXPECT_NEAR(batch.hands[0].landmarks[i].x, 0.01 * i, 1e-6);
    }
}

TEST(FramePayloadDecodeTest, MissingIdRejected) {
    json list = json::array();
    for (size_t i = 0; i < NUM_HAND_LANDMARKS; ++i) {
        list.push_back(json{{"x", 0.02 * i}, {"y", 0.1}, {"z", 0.0}});
    }
    EXPECT_THROW(io::decode_observation_batch(payload_with(list, "Left")),
                 core::InvalidObservationException);

    json one_missing = landmark_list(21);
    one_missing[20].erase("id");
    EXPECT_THROW(io::decode_observation_batch(payload_with(one_missing)),
                 core::InvalidObservationException);
}

TEST(FramePayloadDecodeTest, EmptyHandsIsEmptyBatch) {
    EXPECT_TRUE(io::decode_observation_batch(R"({"hands": []})").empty());
}

TEST(FramePayloadDecodeTest, WrongLandmarkCountRejected) {
    EXPECT_THROW(io::decode_observation_batch(payload_with(landmark_list(20))),
                 core::InvalidObservationException);
    EXPECT_THROW(io::decode_observation_batch(payload_with(landmark_list(22))),
                 core::InvalidObservationException);
}

TEST(FramePayloadDecodeTest, BadIdsRejected) {
    json out_of_range = landmark_list(21);
    out_of_range[3]["id"] = 21;
    EXPECT_THROW(io::decode_observation_batch(payload_with(out_of_range)),
                 core::InvalidObservationException);

    json duplicate = landmark_list(21);
    duplicate[4]["id"] = 3;
    EXPECT_THROW(io::decode_observation_batch(payload_with(duplicate)),
                 core::InvalidObservationException);
}

TEST(FramePayloadDecodeTest, UnknownLabelRejected) {
    EXPECT_THROW(io::decode_observation_batch(payload_with(landmark_list(21), "Middle")),
                 core::InvalidObservationException);
}

TEST(FramePayloadDecodeTest, MalformedPayloadsRejected) {
    EXPECT_THROW(io::decode_observation_batch("{not json"), core::PayloadException);
    EXPECT_THROW(io::decode_observation_batch("[1, 2, 3]"), core::PayloadException);
    EXPECT_THROW(io::decode_observation_batch(R"({"frames": []})"), core::PayloadException);
    EXPECT_THROW(io::decode_observation_batch(R"({"hands": [{"landmarks": []}]})"), core::PayloadException);

    json no_coordinate = landmark_list(21);
    no_coordinate[7].erase("z");
    EXPECT_THROW(io::decode_observation_batch(payload_with(no_coordinate)), core::PayloadException);

    json bad_snap = json::parse(payload_with(landmark_list(21)));
    bad_snap["snap"] = "yes";
    EXPECT_THROW(io::decode_frame_packet(bad_snap.dump()), core::PayloadException);
}

TEST(FramePayloadDecodeTest, ErrorsCarryResultCodes) {
    try {
        io::decode_observation_batch("{not json");
        FAIL() << "Expected PayloadException";
    } catch (const core::PayloadException& e) {
        EXPECT_EQ(e.getResultCode(), core::ResultCode::ERROR_PAYLOAD_FORMAT);
    }

    try {
        io::decode_observation_batch(payload_with(landmark_list(5)));
        FAIL() << "Expected InvalidObservationException";
    } catch (const core::InvalidObservationException& e) {
        EXPECT_EQ(e.getResultCode(), core::ResultCode::ERROR_INVALID_OBSERVATION);
    }
}
