/**
 * @file FramePayloadCodec.hpp
 * @brief JSON wire format for hand frames
 *
 * Wire shape (one object per frame):
 * @code
 * { "hands": [ { "label": "Left"|"Right",
 *                "landmarks": [ {"id": 0, "x": .., "y": .., "z": ..}, ... 21 ],
 *                "gesture": "Fist"|"Open"|"Neutral" },     // optional
 *              ... ],
 *   "snap": true|false }                                    // optional
 * @endcode
 *
 * @copyright 2025 MasterHand Project
 * @license MIT License
 */

#ifndef MASTERHAND_IO_FRAME_PAYLOAD_CODEC_HPP
#define MASTERHAND_IO_FRAME_PAYLOAD_CODEC_HPP

#include <optional>
#include <string>
#include <vector>
#include "masterhand/gesture/GestureTypes.hpp"

namespace masterhand {
namespace io {

/**
 * @brief Which optional fields the encoder emits
 *
 * With both flags off the payload is a bare landmark relay.
 */
struct PayloadOptions {
    bool include_gesture = true;
    bool include_snap = true;
};

/**
 * @brief Serialize a frame result
 *
 * "gesture" is written for a hand only if include_gesture is set and the
 * hand carries a classification.
 */
std::string encode_frame_payload(const gesture::FrameResult& frame,
                                 const PayloadOptions& options = PayloadOptions());

/**
 * @brief Parse the observation part of a payload
 *
 * Optional "gesture" and "snap" fields are ignored. Landmarks are placed by
 * their "id" field.
 *
 * @throws core::PayloadException if the text is not JSON or lacks the required structure
 * @throws core::InvalidObservationException on an unknown label, a landmark
 *         count other than 21, or a missing/duplicate/out-of-range id
 */
gesture::ObservationBatch decode_observation_batch(const std::string& payload);

/**
 * @brief A payload as the consumer sees it
 */
struct DecodedPacket {
    gesture::ObservationBatch observations;

    /// Per-hand gesture name, parallel to observations.hands (empty if absent)
    std::vector<std::string> gestures;

    /// Defaults to false when the field is absent
    bool snap = false;
};

/**
 * @brief Parse a full payload, including the optional fields
 */
DecodedPacket decode_frame_packet(const std::string& payload);

} // namespace io
} // namespace masterhand

#endif // MASTERHAND_IO_FRAME_PAYLOAD_CODEC_HPP
