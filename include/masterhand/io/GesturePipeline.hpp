/**
 * @file GesturePipeline.hpp
 * @brief Frame-at-a-time ingest -> state machine -> sink loop
 *
 * @copyright 2025 MasterHand Project
 * @license MIT License
 */

#ifndef MASTERHAND_IO_GESTURE_PIPELINE_HPP
#define MASTERHAND_IO_GESTURE_PIPELINE_HPP

#include <atomic>
#include <cstdint>
#include "masterhand/gesture/GestureStateMachine.hpp"
#include "masterhand/io/EventSink.hpp"
#include "masterhand/io/FramePayloadCodec.hpp"
#include "masterhand/io/FrameSource.hpp"

namespace masterhand {
namespace io {

/**
 * @brief Counters for one pipeline run
 */
struct PipelineStats {
    uint64_t frames_read = 0;           ///< Frames handed to the state machine
    uint64_t frames_skipped = 0;        ///< Frames dropped because ingest or validation failed
    uint64_t empty_frames = 0;          ///< Frames with no hands (nothing published)
    uint64_t payloads_published = 0;
    uint64_t publish_failures = 0;
    uint64_t snaps = 0;                 ///< Frames whose snap flag was set
};

/**
 * @brief Drives one frame at a time through the state machine
 *
 * Each frame is fully processed and published before the next one is read.
 * A frame with no hands publishes nothing. A frame that fails to ingest or
 * validate is logged and skipped without touching the state machine.
 *
 * The pipeline borrows its collaborators; they must outlive it.
 */
class GesturePipeline {
public:
    GesturePipeline(FrameSource& source,
                    gesture::GestureStateMachine& machine,
                    EventSink& sink,
                    const PayloadOptions& options = PayloadOptions());

    GesturePipeline(const GesturePipeline&) = delete;
    GesturePipeline& operator=(const GesturePipeline&) = delete;

    /**
     * @brief Process a single frame
     * @return false once the source is exhausted
     */
    bool step();

    /**
     * @brief Process frames until the source is exhausted or stop is set
     *
     * @param stop Optional flag checked between frames
     * @return Counters accumulated so far
     */
    PipelineStats run(const std::atomic<bool>* stop = nullptr);

    const PipelineStats& stats() const { return stats_; }

private:
    FrameSource& source_;
    gesture::GestureStateMachine& machine_;
    EventSink& sink_;
    PayloadOptions options_;
    PipelineStats stats_;
};

/**
 * @brief Payload field selection matching a state machine configuration
 *
 * The "gesture" field is emitted only when classification runs and "snap"
 * only when snap detection runs.
 */
PayloadOptions payload_options_for(const gesture::EngineConfig& config);

} // namespace io
} // namespace masterhand

#endif // MASTERHAND_IO_GESTURE_PIPELINE_HPP
