/**
 * @file GesturePipeline.cpp
 * @brief Implementation of the ingest -> classify -> emit loop
 */

#include "masterhand/io/GesturePipeline.hpp"
#include "masterhand/core/exception.h"
#include "masterhand/core/Logger.hpp"

namespace masterhand {
namespace io {

PayloadOptions payload_options_for(const gesture::EngineConfig& config) {
    PayloadOptions options;
    options.include_gesture = config.classify_gestures;
    options.include_snap = config.detect_snaps;
    return options;
}

GesturePipeline::GesturePipeline(FrameSource& source,
                                 gesture::GestureStateMachine& machine,
                                 EventSink& sink,
                                 const PayloadOptions& options)
    : source_(source)
    , machine_(machine)
    , sink_(sink)
    , options_(options) {
}

bool GesturePipeline::step() {
    gesture::ObservationBatch batch;

    try {
        if (!source_.next(batch)) {
            return false;
        }
    } catch (const core::Exception& e) {
        ++stats_.frames_skipped;
        MASTERHAND_LOG_WARNING(std::string("GesturePipeline: skipping frame, ingest failed: ") + e.what());
        return true;
    }

    gesture::FrameResult result;
    try {
        result = machine_.process_frame(batch);
    } catch (const core::InvalidObservationException& e) {
        ++stats_.frames_skipped;
        MASTERHAND_LOG_WARNING(std::string("GesturePipeline: skipping frame, invalid observation: ") + e.what());
        return true;
    }
    ++stats_.frames_read;

    if (result.hands.empty()) {
        ++stats_.empty_frames;
        return true;
    }

    if (result.snap) {
        ++stats_.snaps;
    }

    try {
        sink_.publish(encode_frame_payload(result, options_));
        ++stats_.payloads_published;
        MASTERHAND_LOG_TRACE("GesturePipeline: published frame " + std::to_string(result.frame_index) +
                             " (" + std::to_string(result.hands.size()) + " hands" +
                             (result.snap ? ", snap" : "") + ")");
    } catch (const core::NetworkException& e) {
        ++stats_.publish_failures;
        MASTERHAND_LOG_ERROR(std::string("GesturePipeline: publish failed: ") + e.what());
    }

    return true;
}

PipelineStats GesturePipeline::run(const std::atomic<bool>* stop) {
    while (!(stop && stop->load())) {
        if (!step()) {
            break;
        }
    }

    MASTERHAND_LOG_STREAM(INFO, "GesturePipeline")
        << "run finished: " << stats_.frames_read << " frames, "
        << stats_.frames_skipped << " skipped, "
        << stats_.payloads_published << " published, "
        << stats_.snaps << " snaps";

    return stats_;
}

} // namespace io
} // namespace masterhand
