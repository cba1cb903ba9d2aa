/**
 * @file ReplayFrameSource.cpp
 * @brief Line-delimited JSON recording reader
 */

#include "masterhand/io/FrameSource.hpp"
#include "masterhand/io/FramePayloadCodec.hpp"
#include "masterhand/core/exception.h"

namespace masterhand {
namespace io {

ReplayFrameSource::ReplayFrameSource(const std::string& path)
    : path_(path)
    , stream_(path) {
    if (!stream_.is_open()) {
        MASTERHAND_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_NOT_FOUND,
                              "Cannot open recording: " + path);
    }
}

bool ReplayFrameSource::next(gesture::ObservationBatch& batch) {
    if (failed_) {
        return false;
    }

    std::string line;
    while (std::getline(stream_, line)) {
        ++line_number_;

        const size_t start = line.find_first_not_of(" \t\r");
        if (start == std::string::npos || line[start] == '#') {
            continue;
        }

        try {
            batch = decode_observation_batch(line);
        } catch (const core::Exception& e) {
            // Re-throw with the recording position attached
            throw core::Exception(e.getResultCode(), e.getMessage(),
                                  path_ + ":" + std::to_string(line_number_));
        }
        return true;
    }

    if (stream_.bad()) {
        failed_ = true;
        MASTERHAND_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_IO,
                              "Read error in recording: " + path_);
    }
    return false;
}

} // namespace io
} // namespace masterhand
