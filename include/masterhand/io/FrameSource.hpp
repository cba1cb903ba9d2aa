/**
 * @file FrameSource.hpp
 * @brief Landmark frame ingest boundary
 *
 * @copyright 2025 MasterHand Project
 * @license MIT License
 */

#ifndef MASTERHAND_IO_FRAME_SOURCE_HPP
#define MASTERHAND_IO_FRAME_SOURCE_HPP

#include <fstream>
#include <string>
#include "masterhand/gesture/GestureTypes.hpp"

namespace masterhand {
namespace io {

/**
 * @brief Produces one observation batch per frame
 */
class FrameSource {
public:
    virtual ~FrameSource() = default;

    /**
     * @brief Read the next frame
     *
     * @param batch Output batch, replaced on success
     * @return false at end of stream
     * @throws core::Exception if the frame could not be acquired; unless the
     *         underlying stream failed, the next call reads the following frame
     */
    virtual bool next(gesture::ObservationBatch& batch) = 0;
};

/**
 * @brief Replays a recorded landmark stream
 *
 * The recording holds one wire-format JSON object per line. Blank lines and
 * lines starting with '#' are skipped.
 */
class ReplayFrameSource : public FrameSource {
public:
    /**
     * @throws core::FileException if the recording cannot be opened
     */
    explicit ReplayFrameSource(const std::string& path);

    bool next(gesture::ObservationBatch& batch) override;

    /// 1-based line number of the last line read
    size_t line_number() const { return line_number_; }

private:
    std::string path_;
    std::ifstream stream_;
    size_t line_number_ = 0;
    bool failed_ = false;
};

} // namespace io
} // namespace masterhand

#endif // MASTERHAND_IO_FRAME_SOURCE_HPP
