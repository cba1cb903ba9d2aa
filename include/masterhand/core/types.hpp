/**
 * @file types.hpp
 * @brief Common type definitions for MasterHand
 */

#ifndef MASTERHAND_CORE_TYPES_HPP
#define MASTERHAND_CORE_TYPES_HPP

#include <cstdint>

namespace masterhand {
namespace core {

/**
 * @brief Result codes returned by operations that talk to the outside world
 */
enum class ResultCode : int32_t {
    SUCCESS = 0,
    ERROR_GENERIC = -1,
    ERROR_INVALID_PARAMETER = -2,
    ERROR_NOT_INITIALIZED = -3,
    ERROR_INVALID_OBSERVATION = -4,   ///< Malformed hand observation (bad label or landmark count)
    ERROR_INVALID_CONFIG = -5,
    ERROR_PAYLOAD_FORMAT = -6,        ///< Wire payload is not valid JSON or has the wrong shape
    ERROR_FILE_NOT_FOUND = -7,
    ERROR_FILE_IO = -8,
    ERROR_NETWORK = -9
};

} // namespace core
} // namespace masterhand

#endif // MASTERHAND_CORE_TYPES_HPP
