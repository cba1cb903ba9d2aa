#pragma once

#include "masterhand/core/types.hpp"
#include <stdexcept>
#include <string>

/**
 * @file exception.h
 * @brief Exception handling system for MasterHand
 */

namespace masterhand {
namespace core {

/**
 * @brief Base exception class for all MasterHand exceptions
 *
 * Carries a result code, the raw message and the throw site as context.
 */
class Exception : public std::runtime_error {
public:
    /**
     * @brief Construct exception with result code and message
     * @param code Result code indicating error type
     * @param message Detailed error description
     * @param context Additional context information
     */
    Exception(ResultCode code,
              const std::string& message,
              const std::string& context = "")
        : std::runtime_error(formatMessage(code, message, context))
        , result_code_(code)
        , message_(message)
        , context_(context) {}

    ResultCode getResultCode() const noexcept { return result_code_; }

    /**
     * @brief Get the original error message
     * @return Error message without formatting
     */
    const std::string& getMessage() const noexcept { return message_; }

    const std::string& getContext() const noexcept { return context_; }

private:
    ResultCode result_code_;
    std::string message_;
    std::string context_;

    static std::string formatMessage(ResultCode code,
                                     const std::string& message,
                                     const std::string& context);
};

/**
 * @brief Hand observation violates its preconditions
 *
 * Thrown for an unknown hand label or a landmark set that is not exactly
 * the 21 MediaPipe joints.
 */
class InvalidObservationException : public Exception {
public:
    InvalidObservationException(const std::string& message,
                                const std::string& context = "")
        : Exception(ResultCode::ERROR_INVALID_OBSERVATION, message, context) {}
};

/**
 * @brief Configuration-related exceptions
 */
class ConfigException : public Exception {
public:
    ConfigException(const std::string& message,
                    const std::string& context = "")
        : Exception(ResultCode::ERROR_INVALID_CONFIG, message, context) {}
};

/**
 * @brief Wire payload could not be parsed
 */
class PayloadException : public Exception {
public:
    PayloadException(const std::string& message,
                     const std::string& context = "")
        : Exception(ResultCode::ERROR_PAYLOAD_FORMAT, message, context) {}
};

/**
 * @brief File I/O related exceptions
 */
class FileException : public Exception {
public:
    FileException(ResultCode code,
                  const std::string& message,
                  const std::string& context = "")
        : Exception(code, message, context) {}
};

/**
 * @brief Socket-related exceptions
 */
class NetworkException : public Exception {
public:
    NetworkException(const std::string& message,
                     const std::string& context = "")
        : Exception(ResultCode::ERROR_NETWORK, message, context) {}
};

/**
 * @brief Convert result code to string representation
 */
std::string resultCodeToString(ResultCode code);

/**
 * @brief Macro for throwing exceptions with automatic context
 */
#define MASTERHAND_THROW(ExceptionType, message) \
    throw ExceptionType(message, std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define MASTERHAND_THROW_CODE(ExceptionType, code, message) \
    throw ExceptionType(code, message, std::string(__FILE__) + ":" + std::to_string(__LINE__))

} // namespace core
} // namespace masterhand
