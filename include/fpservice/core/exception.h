#pragma once

#include "fpservice/core/types.hpp"
#include <stdexcept>
#include <string>

/**
 * @file exception.h
 * @brief Exception hierarchy for the fingerprint session service
 */

namespace fpservice {
namespace core {

/**
 * @brief Base exception class for all fpservice exceptions
 *
 * Carries a result code plus the raw message and the throw site context.
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
 * @brief Durable storage failures (I/O and document parsing)
 */
class FileException : public Exception {
public:
    FileException(ResultCode code,
                  const std::string& message,
                  const std::string& context = "")
        : Exception(code, message, context) {}
};

/**
 * @brief Invalid or unreadable configuration
 */
class ConfigException : public Exception {
public:
    ConfigException(const std::string& message,
                    const std::string& context = "")
        : Exception(ResultCode::ERROR_CONFIG_INVALID, message, context) {}
};

/**
 * @brief The transport to the hardware daemon failed mid-call
 *
 * Thrown by BiometricsDaemon implementations when the daemon process is
 * unreachable. Sessions treat it like a daemon failure code.
 */
class DaemonException : public Exception {
public:
    DaemonException(const std::string& message,
                    const std::string& context = "")
        : Exception(ResultCode::ERROR_DAEMON_TRANSPORT, message, context) {}
};

/**
 * @brief Delivery to a caller's receiver failed
 *
 * Receivers may legitimately disappear; sessions log this and move on.
 */
class ReceiverException : public Exception {
public:
    ReceiverException(const std::string& message,
                      const std::string& context = "")
        : Exception(ResultCode::ERROR_RECEIVER_UNREACHABLE, message, context) {}
};

/**
 * @brief Convert result code to string representation
 */
std::string resultCodeToString(ResultCode code);

#define FPSERVICE_THROW(ExceptionType, message) \
    throw ExceptionType(message, std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define FPSERVICE_THROW_CODE(ExceptionType, code, message) \
    throw ExceptionType(code, message, std::string(__FILE__) + ":" + std::to_string(__LINE__))

} // namespace core
} // namespace fpservice
