/**
 * @file types.hpp
 * @brief Common type definitions for the fingerprint session service
 *
 * Fundamental enums and structures shared by every fpservice module.
 */

#ifndef FPSERVICE_CORE_TYPES_HPP
#define FPSERVICE_CORE_TYPES_HPP

#include <cstdint>
#include <string>

namespace fpservice {
namespace core {

/**
 * @brief Result codes for library-level operations
 */
enum class ResultCode {
    SUCCESS = 0,
    ERROR_INVALID_PARAMETER = -2,
    ERROR_FILE_IO = -11,
    ERROR_PARSE = -12,
    ERROR_CONFIG_INVALID = -13,
    ERROR_DAEMON_TRANSPORT = -21,
    ERROR_RECEIVER_UNREACHABLE = -22
};

/**
 * @brief Library version
 */
struct Version {
    uint8_t major;
    uint8_t minor;
    uint8_t patch;

    std::string toString() const {
        return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    }
};

constexpr Version API_VERSION{1, 0, 0};

} // namespace core
} // namespace fpservice

#endif // FPSERVICE_CORE_TYPES_HPP
