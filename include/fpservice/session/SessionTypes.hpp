#pragma once

#include <cerrno>
#include <cstdint>
#include <string>
#include <variant>

namespace fpservice {
namespace session {

/// start()/stop() succeeded
constexpr int kResultSuccess = 0;
/// No daemon handle, or the daemon transport died mid-call
constexpr int kResultNoService = ESRCH;
/// Authentication refused while the lockout policy is engaged
constexpr int kResultLockedOut = EACCES;

/**
 * @brief Error kinds delivered to a caller's receiver
 *
 * Values match the platform fingerprint error codes.
 */
enum class ErrorKind {
    HW_UNAVAILABLE = 1,
    CANCELED = 5,
    LOCKOUT = 7,
    LOCKOUT_PERMANENT = 9
};

/**
 * @brief Result of consulting the lockout policy
 */
enum class LockoutMode {
    NONE = 0,       ///< No restriction
    TIMED = 1,      ///< Temporary backoff
    PERMANENT = 2   ///< Until failed attempts are explicitly reset
};

enum class SessionKind {
    ENROLL,
    AUTHENTICATE,
    REMOVE,
    ENUMERATE
};

std::string errorKindToString(ErrorKind kind);
std::string lockoutModeToString(LockoutMode mode);
std::string sessionKindToString(SessionKind kind);

// Daemon callbacks. remaining == 0 marks the last one of a sequence.

struct EnrollResult {
    int32_t template_id = 0;
    int32_t group_id = 0;
    int32_t remaining = 0;
};

/// template_id == 0 means no match
struct AuthenticatedResult {
    int32_t template_id = 0;
    int32_t group_id = 0;
};

struct RemovedResult {
    int32_t template_id = 0;
    int32_t group_id = 0;
    int32_t remaining = 0;
};

struct EnumerationResult {
    int32_t template_id = 0;
    int32_t group_id = 0;
    int32_t remaining = 0;
};

using DaemonEvent = std::variant<EnrollResult, AuthenticatedResult, RemovedResult, EnumerationResult>;

} // namespace session
} // namespace fpservice
