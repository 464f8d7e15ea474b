#include "fpservice/session/SessionTypes.hpp"

namespace fpservice {
namespace session {

std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::HW_UNAVAILABLE:    return "HW_UNAVAILABLE";
        case ErrorKind::CANCELED:          return "CANCELED";
        case ErrorKind::LOCKOUT:           return "LOCKOUT";
        case ErrorKind::LOCKOUT_PERMANENT: return "LOCKOUT_PERMANENT";
        default:                           return "UNKNOWN";
    }
}

std::string lockoutModeToString(LockoutMode mode) {
    switch (mode) {
        case LockoutMode::NONE:      return "NONE";
        case LockoutMode::TIMED:     return "TIMED";
        case LockoutMode::PERMANENT: return "PERMANENT";
        default:                     return "UNKNOWN";
    }
}

std::string sessionKindToString(SessionKind kind) {
    switch (kind) {
        case SessionKind::ENROLL:       return "enroll";
        case SessionKind::AUTHENTICATE: return "authenticate";
        case SessionKind::REMOVE:       return "remove";
        case SessionKind::ENUMERATE:    return "enumerate";
        default:                        return "unknown";
    }
}

} // namespace session
} // namespace fpservice
