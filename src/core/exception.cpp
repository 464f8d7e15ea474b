#include "fpservice/core/exception.h"
#include <sstream>

namespace fpservice {
namespace core {

std::string Exception::formatMessage(ResultCode code,
                                     const std::string& message,
                                     const std::string& context) {
    std::ostringstream oss;
    oss << "[" << resultCodeToString(code) << "] " << message;
    if (!context.empty()) {
        oss << " (Context: " << context << ")";
    }
    return oss.str();
}

std::string resultCodeToString(ResultCode code) {
    switch (code) {
        case ResultCode::SUCCESS:
            return "SUCCESS";
        case ResultCode::ERROR_INVALID_PARAMETER:
            return "ERROR_INVALID_PARAMETER";
        case ResultCode::ERROR_FILE_IO:
            return "ERROR_FILE_IO";
        case ResultCode::ERROR_PARSE:
            return "ERROR_PARSE";
        case ResultCode::ERROR_CONFIG_INVALID:
            return "ERROR_CONFIG_INVALID";
        case ResultCode::ERROR_DAEMON_TRANSPORT:
            return "ERROR_DAEMON_TRANSPORT";
        case ResultCode::ERROR_RECEIVER_UNREACHABLE:
            return "ERROR_RECEIVER_UNREACHABLE";
        default:
            return "UNKNOWN_ERROR";
    }
}

} // namespace core
} // namespace fpservice
