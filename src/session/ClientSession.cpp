#include "fpservice/session/ClientSession.hpp"
#include "fpservice/core/Logger.hpp"
#include "fpservice/core/exception.h"

#include <type_traits>
#include <utility>

namespace fpservice {
namespace session {

namespace {

const char* const TAG = "ClientSession";

} // namespace

ClientSession::ClientSession(Collaborators collaborators, Params params)
    : collaborators_(std::move(collaborators))
    , params_(std::move(params)) {
}

std::shared_ptr<BiometricsDaemon> ClientSession::getDaemon() const {
    if (!collaborators_.daemon) {
        return nullptr;
    }
    return collaborators_.daemon();
}

std::shared_ptr<SessionReceiver> ClientSession::getReceiver() const {
    return collaborators_.receiver.lock();
}

bool ClientSession::isAlreadyCancelled() const {
    std::lock_guard<std::mutex> lock(cancel_mutex_);
    return already_cancelled_;
}

int ClientSession::stop(bool initiatedByCaller) {
    const std::string kind = sessionKindToString(getKind());
    int result = kResultSuccess;
    {
        std::lock_guard<std::mutex> lock(cancel_mutex_);
        if (already_cancelled_) {
            FPSERVICE_LOG_WARNING(TAG) << "stop " << kind << ": already cancelled";
            return kResultSuccess;
        }

        std::shared_ptr<BiometricsDaemon> daemon = getDaemon();
        if (!daemon) {
            FPSERVICE_LOG_WARNING(TAG) << "stop " << kind << ": no fingerprint daemon";
            result = kResultNoService;
        } else {
            try {
                result = daemon->cancel();
                if (result != kResultSuccess) {
                    FPSERVICE_LOG_WARNING(TAG) << "stop " << kind << ": cancel failed, result=" << result;
                } else {
                    already_cancelled_ = true;
                    FPSERVICE_LOG_DEBUG(TAG) << "client " << params_.owner << " is no longer running " << kind;
                }
            } catch (const core::DaemonException& e) {
                FPSERVICE_LOG_ERROR(TAG) << "stop " << kind << " failed: " << e.what();
                result = kResultNoService;
            }
        }
    }

    onStopRequested(initiatedByCaller, result);
    return result;
}

void ClientSession::onStopRequested(bool /*initiatedByCaller*/, int /*cancelResult*/) {
}

bool ClientSession::handleResult(const DaemonEvent& event) {
    return std::visit([this](const auto& result) -> bool {
        using T = std::decay_t<decltype(result)>;
        if constexpr (std::is_same_v<T, EnrollResult>) {
            return onEnrollResult(result.template_id, result.group_id, result.remaining);
        } else if constexpr (std::is_same_v<T, AuthenticatedResult>) {
            return onAuthenticated(result.template_id, result.group_id);
        } else if constexpr (std::is_same_v<T, RemovedResult>) {
            return onRemoved(result.template_id, result.group_id, result.remaining);
        } else {
            return onEnumerationResult(result.template_id, result.group_id, result.remaining);
        }
    }, event);
}

bool ClientSession::logIgnoredCallback(const std::string& callback) const {
    FPSERVICE_LOG_DEBUG(TAG) << callback << "() called for " << sessionKindToString(getKind());
    return true;
}

bool ClientSession::onEnrollResult(int32_t, int32_t, int32_t) {
    return logIgnoredCallback("onEnrollResult");
}

bool ClientSession::onAuthenticated(int32_t, int32_t) {
    return logIgnoredCallback("onAuthenticated");
}

bool ClientSession::onRemoved(int32_t, int32_t, int32_t) {
    return logIgnoredCallback("onRemoved");
}

bool ClientSession::onEnumerationResult(int32_t, int32_t, int32_t) {
    return logIgnoredCallback("onEnumerationResult");
}

bool ClientSession::deliver(const std::string& what, const std::function<void(SessionReceiver&)>& fn) {
    std::shared_ptr<SessionReceiver> receiver = getReceiver();
    if (!receiver) {
        return false;
    }
    try {
        fn(*receiver);
        return true;
    } catch (const core::ReceiverException& e) {
        FPSERVICE_LOG_WARNING(TAG) << "Failed to notify " << what << ": " << e.what();
        return false;
    }
}

bool ClientSession::onError(ErrorKind kind, int32_t vendorCode) {
    const int64_t deviceId = params_.device_id;
    return deliver("error " + errorKindToString(kind), [deviceId, kind, vendorCode](SessionReceiver& r) {
        r.onError(deviceId, kind, vendorCode);
    });
}

int ClientSession::issueDaemonOperation(const std::string& operation,
                                        const std::string& errorHistogram,
                                        const std::function<int(BiometricsDaemon&)>& call) {
    std::shared_ptr<BiometricsDaemon> daemon = getDaemon();
    if (!daemon) {
        FPSERVICE_LOG_WARNING(TAG) << operation << ": no fingerprint daemon";
        return kResultNoService;
    }

    int result;
    try {
        result = call(*daemon);
    } catch (const core::DaemonException& e) {
        FPSERVICE_LOG_ERROR(TAG) << operation << " failed: " << e.what();
        onError(ErrorKind::HW_UNAVAILABLE, 0);
        return kResultNoService;
    }

    if (result != kResultSuccess) {
        FPSERVICE_LOG_WARNING(TAG) << operation << " failed, result=" << result;
        if (telemetry()) {
            telemetry()->recordHistogram(errorHistogram, result);
        }
        onError(ErrorKind::HW_UNAVAILABLE, 0);
        return result;
    }

    FPSERVICE_LOG_DEBUG(TAG) << "client " << params_.owner << " started " << operation;
    return kResultSuccess;
}

void ClientSession::vibrateSuccess() {
    if (collaborators_.haptics) {
        collaborators_.haptics->vibrateSuccess();
    }
}

void ClientSession::vibrateError() {
    if (collaborators_.haptics) {
        collaborators_.haptics->vibrateError();
    }
}

} // namespace session
} // namespace fpservice
