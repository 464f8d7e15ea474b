#include "fpservice/session/AuthenticateSession.hpp"
#include "fpservice/core/Logger.hpp"
#include "fpservice/core/exception.h"

#include <utility>

namespace fpservice {
namespace session {

namespace {

const char* const TAG = "AuthenticateSession";

ErrorKind lockoutError(LockoutMode mode) {
    return mode == LockoutMode::TIMED ? ErrorKind::LOCKOUT : ErrorKind::LOCKOUT_PERMANENT;
}

} // namespace

AuthenticateSession::AuthenticateSession(Collaborators collaborators, Params params, uint64_t operationId,
                                         std::shared_ptr<LockoutPolicy> lockout,
                                         std::shared_ptr<const storage::TemplateRegistry> names)
    : ClientSession(std::move(collaborators), std::move(params))
    , operation_id_(operationId)
    , lockout_(std::move(lockout))
    , names_(std::move(names)) {
    if (!lockout_) {
        FPSERVICE_THROW_CODE(core::Exception, core::ResultCode::ERROR_INVALID_PARAMETER,
                             "AuthenticateSession requires a lockout policy");
    }
}

int AuthenticateSession::start() {
    const LockoutMode mode = lockout_->getLockoutMode();
    if (mode != LockoutMode::NONE) {
        FPSERVICE_LOG_WARNING(TAG) << "authenticate refused, lockout " << lockoutModeToString(mode);
        onError(lockoutError(mode), 0);
        return kResultLockedOut;
    }

    const uint64_t operationId = operation_id_;
    const int32_t groupId = getGroupId();
    return issueDaemonOperation("authenticate", "fingerprintd_auth_start_error",
                                [operationId, groupId](BiometricsDaemon& daemon) {
                                    return daemon.authenticate(operationId, groupId);
                                });
}

std::optional<storage::Template> AuthenticateSession::makeReportedTemplate(int32_t templateId,
                                                                           int32_t groupId) const {
    if (isRestricted()) {
        return std::nullopt;
    }
    std::string name;
    if (names_) {
        if (auto stored = names_->find(templateId)) {
            name = stored->name;
        }
    }
    return storage::Template(name, groupId, templateId, getDeviceId());
}

bool AuthenticateSession::onAuthenticated(int32_t templateId, int32_t groupId) {
    const bool authenticated = templateId != 0;
    const int64_t deviceId = getDeviceId();
    bool done = false;

    if (telemetry()) {
        telemetry()->recordAction(TelemetryAction::AUTHENTICATE, authenticated);
    }

    const bool listening = static_cast<bool>(getReceiver());
    if (!listening) {
        done = true; // client not listening
    } else if (!authenticated) {
        done = !deliver("AuthenticationFailed", [deviceId](SessionReceiver& r) {
            r.onAuthenticationFailed(deviceId);
        });
    } else {
        FPSERVICE_LOG_DEBUG(TAG) << "onAuthenticated(owner=" << getOwner() << ", id=" << templateId
                                 << ", gp=" << groupId << ")";
        const std::optional<storage::Template> tmpl = makeReportedTemplate(templateId, groupId);
        const int32_t userId = getTargetUserId();
        done = !deliver("AuthenticationSucceeded", [deviceId, &tmpl, userId](SessionReceiver& r) {
            r.onAuthenticationSucceeded(deviceId, tmpl, userId);
        });
    }

    if (!authenticated) {
        if (listening) {
            vibrateError();
        }
        const LockoutMode mode = lockout_->handleFailedAttempt();
        if (mode != LockoutMode::NONE) {
            FPSERVICE_LOG_WARNING(TAG) << "Forcing lockout, mode " << lockoutModeToString(mode);
            stop(false);
            onError(lockoutError(mode), 0);
            done = true;
        }
    } else {
        if (listening) {
            vibrateSuccess();
        }
        lockout_->resetFailedAttempts();
        done = true;
    }
    return done;
}

} // namespace session
} // namespace fpservice
