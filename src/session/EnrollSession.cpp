#include "fpservice/session/EnrollSession.hpp"
#include "fpservice/core/Logger.hpp"
#include "fpservice/core/exception.h"

#include <utility>

namespace fpservice {
namespace session {

EnrollSession::EnrollSession(Collaborators collaborators, Params params,
                             const std::vector<uint8_t>& token,
                             std::shared_ptr<storage::TemplateRegistry> registry,
                             std::chrono::seconds timeout)
    : ClientSession(std::move(collaborators), std::move(params))
    , token_(token.begin(), token.end())
    , registry_(std::move(registry))
    , timeout_(timeout) {
    if (!registry_) {
        FPSERVICE_THROW_CODE(core::Exception, core::ResultCode::ERROR_INVALID_PARAMETER,
                             "EnrollSession requires a template registry");
    }
}

int EnrollSession::start() {
    const int32_t groupId = getGroupId();
    const auto timeoutSec = static_cast<int32_t>(timeout_.count());
    return issueDaemonOperation("enroll", "fingerprintd_enroll_start_error",
                                [this, groupId, timeoutSec](BiometricsDaemon& daemon) {
                                    return daemon.enroll(token_, groupId, timeoutSec);
                                });
}

bool EnrollSession::onEnrollResult(int32_t templateId, int32_t groupId, int32_t remaining) {
    if (groupId != getGroupId()) {
        FPSERVICE_LOG_WARNING("EnrollSession") << "groupId != getGroupId(), groupId: " << groupId
                                               << " getGroupId(): " << getGroupId();
    }
    if (remaining == 0) {
        registry_->add(templateId, groupId);
    }
    return sendEnrollResult(templateId, groupId, remaining);
}

bool EnrollSession::sendEnrollResult(int32_t templateId, int32_t groupId, int32_t remaining) {
    if (!getReceiver()) {
        return true; // client not listening
    }

    vibrateSuccess();
    if (telemetry()) {
        telemetry()->recordAction(TelemetryAction::ENROLL, true);
    }

    const int64_t deviceId = getDeviceId();
    bool delivered = deliver("EnrollResult", [=](SessionReceiver& r) {
        r.onEnrollResult(deviceId, templateId, groupId, remaining);
    });
    if (!delivered) {
        return true;
    }
    return remaining == 0;
}

void EnrollSession::onStopRequested(bool initiatedByCaller, int /*cancelResult*/) {
    // The caller sees its cancel acknowledged even if the daemon refused it
    if (initiatedByCaller) {
        onError(ErrorKind::CANCELED, 0);
    }
}

} // namespace session
} // namespace fpservice
