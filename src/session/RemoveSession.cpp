#include "fpservice/session/RemoveSession.hpp"
#include "fpservice/core/Logger.hpp"
#include "fpservice/core/exception.h"

#include <utility>

namespace fpservice {
namespace session {

RemoveSession::RemoveSession(Collaborators collaborators, Params params, int32_t templateId,
                             std::shared_ptr<storage::TemplateRegistry> registry)
    : ClientSession(std::move(collaborators), std::move(params))
    , template_id_(templateId)
    , registry_(std::move(registry)) {
    if (!registry_) {
        FPSERVICE_THROW_CODE(core::Exception, core::ResultCode::ERROR_INVALID_PARAMETER,
                             "RemoveSession requires a template registry");
    }
}

int RemoveSession::start() {
    const int32_t groupId = getGroupId();
    const int32_t templateId = template_id_;
    return issueDaemonOperation("remove template " + std::to_string(templateId),
                                "fingerprintd_remove_start_error",
                                [groupId, templateId](BiometricsDaemon& daemon) {
                                    return daemon.remove(groupId, templateId);
                                });
}

bool RemoveSession::onRemoved(int32_t templateId, int32_t /*groupId*/, int32_t remaining) {
    if (templateId != 0) {
        registry_->remove(templateId);
    }

    const int64_t deviceId = getDeviceId();
    const int32_t groupId = getGroupId();
    deliver("Removed", [=](SessionReceiver& r) {
        r.onRemoved(deviceId, templateId, groupId, remaining);
    });
    return remaining == 0;
}

} // namespace session
} // namespace fpservice
