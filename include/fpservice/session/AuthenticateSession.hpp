#pragma once

#include "fpservice/session/ClientSession.hpp"
#include "fpservice/session/LockoutPolicy.hpp"
#include "fpservice/storage/TemplateRegistry.hpp"

#include <cstdint>
#include <memory>
#include <optional>

namespace fpservice {
namespace session {

/**
 * @brief Matches a finger against the user's enrolled templates
 *
 * Failed matches are fed to the LockoutPolicy. Once the policy reports a
 * lockout the session stops itself and reports LOCKOUT or
 * LOCKOUT_PERMANENT; a success resets the policy.
 */
class AuthenticateSession : public ClientSession {
public:
    /**
     * @param lockout shared failed-attempt policy, required
     * @param names optional registry used to report the matched template's name
     */
    AuthenticateSession(Collaborators collaborators, Params params, uint64_t operationId,
                        std::shared_ptr<LockoutPolicy> lockout,
                        std::shared_ptr<const storage::TemplateRegistry> names = nullptr);

    SessionKind getKind() const override { return SessionKind::AUTHENTICATE; }

    /**
     * Refuses with kResultLockedOut while the policy reports a lockout
     */
    int start() override;

    /**
     * @param templateId matched template, 0 for no match
     * @return true on a match, on lockout, or when the receiver is gone
     */
    bool onAuthenticated(int32_t templateId, int32_t groupId) override;

    uint64_t getOperationId() const { return operation_id_; }

private:
    std::optional<storage::Template> makeReportedTemplate(int32_t templateId, int32_t groupId) const;

    const uint64_t operation_id_;
    std::shared_ptr<LockoutPolicy> lockout_;
    std::shared_ptr<const storage::TemplateRegistry> names_;
};

} // namespace session
} // namespace fpservice
