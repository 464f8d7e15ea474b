#pragma once

#include "fpservice/session/ClientSession.hpp"
#include "fpservice/storage/TemplateRegistry.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

namespace fpservice {
namespace session {

/**
 * @brief Enrolls one finger, committing it to the registry when done
 */
class EnrollSession : public ClientSession {
public:
    static constexpr std::chrono::seconds kDefaultTimeout{60};

    /**
     * @param token capture/credential token, copied
     * @param registry registry of the target user
     */
    EnrollSession(Collaborators collaborators, Params params,
                  const std::vector<uint8_t>& token,
                  std::shared_ptr<storage::TemplateRegistry> registry,
                  std::chrono::seconds timeout = kDefaultTimeout);

    SessionKind getKind() const override { return SessionKind::ENROLL; }

    int start() override;

    /**
     * The daemon's group id wins over ours; a mismatch is only logged.
     * @return true when remaining == 0 or the receiver is gone
     */
    bool onEnrollResult(int32_t templateId, int32_t groupId, int32_t remaining) override;

    std::chrono::seconds getTimeout() const { return timeout_; }

protected:
    void onStopRequested(bool initiatedByCaller, int cancelResult) override;

private:
    bool sendEnrollResult(int32_t templateId, int32_t groupId, int32_t remaining);

    const std::vector<uint8_t> token_;
    std::shared_ptr<storage::TemplateRegistry> registry_;
    const std::chrono::seconds timeout_;
};

} // namespace session
} // namespace fpservice
