#pragma once

#include "fpservice/session/ClientSession.hpp"
#include "fpservice/storage/TemplateRegistry.hpp"

#include <cstdint>
#include <memory>

namespace fpservice {
namespace session {

/**
 * @brief Removes one template from the daemon and from the user's registry
 *
 * Registry entries go only once the daemon confirms the removal.
 */
class RemoveSession : public ClientSession {
public:
    RemoveSession(Collaborators collaborators, Params params, int32_t templateId,
                  std::shared_ptr<storage::TemplateRegistry> registry);

    SessionKind getKind() const override { return SessionKind::REMOVE; }

    int start() override;

    bool onRemoved(int32_t templateId, int32_t groupId, int32_t remaining) override;

    int32_t getTemplateId() const { return template_id_; }

private:
    const int32_t template_id_;
    std::shared_ptr<storage::TemplateRegistry> registry_;
};

} // namespace session
} // namespace fpservice
