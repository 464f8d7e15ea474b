#pragma once

#include "fpservice/session/SessionTypes.hpp"
#include "fpservice/storage/Template.hpp"

#include <cstdint>
#include <optional>

namespace fpservice {
namespace session {

/**
 * @brief Caller-side callback surface
 *
 * Implementations that forward to a remote caller throw
 * core::ReceiverException when the caller is gone.
 */
class SessionReceiver {
public:
    virtual ~SessionReceiver() = default;

    virtual void onEnrollResult(int64_t deviceId, int32_t templateId, int32_t groupId,
                                int32_t remaining) = 0;

    /**
     * @param tmpl std::nullopt for restricted callers
     */
    virtual void onAuthenticationSucceeded(int64_t deviceId,
                                           const std::optional<storage::Template>& tmpl,
                                           int32_t userId) = 0;

    virtual void onAuthenticationFailed(int64_t deviceId) = 0;

    virtual void onRemoved(int64_t deviceId, int32_t templateId, int32_t groupId,
                           int32_t remaining) = 0;

    virtual void onError(int64_t deviceId, ErrorKind kind, int32_t vendorCode) = 0;
};

} // namespace session
} // namespace fpservice
