#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace fpservice {
namespace session {

/**
 * @brief Synchronous call surface of the hardware daemon
 *
 * Each call returns 0 on success or a daemon failure code. Implementations
 * throw core::DaemonException when the daemon cannot be reached.
 */
class BiometricsDaemon {
public:
    virtual ~BiometricsDaemon() = default;

    virtual int enroll(const std::vector<uint8_t>& token, int32_t groupId, int32_t timeoutSec) = 0;
    virtual int authenticate(uint64_t operationId, int32_t groupId) = 0;
    virtual int remove(int32_t groupId, int32_t templateId) = 0;
    virtual int cancel() = 0;
};

/**
 * Returns the current daemon connection, or nullptr when there is none
 */
using DaemonProvider = std::function<std::shared_ptr<BiometricsDaemon>()>;

} // namespace session
} // namespace fpservice
