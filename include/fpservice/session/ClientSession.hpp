#pragma once

#include "fpservice/session/BiometricsDaemon.hpp"
#include "fpservice/session/Feedback.hpp"
#include "fpservice/session/SessionReceiver.hpp"
#include "fpservice/session/SessionTypes.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace fpservice {
namespace session {

/**
 * @brief One in-flight enroll, authenticate or remove operation
 *
 * Created by the dispatcher for a single request, started once and
 * discarded after a terminal daemon callback or stop(). Daemon callbacks
 * enter through handleResult(); each variant overrides the one callback
 * it understands, the rest fall back to a logged no-op that reports
 * "done" so a misrouted callback never stalls the dispatcher.
 *
 * The receiver is held weakly: a caller that went away is "not
 * listening", never an error.
 */
class ClientSession {
public:
    struct Params {
        int64_t device_id = 0;       ///< daemon device id echoed to the receiver
        int32_t target_user_id = 0;
        int32_t group_id = 0;
        bool restricted = false;     ///< hide template names from the caller
        std::string owner;           ///< caller identity, for logs
    };

    struct Collaborators {
        DaemonProvider daemon;
        std::weak_ptr<SessionReceiver> receiver;
        std::shared_ptr<HapticFeedback> haptics;      ///< optional
        std::shared_ptr<TelemetrySink> telemetry;     ///< optional
    };

    ClientSession(Collaborators collaborators, Params params);
    virtual ~ClientSession() = default;

    ClientSession(const ClientSession&) = delete;
    ClientSession& operator=(const ClientSession&) = delete;

    virtual SessionKind getKind() const = 0;

    /**
     * @brief Issue the operation to the daemon
     * @return kResultSuccess, kResultNoService, or the daemon's failure code
     */
    virtual int start() = 0;

    /**
     * @brief Ask the daemon to cancel the operation
     *
     * Idempotent: once cancellation succeeded, later calls return
     * kResultSuccess without contacting the daemon. Safe to call
     * concurrently with daemon callbacks.
     */
    int stop(bool initiatedByCaller);

    /**
     * @brief Route a daemon callback to the matching handler
     * @return true when the session is finished
     */
    bool handleResult(const DaemonEvent& event);

    virtual bool onEnrollResult(int32_t templateId, int32_t groupId, int32_t remaining);
    virtual bool onAuthenticated(int32_t templateId, int32_t groupId);
    virtual bool onRemoved(int32_t templateId, int32_t groupId, int32_t remaining);
    virtual bool onEnumerationResult(int32_t templateId, int32_t groupId, int32_t remaining);

    /**
     * @brief Deliver an error to the receiver, if it is still listening
     * @return false if the receiver is gone or delivery failed
     */
    bool onError(ErrorKind kind, int32_t vendorCode);

    bool isAlreadyCancelled() const;

    int64_t getDeviceId() const { return params_.device_id; }
    int32_t getTargetUserId() const { return params_.target_user_id; }
    int32_t getGroupId() const { return params_.group_id; }
    bool isRestricted() const { return params_.restricted; }
    const std::string& getOwner() const { return params_.owner; }

protected:
    std::shared_ptr<BiometricsDaemon> getDaemon() const;
    std::shared_ptr<SessionReceiver> getReceiver() const;

    /**
     * @brief Shared start() body
     *
     * A missing daemon returns kResultNoService silently. A daemon failure
     * code or transport failure delivers HW_UNAVAILABLE and is returned.
     */
    int issueDaemonOperation(const std::string& operation,
                             const std::string& errorHistogram,
                             const std::function<int(BiometricsDaemon&)>& call);

    /**
     * @brief Invoke fn on the receiver, logging delivery failures
     * @return false if nobody is listening or delivery failed
     */
    bool deliver(const std::string& what, const std::function<void(SessionReceiver&)>& fn);

    /**
     * Hook run after a stop() that reached the daemon-cancel step,
     * whatever its result
     */
    virtual void onStopRequested(bool initiatedByCaller, int cancelResult);

    bool logIgnoredCallback(const std::string& callback) const;

    void vibrateSuccess();
    void vibrateError();
    TelemetrySink* telemetry() const { return collaborators_.telemetry.get(); }

private:
    Collaborators collaborators_;
    const Params params_;

    mutable std::mutex cancel_mutex_;
    bool already_cancelled_ = false;
};

} // namespace session
} // namespace fpservice
