#pragma once

#include "fpservice/session/SessionTypes.hpp"

#include <chrono>
#include <functional>
#include <mutex>
#include <string>

namespace fpservice {
namespace session {

/**
 * @brief Failed-attempt accounting consulted by AuthenticateSession
 */
class LockoutPolicy {
public:
    virtual ~LockoutPolicy() = default;

    /**
     * @brief Count one failed match
     * @return the lockout mode in force after this failure
     */
    virtual LockoutMode handleFailedAttempt() = 0;

    /**
     * Called on every successful match, and to lift a permanent lockout
     */
    virtual void resetFailedAttempts() = 0;

    virtual LockoutMode getLockoutMode() const = 0;
};

/**
 * @brief Counter based lockout with a timed backoff window
 *
 * Every timed_threshold-th consecutive failure opens a timed lockout of
 * timed_duration; failures inside an open window keep reporting TIMED.
 * Reaching permanent_threshold failures locks out until reset.
 */
class FailedAttemptLockoutPolicy : public LockoutPolicy {
public:
    using Clock = std::chrono::steady_clock;
    using ClockSource = std::function<Clock::time_point()>;

    struct Thresholds {
        int timed_threshold = 5;
        int permanent_threshold = 20;
        std::chrono::milliseconds timed_duration{30000};

        bool validate() const;
        std::string toString() const;
    };

    /**
     * @throws core::ConfigException if thresholds fail validate()
     */
    explicit FailedAttemptLockoutPolicy(const Thresholds& thresholds,
                                        ClockSource clock = &Clock::now);

    LockoutMode handleFailedAttempt() override;
    void resetFailedAttempts() override;
    LockoutMode getLockoutMode() const override;

    int getFailedAttempts() const;
    const Thresholds& getThresholds() const { return thresholds_; }

private:
    LockoutMode getLockoutModeLocked(Clock::time_point now) const;

    const Thresholds thresholds_;
    ClockSource clock_;

    mutable std::mutex mutex_;
    int failed_attempts_ = 0;
    Clock::time_point timed_lockout_until_{};
};

} // namespace session
} // namespace fpservice
