#include "fpservice/session/LockoutPolicy.hpp"
#include "fpservice/core/Logger.hpp"
#include "fpservice/core/exception.h"

#include <sstream>
#include <utility>

namespace fpservice {
namespace session {

bool FailedAttemptLockoutPolicy::Thresholds::validate() const {
    return timed_threshold > 0 &&
           permanent_threshold > timed_threshold &&
           timed_duration.count() >= 0;
}

std::string FailedAttemptLockoutPolicy::Thresholds::toString() const {
    std::ostringstream oss;
    oss << "timed_threshold=" << timed_threshold
        << ", permanent_threshold=" << permanent_threshold
        << ", timed_duration_ms=" << timed_duration.count();
    return oss.str();
}

FailedAttemptLockoutPolicy::FailedAttemptLockoutPolicy(const Thresholds& thresholds, ClockSource clock)
    : thresholds_(thresholds)
    , clock_(std::move(clock)) {
    if (!thresholds_.validate()) {
        FPSERVICE_THROW(core::ConfigException, "Invalid lockout thresholds: " + thresholds_.toString());
    }
    if (!clock_) {
        clock_ = &Clock::now;
    }
}

LockoutMode FailedAttemptLockoutPolicy::handleFailedAttempt() {
    std::lock_guard<std::mutex> lock(mutex_);
    const Clock::time_point now = clock_();

    failed_attempts_++;

    LockoutMode mode;
    if (failed_attempts_ >= thresholds_.permanent_threshold) {
        mode = LockoutMode::PERMANENT;
    } else if (failed_attempts_ % thresholds_.timed_threshold == 0) {
        timed_lockout_until_ = now + thresholds_.timed_duration;
        mode = LockoutMode::TIMED;
    } else {
        mode = getLockoutModeLocked(now);
    }

    if (mode != LockoutMode::NONE) {
        FPSERVICE_LOG_WARNING("LockoutPolicy") << failed_attempts_ << " failed attempts, lockout "
                                               << lockoutModeToString(mode);
    }
    return mode;
}

void FailedAttemptLockoutPolicy::resetFailedAttempts() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failed_attempts_ > 0) {
        FPSERVICE_LOG_DEBUG("LockoutPolicy") << "resetting " << failed_attempts_ << " failed attempts";
    }
    failed_attempts_ = 0;
    timed_lockout_until_ = Clock::time_point{};
}

LockoutMode FailedAttemptLockoutPolicy::getLockoutMode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return getLockoutModeLocked(clock_());
}

LockoutMode FailedAttemptLockoutPolicy::getLockoutModeLocked(Clock::time_point now) const {
    if (failed_attempts_ >= thresholds_.permanent_threshold) {
        return LockoutMode::PERMANENT;
    }
    if (failed_attempts_ > 0 && now < timed_lockout_until_) {
        return LockoutMode::TIMED;
    }
    return LockoutMode::NONE;
}

int FailedAttemptLockoutPolicy::getFailedAttempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_attempts_;
}

} // namespace session
} // namespace fpservice
