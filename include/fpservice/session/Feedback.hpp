#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>

namespace fpservice {
namespace session {

/// Vibration patterns, alternating off/on durations in milliseconds
constexpr std::array<int64_t, 2> kSuccessVibratePatternMs{0, 30};
constexpr std::array<int64_t, 4> kErrorVibratePatternMs{0, 30, 100, 30};

/**
 * @brief Haptic output device
 */
class HapticFeedback {
public:
    virtual ~HapticFeedback() = default;

    virtual void vibrateSuccess() = 0;
    virtual void vibrateError() = 0;
};

enum class TelemetryAction {
    ENROLL,
    AUTHENTICATE
};

/**
 * @brief Metrics sink for session events
 */
class TelemetrySink {
public:
    virtual ~TelemetrySink() = default;

    virtual void recordAction(TelemetryAction action, bool success) = 0;

    /**
     * Sample a named histogram, e.g. "fingerprintd_enroll_start_error"
     */
    virtual void recordHistogram(const std::string& name, int value) = 0;
};

/**
 * @brief TelemetrySink that keeps counters and writes each event to the log
 */
class LogTelemetrySink : public TelemetrySink {
public:
    void recordAction(TelemetryAction action, bool success) override;
    void recordHistogram(const std::string& name, int value) override;

    uint64_t getActionCount(TelemetryAction action, bool success) const;
    uint64_t getHistogramCount(const std::string& name) const;

private:
    mutable std::mutex mutex_;
    std::map<std::pair<TelemetryAction, bool>, uint64_t> actions_;
    std::map<std::string, uint64_t> histograms_;
};

} // namespace session
} // namespace fpservice
