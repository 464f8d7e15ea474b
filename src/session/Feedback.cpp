#include "fpservice/session/Feedback.hpp"
#include "fpservice/core/Logger.hpp"

namespace fpservice {
namespace session {

namespace {

const char* actionName(TelemetryAction action) {
    switch (action) {
        case TelemetryAction::ENROLL:       return "fingerprint_enroll";
        case TelemetryAction::AUTHENTICATE: return "fingerprint_auth";
        default:                            return "fingerprint_unknown";
    }
}

} // namespace

void LogTelemetrySink::recordAction(TelemetryAction action, bool success) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        actions_[{action, success}]++;
    }
    FPSERVICE_LOG_DEBUG("Telemetry") << actionName(action) << " success=" << (success ? "true" : "false");
}

void LogTelemetrySink::recordHistogram(const std::string& name, int value) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        histograms_[name]++;
    }
    FPSERVICE_LOG_INFO("Telemetry") << name << " sample " << value;
}

uint64_t LogTelemetrySink::getActionCount(TelemetryAction action, bool success) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = actions_.find({action, success});
    return it == actions_.end() ? 0 : it->second;
}

uint64_t LogTelemetrySink::getHistogramCount(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = histograms_.find(name);
    return it == histograms_.end() ? 0 : it->second;
}

} // namespace session
} // namespace fpservice
