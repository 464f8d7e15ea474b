/**
 * Fingerprint Session Demo
 *
 * Wires the service pieces the way a dispatcher would and drives them
 * with a simulated daemon:
 * - enroll a finger in three steps
 * - fail authentication until the lockout policy engages
 * - reset the policy, authenticate successfully
 * - remove the template
 *
 * Usage:
 *   ./fingerprint_session_demo [config.yaml] [--base-dir DIR]
 */

#include <fpservice/fpservice.h>

#include <array>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

using namespace fpservice;

namespace {

/**
 * In-process stand-in for the hardware daemon. It accepts every request;
 * the demo feeds the callbacks a real daemon would send.
 */
class SimulatedDaemon : public session::BiometricsDaemon {
public:
    int enroll(const std::vector<uint8_t>& token, int32_t groupId, int32_t timeoutSec) override {
        std::cout << "  [daemon] enroll token=" << token.size() << "B group=" << groupId
                  << " timeout=" << timeoutSec << "s\n";
        return 0;
    }

    int authenticate(uint64_t operationId, int32_t groupId) override {
        std::cout << "  [daemon] authenticate op=" << operationId << " group=" << groupId << "\n";
        return 0;
    }

    int remove(int32_t groupId, int32_t templateId) override {
        std::cout << "  [daemon] remove group=" << groupId << " template=" << templateId << "\n";
        return 0;
    }

    int cancel() override {
        std::cout << "  [daemon] cancel\n";
        return 0;
    }
};

class ConsoleReceiver : public session::SessionReceiver {
public:
    void onEnrollResult(int64_t, int32_t templateId, int32_t, int32_t remaining) override {
        std::cout << "  [caller] enroll progress template=" << templateId << " remaining=" << remaining << "\n";
    }

    void onAuthenticationSucceeded(int64_t, const std::optional<storage::Template>& tmpl,
                                   int32_t userId) override {
        std::cout << "  [caller] authenticated user " << userId;
        if (tmpl) {
            std::cout << " with '" << tmpl->name << "'";
        }
        std::cout << "\n";
    }

    void onAuthenticationFailed(int64_t) override {
        std::cout << "  [caller] no match\n";
    }

    void onRemoved(int64_t, int32_t templateId, int32_t, int32_t remaining) override {
        std::cout << "  [caller] removed template=" << templateId << " remaining=" << remaining << "\n";
    }

    void onError(int64_t, session::ErrorKind kind, int32_t vendorCode) override {
        std::cout << "  [caller] error " << session::errorKindToString(kind) << " vendor=" << vendorCode << "\n";
    }
};

template<size_t N>
std::string describePattern(const std::array<int64_t, N>& pattern) {
    std::string text;
    for (int64_t ms : pattern) {
        text += (text.empty() ? "" : ",") + std::to_string(ms);
    }
    return "{" + text + "} ms";
}

class LoggingHaptics : public session::HapticFeedback {
public:
    void vibrateSuccess() override {
        LOG_DEBUG("haptics: success " + describePattern(session::kSuccessVibratePatternMs));
    }
    void vibrateError() override {
        LOG_DEBUG("haptics: error " + describePattern(session::kErrorVibratePatternMs));
    }
};

void printTemplates(const std::vector<storage::Template>& templates) {
    std::cout << "  registry: " << templates.size() << " template(s)\n";
    for (const auto& t : templates) {
        std::cout << "    #" << t.template_id << " '" << t.name << "' group " << t.group_id << "\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    std::string configPath;
    std::string baseDirOverride;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--base-dir" && i + 1 < argc) {
            baseDirOverride = argv[++i];
        } else {
            configPath = arg;
        }
    }

    core::Configuration configuration;
    if (!configPath.empty() && !configuration.load(configPath)) {
        std::cerr << "Failed to load " << configPath << std::endl;
        return 1;
    }

    core::ServiceConfig config;
    try {
        config = core::ServiceConfig::fromConfiguration(configuration);
    } catch (const core::ConfigException& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    if (!baseDirOverride.empty()) {
        config.storage.base_directory = baseDirOverride;
    } else if (configPath.empty()) {
        config.storage.base_directory =
            (std::filesystem::temp_directory_path() / "fpservice_demo").string();
    }

    core::Logger::getInstance().initialize(core::parseLogLevel(config.logging.level),
                                           config.logging.console, config.logging.file);
    LOG_INFO("fpservice " + getVersionString() + " demo, " + config.toString());

    storage::TemplateRegistryStore::Options storeOptions;
    storeOptions.base_directory = config.storage.base_directory;
    storeOptions.file_name = config.storage.file_name;
    storeOptions.name_template = config.storage.name_template;
    storeOptions.write_queue_capacity = config.storage.write_queue_capacity;

    session::FailedAttemptLockoutPolicy::Thresholds thresholds;
    thresholds.timed_threshold = config.lockout.timed_threshold;
    thresholds.permanent_threshold = config.lockout.permanent_threshold;
    thresholds.timed_duration = std::chrono::milliseconds(config.lockout.timed_duration_ms);

    try {
        storage::TemplateRegistryStore store(storeOptions);
        auto lockout = std::make_shared<session::FailedAttemptLockoutPolicy>(thresholds);

        auto daemon = std::make_shared<SimulatedDaemon>();
        auto receiver = std::make_shared<ConsoleReceiver>();

        session::ClientSession::Collaborators collaborators;
        collaborators.daemon = [daemon]() { return daemon; };
        collaborators.receiver = receiver;
        collaborators.haptics = std::make_shared<LoggingHaptics>();
        collaborators.telemetry = std::make_shared<session::LogTelemetrySink>();

        session::ClientSession::Params params;
        params.device_id = 1;
        params.target_user_id = 0;
        params.group_id = 0;
        params.owner = "fingerprint_session_demo";

        auto registry = store.getRegistry(params.target_user_id);
        const int32_t templateId = 1000 + static_cast<int32_t>(registry->size());

        std::cout << "\n== Enroll\n";
        session::EnrollSession enroll(collaborators, params, {0x01, 0x02, 0x03, 0x04}, registry,
                                      std::chrono::seconds(config.enroll.timeout_sec));
        if (enroll.start() != session::kResultSuccess) {
            return 1;
        }
        for (int remaining = 2; remaining >= 0; --remaining) {
            enroll.handleResult(session::EnrollResult{templateId, params.group_id, remaining});
        }
        printTemplates(registry->list());

        std::cout << "\n== Authenticate with the wrong finger\n";
        session::AuthenticateSession failing(collaborators, params, 42, lockout, registry);
        if (failing.start() != session::kResultSuccess) {
            return 1;
        }
        for (int attempt = 0; attempt < thresholds.timed_threshold; ++attempt) {
            if (failing.handleResult(session::AuthenticatedResult{0, params.group_id})) {
                break;
            }
        }

        std::cout << "\n== Authenticate during lockout\n";
        session::AuthenticateSession refused(collaborators, params, 43, lockout, registry);
        std::cout << "  start() = " << refused.start() << "\n";

        std::cout << "\n== Reset lockout, authenticate\n";
        lockout->resetFailedAttempts();
        session::AuthenticateSession matching(collaborators, params, 44, lockout, registry);
        if (matching.start() != session::kResultSuccess) {
            return 1;
        }
        matching.handleResult(session::AuthenticatedResult{templateId, params.group_id});

        std::cout << "\n== Remove\n";
        session::RemoveSession removal(collaborators, params, templateId, registry);
        if (removal.start() != session::kResultSuccess) {
            return 1;
        }
        removal.handleResult(session::RemovedResult{templateId, params.group_id, 0});

        store.flushAll();
        printTemplates(registry->list());
        std::cout << "\nState file: " << registry->getFilePath() << "\n";
    } catch (const core::Exception& e) {
        LOG_CRITICAL(std::string("Demo aborted: ") + e.what());
        return 1;
    }

    core::Logger::getInstance().flush();
    return 0;
}
