/**
 * @file test_authenticate_session.cpp
 * @brief Unit tests for AuthenticateSession and lockout enforcement
 */

#include <gtest/gtest.h>
#include <fpservice/session/AuthenticateSession.hpp>
#include <fpservice/session/LockoutPolicy.hpp>
#include <fpservice/storage/TemplateRegistry.hpp>

#include "SessionTestDoubles.hpp"

using namespace fpservice;
using namespace fpservice::session;
using namespace fpservice::testing;

class AuthenticateSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        daemon_ = std::make_shared<FakeDaemon>();
        receiver_ = std::make_shared<RecordingReceiver>();
        haptics_ = std::make_shared<RecordingHaptics>();
        telemetry_ = std::make_shared<RecordingTelemetry>();

        FailedAttemptLockoutPolicy::Thresholds thresholds;
        thresholds.timed_threshold = 5;
        thresholds.permanent_threshold = 20;
        thresholds.timed_duration = std::chrono::milliseconds(30000);
        lockout_ = std::make_shared<FailedAttemptLockoutPolicy>(
            thresholds, [this]() { return clock_.now(); });

        storage::TemplateRegistry::Options options;
        options.file_path = dir_.file("fingerprint_templates.yaml");
        registry_ = std::make_shared<storage::TemplateRegistry>(10, options);
        registry_->add(4, 1, "Right thumb");

        params_.device_id = 42;
        params_.target_user_id = 10;
        params_.group_id = 1;
        params_.owner = "com.example.keyguard";
    }

    ClientSession::Collaborators collaborators() {
        ClientSession::Collaborators c;
        auto daemon = daemon_;
        c.daemon = [daemon]() -> std::shared_ptr<BiometricsDaemon> { return daemon; };
        c.receiver = receiver_;
        c.haptics = haptics_;
        c.telemetry = telemetry_;
        return c;
    }

    std::unique_ptr<AuthenticateSession> makeSession() {
        return std::make_unique<AuthenticateSession>(collaborators(), params_, kOperationId,
                                                     lockout_, registry_);
    }

    static constexpr uint64_t kOperationId = 0x1234abcdULL;

    TempDir dir_;
    ManualClock clock_;
    std::shared_ptr<FakeDaemon> daemon_;
    std::shared_ptr<RecordingReceiver> receiver_;
    std::shared_ptr<RecordingHaptics> haptics_;
    std::shared_ptr<RecordingTelemetry> telemetry_;
    std::shared_ptr<FailedAttemptLockoutPolicy> lockout_;
    std::shared_ptr<storage::TemplateRegistry> registry_;
    ClientSession::Params params_;
};

TEST_F(AuthenticateSessionTest, StartPassesOperationAndGroup) {
    auto session = makeSession();
    EXPECT_EQ(session->getKind(), SessionKind::AUTHENTICATE);
    EXPECT_EQ(session->start(), kResultSuccess);

    EXPECT_EQ(daemon_->authenticateCalls, 1);
    EXPECT_EQ(daemon_->lastOperationId, kOperationId);
    EXPECT_EQ(daemon_->lastGroupId, 1);
}

TEST_F(AuthenticateSessionTest, MatchReportsTemplateWithName) {
    auto session = makeSession();
    session->start();

    EXPECT_TRUE(session->onAuthenticated(4, 1));

    ASSERT_EQ(receiver_->successEvents.size(), 1u);
    const auto& event = receiver_->successEvents[0];
    EXPECT_EQ(event.device_id, 42);
    EXPECT_EQ(event.user_id, 10);
    ASSERT_TRUE(event.tmpl.has_value());
    EXPECT_EQ(event.tmpl->template_id, 4);
    EXPECT_EQ(event.tmpl->group_id, 1);
    EXPECT_EQ(event.tmpl->name, "Right thumb");
    EXPECT_EQ(event.tmpl->device_id, 42);

    EXPECT_EQ(haptics_->successCount.load(), 1);
    ASSERT_EQ(telemetry_->actions.size(), 1u);
    EXPECT_EQ(telemetry_->actions[0].first, TelemetryAction::AUTHENTICATE);
    EXPECT_TRUE(telemetry_->actions[0].second);
}

TEST_F(AuthenticateSessionTest, RestrictedCallerGetsNoTemplate) {
    params_.restricted = true;
    auto session = makeSession();

    EXPECT_TRUE(session->onAuthenticated(4, 1));
    ASSERT_EQ(receiver_->successEvents.size(), 1u);
    EXPECT_FALSE(receiver_->successEvents[0].tmpl.has_value());
    EXPECT_EQ(receiver_->successEvents[0].user_id, 10);
}

TEST_F(AuthenticateSessionTest, UnknownTemplateHasEmptyName) {
    AuthenticateSession session(collaborators(), params_, kOperationId, lockout_);

    EXPECT_TRUE(session.onAuthenticated(9, 1));
    ASSERT_EQ(receiver_->successEvents.size(), 1u);
    ASSERT_TRUE(receiver_->successEvents[0].tmpl.has_value());
    EXPECT_TRUE(receiver_->successEvents[0].tmpl->name.empty());
}

TEST_F(AuthenticateSessionTest, NoMatchKeepsSessionRunning) {
    auto session = makeSession();
    session->start();

    EXPECT_FALSE(session->onAuthenticated(0, 1));
    EXPECT_EQ(receiver_->failedCount, 1);
    EXPECT_EQ(haptics_->errorCount.load(), 1);
    EXPECT_EQ(lockout_->getFailedAttempts(), 1);
    EXPECT_TRUE(receiver_->errors.empty());
}

TEST_F(AuthenticateSessionTest, FifthNoMatchForcesLockout) {
    auto session = makeSession();
    session->start();

    for (int i = 0; i < 4; ++i) {
        EXPECT_FALSE(session->handleResult(AuthenticatedResult{0, 1})) << "attempt " << i + 1;
    }
    EXPECT_EQ(daemon_->cancelCalls.load(), 0);

    EXPECT_TRUE(session->handleResult(AuthenticatedResult{0, 1}));
    EXPECT_EQ(daemon_->cancelCalls.load(), 1);
    EXPECT_TRUE(session->isAlreadyCancelled());
    EXPECT_EQ(receiver_->failedCount, 5);
    EXPECT_EQ(receiver_->errorKinds(), std::vector<ErrorKind>{ErrorKind::LOCKOUT});
}

TEST_F(AuthenticateSessionTest, StartIsRefusedDuringLockout) {
    for (int i = 0; i < 5; ++i) {
        lockout_->handleFailedAttempt();
    }

    auto session = makeSession();
    EXPECT_EQ(session->start(), kResultLockedOut);
    EXPECT_EQ(daemon_->authenticateCalls, 0);
    EXPECT_EQ(receiver_->errorKinds(), std::vector<ErrorKind>{ErrorKind::LOCKOUT});

    clock_.advance(std::chrono::milliseconds(30000));
    auto retry = makeSession();
    EXPECT_EQ(retry->start(), kResultSuccess);
    EXPECT_EQ(daemon_->authenticateCalls, 1);
}

TEST_F(AuthenticateSessionTest, PermanentLockoutIsReported) {
    for (int i = 0; i < 19; ++i) {
        lockout_->handleFailedAttempt();
    }
    clock_.advance(std::chrono::hours(1));

    auto session = makeSession();
    EXPECT_TRUE(session->onAuthenticated(0, 1));
    EXPECT_EQ(receiver_->errorKinds(), std::vector<ErrorKind>{ErrorKind::LOCKOUT_PERMANENT});

    auto next = makeSession();
    EXPECT_EQ(next->start(), kResultLockedOut);
}

TEST_F(AuthenticateSessionTest, MatchResetsFailedAttempts) {
    auto session = makeSession();
    session->onAuthenticated(0, 1);
    session->onAuthenticated(0, 1);
    ASSERT_EQ(lockout_->getFailedAttempts(), 2);

    EXPECT_TRUE(session->onAuthenticated(4, 1));
    EXPECT_EQ(lockout_->getFailedAttempts(), 0);
}

TEST_F(AuthenticateSessionTest, GoneReceiverStillCountsFailures) {
    auto session = makeSession();
    receiver_.reset();

    EXPECT_TRUE(session->onAuthenticated(0, 1));
    EXPECT_EQ(lockout_->getFailedAttempts(), 1);
    EXPECT_EQ(haptics_->errorCount.load(), 0);
}

TEST_F(AuthenticateSessionTest, FailedDeliveryEndsSession) {
    auto session = makeSession();
    receiver_->failDelivery = true;

    EXPECT_TRUE(session->onAuthenticated(0, 1));
    EXPECT_EQ(lockout_->getFailedAttempts(), 1);
}

TEST_F(AuthenticateSessionTest, DeadTransportAtStart) {
    daemon_->transportDead = true;
    auto session = makeSession();

    EXPECT_EQ(session->start(), kResultNoService);
    EXPECT_EQ(receiver_->errorKinds(), std::vector<ErrorKind>{ErrorKind::HW_UNAVAILABLE});
}

TEST_F(AuthenticateSessionTest, FailedStartRecordsAuthHistogram) {
    daemon_->authenticateResult = -2;
    auto session = makeSession();

    EXPECT_EQ(session->start(), -2);
    ASSERT_EQ(telemetry_->histograms.size(), 1u);
    EXPECT_EQ(telemetry_->histograms[0].first, "fingerprintd_auth_start_error");
}

TEST_F(AuthenticateSessionTest, CallerStopDoesNotReportCanceled) {
    auto session = makeSession();
    session->start();

    EXPECT_EQ(session->stop(true), kResultSuccess);
    EXPECT_EQ(session->stop(true), kResultSuccess);
    EXPECT_EQ(daemon_->cancelCalls.load(), 1);
    EXPECT_TRUE(receiver_->errors.empty());
}

TEST_F(AuthenticateSessionTest, EnrollCallbackIsIgnored) {
    auto session = makeSession();
    EXPECT_TRUE(session->handleResult(EnrollResult{3, 1, 0}));
    EXPECT_EQ(registry_->size(), 1u);
    EXPECT_TRUE(receiver_->enrollEvents.empty());
}

TEST_F(AuthenticateSessionTest, MissingLockoutPolicyIsRejected) {
    EXPECT_THROW(AuthenticateSession(collaborators(), params_, kOperationId, nullptr),
                 core::Exception);
}
