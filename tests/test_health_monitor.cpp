#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>

#include "errors.hpp"
#include "health_monitor.hpp"
#include "test_support.hpp"

namespace {

HealthCheckOptions fastOptions(int retries) {
    HealthCheckOptions options;
    options.intervalSec = 0.01;
    options.timeoutSec = 0.5;
    options.retries = retries;
    return options;
}

template <typename Predicate>
bool waitUntil(Predicate predicate, std::chrono::milliseconds limit = std::chrono::milliseconds(3000)) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

class HealthMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        probe = std::make_shared<ScriptedProbe>();
        monitor = std::make_unique<HealthMonitor>(probe, fastOptions(3));
        monitor->addServer("S1", ProbeTarget{"10.0.0.1", 8080});
    }

    std::shared_ptr<ScriptedProbe> probe;
    std::unique_ptr<HealthMonitor> monitor;
};

} // namespace

TEST_F(HealthMonitorTest, NewServerIsUnknownAndNotHealthy) {
    EXPECT_EQ(monitor->getState("S1"), HealthState::UNKNOWN);
    EXPECT_FALSE(monitor->isHealthy("S1"));
    EXPECT_FALSE(monitor->isHealthy("missing"));
}

TEST_F(HealthMonitorTest, FirstOutcomeResolvesUnknown) {
    monitor->addServer("S2", ProbeTarget{"10.0.0.2", 8080});
    monitor->recordProbeResult("S1", true, 1);
    monitor->recordProbeResult("S2", false, 1);
    EXPECT_EQ(monitor->getState("S1"), HealthState::HEALTHY);
    EXPECT_EQ(monitor->getState("S2"), HealthState::UNHEALTHY);
}

TEST_F(HealthMonitorTest, SingleFailureDoesNotFlap) {
    monitor->recordProbeResult("S1", true, 1);
    monitor->recordProbeResult("S1", false, 1);
    monitor->recordProbeResult("S1", true, 1);
    monitor->recordProbeResult("S1", false, 1);
    EXPECT_TRUE(monitor->isHealthy("S1"));
    EXPECT_EQ(monitor->getStatus("S1").consecutiveFailures, 1);
}

TEST_F(HealthMonitorTest, ConsecutiveFailuresReachRetries) {
    monitor->recordProbeResult("S1", true, 1);
    monitor->recordProbeResult("S1", false, 1);
    monitor->recordProbeResult("S1", false, 1);
    EXPECT_EQ(monitor->getState("S1"), HealthState::HEALTHY);
    monitor->recordProbeResult("S1", false, 1);
    EXPECT_EQ(monitor->getState("S1"), HealthState::UNHEALTHY);

    monitor->recordProbeResult("S1", true, 1);
    EXPECT_EQ(monitor->getState("S1"), HealthState::HEALTHY);

    HealthStatus status = monitor->getStatus("S1");
    EXPECT_EQ(status.consecutiveSuccesses, 1);
    EXPECT_EQ(status.consecutiveFailures, 0);
    EXPECT_EQ(status.totalChecks, 5);
    EXPECT_EQ(status.failedChecks, 3);
    EXPECT_GT(status.lastCheckMillis, 0);
}

TEST_F(HealthMonitorTest, SlowProbeCountsAsFailure) {
    monitor->recordProbeResult("S1", true, 1);
    for (int i = 0; i < 3; ++i) {
        monitor->recordProbeResult("S1", true, 600);
    }
    EXPECT_EQ(monitor->getState("S1"), HealthState::UNHEALTHY);
    EXPECT_EQ(monitor->getStatus("S1").lastResponseTimeMs, 600);
}

TEST_F(HealthMonitorTest, ManualStatusOverridesAndResetsCounters) {
    monitor->recordProbeResult("S1", false, 1);
    monitor->markServerStatus("S1", true);
    EXPECT_TRUE(monitor->isHealthy("S1"));
    EXPECT_EQ(monitor->getStatus("S1").consecutiveFailures, 0);

    monitor->markServerStatus("S1", false);
    EXPECT_EQ(monitor->getState("S1"), HealthState::UNHEALTHY);

    try {
        monitor->markServerStatus("missing", true);
        FAIL() << "expected ServerNotFound";
    } catch (const BalancerError& e) {
        EXPECT_EQ(e.getKind(), ErrorKind::SERVER_NOT_FOUND);
    }
}

TEST_F(HealthMonitorTest, RegistrationErrors) {
    try {
        monitor->addServer("S1", ProbeTarget{"10.0.0.9", 80});
        FAIL() << "expected DuplicateServer";
    } catch (const BalancerError& e) {
        EXPECT_EQ(e.getKind(), ErrorKind::DUPLICATE_SERVER);
    }
    try {
        monitor->removeServer("missing");
        FAIL() << "expected ServerNotFound";
    } catch (const BalancerError& e) {
        EXPECT_EQ(e.getKind(), ErrorKind::SERVER_NOT_FOUND);
    }
    EXPECT_THROW(monitor->getStatus("missing"), BalancerError);
}

TEST_F(HealthMonitorTest, ResultsForRemovedServerAreDropped) {
    monitor->removeServer("S1");
    EXPECT_FALSE(monitor->recordProbeResult("S1", true, 1));
    EXPECT_TRUE(monitor->snapshot().empty());
}

TEST_F(HealthMonitorTest, ProbeNowRunsProbeSynchronously) {
    probe->setOutcome("10.0.0.1", false);
    ProbeResult result = monitor->probeNow("S1");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(monitor->getState("S1"), HealthState::UNHEALTHY);
    EXPECT_EQ(probe->calls.load(), 1);
}

TEST_F(HealthMonitorTest, BackgroundLoopTracksProbeOutcome) {
    monitor->addServer("S2", ProbeTarget{"10.0.0.2", 8080});
    probe->setOutcome("10.0.0.2", false);
    monitor->start();
    EXPECT_TRUE(monitor->isRunning());

    EXPECT_TRUE(waitUntil([this]() { return monitor->isHealthy("S1"); }));
    EXPECT_TRUE(waitUntil([this]() { return monitor->getState("S2") == HealthState::UNHEALTHY; }));

    probe->setOutcome("10.0.0.1", false);
    EXPECT_TRUE(waitUntil([this]() { return monitor->getState("S1") == HealthState::UNHEALTHY; }));

    probe->setOutcome("10.0.0.2", true);
    EXPECT_TRUE(waitUntil([this]() { return monitor->isHealthy("S2"); }));

    monitor->stop();
    EXPECT_FALSE(monitor->isRunning());
}

TEST_F(HealthMonitorTest, ServersAddedWhileRunningAreProbed) {
    monitor->start();
    monitor->addServer("S2", ProbeTarget{"10.0.0.2", 8080});
    EXPECT_TRUE(waitUntil([this]() { return monitor->isHealthy("S2"); }));

    monitor->removeServer("S2");
    EXPECT_FALSE(monitor->isHealthy("S2"));
    monitor->stop();

    int calls = probe->calls.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(probe->calls.load(), calls);
}

TEST(HealthMonitorOptionsTest, RejectsInvalidOptions) {
    auto probe = std::make_shared<ScriptedProbe>();
    EXPECT_THROW(HealthMonitor(nullptr, fastOptions(3)), std::invalid_argument);
    EXPECT_THROW(HealthMonitor(probe, fastOptions(0)), std::invalid_argument);
    HealthCheckOptions options = fastOptions(3);
    options.timeoutSec = 0;
    EXPECT_THROW(HealthMonitor(probe, options), std::invalid_argument);
}
