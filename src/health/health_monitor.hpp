#ifndef HEALTH_MONITOR_HPP
#define HEALTH_MONITOR_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <boost/thread/locks.hpp>
#include <boost/thread/shared_mutex.hpp>

#include "configs.hpp"
#include "enums.hpp"
#include "health_probe.hpp"
#include "utils.hpp"

struct HealthCheckOptions {
    double intervalSec = HEALTH_CHECK_INTERVAL_SEC;
    double timeoutSec = HEALTH_CHECK_TIMEOUT_SEC;
    int retries = HEALTH_CHECK_RETRIES;
};

struct HealthStatus {
    std::string serverId;
    ProbeTarget target;
    HealthState state;
    int consecutiveFailures;
    int consecutiveSuccesses;
    long long lastCheckMillis; // 0 until the first probe completes
    long long lastResponseTimeMs;
    long long totalChecks;
    long long failedChecks;
};

const char* healthStateName(HealthState state);

// Tracks one health state per server and probes every server on its own
// schedule. State reads never wait on a probe in flight.
class HealthMonitor {
public:
    HealthMonitor(std::shared_ptr<HealthProbe> probe, const HealthCheckOptions& options = HealthCheckOptions());
    ~HealthMonitor();

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    void addServer(const std::string& serverId, const ProbeTarget& target);

    void removeServer(const std::string& serverId);

    bool isHealthy(const std::string& serverId) const;

    HealthState getState(const std::string& serverId) const;

    HealthStatus getStatus(const std::string& serverId) const;

    std::vector<HealthStatus> snapshot() const;

    // Feeds one probe outcome into the state machine. Returns false when the
    // server is no longer registered and the outcome was dropped.
    bool recordProbeResult(const std::string& serverId, bool success, long long responseTimeMs);

    void markServerStatus(const std::string& serverId, bool healthy);

    // Probes a server synchronously on the caller's thread.
    ProbeResult probeNow(const std::string& serverId);

    void start();
    void stop();
    bool isRunning() const { return running; }

    const HealthCheckOptions& getOptions() const { return options; }

private:
    struct HealthRecord {
        explicit HealthRecord(const ProbeTarget& target) : target(target) {}

        ProbeTarget target;
        std::atomic<int> state{HealthState::UNKNOWN};
        std::atomic<int> consecutiveFailures{0};
        std::atomic<int> consecutiveSuccesses{0};
        std::atomic<long long> lastCheckMillis{0};
        std::atomic<long long> lastResponseTimeMs{0};
        std::atomic<long long> totalChecks{0};
        std::atomic<long long> failedChecks{0};
        std::mutex transitionLock;
    };

    struct ProbeTask {
        std::thread worker;
        std::mutex mutex;
        std::condition_variable cv;
        bool cancelled = false;
        std::atomic<bool> finished{false};
    };

    std::shared_ptr<HealthRecord> findRecord(const std::string& serverId) const;
    void applyResult(const std::string& serverId, HealthRecord& record, bool success, long long responseTimeMs);
    ProbeResult runProbe(const HealthRecord& record);
    void runProbeLoop(std::string serverId, std::shared_ptr<HealthRecord> record, std::shared_ptr<ProbeTask> task);
    void startTask(const std::string& serverId, std::shared_ptr<HealthRecord> record);
    void cancelTask(const std::string& serverId);
    void reapFinishedTasks();
    HealthStatus toStatus(const std::string& serverId, const HealthRecord& record) const;

    std::shared_ptr<HealthProbe> probe;
    HealthCheckOptions options;
    std::chrono::milliseconds interval;
    std::chrono::milliseconds timeout;

    std::map<std::string, std::shared_ptr<HealthRecord>> records;
    mutable boost::shared_mutex recordsLock;

    std::mutex tasksLock;
    std::map<std::string, std::shared_ptr<ProbeTask>> tasks;
    std::vector<std::shared_ptr<ProbeTask>> retiredTasks;
    std::atomic<bool> running{false};

    Logger logger;
};

#endif // HEALTH_MONITOR_HPP
