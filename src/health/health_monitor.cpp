#include "health_monitor.hpp"

#include <algorithm>
#include <stdexcept>

#include "errors.hpp"

const char* healthStateName(HealthState state) {
    switch (state) {
        case HealthState::UNKNOWN:
            return "unknown";
        case HealthState::HEALTHY:
            return "healthy";
        case HealthState::UNHEALTHY:
            return "unhealthy";
    }
    return "invalid";
}

HealthMonitor::HealthMonitor(std::shared_ptr<HealthProbe> probe, const HealthCheckOptions& options)
             : probe(probe), options(options), logger("HealthMonitor") {
    if (!this->probe) {
        throw std::invalid_argument("Health probe must not be null");
    }
    if (options.intervalSec <= 0.0 || options.timeoutSec <= 0.0) {
        throw std::invalid_argument("Health check interval and timeout must be positive");
    }
    if (options.retries < 1) {
        throw std::invalid_argument("Health check retries must be at least 1");
    }
    interval = std::chrono::milliseconds(static_cast<long long>(options.intervalSec * 1000.0));
    timeout = std::chrono::milliseconds(static_cast<long long>(options.timeoutSec * 1000.0));
}

HealthMonitor::~HealthMonitor() {
    stop();
}

void HealthMonitor::addServer(const std::string& serverId, const ProbeTarget& target) {
    auto record = std::make_shared<HealthRecord>(target);
    {
        boost::unique_lock<boost::shared_mutex> lock(recordsLock);
        if (records.count(serverId)) {
            throw BalancerError(ErrorKind::DUPLICATE_SERVER, "Server " + serverId + " is already monitored");
        }
        records[serverId] = record;
    }
    logger.log_message("Monitoring " + serverId + " at " + target.host + ":" + std::to_string(target.port));

    std::lock_guard<std::mutex> guard(tasksLock);
    reapFinishedTasks();
    if (running) {
        startTask(serverId, record);
    }
}

void HealthMonitor::removeServer(const std::string& serverId) {
    {
        boost::unique_lock<boost::shared_mutex> lock(recordsLock);
        if (records.erase(serverId) == 0) {
            throw BalancerError(ErrorKind::SERVER_NOT_FOUND, "Server " + serverId + " is not monitored");
        }
    }
    logger.log_message("Stopped monitoring " + serverId);

    std::lock_guard<std::mutex> guard(tasksLock);
    cancelTask(serverId);
    reapFinishedTasks();
}

bool HealthMonitor::isHealthy(const std::string& serverId) const {
    std::shared_ptr<HealthRecord> record = findRecord(serverId);
    return record && record->state.load() == HealthState::HEALTHY;
}

HealthState HealthMonitor::getState(const std::string& serverId) const {
    std::shared_ptr<HealthRecord> record = findRecord(serverId);
    if (!record) {
        throw BalancerError(ErrorKind::SERVER_NOT_FOUND, "Server " + serverId + " is not monitored");
    }
    return static_cast<HealthState>(record->state.load());
}

HealthStatus HealthMonitor::getStatus(const std::string& serverId) const {
    std::shared_ptr<HealthRecord> record = findRecord(serverId);
    if (!record) {
        throw BalancerError(ErrorKind::SERVER_NOT_FOUND, "Server " + serverId + " is not monitored");
    }
    return toStatus(serverId, *record);
}

std::vector<HealthStatus> HealthMonitor::snapshot() const {
    std::vector<std::pair<std::string, std::shared_ptr<HealthRecord>>> copy;
    {
        boost::shared_lock<boost::shared_mutex> lock(recordsLock);
        copy.assign(records.begin(), records.end());
    }
    std::vector<HealthStatus> statuses;
    statuses.reserve(copy.size());
    for (const auto& entry : copy) {
        statuses.push_back(toStatus(entry.first, *entry.second));
    }
    return statuses;
}

bool HealthMonitor::recordProbeResult(const std::string& serverId, bool success, long long responseTimeMs) {
    std::shared_ptr<HealthRecord> record = findRecord(serverId);
    if (!record) {
        return false;
    }
    applyResult(serverId, *record, success, responseTimeMs);
    return true;
}

void HealthMonitor::markServerStatus(const std::string& serverId, bool healthy) {
    std::shared_ptr<HealthRecord> record = findRecord(serverId);
    if (!record) {
        throw BalancerError(ErrorKind::SERVER_NOT_FOUND, "Server " + serverId + " is not monitored");
    }
    std::lock_guard<std::mutex> guard(record->transitionLock);
    record->state = healthy ? HealthState::HEALTHY : HealthState::UNHEALTHY;
    record->consecutiveFailures = 0;
    record->consecutiveSuccesses = 0;
    logger.log_message("Server " + serverId + " manually marked " + (healthy ? "healthy" : "unhealthy"));
}

ProbeResult HealthMonitor::probeNow(const std::string& serverId) {
    std::shared_ptr<HealthRecord> record = findRecord(serverId);
    if (!record) {
        throw BalancerError(ErrorKind::SERVER_NOT_FOUND, "Server " + serverId + " is not monitored");
    }
    ProbeResult result = runProbe(*record);
    recordProbeResult(serverId, result.success, result.responseTimeMs);
    return result;
}

void HealthMonitor::start() {
    std::lock_guard<std::mutex> guard(tasksLock);
    if (running) {
        return;
    }
    running = true;

    std::vector<std::pair<std::string, std::shared_ptr<HealthRecord>>> copy;
    {
        boost::shared_lock<boost::shared_mutex> lock(recordsLock);
        copy.assign(records.begin(), records.end());
    }
    for (const auto& entry : copy) {
        startTask(entry.first, entry.second);
    }
    logger.log_message("Health checks started: interval " + std::to_string(interval.count()) + "ms, timeout "
                       + std::to_string(timeout.count()) + "ms, retries " + std::to_string(options.retries));
}

void HealthMonitor::stop() {
    std::vector<std::shared_ptr<ProbeTask>> stopping;
    {
        std::lock_guard<std::mutex> guard(tasksLock);
        if (!running && retiredTasks.empty()) {
            return;
        }
        running = false;
        for (auto& entry : tasks) {
            {
                std::lock_guard<std::mutex> taskGuard(entry.second->mutex);
                entry.second->cancelled = true;
            }
            entry.second->cv.notify_all();
            stopping.push_back(entry.second);
        }
        tasks.clear();
        stopping.insert(stopping.end(), retiredTasks.begin(), retiredTasks.end());
        retiredTasks.clear();
    }
    // In-flight probes finish within their own timeout
    for (auto& task : stopping) {
        if (task->worker.joinable()) {
            task->worker.join();
        }
    }
    logger.log_message("Health checks stopped");
}

std::shared_ptr<HealthMonitor::HealthRecord> HealthMonitor::findRecord(const std::string& serverId) const {
    boost::shared_lock<boost::shared_mutex> lock(recordsLock);
    auto it = records.find(serverId);
    if (it == records.end()) {
        return nullptr;
    }
    return it->second;
}

void HealthMonitor::applyResult(const std::string& serverId, HealthRecord& record, bool success, long long responseTimeMs) {
    // A probe slower than the timeout counts as failed whatever it returned
    if (responseTimeMs > timeout.count()) {
        success = false;
    }

    std::lock_guard<std::mutex> guard(record.transitionLock);
    record.totalChecks++;
    record.lastCheckMillis = getCurrentTimeMillis();
    record.lastResponseTimeMs = responseTimeMs;

    HealthState previous = static_cast<HealthState>(record.state.load());
    HealthState next = previous;
    if (success) {
        record.consecutiveSuccesses++;
        record.consecutiveFailures = 0;
        next = HealthState::HEALTHY;
    } else {
        record.failedChecks++;
        record.consecutiveFailures++;
        record.consecutiveSuccesses = 0;
        if (previous == HealthState::UNKNOWN || record.consecutiveFailures >= options.retries) {
            next = HealthState::UNHEALTHY;
        }
    }

    if (next != previous) {
        record.state = next;
        logger.log_message("Server " + serverId + " is now " + healthStateName(next) + " (was " + healthStateName(previous) + ")");
    }
}

ProbeResult HealthMonitor::runProbe(const HealthRecord& record) {
    try {
        return probe->probe(record.target, timeout);
    } catch (const std::exception& e) {
        return ProbeResult{false, 0, -1, e.what()};
    }
}

void HealthMonitor::runProbeLoop(std::string serverId, std::shared_ptr<HealthRecord> record, std::shared_ptr<ProbeTask> task) {
    while (true) {
        ProbeResult result = runProbe(*record);

        std::unique_lock<std::mutex> lock(task->mutex);
        if (task->cancelled) {
            break;
        }
        lock.unlock();

        applyResult(serverId, *record, result.success, result.responseTimeMs);
        if (!result.success) {
            logger.log_message("Probe of " + serverId + " failed: " + result.errorMessage);
        }

        lock.lock();
        if (task->cv.wait_for(lock, interval, [&task]() { return task->cancelled; })) {
            break;
        }
    }
    task->finished = true;
}

void HealthMonitor::startTask(const std::string& serverId, std::shared_ptr<HealthRecord> record) {
    auto task = std::make_shared<ProbeTask>();
    task->worker = std::thread(&HealthMonitor::runProbeLoop, this, serverId, record, task);
    tasks[serverId] = task;
}

void HealthMonitor::cancelTask(const std::string& serverId) {
    auto it = tasks.find(serverId);
    if (it == tasks.end()) {
        return;
    }
    std::shared_ptr<ProbeTask> task = it->second;
    tasks.erase(it);
    {
        std::lock_guard<std::mutex> taskGuard(task->mutex);
        task->cancelled = true;
    }
    task->cv.notify_all();
    retiredTasks.push_back(task);
}

void HealthMonitor::reapFinishedTasks() {
    auto it = std::partition(retiredTasks.begin(), retiredTasks.end(),
                             [](const std::shared_ptr<ProbeTask>& task) { return !task->finished.load(); });
    for (auto finished = it; finished != retiredTasks.end(); ++finished) {
        if ((*finished)->worker.joinable()) {
            (*finished)->worker.join();
        }
    }
    retiredTasks.erase(it, retiredTasks.end());
}

HealthStatus HealthMonitor::toStatus(const std::string& serverId, const HealthRecord& record) const {
    return HealthStatus{
        serverId,
        record.target,
        static_cast<HealthState>(record.state.load()),
        record.consecutiveFailures.load(),
        record.consecutiveSuccesses.load(),
        record.lastCheckMillis.load(),
        record.lastResponseTimeMs.load(),
        record.totalChecks.load(),
        record.failedChecks.load(),
    };
}
