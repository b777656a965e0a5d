#include "statistics_collector.hpp"

#include "errors.hpp"

// Longer samples are clamped so the microsecond conversion stays in range
static const double MAX_LATENCY_MS = 24.0 * 60 * 60 * 1000;

void StatisticsCollector::registerServer(const std::string& serverId) {
    boost::unique_lock<boost::shared_mutex> lock(rwlock);
    if (counters.count(serverId)) {
        throw BalancerError(ErrorKind::DUPLICATE_SERVER, "Statistics for " + serverId + " already exist");
    }
    counters[serverId] = std::make_shared<Counters>();
}

void StatisticsCollector::unregisterServer(const std::string& serverId) {
    boost::unique_lock<boost::shared_mutex> lock(rwlock);
    if (counters.erase(serverId) == 0) {
        throw BalancerError(ErrorKind::SERVER_NOT_FOUND, "No statistics for " + serverId);
    }
}

bool StatisticsCollector::recordRequest(const std::string& serverId) {
    std::shared_ptr<Counters> entry = find(serverId);
    if (!entry) {
        return false;
    }
    entry->requests++;
    return true;
}

bool StatisticsCollector::recordError(const std::string& serverId) {
    std::shared_ptr<Counters> entry = find(serverId);
    if (!entry) {
        return false;
    }
    entry->errors++;
    return true;
}

bool StatisticsCollector::recordLatency(const std::string& serverId, double durationMs) {
    std::shared_ptr<Counters> entry = find(serverId);
    if (!entry) {
        return false;
    }
    // NaN and negative samples count as zero
    long long micros = 0;
    if (durationMs >= MAX_LATENCY_MS) {
        micros = static_cast<long long>(MAX_LATENCY_MS * 1000.0);
    } else if (durationMs > 0.0) {
        micros = static_cast<long long>(durationMs * 1000.0);
    }
    entry->totalLatencyMicros += micros;
    entry->lastLatencyMicros = micros;
    entry->latencySamples++;
    return true;
}

void StatisticsCollector::recordSelection(bool success) {
    selections++;
    if (!success) {
        failedSelections++;
    }
}

std::map<std::string, ServerStatistics> StatisticsCollector::snapshot() const {
    std::map<std::string, ServerStatistics> result;
    boost::shared_lock<boost::shared_mutex> lock(rwlock);
    for (const auto& entry : counters) {
        result[entry.first] = toStatistics(entry.first, *entry.second);
    }
    return result;
}

ServerStatistics StatisticsCollector::getServerStatistics(const std::string& serverId) const {
    std::shared_ptr<Counters> entry = find(serverId);
    if (!entry) {
        throw BalancerError(ErrorKind::SERVER_NOT_FOUND, "No statistics for " + serverId);
    }
    return toStatistics(serverId, *entry);
}

AggregateStatistics StatisticsCollector::aggregate() const {
    AggregateStatistics total{0, 0, 0, selections.load(), failedSelections.load(), 0.0, 0.0};
    long long latencySamples = 0;
    double latencySumMs = 0.0;
    for (const auto& entry : snapshot()) {
        const ServerStatistics& stats = entry.second;
        total.serverCount++;
        total.totalRequests += stats.requestCount;
        total.totalErrors += stats.errorCount;
        latencySamples += stats.latencySamples;
        latencySumMs += stats.averageLatencyMs * stats.latencySamples;
    }
    if (total.totalRequests > 0) {
        total.errorRate = static_cast<double>(total.totalErrors) / total.totalRequests;
    }
    if (latencySamples > 0) {
        total.averageLatencyMs = latencySumMs / latencySamples;
    }
    return total;
}

void StatisticsCollector::reset() {
    boost::unique_lock<boost::shared_mutex> lock(rwlock);
    for (auto& entry : counters) {
        entry.second = std::make_shared<Counters>();
    }
    selections = 0;
    failedSelections = 0;
}

std::shared_ptr<StatisticsCollector::Counters> StatisticsCollector::find(const std::string& serverId) const {
    boost::shared_lock<boost::shared_mutex> lock(rwlock);
    auto it = counters.find(serverId);
    if (it == counters.end()) {
        return nullptr;
    }
    return it->second;
}

ServerStatistics StatisticsCollector::toStatistics(const std::string& serverId, const Counters& counters) {
    long long requests = counters.requests.load();
    long long errors = counters.errors.load();
    long long samples = counters.latencySamples.load();
    ServerStatistics stats;
    stats.serverId = serverId;
    stats.requestCount = requests;
    stats.errorCount = errors;
    stats.latencySamples = samples;
    stats.averageLatencyMs = samples > 0 ? counters.totalLatencyMicros.load() / 1000.0 / samples : 0.0;
    stats.lastLatencyMs = counters.lastLatencyMicros.load() / 1000.0;
    stats.errorRate = requests > 0 ? static_cast<double>(errors) / requests : 0.0;
    return stats;
}
