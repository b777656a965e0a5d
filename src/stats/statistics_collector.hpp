#ifndef STATISTICS_COLLECTOR_HPP
#define STATISTICS_COLLECTOR_HPP

#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <boost/thread/locks.hpp>
#include <boost/thread/shared_mutex.hpp>

struct ServerStatistics {
    std::string serverId;
    long long requestCount;
    long long errorCount;
    long long latencySamples;
    double averageLatencyMs;
    double lastLatencyMs;
    double errorRate;
};

struct AggregateStatistics {
    size_t serverCount;
    long long totalRequests;
    long long totalErrors;
    long long totalSelections;
    long long failedSelections;
    double errorRate;
    double averageLatencyMs;
};

class StatisticsCollector {
public:
    void registerServer(const std::string& serverId);
    void unregisterServer(const std::string& serverId);

    // Each returns false when the server is not registered.
    bool recordRequest(const std::string& serverId);
    bool recordError(const std::string& serverId);
    bool recordLatency(const std::string& serverId, double durationMs);

    void recordSelection(bool success);

    std::map<std::string, ServerStatistics> snapshot() const;
    ServerStatistics getServerStatistics(const std::string& serverId) const;
    AggregateStatistics aggregate() const;

    void reset();

private:
    struct Counters {
        std::atomic<long long> requests{0};
        std::atomic<long long> errors{0};
        std::atomic<long long> latencySamples{0};
        std::atomic<long long> totalLatencyMicros{0};
        std::atomic<long long> lastLatencyMicros{0};
    };

    std::shared_ptr<Counters> find(const std::string& serverId) const;
    static ServerStatistics toStatistics(const std::string& serverId, const Counters& counters);

    std::map<std::string, std::shared_ptr<Counters>> counters;
    mutable boost::shared_mutex rwlock;

    std::atomic<long long> selections{0};
    std::atomic<long long> failedSelections{0};
};

#endif // STATISTICS_COLLECTOR_HPP
