#ifndef LOAD_BALANCER_HPP
#define LOAD_BALANCER_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <boost/thread/locks.hpp>
#include <boost/thread/shared_mutex.hpp>

#include "configs.hpp"
#include "consistent_hashing.hpp"
#include "health_monitor.hpp"
#include "statistics_collector.hpp"
#include "utils.hpp"

struct ServerDescriptor {
    std::string name; // optional, the id falls back to host:port
    std::string host;
    int port = 0;
    int weight = 1;

    std::string getId() const;
    std::string getAddress() const;
};

// Parses "name,host,port[,weight]" or "host:port[,weight]".
ServerDescriptor parseServerSpec(const std::string& spec);

struct ServerInfo {
    ServerDescriptor descriptor;
    HealthStatus health;
    ServerStatistics statistics;
    size_t virtualNodeCount;
};

struct LookupDescription {
    std::string key;
    uint32_t hashValue;
    std::string primary;
    std::vector<std::string> candidates;
    bool hasSelection;
    std::string selected;
};

struct LoadBalancerOptions {
    int virtualNodes = VIRTUAL_NODES;
    std::string hashFunction = HASH_FUNCTION;
    // 0 means every registered server may be tried
    size_t maxCandidates = 0;
    HealthCheckOptions healthCheck;
};

class LoadBalancer {
public:
    LoadBalancer(const LoadBalancerOptions& options, std::shared_ptr<HealthProbe> probe);
    ~LoadBalancer();

    LoadBalancer(const LoadBalancer&) = delete;
    LoadBalancer& operator=(const LoadBalancer&) = delete;

    std::string addServer(const ServerDescriptor& server);

    void removeServer(const std::string& serverId);

    void updateWeight(const std::string& serverId, int weight);

    std::string selectServer(const std::string& key);

    void reportResult(const std::string& serverId, bool success, double latencyMs);

    void markServerStatus(const std::string& serverId, bool healthy);

    std::vector<ServerInfo> getServerList() const;

    ServerInfo getServer(const std::string& serverId) const;

    AggregateStatistics getAggregateStats() const;

    size_t getHealthyServerCount() const;

    void resetStatistics();

    LookupDescription describeLookup(const std::string& key, size_t candidateCount = 3) const;

    void startHealthChecks();
    void stopHealthChecks();

    size_t getServerCount() const;

    const LoadBalancerOptions& getOptions() const { return options; }
    ConsistentHashRing& getRing() { return ring; }
    HealthMonitor& getHealthMonitor() { return healthMonitor; }
    StatisticsCollector& getStatistics() { return statistics; }

private:
    std::vector<std::string> findCandidates(const std::string& key) const;
    std::string firstHealthy(const std::vector<std::string>& candidates) const;
    ServerInfo buildInfo(const ServerDescriptor& descriptor) const;

    LoadBalancerOptions options;
    ConsistentHashRing ring;
    HealthMonitor healthMonitor;
    StatisticsCollector statistics;

    std::map<std::string, ServerDescriptor> servers;
    mutable boost::shared_mutex serversLock;

    // Serializes topology changes across ring, monitor and statistics
    std::mutex topologyLock;

    Logger logger;
};

#endif // LOAD_BALANCER_HPP
