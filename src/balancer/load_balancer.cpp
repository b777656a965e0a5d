#include "load_balancer.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

#include "errors.hpp"
#include "hash_functions.hpp"

std::string ServerDescriptor::getId() const {
    return name.empty() ? getAddress() : name;
}

std::string ServerDescriptor::getAddress() const {
    if (host.find(':') != std::string::npos) {
        return "[" + host + "]:" + std::to_string(port);
    }
    return host + ":" + std::to_string(port);
}

static int parseInteger(const std::string& value, const std::string& field, const std::string& spec) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Invalid " + field + " '" + value + "' in server spec: " + spec);
    }
}

ServerDescriptor parseServerSpec(const std::string& spec) {
    std::vector<std::string> fields;
    splitString(spec, fields);

    ServerDescriptor server;
    if (!fields.empty() && splitIpAddressAndPort(fields[0], server.host, server.port) && fields.size() <= 2) {
        if (fields.size() == 2) {
            server.weight = parseInteger(fields[1], "weight", spec);
        }
        return server;
    }

    if (fields.size() < 3 || fields.size() > 4) {
        throw std::invalid_argument("Expected name,host,port[,weight] in server spec: " + spec);
    }
    server.name = fields[0];
    server.host = fields[1];
    server.port = parseInteger(fields[2], "port", spec);
    if (fields.size() == 4) {
        server.weight = parseInteger(fields[3], "weight", spec);
    }
    return server;
}

LoadBalancer::LoadBalancer(const LoadBalancerOptions& options, std::shared_ptr<HealthProbe> probe)
            : options(options),
              ring(createHashFunction(options.hashFunction), options.virtualNodes),
              healthMonitor(probe, options.healthCheck),
              logger("LoadBalancer") {
    logger.log_message("Load balancer created: hash function " + options.hashFunction + ", "
                       + std::to_string(options.virtualNodes) + " virtual nodes per weight unit");
}

LoadBalancer::~LoadBalancer() {
    healthMonitor.stop();
}

std::string LoadBalancer::addServer(const ServerDescriptor& server) {
    ring.validateWeight(server.getId(), server.weight);
    if (server.host.empty() || server.port <= 0 || server.port > 65535) {
        throw std::invalid_argument("Invalid server address: " + server.getAddress());
    }
    std::string serverId = server.getId();

    std::lock_guard<std::mutex> guard(topologyLock);
    {
        boost::shared_lock<boost::shared_mutex> lock(serversLock);
        if (servers.count(serverId)) {
            throw BalancerError(ErrorKind::DUPLICATE_SERVER, "Server " + serverId + " already exists");
        }
    }

    statistics.registerServer(serverId);
    try {
        healthMonitor.addServer(serverId, ProbeTarget{server.host, server.port});
        try {
            {
                boost::unique_lock<boost::shared_mutex> lock(serversLock);
                servers[serverId] = server;
            }
            ring.addServer(serverId, server.weight);
        } catch (const std::exception&) {
            {
                boost::unique_lock<boost::shared_mutex> lock(serversLock);
                servers.erase(serverId);
            }
            healthMonitor.removeServer(serverId);
            throw;
        }
    } catch (const std::exception&) {
        statistics.unregisterServer(serverId);
        throw;
    }

    logger.log_message("Added server " + serverId + " (" + server.getAddress() + ", weight " + std::to_string(server.weight) + ")");
    return serverId;
}

void LoadBalancer::removeServer(const std::string& serverId) {
    std::lock_guard<std::mutex> guard(topologyLock);
    {
        boost::shared_lock<boost::shared_mutex> lock(serversLock);
        if (!servers.count(serverId)) {
            throw BalancerError(ErrorKind::SERVER_NOT_FOUND, "Server " + serverId + " not found");
        }
    }

    // Leave the ring first so no new selection can pick it
    ring.removeServer(serverId);
    healthMonitor.removeServer(serverId);
    statistics.unregisterServer(serverId);
    {
        boost::unique_lock<boost::shared_mutex> lock(serversLock);
        servers.erase(serverId);
    }
    logger.log_message("Removed server " + serverId);
}

void LoadBalancer::updateWeight(const std::string& serverId, int weight) {
    ring.validateWeight(serverId, weight);

    std::lock_guard<std::mutex> guard(topologyLock);
    int previous;
    {
        boost::shared_lock<boost::shared_mutex> lock(serversLock);
        auto it = servers.find(serverId);
        if (it == servers.end()) {
            throw BalancerError(ErrorKind::SERVER_NOT_FOUND, "Server " + serverId + " not found");
        }
        previous = it->second.weight;
    }
    if (previous == weight) {
        return;
    }

    // Health state and statistics survive a reweight; only ring positions move
    ring.updateServer(serverId, weight);
    {
        boost::unique_lock<boost::shared_mutex> lock(serversLock);
        servers[serverId].weight = weight;
    }
    logger.log_message("Server " + serverId + " weight changed from " + std::to_string(previous) + " to " + std::to_string(weight));
}

std::string LoadBalancer::selectServer(const std::string& key) {
    std::vector<std::string> candidates;
    try {
        candidates = findCandidates(key);
    } catch (const BalancerError& e) {
        if (e.getKind() != ErrorKind::EMPTY_RING) {
            throw;
        }
        statistics.recordSelection(false);
        throw BalancerError(ErrorKind::NO_SERVERS_AVAILABLE, "No servers available");
    }

    std::string selected = firstHealthy(candidates);
    if (selected.empty()) {
        statistics.recordSelection(false);
        throw BalancerError(ErrorKind::NO_HEALTHY_SERVER, "No healthy server among " + std::to_string(candidates.size()) + " candidates for key");
    }
    statistics.recordSelection(true);
    statistics.recordRequest(selected);
    return selected;
}

void LoadBalancer::reportResult(const std::string& serverId, bool success, double latencyMs) {
    if (!statistics.recordLatency(serverId, latencyMs)) {
        throw BalancerError(ErrorKind::SERVER_NOT_FOUND, "Server " + serverId + " not found");
    }
    if (!success) {
        statistics.recordError(serverId);
    }
}

void LoadBalancer::markServerStatus(const std::string& serverId, bool healthy) {
    healthMonitor.markServerStatus(serverId, healthy);
}

std::vector<ServerInfo> LoadBalancer::getServerList() const {
    std::vector<ServerDescriptor> descriptors;
    {
        boost::shared_lock<boost::shared_mutex> lock(serversLock);
        for (const auto& entry : servers) {
            descriptors.push_back(entry.second);
        }
    }

    std::vector<ServerInfo> infos;
    for (const ServerDescriptor& descriptor : descriptors) {
        try {
            infos.push_back(buildInfo(descriptor));
        } catch (const BalancerError& e) {
            // Removed while the list was being built
            if (e.getKind() != ErrorKind::SERVER_NOT_FOUND) {
                throw;
            }
        }
    }
    return infos;
}

ServerInfo LoadBalancer::getServer(const std::string& serverId) const {
    ServerDescriptor descriptor;
    {
        boost::shared_lock<boost::shared_mutex> lock(serversLock);
        auto it = servers.find(serverId);
        if (it == servers.end()) {
            throw BalancerError(ErrorKind::SERVER_NOT_FOUND, "Server " + serverId + " not found");
        }
        descriptor = it->second;
    }
    return buildInfo(descriptor);
}

AggregateStatistics LoadBalancer::getAggregateStats() const {
    return statistics.aggregate();
}

size_t LoadBalancer::getHealthyServerCount() const {
    std::vector<HealthStatus> statuses = healthMonitor.snapshot();
    return std::count_if(statuses.begin(), statuses.end(),
                         [](const HealthStatus& status) { return status.state == HealthState::HEALTHY; });
}

void LoadBalancer::resetStatistics() {
    statistics.reset();
    logger.log_message("Statistics reset");
}

LookupDescription LoadBalancer::describeLookup(const std::string& key, size_t candidateCount) const {
    LookupDescription description;
    description.key = key;
    description.hashValue = ring.hashKey(key);
    description.hasSelection = false;

    std::shared_ptr<const RingSnapshot> current = ring.snapshot();
    std::vector<std::string> all = ConsistentHashRing::candidatesFrom(*current, description.hashValue, current->servers.size());
    if (!all.empty()) {
        description.primary = all.front();
    }
    description.candidates.assign(all.begin(), all.begin() + std::min(candidateCount, all.size()));

    size_t limit = options.maxCandidates == 0 ? all.size() : std::min(options.maxCandidates, all.size());
    description.selected = firstHealthy(std::vector<std::string>(all.begin(), all.begin() + limit));
    description.hasSelection = !description.selected.empty();
    return description;
}

void LoadBalancer::startHealthChecks() {
    healthMonitor.start();
}

void LoadBalancer::stopHealthChecks() {
    healthMonitor.stop();
}

size_t LoadBalancer::getServerCount() const {
    boost::shared_lock<boost::shared_mutex> lock(serversLock);
    return servers.size();
}

std::vector<std::string> LoadBalancer::findCandidates(const std::string& key) const {
    size_t limit = options.maxCandidates == 0 ? std::numeric_limits<size_t>::max() : options.maxCandidates;
    return ring.lookupCandidates(key, limit);
}

std::string LoadBalancer::firstHealthy(const std::vector<std::string>& candidates) const {
    for (const std::string& candidate : candidates) {
        if (healthMonitor.isHealthy(candidate)) {
            return candidate;
        }
    }
    return "";
}

ServerInfo LoadBalancer::buildInfo(const ServerDescriptor& descriptor) const {
    std::string serverId = descriptor.getId();
    ServerInfo info;
    info.descriptor = descriptor;
    info.health = healthMonitor.getStatus(serverId);
    info.statistics = statistics.getServerStatistics(serverId);
    std::map<std::string, size_t> counts = ring.virtualNodeCounts();
    auto it = counts.find(serverId);
    info.virtualNodeCount = it == counts.end() ? 0 : it->second;
    return info;
}
