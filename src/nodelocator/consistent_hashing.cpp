#include "consistent_hashing.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <unordered_set>

#include "errors.hpp"

// Upper bound on virtual nodes a single server may own
static const long long MAX_VIRTUAL_NODES_PER_SERVER = 1LL << 20;

ConsistentHashRing::ConsistentHashRing(std::shared_ptr<const HashFunction> hashFunction, int virtualNodes)
                  : hashFunction(hashFunction), virtualNodes(virtualNodes), ring(std::make_shared<RingSnapshot>()) {
    if (!this->hashFunction) {
        throw std::invalid_argument("Hash function must not be null");
    }
    if (this->hashFunction->outputBits() != RING_HASH_BITS) {
        throw std::invalid_argument("Hash function '" + this->hashFunction->name() + "' produces "
                                    + std::to_string(this->hashFunction->outputBits()) + "-bit values, ring expects "
                                    + std::to_string(RING_HASH_BITS));
    }
    if (virtualNodes < 1) {
        throw std::invalid_argument("Virtual node count must be positive: " + std::to_string(virtualNodes));
    }
}

void ConsistentHashRing::addServer(const std::string& serverId, int weight) {
    validateWeight(serverId, weight);

    std::lock_guard<std::mutex> guard(writeLock);
    std::shared_ptr<const RingSnapshot> current = snapshot();
    if (current->servers.count(serverId)) {
        throw BalancerError(ErrorKind::DUPLICATE_SERVER, "Server " + serverId + " already exists");
    }

    uint64_t sequence = nextSequence++;
    std::vector<VirtualNode> added = buildNodes(serverId, weight, sequence);

    auto next = std::make_shared<RingSnapshot>();
    next->nodes.reserve(current->nodes.size() + added.size());
    std::merge(current->nodes.begin(), current->nodes.end(), added.begin(), added.end(),
               std::back_inserter(next->nodes), ringOrder);
    next->servers = current->servers;
    next->servers[serverId] = RingServer{weight, sequence, added.size()};

    publish(next);
}

void ConsistentHashRing::updateServer(const std::string& serverId, int weight) {
    validateWeight(serverId, weight);

    std::lock_guard<std::mutex> guard(writeLock);
    std::shared_ptr<const RingSnapshot> current = snapshot();
    auto existing = current->servers.find(serverId);
    if (existing == current->servers.end()) {
        throw BalancerError(ErrorKind::SERVER_NOT_FOUND, "Server " + serverId + " not found");
    }
    if (existing->second.weight == weight) {
        return;
    }

    // Keeps the registration sequence so collision order is unchanged
    uint64_t sequence = existing->second.sequence;
    std::vector<VirtualNode> added = buildNodes(serverId, weight, sequence);

    std::vector<VirtualNode> kept;
    kept.reserve(current->nodes.size());
    std::copy_if(current->nodes.begin(), current->nodes.end(), std::back_inserter(kept),
                 [&serverId](const VirtualNode& node) { return node.getServerId() != serverId; });

    auto next = std::make_shared<RingSnapshot>();
    next->nodes.reserve(kept.size() + added.size());
    std::merge(kept.begin(), kept.end(), added.begin(), added.end(), std::back_inserter(next->nodes), ringOrder);
    next->servers = current->servers;
    next->servers[serverId] = RingServer{weight, sequence, added.size()};

    publish(next);
}

void ConsistentHashRing::removeServer(const std::string& serverId) {
    std::lock_guard<std::mutex> guard(writeLock);
    std::shared_ptr<const RingSnapshot> current = snapshot();
    if (!current->servers.count(serverId)) {
        throw BalancerError(ErrorKind::SERVER_NOT_FOUND, "Server " + serverId + " not found");
    }

    auto next = std::make_shared<RingSnapshot>();
    next->nodes.reserve(current->nodes.size());
    std::copy_if(current->nodes.begin(), current->nodes.end(), std::back_inserter(next->nodes),
                 [&serverId](const VirtualNode& node) { return node.getServerId() != serverId; });
    next->servers = current->servers;
    next->servers.erase(serverId);

    publish(next);
}

std::string ConsistentHashRing::lookup(const std::string& key) const {
    std::shared_ptr<const RingSnapshot> current = snapshot();
    if (current->nodes.empty()) {
        throw BalancerError(ErrorKind::EMPTY_RING, "No servers registered on the ring");
    }
    return candidatesFrom(*current, hashFunction->hash(key), 1).front();
}

std::vector<std::string> ConsistentHashRing::lookupCandidates(const std::string& key, size_t n) const {
    std::shared_ptr<const RingSnapshot> current = snapshot();
    if (current->nodes.empty()) {
        throw BalancerError(ErrorKind::EMPTY_RING, "No servers registered on the ring");
    }
    return candidatesFrom(*current, hashFunction->hash(key), n);
}

std::vector<std::string> ConsistentHashRing::candidatesFrom(const RingSnapshot& ring, uint32_t hashValue, size_t n) {
    std::vector<std::string> candidates;
    if (ring.nodes.empty() || n == 0) {
        return candidates;
    }
    n = std::min(n, ring.servers.size());

    auto it = std::lower_bound(ring.nodes.begin(), ring.nodes.end(), hashValue,
                               [](const VirtualNode& node, uint32_t value) { return node.getHashValue() < value; });
    size_t start = static_cast<size_t>(std::distance(ring.nodes.begin(), it)) % ring.nodes.size();

    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < ring.nodes.size() && candidates.size() < n; ++i) {
        const VirtualNode& node = ring.nodes[(start + i) % ring.nodes.size()];
        if (seen.insert(node.getServerId()).second) {
            candidates.push_back(node.getServerId());
        }
    }
    return candidates;
}

bool ConsistentHashRing::contains(const std::string& serverId) const {
    return snapshot()->servers.count(serverId) > 0;
}

size_t ConsistentHashRing::serverCount() const {
    return snapshot()->servers.size();
}

size_t ConsistentHashRing::virtualNodeCount() const {
    return snapshot()->nodes.size();
}

std::vector<std::string> ConsistentHashRing::getServers() const {
    std::shared_ptr<const RingSnapshot> current = snapshot();
    std::vector<std::string> servers;
    for (const auto& entry : current->servers) {
        servers.push_back(entry.first);
    }
    return servers;
}

std::map<std::string, size_t> ConsistentHashRing::virtualNodeCounts() const {
    std::shared_ptr<const RingSnapshot> current = snapshot();
    std::map<std::string, size_t> counts;
    for (const auto& entry : current->servers) {
        counts[entry.first] = entry.second.virtualNodeCount;
    }
    return counts;
}

std::vector<VirtualNode> ConsistentHashRing::virtualNodesOf(const std::string& serverId) const {
    std::shared_ptr<const RingSnapshot> current = snapshot();
    if (!current->servers.count(serverId)) {
        throw BalancerError(ErrorKind::SERVER_NOT_FOUND, "Server " + serverId + " not found");
    }
    std::vector<VirtualNode> owned;
    std::copy_if(current->nodes.begin(), current->nodes.end(), std::back_inserter(owned),
                 [&serverId](const VirtualNode& node) { return node.getServerId() == serverId; });
    return owned;
}

std::vector<VirtualNode> ConsistentHashRing::nodesSample(size_t limit) const {
    std::shared_ptr<const RingSnapshot> current = snapshot();
    size_t count = std::min(limit, current->nodes.size());
    return std::vector<VirtualNode>(current->nodes.begin(), current->nodes.begin() + count);
}

int ConsistentHashRing::weightOf(const std::string& serverId) const {
    std::shared_ptr<const RingSnapshot> current = snapshot();
    auto it = current->servers.find(serverId);
    if (it == current->servers.end()) {
        throw BalancerError(ErrorKind::SERVER_NOT_FOUND, "Server " + serverId + " not found");
    }
    return it->second.weight;
}

void ConsistentHashRing::validateWeight(const std::string& serverId, int weight) const {
    if (weight < 1 || static_cast<long long>(weight) * virtualNodes > MAX_VIRTUAL_NODES_PER_SERVER) {
        throw BalancerError(ErrorKind::INVALID_WEIGHT, "Invalid weight " + std::to_string(weight) + " for server " + serverId);
    }
}

std::vector<VirtualNode> ConsistentHashRing::buildNodes(const std::string& serverId, int weight, uint64_t sequence) const {
    int count = weight * virtualNodes;
    std::vector<VirtualNode> nodes;
    nodes.reserve(count);
    for (int i = 0; i < count; ++i) {
        nodes.push_back(VirtualNode::create(serverId, i, sequence, *hashFunction));
    }
    std::sort(nodes.begin(), nodes.end(), ringOrder);
    return nodes;
}

uint32_t ConsistentHashRing::hashKey(const std::string& key) const {
    return hashFunction->hash(key);
}

std::shared_ptr<const RingSnapshot> ConsistentHashRing::snapshot() const {
    boost::shared_lock<boost::shared_mutex> lock(rwlock);
    return ring;
}

void ConsistentHashRing::publish(std::shared_ptr<const RingSnapshot> next) {
    boost::unique_lock<boost::shared_mutex> lock(rwlock);
    ring = std::move(next);
}
