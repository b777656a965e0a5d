#ifndef CONSISTENT_HASHING_HPP
#define CONSISTENT_HASHING_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <boost/thread/locks.hpp>
#include <boost/thread/shared_mutex.hpp>

#include "configs.hpp"
#include "hash_functions.hpp"
#include "virtual_node.hpp"

struct RingServer {
    int weight;
    uint64_t sequence;
    size_t virtualNodeCount;
};

// Immutable ring contents. A new snapshot is built for every topology change.
struct RingSnapshot {
    std::vector<VirtualNode> nodes;
    std::map<std::string, RingServer> servers;
};

class ConsistentHashRing {
public:
    ConsistentHashRing(std::shared_ptr<const HashFunction> hashFunction, int virtualNodes = VIRTUAL_NODES);

    void addServer(const std::string& serverId, int weight = 1);

    // Replaces the server's virtual nodes in a single published snapshot.
    void updateServer(const std::string& serverId, int weight);

    void removeServer(const std::string& serverId);

    std::string lookup(const std::string& key) const;

    std::vector<std::string> lookupCandidates(const std::string& key, size_t n) const;

    bool contains(const std::string& serverId) const;

    size_t serverCount() const;

    int weightOf(const std::string& serverId) const;

    // Throws InvalidWeight unless 1 <= weight and the server's node count stays bounded.
    void validateWeight(const std::string& serverId, int weight) const;

    size_t virtualNodeCount() const;

    std::vector<std::string> getServers() const;

    std::map<std::string, size_t> virtualNodeCounts() const;

    std::vector<VirtualNode> virtualNodesOf(const std::string& serverId) const;

    std::vector<VirtualNode> nodesSample(size_t limit) const;

    uint32_t hashKey(const std::string& key) const;

    std::shared_ptr<const RingSnapshot> snapshot() const;

    int getVirtualNodes() const { return virtualNodes; }

    const HashFunction& getHashFunction() const { return *hashFunction; }

    static std::vector<std::string> candidatesFrom(const RingSnapshot& ring, uint32_t hashValue, size_t n);

private:
    std::vector<VirtualNode> buildNodes(const std::string& serverId, int weight, uint64_t sequence) const;
    void publish(std::shared_ptr<const RingSnapshot> next);

    std::shared_ptr<const HashFunction> hashFunction;
    int virtualNodes;

    std::shared_ptr<const RingSnapshot> ring;
    mutable boost::shared_mutex rwlock;

    // Serializes writers; readers never take it
    std::mutex writeLock;
    uint64_t nextSequence = 0;
};

#endif // CONSISTENT_HASHING_HPP
