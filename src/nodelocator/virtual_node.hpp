#ifndef VIRTUAL_NODE_HPP
#define VIRTUAL_NODE_HPP

#include <cstdint>
#include <string>

#include "hash_functions.hpp"

// One position a physical server occupies on the ring. Immutable once built.
class VirtualNode {
public:
    VirtualNode(const std::string& serverId, int replicaIndex, uint32_t hashValue, uint64_t sequence);

    static VirtualNode create(const std::string& serverId, int replicaIndex, uint64_t sequence, const HashFunction& hashFunction);

    static std::string replicaKey(const std::string& serverId, int replicaIndex);

    const std::string& getServerId() const { return serverId; }
    int getReplicaIndex() const { return replicaIndex; }
    uint32_t getHashValue() const { return hashValue; }
    uint64_t getSequence() const { return sequence; }

    bool operator==(const VirtualNode& other) const;
    bool operator!=(const VirtualNode& other) const;

    std::string toString() const;

private:
    std::string serverId;
    int replicaIndex;
    uint32_t hashValue;
    // Registration order of the owning server, breaks ties between equal hashes
    uint64_t sequence;
};

// Ring order: hash value, then registration order, then server id, then replica index.
bool ringOrder(const VirtualNode& a, const VirtualNode& b);

#endif // VIRTUAL_NODE_HPP
