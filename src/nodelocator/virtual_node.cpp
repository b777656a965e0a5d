#include "virtual_node.hpp"

#include <functional>
#include <tuple>

VirtualNode::VirtualNode(const std::string& serverId, int replicaIndex, uint32_t hashValue, uint64_t sequence)
            : serverId(serverId), replicaIndex(replicaIndex), hashValue(hashValue), sequence(sequence) {}

VirtualNode VirtualNode::create(const std::string& serverId, int replicaIndex, uint64_t sequence, const HashFunction& hashFunction) {
    return VirtualNode(serverId, replicaIndex, hashFunction.hash(replicaKey(serverId, replicaIndex)), sequence);
}

std::string VirtualNode::replicaKey(const std::string& serverId, int replicaIndex) {
    return serverId + ":" + std::to_string(replicaIndex);
}

bool VirtualNode::operator==(const VirtualNode& other) const {
    return serverId == other.serverId && replicaIndex == other.replicaIndex;
}

bool VirtualNode::operator!=(const VirtualNode& other) const {
    return !(*this == other);
}

std::string VirtualNode::toString() const {
    return "VirtualNode(server=" + serverId + ", replica=" + std::to_string(replicaIndex) + ", hash=" + std::to_string(hashValue) + ")";
}

bool ringOrder(const VirtualNode& a, const VirtualNode& b) {
    return std::make_tuple(a.getHashValue(), a.getSequence(), std::cref(a.getServerId()), a.getReplicaIndex())
         < std::make_tuple(b.getHashValue(), b.getSequence(), std::cref(b.getServerId()), b.getReplicaIndex());
}
