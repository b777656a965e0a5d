#ifndef BALANCER_CLIENT_HPP
#define BALANCER_CLIENT_HPP

#include <memory>
#include <string>
#include <vector>
#include <grpcpp/grpcpp.h>

#include "ringlb.grpc.pb.h"

// Thin wrapper over the BalancerService stub. Every call throws
// std::runtime_error when the RPC does not return OK.
class BalancerClient {
public:
    BalancerClient();

    void connect(const std::string& address);

    std::string addServer(const std::string& name, const std::string& host, int port, int weight);

    void removeServer(const std::string& serverId);

    void updateWeight(const std::string& serverId, int weight);

    ringlb::SelectServerResponse selectServer(const std::string& key);

    void reportResult(const std::string& serverId, bool success, double latencyMs);

    void setServerHealth(const std::string& serverId, bool healthy);

    std::vector<ringlb::ServerInfo> getServerList();

    ringlb::GetAggregateStatsResponse getAggregateStats();

    void resetStats();

    ringlb::DebugLookupResponse debugLookup(const std::string& key, int candidateCount);

    ringlb::DebugRingResponse debugRing(int limit);

private:
    ringlb::BalancerService::Stub& getStub() const;
    void checkStatus(const grpc::Status& status, const std::string& call) const;

    std::string address;
    std::shared_ptr<grpc::Channel> channel;
    std::unique_ptr<ringlb::BalancerService::Stub> stub;
};

#endif // BALANCER_CLIENT_HPP
