#include "balancer_client.hpp"

#include <stdexcept>

#include "configs.hpp"

BalancerClient::BalancerClient() {}

void BalancerClient::connect(const std::string& address) {
    this->address = address;
    grpc::ChannelArguments channel_args;
    channel_args.SetMaxReceiveMessageSize(MAX_MESSAGE_SIZE);
    channel_args.SetMaxSendMessageSize(MAX_MESSAGE_SIZE);
    channel = grpc::CreateCustomChannel(address, grpc::InsecureChannelCredentials(), channel_args);
    stub = ringlb::BalancerService::NewStub(channel);
}

ringlb::BalancerService::Stub& BalancerClient::getStub() const {
    if (!stub) {
        throw std::runtime_error("Not connected to a balancer server");
    }
    return *stub;
}

void BalancerClient::checkStatus(const grpc::Status& status, const std::string& call) const {
    if (!status.ok()) {
        throw std::runtime_error(call + " to " + address + " failed (code " + std::to_string(status.error_code()) + "): " + status.error_message());
    }
}

std::string BalancerClient::addServer(const std::string& name, const std::string& host, int port, int weight) {
    ringlb::AddServerRequest request;
    ringlb::AddServerResponse response;
    grpc::ClientContext context;
    request.set_name(name);
    request.set_host(host);
    request.set_port(port);
    request.set_weight(weight);
    checkStatus(getStub().AddServer(&context, request, &response), "AddServer");
    return response.server_id();
}

void BalancerClient::removeServer(const std::string& serverId) {
    ringlb::RemoveServerRequest request;
    ringlb::RemoveServerResponse response;
    grpc::ClientContext context;
    request.set_server_id(serverId);
    checkStatus(getStub().RemoveServer(&context, request, &response), "RemoveServer");
}

void BalancerClient::updateWeight(const std::string& serverId, int weight) {
    ringlb::UpdateWeightRequest request;
    ringlb::UpdateWeightResponse response;
    grpc::ClientContext context;
    request.set_server_id(serverId);
    request.set_weight(weight);
    checkStatus(getStub().UpdateWeight(&context, request, &response), "UpdateWeight");
}

ringlb::SelectServerResponse BalancerClient::selectServer(const std::string& key) {
    ringlb::SelectServerRequest request;
    ringlb::SelectServerResponse response;
    grpc::ClientContext context;
    request.set_key(key);
    checkStatus(getStub().SelectServer(&context, request, &response), "SelectServer");
    return response;
}

void BalancerClient::reportResult(const std::string& serverId, bool success, double latencyMs) {
    ringlb::ReportResultRequest request;
    ringlb::ReportResultResponse response;
    grpc::ClientContext context;
    request.set_server_id(serverId);
    request.set_success(success);
    request.set_latency_ms(latencyMs);
    checkStatus(getStub().ReportResult(&context, request, &response), "ReportResult");
}

void BalancerClient::setServerHealth(const std::string& serverId, bool healthy) {
    ringlb::SetServerHealthRequest request;
    ringlb::SetServerHealthResponse response;
    grpc::ClientContext context;
    request.set_server_id(serverId);
    request.set_healthy(healthy);
    checkStatus(getStub().SetServerHealth(&context, request, &response), "SetServerHealth");
}

std::vector<ringlb::ServerInfo> BalancerClient::getServerList() {
    ringlb::GetServerListRequest request;
    ringlb::GetServerListResponse response;
    grpc::ClientContext context;
    checkStatus(getStub().GetServerList(&context, request, &response), "GetServerList");
    return std::vector<ringlb::ServerInfo>(response.servers().begin(), response.servers().end());
}

ringlb::GetAggregateStatsResponse BalancerClient::getAggregateStats() {
    ringlb::GetAggregateStatsRequest request;
    ringlb::GetAggregateStatsResponse response;
    grpc::ClientContext context;
    checkStatus(getStub().GetAggregateStats(&context, request, &response), "GetAggregateStats");
    return response;
}

void BalancerClient::resetStats() {
    ringlb::ResetStatsRequest request;
    ringlb::ResetStatsResponse response;
    grpc::ClientContext context;
    checkStatus(getStub().ResetStats(&context, request, &response), "ResetStats");
}

ringlb::DebugLookupResponse BalancerClient::debugLookup(const std::string& key, int candidateCount) {
    ringlb::DebugLookupRequest request;
    ringlb::DebugLookupResponse response;
    grpc::ClientContext context;
    request.set_key(key);
    request.set_candidate_count(candidateCount);
    checkStatus(getStub().DebugLookup(&context, request, &response), "DebugLookup");
    return response;
}

ringlb::DebugRingResponse BalancerClient::debugRing(int limit) {
    ringlb::DebugRingRequest request;
    ringlb::DebugRingResponse response;
    grpc::ClientContext context;
    request.set_limit(limit);
    checkStatus(getStub().DebugRing(&context, request, &response), "DebugRing");
    return response;
}
