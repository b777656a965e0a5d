#include <iostream>
#include <grpcpp/grpcpp.h>
#include <grpcpp/server.h>
#include <grpcpp/server_builder.h>
#include <grpcpp/server_context.h>
#include <grpcpp/security/server_credentials.h>

#include "balancer_server.hpp"
#include "configs.hpp"
#include "health_monitor.hpp"
#include "ringlb.grpc.pb.h"

static const int DEFAULT_DEBUG_CANDIDATES = 3;
static const int DEFAULT_DEBUG_RING_LIMIT = 20;

grpc::Status toGrpcStatus(const BalancerError& error) {
    std::string message = std::string(errorKindName(error.getKind())) + ": " + error.what();
    switch (error.getKind()) {
        case ErrorKind::DUPLICATE_SERVER:
            return grpc::Status(grpc::StatusCode::ALREADY_EXISTS, message);
        case ErrorKind::SERVER_NOT_FOUND:
            return grpc::Status(grpc::StatusCode::NOT_FOUND, message);
        case ErrorKind::INVALID_WEIGHT:
            return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, message);
        case ErrorKind::EMPTY_RING:
        case ErrorKind::NO_SERVERS_AVAILABLE:
        case ErrorKind::NO_HEALTHY_SERVER:
            return grpc::Status(grpc::StatusCode::UNAVAILABLE, message);
    }
    return grpc::Status(grpc::StatusCode::INTERNAL, message);
}

static void fillServerInfo(const ServerInfo& info, ringlb::ServerInfo* out) {
    out->set_server_id(info.descriptor.getId());
    out->set_name(info.descriptor.name);
    out->set_host(info.descriptor.host);
    out->set_port(info.descriptor.port);
    out->set_weight(info.descriptor.weight);
    out->set_virtual_node_count(info.virtualNodeCount);

    ringlb::HealthInfo* health = out->mutable_health();
    health->set_state(healthStateName(info.health.state));
    health->set_consecutive_failures(info.health.consecutiveFailures);
    health->set_consecutive_successes(info.health.consecutiveSuccesses);
    health->set_last_check_millis(info.health.lastCheckMillis);
    health->set_last_response_time_ms(info.health.lastResponseTimeMs);
    health->set_total_checks(info.health.totalChecks);
    health->set_failed_checks(info.health.failedChecks);

    ringlb::StatsInfo* stats = out->mutable_stats();
    stats->set_request_count(info.statistics.requestCount);
    stats->set_error_count(info.statistics.errorCount);
    stats->set_average_latency_ms(info.statistics.averageLatencyMs);
    stats->set_last_latency_ms(info.statistics.lastLatencyMs);
    stats->set_error_rate(info.statistics.errorRate);
}

BalancerServiceImpl::BalancerServiceImpl(std::shared_ptr<LoadBalancer> balancer) : balancer(balancer), logger("BalancerService") {}

grpc::Status BalancerServiceImpl::AddServer(grpc::ServerContext* context, const ringlb::AddServerRequest* request, ringlb::AddServerResponse* response) {
    ServerDescriptor server;
    server.name = request->name();
    server.host = request->host();
    server.port = request->port();
    server.weight = request->has_weight() ? request->weight() : 1;
    try {
        response->set_server_id(balancer->addServer(server));
    } catch (const BalancerError& e) {
        return toGrpcStatus(e);
    } catch (const std::invalid_argument& e) {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, e.what());
    }
    logger.log_message("AddServer " + response->server_id());
    return grpc::Status::OK;
}

grpc::Status BalancerServiceImpl::RemoveServer(grpc::ServerContext* context, const ringlb::RemoveServerRequest* request, ringlb::RemoveServerResponse* response) {
    try {
        balancer->removeServer(request->server_id());
    } catch (const BalancerError& e) {
        return toGrpcStatus(e);
    }
    logger.log_message("RemoveServer " + request->server_id());
    return grpc::Status::OK;
}

grpc::Status BalancerServiceImpl::UpdateWeight(grpc::ServerContext* context, const ringlb::UpdateWeightRequest* request, ringlb::UpdateWeightResponse* response) {
    try {
        balancer->updateWeight(request->server_id(), request->weight());
    } catch (const BalancerError& e) {
        return toGrpcStatus(e);
    }
    logger.log_message("UpdateWeight " + request->server_id() + " " + std::to_string(request->weight()));
    return grpc::Status::OK;
}

grpc::Status BalancerServiceImpl::SelectServer(grpc::ServerContext* context, const ringlb::SelectServerRequest* request, ringlb::SelectServerResponse* response) {
    try {
        std::string serverId = balancer->selectServer(request->key());
        response->set_server_id(serverId);
        ServerInfo info = balancer->getServer(serverId);
        response->set_host(info.descriptor.host);
        response->set_port(info.descriptor.port);
    } catch (const BalancerError& e) {
        // Removed between selection and lookup; the id alone is still a valid answer
        if (e.getKind() != ErrorKind::SERVER_NOT_FOUND || response->server_id().empty()) {
            return toGrpcStatus(e);
        }
    }
    return grpc::Status::OK;
}

grpc::Status BalancerServiceImpl::ReportResult(grpc::ServerContext* context, const ringlb::ReportResultRequest* request, ringlb::ReportResultResponse* response) {
    try {
        balancer->reportResult(request->server_id(), request->success(), request->latency_ms());
    } catch (const BalancerError& e) {
        return toGrpcStatus(e);
    }
    return grpc::Status::OK;
}

grpc::Status BalancerServiceImpl::SetServerHealth(grpc::ServerContext* context, const ringlb::SetServerHealthRequest* request, ringlb::SetServerHealthResponse* response) {
    try {
        balancer->markServerStatus(request->server_id(), request->healthy());
    } catch (const BalancerError& e) {
        return toGrpcStatus(e);
    }
    logger.log_message("SetServerHealth " + request->server_id() + (request->healthy() ? " healthy" : " unhealthy"));
    return grpc::Status::OK;
}

grpc::Status BalancerServiceImpl::GetServerList(grpc::ServerContext* context, const ringlb::GetServerListRequest* request, ringlb::GetServerListResponse* response) {
    for (const ServerInfo& info : balancer->getServerList()) {
        fillServerInfo(info, response->add_servers());
    }
    return grpc::Status::OK;
}

grpc::Status BalancerServiceImpl::GetAggregateStats(grpc::ServerContext* context, const ringlb::GetAggregateStatsRequest* request, ringlb::GetAggregateStatsResponse* response) {
    AggregateStatistics stats = balancer->getAggregateStats();
    response->set_server_count(stats.serverCount);
    response->set_healthy_server_count(balancer->getHealthyServerCount());
    response->set_total_requests(stats.totalRequests);
    response->set_total_errors(stats.totalErrors);
    response->set_total_selections(stats.totalSelections);
    response->set_failed_selections(stats.failedSelections);
    response->set_error_rate(stats.errorRate);
    response->set_average_latency_ms(stats.averageLatencyMs);
    response->set_hash_function(balancer->getRing().getHashFunction().name());
    response->set_virtual_nodes(balancer->getRing().getVirtualNodes());
    response->set_ring_size(balancer->getRing().virtualNodeCount());
    return grpc::Status::OK;
}

grpc::Status BalancerServiceImpl::ResetStats(grpc::ServerContext* context, const ringlb::ResetStatsRequest* request, ringlb::ResetStatsResponse* response) {
    balancer->resetStatistics();
    logger.log_message("ResetStats");
    return grpc::Status::OK;
}

grpc::Status BalancerServiceImpl::DebugLookup(grpc::ServerContext* context, const ringlb::DebugLookupRequest* request, ringlb::DebugLookupResponse* response) {
    int count = request->candidate_count() > 0 ? request->candidate_count() : DEFAULT_DEBUG_CANDIDATES;
    LookupDescription lookup = balancer->describeLookup(request->key(), count);
    response->set_key(lookup.key);
    response->set_hash_value(lookup.hashValue);
    response->set_primary(lookup.primary);
    for (const std::string& candidate : lookup.candidates) {
        response->add_candidates(candidate);
    }
    response->set_has_selection(lookup.hasSelection);
    response->set_selected(lookup.selected);
    return grpc::Status::OK;
}

grpc::Status BalancerServiceImpl::DebugRing(grpc::ServerContext* context, const ringlb::DebugRingRequest* request, ringlb::DebugRingResponse* response) {
    ConsistentHashRing& ring = balancer->getRing();
    int limit = request->limit() > 0 ? request->limit() : DEFAULT_DEBUG_RING_LIMIT;
    response->set_total_virtual_nodes(ring.virtualNodeCount());
    for (const auto& entry : ring.virtualNodeCounts()) {
        (*response->mutable_virtual_node_counts())[entry.first] = entry.second;
    }
    for (const VirtualNode& node : ring.nodesSample(limit)) {
        ringlb::VirtualNodeInfo* info = response->add_sample();
        info->set_server_id(node.getServerId());
        info->set_replica_index(node.getReplicaIndex());
        info->set_hash_value(node.getHashValue());
    }
    return grpc::Status::OK;
}


void serve(std::shared_ptr<LoadBalancer> balancer) {
    grpc::ServerBuilder builder;
    builder.AddListeningPort(LISTEN_ADDRESS, grpc::InsecureServerCredentials());
    builder.SetMaxReceiveMessageSize(MAX_MESSAGE_SIZE);
    builder.SetMaxSendMessageSize(MAX_MESSAGE_SIZE);

    BalancerServiceImpl service(balancer);
    Logger logger("BalancerServer");
    builder.RegisterService(&service);

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        throw std::runtime_error("Failed to listen on " + LISTEN_ADDRESS);
    }
    logger.log_message("Start listening on " + LISTEN_ADDRESS);
    std::cout << "Listening on " << LISTEN_ADDRESS << std::endl;
    server->Wait();
}
