#ifndef BALANCER_SERVER_HPP
#define BALANCER_SERVER_HPP

#include <memory>
#include <grpcpp/grpcpp.h>

#include "load_balancer.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include "ringlb.grpc.pb.h"

class BalancerServiceImpl final : public ringlb::BalancerService::Service {
public:
    explicit BalancerServiceImpl(std::shared_ptr<LoadBalancer> balancer);

    grpc::Status AddServer(grpc::ServerContext* context, const ringlb::AddServerRequest* request, ringlb::AddServerResponse* response) override;

    grpc::Status RemoveServer(grpc::ServerContext* context, const ringlb::RemoveServerRequest* request, ringlb::RemoveServerResponse* response) override;

    grpc::Status UpdateWeight(grpc::ServerContext* context, const ringlb::UpdateWeightRequest* request, ringlb::UpdateWeightResponse* response) override;

    grpc::Status SelectServer(grpc::ServerContext* context, const ringlb::SelectServerRequest* request, ringlb::SelectServerResponse* response) override;

    grpc::Status ReportResult(grpc::ServerContext* context, const ringlb::ReportResultRequest* request, ringlb::ReportResultResponse* response) override;

    grpc::Status SetServerHealth(grpc::ServerContext* context, const ringlb::SetServerHealthRequest* request, ringlb::SetServerHealthResponse* response) override;

    grpc::Status GetServerList(grpc::ServerContext* context, const ringlb::GetServerListRequest* request, ringlb::GetServerListResponse* response) override;

    grpc::Status GetAggregateStats(grpc::ServerContext* context, const ringlb::GetAggregateStatsRequest* request, ringlb::GetAggregateStatsResponse* response) override;

    grpc::Status ResetStats(grpc::ServerContext* context, const ringlb::ResetStatsRequest* request, ringlb::ResetStatsResponse* response) override;

    grpc::Status DebugLookup(grpc::ServerContext* context, const ringlb::DebugLookupRequest* request, ringlb::DebugLookupResponse* response) override;

    grpc::Status DebugRing(grpc::ServerContext* context, const ringlb::DebugRingRequest* request, ringlb::DebugRingResponse* response) override;

private:
    std::shared_ptr<LoadBalancer> balancer;
    Logger logger;
};

grpc::Status toGrpcStatus(const BalancerError& error);

void serve(std::shared_ptr<LoadBalancer> balancer);

#endif // BALANCER_SERVER_HPP
