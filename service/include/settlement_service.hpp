#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>
#include "chipledger/settlement.grpc.pb.h"
#include "chipledger/settlement_coordinator.hpp"

namespace chipledger {

/// gRPC front of the SettlementCoordinator.
class SettlementServiceImpl final : public proto::SettlementService::Service {
public:
    explicit SettlementServiceImpl(std::shared_ptr<SettlementCoordinator> coordinator)
        : coordinator_(std::move(coordinator)) {}

    grpc::Status Settle(grpc::ServerContext* context,
                        const proto::SettleRequest* request,
                        proto::SettleResponse* response) override;

    grpc::Status GetSettlement(grpc::ServerContext* context,
                               const proto::GetSettlementRequest* request,
                               proto::Settlement* response) override;

    grpc::Status MarkPaid(grpc::ServerContext* context,
                          const proto::MarkPaidRequest* request,
                          proto::SettlementPayment* response) override;

    grpc::Status GetBalances(grpc::ServerContext* context,
                             const proto::GetBalancesRequest* request,
                             proto::BalanceSummary* response) override;

private:
    std::shared_ptr<SettlementCoordinator> coordinator_;
};

} // namespace chipledger
