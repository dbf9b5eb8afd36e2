#include "settlement_service.hpp"
#include "proto_mapping.hpp"
#include "chipledger/errors.hpp"
#include "chipledger/logging.hpp"
#include "chipledger/validation.hpp"

namespace chipledger {

namespace {

constexpr const char* LOG_DOMAIN = "settlement-service";

/// Run a handler body, converting settlement errors to their gRPC status.
template<typename Fn>
grpc::Status guarded(const char* rpc, Fn&& body) {
    try {
        body();
        return grpc::Status::OK;
    } catch (const SettlementError& e) {
        return e.to_grpc_status();
    } catch (const std::exception& e) {
        log_error(LOG_DOMAIN, "unexpected_error", {{"rpc", rpc}, {"error", e.what()}});
        return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
    }
}

} // anonymous namespace

grpc::Status SettlementServiceImpl::Settle(grpc::ServerContext* context,
                                           const proto::SettleRequest* request,
                                           proto::SettleResponse* response) {
    return guarded("Settle", [&] {
        auto result = coordinator_->settle(request->game_id(), request->group_id(),
                                           mapping::from_proto(request->players()));
        mapping::to_proto(result.settlement, response->mutable_settlement());
        response->set_already_settled(result.already_settled);
    });
}

grpc::Status SettlementServiceImpl::GetSettlement(grpc::ServerContext* context,
                                                  const proto::GetSettlementRequest* request,
                                                  proto::Settlement* response) {
    return guarded("GetSettlement", [&] {
        mapping::to_proto(coordinator_->get_settlement(request->game_id()), response);
    });
}

grpc::Status SettlementServiceImpl::MarkPaid(grpc::ServerContext* context,
                                             const proto::MarkPaidRequest* request,
                                             proto::SettlementPayment* response) {
    return guarded("MarkPaid", [&] {
        auto payment = coordinator_->mark_paid(request->ledger_id(), request->acting_user_id(),
                                               request->paid());
        mapping::to_proto(payment, response);
    });
}

grpc::Status SettlementServiceImpl::GetBalances(grpc::ServerContext* context,
                                                const proto::GetBalancesRequest* request,
                                                proto::BalanceSummary* response) {
    return guarded("GetBalances", [&] {
        validation::require_not_empty(request->user_id(), "user_id");
        mapping::to_proto(coordinator_->balances(request->user_id()), response);
    });
}

} // namespace chipledger
