#include "proto_mapping.hpp"
#include <google/protobuf/util/time_util.h>

namespace chipledger {
namespace mapping {

namespace {

proto::PaymentStatus to_proto(PaymentStatus status) {
    switch (status) {
        case PaymentStatus::Pending: return proto::PAYMENT_STATUS_PENDING;
        case PaymentStatus::Paid: return proto::PAYMENT_STATUS_PAID;
    }
    return proto::PAYMENT_STATUS_UNSPECIFIED;
}

proto::SettlementStatus to_proto(SettlementStatus status) {
    switch (status) {
        case SettlementStatus::Unsettled: return proto::SETTLEMENT_STATUS_UNSETTLED;
        case SettlementStatus::Settling: return proto::SETTLEMENT_STATUS_SETTLING;
        case SettlementStatus::Settled: return proto::SETTLEMENT_STATUS_SETTLED;
    }
    return proto::SETTLEMENT_STATUS_UNSPECIFIED;
}

} // anonymous namespace

google::protobuf::Timestamp to_proto(Clock::time_point tp) {
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch());
    return google::protobuf::util::TimeUtil::NanosecondsToTimestamp(nanos.count());
}

std::vector<PlayerRecord> from_proto(
    const google::protobuf::RepeatedPtrField<proto::PlayerRecord>& players) {
    std::vector<PlayerRecord> records;
    records.reserve(players.size());
    for (const auto& player : players) {
        records.push_back({player.user_id(), player.total_buy_in(), player.cash_out()});
    }
    return records;
}

void to_proto(const SettlementPayment& payment, proto::SettlementPayment* out) {
    out->set_ledger_id(payment.ledger_id);
    out->set_game_id(payment.game_id);
    out->set_group_id(payment.group_id);
    out->set_from_user_id(payment.from_user);
    out->set_to_user_id(payment.to_user);
    out->set_amount_cents(payment.amount);
    out->set_status(to_proto(payment.status));
    *out->mutable_created_at() = to_proto(payment.created_at);
    if (payment.paid_at) {
        *out->mutable_paid_at() = to_proto(*payment.paid_at);
    }
    out->set_is_locked(payment.is_locked);
}

void to_proto(const Settlement& settlement, proto::Settlement* out) {
    out->set_game_id(settlement.game_id);
    out->set_group_id(settlement.group_id);
    out->set_status(to_proto(settlement.status));
    for (const auto& payment : settlement.payments) {
        to_proto(payment, out->add_payments());
    }
    *out->mutable_settled_at() = to_proto(settlement.settled_at);
}

void to_proto(const BalanceSummary& summary, proto::BalanceSummary* out) {
    out->set_user_id(summary.user_id);
    out->set_total_owes_cents(summary.total_owes);
    out->set_total_owed_cents(summary.total_owed);
    out->set_net_balance_cents(summary.net_balance);
    for (const auto& payment : summary.owes) {
        to_proto(payment, out->add_owes());
    }
    for (const auto& payment : summary.owed) {
        to_proto(payment, out->add_owed());
    }
}

} // namespace mapping
} // namespace chipledger
