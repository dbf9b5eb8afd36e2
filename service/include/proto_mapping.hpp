#pragma once

#include <vector>
#include <google/protobuf/timestamp.pb.h>
#include "chipledger/types.hpp"
#include "chipledger/types.pb.h"

namespace chipledger {
namespace mapping {

google::protobuf::Timestamp to_proto(Clock::time_point tp);

std::vector<PlayerRecord> from_proto(
    const google::protobuf::RepeatedPtrField<proto::PlayerRecord>& players);

void to_proto(const SettlementPayment& payment, proto::SettlementPayment* out);
void to_proto(const Settlement& settlement, proto::Settlement* out);
void to_proto(const BalanceSummary& summary, proto::BalanceSummary* out);

} // namespace mapping
} // namespace chipledger
