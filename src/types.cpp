#include "chipledger/types.hpp"

namespace chipledger {

const char* to_string(PaymentStatus status) {
    switch (status) {
        case PaymentStatus::Pending: return "pending";
        case PaymentStatus::Paid: return "paid";
    }
    return "unknown";
}

const char* to_string(SettlementStatus status) {
    switch (status) {
        case SettlementStatus::Unsettled: return "unsettled";
        case SettlementStatus::Settling: return "settling";
        case SettlementStatus::Settled: return "settled";
    }
    return "unknown";
}

} // namespace chipledger
