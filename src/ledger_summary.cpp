#include "chipledger/ledger_summary.hpp"

namespace chipledger {

BalanceSummary summarize_balances(const std::string& user_id,
                                  const std::vector<SettlementPayment>& payments) {
    BalanceSummary summary;
    summary.user_id = user_id;

    for (const auto& payment : payments) {
        if (payment.status != PaymentStatus::Pending) continue;
        if (payment.from_user == user_id) {
            summary.total_owes += payment.amount;
            summary.owes.push_back(payment);
        } else if (payment.to_user == user_id) {
            summary.total_owed += payment.amount;
            summary.owed.push_back(payment);
        }
    }

    summary.net_balance = summary.total_owed - summary.total_owes;
    return summary;
}

} // namespace chipledger
