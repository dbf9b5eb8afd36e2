#include "chipledger/debt_minimizer.hpp"
#include "chipledger/errors.hpp"
#include "chipledger/money.hpp"
#include <algorithm>
#include <limits>
#include <queue>
#include <unordered_set>

namespace chipledger {

namespace {

/// A participant with an outstanding magnitude, always positive.
struct Party {
    std::string user_id;
    Cents remaining = 0;
};

/// Max-heap order on (remaining, user id descending): the top is the largest
/// magnitude, and among equals the smallest user id.
struct PartyOrder {
    bool operator()(const Party& a, const Party& b) const {
        if (a.remaining != b.remaining) return a.remaining < b.remaining;
        return a.user_id > b.user_id;
    }
};

using PartyQueue = std::priority_queue<Party, std::vector<Party>, PartyOrder>;

} // anonymous namespace

std::vector<SettlementPayment> DebtMinimizer::minimize(const std::vector<NetBalance>& balances) {
    PartyQueue creditors;
    PartyQueue debtors;
    Cents credit_total = 0;
    Cents debit_total = 0;

    std::unordered_set<std::string> seen;
    for (const auto& balance : balances) {
        if (!seen.insert(balance.user_id).second) {
            throw InvalidRecordError("Duplicate balance for " + balance.user_id);
        }
        if (balance.amount > 0) {
            creditors.push({balance.user_id, balance.amount});
            credit_total = money::checked_add(credit_total, balance.amount, "total credit");
        } else if (balance.amount < 0) {
            if (balance.amount == std::numeric_limits<Cents>::min()) {
                throw InvalidRecordError("Balance for " + balance.user_id + " is out of range");
            }
            debtors.push({balance.user_id, -balance.amount});
            debit_total = money::checked_add(debit_total, -balance.amount, "total debt");
        }
    }

    if (credit_total != debit_total) {
        throw UnbalancedLedgerError(
            "Credits " + money::format_cents(credit_total) +
            " do not match debts " + money::format_cents(debit_total));
    }

    std::vector<SettlementPayment> payments;
    if (!creditors.empty()) {
        payments.reserve(creditors.size() + debtors.size() - 1);
    }

    while (!creditors.empty() && !debtors.empty()) {
        Party creditor = creditors.top();
        creditors.pop();
        Party debtor = debtors.top();
        debtors.pop();

        Cents amount = std::min(creditor.remaining, debtor.remaining);

        SettlementPayment payment;
        payment.from_user = debtor.user_id;
        payment.to_user = creditor.user_id;
        payment.amount = amount;
        payments.push_back(std::move(payment));

        creditor.remaining -= amount;
        debtor.remaining -= amount;
        if (creditor.remaining > 0) creditors.push(std::move(creditor));
        if (debtor.remaining > 0) debtors.push(std::move(debtor));
    }

    return payments;
}

} // namespace chipledger
