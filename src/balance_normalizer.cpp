#include "chipledger/balance_normalizer.hpp"
#include "chipledger/errors.hpp"
#include "chipledger/money.hpp"
#include "chipledger/validation.hpp"
#include <cstdlib>
#include <unordered_set>

namespace chipledger {

namespace {

NetBalance to_net_balance(const PlayerRecord& record) {
    validation::require_not_empty(record.user_id, "user_id");
    validation::require_finite(record.total_buy_in, "total_buy_in for " + record.user_id);
    validation::require_finite(record.cash_out, "cash_out for " + record.user_id);
    validation::require_non_negative(record.total_buy_in, "total_buy_in for " + record.user_id);
    validation::require_non_negative(record.cash_out, "cash_out for " + record.user_id);

    Cents buy_in = money::to_cents(record.total_buy_in, "total_buy_in");
    Cents cash_out = money::to_cents(record.cash_out, "cash_out");
    return {record.user_id, cash_out - buy_in};
}

/// Index of the balance absorbing the residue: largest |amount|, then smallest user id.
size_t adjustment_target(const std::vector<NetBalance>& balances) {
    size_t target = 0;
    for (size_t i = 1; i < balances.size(); ++i) {
        Cents magnitude = std::llabs(balances[i].amount);
        Cents best = std::llabs(balances[target].amount);
        if (magnitude > best ||
            (magnitude == best && balances[i].user_id < balances[target].user_id)) {
            target = i;
        }
    }
    return target;
}

} // anonymous namespace

std::vector<NetBalance> BalanceNormalizer::normalize(const std::vector<PlayerRecord>& records) {
    std::vector<NetBalance> balances;
    balances.reserve(records.size());

    std::unordered_set<std::string> seen;
    Cents residue = 0;
    for (const auto& record : records) {
        auto balance = to_net_balance(record);
        if (!seen.insert(balance.user_id).second) {
            throw InvalidRecordError("Duplicate player record for " + balance.user_id);
        }
        residue = money::checked_add(residue, balance.amount, "sum of net balances");
        balances.push_back(std::move(balance));
    }

    if (residue == 0) {
        return balances;
    }

    Cents limit = tolerance(balances.size());
    if (std::llabs(residue) > limit) {
        throw UnbalancedLedgerError(
            "Net balances sum to " + money::format_cents(residue) +
            " instead of zero (tolerance " + money::format_cents(limit) +
            "); check buy-ins and cash-outs");
    }

    balances[adjustment_target(balances)].amount -= residue;
    return balances;
}

} // namespace chipledger
