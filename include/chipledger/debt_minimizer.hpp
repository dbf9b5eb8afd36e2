#pragma once

#include <vector>
#include "types.hpp"

namespace chipledger {

/**
 * Greedy largest-pair debt matching.
 *
 * Repeatedly pairs the largest remaining creditor with the largest remaining
 * debtor and transfers the smaller of the two magnitudes. Every step zeroes
 * at least one participant, so n nonzero balances settle in at most n - 1
 * payments. The result is not guaranteed to be the global minimum for four
 * or more participants.
 *
 * Ties on magnitude are broken by ascending user id, so the output depends
 * only on the multiset of balances, never on their input order.
 */
class DebtMinimizer {
public:
    /**
     * @return payments with from_user, to_user and amount set, in elimination order
     * @throws InvalidRecordError if a user id appears twice
     * @throws UnbalancedLedgerError if credits and debts do not cancel exactly
     */
    static std::vector<SettlementPayment> minimize(const std::vector<NetBalance>& balances);
};

} // namespace chipledger
