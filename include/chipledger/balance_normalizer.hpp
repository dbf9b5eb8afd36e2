#pragma once

#include <vector>
#include "types.hpp"

namespace chipledger {

/**
 * Converts raw per-player buy-in / cash-out totals into integer net balances
 * that sum to exactly zero.
 *
 * Each amount is rounded to cents (half to even) before subtraction. A
 * residue of at most one cent per player, left over from independent
 * rounding, is absorbed by the balance with the largest magnitude (ties go
 * to the lexicographically smallest user id). Anything larger is rejected.
 */
class BalanceNormalizer {
public:
    /**
     * @return one balance per record, in input order
     * @throws InvalidRecordError for a negative, non-finite, unnamed or duplicate record
     * @throws UnbalancedLedgerError if the residue exceeds the rounding tolerance
     */
    static std::vector<NetBalance> normalize(const std::vector<PlayerRecord>& records);

    /**
     * Largest residue (in cents) that is corrected instead of rejected.
     */
    static Cents tolerance(size_t player_count) { return static_cast<Cents>(player_count); }
};

} // namespace chipledger
