#pragma once

#include <string>
#include <vector>
#include "types.hpp"

namespace chipledger {

/**
 * Totals of what a user still owes and is owed.
 *
 * Only pending payments in which the user takes part are counted; paid
 * rows and rows of other users are ignored.
 */
BalanceSummary summarize_balances(const std::string& user_id,
                                  const std::vector<SettlementPayment>& payments);

} // namespace chipledger
