#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include "config.hpp"
#include "settlement_store.hpp"
#include "types.hpp"

namespace chipledger {

/**
 * Result of a settle call.
 *
 * already_settled is true when this caller did not compute the settlement
 * and received the stored one instead (a repeated or concurrent call).
 */
struct SettleResult {
    Settlement settlement;
    bool already_settled = false;
};

/**
 * Exactly-once "settle this game" operation over a SettlementStore.
 *
 * Safe to call concurrently for the same game: only the caller that wins the
 * unsettled -> settling claim normalizes, minimizes and commits. Others wait
 * for the committed result, or retry the claim if the winner failed.
 *
 * Example:
 *   SettlementCoordinator coordinator(std::make_shared<InMemorySettlementStore>());
 *   auto result = coordinator.settle("game_1", "group_1", records);
 *   for (const auto& p : result.settlement.payments) { ... }
 */
class SettlementCoordinator {
public:
    explicit SettlementCoordinator(
        std::shared_ptr<SettlementStore> store,
        std::chrono::milliseconds settle_wait = std::chrono::milliseconds(DEFAULT_SETTLE_WAIT_MS));

    /**
     * Settle a finished game from its player records.
     *
     * @throws InvalidRecordError / UnbalancedLedgerError from normalization;
     *         the game is left unsettled so a corrected retry can succeed
     * @throws ConcurrentSettlementError if the transition or the write fails
     */
    SettleResult settle(const std::string& game_id,
                        const std::string& group_id,
                        const std::vector<PlayerRecord>& records);

    /**
     * @throws NotFoundError if the game has not been settled
     */
    Settlement get_settlement(const std::string& game_id) const;

    /**
     * Flip a payment between pending and paid on behalf of its payer or payee.
     * The first change locks the entry.
     *
     * @throws NotFoundError for an unknown ledger id
     * @throws PermissionDeniedError if acting_user is neither payer nor payee
     */
    SettlementPayment mark_paid(const std::string& ledger_id,
                                const std::string& acting_user,
                                bool paid);

    /**
     * Outstanding balance summary of a user across all settled games.
     */
    BalanceSummary balances(const std::string& user_id) const;

private:
    Settlement compute_and_commit(const std::string& game_id,
                                  const std::string& group_id,
                                  const std::vector<PlayerRecord>& records);

    std::shared_ptr<SettlementStore> store_;
    std::chrono::milliseconds settle_wait_;
};

} // namespace chipledger
