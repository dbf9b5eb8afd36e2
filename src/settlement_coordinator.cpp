#include "chipledger/settlement_coordinator.hpp"
#include "chipledger/balance_normalizer.hpp"
#include "chipledger/debt_minimizer.hpp"
#include "chipledger/errors.hpp"
#include "chipledger/helpers.hpp"
#include "chipledger/ledger_summary.hpp"
#include "chipledger/logging.hpp"
#include "chipledger/validation.hpp"

namespace chipledger {

namespace {

constexpr const char* LOG_DOMAIN = "settlement";

/// Releases a claimed game back to unsettled unless the settlement was committed.
class ClaimGuard {
public:
    ClaimGuard(SettlementStore& store, std::string game_id)
        : store_(store), game_id_(std::move(game_id)) {}

    ClaimGuard(const ClaimGuard&) = delete;
    ClaimGuard& operator=(const ClaimGuard&) = delete;

    ~ClaimGuard() {
        if (committed_) return;
        try {
            store_.release(game_id_);
            log_info(LOG_DOMAIN, "claim_released", {{"game_id", game_id_}});
        } catch (const std::exception& e) {
            log_error(LOG_DOMAIN, "claim_release_failed",
                {{"game_id", game_id_}, {"error", e.what()}});
        }
    }

    void mark_committed() { committed_ = true; }

private:
    SettlementStore& store_;
    std::string game_id_;
    bool committed_ = false;
};

ClaimResult claim(SettlementStore& store, const std::string& game_id) {
    try {
        return store.try_claim(game_id);
    } catch (const StorageError& e) {
        throw ConcurrentSettlementError(
            "Could not claim game " + game_id + " for settlement: " + e.what());
    }
}

} // anonymous namespace

SettlementCoordinator::SettlementCoordinator(std::shared_ptr<SettlementStore> store,
                                             std::chrono::milliseconds settle_wait)
    : store_(std::move(store)), settle_wait_(settle_wait) {}

SettleResult SettlementCoordinator::settle(const std::string& game_id,
                                           const std::string& group_id,
                                           const std::vector<PlayerRecord>& records) {
    validation::require_not_empty(game_id, "game_id");

    while (true) {
        switch (claim(*store_, game_id)) {
            case ClaimResult::Claimed:
                return {compute_and_commit(game_id, group_id, records), false};

            case ClaimResult::AlreadySettled: {
                auto existing = store_->find(game_id);
                if (!existing) {
                    throw ConcurrentSettlementError(
                        "Game " + game_id + " is settled but its settlement is missing");
                }
                log_info(LOG_DOMAIN, "already_settled", {{"game_id", game_id}});
                return {*existing, true};
            }

            case ClaimResult::InProgress: {
                log_info(LOG_DOMAIN, "waiting_for_settlement", {{"game_id", game_id}});
                auto resolved = store_->wait_until_resolved(game_id, settle_wait_);
                if (resolved) {
                    return {*resolved, true};
                }
                // The other attempt failed and released its claim.
                break;
            }
        }
    }
}

Settlement SettlementCoordinator::compute_and_commit(const std::string& game_id,
                                                     const std::string& group_id,
                                                     const std::vector<PlayerRecord>& records) {
    ClaimGuard guard(*store_, game_id);
    log_info(LOG_DOMAIN, "settling_game",
        {{"game_id", game_id}, {"players", records.size()}});

    Settlement settlement;
    try {
        auto balances = BalanceNormalizer::normalize(records);
        auto payments = DebtMinimizer::minimize(balances);

        auto now = helpers::now();
        settlement.game_id = game_id;
        settlement.group_id = group_id;
        settlement.status = SettlementStatus::Settled;
        settlement.settled_at = now;
        for (auto& payment : payments) {
            payment.ledger_id = helpers::generate_ledger_id();
            payment.game_id = game_id;
            payment.group_id = group_id;
            payment.status = PaymentStatus::Pending;
            payment.created_at = now;
        }
        settlement.payments = std::move(payments);
    } catch (const SettlementError& e) {
        log_warn(LOG_DOMAIN, "settlement_rejected",
            {{"game_id", game_id}, {"error", e.what()}});
        throw;
    }

    try {
        store_->commit(settlement);
    } catch (const StorageError& e) {
        log_error(LOG_DOMAIN, "settlement_commit_failed",
            {{"game_id", game_id}, {"error", e.what()}});
        throw ConcurrentSettlementError(
            "Failed to persist settlement for game " + game_id + ": " + e.what());
    }
    guard.mark_committed();

    log_info(LOG_DOMAIN, "game_settled",
        {{"game_id", game_id}, {"payments", settlement.payments.size()}});
    return settlement;
}

Settlement SettlementCoordinator::get_settlement(const std::string& game_id) const {
    auto settlement = store_->find(game_id);
    if (!settlement) {
        throw NotFoundError("No settlement for game " + game_id);
    }
    return *settlement;
}

SettlementPayment SettlementCoordinator::mark_paid(const std::string& ledger_id,
                                                   const std::string& acting_user,
                                                   bool paid) {
    auto payment = store_->find_payment(ledger_id);
    if (!payment) {
        throw NotFoundError("Ledger entry not found: " + ledger_id);
    }
    if (acting_user != payment->from_user && acting_user != payment->to_user) {
        throw PermissionDeniedError(
            "Only the payer or payee can update ledger entry " + ledger_id);
    }

    payment->status = paid ? PaymentStatus::Paid : PaymentStatus::Pending;
    if (paid) {
        payment->paid_at = helpers::now();
    } else {
        payment->paid_at.reset();
    }
    payment->is_locked = true;
    store_->update_payment(*payment);

    log_info(LOG_DOMAIN, "payment_status_updated",
        {{"ledger_id", ledger_id}, {"status", to_string(payment->status)},
         {"by", acting_user}});
    return *payment;
}

BalanceSummary SettlementCoordinator::balances(const std::string& user_id) const {
    return summarize_balances(user_id, store_->pending_payments_for(user_id));
}

} // namespace chipledger
