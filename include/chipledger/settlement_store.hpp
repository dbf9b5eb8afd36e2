#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "types.hpp"

namespace chipledger {

/**
 * Outcome of an attempt to move a game from unsettled to settling.
 */
enum class ClaimResult {
    Claimed,         ///< The caller owns the computation.
    InProgress,      ///< Another caller is computing.
    AlreadySettled   ///< A settlement has been committed.
};

/**
 * Persisted per-game settlement state machine: unsettled -> settling -> settled.
 *
 * Implementations must make try_claim an atomic compare-and-swap (or a
 * unique-constraint insert) and commit a single atomic write of the
 * settlement with all of its payments.
 */
class SettlementStore {
public:
    virtual ~SettlementStore() = default;

    /**
     * Atomically transition the game from unsettled to settling.
     */
    virtual ClaimResult try_claim(const std::string& game_id) = 0;

    /**
     * Block while the game is settling.
     *
     * @return the settlement once committed, or nullopt if the claim was released
     * @throws ConcurrentSettlementError if still settling when the timeout elapses
     */
    virtual std::optional<Settlement> wait_until_resolved(const std::string& game_id,
                                                          std::chrono::milliseconds timeout) = 0;

    /**
     * Persist a settled game and its payments, settling -> settled.
     *
     * @throws StorageError if the write fails; the game stays settling
     */
    virtual void commit(const Settlement& settlement) = 0;

    /**
     * Return a claimed game to unsettled.
     */
    virtual void release(const std::string& game_id) = 0;

    virtual SettlementStatus status(const std::string& game_id) const = 0;

    virtual std::optional<Settlement> find(const std::string& game_id) const = 0;

    virtual std::optional<SettlementPayment> find_payment(const std::string& ledger_id) const = 0;

    /**
     * Overwrite the status fields of an existing payment.
     *
     * @throws NotFoundError if the ledger id is unknown
     */
    virtual void update_payment(const SettlementPayment& payment) = 0;

    /**
     * All pending payments the user pays or receives, in commit order.
     */
    virtual std::vector<SettlementPayment> pending_payments_for(const std::string& user_id) const = 0;
};

/**
 * SettlementStore held in process memory. A mutex guards all state and a
 * condition variable wakes waiters on commit or release.
 */
class InMemorySettlementStore : public SettlementStore {
public:
    ClaimResult try_claim(const std::string& game_id) override;
    std::optional<Settlement> wait_until_resolved(const std::string& game_id,
                                                  std::chrono::milliseconds timeout) override;
    void commit(const Settlement& settlement) override;
    void release(const std::string& game_id) override;
    SettlementStatus status(const std::string& game_id) const override;
    std::optional<Settlement> find(const std::string& game_id) const override;
    std::optional<SettlementPayment> find_payment(const std::string& ledger_id) const override;
    void update_payment(const SettlementPayment& payment) override;
    std::vector<SettlementPayment> pending_payments_for(const std::string& user_id) const override;

private:
    struct PaymentLocation {
        std::string game_id;
        size_t index = 0;
    };

    mutable std::mutex mutex_;
    std::condition_variable resolved_;
    std::unordered_map<std::string, SettlementStatus> statuses_;
    std::unordered_map<std::string, Settlement> settlements_;
    std::unordered_map<std::string, PaymentLocation> payment_index_;
    std::vector<std::string> commit_order_;
};

} // namespace chipledger
