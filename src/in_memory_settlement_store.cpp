#include "chipledger/settlement_store.hpp"
#include "chipledger/errors.hpp"

namespace chipledger {

ClaimResult InMemorySettlementStore::try_claim(const std::string& game_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& current = statuses_[game_id];
    switch (current) {
        case SettlementStatus::Settled:
            return ClaimResult::AlreadySettled;
        case SettlementStatus::Settling:
            return ClaimResult::InProgress;
        case SettlementStatus::Unsettled:
            current = SettlementStatus::Settling;
            return ClaimResult::Claimed;
    }
    return ClaimResult::InProgress;
}

std::optional<Settlement> InMemorySettlementStore::wait_until_resolved(
    const std::string& game_id, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto is_settling = [&] {
        auto it = statuses_.find(game_id);
        return it != statuses_.end() && it->second == SettlementStatus::Settling;
    };

    if (!resolved_.wait_for(lock, timeout, [&] { return !is_settling(); })) {
        throw ConcurrentSettlementError(
            "Timed out waiting for in-progress settlement of game " + game_id);
    }

    auto it = settlements_.find(game_id);
    if (it == settlements_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemorySettlementStore::commit(const Settlement& settlement) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto status_it = statuses_.find(settlement.game_id);
        if (status_it == statuses_.end() || status_it->second != SettlementStatus::Settling) {
            throw StorageError("Game " + settlement.game_id + " is not being settled");
        }
        if (settlements_.count(settlement.game_id) > 0) {
            throw StorageError("Settlement for game " + settlement.game_id + " already exists");
        }
        for (const auto& payment : settlement.payments) {
            if (payment_index_.count(payment.ledger_id) > 0) {
                throw StorageError("Duplicate ledger id " + payment.ledger_id);
            }
        }

        for (size_t i = 0; i < settlement.payments.size(); ++i) {
            payment_index_[settlement.payments[i].ledger_id] = {settlement.game_id, i};
        }
        settlements_.emplace(settlement.game_id, settlement);
        commit_order_.push_back(settlement.game_id);
        status_it->second = SettlementStatus::Settled;
    }
    resolved_.notify_all();
}

void InMemorySettlementStore::release(const std::string& game_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = statuses_.find(game_id);
        if (it == statuses_.end() || it->second != SettlementStatus::Settling) {
            return;
        }
        it->second = SettlementStatus::Unsettled;
    }
    resolved_.notify_all();
}

SettlementStatus InMemorySettlementStore::status(const std::string& game_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = statuses_.find(game_id);
    return it == statuses_.end() ? SettlementStatus::Unsettled : it->second;
}

std::optional<Settlement> InMemorySettlementStore::find(const std::string& game_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = settlements_.find(game_id);
    if (it == settlements_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<SettlementPayment> InMemorySettlementStore::find_payment(
    const std::string& ledger_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = payment_index_.find(ledger_id);
    if (it == payment_index_.end()) {
        return std::nullopt;
    }
    return settlements_.at(it->second.game_id).payments.at(it->second.index);
}

void InMemorySettlementStore::update_payment(const SettlementPayment& payment) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = payment_index_.find(payment.ledger_id);
    if (it == payment_index_.end()) {
        throw NotFoundError("Ledger entry not found: " + payment.ledger_id);
    }
    auto& stored = settlements_.at(it->second.game_id).payments.at(it->second.index);
    stored.status = payment.status;
    stored.paid_at = payment.paid_at;
    stored.is_locked = payment.is_locked;
}

std::vector<SettlementPayment> InMemorySettlementStore::pending_payments_for(
    const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SettlementPayment> result;
    for (const auto& game_id : commit_order_) {
        for (const auto& payment : settlements_.at(game_id).payments) {
            if (payment.status != PaymentStatus::Pending) continue;
            if (payment.from_user == user_id || payment.to_user == user_id) {
                result.push_back(payment);
            }
        }
    }
    return result;
}

} // namespace chipledger
