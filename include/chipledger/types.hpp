#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chipledger {

using Cents = int64_t;
using Clock = std::chrono::system_clock;

/**
 * One participant's totals for a finished game, as entered in currency units.
 */
struct PlayerRecord {
    std::string user_id;
    double total_buy_in = 0.0;
    double cash_out = 0.0;
};

/**
 * Net result of one player in integer cents.
 * Positive means the player is owed money, negative means they owe.
 */
struct NetBalance {
    std::string user_id;
    Cents amount = 0;

    bool operator==(const NetBalance& other) const {
        return user_id == other.user_id && amount == other.amount;
    }
};

enum class PaymentStatus {
    Pending,
    Paid
};

enum class SettlementStatus {
    Unsettled,
    Settling,
    Settled
};

/**
 * A single point-to-point transfer, from a debtor to a creditor.
 */
struct SettlementPayment {
    std::string ledger_id;
    std::string game_id;
    std::string group_id;
    std::string from_user;
    std::string to_user;
    Cents amount = 0;
    PaymentStatus status = PaymentStatus::Pending;
    Clock::time_point created_at{};
    std::optional<Clock::time_point> paid_at;
    bool is_locked = false;
};

/**
 * The settled ledger of one game.
 */
struct Settlement {
    std::string game_id;
    std::string group_id;
    SettlementStatus status = SettlementStatus::Unsettled;
    std::vector<SettlementPayment> payments;
    Clock::time_point settled_at{};
};

/**
 * Outstanding (pending) payments of one user across all settled games.
 */
struct BalanceSummary {
    std::string user_id;
    Cents total_owes = 0;
    Cents total_owed = 0;
    Cents net_balance = 0;
    std::vector<SettlementPayment> owes;
    std::vector<SettlementPayment> owed;
};

const char* to_string(PaymentStatus status);
const char* to_string(SettlementStatus status);

} // namespace chipledger
