#include <gtest/gtest.h>
#include "chipledger/ledger_summary.hpp"

using namespace chipledger;

namespace {

SettlementPayment payment(const std::string& from, const std::string& to, Cents amount,
                          PaymentStatus status = PaymentStatus::Pending) {
    SettlementPayment p;
    p.ledger_id = "led_" + from + "_" + to;
    p.from_user = from;
    p.to_user = to;
    p.amount = amount;
    p.status = status;
    return p;
}

} // anonymous namespace

TEST(LedgerSummaryTest, Summarize_NoPayments_ShouldBeZero) {
    auto summary = summarize_balances("alice", {});
    EXPECT_EQ(summary.user_id, "alice");
    EXPECT_EQ(summary.total_owes, 0);
    EXPECT_EQ(summary.total_owed, 0);
    EXPECT_EQ(summary.net_balance, 0);
}

TEST(LedgerSummaryTest, Summarize_MixedPayments_ShouldSplitOwesAndOwed) {
    // Given alice pays bob, and carol and dave pay alice
    std::vector<SettlementPayment> payments = {
        payment("alice", "bob", 700),
        payment("carol", "alice", 300),
        payment("dave", "alice", 250),
    };

    auto summary = summarize_balances("alice", payments);

    EXPECT_EQ(summary.total_owes, 700);
    EXPECT_EQ(summary.total_owed, 550);
    EXPECT_EQ(summary.net_balance, -150);
    ASSERT_EQ(summary.owes.size(), 1u);
    EXPECT_EQ(summary.owes[0].to_user, "bob");
    EXPECT_EQ(summary.owed.size(), 2u);
}

TEST(LedgerSummaryTest, Summarize_PaidAndUnrelated_ShouldBeIgnored) {
    std::vector<SettlementPayment> payments = {
        payment("alice", "bob", 700, PaymentStatus::Paid),
        payment("carol", "dave", 300),
        payment("bob", "alice", 100),
    };

    auto summary = summarize_balances("alice", payments);

    EXPECT_EQ(summary.total_owes, 0);
    EXPECT_EQ(summary.total_owed, 100);
    EXPECT_EQ(summary.net_balance, 100);
    EXPECT_TRUE(summary.owes.empty());
}
