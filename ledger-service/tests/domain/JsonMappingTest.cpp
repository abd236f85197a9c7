// tests/domain/JsonMappingTest.cpp
#include <gtest/gtest.h>
#include "domain/JsonMapping.hpp"

using namespace ledger::domain;

TEST(JsonMappingTest, Credit_OmitsSourceAccount) {
    auto tx = Transaction::credit(7, Money::fromString("12.5"));
    tx.id = 42;
    tx.createdAt = Timestamp::fromMicros(1700000000123456);

    auto j = toJson(tx);

    EXPECT_EQ(j["id"], 42);
    EXPECT_FALSE(j.contains("source_account"));
    EXPECT_EQ(j["dest_account"], 7);
    EXPECT_EQ(j["amount"], "12.50");
    EXPECT_EQ(j["type"], "credit");
    EXPECT_EQ(j["status"], "pending");
    EXPECT_EQ(j["created_at"], "2023-11-14T22:13:20.123456Z");
}

TEST(JsonMappingTest, Transfer_HasBothAccounts) {
    auto tx = Transaction::transfer(1, 2, Money::fromUnits(3));
    tx.status = TransactionStatus::ROLLED_BACK;

    auto j = toJson(tx);

    EXPECT_EQ(j["source_account"], 1);
    EXPECT_EQ(j["dest_account"], 2);
    EXPECT_EQ(j["status"], "rolled_back");
}

TEST(JsonMappingTest, HistoryEntry_SignedChangeAndOptionalTransaction) {
    BalanceHistoryEntry entry;
    entry.id = 5;
    entry.accountId = 9;
    entry.resultingBalance = Money::fromUnits(70);
    entry.changeAmount = Money::fromUnits(-30);

    auto j = toJson(entry);
    EXPECT_EQ(j["account_id"], 9);
    EXPECT_EQ(j["balance"], "70.00");
    EXPECT_EQ(j["change_amount"], "-30.00");
    EXPECT_FALSE(j.contains("transaction_id"));

    entry.transactionId = 11;
    EXPECT_EQ(toJson(entry)["transaction_id"], 11);
}

TEST(JsonMappingTest, ReconciliationReport_IncludesDrift) {
    ReconciliationReport report;
    report.accountId = 3;
    report.storedBalance = Money::fromUnits(100);
    report.historyBalance = Money::fromUnits(80);

    auto reports = toJsonArray(std::vector<ReconciliationReport>{report});

    ASSERT_TRUE(reports.is_array());
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0]["drift"], "20.00");
    EXPECT_EQ(reports[0]["consistent"], false);
}

TEST(JsonMappingTest, Balance_Keys) {
    Balance balance(4, Money::fromString("0.07"), Timestamp::fromSeconds(0));
    auto j = toJson(balance);
    EXPECT_EQ(j["account_id"], 4);
    EXPECT_EQ(j["amount"], "0.07");
    EXPECT_EQ(j["last_updated_at"], "1970-01-01T00:00:00.000000Z");
}
