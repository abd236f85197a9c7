// tests/application/BalanceServiceTest.cpp
/**
 * @file BalanceServiceTest.cpp
 * @brief Чтение баланса, истории, баланс на момент времени, сверка
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "application/BalanceService.hpp"
#include "application/TransactionService.hpp"
#include "adapters/secondary/persistence/InMemoryLedgerStore.hpp"
#include "mocks/FakeClock.hpp"
#include "mocks/MockLedgerStore.hpp"

using namespace ledger;
using namespace ledger::domain;
using ledger::settings::LedgerSettings;
using ::testing::Return;

// ============================================================================
// Test Fixture
// ============================================================================

class BalanceServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_ = std::make_shared<LedgerSettings>();
        store_ = std::make_shared<adapters::secondary::InMemoryLedgerStore>(clock_.asFunction());
        transactions_ = std::make_shared<application::TransactionService>(
            store_,
            std::make_shared<application::AccountGuard>(settings_),
            std::make_shared<application::BalanceWriter>(settings_),
            settings_);
        service_ = std::make_shared<application::BalanceService>(store_, settings_);
    }

    tests::FakeClock clock_;
    std::shared_ptr<LedgerSettings> settings_;
    std::shared_ptr<adapters::secondary::InMemoryLedgerStore> store_;
    std::shared_ptr<application::TransactionService> transactions_;
    std::shared_ptr<application::BalanceService> service_;
};

// ============================================================================
// GetBalance
// ============================================================================

TEST_F(BalanceServiceTest, GetBalance_UnknownAccount_ReturnsZeroAndPersists) {
    auto balance = service_->getBalance(42);

    EXPECT_EQ(balance.accountId, 42);
    EXPECT_TRUE(balance.amount.isZero());
    ASSERT_TRUE(store_->findBalance(42).has_value());
    EXPECT_EQ(store_->listAccountIds(), (std::vector<AccountId>{42}));
}

TEST_F(BalanceServiceTest, GetBalance_AfterCredit) {
    transactions_->credit({1, Money::fromString("10.10")});
    EXPECT_EQ(service_->getBalance(1).amount, Money::fromString("10.10"));
}

TEST_F(BalanceServiceTest, InvalidAccountId_Throws) {
    EXPECT_THROW(service_->getBalance(0), ValidationError);
    EXPECT_THROW(service_->getHistory(-1, 10, 0), ValidationError);
    EXPECT_THROW(service_->getBalanceAtTime(0, clock_.now()), ValidationError);
    EXPECT_THROW(service_->reconcile(0), ValidationError);
}

// ============================================================================
// История
// ============================================================================

TEST_F(BalanceServiceTest, GetHistory_NewestFirst) {
    transactions_->credit({1, Money::fromUnits(100)});
    clock_.advance(std::chrono::seconds(1));
    transactions_->debit({1, Money::fromUnits(30)});

    auto history = service_->getHistory(1, 10, 0);
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].changeAmount, Money::fromUnits(-30));
    EXPECT_EQ(history[0].resultingBalance, Money::fromUnits(70));
    EXPECT_EQ(history[1].changeAmount, Money::fromUnits(100));
}

TEST(BalanceServiceLimitTest, GetHistory_ZeroLimitUsesDefaultAndLargeIsClamped) {
    auto settings = std::make_shared<LedgerSettings>();
    auto store = std::make_shared<::testing::StrictMock<tests::MockLedgerStore>>();
    application::BalanceService service(store, settings);

    EXPECT_CALL(*store, findHistory(7, LedgerSettings::kDefaultPageLimit, 0))
        .WillOnce(Return(std::vector<BalanceHistoryEntry>{}));
    EXPECT_CALL(*store, findHistory(7, LedgerSettings::kMaxPageLimit, 20))
        .WillOnce(Return(std::vector<BalanceHistoryEntry>{}));

    service.getHistory(7, 0, 0);
    service.getHistory(7, 100000, 20);
}

// ============================================================================
// Баланс на момент времени
// ============================================================================

TEST_F(BalanceServiceTest, GetBalanceAtTime_ReturnsLatestEntryNotAfterT) {
    auto t1 = clock_.now();
    transactions_->credit({1, Money::fromUnits(100)});

    clock_.advance(std::chrono::seconds(10));
    auto t2 = clock_.now();
    transactions_->debit({1, Money::fromUnits(40)});

    clock_.advance(std::chrono::seconds(10));
    auto t3 = clock_.now();
    transactions_->credit({1, Money::fromUnits(5)});

    EXPECT_TRUE(service_->getBalanceAtTime(1, t1 + std::chrono::microseconds(-1)).isZero());
    EXPECT_EQ(service_->getBalanceAtTime(1, t1), Money::fromUnits(100));
    EXPECT_EQ(service_->getBalanceAtTime(1, t1 + std::chrono::seconds(5)), Money::fromUnits(100));
    EXPECT_EQ(service_->getBalanceAtTime(1, t2), Money::fromUnits(60));
    EXPECT_EQ(service_->getBalanceAtTime(1, t3), Money::fromUnits(65));
    EXPECT_EQ(service_->getBalanceAtTime(1, t3 + std::chrono::seconds(3600)), Money::fromUnits(65));
}

TEST_F(BalanceServiceTest, GetBalanceAtTime_NoHistory_Zero) {
    EXPECT_TRUE(service_->getBalanceAtTime(99, clock_.now()).isZero());
}

// ============================================================================
// Сверка
// ============================================================================

TEST_F(BalanceServiceTest, Reconcile_ConsistentAfterNormalOperations) {
    transactions_->credit({1, Money::fromUnits(100)});
    transactions_->transfer({1, 2, Money::fromUnits(25)});
    auto debit = transactions_->debit({1, Money::fromUnits(5)});
    transactions_->rollback(debit.id);

    for (AccountId id : {1, 2}) {
        auto report = service_->reconcile(id);
        EXPECT_TRUE(report.isConsistent()) << "account " << id;
        EXPECT_TRUE(report.drift().isZero());
    }
    EXPECT_EQ(service_->calculateBalanceFromHistory(1), Money::fromUnits(75));
    EXPECT_EQ(service_->calculateBalanceFromHistory(2), Money::fromUnits(25));
}

TEST(BalanceServiceReconcileTest, Reconcile_ReportsDriftWithoutThrowing) {
    auto settings = std::make_shared<LedgerSettings>();
    auto store = std::make_shared<::testing::NiceMock<tests::MockLedgerStore>>();
    application::BalanceService service(store, settings);

    EXPECT_CALL(*store, createBalanceIfAbsent(3))
        .WillOnce(Return(Balance(3, Money::fromUnits(150))));
    EXPECT_CALL(*store, sumHistoryChanges(3))
        .WillOnce(Return(Money::fromUnits(100)));

    auto report = service.reconcile(3);

    EXPECT_EQ(report.accountId, 3);
    EXPECT_FALSE(report.isConsistent());
    EXPECT_EQ(report.drift(), Money::fromUnits(50));
}
