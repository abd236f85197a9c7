// tests/application/ReconciliationJobTest.cpp
#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "application/ReconciliationJob.hpp"
#include "mocks/MockLedgerStore.hpp"
#include <chrono>
#include <thread>

using namespace ledger;
using namespace ledger::domain;
using ::testing::_;
using ::testing::AtLeast;
using ::testing::Return;
using ::testing::Throw;

// ============================================================================
// Mock
// ============================================================================

class MockBalanceService : public ports::input::IBalanceService {
public:
    MOCK_METHOD(Balance, getBalance, (AccountId), (override));
    MOCK_METHOD(std::vector<BalanceHistoryEntry>, getHistory, (AccountId, std::size_t, std::size_t), (override));
    MOCK_METHOD(Money, getBalanceAtTime, (AccountId, const Timestamp&), (override));
    MOCK_METHOD(Money, calculateBalanceFromHistory, (AccountId), (override));
    MOCK_METHOD(ReconciliationReport, reconcile, (AccountId), (override));
};

// ============================================================================
// Test Fixture
// ============================================================================

class ReconciliationJobTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<::testing::NiceMock<tests::MockLedgerStore>>();
        balances_ = std::make_shared<::testing::NiceMock<MockBalanceService>>();
        job_ = std::make_unique<application::ReconciliationJob>(store_, balances_);
    }

    static ReconciliationReport report(AccountId accountId, int64_t stored, int64_t history) {
        ReconciliationReport r;
        r.accountId = accountId;
        r.storedBalance = Money::fromUnits(stored);
        r.historyBalance = Money::fromUnits(history);
        return r;
    }

    std::shared_ptr<::testing::NiceMock<tests::MockLedgerStore>> store_;
    std::shared_ptr<::testing::NiceMock<MockBalanceService>> balances_;
    std::unique_ptr<application::ReconciliationJob> job_;
};

// ============================================================================
// ТЕСТЫ
// ============================================================================

TEST_F(ReconciliationJobTest, RunOnce_ReturnsOnlyMismatches) {
    EXPECT_CALL(*store_, listAccountIds()).WillOnce(Return(std::vector<AccountId>{1, 2, 3}));
    EXPECT_CALL(*balances_, reconcile(1)).WillOnce(Return(report(1, 10, 10)));
    EXPECT_CALL(*balances_, reconcile(2)).WillOnce(Return(report(2, 50, 20)));
    EXPECT_CALL(*balances_, reconcile(3)).WillOnce(Return(report(3, 0, 0)));

    auto mismatches = job_->runOnce();

    ASSERT_EQ(mismatches.size(), 1u);
    EXPECT_EQ(mismatches[0].accountId, 2);
    EXPECT_EQ(mismatches[0].drift(), Money::fromUnits(30));
    EXPECT_EQ(job_->getRunCount(), 1u);
}

TEST_F(ReconciliationJobTest, RunOnce_FailingAccountDoesNotStopScan) {
    EXPECT_CALL(*store_, listAccountIds()).WillOnce(Return(std::vector<AccountId>{1, 2}));
    EXPECT_CALL(*balances_, reconcile(1)).WillOnce(Throw(StorageError("connection reset")));
    EXPECT_CALL(*balances_, reconcile(2)).WillOnce(Return(report(2, 7, 5)));

    auto mismatches = job_->runOnce();

    ASSERT_EQ(mismatches.size(), 1u);
    EXPECT_EQ(mismatches[0].accountId, 2);
}

TEST_F(ReconciliationJobTest, RunOnce_NoAccounts_Empty) {
    EXPECT_CALL(*store_, listAccountIds()).WillOnce(Return(std::vector<AccountId>{}));
    EXPECT_CALL(*balances_, reconcile(_)).Times(0);

    EXPECT_TRUE(job_->runOnce().empty());
}

TEST_F(ReconciliationJobTest, StartStop_RunsPeriodically) {
    EXPECT_CALL(*store_, listAccountIds()).Times(AtLeast(2))
        .WillRepeatedly(Return(std::vector<AccountId>{}));

    job_->start(std::chrono::milliseconds(10));
    EXPECT_TRUE(job_->isRunning());

    for (int i = 0; i < 200 && job_->getRunCount() < 2; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    job_->stop();

    EXPECT_FALSE(job_->isRunning());
    EXPECT_GE(job_->getRunCount(), 2u);
}

TEST_F(ReconciliationJobTest, Stop_WakesUpLongInterval) {
    EXPECT_CALL(*store_, listAccountIds()).WillRepeatedly(Return(std::vector<AccountId>{}));

    job_->start(std::chrono::hours(1));
    for (int i = 0; i < 200 && job_->getRunCount() < 1; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    auto started = std::chrono::steady_clock::now();
    job_->stop();
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
    EXPECT_EQ(job_->getRunCount(), 1u);
}
