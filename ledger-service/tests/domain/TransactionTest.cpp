// tests/domain/TransactionTest.cpp
#include <gtest/gtest.h>
#include "domain/Transaction.hpp"

using namespace ledger::domain;

// ============================================================================
// Форма записи
// ============================================================================

TEST(TransactionTest, Factories_ProduceValidShapes) {
    auto credit = Transaction::credit(1, Money::fromUnits(10));
    EXPECT_TRUE(credit.hasValidShape());
    EXPECT_FALSE(credit.sourceAccount.has_value());
    EXPECT_EQ(credit.destAccount.value(), 1);
    EXPECT_EQ(credit.status, TransactionStatus::PENDING);

    auto debit = Transaction::debit(2, Money::fromUnits(10));
    EXPECT_TRUE(debit.hasValidShape());
    EXPECT_EQ(debit.sourceAccount.value(), 2);
    EXPECT_FALSE(debit.destAccount.has_value());

    auto transfer = Transaction::transfer(1, 2, Money::fromUnits(10));
    EXPECT_TRUE(transfer.hasValidShape());
    EXPECT_EQ(transfer.involvedAccounts(), (std::vector<AccountId>{1, 2}));
}

TEST(TransactionTest, InvalidShapes) {
    EXPECT_FALSE(Transaction::transfer(1, 1, Money::fromUnits(10)).hasValidShape());
    EXPECT_FALSE(Transaction::credit(1, Money::zero()).hasValidShape());

    auto broken = Transaction::debit(1, Money::fromUnits(1));
    broken.destAccount = 2;
    EXPECT_FALSE(broken.hasValidShape());
}

// ============================================================================
// Машина состояний
// ============================================================================

TEST(TransactionTest, StatusMachine_LegalPath) {
    auto tx = Transaction::credit(1, Money::fromUnits(5));
    tx.transitionTo(TransactionStatus::COMPLETED);
    EXPECT_EQ(tx.status, TransactionStatus::COMPLETED);
    tx.transitionTo(TransactionStatus::ROLLED_BACK);
    EXPECT_EQ(tx.status, TransactionStatus::ROLLED_BACK);
    EXPECT_TRUE(isFinalStatus(tx.status));
}

TEST(TransactionTest, StatusMachine_PendingCannotBeRolledBack) {
    auto tx = Transaction::credit(1, Money::fromUnits(5));
    EXPECT_THROW(tx.transitionTo(TransactionStatus::ROLLED_BACK), InvalidStateTransitionError);
    EXPECT_EQ(tx.status, TransactionStatus::PENDING);
}

TEST(TransactionTest, StatusMachine_CompletedCannotReturnToPending) {
    auto tx = Transaction::credit(1, Money::fromUnits(5));
    tx.transitionTo(TransactionStatus::COMPLETED);
    EXPECT_THROW(tx.transitionTo(TransactionStatus::PENDING), InvalidStateTransitionError);
    EXPECT_THROW(tx.transitionTo(TransactionStatus::COMPLETED), InvalidStateTransitionError);
}

TEST(TransactionTest, StatusMachine_RolledBackIsTerminal) {
    auto tx = Transaction::credit(1, Money::fromUnits(5));
    tx.id = 77;
    tx.transitionTo(TransactionStatus::COMPLETED);
    tx.transitionTo(TransactionStatus::ROLLED_BACK);

    try {
        tx.transitionTo(TransactionStatus::ROLLED_BACK);
        FAIL() << "expected AlreadyRolledBackError";
    } catch (const AlreadyRolledBackError& e) {
        EXPECT_EQ(e.code(), ErrorCode::ALREADY_ROLLED_BACK);
    }

    // AlreadyRolledBack - частный случай недопустимого перехода
    EXPECT_THROW(tx.transitionTo(TransactionStatus::COMPLETED), InvalidStateTransitionError);
}

// ============================================================================
// Компенсации
// ============================================================================

TEST(TransactionTest, CompensatingDeltas_Credit) {
    auto deltas = Transaction::credit(3, Money::fromUnits(40)).compensatingDeltas();
    ASSERT_EQ(deltas.size(), 1u);
    EXPECT_EQ(deltas[0].accountId, 3);
    EXPECT_EQ(deltas[0].delta, Money::fromUnits(-40));
}

TEST(TransactionTest, CompensatingDeltas_Debit) {
    auto deltas = Transaction::debit(4, Money::fromUnits(15)).compensatingDeltas();
    ASSERT_EQ(deltas.size(), 1u);
    EXPECT_EQ(deltas[0].accountId, 4);
    EXPECT_EQ(deltas[0].delta, Money::fromUnits(15));
}

TEST(TransactionTest, CompensatingDeltas_TransferCreditsSourceFirst) {
    auto deltas = Transaction::transfer(1, 2, Money::fromUnits(30)).compensatingDeltas();
    ASSERT_EQ(deltas.size(), 2u);
    EXPECT_EQ(deltas[0].accountId, 1);
    EXPECT_EQ(deltas[0].delta, Money::fromUnits(30));
    EXPECT_EQ(deltas[1].accountId, 2);
    EXPECT_EQ(deltas[1].delta, Money::fromUnits(-30));
}

// ============================================================================
// Строковые представления
// ============================================================================

TEST(TransactionTest, EnumStrings_ParseBack) {
    EXPECT_EQ(parseTransactionType(toString(TransactionType::TRANSFER)), TransactionType::TRANSFER);
    EXPECT_EQ(parseTransactionStatus("rolled_back"), TransactionStatus::ROLLED_BACK);
    EXPECT_THROW(parseTransactionType("refund"), std::invalid_argument);
    EXPECT_THROW(parseTransactionStatus("failed"), std::invalid_argument);
}
