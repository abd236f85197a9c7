// tests/mocks/FaultInjectingLedgerStore.hpp
#pragma once

#include "ports/output/ILedgerStore.hpp"
#include "domain/LedgerErrors.hpp"
#include <atomic>
#include <memory>
#include <optional>

namespace ledger::tests {

/**
 * @brief Декоратор хранилища, который умеет падать по заказу
 *
 * Сбои внедряются в единицы работы, созданные после настройки:
 * - failHistoryAppend:      appendHistory бросает StorageError
 * - failWriteForAccount:    writeBalance для указанного счёта бросает StorageError
 * - failStatusUpdate:       updateTransactionStatus бросает StorageError
 * - failCommit:             commit бросает StorageError (изменения не применяются)
 */
class FaultInjectingLedgerStore : public ports::output::ILedgerStore {
public:
    explicit FaultInjectingLedgerStore(std::shared_ptr<ports::output::ILedgerStore> inner)
        : inner_(std::move(inner)) {}

    std::atomic<bool> failHistoryAppend{false};
    std::atomic<domain::AccountId> failWriteForAccount{0};
    std::atomic<bool> failStatusUpdate{false};
    std::atomic<bool> failCommit{false};
    std::atomic<int> beginCount{0};

    std::unique_ptr<ports::output::ILedgerUnitOfWork> begin() override {
        ++beginCount;
        return std::make_unique<Unit>(*this, inner_->begin());
    }

    std::optional<domain::Balance> findBalance(domain::AccountId accountId) override {
        return inner_->findBalance(accountId);
    }

    domain::Balance createBalanceIfAbsent(domain::AccountId accountId) override {
        return inner_->createBalanceIfAbsent(accountId);
    }

    std::vector<domain::AccountId> listAccountIds() override {
        return inner_->listAccountIds();
    }

    std::vector<domain::BalanceHistoryEntry> findHistory(
        domain::AccountId accountId, std::size_t limit, std::size_t offset) override {
        return inner_->findHistory(accountId, limit, offset);
    }

    std::optional<domain::BalanceHistoryEntry> findLatestHistoryAt(
        domain::AccountId accountId, const domain::Timestamp& at) override {
        return inner_->findLatestHistoryAt(accountId, at);
    }

    domain::Money sumHistoryChanges(domain::AccountId accountId) override {
        return inner_->sumHistoryChanges(accountId);
    }

    std::optional<domain::Transaction> findTransaction(domain::TransactionId transactionId) override {
        return inner_->findTransaction(transactionId);
    }

    std::vector<domain::Transaction> findTransactionsByAccount(
        domain::AccountId accountId, std::size_t limit, std::size_t offset) override {
        return inner_->findTransactionsByAccount(accountId, limit, offset);
    }

private:
    class Unit : public ports::output::ILedgerUnitOfWork {
    public:
        Unit(FaultInjectingLedgerStore& owner, std::unique_ptr<ports::output::ILedgerUnitOfWork> inner)
            : owner_(owner), inner_(std::move(inner)) {}

        ports::output::LockedBalance lockBalance(domain::AccountId accountId) override {
            return inner_->lockBalance(accountId);
        }

        domain::Balance writeBalance(domain::AccountId accountId, const domain::Money& amount) override {
            if (owner_.failWriteForAccount == accountId) {
                throw domain::StorageError("injected writeBalance failure for account " + std::to_string(accountId));
            }
            return inner_->writeBalance(accountId, amount);
        }

        domain::HistoryEntryId appendHistory(const domain::BalanceHistoryEntry& entry) override {
            if (owner_.failHistoryAppend) {
                throw domain::StorageError("injected appendHistory failure");
            }
            return inner_->appendHistory(entry);
        }

        domain::Transaction insertTransaction(const domain::Transaction& transaction) override {
            return inner_->insertTransaction(transaction);
        }

        std::optional<domain::Transaction> lockTransaction(domain::TransactionId transactionId) override {
            return inner_->lockTransaction(transactionId);
        }

        void updateTransactionStatus(domain::TransactionId transactionId, domain::TransactionStatus status) override {
            if (owner_.failStatusUpdate) {
                throw domain::StorageError("injected updateTransactionStatus failure");
            }
            inner_->updateTransactionStatus(transactionId, status);
        }

        void commit() override {
            if (owner_.failCommit) {
                throw domain::StorageError("injected commit failure");
            }
            inner_->commit();
        }

        void rollback() override { inner_->rollback(); }

        bool isCommitted() const override { return inner_->isCommitted(); }

    private:
        FaultInjectingLedgerStore& owner_;
        std::unique_ptr<ports::output::ILedgerUnitOfWork> inner_;
    };

    std::shared_ptr<ports::output::ILedgerStore> inner_;
};

} // namespace ledger::tests
