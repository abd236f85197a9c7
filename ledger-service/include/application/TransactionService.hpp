// ledger-service/include/application/TransactionService.hpp
#pragma once

#include "ports/input/ITransactionService.hpp"
#include "ports/output/ILedgerStore.hpp"
#include "application/AccountGuard.hpp"
#include "application/BalanceWriter.hpp"
#include "domain/LedgerErrors.hpp"
#include "settings/LedgerSettings.hpp"
#include <algorithm>
#include <iostream>
#include <memory>

namespace ledger::application {

/**
 * @brief Оркестратор транзакций: credit, debit, transfer, rollback
 *
 * Схема каждой изменяющей операции:
 *   валидация -> guard по счетам -> begin() -> insert tx (PENDING)
 *   -> applyDelta(...) -> tx COMPLETED -> commit() -> guard освобождается
 *
 * Статус транзакции и изменение балансов коммитятся одной единицей работы.
 * Любое исключение после begin() оставляет единицу незакоммиченной,
 * деструктор её откатывает - ни балансы, ни история, ни запись транзакции
 * не меняются.
 */
class TransactionService : public ports::input::ITransactionService {
public:
    TransactionService(
        std::shared_ptr<ports::output::ILedgerStore> store,
        std::shared_ptr<AccountGuard> guard,
        std::shared_ptr<BalanceWriter> writer,
        std::shared_ptr<settings::LedgerSettings> settings
    ) : store_(std::move(store))
      , guard_(std::move(guard))
      , writer_(std::move(writer))
      , settings_(std::move(settings))
    {
        std::cout << "[TransactionService] Created" << std::endl;
    }

    domain::Transaction credit(const domain::CreditRequest& request) override {
        validateAccountId(request.accountId);
        validateAmount(request.amount);

        auto lock = guard_->acquire(request.accountId);
        try {
            auto unit = store_->begin();
            auto tx = unit->insertTransaction(domain::Transaction::credit(request.accountId, request.amount));

            writer_->applyDelta(*unit, request.accountId, request.amount, tx.id);

            complete(*unit, tx);
            unit->commit();

            std::cout << "[TransactionService] Credit completed: tx=" << tx.id
                      << " account=" << request.accountId
                      << " amount=" << request.amount.toString() << std::endl;
            return tx;

        } catch (const domain::LedgerError& e) {
            std::cerr << "[TransactionService] Credit failed for account " << request.accountId
                      << ": " << e.what() << std::endl;
            throw;
        }
    }

    domain::Transaction debit(const domain::DebitRequest& request) override {
        validateAccountId(request.accountId);
        validateAmount(request.amount);

        advisoryPrecheck(request.accountId, request.amount);

        auto lock = guard_->acquire(request.accountId);
        try {
            auto unit = store_->begin();
            auto tx = unit->insertTransaction(domain::Transaction::debit(request.accountId, request.amount));

            // Авторитетная проверка средств - здесь, под блокировкой строки
            writer_->applyDelta(*unit, request.accountId, -request.amount, tx.id);

            complete(*unit, tx);
            unit->commit();

            std::cout << "[TransactionService] Debit completed: tx=" << tx.id
                      << " account=" << request.accountId
                      << " amount=" << request.amount.toString() << std::endl;
            return tx;

        } catch (const domain::LedgerError& e) {
            std::cerr << "[TransactionService] Debit failed for account " << request.accountId
                      << ": " << e.what() << std::endl;
            throw;
        }
    }

    domain::Transaction transfer(const domain::TransferRequest& request) override {
        validateAccountId(request.fromAccountId);
        validateAccountId(request.toAccountId);
        validateAmount(request.amount);
        if (request.fromAccountId == request.toAccountId) {
            throw domain::ValidationError("cannot transfer to the same account");
        }

        advisoryPrecheck(request.fromAccountId, request.amount);

        auto lock = guard_->acquire({request.fromAccountId, request.toAccountId});
        try {
            auto unit = store_->begin();
            auto tx = unit->insertTransaction(domain::Transaction::transfer(
                request.fromAccountId, request.toAccountId, request.amount));

            writer_->lockAccounts(*unit, {request.fromAccountId, request.toAccountId});
            writer_->applyDelta(*unit, request.fromAccountId, -request.amount, tx.id);
            writer_->applyDelta(*unit, request.toAccountId, request.amount, tx.id);

            complete(*unit, tx);
            unit->commit();

            std::cout << "[TransactionService] Transfer completed: tx=" << tx.id
                      << " from=" << request.fromAccountId
                      << " to=" << request.toAccountId
                      << " amount=" << request.amount.toString() << std::endl;
            return tx;

        } catch (const domain::LedgerError& e) {
            std::cerr << "[TransactionService] Transfer failed " << request.fromAccountId
                      << " -> " << request.toAccountId << ": " << e.what() << std::endl;
            throw;
        }
    }

    domain::Transaction rollback(domain::TransactionId transactionId) override {
        validateTransactionId(transactionId);

        // Чтение вне единицы работы - только чтобы узнать счета для guard.
        // Статус перепроверяется ниже под блокировкой строки транзакции.
        auto snapshot = store_->findTransaction(transactionId);
        if (!snapshot) {
            throw domain::NotFoundError("transaction " + std::to_string(transactionId) + " not found");
        }
        ensureRollbackAllowed(*snapshot);

        auto lock = guard_->acquire(snapshot->involvedAccounts());
        try {
            auto unit = store_->begin();
            auto tx = unit->lockTransaction(transactionId);
            if (!tx) {
                throw domain::NotFoundError("transaction " + std::to_string(transactionId) + " not found");
            }
            ensureRollbackAllowed(*tx);

            writer_->lockAccounts(*unit, tx->involvedAccounts());
            for (const auto& compensation : tx->compensatingDeltas()) {
                writer_->applyDelta(*unit, compensation.accountId, compensation.delta, tx->id);
            }

            tx->transitionTo(domain::TransactionStatus::ROLLED_BACK);
            unit->updateTransactionStatus(tx->id, tx->status);
            unit->commit();

            std::cout << "[TransactionService] Transaction rolled back: tx=" << tx->id
                      << " type=" << domain::toString(tx->type)
                      << " amount=" << tx->amount.toString() << std::endl;
            return *tx;

        } catch (const domain::LedgerError& e) {
            std::cerr << "[TransactionService] Rollback failed for tx " << transactionId
                      << ": " << e.what() << std::endl;
            throw;
        }
    }

    domain::Transaction getTransaction(domain::TransactionId transactionId) override {
        validateTransactionId(transactionId);
        auto tx = store_->findTransaction(transactionId);
        if (!tx) {
            throw domain::NotFoundError("transaction " + std::to_string(transactionId) + " not found");
        }
        return *tx;
    }

    std::vector<domain::Transaction> getAccountTransactions(
        domain::AccountId accountId, std::size_t limit, std::size_t offset) override
    {
        validateAccountId(accountId);
        return store_->findTransactionsByAccount(accountId, normalizeLimit(limit), offset);
    }

private:
    std::shared_ptr<ports::output::ILedgerStore> store_;
    std::shared_ptr<AccountGuard> guard_;
    std::shared_ptr<BalanceWriter> writer_;
    std::shared_ptr<settings::LedgerSettings> settings_;

    static void validateAccountId(domain::AccountId accountId) {
        if (!domain::isValidId(accountId)) {
            throw domain::ValidationError("invalid account id: " + std::to_string(accountId));
        }
    }

    static void validateTransactionId(domain::TransactionId transactionId) {
        if (!domain::isValidId(transactionId)) {
            throw domain::ValidationError("invalid transaction id: " + std::to_string(transactionId));
        }
    }

    static void validateAmount(const domain::Money& amount) {
        if (!amount.isPositive()) {
            throw domain::ValidationError("amount must be greater than zero");
        }
    }

    /**
     * @brief Быстрый отказ до открытия единицы работы
     *
     * Check-then-act: результат может устареть к моменту begin().
     * Только оптимизация, настоящая проверка - в applyDelta под блокировкой.
     */
    void advisoryPrecheck(domain::AccountId accountId, const domain::Money& amount) {
        if (!settings_->isAdvisoryPrecheckEnabled()) return;

        auto balance = store_->findBalance(accountId);
        domain::Money available = balance ? balance->amount : domain::Money::zero();
        if (available < amount) {
            std::cout << "[TransactionService] Fast reject: account " << accountId
                      << " has " << available.toString() << ", needs " << amount.toString() << std::endl;
            throw domain::InsufficientFundsError(accountId, available, amount);
        }
    }

    static void ensureRollbackAllowed(const domain::Transaction& tx) {
        if (tx.status == domain::TransactionStatus::ROLLED_BACK) {
            throw domain::AlreadyRolledBackError(tx.id);
        }
        if (tx.status != domain::TransactionStatus::COMPLETED) {
            throw domain::InvalidStateTransitionError(
                "only completed transactions can be rolled back, tx " + std::to_string(tx.id) +
                " is " + domain::toString(tx.status));
        }
    }

    static void complete(ports::output::ILedgerUnitOfWork& unit, domain::Transaction& tx) {
        tx.transitionTo(domain::TransactionStatus::COMPLETED);
        unit.updateTransactionStatus(tx.id, tx.status);
    }

    std::size_t normalizeLimit(std::size_t limit) const {
        if (limit == 0) return settings_->getDefaultPageLimit();
        return std::min(limit, settings_->getMaxPageLimit());
    }
};

} // namespace ledger::application
