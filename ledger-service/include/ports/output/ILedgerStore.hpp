#pragma once

#include "ports/output/ILedgerUnitOfWork.hpp"
#include "domain/Balance.hpp"
#include "domain/BalanceHistoryEntry.hpp"
#include "domain/Transaction.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace ledger::ports::output {

/**
 * @brief Хранилище леджера: balances, balance_history, transactions
 *
 * Изменения - только через единицу работы begin(). Остальные методы -
 * чтение вне единицы работы (кроме createBalanceIfAbsent).
 *
 * @example
 * ```cpp
 * auto unit = store->begin();
 * auto locked = unit->lockBalance(accountId);      // SELECT ... FOR UPDATE
 * unit->writeBalance(accountId, locked.balance.amount + delta);
 * unit->appendHistory(entry);
 * unit->commit();                                  // иначе откат в деструкторе
 * ```
 *
 * Все методы бросают domain::StorageError при сбое хранилища.
 */
class ILedgerStore {
public:
    virtual ~ILedgerStore() = default;

    /**
     * @brief Открыть атомарную единицу работы
     */
    virtual std::unique_ptr<ILedgerUnitOfWork> begin() = 0;

    // =========================================================================
    // Балансы
    // =========================================================================

    /**
     * @brief Найти баланс без побочных эффектов
     */
    virtual std::optional<domain::Balance> findBalance(domain::AccountId accountId) = 0;

    /**
     * @brief Вернуть баланс, создав нулевую строку при первом обращении
     *
     * Безопасно при конкурентном первом обращении (INSERT ... ON CONFLICT DO NOTHING).
     */
    virtual domain::Balance createBalanceIfAbsent(domain::AccountId accountId) = 0;

    /**
     * @brief Все счета, у которых есть строка баланса
     */
    virtual std::vector<domain::AccountId> listAccountIds() = 0;

    // =========================================================================
    // История
    // =========================================================================

    /**
     * @brief История счёта, от новых к старым
     */
    virtual std::vector<domain::BalanceHistoryEntry> findHistory(
        domain::AccountId accountId, std::size_t limit, std::size_t offset) = 0;

    /**
     * @brief Последняя запись с createdAt <= at
     */
    virtual std::optional<domain::BalanceHistoryEntry> findLatestHistoryAt(
        domain::AccountId accountId, const domain::Timestamp& at) = 0;

    /**
     * @brief SUM(change_amount) по счёту; 0 если истории нет
     */
    virtual domain::Money sumHistoryChanges(domain::AccountId accountId) = 0;

    // =========================================================================
    // Транзакции
    // =========================================================================

    virtual std::optional<domain::Transaction> findTransaction(domain::TransactionId transactionId) = 0;

    /**
     * @brief Транзакции, где счёт - source или dest, от новых к старым
     */
    virtual std::vector<domain::Transaction> findTransactionsByAccount(
        domain::AccountId accountId, std::size_t limit, std::size_t offset) = 0;
};

} // namespace ledger::ports::output
