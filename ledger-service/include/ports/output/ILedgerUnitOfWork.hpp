#pragma once

#include "domain/Balance.hpp"
#include "domain/BalanceHistoryEntry.hpp"
#include "domain/Transaction.hpp"
#include <optional>

namespace ledger::ports::output {

/**
 * @brief Результат захвата строки баланса
 */
struct LockedBalance {
    domain::Balance balance;
    bool created = false;   ///< Строки не было - создана с нулём в этой единице работы
};

/**
 * @brief Атомарная единица работы над хранилищем
 *
 * Гарантии для всех реализаций:
 * - изменения не видны другим до commit()
 * - после commit() все чтения видят изменения
 * - rollback() отбрасывает все записи
 * - деструктор откатывает незавершённую единицу
 * - блокировки строк держатся до commit()/rollback()
 *
 * PostgreSQL: pqxx::work + SELECT ... FOR UPDATE
 * InMemory: таблица блокировок строк + staged-изменения
 *
 * Все методы бросают domain::StorageError при сбое хранилища.
 */
class ILedgerUnitOfWork {
public:
    virtual ~ILedgerUnitOfWork() = default;

    // =========================================================================
    // Балансы
    // =========================================================================

    /**
     * @brief Захватить эксклюзивную блокировку строки баланса
     *
     * Если строки нет - создаёт её с нулём внутри этой единицы работы
     * (при откате строка исчезает). Повторный вызов для уже захваченного
     * счёта не блокируется.
     */
    virtual LockedBalance lockBalance(domain::AccountId accountId) = 0;

    /**
     * @brief Записать новое значение баланса и обновить lastUpdatedAt
     *
     * Строка должна быть предварительно захвачена через lockBalance().
     */
    virtual domain::Balance writeBalance(domain::AccountId accountId, const domain::Money& amount) = 0;

    // =========================================================================
    // История
    // =========================================================================

    /**
     * @brief Добавить запись в историю
     *
     * Ошибка вставки не ломает остальную единицу работы (PostgreSQL:
     * savepoint) - решение, откатывать ли всё, принимает вызывающий.
     * @return id новой записи
     */
    virtual domain::HistoryEntryId appendHistory(const domain::BalanceHistoryEntry& entry) = 0;

    // =========================================================================
    // Транзакции
    // =========================================================================

    /**
     * @brief Вставить запись транзакции
     * @return запись с присвоенными id и createdAt
     */
    virtual domain::Transaction insertTransaction(const domain::Transaction& transaction) = 0;

    /**
     * @brief Прочитать транзакцию с эксклюзивной блокировкой строки
     */
    virtual std::optional<domain::Transaction> lockTransaction(domain::TransactionId transactionId) = 0;

    virtual void updateTransactionStatus(domain::TransactionId transactionId, domain::TransactionStatus status) = 0;

    // =========================================================================
    // Завершение
    // =========================================================================

    virtual void commit() = 0;
    virtual void rollback() = 0;
    virtual bool isCommitted() const = 0;
};

} // namespace ledger::ports::output
