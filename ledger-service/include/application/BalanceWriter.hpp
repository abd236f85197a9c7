// ledger-service/include/application/BalanceWriter.hpp
#pragma once

#include "ports/output/ILedgerUnitOfWork.hpp"
#include "domain/LedgerErrors.hpp"
#include "settings/LedgerSettings.hpp"
#include <algorithm>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <vector>

namespace ledger::application {

/**
 * @brief Атомарное изменение баланса внутри единицы работы (applyDelta)
 *
 * 1. Читает баланс под эксклюзивной блокировкой строки (нет строки -> 0, строка создаётся)
 * 2. new = current + delta; new < 0 -> InsufficientFundsError,
 *    new > Money::max() -> BalanceLimitExceededError
 * 3. Записывает new, обновляет lastUpdatedAt
 * 4. Добавляет запись в историю (поведение при ошибке - HistoryWritePolicy)
 *
 * Единицу работы не коммитит и не откатывает - это делает вызывающий.
 */
class BalanceWriter {
public:
    explicit BalanceWriter(std::shared_ptr<settings::LedgerSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[BalanceWriter] Created, history policy: "
                  << settings::toString(settings_->getHistoryPolicy()) << std::endl;
    }

    /**
     * @brief Захватить строки балансов в порядке возрастания accountId
     *
     * Единый порядок захвата строк во всех операциях исключает deadlock
     * между встречными переводами и в БД, не только внутри процесса.
     */
    void lockAccounts(ports::output::ILedgerUnitOfWork& unit, std::vector<domain::AccountId> accountIds) const {
        std::sort(accountIds.begin(), accountIds.end());
        accountIds.erase(std::unique(accountIds.begin(), accountIds.end()), accountIds.end());
        for (auto accountId : accountIds) {
            unit.lockBalance(accountId);
        }
    }

    /**
     * @brief Применить дельту к балансу
     * @return баланс после изменения
     * @throws domain::InsufficientFundsError если баланс ушёл бы в минус
     * @throws domain::BalanceLimitExceededError если баланс вышел бы за Money::max()
     * @throws domain::StorageError при сбое хранилища
     */
    domain::Balance applyDelta(
        ports::output::ILedgerUnitOfWork& unit,
        domain::AccountId accountId,
        const domain::Money& delta,
        std::optional<domain::TransactionId> transactionId = std::nullopt) const
    {
        auto locked = unit.lockBalance(accountId);
        domain::Money current = locked.balance.amount;
        domain::Money next;
        try {
            next = current + delta;
        } catch (const std::overflow_error&) {
            throw domain::BalanceLimitExceededError(accountId, current, delta);
        }

        if (next.isNegative()) {
            throw domain::InsufficientFundsError(accountId, current, -delta);
        }

        auto updated = unit.writeBalance(accountId, next);

        domain::BalanceHistoryEntry entry;
        entry.accountId = accountId;
        entry.resultingBalance = next;
        entry.changeAmount = delta;
        entry.transactionId = transactionId;

        try {
            unit.appendHistory(entry);
        } catch (const domain::StorageError& e) {
            if (settings_->getHistoryPolicy() == settings::HistoryWritePolicy::STRICT) {
                std::cerr << "[BalanceWriter] History append failed for account " << accountId
                          << ", aborting unit: " << e.what() << std::endl;
                throw;
            }
            std::cerr << "[BalanceWriter] WARNING: failed to record balance history for account "
                      << accountId << " (non-critical, best effort): " << e.what() << std::endl;
        }

        return updated;
    }

private:
    std::shared_ptr<settings::LedgerSettings> settings_;
};

} // namespace ledger::application
