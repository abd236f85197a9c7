// ledger-service/include/application/BalanceService.hpp
#pragma once

#include "ports/input/IBalanceService.hpp"
#include "ports/output/ILedgerStore.hpp"
#include "domain/LedgerErrors.hpp"
#include "settings/LedgerSettings.hpp"
#include <algorithm>
#include <iostream>
#include <memory>

namespace ledger::application {

/**
 * @brief Чтение балансов, истории и сверка
 *
 * Только чтение, кроме одного побочного эффекта: getBalance() для нового
 * счёта создаёт строку с нулём.
 */
class BalanceService : public ports::input::IBalanceService {
public:
    BalanceService(
        std::shared_ptr<ports::output::ILedgerStore> store,
        std::shared_ptr<settings::LedgerSettings> settings
    ) : store_(std::move(store))
      , settings_(std::move(settings))
    {
        std::cout << "[BalanceService] Created" << std::endl;
    }

    domain::Balance getBalance(domain::AccountId accountId) override {
        validateAccountId(accountId);
        return store_->createBalanceIfAbsent(accountId);
    }

    std::vector<domain::BalanceHistoryEntry> getHistory(
        domain::AccountId accountId, std::size_t limit, std::size_t offset) override
    {
        validateAccountId(accountId);
        if (limit == 0) {
            limit = settings_->getDefaultPageLimit();
        }
        limit = std::min(limit, settings_->getMaxPageLimit());
        return store_->findHistory(accountId, limit, offset);
    }

    domain::Money getBalanceAtTime(domain::AccountId accountId, const domain::Timestamp& at) override {
        validateAccountId(accountId);
        auto entry = store_->findLatestHistoryAt(accountId, at);
        if (!entry) {
            return domain::Money::zero();
        }
        return entry->resultingBalance;
    }

    domain::Money calculateBalanceFromHistory(domain::AccountId accountId) override {
        validateAccountId(accountId);
        return store_->sumHistoryChanges(accountId);
    }

    /**
     * @brief Сверка: баланс vs сумма дельт истории
     *
     * Расхождение логируется как WARNING и возвращается в отчёте.
     * Не бросает исключение и ничего не исправляет.
     */
    domain::ReconciliationReport reconcile(domain::AccountId accountId) override {
        auto current = getBalance(accountId);
        auto calculated = calculateBalanceFromHistory(accountId);

        domain::ReconciliationReport report;
        report.accountId = accountId;
        report.storedBalance = current.amount;
        report.historyBalance = calculated;
        report.checkedAt = domain::Timestamp::now();

        if (!report.isConsistent()) {
            std::cerr << "[BalanceService] WARNING: Balance discrepancy detected for account " << accountId
                      << ": current=" << report.storedBalance.toString()
                      << " calculated=" << report.historyBalance.toString()
                      << " drift=" << report.drift().toString() << std::endl;
        }
        return report;
    }

private:
    std::shared_ptr<ports::output::ILedgerStore> store_;
    std::shared_ptr<settings::LedgerSettings> settings_;

    static void validateAccountId(domain::AccountId accountId) {
        if (!domain::isValidId(accountId)) {
            throw domain::ValidationError("invalid account id: " + std::to_string(accountId));
        }
    }
};

} // namespace ledger::application
