// ledger-service/include/application/AccountGuard.hpp
#pragma once

#include "domain/Identifiers.hpp"
#include "settings/LedgerSettings.hpp"
#include <StripedLock.hpp>
#include <iostream>
#include <memory>
#include <vector>

namespace ledger::application {

/**
 * @brief Внутрипроцессная сериализация операций по счетам
 *
 * Снижает конкуренцию за блокировку строки в БД, но НЕ отвечает за
 * корректность: её обеспечивает SELECT ... FOR UPDATE в хранилище
 * (он работает и между процессами).
 *
 * Фиксированное число полос (LedgerSettings::guardStripes), таблица
 * блокировок не растёт. guardStripes = 0 отключает guard.
 */
class AccountGuard {
public:
    using Handle = StripedLock<domain::AccountId>::Handle;

    explicit AccountGuard(std::shared_ptr<settings::LedgerSettings> settings) {
        auto stripes = settings->getGuardStripes();
        if (stripes > 0) {
            stripes_ = std::make_unique<StripedLock<domain::AccountId>>(stripes);
        }
        std::cout << "[AccountGuard] Created with " << stripes << " stripes"
                  << (stripes == 0 ? " (disabled)" : "") << std::endl;
    }

    Handle acquire(domain::AccountId accountId) {
        if (!stripes_) return Handle{};
        return stripes_->acquire(accountId);
    }

    /**
     * @brief Захват для нескольких счетов; порядок аргументов не важен
     */
    Handle acquire(const std::vector<domain::AccountId>& accountIds) {
        if (!stripes_) return Handle{};
        return stripes_->acquire(accountIds);
    }

private:
    std::unique_ptr<StripedLock<domain::AccountId>> stripes_;
};

} // namespace ledger::application
