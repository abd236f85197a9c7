// ledger-service/include/ports/input/IBalanceService.hpp
#pragma once

#include "domain/Balance.hpp"
#include "domain/BalanceHistoryEntry.hpp"
#include "domain/ReconciliationReport.hpp"
#include "domain/Timestamp.hpp"
#include <cstddef>
#include <vector>

namespace ledger::ports::input {

/**
 * @brief Интерфейс чтения балансов
 */
class IBalanceService {
public:
    virtual ~IBalanceService() = default;

    /**
     * @brief Текущий баланс; для нового счёта создаёт строку с нулём
     */
    virtual domain::Balance getBalance(domain::AccountId accountId) = 0;

    /**
     * @brief История изменений, от новых к старым
     * @param limit 0 - размер страницы по умолчанию
     */
    virtual std::vector<domain::BalanceHistoryEntry> getHistory(
        domain::AccountId accountId, std::size_t limit, std::size_t offset) = 0;

    /**
     * @brief Баланс на момент времени; 0 если истории до этого момента нет
     */
    virtual domain::Money getBalanceAtTime(domain::AccountId accountId, const domain::Timestamp& at) = 0;

    virtual domain::Money calculateBalanceFromHistory(domain::AccountId accountId) = 0;

    /**
     * @brief Сверить баланс с историей (только отчёт, без исправления)
     */
    virtual domain::ReconciliationReport reconcile(domain::AccountId accountId) = 0;
};

} // namespace ledger::ports::input
