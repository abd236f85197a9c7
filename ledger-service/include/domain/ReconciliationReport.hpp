#pragma once

#include "Identifiers.hpp"
#include "Money.hpp"
#include "Timestamp.hpp"

namespace ledger::domain {

/**
 * @brief Результат сверки баланса с историей
 */
struct ReconciliationReport {
    AccountId accountId = 0;
    Money storedBalance;      ///< Значение из таблицы balances
    Money historyBalance;     ///< SUM(change_amount) по balance_history
    Timestamp checkedAt;

    Money drift() const { return storedBalance - historyBalance; }
    bool isConsistent() const { return storedBalance == historyBalance; }
};

} // namespace ledger::domain
