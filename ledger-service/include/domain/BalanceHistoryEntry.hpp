#pragma once

#include "Identifiers.hpp"
#include "Money.hpp"
#include "Timestamp.hpp"
#include <optional>

namespace ledger::domain {

/**
 * @brief Запись истории баланса (append-only)
 *
 * Никогда не изменяется и не удаляется. Откат транзакции пишется
 * новыми записями с обратным знаком changeAmount.
 */
struct BalanceHistoryEntry {
    HistoryEntryId id = 0;
    AccountId accountId = 0;
    Money resultingBalance;                       ///< Баланс после изменения
    Money changeAmount;                           ///< Дельта (со знаком)
    std::optional<TransactionId> transactionId;   ///< Транзакция-причина
    Timestamp createdAt;
};

} // namespace ledger::domain
