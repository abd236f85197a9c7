#pragma once

#include <cstdint>

namespace ledger::domain {

using AccountId = int64_t;          ///< Положительный идентификатор счёта (внешний)
using TransactionId = int64_t;      ///< PK таблицы transactions
using HistoryEntryId = int64_t;     ///< PK таблицы balance_history

inline bool isValidId(int64_t id) {
    return id > 0;
}

} // namespace ledger::domain
