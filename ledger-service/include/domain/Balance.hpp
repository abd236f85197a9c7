#pragma once

#include "Identifiers.hpp"
#include "Money.hpp"
#include "Timestamp.hpp"

namespace ledger::domain {

/**
 * @brief Текущий баланс счёта
 *
 * Одна строка на счёт, создаётся с нулём при первом обращении.
 * Инвариант: amount >= 0.
 */
struct Balance {
    AccountId accountId = 0;
    Money amount;
    Timestamp lastUpdatedAt;

    Balance() = default;

    Balance(AccountId id, const Money& value, const Timestamp& updatedAt = Timestamp::now())
        : accountId(id), amount(value), lastUpdatedAt(updatedAt) {}
};

} // namespace ledger::domain
