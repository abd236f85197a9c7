#pragma once

#include "Identifiers.hpp"
#include "Money.hpp"

namespace ledger::domain {

/**
 * @brief Запросы к оркестратору
 *
 * Приходят уже провалидированными и авторизованными внешним слоем;
 * ядро повторно проверяет только инварианты (id > 0, amount > 0, from != to).
 */
struct CreditRequest {
    AccountId accountId = 0;
    Money amount;
};

struct DebitRequest {
    AccountId accountId = 0;
    Money amount;
};

struct TransferRequest {
    AccountId fromAccountId = 0;
    AccountId toAccountId = 0;
    Money amount;
};

} // namespace ledger::domain
