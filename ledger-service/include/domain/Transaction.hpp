#pragma once

#include "enums/TransactionStatus.hpp"
#include "enums/TransactionType.hpp"
#include "Identifiers.hpp"
#include "LedgerErrors.hpp"
#include "Money.hpp"
#include "Timestamp.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ledger::domain {

/**
 * @brief Компенсирующее изменение баланса при откате
 */
struct BalanceDelta {
    AccountId accountId;
    Money delta;
};

/**
 * @brief Запись о транзакции (credit / debit / transfer)
 *
 * Форма записи зависит от типа:
 * - CREDIT:   sourceAccount = null, destAccount задан
 * - DEBIT:    sourceAccount задан,  destAccount = null
 * - TRANSFER: оба заданы и различны
 *
 * amount > 0 и не меняется после создания. Меняется только status.
 */
struct Transaction {
    TransactionId id = 0;
    std::optional<AccountId> sourceAccount;
    std::optional<AccountId> destAccount;
    Money amount;
    TransactionType type = TransactionType::CREDIT;
    TransactionStatus status = TransactionStatus::PENDING;
    Timestamp createdAt;

    static Transaction credit(AccountId dest, const Money& amount) {
        Transaction tx;
        tx.destAccount = dest;
        tx.amount = amount;
        tx.type = TransactionType::CREDIT;
        return tx;
    }

    static Transaction debit(AccountId source, const Money& amount) {
        Transaction tx;
        tx.sourceAccount = source;
        tx.amount = amount;
        tx.type = TransactionType::DEBIT;
        return tx;
    }

    static Transaction transfer(AccountId source, AccountId dest, const Money& amount) {
        Transaction tx;
        tx.sourceAccount = source;
        tx.destAccount = dest;
        tx.amount = amount;
        tx.type = TransactionType::TRANSFER;
        return tx;
    }

    /**
     * @brief Проверить, что форма записи соответствует типу
     */
    bool hasValidShape() const {
        if (!amount.isPositive()) return false;
        switch (type) {
            case TransactionType::CREDIT:
                return !sourceAccount && destAccount;
            case TransactionType::DEBIT:
                return sourceAccount && !destAccount;
            case TransactionType::TRANSFER:
                return sourceAccount && destAccount && *sourceAccount != *destAccount;
        }
        return false;
    }

    /**
     * @brief Все счета, затронутые транзакцией
     */
    std::vector<AccountId> involvedAccounts() const {
        std::vector<AccountId> accounts;
        if (sourceAccount) accounts.push_back(*sourceAccount);
        if (destAccount) accounts.push_back(*destAccount);
        return accounts;
    }

    /**
     * @brief Перейти в новый статус
     * @throws AlreadyRolledBackError если транзакция уже откатена
     * @throws InvalidStateTransitionError для любого другого недопустимого перехода
     */
    void transitionTo(TransactionStatus next) {
        if (!canTransition(status, next)) {
            if (status == TransactionStatus::ROLLED_BACK) {
                throw AlreadyRolledBackError(id);
            }
            throw InvalidStateTransitionError(
                "transaction " + std::to_string(id) + ": " +
                toString(status) + " -> " + toString(next) + " is not allowed");
        }
        status = next;
    }

    /**
     * @brief Изменения балансов, отменяющие эффект транзакции
     *
     * credit   -> списать с dest
     * debit    -> вернуть на source
     * transfer -> вернуть на source, затем списать с dest
     */
    std::vector<BalanceDelta> compensatingDeltas() const {
        switch (type) {
            case TransactionType::CREDIT:
                return {BalanceDelta{*destAccount, -amount}};
            case TransactionType::DEBIT:
                return {BalanceDelta{*sourceAccount, amount}};
            case TransactionType::TRANSFER:
                return {BalanceDelta{*sourceAccount, amount},
                        BalanceDelta{*destAccount, -amount}};
        }
        return {};
    }
};

} // namespace ledger::domain
