#pragma once

#include <stdexcept>
#include <string>

namespace ledger::domain {

/**
 * @brief Статус транзакции
 *
 * Машина состояний: PENDING -> COMPLETED -> ROLLED_BACK.
 * ROLLED_BACK - терминальный. Других переходов нет.
 */
enum class TransactionStatus {
    PENDING,
    COMPLETED,
    ROLLED_BACK
};

inline std::string toString(TransactionStatus status) {
    switch (status) {
        case TransactionStatus::PENDING: return "pending";
        case TransactionStatus::COMPLETED: return "completed";
        case TransactionStatus::ROLLED_BACK: return "rolled_back";
        default: return "unknown";
    }
}

inline TransactionStatus parseTransactionStatus(const std::string& str) {
    if (str == "pending") return TransactionStatus::PENDING;
    if (str == "completed") return TransactionStatus::COMPLETED;
    if (str == "rolled_back") return TransactionStatus::ROLLED_BACK;
    throw std::invalid_argument("unknown transaction status: " + str);
}

inline bool isFinalStatus(TransactionStatus status) {
    return status == TransactionStatus::ROLLED_BACK;
}

inline bool canTransition(TransactionStatus from, TransactionStatus to) {
    return (from == TransactionStatus::PENDING && to == TransactionStatus::COMPLETED) ||
           (from == TransactionStatus::COMPLETED && to == TransactionStatus::ROLLED_BACK);
}

} // namespace ledger::domain
