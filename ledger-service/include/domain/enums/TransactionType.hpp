#pragma once

#include <stdexcept>
#include <string>

namespace ledger::domain {

enum class TransactionType {
    CREDIT,     ///< Зачисление на счёт (только dest)
    DEBIT,      ///< Списание со счёта (только source)
    TRANSFER    ///< Перевод source -> dest
};

inline std::string toString(TransactionType type) {
    switch (type) {
        case TransactionType::CREDIT: return "credit";
        case TransactionType::DEBIT: return "debit";
        case TransactionType::TRANSFER: return "transfer";
        default: return "unknown";
    }
}

/**
 * @throws std::invalid_argument для неизвестного значения из БД
 */
inline TransactionType parseTransactionType(const std::string& str) {
    if (str == "credit") return TransactionType::CREDIT;
    if (str == "debit") return TransactionType::DEBIT;
    if (str == "transfer") return TransactionType::TRANSFER;
    throw std::invalid_argument("unknown transaction type: " + str);
}

} // namespace ledger::domain
