#pragma once

#include "Balance.hpp"
#include "BalanceHistoryEntry.hpp"
#include "ReconciliationReport.hpp"
#include "Transaction.hpp"
#include <nlohmann/json.hpp>
#include <vector>

/**
 * @file JsonMapping.hpp
 * @brief Представление записей ядра для внешнего слоя
 *
 * Ключи snake_case. Суммы - десятичные строки ("100.00"), чтобы не терять
 * точность на double. Пустые счета транзакции в JSON не попадают.
 */
namespace ledger::domain {

nlohmann::json toJson(const Balance& balance);
nlohmann::json toJson(const BalanceHistoryEntry& entry);
nlohmann::json toJson(const Transaction& transaction);
nlohmann::json toJson(const ReconciliationReport& report);

template <typename T>
nlohmann::json toJsonArray(const std::vector<T>& items) {
    auto array = nlohmann::json::array();
    for (const auto& item : items) {
        array.push_back(toJson(item));
    }
    return array;
}

} // namespace ledger::domain
