#include "domain/JsonMapping.hpp"

namespace ledger::domain {

nlohmann::json toJson(const Balance& balance) {
    nlohmann::json j;
    j["account_id"] = balance.accountId;
    j["amount"] = balance.amount.toString();
    j["last_updated_at"] = balance.lastUpdatedAt.toString();
    return j;
}

nlohmann::json toJson(const BalanceHistoryEntry& entry) {
    nlohmann::json j;
    j["id"] = entry.id;
    j["account_id"] = entry.accountId;
    j["balance"] = entry.resultingBalance.toString();
    j["change_amount"] = entry.changeAmount.toString();
    if (entry.transactionId) {
        j["transaction_id"] = *entry.transactionId;
    }
    j["created_at"] = entry.createdAt.toString();
    return j;
}

nlohmann::json toJson(const Transaction& transaction) {
    nlohmann::json j;
    j["id"] = transaction.id;
    if (transaction.sourceAccount) {
        j["source_account"] = *transaction.sourceAccount;
    }
    if (transaction.destAccount) {
        j["dest_account"] = *transaction.destAccount;
    }
    j["amount"] = transaction.amount.toString();
    j["type"] = toString(transaction.type);
    j["status"] = toString(transaction.status);
    j["created_at"] = transaction.createdAt.toString();
    return j;
}

nlohmann::json toJson(const ReconciliationReport& report) {
    nlohmann::json j;
    j["account_id"] = report.accountId;
    j["stored_balance"] = report.storedBalance.toString();
    j["history_balance"] = report.historyBalance.toString();
    j["drift"] = report.drift().toString();
    j["consistent"] = report.isConsistent();
    j["checked_at"] = report.checkedAt.toString();
    return j;
}

} // namespace ledger::domain
