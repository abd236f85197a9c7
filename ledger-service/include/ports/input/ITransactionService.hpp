// ledger-service/include/ports/input/ITransactionService.hpp
#pragma once

#include "domain/Transaction.hpp"
#include "domain/TransactionRequest.hpp"
#include <cstddef>
#include <vector>

namespace ledger::ports::input {

/**
 * @brief Интерфейс оркестратора транзакций
 *
 * Каждая изменяющая операция - одна атомарная единица работы:
 * либо применяется целиком, либо не оставляет следов.
 * Ошибки - исключения из domain/LedgerErrors.hpp.
 */
class ITransactionService {
public:
    virtual ~ITransactionService() = default;

    /**
     * @brief Зачислить amount на счёт
     */
    virtual domain::Transaction credit(const domain::CreditRequest& request) = 0;

    /**
     * @brief Списать amount со счёта
     * @throws domain::InsufficientFundsError
     */
    virtual domain::Transaction debit(const domain::DebitRequest& request) = 0;

    /**
     * @brief Перевести amount между счетами
     * @throws domain::InsufficientFundsError
     */
    virtual domain::Transaction transfer(const domain::TransferRequest& request) = 0;

    /**
     * @brief Компенсирующий откат завершённой транзакции
     * @throws domain::NotFoundError
     * @throws domain::AlreadyRolledBackError
     * @throws domain::InvalidStateTransitionError
     */
    virtual domain::Transaction rollback(domain::TransactionId transactionId) = 0;

    /**
     * @throws domain::NotFoundError
     */
    virtual domain::Transaction getTransaction(domain::TransactionId transactionId) = 0;

    /**
     * @brief Транзакции счёта (source или dest), от новых к старым
     */
    virtual std::vector<domain::Transaction> getAccountTransactions(
        domain::AccountId accountId, std::size_t limit, std::size_t offset) = 0;
};

} // namespace ledger::ports::input
