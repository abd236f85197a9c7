#pragma once

#include "Identifiers.hpp"
#include "Money.hpp"
#include <stdexcept>
#include <string>

/**
 * @file LedgerErrors.hpp
 * @brief Иерархия исключений ядра
 *
 * Внешний слой (HTTP, очередь) различает ошибки по code(), а не по тексту.
 */
namespace ledger::domain {

enum class ErrorCode {
    VALIDATION,
    INSUFFICIENT_FUNDS,
    BALANCE_LIMIT_EXCEEDED,
    NOT_FOUND,
    INVALID_STATE_TRANSITION,
    ALREADY_ROLLED_BACK,
    STORAGE
};

inline std::string toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::VALIDATION: return "validation_error";
        case ErrorCode::INSUFFICIENT_FUNDS: return "insufficient_funds";
        case ErrorCode::BALANCE_LIMIT_EXCEEDED: return "balance_limit_exceeded";
        case ErrorCode::NOT_FOUND: return "not_found";
        case ErrorCode::INVALID_STATE_TRANSITION: return "invalid_state_transition";
        case ErrorCode::ALREADY_ROLLED_BACK: return "already_rolled_back";
        case ErrorCode::STORAGE: return "storage_error";
        default: return "unknown_error";
    }
}

class LedgerError : public std::runtime_error {
public:
    LedgerError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

/**
 * @brief Некорректный запрос: сумма <= 0, перевод на тот же счёт, плохой id
 *
 * Бросается до открытия атомарной единицы работы.
 */
class ValidationError : public LedgerError {
public:
    explicit ValidationError(const std::string& message)
        : LedgerError(ErrorCode::VALIDATION, message) {}
};

/**
 * @brief Баланс ушёл бы в минус (проверка под блокировкой строки)
 */
class InsufficientFundsError : public LedgerError {
public:
    InsufficientFundsError(AccountId accountId, const Money& available, const Money& requested)
        : LedgerError(ErrorCode::INSUFFICIENT_FUNDS,
                      "insufficient funds on account " + std::to_string(accountId) +
                      ": available " + available.toString() + ", requested " + requested.toString())
        , accountId_(accountId)
        , available_(available)
        , requested_(requested) {}

    AccountId accountId() const { return accountId_; }
    const Money& available() const { return available_; }
    const Money& requested() const { return requested_; }

private:
    AccountId accountId_;
    Money available_;
    Money requested_;
};

/**
 * @brief Баланс превысил бы Money::max() (верхняя граница NUMERIC(18,2))
 */
class BalanceLimitExceededError : public LedgerError {
public:
    BalanceLimitExceededError(AccountId accountId, const Money& current, const Money& change)
        : LedgerError(ErrorCode::BALANCE_LIMIT_EXCEEDED,
                      "balance limit exceeded on account " + std::to_string(accountId) +
                      ": current " + current.toString() + ", change " + change.toString() +
                      ", limit " + Money::max().toString())
        , accountId_(accountId) {}

    AccountId accountId() const { return accountId_; }

private:
    AccountId accountId_;
};

class NotFoundError : public LedgerError {
public:
    explicit NotFoundError(const std::string& message)
        : LedgerError(ErrorCode::NOT_FOUND, message) {}
};

class InvalidStateTransitionError : public LedgerError {
public:
    explicit InvalidStateTransitionError(const std::string& message)
        : LedgerError(ErrorCode::INVALID_STATE_TRANSITION, message) {}

protected:
    InvalidStateTransitionError(ErrorCode code, const std::string& message)
        : LedgerError(code, message) {}
};

class AlreadyRolledBackError : public InvalidStateTransitionError {
public:
    explicit AlreadyRolledBackError(TransactionId transactionId)
        : InvalidStateTransitionError(ErrorCode::ALREADY_ROLLED_BACK,
                                      "transaction " + std::to_string(transactionId) + " already rolled back") {}
};

/**
 * @brief Сбой хранилища (соединение, SQL, нарушение ограничения)
 */
class StorageError : public LedgerError {
public:
    explicit StorageError(const std::string& message)
        : LedgerError(ErrorCode::STORAGE, message) {}
};

} // namespace ledger::domain
