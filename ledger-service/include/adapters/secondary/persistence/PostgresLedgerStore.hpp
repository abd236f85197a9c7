// ledger-service/include/adapters/secondary/persistence/PostgresLedgerStore.hpp
#pragma once

#include "ports/output/ILedgerStore.hpp"
#include "domain/LedgerErrors.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ledger::adapters::secondary {

namespace detail {

// Общие фрагменты запросов. Суммы читаются как текст (NUMERIC -> Money без
// потери точности), время - как микросекунды от эпохи.
inline constexpr const char* kBalanceColumns =
    "account_id, amount::TEXT AS amount, "
    "(EXTRACT(EPOCH FROM updated_at) * 1000000)::BIGINT AS updated_us";

inline constexpr const char* kHistoryColumns =
    "id, account_id, resulting_balance::TEXT AS resulting_balance, "
    "change_amount::TEXT AS change_amount, transaction_id, "
    "(EXTRACT(EPOCH FROM created_at) * 1000000)::BIGINT AS created_us";

inline constexpr const char* kTransactionColumns =
    "id, source_account, dest_account, amount::TEXT AS amount, type, status, "
    "(EXTRACT(EPOCH FROM created_at) * 1000000)::BIGINT AS created_us";

inline domain::Balance balanceFromRow(const pqxx::row& row) {
    return domain::Balance(
        row["account_id"].as<int64_t>(),
        domain::Money::fromString(row["amount"].as<std::string>()),
        domain::Timestamp::fromMicros(row["updated_us"].as<int64_t>()));
}

inline domain::BalanceHistoryEntry historyFromRow(const pqxx::row& row) {
    domain::BalanceHistoryEntry entry;
    entry.id = row["id"].as<int64_t>();
    entry.accountId = row["account_id"].as<int64_t>();
    entry.resultingBalance = domain::Money::fromString(row["resulting_balance"].as<std::string>());
    entry.changeAmount = domain::Money::fromString(row["change_amount"].as<std::string>());
    if (!row["transaction_id"].is_null()) {
        entry.transactionId = row["transaction_id"].as<int64_t>();
    }
    entry.createdAt = domain::Timestamp::fromMicros(row["created_us"].as<int64_t>());
    return entry;
}

inline domain::Transaction transactionFromRow(const pqxx::row& row) {
    domain::Transaction tx;
    tx.id = row["id"].as<int64_t>();
    if (!row["source_account"].is_null()) {
        tx.sourceAccount = row["source_account"].as<int64_t>();
    }
    if (!row["dest_account"].is_null()) {
        tx.destAccount = row["dest_account"].as<int64_t>();
    }
    tx.amount = domain::Money::fromString(row["amount"].as<std::string>());
    tx.type = domain::parseTransactionType(row["type"].as<std::string>());
    tx.status = domain::parseTransactionStatus(row["status"].as<std::string>());
    tx.createdAt = domain::Timestamp::fromMicros(row["created_us"].as<int64_t>());
    return tx;
}

} // namespace detail

/**
 * @brief Единица работы поверх одной pqxx::work
 *
 * Своё соединение на единицу работы, блокировки строк - SELECT ... FOR UPDATE,
 * держатся до commit()/rollback().
 */
class PostgresLedgerUnit : public ports::output::ILedgerUnitOfWork {
public:
    explicit PostgresLedgerUnit(const std::string& connectionString)
        : conn_(connectionString)
        , txn_(conn_)
    {}

    ~PostgresLedgerUnit() override {
        if (!finished_) {
            try {
                txn_.abort();
            } catch (const std::exception& e) {
                std::cerr << "[PostgresLedgerStore] Abort on destroy failed: " << e.what() << std::endl;
            }
        }
    }

    ports::output::LockedBalance lockBalance(domain::AccountId accountId) override {
        try {
            // Конкурентное первое обращение: один INSERT проходит, остальные
            // ждут его коммита и получают конфликт.
            auto inserted = txn_.exec_params(
                "INSERT INTO balances (account_id, amount, updated_at) "
                "VALUES ($1, 0, clock_timestamp()) "
                "ON CONFLICT (account_id) DO NOTHING "
                "RETURNING account_id",
                accountId
            );

            auto result = txn_.exec_params(
                std::string("SELECT ") + detail::kBalanceColumns +
                " FROM balances WHERE account_id = $1 FOR UPDATE",
                accountId
            );
            if (result.empty()) {
                throw domain::StorageError("balance row for account " + std::to_string(accountId) + " vanished");
            }

            ports::output::LockedBalance locked;
            locked.balance = detail::balanceFromRow(result[0]);
            locked.created = !inserted.empty();
            return locked;

        } catch (const domain::LedgerError&) {
            throw;
        } catch (const std::exception& e) {
            throw storageError("lockBalance", e);
        }
    }

    domain::Balance writeBalance(domain::AccountId accountId, const domain::Money& amount) override {
        try {
            auto result = txn_.exec_params(
                std::string("UPDATE balances SET amount = $2::NUMERIC, updated_at = clock_timestamp() "
                            "WHERE account_id = $1 RETURNING ") + detail::kBalanceColumns,
                accountId,
                amount.toString()
            );
            if (result.empty()) {
                throw domain::StorageError("balance row for account " + std::to_string(accountId) + " not found");
            }
            return detail::balanceFromRow(result[0]);

        } catch (const domain::LedgerError&) {
            throw;
        } catch (const std::exception& e) {
            throw storageError("writeBalance", e);
        }
    }

    domain::HistoryEntryId appendHistory(const domain::BalanceHistoryEntry& entry) override {
        try {
            // Savepoint: сбой вставки откатывает только её, txn_ остаётся рабочей
            pqxx::subtransaction savepoint(txn_, "append_history");
            auto result = savepoint.exec_params(
                "INSERT INTO balance_history "
                "(account_id, resulting_balance, change_amount, transaction_id, created_at) "
                "VALUES ($1, $2::NUMERIC, $3::NUMERIC, $4, clock_timestamp()) "
                "RETURNING id",
                entry.accountId,
                entry.resultingBalance.toString(),
                entry.changeAmount.toString(),
                entry.transactionId
            );
            savepoint.commit();
            return result[0]["id"].as<int64_t>();

        } catch (const std::exception& e) {
            throw storageError("appendHistory", e);
        }
    }

    domain::Transaction insertTransaction(const domain::Transaction& transaction) override {
        try {
            auto result = txn_.exec_params(
                std::string("INSERT INTO transactions "
                            "(source_account, dest_account, amount, type, status, created_at) "
                            "VALUES ($1, $2, $3::NUMERIC, $4, $5, clock_timestamp()) "
                            "RETURNING ") + detail::kTransactionColumns,
                transaction.sourceAccount,
                transaction.destAccount,
                transaction.amount.toString(),
                domain::toString(transaction.type),
                domain::toString(transaction.status)
            );
            return detail::transactionFromRow(result[0]);

        } catch (const std::exception& e) {
            throw storageError("insertTransaction", e);
        }
    }

    std::optional<domain::Transaction> lockTransaction(domain::TransactionId transactionId) override {
        try {
            auto result = txn_.exec_params(
                std::string("SELECT ") + detail::kTransactionColumns +
                " FROM transactions WHERE id = $1 FOR UPDATE",
                transactionId
            );
            if (result.empty()) {
                return std::nullopt;
            }
            return detail::transactionFromRow(result[0]);

        } catch (const std::exception& e) {
            throw storageError("lockTransaction", e);
        }
    }

    void updateTransactionStatus(domain::TransactionId transactionId, domain::TransactionStatus status) override {
        pqxx::result result;
        try {
            result = txn_.exec_params(
                "UPDATE transactions SET status = $2 WHERE id = $1 RETURNING id",
                transactionId,
                domain::toString(status)
            );
        } catch (const std::exception& e) {
            throw storageError("updateTransactionStatus", e);
        }
        if (result.empty()) {
            throw domain::StorageError("transaction " + std::to_string(transactionId) + " not found for status update");
        }
    }

    void commit() override {
        if (finished_) {
            throw domain::StorageError("unit of work already finished");
        }
        try {
            txn_.commit();
            finished_ = true;
            committed_ = true;
        } catch (const std::exception& e) {
            finished_ = true;
            throw storageError("commit", e);
        }
    }

    void rollback() override {
        if (finished_) return;
        finished_ = true;
        try {
            txn_.abort();
        } catch (const std::exception& e) {
            throw storageError("rollback", e);
        }
    }

    bool isCommitted() const override { return committed_; }

private:
    pqxx::connection conn_;
    pqxx::work txn_;
    bool finished_ = false;
    bool committed_ = false;

    static domain::StorageError storageError(const char* operation, const std::exception& e) {
        std::cerr << "[PostgresLedgerStore] " << operation << " error: " << e.what() << std::endl;
        return domain::StorageError(std::string(operation) + ": " + e.what());
    }
};

/**
 * @brief PostgreSQL реализация хранилища леджера
 *
 * Таблицы:
 * - balances          (account_id BIGINT PK, amount NUMERIC(18,2) >= 0, updated_at)
 * - transactions      (id BIGSERIAL PK, source/dest BIGINT NULL, amount > 0, type, status, created_at)
 * - balance_history   (id BIGSERIAL PK, account_id, resulting_balance, change_amount,
 *                      transaction_id NULL, created_at)
 *
 * Время записей - clock_timestamp(), а не NOW(): внутри одной транзакции
 * NOW() постоянен, а порядок истории должен совпадать с порядком изменений.
 */
class PostgresLedgerStore : public ports::output::ILedgerStore {
public:
    explicit PostgresLedgerStore(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        initSchema();
        std::cout << "[PostgresLedgerStore] Created" << std::endl;
    }

    std::unique_ptr<ports::output::ILedgerUnitOfWork> begin() override {
        try {
            return std::make_unique<PostgresLedgerUnit>(settings_->getConnectionString());
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerStore] begin error: " << e.what() << std::endl;
            throw domain::StorageError(std::string("begin: ") + e.what());
        }
    }

    // =========================================================================
    // Балансы
    // =========================================================================

    std::optional<domain::Balance> findBalance(domain::AccountId accountId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                std::string("SELECT ") + detail::kBalanceColumns +
                " FROM balances WHERE account_id = $1",
                accountId
            );
            if (result.empty()) {
                return std::nullopt;
            }
            return detail::balanceFromRow(result[0]);

        } catch (const std::exception& e) {
            throw storageError("findBalance", e);
        }
    }

    domain::Balance createBalanceIfAbsent(domain::AccountId accountId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto inserted = txn.exec_params(
                std::string("INSERT INTO balances (account_id, amount, updated_at) "
                            "VALUES ($1, 0, clock_timestamp()) "
                            "ON CONFLICT (account_id) DO NOTHING RETURNING ") + detail::kBalanceColumns,
                accountId
            );
            if (!inserted.empty()) {
                txn.commit();
                std::cout << "[PostgresLedgerStore] Created balance row for account " << accountId << std::endl;
                return detail::balanceFromRow(inserted[0]);
            }

            auto result = txn.exec_params(
                std::string("SELECT ") + detail::kBalanceColumns +
                " FROM balances WHERE account_id = $1",
                accountId
            );
            txn.commit();
            if (result.empty()) {
                throw domain::StorageError("balance row for account " + std::to_string(accountId) + " not found");
            }
            return detail::balanceFromRow(result[0]);

        } catch (const domain::LedgerError&) {
            throw;
        } catch (const std::exception& e) {
            throw storageError("createBalanceIfAbsent", e);
        }
    }

    std::vector<domain::AccountId> listAccountIds() override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec("SELECT account_id FROM balances ORDER BY account_id");

            std::vector<domain::AccountId> ids;
            ids.reserve(result.size());
            for (const auto& row : result) {
                ids.push_back(row["account_id"].as<int64_t>());
            }
            return ids;

        } catch (const std::exception& e) {
            throw storageError("listAccountIds", e);
        }
    }

    // =========================================================================
    // История
    // =========================================================================

    std::vector<domain::BalanceHistoryEntry> findHistory(
        domain::AccountId accountId, std::size_t limit, std::size_t offset) override
    {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                std::string("SELECT ") + detail::kHistoryColumns +
                " FROM balance_history WHERE account_id = $1 "
                "ORDER BY created_at DESC, id DESC LIMIT $2 OFFSET $3",
                accountId,
                static_cast<int64_t>(limit),
                static_cast<int64_t>(offset)
            );

            std::vector<domain::BalanceHistoryEntry> entries;
            entries.reserve(result.size());
            for (const auto& row : result) {
                entries.push_back(detail::historyFromRow(row));
            }
            return entries;

        } catch (const std::exception& e) {
            throw storageError("findHistory", e);
        }
    }

    std::optional<domain::BalanceHistoryEntry> findLatestHistoryAt(
        domain::AccountId accountId, const domain::Timestamp& at) override
    {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                std::string("SELECT ") + detail::kHistoryColumns +
                " FROM balance_history WHERE account_id = $1 "
                "AND created_at <= TIMESTAMPTZ 'epoch' + $2::BIGINT * INTERVAL '1 microsecond' "
                "ORDER BY created_at DESC, id DESC LIMIT 1",
                accountId,
                at.toMicros()
            );
            if (result.empty()) {
                return std::nullopt;
            }
            return detail::historyFromRow(result[0]);

        } catch (const std::exception& e) {
            throw storageError("findLatestHistoryAt", e);
        }
    }

    domain::Money sumHistoryChanges(domain::AccountId accountId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT COALESCE(SUM(change_amount), 0)::NUMERIC(18,2)::TEXT AS total "
                "FROM balance_history WHERE account_id = $1",
                accountId
            );
            return domain::Money::fromString(result[0]["total"].as<std::string>());

        } catch (const std::exception& e) {
            throw storageError("sumHistoryChanges", e);
        }
    }

    // =========================================================================
    // Транзакции
    // =========================================================================

    std::optional<domain::Transaction> findTransaction(domain::TransactionId transactionId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                std::string("SELECT ") + detail::kTransactionColumns +
                " FROM transactions WHERE id = $1",
                transactionId
            );
            if (result.empty()) {
                return std::nullopt;
            }
            return detail::transactionFromRow(result[0]);

        } catch (const std::exception& e) {
            throw storageError("findTransaction", e);
        }
    }

    std::vector<domain::Transaction> findTransactionsByAccount(
        domain::AccountId accountId, std::size_t limit, std::size_t offset) override
    {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                std::string("SELECT ") + detail::kTransactionColumns +
                " FROM transactions WHERE source_account = $1 OR dest_account = $1 "
                "ORDER BY created_at DESC, id DESC LIMIT $2 OFFSET $3",
                accountId,
                static_cast<int64_t>(limit),
                static_cast<int64_t>(offset)
            );

            std::vector<domain::Transaction> transactions;
            transactions.reserve(result.size());
            for (const auto& row : result) {
                transactions.push_back(detail::transactionFromRow(row));
            }
            return transactions;

        } catch (const std::exception& e) {
            throw storageError("findTransactionsByAccount", e);
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    static domain::StorageError storageError(const char* operation, const std::exception& e) {
        std::cerr << "[PostgresLedgerStore] " << operation << " error: " << e.what() << std::endl;
        return domain::StorageError(std::string(operation) + ": " + e.what());
    }

    void initSchema() {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS balances (
                    account_id BIGINT PRIMARY KEY,
                    amount NUMERIC(18,2) NOT NULL DEFAULT 0 CHECK (amount >= 0),
                    updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS transactions (
                    id BIGSERIAL PRIMARY KEY,
                    source_account BIGINT,
                    dest_account BIGINT,
                    amount NUMERIC(18,2) NOT NULL CHECK (amount > 0),
                    type VARCHAR(16) NOT NULL,
                    status VARCHAR(16) NOT NULL,
                    created_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS balance_history (
                    id BIGSERIAL PRIMARY KEY,
                    account_id BIGINT NOT NULL,
                    resulting_balance NUMERIC(18,2) NOT NULL,
                    change_amount NUMERIC(18,2) NOT NULL,
                    transaction_id BIGINT REFERENCES transactions(id),
                    created_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
                )
            )");

            txn.exec("CREATE INDEX IF NOT EXISTS idx_history_account_time "
                     "ON balance_history (account_id, created_at DESC, id DESC)");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_transactions_source ON transactions (source_account)");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_transactions_dest ON transactions (dest_account)");

            txn.commit();
            std::cout << "[PostgresLedgerStore] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            throw storageError("initSchema", e);
        }
    }
};

} // namespace ledger::adapters::secondary
