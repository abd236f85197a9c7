// ledger-service/include/adapters/secondary/persistence/InMemoryLedgerStore.hpp
#pragma once

#include "ports/output/ILedgerStore.hpp"
#include "domain/LedgerErrors.hpp"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace ledger::adapters::secondary {

/**
 * @brief In-memory реализация хранилища леджера
 *
 * Та же семантика единицы работы, что и у PostgreSQL:
 * - блокировки строк (balances, transactions) через таблицу занятых id
 *   и condition_variable, держатся до commit()/rollback()
 * - изменения копятся в единице работы и применяются разом в commit()
 * - деструктор незавершённой единицы её откатывает
 *
 * Часы инжектируются - тесты задают время записей истории.
 * Хранилище должно пережить все свои единицы работы.
 */
class InMemoryLedgerStore : public ports::output::ILedgerStore {
public:
    using Clock = std::function<domain::Timestamp()>;

    InMemoryLedgerStore()
        : InMemoryLedgerStore([]() { return domain::Timestamp::now(); })
    {}

    explicit InMemoryLedgerStore(Clock clock)
        : clock_(std::move(clock))
    {
        std::cout << "[InMemoryLedgerStore] Created" << std::endl;
    }

    std::unique_ptr<ports::output::ILedgerUnitOfWork> begin() override {
        return std::make_unique<Unit>(*this);
    }

    // =========================================================================
    // Балансы
    // =========================================================================

    std::optional<domain::Balance> findBalance(domain::AccountId accountId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = balances_.find(accountId);
        if (it == balances_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    domain::Balance createBalanceIfAbsent(domain::AccountId accountId) override {
        std::unique_lock<std::mutex> lock(mutex_);
        auto it = balances_.find(accountId);
        if (it != balances_.end()) {
            return it->second;
        }

        // Строку может создавать незакоммиченная единица работы - ждём её
        rowReleased_.wait(lock, [this, accountId]() { return lockedBalances_.count(accountId) == 0; });

        it = balances_.find(accountId);
        if (it != balances_.end()) {
            return it->second;
        }
        auto created = domain::Balance(accountId, domain::Money::zero(), clock_());
        balances_.emplace(accountId, created);
        std::cout << "[InMemoryLedgerStore] Created balance row for account " << accountId << std::endl;
        return created;
    }

    std::vector<domain::AccountId> listAccountIds() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::AccountId> ids;
        ids.reserve(balances_.size());
        for (const auto& [id, balance] : balances_) {
            ids.push_back(id);
        }
        return ids;
    }

    // =========================================================================
    // История
    // =========================================================================

    std::vector<domain::BalanceHistoryEntry> findHistory(
        domain::AccountId accountId, std::size_t limit, std::size_t offset) override
    {
        auto entries = historyOf(accountId);
        if (offset >= entries.size()) {
            return {};
        }
        auto first = entries.begin() + static_cast<std::ptrdiff_t>(offset);
        auto last = entries.begin() + static_cast<std::ptrdiff_t>(std::min(entries.size(), offset + limit));
        return std::vector<domain::BalanceHistoryEntry>(first, last);
    }

    std::optional<domain::BalanceHistoryEntry> findLatestHistoryAt(
        domain::AccountId accountId, const domain::Timestamp& at) override
    {
        for (const auto& entry : historyOf(accountId)) {
            if (entry.createdAt <= at) {
                return entry;
            }
        }
        return std::nullopt;
    }

    domain::Money sumHistoryChanges(domain::AccountId accountId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        domain::Money total;
        try {
            for (const auto& entry : history_) {
                if (entry.accountId == accountId) {
                    total += entry.changeAmount;
                }
            }
        } catch (const std::overflow_error& e) {
            throw domain::StorageError("history sum for account " + std::to_string(accountId) +
                                       " out of range: " + e.what());
        }
        return total;
    }

    // =========================================================================
    // Транзакции
    // =========================================================================

    std::optional<domain::Transaction> findTransaction(domain::TransactionId transactionId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = transactions_.find(transactionId);
        if (it == transactions_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<domain::Transaction> findTransactionsByAccount(
        domain::AccountId accountId, std::size_t limit, std::size_t offset) override
    {
        std::vector<domain::Transaction> result;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& [id, tx] : transactions_) {
                if (tx.sourceAccount == accountId || tx.destAccount == accountId) {
                    result.push_back(tx);
                }
            }
        }

        // Новые первые
        std::sort(result.begin(), result.end(),
            [](const domain::Transaction& a, const domain::Transaction& b) {
                if (a.createdAt == b.createdAt) return a.id > b.id;
                return a.createdAt > b.createdAt;
            });

        if (offset >= result.size()) {
            return {};
        }
        result.erase(result.begin(), result.begin() + static_cast<std::ptrdiff_t>(offset));
        if (result.size() > limit) {
            result.resize(limit);
        }
        return result;
    }

    /**
     * @brief Число транзакций со статусом (для тестов и диагностики)
     */
    std::size_t countTransactions(domain::TransactionStatus status) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<std::size_t>(std::count_if(transactions_.begin(), transactions_.end(),
            [status](const auto& item) { return item.second.status == status; }));
    }

    std::size_t historySize() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return history_.size();
    }

private:
    /**
     * @brief Единица работы: staged-изменения + захваченные строки
     */
    class Unit : public ports::output::ILedgerUnitOfWork {
    public:
        explicit Unit(InMemoryLedgerStore& store) : store_(store) {}

        ~Unit() override {
            rollback();
        }

        ports::output::LockedBalance lockBalance(domain::AccountId accountId) override {
            ensureActive();
            if (heldBalances_.count(accountId)) {
                return {stagedBalances_.at(accountId), false};
            }

            std::unique_lock<std::mutex> lock(store_.mutex_);
            store_.rowReleased_.wait(lock, [this, accountId]() {
                return store_.lockedBalances_.count(accountId) == 0;
            });
            store_.lockedBalances_.insert(accountId);
            heldBalances_.insert(accountId);

            ports::output::LockedBalance locked;
            auto it = store_.balances_.find(accountId);
            if (it != store_.balances_.end()) {
                locked.balance = it->second;
            } else {
                locked.balance = domain::Balance(accountId, domain::Money::zero(), store_.clock_());
                locked.created = true;
            }
            stagedBalances_[accountId] = locked.balance;
            return locked;
        }

        domain::Balance writeBalance(domain::AccountId accountId, const domain::Money& amount) override {
            ensureActive();
            if (!heldBalances_.count(accountId)) {
                throw domain::StorageError("balance row for account " + std::to_string(accountId) + " is not locked");
            }
            auto updated = domain::Balance(accountId, amount, store_.clock_());
            stagedBalances_[accountId] = updated;
            return updated;
        }

        domain::HistoryEntryId appendHistory(const domain::BalanceHistoryEntry& entry) override {
            ensureActive();
            domain::BalanceHistoryEntry staged = entry;
            staged.id = store_.nextHistoryId_++;
            staged.createdAt = store_.clock_();
            stagedHistory_.push_back(staged);
            return staged.id;
        }

        domain::Transaction insertTransaction(const domain::Transaction& transaction) override {
            ensureActive();
            domain::Transaction staged = transaction;
            staged.id = store_.nextTransactionId_++;
            staged.createdAt = store_.clock_();
            {
                // Новая строка заблокирована вставившей её единицей работы
                std::lock_guard<std::mutex> lock(store_.mutex_);
                store_.lockedTransactions_.insert(staged.id);
            }
            heldTransactions_.insert(staged.id);
            stagedTransactions_[staged.id] = staged;
            return staged;
        }

        std::optional<domain::Transaction> lockTransaction(domain::TransactionId transactionId) override {
            ensureActive();
            if (heldTransactions_.count(transactionId)) {
                return stagedTransactions_.at(transactionId);
            }

            std::unique_lock<std::mutex> lock(store_.mutex_);
            store_.rowReleased_.wait(lock, [this, transactionId]() {
                return store_.lockedTransactions_.count(transactionId) == 0;
            });

            auto it = store_.transactions_.find(transactionId);
            if (it == store_.transactions_.end()) {
                return std::nullopt;
            }
            store_.lockedTransactions_.insert(transactionId);
            heldTransactions_.insert(transactionId);
            stagedTransactions_[transactionId] = it->second;
            return it->second;
        }

        void updateTransactionStatus(domain::TransactionId transactionId, domain::TransactionStatus status) override {
            ensureActive();
            auto it = stagedTransactions_.find(transactionId);
            if (it == stagedTransactions_.end()) {
                throw domain::StorageError("transaction " + std::to_string(transactionId) + " is not locked");
            }
            it->second.status = status;
        }

        void commit() override {
            ensureActive();
            {
                std::lock_guard<std::mutex> lock(store_.mutex_);
                for (const auto& [id, balance] : stagedBalances_) {
                    store_.balances_[id] = balance;
                }
                for (const auto& [id, tx] : stagedTransactions_) {
                    store_.transactions_[id] = tx;
                }
                store_.history_.insert(store_.history_.end(), stagedHistory_.begin(), stagedHistory_.end());
                releaseLocked();
            }
            store_.rowReleased_.notify_all();
            finished_ = true;
            committed_ = true;
        }

        void rollback() override {
            if (finished_) return;
            {
                std::lock_guard<std::mutex> lock(store_.mutex_);
                releaseLocked();
            }
            store_.rowReleased_.notify_all();
            stagedBalances_.clear();
            stagedHistory_.clear();
            stagedTransactions_.clear();
            finished_ = true;
        }

        bool isCommitted() const override { return committed_; }

    private:
        InMemoryLedgerStore& store_;
        std::set<domain::AccountId> heldBalances_;
        std::set<domain::TransactionId> heldTransactions_;
        std::map<domain::AccountId, domain::Balance> stagedBalances_;
        std::vector<domain::BalanceHistoryEntry> stagedHistory_;
        std::map<domain::TransactionId, domain::Transaction> stagedTransactions_;
        bool finished_ = false;
        bool committed_ = false;

        void ensureActive() const {
            if (finished_) {
                throw domain::StorageError("unit of work already finished");
            }
        }

        // Вызывается под store_.mutex_
        void releaseLocked() {
            for (auto id : heldBalances_) {
                store_.lockedBalances_.erase(id);
            }
            for (auto id : heldTransactions_) {
                store_.lockedTransactions_.erase(id);
            }
            heldBalances_.clear();
            heldTransactions_.clear();
        }
    };

    mutable std::mutex mutex_;
    std::condition_variable rowReleased_;

    std::map<domain::AccountId, domain::Balance> balances_;
    std::map<domain::TransactionId, domain::Transaction> transactions_;
    std::vector<domain::BalanceHistoryEntry> history_;

    std::set<domain::AccountId> lockedBalances_;
    std::set<domain::TransactionId> lockedTransactions_;

    std::atomic<int64_t> nextHistoryId_{1};
    std::atomic<int64_t> nextTransactionId_{1};
    Clock clock_;

    /**
     * @brief Закоммиченная история счёта, от новых к старым
     */
    std::vector<domain::BalanceHistoryEntry> historyOf(domain::AccountId accountId) const {
        std::vector<domain::BalanceHistoryEntry> entries;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& entry : history_) {
                if (entry.accountId == accountId) {
                    entries.push_back(entry);
                }
            }
        }
        std::sort(entries.begin(), entries.end(),
            [](const domain::BalanceHistoryEntry& a, const domain::BalanceHistoryEntry& b) {
                if (a.createdAt == b.createdAt) return a.id > b.id;
                return a.createdAt > b.createdAt;
            });
        return entries;
    }
};

} // namespace ledger::adapters::secondary
