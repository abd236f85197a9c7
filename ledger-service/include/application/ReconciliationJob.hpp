// ledger-service/include/application/ReconciliationJob.hpp
#pragma once

#include "ports/input/IBalanceService.hpp"
#include "ports/output/ILedgerStore.hpp"
#include "domain/LedgerErrors.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace ledger::application {

/**
 * @brief Периодическая сверка всех счетов
 *
 * Находит расхождения между balances и balance_history (например, после
 * потерянной записи истории в режиме BEST_EFFORT). Только отчёт.
 */
class ReconciliationJob {
public:
    ReconciliationJob(
        std::shared_ptr<ports::output::ILedgerStore> store,
        std::shared_ptr<ports::input::IBalanceService> balanceService
    ) : store_(std::move(store))
      , balanceService_(std::move(balanceService))
      , running_(false)
      , runCount_(0)
    {
        std::cout << "[ReconciliationJob] Created" << std::endl;
    }

    ~ReconciliationJob() {
        stop();
    }

    // Non-copyable, non-movable
    ReconciliationJob(const ReconciliationJob&) = delete;
    ReconciliationJob& operator=(const ReconciliationJob&) = delete;

    /**
     * @brief Один проход по всем счетам
     * @return отчёты только по счетам с расхождением
     *
     * Ошибка по одному счёту логируется, проход продолжается.
     */
    std::vector<domain::ReconciliationReport> runOnce() {
        std::vector<domain::ReconciliationReport> mismatches;
        auto accounts = store_->listAccountIds();

        for (auto accountId : accounts) {
            try {
                auto report = balanceService_->reconcile(accountId);
                if (!report.isConsistent()) {
                    mismatches.push_back(report);
                }
            } catch (const domain::LedgerError& e) {
                std::cerr << "[ReconciliationJob] Failed to reconcile account " << accountId
                          << ": " << e.what() << std::endl;
            }
        }

        ++runCount_;
        std::cout << "[ReconciliationJob] Checked " << accounts.size() << " accounts, "
                  << mismatches.size() << " mismatches" << std::endl;
        return mismatches;
    }

    void start(std::chrono::milliseconds interval) {
        if (running_.exchange(true)) return;

        thread_ = std::thread([this, interval]() {
            while (running_) {
                try {
                    runOnce();
                } catch (const domain::LedgerError& e) {
                    std::cerr << "[ReconciliationJob] Scan failed: " << e.what() << std::endl;
                }

                std::unique_lock<std::mutex> lock(mutex_);
                wakeup_.wait_for(lock, interval, [this]() { return !running_; });
            }
        });
        std::cout << "[ReconciliationJob] Started, interval " << interval.count() << " ms" << std::endl;
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_ = false;
        }
        wakeup_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
            std::cout << "[ReconciliationJob] Stopped" << std::endl;
        }
    }

    bool isRunning() const { return running_; }

    uint64_t getRunCount() const { return runCount_; }

private:
    std::shared_ptr<ports::output::ILedgerStore> store_;
    std::shared_ptr<ports::input::IBalanceService> balanceService_;
    std::atomic<bool> running_;
    std::atomic<uint64_t> runCount_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable wakeup_;
};

} // namespace ledger::application
