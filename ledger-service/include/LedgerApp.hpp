// ledger-service/include/LedgerApp.hpp
#pragma once

#include "application/ReconciliationJob.hpp"
#include "ports/input/IBalanceService.hpp"
#include "ports/input/ITransactionService.hpp"
#include "settings/DbSettings.hpp"
#include "settings/LedgerSettings.hpp"
#include <atomic>
#include <memory>

namespace ledger {

/**
 * @class LedgerApp
 * @brief Composition root ledger-service
 *
 * Template Method:
 * 1. loadEnvironment() - настройки из переменных окружения и аргументы
 * 2. configureInjection() - связывание портов и адаптеров через Boost.DI
 * 3. start() - фоновая сверка до stop() (или один проход с --reconcile-once)
 *
 * Сервисы транзакций и балансов собираются здесь же и отдаются через
 * transactions()/balances() транспортному слою (HTTP, очередь), который
 * подключается поверх; сам процесс вызывает только сверку.
 */
class LedgerApp {
public:
    static constexpr int kExitOk = 0;
    static constexpr int kExitFailure = 1;
    static constexpr int kExitDriftFound = 2;

    LedgerApp();
    virtual ~LedgerApp();

    /**
     * @brief Запустить приложение (блокирует до stop() в периодическом режиме)
     * @return код завершения процесса: kExitOk, или kExitDriftFound если
     *         --reconcile-once нашёл расхождения
     */
    int run(int argc, char* argv[]);

    /**
     * @brief Запросить остановку; только пишет atomic - можно из обработчика сигнала
     */
    void stop();

    std::shared_ptr<ports::input::ITransactionService> transactions() const { return transactionService_; }
    std::shared_ptr<ports::input::IBalanceService> balances() const { return balanceService_; }

protected:
    virtual void loadEnvironment(int argc, char* argv[]);
    virtual void configureInjection();
    virtual int start();

    std::shared_ptr<settings::DbSettings> dbSettings_;
    std::shared_ptr<settings::LedgerSettings> ledgerSettings_;

    std::shared_ptr<ports::input::ITransactionService> transactionService_;
    std::shared_ptr<ports::input::IBalanceService> balanceService_;
    std::shared_ptr<application::ReconciliationJob> reconciliationJob_;

private:
    bool reconcileOnce_ = false;
    std::atomic<bool> stopRequested_{false};
};

} // namespace ledger
