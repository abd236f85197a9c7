#include "LedgerApp.hpp"

#include "application/AccountGuard.hpp"
#include "application/BalanceService.hpp"
#include "application/BalanceWriter.hpp"
#include "application/TransactionService.hpp"
#include "adapters/secondary/persistence/PostgresLedgerStore.hpp"
#include "domain/JsonMapping.hpp"
#include <boost/di.hpp>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

namespace di = boost::di;

namespace ledger {

LedgerApp::LedgerApp()
{
    std::cout << "[LedgerApp] Application created" << std::endl;
}

LedgerApp::~LedgerApp()
{
    std::cout << "[LedgerApp] Application destroyed" << std::endl;
}

int LedgerApp::run(int argc, char* argv[])
{
    loadEnvironment(argc, argv);
    configureInjection();
    return start();
}

void LedgerApp::stop()
{
    stopRequested_ = true;
}

void LedgerApp::loadEnvironment(int argc, char* argv[])
{
    std::cout << "[LedgerApp] Loading environment..." << std::endl;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--reconcile-once") {
            reconcileOnce_ = true;
        } else {
            std::cerr << "[LedgerApp] Unknown argument ignored: " << arg << std::endl;
        }
    }

    dbSettings_ = std::make_shared<settings::DbSettings>(settings::DbSettings::fromEnvironment());
    ledgerSettings_ = std::make_shared<settings::LedgerSettings>(settings::LedgerSettings::fromEnvironment());

    std::cout << "[LedgerApp] Environment loaded: db=" << dbSettings_->getHost() << ":" << dbSettings_->getPort()
              << "/" << dbSettings_->getName()
              << " stripes=" << ledgerSettings_->getGuardStripes()
              << " history=" << settings::toString(ledgerSettings_->getHistoryPolicy())
              << " precheck=" << (ledgerSettings_->isAdvisoryPrecheckEnabled() ? "on" : "off")
              << std::endl;
}

void LedgerApp::configureInjection()
{
    std::cout << "[LedgerApp] Configuring DI..." << std::endl;

    auto injector = di::make_injector(
        di::bind<settings::DbSettings>().to(dbSettings_),
        di::bind<settings::LedgerSettings>().to(ledgerSettings_),

        di::bind<ports::output::ILedgerStore>().to<adapters::secondary::PostgresLedgerStore>().in(di::singleton),

        di::bind<application::AccountGuard>().in(di::singleton),
        di::bind<application::BalanceWriter>().in(di::singleton),
        di::bind<ports::input::ITransactionService>().to<application::TransactionService>().in(di::singleton),
        di::bind<ports::input::IBalanceService>().to<application::BalanceService>().in(di::singleton),
        di::bind<application::ReconciliationJob>().in(di::singleton)
    );

    transactionService_ = injector.create<std::shared_ptr<ports::input::ITransactionService>>();
    balanceService_ = injector.create<std::shared_ptr<ports::input::IBalanceService>>();
    reconciliationJob_ = injector.create<std::shared_ptr<application::ReconciliationJob>>();

    std::cout << "[LedgerApp] DI configured" << std::endl;
}

int LedgerApp::start()
{
    if (reconcileOnce_) {
        std::cout << "[LedgerApp] Single reconciliation pass" << std::endl;
        auto mismatches = reconciliationJob_->runOnce();
        std::cout << domain::toJsonArray(mismatches).dump(2) << std::endl;
        if (!mismatches.empty()) {
            std::cerr << "[LedgerApp] Reconciliation found " << mismatches.size()
                      << " mismatched account(s)" << std::endl;
            return kExitDriftFound;
        }
        return kExitOk;
    }

    reconciliationJob_->start(std::chrono::duration_cast<std::chrono::milliseconds>(
        ledgerSettings_->getReconcileInterval()));

    std::cout << "[LedgerApp] Running, reconcile every "
              << ledgerSettings_->getReconcileInterval().count() << " s, Ctrl+C to stop" << std::endl;

    while (!stopRequested_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "[LedgerApp] Stop requested, shutting down..." << std::endl;
    reconciliationJob_->stop();
    std::cout << "[LedgerApp] Stopped after " << reconciliationJob_->getRunCount()
              << " reconciliation run(s)" << std::endl;
    return kExitOk;
}

} // namespace ledger
