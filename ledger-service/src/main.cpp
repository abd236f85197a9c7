#include "LedgerApp.hpp"
#include <csignal>
#include <iostream>

namespace {

ledger::LedgerApp* g_app = nullptr;

// Только флаг остановки: вывод и завершение делает LedgerApp::start()
void onTerminate(int)
{
    if (g_app) {
        g_app->stop();
    }
}

} // namespace

int main(int argc, char* argv[])
{
    ledger::LedgerApp app;
    g_app = &app;
    std::signal(SIGINT, onTerminate);
    std::signal(SIGTERM, onTerminate);

    int exitCode = ledger::LedgerApp::kExitFailure;
    try {
        exitCode = app.run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[main] ledger-service failed: " << e.what() << std::endl;
    }

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_app = nullptr;

    std::cout << "[main] ledger-service exit code " << exitCode << std::endl;
    return exitCode;
}
