#include "application/controllers/ApplicationController.hpp"
#include "logger/Logger.hpp"
#include <atomic>
#include <csignal>
#include <cstring>
#include <iostream>
#include <string>

std::atomic<bool> interrupted{false};
static_assert(std::atomic<bool>::is_always_lock_free, "interrupt flag is written from a signal handler");

// Only async-signal-safe work here; the transport writer polls the flag between chunks
void handleSignal(int) {
    interrupted.store(true);
}

void printUsage(const char *program) {
    std::cerr << "Usage: " << program << " [--config <file>] (--test | <receipt.json>)" << std::endl;
}

int main(int argc, char *argv[]) {
    std::string configPath = "config.json";
    std::string receiptPath;
    bool testPrint = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            configPath = argv[++i];
        } else if (std::strcmp(argv[i], "--test") == 0) {
            testPrint = true;
        } else if (std::strcmp(argv[i], "--help") == 0) {
            printUsage(argv[0]);
            return 0;
        } else if (argv[i][0] != '-' && receiptPath.empty()) {
            receiptPath = argv[i];
        } else {
            printUsage(argv[0]);
            return 1;
        }
    }

    if (!testPrint && receiptPath.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    int exitCode = 1;
    try {
        Logger::init();
        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        ApplicationController app(&interrupted);

        if (app.initialize(configPath)) {
            exitCode = testPrint ? app.printTest() : app.printReceiptFile(receiptPath);
        } else {
            Logger::logError("Application initialization failed");
        }

        if (interrupted) {
            Logger::logWarning("Interrupted by signal, print job aborted");
        }
        app.shutdown();
    } catch (const std::exception &ex) {
        Logger::logError("Fatal error: " + std::string(ex.what()));
        exitCode = 1;
    }

    Logger::shutdown();
    return exitCode;
}
