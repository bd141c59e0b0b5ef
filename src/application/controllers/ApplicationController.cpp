//
// Created by Andrea on 23/08/2025.
//

#include "application/controllers/ApplicationController.hpp"
#include "application/config/ConfigManager.hpp"
#include "thermal/receipt/ReceiptLoader.hpp"
#include "thermal/types/Error.hpp"
#include "logger/Logger.hpp"

using thermal::config::ConfigManager;

ApplicationController::ApplicationController(const std::atomic<bool> *interruptFlag)
        : eventLogger_(std::make_shared<JobEventLogger>()),
          interruptFlag_(interruptFlag),
          initializationComplete_(false) {
    thermal::events::EventBus::getInstance().subscribe(eventLogger_);
}

ApplicationController::~ApplicationController() {
    shutdown();
}

bool ApplicationController::initialize(const std::string &configPath) {
    Logger::logInfo("[ApplicationController] Starting thermal print driver");

    Logger::logInfo("[ApplicationController] [1/3] Loading configuration...");
    if (!initializeConfig(configPath)) {
        Logger::logError("[ApplicationController] Configuration invalid");
        return false;
    }

    Logger::logInfo("[ApplicationController] [2/3] Opening printer link...");
    if (!initializeLink()) {
        Logger::logError("[ApplicationController] Printer link unavailable");
        return false;
    }

    Logger::logInfo("[ApplicationController] [3/3] Creating receipt printer...");
    try {
        auto &config = ConfigManager::getInstance();
        auto linkConfig = config.getLinkConfig();
        writer_ = std::make_shared<thermal::transport::TransportWriter>(
                static_cast<size_t>(linkConfig.chunkSize), std::chrono::milliseconds(linkConfig.writeTimeoutMs));
        writer_->setAbortFlag(interruptFlag_);
        printer_ = std::make_unique<thermal::ReceiptPrinter>(link_, writer_, config.getReceiptLayout());
    } catch (const thermal::types::DriverException &e) {
        Logger::logError("[ApplicationController] " + std::string(e.what()));
        return false;
    }

    initializationComplete_ = true;
    Logger::logInfo("[ApplicationController] Ready, chunk limit " +
                    std::to_string(writer_->chunkLimitFor(*link_)) + " bytes");
    return true;
}

bool ApplicationController::initializeConfig(const std::string &configPath) {
    auto &config = ConfigManager::getInstance();
    config.loadFromFile(configPath);
    config.loadFromEnv();

    auto validation = config.validate();
    for (const auto &error: validation.errors) {
        Logger::logError("[ApplicationController] Config: " + error);
    }
    if (!validation.isValid) return false;

    Logger::reconfigure(config.getLoggerOptions());
    return true;
}

bool ApplicationController::initializeLink() {
    auto linkConfig = ConfigManager::getInstance().getLinkConfig();
    try {
        characteristic_ = std::make_shared<thermal::link::SerialGattCharacteristic>(
                linkConfig.devicePath, static_cast<uint32_t>(linkConfig.baudRate),
                static_cast<size_t>(linkConfig.chunkSize));
    } catch (const thermal::types::LinkOpenException &e) {
        Logger::logError("[ApplicationController] " + std::string(e.what()));
        return false;
    }

    link_ = std::make_shared<thermal::link::PrinterLink>(characteristic_);
    return true;
}

int ApplicationController::printReceiptFile(const std::string &receiptPath) {
    if (!initializationComplete_) {
        Logger::logError("[ApplicationController] Not initialized");
        return 1;
    }

    try {
        auto receipt = thermal::receipt::ReceiptLoader::loadFromFile(receiptPath);
        return exitCodeFor(printer_->print(receipt));
    } catch (const thermal::types::ReceiptFormatException &e) {
        Logger::logError("[ApplicationController] " + std::string(e.what()));
        return 1;
    }
}

int ApplicationController::printTest() {
    if (!initializationComplete_) {
        Logger::logError("[ApplicationController] Not initialized");
        return 1;
    }
    return exitCodeFor(printer_->printTest());
}

void ApplicationController::shutdown() {
    if (!initializationComplete_ && !link_) {
        return;
    }

    Logger::logInfo("[ApplicationController] Shutting down");
    initializationComplete_ = false;
    printer_.reset();
    writer_.reset();
    link_.reset();
    characteristic_.reset();
}

int ApplicationController::exitCodeFor(const thermal::types::Result &result) const {
    if (result.isSuccess()) return 0;

    if (result.isDisconnected() || result.isNotConnected()) {
        Logger::logError("[ApplicationController] Printer disconnected, reconnect and print the receipt again");
    } else {
        Logger::logError("[ApplicationController] Printer did not accept data, check paper and power");
    }
    return 1;
}

void ApplicationController::JobEventLogger::onEvent(const thermal::events::Event &event) {
    Logger::logInfo("[Event] " + thermal::events::eventTypeToString(event.type) + " from " + event.source +
                    (event.message.empty() ? "" : ": " + event.message));
}
