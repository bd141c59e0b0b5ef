//
// Created by Andrea on 23/08/2025.
//

#pragma once

#include <memory>
#include <atomic>
#include <string>

#include "thermal/link/impl/SerialGattCharacteristic.hpp"
#include "thermal/link/PrinterLink.hpp"
#include "thermal/transport/TransportWriter.hpp"
#include "thermal/ReceiptPrinter.hpp"
#include "thermal/events/EventSystem.hpp"


/**
 * @class ApplicationController
 * @brief Wires configuration, printer link, transport and receipt printer for the CLI.
 *
 * Initialization sequence:
 * 1. Configuration (file, then environment overrides, then validation)
 * 2. Printer link on the configured BLE bridge device
 * 3. Transport writer and receipt printer
 */
class ApplicationController {
public:
    /**
     * @param interruptFlag set asynchronously (signal handler) to stop the running job before its next chunk
     */
    explicit ApplicationController(const std::atomic<bool> *interruptFlag = nullptr);

    ~ApplicationController();

    /**
     * @return true if every component is ready to print
     */
    bool initialize(const std::string &configPath);

    /**
     * @return process exit code, 0 when the whole receipt was handed to the printer
     */
    int printReceiptFile(const std::string &receiptPath);

    int printTest();

    void shutdown();

private:
    class JobEventLogger : public thermal::events::IEventObserver {
    public:
        void onEvent(const thermal::events::Event &event) override;
    };

    std::shared_ptr<thermal::link::SerialGattCharacteristic> characteristic_;
    std::shared_ptr<thermal::link::PrinterLink> link_;
    std::shared_ptr<thermal::transport::TransportWriter> writer_;
    std::unique_ptr<thermal::ReceiptPrinter> printer_;
    std::shared_ptr<JobEventLogger> eventLogger_;
    const std::atomic<bool> *interruptFlag_;

    std::atomic<bool> initializationComplete_;

    bool initializeConfig(const std::string &configPath);

    bool initializeLink();

    int exitCodeFor(const thermal::types::Result &result) const;
};
