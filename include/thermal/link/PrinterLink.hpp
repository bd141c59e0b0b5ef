//
// Created by redeg on 26/04/2025.
//

#pragma once

#include "thermal/link/GattCharacteristic.hpp"
#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

namespace thermal::link {

    enum class LinkState {
        Connected,
        Disconnected
    };

    /**
     * @brief Write capability towards a connected printer.
     *
     * The link never opens or closes the device itself. Once disconnected it stays
     * disconnected; the pairing layer hands out a new link after reconnecting.
     */
    class PrinterLink {
    public:
        PrinterLink();

        explicit PrinterLink(std::shared_ptr<GattCharacteristic> characteristic, size_t payloadLimit = 0);

        PrinterLink(const PrinterLink &) = delete;

        PrinterLink &operator=(const PrinterLink &) = delete;

        LinkState state() const;

        bool isConnected() const;

        /**
         * @brief Explicit limit if one was given, else the characteristic's negotiated size, else 0.
         */
        size_t payloadLimit() const;

        /**
         * @brief The characteristic, or nullptr once disconnected.
         */
        std::shared_ptr<GattCharacteristic> characteristic() const;

        /**
         * @brief Device-initiated or detected disconnect. Safe from any thread, idempotent.
         */
        void markDisconnected(const std::string &reason);

        /**
         * @brief Held by the transport for the whole duration of a job.
         */
        std::mutex &jobMutex() { return jobMutex_; }

    private:
        std::shared_ptr<GattCharacteristic> characteristic_;
        size_t payloadLimit_;
        std::atomic<bool> connected_;
        mutable std::mutex stateMutex_;
        std::mutex jobMutex_;
    };

    std::string linkStateToString(LinkState state);

} // namespace thermal::link
