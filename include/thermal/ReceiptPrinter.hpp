//
// Created by redeg on 26/04/2025.
//

#pragma once

#include "thermal/link/PrinterLink.hpp"
#include "thermal/transport/TransportWriter.hpp"
#include "thermal/receipt/ReceiptComposer.hpp"
#include "thermal/types/Result.hpp"
#include <memory>

namespace thermal {
    /**
     * @brief Main entry point of the driver: composes receipts and sends them to the link.
     */
    class ReceiptPrinter {
    public:
        ReceiptPrinter(std::shared_ptr<link::PrinterLink> link,
                       std::shared_ptr<transport::TransportWriter> writer,
                       receipt::ReceiptLayout layout);

        types::Result print(const receipt::models::Receipt &receipt) const;

        types::Result printTest() const;

        /**
         * @brief Sends an already composed job and logs the outcome.
         */
        types::Result printJob(const receipt::PrintJob &job) const;

        const receipt::ReceiptComposer &composer() const { return composer_; }

    private:
        std::shared_ptr<link::PrinterLink> link_;
        std::shared_ptr<transport::TransportWriter> writer_;
        receipt::ReceiptComposer composer_;
    };
} // namespace thermal
