//
// Created by redeg on 26/04/2025.
//

#include "thermal/ReceiptPrinter.hpp"
#include "logger/Logger.hpp"

namespace thermal {

    ReceiptPrinter::ReceiptPrinter(std::shared_ptr<link::PrinterLink> link,
                                   std::shared_ptr<transport::TransportWriter> writer,
                                   receipt::ReceiptLayout layout)
            : link_(std::move(link)),
              writer_(std::move(writer)),
              composer_(std::move(layout)) {
    }

    types::Result ReceiptPrinter::print(const receipt::models::Receipt &receipt) const {
        Logger::logInfo("[ReceiptPrinter] Printing \"" + receipt.title + "\" on " +
                        command::paperProfileToString(composer_.layout().paper) + " paper");
        return printJob(composer_.compose(receipt));
    }

    types::Result ReceiptPrinter::printTest() const {
        Logger::logInfo("[ReceiptPrinter] Test print requested");
        return print(receipt::ReceiptComposer::testReceipt());
    }

    types::Result ReceiptPrinter::printJob(const receipt::PrintJob &job) const {
        if (job.substitutedCharacters > 0) {
            Logger::logWarning("[ReceiptPrinter] " + std::to_string(job.substitutedCharacters) +
                               " characters not printable, replaced with '?'");
        }

        types::Result result = writer_->sendSequence(*link_, job.buffers);

        if (result.isSuccess()) {
            Logger::logInfo("[ReceiptPrinter] Receipt sent: " + std::to_string(job.size()) + " commands, " +
                            std::to_string(result.bytesWritten) + " bytes");
            return result;
        }

        std::string failed = "n/a";
        if (result.commandIndex && *result.commandIndex < job.descriptions.size()) {
            failed = std::to_string(*result.commandIndex) + " " + job.descriptions[*result.commandIndex];
        }
        Logger::logError("[ReceiptPrinter] Receipt incomplete (" + types::resultCodeToString(result.code) +
                         ") at command " + failed + ", " + std::to_string(result.bytesWritten) +
                         " bytes already printed");
        return result;
    }

} // namespace thermal
