#pragma once

#include "thermal/command/PrinterCommand.hpp"
#include "thermal/receipt/PrintJob.hpp"
#include "thermal/receipt/ReceiptLayout.hpp"
#include "thermal/receipt/models/Receipt.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace thermal::receipt {

/**
 * @brief Lays out a receipt as an ordered list of encoded ESC/POS buffers.
 *
 * Order: header, customer info, items, total, footer, trailing feeds.
 */
    class ReceiptComposer {
    public:
        explicit ReceiptComposer(ReceiptLayout layout);

        PrintJob compose(const models::Receipt &receipt) const;

        /**
         * @brief Fixed receipt used to check a freshly paired printer.
         */
        static models::Receipt testReceipt();

        /**
         * @brief "RM 10.00" style amount.
         */
        std::string formatAmount(int64_t minorUnits) const;

        /**
         * @brief Name and price on one line of the paper width, or on two lines when they do not fit.
         */
        std::vector<std::string> itemLines(const models::ReceiptItem &item) const;

        const ReceiptLayout &layout() const { return layout_; }

    private:
        ReceiptLayout layout_;

        static void append(PrintJob &job, const command::PrinterCommand &printerCommand);

        static void appendLine(PrintJob &job, const std::string &text);

        void appendSeparator(PrintJob &job) const;

        command::PrinterCommand headerFontCommand() const;
    };

}
