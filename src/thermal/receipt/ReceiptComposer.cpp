#include "thermal/receipt/ReceiptComposer.hpp"
#include "thermal/CommandEncoder.hpp"
#include <cstdint>
#include <iomanip>
#include <sstream>

namespace thermal::receipt {

    using command::PrinterCommand;

    ReceiptComposer::ReceiptComposer(ReceiptLayout layout)
            : layout_(std::move(layout)) {
    }

    PrintJob ReceiptComposer::compose(const models::Receipt &receipt) const {
        PrintJob job;

        // Header
        append(job, PrinterCommand::init());
        append(job, PrinterCommand::alignCenter());
        if (layout_.boldHeaders) append(job, PrinterCommand::boldOn());
        append(job, headerFontCommand());
        appendLine(job, receipt.title);
        append(job, PrinterCommand::fontNormal());
        if (layout_.boldHeaders) append(job, PrinterCommand::boldOff());
        for (const auto &line: receipt.headerLines) {
            appendLine(job, line);
        }
        appendSeparator(job);

        // Customer
        const auto &labels = layout_.labels;
        append(job, PrinterCommand::alignLeft());
        if (!receipt.date.empty()) appendLine(job, labels.date + ": " + receipt.date);
        if (!receipt.customerName.empty()) appendLine(job, labels.name + ": " + receipt.customerName);
        if (layout_.includePhone && !receipt.phone.empty()) {
            appendLine(job, labels.phone + ": " + receipt.phone);
        }
        if (layout_.includeAddress && !receipt.address.empty()) {
            appendLine(job, labels.address + ": " + receipt.address);
        }
        appendSeparator(job);

        // Items
        for (const auto &item: receipt.items) {
            for (const auto &line: itemLines(item)) {
                appendLine(job, line);
            }
        }
        appendSeparator(job);

        // Total
        append(job, PrinterCommand::alignCenter());
        append(job, PrinterCommand::boldOn());
        append(job, PrinterCommand::fontDoubleHeight());
        appendLine(job, labels.total + ": " + formatAmount(receipt.totalMinor));
        append(job, PrinterCommand::fontNormal());
        append(job, PrinterCommand::boldOff());

        // Footer
        appendLine(job, receipt.footer.empty() ? labels.defaultFooter : receipt.footer);
        for (int i = 0; i < layout_.extraFeeds; ++i) {
            append(job, PrinterCommand::feed());
        }

        return job;
    }

    models::Receipt ReceiptComposer::testReceipt() {
        models::Receipt receipt;
        receipt.title = "TEST PRINT";
        receipt.headerLines = {"Printer self test"};
        receipt.customerName = "TEST PRINT";
        receipt.items.emplace_back("TEST SERVICE", 1000);
        receipt.totalMinor = receipt.itemsTotal();
        return receipt;
    }

    std::string ReceiptComposer::formatAmount(int64_t minorUnits) const {
        std::ostringstream oss;
        if (!layout_.currency.empty()) oss << layout_.currency << ' ';
        if (minorUnits < 0) oss << '-';
        // INT64_MIN has no positive int64 counterpart
        const uint64_t magnitude = minorUnits < 0 ? 0 - static_cast<uint64_t>(minorUnits)
                                                  : static_cast<uint64_t>(minorUnits);
        oss << magnitude / 100 << '.' << std::setw(2) << std::setfill('0') << magnitude % 100;
        return oss.str();
    }

    std::vector<std::string> ReceiptComposer::itemLines(const models::ReceiptItem &item) const {
        const size_t width = CommandEncoder::columnWidth(layout_.paper);
        const std::string amount = formatAmount(item.priceMinor);
        // Printed width, one column per code point
        const size_t nameWidth = CommandEncoder::encodeText(item.name).bytes.size();

        if (nameWidth + 1 + amount.size() <= width) {
            return {item.name + std::string(width - nameWidth - amount.size(), ' ') + amount};
        }

        const size_t padding = amount.size() < width ? width - amount.size() : 0;
        return {item.name, std::string(padding, ' ') + amount};
    }

    void ReceiptComposer::append(PrintJob &job, const PrinterCommand &printerCommand) {
        if (printerCommand.type == command::CommandType::Text) {
            auto encoded = CommandEncoder::encodeText(printerCommand.text);
            job.substitutedCharacters += encoded.substituted;
            job.buffers.push_back(std::move(encoded.bytes));
        } else {
            job.buffers.push_back(CommandEncoder::encode(printerCommand));
        }
        job.descriptions.push_back(command::describe(printerCommand));
    }

    void ReceiptComposer::appendLine(PrintJob &job, const std::string &text) {
        append(job, PrinterCommand::textOf(text));
        append(job, PrinterCommand::feed());
    }

    void ReceiptComposer::appendSeparator(PrintJob &job) const {
        job.buffers.push_back(CommandEncoder::separator(layout_.paper));
        job.descriptions.push_back("Separator(" + command::paperProfileToString(layout_.paper) + ")");
    }

    PrinterCommand ReceiptComposer::headerFontCommand() const {
        switch (layout_.headerFont) {
            case HeaderFont::Small:
                return PrinterCommand::fontNormal();
            case HeaderFont::Normal:
                return PrinterCommand::fontDoubleHeight();
            case HeaderFont::Large:
            default:
                return PrinterCommand::fontLarge();
        }
    }

}
