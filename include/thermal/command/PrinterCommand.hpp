//
// Created by Andrea on 18/10/2026.
//

#pragma once

#include <string>
#include <utility>

namespace thermal::command {

    /**
     * @brief Closed set of ESC/POS operations used to lay out a receipt.
     */
    enum class CommandType {
        Init,
        AlignLeft,
        AlignCenter,
        BoldOn,
        BoldOff,
        FontNormal,
        FontLarge,
        FontDoubleHeight,
        Text,
        Feed
    };

    /**
     * @brief A single printer operation. Only Text carries a payload.
     */
    struct PrinterCommand {
        CommandType type;
        std::string text;

        static PrinterCommand init() { return {CommandType::Init, {}}; }

        static PrinterCommand alignLeft() { return {CommandType::AlignLeft, {}}; }

        static PrinterCommand alignCenter() { return {CommandType::AlignCenter, {}}; }

        static PrinterCommand boldOn() { return {CommandType::BoldOn, {}}; }

        static PrinterCommand boldOff() { return {CommandType::BoldOff, {}}; }

        static PrinterCommand fontNormal() { return {CommandType::FontNormal, {}}; }

        static PrinterCommand fontLarge() { return {CommandType::FontLarge, {}}; }

        static PrinterCommand fontDoubleHeight() { return {CommandType::FontDoubleHeight, {}}; }

        static PrinterCommand feed() { return {CommandType::Feed, {}}; }

        static PrinterCommand textOf(std::string value) { return {CommandType::Text, std::move(value)}; }

        bool operator==(const PrinterCommand &other) const {
            return type == other.type && text == other.text;
        }
    };

    inline std::string commandTypeToString(CommandType type) {
        switch (type) {
            case CommandType::Init: return "Init";
            case CommandType::AlignLeft: return "AlignLeft";
            case CommandType::AlignCenter: return "AlignCenter";
            case CommandType::BoldOn: return "BoldOn";
            case CommandType::BoldOff: return "BoldOff";
            case CommandType::FontNormal: return "FontNormal";
            case CommandType::FontLarge: return "FontLarge";
            case CommandType::FontDoubleHeight: return "FontDoubleHeight";
            case CommandType::Text: return "Text";
            case CommandType::Feed: return "Feed";
            default: return "Unknown";
        }
    }

    inline std::string describe(const PrinterCommand &command) {
        if (command.type == CommandType::Text) {
            return "Text(\"" + command.text + "\")";
        }
        return commandTypeToString(command.type);
    }

}
