//
// Created by redeg on 26/04/2025.
//

#pragma once

#include "thermal/command/PrinterCommand.hpp"
#include "thermal/command/PaperProfile.hpp"
#include "thermal/types/Bytes.hpp"
#include <string>
#include <vector>
#include <cstddef>

namespace thermal {

/**
 * @brief Traduce i comandi ESC/POS nelle sequenze di byte attese dalla stampante.
 *
 * Stateless: every call depends only on its arguments.
 */
    class CommandEncoder {
    public:
        static constexpr uint8_t FALLBACK_BYTE = '?';
        static constexpr size_t NARROW_COLUMNS = 32;
        static constexpr size_t WIDE_COLUMNS = 48;

        struct TextEncoding {
            types::Bytes bytes;
            size_t substituted = 0;
        };

        /**
         * @brief Bytes for a single command. Never fails.
         * @param command Command to encode.
         * @return Fixed literal for control commands, single-byte text for Text.
         */
        static types::Bytes encode(const command::PrinterCommand &command);

        /**
         * @brief Encodes a command list preserving its order.
         */
        static std::vector<types::Bytes> encodeAll(const std::vector<command::PrinterCommand> &commands);

        /**
         * @brief UTF-8 text to printer bytes, counting substituted characters.
         *
         * Printable ASCII plus LF, CR and TAB pass through; any other code point and any
         * malformed UTF-8 byte become FALLBACK_BYTE.
         */
        static TextEncoding encodeText(const std::string &text);

        /**
         * @brief Dash line as wide as the paper, terminated by LF.
         */
        static types::Bytes separator(command::PaperProfile profile);

        static size_t columnWidth(command::PaperProfile profile);

    private:
        static bool isRepresentable(uint32_t codePoint);
    };

}
