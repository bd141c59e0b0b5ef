//
// Created by redeg on 26/04/2025.
//

#include "thermal/CommandEncoder.hpp"

namespace thermal {

    namespace {
        constexpr uint8_t ESC = 0x1B;
        constexpr uint8_t GS = 0x1D;
        constexpr uint8_t LF = 0x0A;

        // Length of a UTF-8 sequence from its lead byte, 0 if the byte cannot start one.
        size_t sequenceLength(uint8_t lead) {
            if (lead < 0x80) return 1;
            if ((lead & 0xE0) == 0xC0) return lead >= 0xC2 ? 2 : 0;
            if ((lead & 0xF0) == 0xE0) return 3;
            if ((lead & 0xF8) == 0xF0) return lead <= 0xF4 ? 4 : 0;
            return 0;
        }

        // Rejects overlong forms, UTF-16 surrogates and values past U+10FFFF.
        bool isScalarValue(uint32_t codePoint, size_t length) {
            static constexpr uint32_t minimum[] = {0, 0, 0x80, 0x800, 0x10000};
            if (codePoint < minimum[length]) return false;
            if (codePoint >= 0xD800 && codePoint <= 0xDFFF) return false;
            return codePoint <= 0x10FFFF;
        }
    }

    using command::CommandType;
    using command::PaperProfile;

    types::Bytes CommandEncoder::encode(const command::PrinterCommand &command) {
        switch (command.type) {
            case CommandType::Init:
                return {ESC, '@'};
            case CommandType::AlignLeft:
                return {ESC, 'a', 0x00};
            case CommandType::AlignCenter:
                return {ESC, 'a', 0x01};
            case CommandType::BoldOn:
                return {ESC, 'E', 0x01};
            case CommandType::BoldOff:
                return {ESC, 'E', 0x00};
            case CommandType::FontNormal:
                return {GS, '!', 0x00};
            case CommandType::FontLarge:
                return {GS, '!', 0x11};
            case CommandType::FontDoubleHeight:
                return {GS, '!', 0x01};
            case CommandType::Feed:
                return {LF};
            case CommandType::Text:
                return encodeText(command.text).bytes;
        }
        return {};
    }

    std::vector<types::Bytes> CommandEncoder::encodeAll(const std::vector<command::PrinterCommand> &commands) {
        std::vector<types::Bytes> buffers;
        buffers.reserve(commands.size());
        for (const auto &command: commands) {
            buffers.push_back(encode(command));
        }
        return buffers;
    }

    CommandEncoder::TextEncoding CommandEncoder::encodeText(const std::string &text) {
        TextEncoding result;
        result.bytes.reserve(text.size());

        size_t i = 0;
        while (i < text.size()) {
            const auto lead = static_cast<uint8_t>(text[i]);
            size_t length = sequenceLength(lead);

            uint32_t codePoint = 0;
            bool valid = length > 0 && i + length <= text.size();
            if (valid) {
                codePoint = length == 1 ? lead : (lead & (0xFF >> (length + 1)));
                for (size_t k = 1; k < length; ++k) {
                    const auto next = static_cast<uint8_t>(text[i + k]);
                    if ((next & 0xC0) != 0x80) {
                        valid = false;
                        break;
                    }
                    codePoint = (codePoint << 6) | (next & 0x3F);
                }
                valid = valid && isScalarValue(codePoint, length);
            }

            if (!valid) {
                // One fallback per stray byte, resynchronise on the next one
                result.bytes.push_back(FALLBACK_BYTE);
                result.substituted++;
                i++;
                continue;
            }

            if (isRepresentable(codePoint)) {
                result.bytes.push_back(static_cast<uint8_t>(codePoint));
            } else {
                result.bytes.push_back(FALLBACK_BYTE);
                result.substituted++;
            }
            i += length;
        }

        return result;
    }

    types::Bytes CommandEncoder::separator(PaperProfile profile) {
        types::Bytes line(columnWidth(profile), '-');
        line.push_back(LF);
        return line;
    }

    size_t CommandEncoder::columnWidth(PaperProfile profile) {
        return profile == PaperProfile::Wide ? WIDE_COLUMNS : NARROW_COLUMNS;
    }

    bool CommandEncoder::isRepresentable(uint32_t codePoint) {
        if (codePoint >= 0x20 && codePoint <= 0x7E) return true;
        return codePoint == '\n' || codePoint == '\r' || codePoint == '\t';
    }

} // namespace thermal
