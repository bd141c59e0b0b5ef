#pragma once

#include "thermal/types/Bytes.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace thermal::receipt {

    /**
     * @brief Encoded buffers in print order, ready for TransportWriter::sendSequence.
     *
     * descriptions[i] names buffers[i] in logs.
     */
    struct PrintJob {
        std::vector<types::Bytes> buffers;
        std::vector<std::string> descriptions;
        size_t substitutedCharacters = 0;

        size_t size() const { return buffers.size(); }

        size_t totalBytes() const {
            size_t total = 0;
            for (const auto &buffer: buffers) total += buffer.size();
            return total;
        }
    };

}
