#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace thermal::types {

    using Bytes = std::vector<uint8_t>;

    inline Bytes toBytes(const std::string &raw) {
        return Bytes(raw.begin(), raw.end());
    }

    /**
     * @brief Hex dump ("1B 40 0A") used in log lines.
     */
    std::string toHex(const Bytes &bytes, size_t maxBytes = 32);

}
