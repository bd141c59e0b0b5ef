#include "thermal/types/Bytes.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>

namespace thermal::types {

    std::string toHex(const Bytes &bytes, size_t maxBytes) {
        std::ostringstream oss;
        size_t shown = std::min(bytes.size(), maxBytes);
        for (size_t i = 0; i < shown; ++i) {
            if (i > 0) oss << ' ';
            oss << std::uppercase << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
        }
        if (bytes.size() > shown) {
            oss << " ... (" << std::dec << bytes.size() << " bytes)";
        }
        return oss.str();
    }

}
