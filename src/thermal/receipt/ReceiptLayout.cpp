#include "thermal/receipt/ReceiptLayout.hpp"
#include <algorithm>
#include <cctype>

namespace thermal::receipt {

    std::optional<HeaderFont> parseHeaderFont(const std::string &value) {
        std::string key = value;
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (key == "small") return HeaderFont::Small;
        if (key == "normal") return HeaderFont::Normal;
        if (key == "large") return HeaderFont::Large;
        return std::nullopt;
    }

}
