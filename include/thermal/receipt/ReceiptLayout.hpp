#pragma once

#include "thermal/command/PaperProfile.hpp"
#include <optional>
#include <string>

namespace thermal::receipt {

    enum class HeaderFont {
        Small,
        Normal,
        Large
    };

    std::optional<HeaderFont> parseHeaderFont(const std::string &value);

    struct ReceiptLabels {
        std::string date = "Date";
        std::string name = "Name";
        std::string phone = "Tel";
        std::string address = "Address";
        std::string total = "TOTAL";
        std::string defaultFooter = "Thank You";
    };

    /**
     * @brief Formatting policy for a receipt, independent of its content.
     */
    struct ReceiptLayout {
        command::PaperProfile paper = command::PaperProfile::Narrow;
        HeaderFont headerFont = HeaderFont::Large;
        bool boldHeaders = true;
        bool includePhone = false;
        bool includeAddress = false;
        int extraFeeds = 3;
        std::string currency = "RM";
        ReceiptLabels labels;
    };

}
