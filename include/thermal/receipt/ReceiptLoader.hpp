#pragma once

#include "thermal/receipt/models/Receipt.hpp"
#include <string>

namespace thermal::receipt {

    class ReceiptLoader {
    public:
        /**
         * @throws types::ReceiptFormatException on unreadable file, malformed JSON or invalid receipt.
         */
        static models::Receipt loadFromFile(const std::string &path);

        /**
         * @throws types::ReceiptFormatException on malformed JSON or invalid receipt.
         */
        static models::Receipt loadFromString(const std::string &document);
    };

}
