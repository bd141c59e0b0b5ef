#include "thermal/receipt/ReceiptLoader.hpp"
#include "thermal/types/Error.hpp"
#include "logger/Logger.hpp"
#include <fstream>
#include <sstream>

namespace thermal::receipt {

    models::Receipt ReceiptLoader::loadFromFile(const std::string &path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw types::ReceiptFormatException("cannot open " + path);
        }

        std::stringstream content;
        content << file.rdbuf();

        models::Receipt receipt = loadFromString(content.str());
        Logger::logInfo("[ReceiptLoader] Loaded \"" + receipt.title + "\" with " +
                        std::to_string(receipt.items.size()) + " items from " + path);
        return receipt;
    }

    models::Receipt ReceiptLoader::loadFromString(const std::string &document) {
        models::Receipt receipt;
        try {
            receipt.fromJson(nlohmann::json::parse(document));
        } catch (const nlohmann::json::exception &e) {
            throw types::ReceiptFormatException(e.what());
        }

        if (!receipt.isValid()) {
            throw types::ReceiptFormatException("title is required and prices must be between 0 and " +
                                                std::to_string(models::MAX_AMOUNT_MINOR / 100));
        }

        if (receipt.totalMinor != receipt.itemsTotal()) {
            Logger::logWarning("[ReceiptLoader] Declared total differs from the sum of the items");
        }
        return receipt;
    }

}
