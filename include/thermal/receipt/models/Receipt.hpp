#pragma once

#include "BaseModel.hpp"
#include "thermal/types/Error.hpp"
#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

namespace thermal::receipt::models {

    // One billion major units either way; keeps sums of items far from int64 overflow
    constexpr int64_t MAX_AMOUNT_MINOR = 100000000000LL;

    inline bool isAmountInRange(int64_t minorUnits) {
        return minorUnits >= -MAX_AMOUNT_MINOR && minorUnits <= MAX_AMOUNT_MINOR;
    }

    /**
     * @brief Converts a decimal amount (10.5) to minor units (1050).
     * @throws types::ReceiptFormatException for NaN, infinity or amounts past MAX_AMOUNT_MINOR
     */
    inline int64_t toMinorUnits(double amount) {
        if (!std::isfinite(amount) || std::fabs(amount) * 100.0 > static_cast<double>(MAX_AMOUNT_MINOR)) {
            throw types::ReceiptFormatException("amount out of range: " + std::to_string(amount));
        }
        return static_cast<int64_t>(std::llround(amount * 100.0));
    }

    /**
     * @brief One billed line: name and price.
     */
    class ReceiptItem : public BaseModel {
    public:
        std::string name;
        int64_t priceMinor;

        ReceiptItem() : priceMinor(0) {}

        ReceiptItem(std::string name, int64_t priceMinor)
                : name(std::move(name)), priceMinor(priceMinor) {}

        explicit ReceiptItem(const nlohmann::json &json) : priceMinor(0) { fromJson(json); }

        nlohmann::json toJson() const override {
            return nlohmann::json{
                    {"name",  name},
                    {"price", static_cast<double>(priceMinor) / 100.0}
            };
        }

        void fromJson(const nlohmann::json &json) override {
            name = json.at("name").get<std::string>();
            priceMinor = toMinorUnits(json.at("price").get<double>());
        }

        bool isValid() const override {
            return !name.empty() && priceMinor >= 0 && isAmountInRange(priceMinor);
        }
    };

    /**
     * @brief Receipt content as supplied by the point-of-sale side.
     *
     * Only title and items are required in JSON; total defaults to the sum of the items.
     */
    class Receipt : public BaseModel {
    public:
        std::string title;
        std::vector<std::string> headerLines;
        std::string date;
        std::string customerName;
        std::string phone;
        std::string address;
        std::vector<ReceiptItem> items;
        int64_t totalMinor;
        std::string footer;

        Receipt() : totalMinor(0) {}

        explicit Receipt(const nlohmann::json &json) : totalMinor(0) { fromJson(json); }

        /**
         * @throws types::ReceiptFormatException if an item or the running sum leaves the amount range
         */
        int64_t itemsTotal() const {
            int64_t sum = 0;
            if (!sumItems(sum)) {
                throw types::ReceiptFormatException("sum of the items out of range");
            }
            return sum;
        }

        nlohmann::json toJson() const override {
            nlohmann::json jsonItems = nlohmann::json::array();
            for (const auto &item: items) {
                jsonItems.push_back(item.toJson());
            }

            return nlohmann::json{
                    {"title",       title},
                    {"headerLines", headerLines},
                    {"date",        date},
                    {"customer",    {
                                            {"name", customerName},
                                            {"phone", phone},
                                            {"address", address}
                                    }},
                    {"items",       jsonItems},
                    {"total",       static_cast<double>(totalMinor) / 100.0},
                    {"footer",      footer}
            };
        }

        void fromJson(const nlohmann::json &json) override {
            title = json.at("title").get<std::string>();
            headerLines = json.value("headerLines", std::vector<std::string>{});
            date = json.value("date", std::string());
            footer = json.value("footer", std::string());

            customerName.clear();
            phone.clear();
            address.clear();
            if (json.contains("customer")) {
                const auto &customer = json.at("customer");
                customerName = customer.value("name", std::string());
                phone = customer.value("phone", std::string());
                address = customer.value("address", std::string());
            }

            items.clear();
            for (const auto &jsonItem: json.at("items")) {
                items.emplace_back(jsonItem);
            }

            totalMinor = json.contains("total") ? toMinorUnits(json.at("total").get<double>()) : itemsTotal();
        }

        bool isValid() const override {
            if (title.empty() || totalMinor < 0 || !isAmountInRange(totalMinor)) return false;
            for (const auto &item: items) {
                if (!item.isValid()) return false;
            }
            int64_t sum = 0;
            return sumItems(sum);
        }

    private:
        bool sumItems(int64_t &sum) const {
            sum = 0;
            for (const auto &item: items) {
                // Both operands are in range, so the addition cannot overflow
                if (!isAmountInRange(item.priceMinor)) return false;
                sum += item.priceMinor;
                if (!isAmountInRange(sum)) return false;
            }
            return true;
        }
    };

}
