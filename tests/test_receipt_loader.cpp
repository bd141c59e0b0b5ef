#include "test.h"
#include "thermal/receipt/ReceiptLoader.hpp"
#include "thermal/types/Error.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>

using thermal::receipt::ReceiptLoader;
using thermal::types::ReceiptFormatException;

TEST_CASE("ReceiptLoader reads a complete receipt") {
    auto receipt = ReceiptLoader::loadFromString(R"({
        "title": "KEDAI DOBI",
        "headerLines": ["No 1, Jalan Satu", "Tel 03-1234567"],
        "date": "2024-05-01 10:30",
        "customer": {"name": "Ali", "phone": "012-3456789", "address": "Kuala Lumpur"},
        "items": [{"name": "Wash", "price": 5}, {"name": "Dry", "price": 3.5}],
        "total": 8.5,
        "footer": "Come again"
    })");

    CHECK(receipt.title == "KEDAI DOBI");
    CHECK(receipt.headerLines.size() == 2);
    CHECK(receipt.customerName == "Ali");
    CHECK(receipt.phone == "012-3456789");
    CHECK(receipt.address == "Kuala Lumpur");
    REQUIRE(receipt.items.size() == 2);
    CHECK(receipt.items[1].priceMinor == 350);
    CHECK(receipt.totalMinor == 850);
    CHECK(receipt.footer == "Come again");
}

TEST_CASE("ReceiptLoader optional fields") {
    auto receipt = ReceiptLoader::loadFromString(R"({"title": "T", "items": [{"name": "A", "price": 0.1}, {"name": "B", "price": 0.2}]})");
    CHECK(receipt.headerLines.empty());
    CHECK(receipt.customerName.empty());
    // Total defaults to the item sum, computed in minor units
    CHECK(receipt.totalMinor == 30);
}

TEST_CASE("ReceiptLoader keeps a declared total that differs from the items") {
    auto receipt = ReceiptLoader::loadFromString(R"({"title": "T", "items": [{"name": "A", "price": 10}], "total": 9})");
    CHECK(receipt.totalMinor == 900);
    CHECK(receipt.itemsTotal() == 1000);
}

TEST_CASE("ReceiptLoader rejects invalid documents") {
    CHECK_THROWS_AS(ReceiptLoader::loadFromString("{not json"), ReceiptFormatException);
    CHECK_THROWS_AS(ReceiptLoader::loadFromString(R"({"items": []})"), ReceiptFormatException);
    CHECK_THROWS_AS(ReceiptLoader::loadFromString(R"({"title": "T"})"), ReceiptFormatException);
    CHECK_THROWS_AS(ReceiptLoader::loadFromString(R"({"title": "", "items": []})"), ReceiptFormatException);
    CHECK_THROWS_AS(ReceiptLoader::loadFromString(R"({"title": "T", "items": [{"name": "A", "price": -1}]})"),
                    ReceiptFormatException);
    CHECK_THROWS_AS(ReceiptLoader::loadFromString(R"({"title": "T", "items": [{"name": "A", "price": "free"}]})"),
                    ReceiptFormatException);
}

TEST_CASE("ReceiptLoader rejects amounts outside the printable range") {
    CHECK_THROWS_AS(ReceiptLoader::loadFromString(R"({"title": "T", "items": [{"name": "A", "price": 1e300}]})"),
                    ReceiptFormatException);
    CHECK_THROWS_AS(ReceiptLoader::loadFromString(R"({"title": "T", "items": [], "total": 1e20})"),
                    ReceiptFormatException);
    // Each price is fine on its own, the sum is not
    CHECK_THROWS_AS(ReceiptLoader::loadFromString(
            R"({"title": "T", "items": [{"name": "A", "price": 6e8}, {"name": "B", "price": 6e8}]})"),
                    ReceiptFormatException);
    CHECK_THROWS_AS(ReceiptLoader::loadFromString(
            R"({"title": "T", "items": [{"name": "A", "price": 6e8}, {"name": "B", "price": 6e8}], "total": 1})"),
                    ReceiptFormatException);

    auto receipt = ReceiptLoader::loadFromString(R"({"title": "T", "items": [{"name": "A", "price": 1e9}]})");
    CHECK(receipt.totalMinor == thermal::receipt::models::MAX_AMOUNT_MINOR);
}

TEST_CASE("Receipt built in code with out of range prices is invalid") {
    thermal::receipt::models::Receipt receipt;
    receipt.title = "T";
    receipt.items.emplace_back("A", INT64_MAX);
    receipt.items.emplace_back("B", INT64_MAX);
    CHECK_FALSE(receipt.isValid());
    CHECK_THROWS_AS(receipt.itemsTotal(), ReceiptFormatException);
}

TEST_CASE("ReceiptLoader files") {
    CHECK_THROWS_AS(ReceiptLoader::loadFromFile("/nonexistent/receipt.json"), ReceiptFormatException);

    auto path = std::filesystem::temp_directory_path() / "thermal_print_loader_test.json";
    {
        std::ofstream out(path);
        out << R"({"title": "FILE", "items": [{"name": "A", "price": 1}]})";
    }
    auto receipt = ReceiptLoader::loadFromFile(path.string());
    CHECK(receipt.title == "FILE");
    std::filesystem::remove(path);
}

TEST_CASE("Receipt JSON model") {
    auto receipt = ReceiptLoader::loadFromString(R"({"title": "T", "customer": {"name": "N"}, "items": [{"name": "A", "price": 2.25}]})");
    auto json = receipt.toJson();
    CHECK(json["customer"]["name"] == "N");
    CHECK(json["items"][0]["price"].get<double>() == doctest::Approx(2.25));
}
