#include "test.h"
#include "logger/Logger.hpp"

#include <chrono>
#include <filesystem>
#include <string>

TEST_CASE("Logger level names") {
    CHECK(Logger::parseLevel("DEBUG") == Logger::Level::Debug);
    CHECK(Logger::parseLevel("info") == Logger::Level::Info);
    CHECK(Logger::parseLevel("warn") == Logger::Level::Warning);
    CHECK(Logger::parseLevel("Error") == Logger::Level::Error);
    CHECK_FALSE(Logger::parseLevel("trace").has_value());
    CHECK(Logger::levelToString(Logger::Level::Warning) == "WARNING");
}

TEST_CASE("Logger filters below the minimum level") {
    Logger::Options options;
    options.minLevel = Logger::Level::Warning;
    Logger::reconfigure(options);

    CHECK_FALSE(Logger::isEnabled(Logger::Level::Debug));
    CHECK_FALSE(Logger::isEnabled(Logger::Level::Info));
    CHECK(Logger::isEnabled(Logger::Level::Warning));
    CHECK(Logger::isEnabled(Logger::Level::Error));

    Logger::reconfigure(Logger::Options());
    CHECK(Logger::isEnabled(Logger::Level::Info));
    CHECK_FALSE(Logger::isEnabled(Logger::Level::Debug));
}

namespace {
    size_t countLogFiles(const std::filesystem::path &folder) {
        size_t n = 0;
        for (const auto &entry: std::filesystem::directory_iterator(folder)) {
            const auto name = entry.path().filename().string();
            if (name.rfind("thermal_print_", 0) == 0 && entry.path().extension() == ".log") n++;
        }
        return n;
    }
}

TEST_CASE("Logger rotates within the same second without reusing a file") {
    const auto folder = std::filesystem::temp_directory_path() / "thermal_print_rotation_test";
    std::filesystem::remove_all(folder);

    Logger::Options options;
    options.folder = folder.string();
    options.maxFileBytes = 64;
    options.maxFiles = 100;
    Logger::init(options);
    for (int i = 0; i < 10; ++i) {
        Logger::logInfo("[Test] rotation message number " + std::to_string(i));
    }
    Logger::shutdown();

    // Every message overflows the limit, so each one starts a new file
    CHECK(countLogFiles(folder) >= 10);

    Logger::reconfigure(Logger::Options());
    std::filesystem::remove_all(folder);
}

TEST_CASE("Logger shutdown wakes the cleanup thread every time") {
    const auto folder = std::filesystem::temp_directory_path() / "thermal_print_shutdown_test";
    std::filesystem::remove_all(folder);

    Logger::Options options;
    options.folder = folder.string();

    const auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < 25; ++i) {
        Logger::init(options);
        Logger::shutdown();
    }
    CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds(30));

    Logger::reconfigure(Logger::Options());
    std::filesystem::remove_all(folder);
}
