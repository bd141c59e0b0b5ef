//
// Created by Andrea on 27/08/2025.
//

#include "application/config/ConfigManager.hpp"
#include "thermal/types/Error.hpp"
#include "logger/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <functional>
#include <sstream>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <cstdlib>

namespace thermal::config {
    ConfigManager::ConfigManager() {
        setDefaults();
    }

    ConfigManager &ConfigManager::getInstance() {
        static ConfigManager instance;
        return instance;
    }

    void ConfigManager::loadFromFile(const std::string &configPath) {
        std::lock_guard<std::mutex> lock(configMutex_);
        setDefaults();

        if (!std::filesystem::exists(configPath)) {
            Logger::logWarning("[ConfigManager] Config file not found: " + configPath + ", using defaults");
            return;
        }

        try {
            std::ifstream file(configPath);
            std::stringstream content;
            content << file.rdbuf();
            applyJson(content.str());

            Logger::logInfo(
                "[ConfigManager] Loaded " + std::to_string(config_.size()) + " settings from " + configPath);
        } catch (const std::exception &e) {
            Logger::logError("[ConfigManager] Failed to load config: " + std::string(e.what()));
            setDefaults();
        }
    }

    void ConfigManager::loadFromString(const std::string &document) {
        std::lock_guard<std::mutex> lock(configMutex_);
        setDefaults();
        try {
            applyJson(document);
        } catch (const nlohmann::json::exception &e) {
            setDefaults();
            throw types::ConfigException(e.what());
        }
    }

    void ConfigManager::applyJson(const std::string &document) {
        nlohmann::json json = nlohmann::json::parse(document);

        // Flatten JSON into key-value pairs
        std::function<void(const nlohmann::json &, const std::string &)> flatten;
        flatten = [&](const nlohmann::json &obj, const std::string &prefix) {
            for (auto it = obj.begin(); it != obj.end(); ++it) {
                std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();

                if (it.value().is_object()) {
                    flatten(it.value(), key);
                } else if (it.value().is_string()) {
                    config_[key] = it.value().get<std::string>();
                } else {
                    config_[key] = it.value().dump();
                }
            }
        };

        flatten(json, "");
    }

    void ConfigManager::loadFromEnv() {
        std::lock_guard<std::mutex> lock(configMutex_);

        const char *envVars[] = {
            "PRINTER_PAPER_WIDTH", "PRINTER_FONT_SIZE", "PRINTER_EXTRA_FEEDS", "PRINTER_BOLD_HEADERS",
            "PRINTER_FOOTER_TEXT", "PRINTER_INCLUDE_PHONE", "PRINTER_INCLUDE_ADDRESS", "PRINTER_CURRENCY",
            "LINK_DEVICE_PATH", "LINK_BAUD_RATE", "LINK_CHUNK_SIZE", "LINK_WRITE_TIMEOUT_MS",
            "LOG_LEVEL", "LOG_FOLDER", "LOG_MAX_FILES", "LOG_MAX_SIZE_MB"
        };

        int loaded = 0;
        for (const char *envVar: envVars) {
            const char *value = std::getenv(envVar);
            if (value) {
                // Convert ENV_VAR_NAME to dot notation
                std::string key = envVar;
                std::transform(key.begin(), key.end(), key.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                std::replace(key.begin(), key.end(), '_', '.');

                config_[key] = value;
                loaded++;
            }
        }

        Logger::logInfo("[ConfigManager] Loaded " + std::to_string(loaded) + " settings from environment");
    }

    void ConfigManager::resetToDefaults() {
        std::lock_guard<std::mutex> lock(configMutex_);
        setDefaults();
    }

    void ConfigManager::set(const std::string &key, const std::string &value) {
        std::lock_guard<std::mutex> lock(configMutex_);
        config_[key] = value;
    }

    PrinterConfig ConfigManager::getPrinterConfig() const {
        PrinterConfig config;
        config.paperWidth = get<std::string>("printer.paper.width", "58mm");
        config.fontSize = get<std::string>("printer.font.size", "Large");
        config.extraFeeds = get<int>("printer.extra.feeds", 3);
        config.boldHeaders = get<bool>("printer.bold.headers", true);
        config.footerText = get<std::string>("printer.footer.text", "Thank You");
        config.includePhone = get<bool>("printer.include.phone", false);
        config.includeAddress = get<bool>("printer.include.address", false);
        config.currency = get<std::string>("printer.currency", "RM");
        return config;
    }

    LinkConfig ConfigManager::getLinkConfig() const {
        LinkConfig config;
        config.devicePath = get<std::string>("link.device.path", "/dev/rfcomm0");
        config.baudRate = get<int>("link.baud.rate", 115200);
        config.chunkSize = get<int>("link.chunk.size", 20);
        config.writeTimeoutMs = get<int>("link.write.timeout.ms", 5000);
        return config;
    }

    LabelConfig ConfigManager::getLabelConfig() const {
        LabelConfig config;
        config.date = get<std::string>("receipt.label.date", "Date");
        config.name = get<std::string>("receipt.label.name", "Name");
        config.phone = get<std::string>("receipt.label.phone", "Tel");
        config.address = get<std::string>("receipt.label.address", "Address");
        config.total = get<std::string>("receipt.label.total", "TOTAL");
        return config;
    }

    Logger::Options ConfigManager::getLoggerOptions() const {
        Logger::Options options;
        options.folder = get<std::string>("log.folder", "logs");
        options.minLevel = Logger::parseLevel(get<std::string>("log.level", "info")).value_or(Logger::Level::Info);
        options.maxFiles = static_cast<size_t>(std::max(1, get<int>("log.max.files", 10)));
        options.maxFileBytes = static_cast<size_t>(std::max(1, get<int>("log.max.size.mb", 10))) * 1024 * 1024;
        return options;
    }

    receipt::ReceiptLayout ConfigManager::getReceiptLayout() const {
        PrinterConfig printer = getPrinterConfig();
        LabelConfig labels = getLabelConfig();

        auto paper = command::parsePaperProfile(printer.paperWidth);
        if (!paper) {
            throw types::ConfigException("printer.paper.width '" + printer.paperWidth + "'");
        }
        auto font = receipt::parseHeaderFont(printer.fontSize);
        if (!font) {
            throw types::ConfigException("printer.font.size '" + printer.fontSize + "'");
        }

        receipt::ReceiptLayout layout;
        layout.paper = *paper;
        layout.headerFont = *font;
        layout.boldHeaders = printer.boldHeaders;
        layout.includePhone = printer.includePhone;
        layout.includeAddress = printer.includeAddress;
        layout.extraFeeds = std::max(0, printer.extraFeeds);
        layout.currency = printer.currency;
        layout.labels.date = labels.date;
        layout.labels.name = labels.name;
        layout.labels.phone = labels.phone;
        layout.labels.address = labels.address;
        layout.labels.total = labels.total;
        layout.labels.defaultFooter = printer.footerText;
        return layout;
    }

    ConfigManager::ValidationResult ConfigManager::validate() const {
        ValidationResult result;

        if (!command::parsePaperProfile(get<std::string>("printer.paper.width", ""))) {
            result.errors.push_back("printer.paper.width must be 58mm or 80mm");
        }

        if (!receipt::parseHeaderFont(get<std::string>("printer.font.size", ""))) {
            result.errors.push_back("printer.font.size must be Small, Normal or Large");
        }

        int feeds = get<int>("printer.extra.feeds", -1);
        if (feeds < 0 || feeds > 20) {
            result.errors.push_back("printer.extra.feeds must be between 0 and 20");
        }

        if (get<std::string>("link.device.path", "").empty()) {
            result.errors.push_back("link.device.path must not be empty");
        }

        if (get<int>("link.baud.rate", -1) <= 0) {
            result.errors.push_back("link.baud.rate must be > 0");
        }

        // 512 is the largest attribute value BLE allows
        int chunk = get<int>("link.chunk.size", -1);
        if (chunk < 1 || chunk > 512) {
            result.errors.push_back("link.chunk.size must be between 1 and 512");
        }

        if (get<int>("link.write.timeout.ms", -1) < 100) {
            result.errors.push_back("link.write.timeout.ms must be >= 100");
        }

        if (!Logger::parseLevel(get<std::string>("log.level", ""))) {
            result.errors.push_back("log.level must be debug, info, warning or error");
        }

        result.isValid = result.errors.empty();
        return result;
    }

    void ConfigManager::setDefaults() {
        config_.clear();

        // Printer defaults
        config_["printer.paper.width"] = "58mm";
        config_["printer.font.size"] = "Large";
        config_["printer.extra.feeds"] = "3";
        config_["printer.bold.headers"] = "true";
        config_["printer.footer.text"] = "Thank You";
        config_["printer.include.phone"] = "false";
        config_["printer.include.address"] = "false";
        config_["printer.currency"] = "RM";

        // Link defaults
        config_["link.device.path"] = "/dev/rfcomm0";
        config_["link.baud.rate"] = "115200";
        config_["link.chunk.size"] = "20";
        config_["link.write.timeout.ms"] = "5000";

        // Receipt labels
        config_["receipt.label.date"] = "Date";
        config_["receipt.label.name"] = "Name";
        config_["receipt.label.phone"] = "Tel";
        config_["receipt.label.address"] = "Address";
        config_["receipt.label.total"] = "TOTAL";

        // Logging
        config_["log.level"] = "info";
        config_["log.folder"] = "logs";
        config_["log.max.files"] = "10";
        config_["log.max.size.mb"] = "10";
    }
} // namespace thermal::config
