//
// Created by Andrea on 27/08/2025.
//

#pragma once

#include "thermal/receipt/ReceiptLayout.hpp"
#include "logger/Logger.hpp"
#include <cstdint>
#include <string>
#include <unordered_map>
#include <mutex>
#include <vector>

namespace thermal::config {
    struct PrinterConfig {
        std::string paperWidth = "58mm";
        std::string fontSize = "Large";
        int extraFeeds = 3;
        bool boldHeaders = true;
        std::string footerText = "Thank You";
        bool includePhone = false;
        bool includeAddress = false;
        std::string currency = "RM";
    };

    struct LinkConfig {
        std::string devicePath = "/dev/rfcomm0";
        int baudRate = 115200;
        int chunkSize = 20; // bytes per write, ATT MTU 23 minus header
        int writeTimeoutMs = 5000;
    };

    struct LabelConfig {
        std::string date = "Date";
        std::string name = "Name";
        std::string phone = "Tel";
        std::string address = "Address";
        std::string total = "TOTAL";
    };

    class ConfigManager {
    public:
        static ConfigManager &getInstance();

        // Load configuration
        void loadFromFile(const std::string &configPath = "config.json");

        void loadFromString(const std::string &document);

        void loadFromEnv();

        void resetToDefaults();

        void set(const std::string &key, const std::string &value);

        // Configuration access
        PrinterConfig getPrinterConfig() const;

        LinkConfig getLinkConfig() const;

        LabelConfig getLabelConfig() const;

        /**
         * @brief Logger options from the log.* keys; an unknown level falls back to info.
         */
        Logger::Options getLoggerOptions() const;

        /**
         * @throws types::ConfigException for an unknown paper width or font size.
         */
        receipt::ReceiptLayout getReceiptLayout() const;

        // Generic getters with defaults
        template<typename T>
        T get(const std::string &key, const T &defaultValue) const;

        // Validation
        struct ValidationResult {
            bool isValid = true;
            std::vector<std::string> errors;
        };

        ValidationResult validate() const;

    private:
        ConfigManager();

        mutable std::mutex configMutex_;
        std::unordered_map<std::string, std::string> config_;

        // Caller holds configMutex_
        void applyJson(const std::string &document);

        void setDefaults();
    };

    // Template specializations
    template<>
    inline int ConfigManager::get<int>(const std::string &key, const int &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        if (it == config_.end()) return defaultValue;
        try {
            return std::stoi(it->second);
        } catch (const std::exception &) {
            return defaultValue;
        }
    }

    template<>
    inline std::string ConfigManager::get<std::string>(const std::string &key, const std::string &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        return (it != config_.end()) ? it->second : defaultValue;
    }

    template<>
    inline bool ConfigManager::get<bool>(const std::string &key, const bool &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        if (it == config_.end()) return defaultValue;
        return it->second == "true" || it->second == "1";
    }
} // namespace thermal::config
