//
// Created by redeg on 26/04/2025.
//

#include "logger/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

std::ofstream Logger::logFile_;
std::mutex Logger::logMutex_;
Logger::Options Logger::options_;
std::string Logger::currentLogPath_;
std::atomic<size_t> Logger::currentLogSize_{0};
std::atomic<int> Logger::minLevel_{static_cast<int>(Logger::Level::Info)};
std::atomic<bool> Logger::consoleEnabled_{true};
std::thread Logger::cleanupThread_;
std::atomic<bool> Logger::shutdownRequested_{false};
std::mutex Logger::cleanupMutex_;
std::condition_variable Logger::cleanupCondition_;

void Logger::init() {
    init(Options());
}

void Logger::init(const Options &options) {
    {
        std::lock_guard<std::mutex> lock(logMutex_);
        options_ = options;
        minLevel_ = static_cast<int>(options.minLevel);
        shutdownRequested_ = false;
        rotateLogFile();
    }
    startCleanupThread();
    logInfo("[Logger] Writing " + levelToString(options.minLevel) + "+ to " + currentLogPath_);
}

void Logger::reconfigure(const Options &options) {
    std::lock_guard<std::mutex> lock(logMutex_);
    bool moved = options.folder != options_.folder;
    options_ = options;
    minLevel_ = static_cast<int>(options.minLevel);
    if (moved && logFile_.is_open()) {
        rotateLogFile();
    }
}

void Logger::shutdown() {
    {
        // Under the lock, so the cleanup thread cannot miss the wake-up between its check and its wait
        std::lock_guard<std::mutex> lock(cleanupMutex_);
        shutdownRequested_ = true;
    }
    cleanupCondition_.notify_all();
    if (cleanupThread_.joinable()) {
        cleanupThread_.join();
    }
    std::lock_guard<std::mutex> lock(logMutex_);
    if (logFile_.is_open()) {
        logFile_.close();
    }
}

void Logger::logDebug(const std::string &message) {
    log(Level::Debug, message);
}

void Logger::logInfo(const std::string &message) {
    log(Level::Info, message);
}

void Logger::logWarning(const std::string &message) {
    log(Level::Warning, message);
}

void Logger::logError(const std::string &message) {
    log(Level::Error, message);
}

bool Logger::isEnabled(Level level) {
    return static_cast<int>(level) >= minLevel_;
}

void Logger::setConsoleEnabled(bool enabled) {
    consoleEnabled_ = enabled;
}

std::optional<Logger::Level> Logger::parseLevel(const std::string &value) {
    std::string key = value;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (key == "debug") return Level::Debug;
    if (key == "info") return Level::Info;
    if (key == "warning" || key == "warn") return Level::Warning;
    if (key == "error") return Level::Error;
    return std::nullopt;
}

std::string Logger::levelToString(Level level) {
    switch (level) {
        case Level::Debug:
            return "DEBUG";
        case Level::Info:
            return "INFO";
        case Level::Warning:
            return "WARNING";
        case Level::Error:
            return "ERROR";
        default:
            return "UNKNOWN";
    }
}

void Logger::log(Level level, const std::string &message) {
    if (!isEnabled(level)) return;
    if (message.find_first_not_of(" \t\r\n") == std::string::npos) return;

    std::string formatted = "[" + levelToString(level) + "] [" + currentTimestamp() + "] " + message;

    std::lock_guard<std::mutex> lock(logMutex_);
    if (consoleEnabled_) {
        (level == Level::Error ? std::cerr : std::cout) << formatted << std::endl;
    }

    if (!logFile_.is_open()) return;

    if (currentLogSize_ > options_.maxFileBytes) {
        rotateLogFile();
        if (!logFile_.is_open()) return;
    }

    logFile_ << formatted << '\n';
    // Warnings and errors must survive a crash right after them
    if (level >= Level::Warning) logFile_.flush();
    currentLogSize_ += formatted.length() + 1;
}

// Caller holds logMutex_.
void Logger::rotateLogFile() {
    if (logFile_.is_open()) {
        logFile_.close();
    }

    try {
        currentLogPath_ = generateLogFilename();
    } catch (const fs::filesystem_error &e) {
        std::cerr << "[Logger] Cannot create logs folder " << options_.folder << ": " << e.what() << std::endl;
        return;
    }

    logFile_.open(currentLogPath_, std::ios::out | std::ios::trunc);
    currentLogSize_ = 0;

    if (!logFile_.is_open()) {
        std::cerr << "[Logger] Cannot open log file: " << currentLogPath_ << std::endl;
    }
}

void Logger::startCleanupThread() {
    if (cleanupThread_.joinable()) return;

    cleanupThread_ = std::thread([]() {
        while (!shutdownRequested_) {
            cleanupOldLogs();
            std::unique_lock<std::mutex> lock(cleanupMutex_);
            cleanupCondition_.wait_for(lock, std::chrono::hours(1), []() { return shutdownRequested_.load(); });
        }
    });
}

void Logger::cleanupOldLogs() {
    Options options;
    std::string active;
    {
        std::lock_guard<std::mutex> lock(logMutex_);
        options = options_;
        active = currentLogPath_;
    }

    try {
        if (!fs::exists(options.folder)) return;

        const auto cutoff = fs::file_time_type::clock::now() - options.retention;
        std::vector<fs::path> kept;

        for (const auto &entry: fs::directory_iterator(options.folder)) {
            const auto &path = entry.path();
            if (path.extension() != ".log" || path.filename().string().rfind("thermal_print_", 0) != 0) continue;
            if (path == fs::path(active)) continue;

            if (fs::last_write_time(path) < cutoff) {
                fs::remove(path);
            } else {
                kept.push_back(path);
            }
        }

        // The active file counts towards the limit
        const size_t allowed = options.maxFiles > 0 ? options.maxFiles - 1 : 0;
        if (kept.size() > allowed) {
            std::sort(kept.begin(), kept.end(), [](const fs::path &a, const fs::path &b) {
                return fs::last_write_time(a) < fs::last_write_time(b);
            });
            for (size_t i = 0; i < kept.size() - allowed; ++i) {
                fs::remove(kept[i]);
            }
        }
    } catch (const fs::filesystem_error &e) {
        std::cerr << "[Logger] Cleanup error: " << e.what() << std::endl;
    }
}

std::string Logger::currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&in_time_t, &local);

    std::ostringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis;
    return ss.str();
}

// Caller holds logMutex_.
std::string Logger::generateLogFilename() {
    auto in_time_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

    std::tm local{};
    localtime_r(&in_time_t, &local);

    std::ostringstream ss;
    ss << options_.folder << "/thermal_print_" << std::put_time(&local, "%Y%m%d_%H%M%S");
    const std::string stem = ss.str();

    fs::create_directories(options_.folder);

    // Several runs or rotations can land within the same second; never reuse a file
    std::string path = stem + ".log";
    for (int sequence = 1; fs::exists(path); ++sequence) {
        path = stem + "_" + std::to_string(sequence) + ".log";
    }
    return path;
}
