//
// Created by redeg on 26/04/2025.
//

#pragma once

#include <string>
#include <fstream>
#include <mutex>
#include <thread>
#include <atomic>
#include <chrono>
#include <optional>
#include <condition_variable>

/**
 * @brief Process-wide logger: console output plus a rotating file under the logs folder.
 *
 * File output is only active between init() and shutdown(); before init() messages
 * go to the console only, which is what the unit tests rely on.
 */
class Logger {
public:
    enum class Level {
        Debug,
        Info,
        Warning,
        Error
    };

    struct Options {
        std::string folder = "logs";
        Level minLevel = Level::Info;
        size_t maxFileBytes = 10 * 1024 * 1024;
        size_t maxFiles = 10;
        std::chrono::hours retention{24 * 30};
    };

    static void init();

    static void init(const Options &options);

    /**
     * @brief Applies new options to a running logger, reopening the file if the folder moved.
     */
    static void reconfigure(const Options &options);

    static void shutdown();

    static void logDebug(const std::string &message);

    static void logInfo(const std::string &message);

    static void logWarning(const std::string &message);

    static void logError(const std::string &message);

    static bool isEnabled(Level level);

    /**
     * @brief Silences console output (file output is unaffected).
     */
    static void setConsoleEnabled(bool enabled);

    static std::optional<Level> parseLevel(const std::string &value);

    static std::string levelToString(Level level);

private:
    static std::ofstream logFile_;
    static std::mutex logMutex_;
    static Options options_;
    static std::string currentLogPath_;
    static std::atomic<size_t> currentLogSize_;
    static std::atomic<int> minLevel_;
    static std::atomic<bool> consoleEnabled_;
    static std::thread cleanupThread_;
    static std::atomic<bool> shutdownRequested_;
    static std::mutex cleanupMutex_;
    static std::condition_variable cleanupCondition_;

    static void log(Level level, const std::string &message);

    static void rotateLogFile();

    static void startCleanupThread();

    static void cleanupOldLogs();

    static std::string currentTimestamp();

    static std::string generateLogFilename();
};
