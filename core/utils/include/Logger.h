#pragma once

#include <string>
#include <mutex>
#include <atomic>
#include <fstream>
#include <iostream>

namespace ChatStorage {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR,
        CRITICAL
    };

    /**
     * @brief Process-wide logger with component tags and size-based rotation.
     *
     * Lines look like "[2024-01-01 12:00:00] [INFO] [Connection] message".
     * Warnings and errors are colored on the console.
     */
    class Logger {
    public:
        static Logger& instance();

        void setLogFile(const std::string& path);
        void setMaxFileSize(size_t maxSizeMB);
        void setComponent(const std::string& component);
        void setLevel(LogLevel level);
        LogLevel getLevel() const { return currentLevel_.load(); }
        bool isDebugEnabled() const { return currentLevel_.load() == LogLevel::DEBUG; }

        /// Silence console output (file output is unaffected)
        void setConsoleOutput(bool enabled) { consoleOutput_ = enabled; }

        void log(LogLevel level, const std::string& message, const std::string& component = "");

        void debug(const std::string& message, const std::string& component = "");
        void info(const std::string& message, const std::string& component = "");
        void warn(const std::string& message, const std::string& component = "");
        void error(const std::string& message, const std::string& component = "");
        void critical(const std::string& message, const std::string& component = "");

        /// Parse "debug", "info", "warn", "error", "critical"; unknown names map to INFO
        static LogLevel parseLevel(const std::string& name);

    private:
        Logger() = default;
        ~Logger();

        std::mutex mutex_;
        std::ofstream logFile_;
        std::string logFilePath_;
        std::string defaultComponent_ = "ChatStorage";
        std::atomic<LogLevel> currentLevel_{LogLevel::INFO};
        std::atomic<bool> consoleOutput_{true};
        size_t maxFileSizeMB_ = 100;
        size_t currentFileSize_ = 0;

        std::string levelToString(LogLevel level);
        std::string getCurrentTime();
        std::string rotateLogFile();
        size_t getFileSize();
    };

}
