#pragma once

#include <string>
#include <mutex>
#include <fstream>
#include <iostream>

namespace Chunkwise {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR,
        CRITICAL
    };

    /// Parse "DEBUG", "info", "Warning", ... Unknown names fall back to INFO.
    LogLevel parseLogLevel(const std::string& name);

    /**
     * @brief Line-oriented logger shared by every component of one process
     *
     * Constructed once by the application and handed to components by
     * reference. Each line carries a component tag, e.g.
     * "[2026-01-01 12:00:00] [INFO] [Sender] Connected to 10.0.0.2:5001".
     */
    class Logger {
    public:
        Logger() = default;
        ~Logger();

        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        bool setLogFile(const std::string& path);
        void setLevel(LogLevel level);
        void setMaxFileSize(size_t maxSizeMB); // Rotate once the file grows past this
        void setComponent(const std::string& component); // Used when a call passes no component
        void setConsoleOutput(bool enabled);

        bool isDebugEnabled() const { return currentLevel_ <= LogLevel::DEBUG; }
        LogLevel getLevel() const { return currentLevel_; }

        void log(LogLevel level, const std::string& message, const std::string& component = "");

        void debug(const std::string& message, const std::string& component = "");
        void info(const std::string& message, const std::string& component = "");
        void warn(const std::string& message, const std::string& component = "");
        void error(const std::string& message, const std::string& component = "");
        void critical(const std::string& message, const std::string& component = "");

    private:
        std::mutex mutex_;
        std::ofstream logFile_;
        std::string logFilePath_;
        LogLevel currentLevel_ = LogLevel::INFO;
        std::string defaultComponent_ = "Chunkwise";
        bool consoleOutput_ = true;
        size_t maxFileSizeMB_ = 10;
        size_t currentFileSize_ = 0;

        static std::string levelToString(LogLevel level);
        static std::string getCurrentTime(const char* format);
        void writeLine(const std::string& line);
        void rotateLogFile();
        size_t getFileSize() const;
    };

}
