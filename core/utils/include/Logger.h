#pragma once

#include <string>
#include <mutex>
#include <fstream>
#include <iostream>

namespace TermXfer {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR,
        CRITICAL
    };

    /**
     * @brief Process-wide logger.
     *
     * Console output goes to stderr so it never interleaves with escape codes
     * written to the terminal on stdout. An optional log file is rotated once
     * it grows past the configured size.
     */
    class Logger {
    public:
        static Logger& instance();

        void setLogFile(const std::string& path);
        void setLevel(LogLevel level);
        void setMaxFileSize(size_t maxSizeMB);
        void setComponent(const std::string& component); // used when a call passes none
        void setConsoleOutput(bool enabled);

        bool isDebugEnabled() const { return currentLevel_ <= LogLevel::DEBUG; }
        bool isInfoEnabled() const { return currentLevel_ <= LogLevel::INFO; }

        void log(LogLevel level, const std::string& message, const std::string& component = "");

        void debug(const std::string& message, const std::string& component = "");
        void info(const std::string& message, const std::string& component = "");
        void warn(const std::string& message, const std::string& component = "");
        void error(const std::string& message, const std::string& component = "");
        void critical(const std::string& message, const std::string& component = "");

        /// Case-insensitive; "warning" is accepted for WARN.
        static LogLevel parseLevel(const std::string& name, LogLevel fallback = LogLevel::INFO);

    private:
        Logger() = default;
        ~Logger();

        std::mutex mutex_;
        std::ofstream logFile_;
        std::string logFilePath_;
        LogLevel currentLevel_ = LogLevel::INFO;
        std::string defaultComponent_ = "TermXfer";
        size_t maxFileSizeMB_ = 100;
        size_t currentFileSize_ = 0;
        bool consoleOutput_ = true;

        static std::string levelToString(LogLevel level);
        static std::string timestamp(const char* format);
        void rotateLogFile();
        size_t currentLogSize() const;
    };

}
