#pragma once
/**
 * @file Logger.h
 * @brief Process-wide leveled logger.
 */
#include <mutex>
#include <ostream>
#include <string>

namespace ringpower {
    enum class LogLevel : int { DEBUG = 0, INFO = 1, WARNING = 2, ERROR = 3, OFF = 4 };

    /**
     * @brief Thread-safe singleton writing "[LEVEL] [component] message" lines.
     *
     * Worker threads log through the same instance; each line is written under a mutex.
     */
    class Logger {
    public:
        static Logger& getInstance();

        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        void setLevel(LogLevel level);
        LogLevel level() const;

        /** @brief Redirect output (default std::clog). The stream must outlive the logger's use. */
        void setStream(std::ostream& out);

        void debug(const std::string& component, const std::string& message);
        void info(const std::string& component, const std::string& message);
        void warning(const std::string& component, const std::string& message);
        void error(const std::string& component, const std::string& message);

        /** @brief Parse "debug" / "info" / "warning" / "error" / "off" (case-insensitive). */
        static LogLevel parseLevel(const std::string& name);

    private:
        Logger();

        void log(LogLevel level, const std::string& component, const std::string& message);

        mutable std::mutex mutex_;
        LogLevel level_;
        std::ostream* out_;
    };
}
