#include "Logger.h"

#include <algorithm>
#include <cctype>
#include <iostream>

#include "Exceptions.h"

using namespace ringpower;

namespace {
    const char* levelName(const LogLevel level) {
        switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::OFF: return "OFF";
        }
        return "?";
    }
}

Logger::Logger() : level_(LogLevel::INFO), out_(&std::clog) {}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::setLevel(const LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::setStream(std::ostream& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ = &out;
}

void Logger::debug(const std::string& component, const std::string& message) {
    log(LogLevel::DEBUG, component, message);
}

void Logger::info(const std::string& component, const std::string& message) {
    log(LogLevel::INFO, component, message);
}

void Logger::warning(const std::string& component, const std::string& message) {
    log(LogLevel::WARNING, component, message);
}

void Logger::error(const std::string& component, const std::string& message) {
    log(LogLevel::ERROR, component, message);
}

void Logger::log(const LogLevel level, const std::string& component, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(level) < static_cast<int>(level_)) return;
    (*out_) << "[" << levelName(level) << "] [" << component << "] " << message << '\n';
}

LogLevel Logger::parseLevel(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(), [](const unsigned char c) { return std::tolower(c); });
    if (n == "debug") return LogLevel::DEBUG;
    if (n == "info") return LogLevel::INFO;
    if (n == "warning" || n == "warn") return LogLevel::WARNING;
    if (n == "error") return LogLevel::ERROR;
    if (n == "off") return LogLevel::OFF;
    throw ConfigurationError("Logger: unknown log level '" + name + "'");
}
