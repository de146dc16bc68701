#ifndef SENSISCAN_UTIL_LOGGER_HPP
#define SENSISCAN_UTIL_LOGGER_HPP

#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <mutex>
#include <memory>
#include <iomanip>
#include <chrono>
#include <ctime>
#include <stdexcept>
#include <algorithm>
#include <cctype>

/**
 * @file logger.hpp
 * @brief A thread-safe logging utility for SensiScan.
 *
 * Log lines go to stderr (stdout is reserved for CLI output) and optionally
 * to a file. Callers must never pass raw matched values; log ids, counts and
 * redacted projections only.
 *
 * Usage:
 *   - logger::setLogLevel(logger::parseLogLevel(cfg.logLevel));
 *   - logger::info("Scanner: scan " + id + " complete");
 *   - logger::enableFileOutput("sensiscan.log", true);
 */

namespace sensiscan {
namespace util {
namespace logger {

/**
 * @brief Enumeration of log levels.
 */
enum class LogLevel {
    DEBUG = 0,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * @brief Parse "debug", "info", "warn", "error" or "critical" (any case).
 * @throw std::runtime_error on an unknown name.
 */
inline LogLevel parseLogLevel(const std::string &name)
{
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug")    return LogLevel::DEBUG;
    if (lower == "info")     return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error")    return LogLevel::ERROR;
    if (lower == "critical") return LogLevel::CRITICAL;
    throw std::runtime_error("logger: unknown log level '" + name + "'");
}

/**
 * @class Logger
 * @brief Process-wide sink. One entry is always one physical line: control
 *        characters in a message are escaped before it is written.
 */
class Logger {
public:
    static Logger& getInstance()
    {
        static Logger instance;
        return instance;
    }

    void setLogLevel(LogLevel level)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        logLevel_ = level;
    }

    LogLevel getLogLevel() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return logLevel_;
    }

    /**
     * @brief Mirror log lines into `filename`.
     * @return false if the file cannot be opened; console output continues.
     */
    bool enableFileOutput(const std::string &filename, bool append = false)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        fileStream_ = std::make_unique<std::ofstream>(filename,
            append ? (std::ios::out | std::ios::app) : (std::ios::out | std::ios::trunc));
        if (!fileStream_->is_open()) {
            fileStream_.reset();
            return false;
        }
        return true;
    }

    void disableFileOutput()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        fileStream_.reset();
    }

    void write(LogLevel level, const std::string &msg)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < logLevel_) {
            return;
        }
        const std::string line = "[" + timestamp() + "][" + levelName(level) + "] " + singleLine(msg) + "\n";
        std::cerr << line;
        std::cerr.flush();
        if (fileStream_) {
            (*fileStream_) << line;
            fileStream_->flush();
        }
    }

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static const char* levelName(LogLevel level)
    {
        switch (level) {
        case LogLevel::DEBUG:    return "DEBUG";
        case LogLevel::INFO:     return "INFO";
        case LogLevel::WARN:     return "WARN";
        case LogLevel::ERROR:    return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
        }
        return "INFO";
    }

    /// Local time with milliseconds, e.g. 2024-03-01 12:00:00.042
    static std::string timestamp()
    {
        auto now = std::chrono::system_clock::now();
        auto secs = std::chrono::system_clock::to_time_t(now);
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          now.time_since_epoch()).count() % 1000;
        std::tm tm_buf{};
        localtime_r(&secs, &tm_buf);
        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << '.'
            << std::setw(3) << std::setfill('0') << millis;
        return oss.str();
    }

    static std::string singleLine(const std::string &msg)
    {
        std::string out;
        out.reserve(msg.size());
        for (char c : msg) {
            if (c == '\n') {
                out += "\\n";
            } else if (c == '\r') {
                out += "\\r";
            } else if (static_cast<unsigned char>(c) < 0x20 && c != '\t') {
                out += '?';
            } else {
                out += c;
            }
        }
        return out;
    }

    mutable std::mutex mutex_;
    LogLevel logLevel_ = LogLevel::INFO;
    std::unique_ptr<std::ofstream> fileStream_;
};

inline void setLogLevel(LogLevel level)
{
    Logger::getInstance().setLogLevel(level);
}

inline bool enableFileOutput(const std::string &filename, bool append = false)
{
    return Logger::getInstance().enableFileOutput(filename, append);
}

inline void disableFileOutput()
{
    Logger::getInstance().disableFileOutput();
}

inline void debug(const std::string &msg)    { Logger::getInstance().write(LogLevel::DEBUG, msg); }
inline void info(const std::string &msg)     { Logger::getInstance().write(LogLevel::INFO, msg); }
inline void warn(const std::string &msg)     { Logger::getInstance().write(LogLevel::WARN, msg); }
inline void error(const std::string &msg)    { Logger::getInstance().write(LogLevel::ERROR, msg); }
inline void critical(const std::string &msg) { Logger::getInstance().write(LogLevel::CRITICAL, msg); }

} // namespace logger
} // namespace util
} // namespace sensiscan

#endif // SENSISCAN_UTIL_LOGGER_HPP
