#ifndef LSNP_UTIL_LOGGER_HPP
#define LSNP_UTIL_LOGGER_HPP

#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <mutex>
#include <memory>
#include <iomanip>
#include <chrono>
#include <ctime>
#include <functional>
#include <stdexcept>
#include <algorithm>
#include <cctype>

/**
 * @file logger.hpp
 * @brief A thread-safe logging utility shared by every LSNP component.
 *
 * Usage:
 *   - Logger::getInstance().info("[Router] dropped DM");
 *   - logger::debug("Debug message");
 *   - logger::enableFileOutput("lsnp.log");
 *   - logger::setLogLevel(logger::parseLogLevel("WARN"));
 *
 * Lines look like "[2024-01-31 12:00:00][WARN] [Codec] payload is 21000 bytes".
 * Components prefix the message with their own name in brackets.
 */

namespace lsnp {
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

inline const char* levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARN:
        return "WARN";
    case LogLevel::ERROR:
        return "ERROR";
    case LogLevel::CRITICAL:
        return "CRITICAL";
    }
    return "UNKNOWN";
}

/**
 * @brief Map a configuration string ("debug", "INFO", "warning", ...) to a LogLevel.
 * @throw std::runtime_error on an unknown name.
 */
inline LogLevel parseLogLevel(std::string name)
{
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (name == "DEBUG") {
        return LogLevel::DEBUG;
    }
    if (name == "INFO") {
        return LogLevel::INFO;
    }
    if (name == "WARN" || name == "WARNING") {
        return LogLevel::WARN;
    }
    if (name == "ERROR") {
        return LogLevel::ERROR;
    }
    if (name == "CRITICAL") {
        return LogLevel::CRITICAL;
    }
    throw std::runtime_error("logger: unknown log level '" + name + "'");
}

/**
 * @brief Process-wide logger:
 *  - level filter
 *  - console output (can be muted)
 *  - optional file output
 *  - optional capture hook that sees every accepted record
 */
class Logger {
public:
    using CaptureHook = std::function<void(LogLevel, const std::string&)>;

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

    void setConsoleOutput(bool enabled)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        console_ = enabled;
    }

    /**
     * @brief Write records to a file as well as the console.
     * @param filename The file path to write logs into.
     * @param append If true, appends to existing file; otherwise truncates.
     */
    void enableFileOutput(const std::string &filename, bool append = false)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fileStream_) {
            fileStream_->close();
        }
        fileStream_ = std::make_unique<std::ofstream>(filename,
            append ? (std::ios::out | std::ios::app) : (std::ios::out | std::ios::trunc));
        if (!fileStream_->is_open()) {
            fileStream_.reset();
            std::cerr << "[Logger] Failed to open log file: " << filename << std::endl;
        }
    }

    void disableFileOutput()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fileStream_) {
            fileStream_->close();
            fileStream_.reset();
        }
    }

    /**
     * @brief Install (or clear, with an empty function) a hook receiving each
     *        record that passes the level filter. The hook runs under the logger
     *        lock and must not log.
     */
    void setCaptureHook(CaptureHook hook)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        hook_ = std::move(hook);
    }

    void debug(const std::string &msg) { log(LogLevel::DEBUG, msg); }
    void info(const std::string &msg) { log(LogLevel::INFO, msg); }
    void warn(const std::string &msg) { log(LogLevel::WARN, msg); }
    void error(const std::string &msg) { log(LogLevel::ERROR, msg); }
    void critical(const std::string &msg) { log(LogLevel::CRITICAL, msg); }

private:
    Logger()
        : logLevel_(LogLevel::INFO)
        , console_(true)
    {
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string &msg)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < logLevel_) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time_t_now);
#else
        localtime_r(&time_t_now, &tm_buf);
#endif
        std::ostringstream line;
        line << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << "]["
             << levelName(level) << "] " << msg << '\n';

        if (console_) {
            std::cout << line.str();
            std::cout.flush();
        }
        if (fileStream_) {
            (*fileStream_) << line.str();
            fileStream_->flush();
        }
        if (hook_) {
            hook_(level, msg);
        }
    }

    mutable std::mutex mutex_;
    LogLevel logLevel_;
    bool console_;
    std::unique_ptr<std::ofstream> fileStream_;
    CaptureHook hook_;
};

// ----------------------------------------------------------------------------
//  Convenience free functions (shortcuts)
// ----------------------------------------------------------------------------
inline void setLogLevel(LogLevel level)
{
    Logger::getInstance().setLogLevel(level);
}

inline void enableFileOutput(const std::string &filename, bool append = false)
{
    Logger::getInstance().enableFileOutput(filename, append);
}

inline void debug(const std::string &msg)
{
    Logger::getInstance().debug(msg);
}

inline void info(const std::string &msg)
{
    Logger::getInstance().info(msg);
}

inline void warn(const std::string &msg)
{
    Logger::getInstance().warn(msg);
}

inline void error(const std::string &msg)
{
    Logger::getInstance().error(msg);
}

inline void critical(const std::string &msg)
{
    Logger::getInstance().critical(msg);
}

} // namespace logger
} // namespace util
} // namespace lsnp

#endif // LSNP_UTIL_LOGGER_HPP
