#ifndef DOCSHIELD_UTIL_LOGGER_HPP
#define DOCSHIELD_UTIL_LOGGER_HPP

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>

/**
 * @file logger.hpp
 * @brief Process-wide, thread-safe logging for DocShield.
 *
 * Every line has the shape "[YYYY-MM-DD HH:MM:SS][LEVEL] message". Console
 * lines go to stderr: the command-line front end owns stdout for reports.
 * A log file can be attached in addition to (or, with the console muted,
 * instead of) the console.
 *
 * Usage:
 *   - logger::info("DocumentScanner: 3 page(s)");
 *   - logger::Logger::getInstance().setLogLevel(LogLevel::DEBUG);
 *   - logger::enableFileOutput("docshield.log", true);
 */

namespace docshield {
namespace util {
namespace logger {

enum class LogLevel {
    DEBUG = 0,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

inline const char *levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::DEBUG:    return "DEBUG";
    case LogLevel::INFO:     return "INFO";
    case LogLevel::WARN:     return "WARN";
    case LogLevel::ERROR:    return "ERROR";
    case LogLevel::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

/**
 * @brief Level from its name, any case. "WARNING" is accepted for WARN.
 * @throw std::invalid_argument on an unknown name.
 */
inline LogLevel parseLogLevel(const std::string &name)
{
    std::string upper;
    for (char c : name) {
        upper.push_back((c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c);
    }
    for (LogLevel level : {LogLevel::DEBUG, LogLevel::INFO, LogLevel::WARN, LogLevel::ERROR,
                           LogLevel::CRITICAL}) {
        if (upper == levelName(level)) {
            return level;
        }
    }
    if (upper == "WARNING") {
        return LogLevel::WARN;
    }
    throw std::invalid_argument("logger: unknown log level '" + name + "'");
}

/**
 * @class Logger
 * @brief Singleton sink shared by every component. All members lock one mutex.
 */
class Logger {
public:
    static Logger& getInstance()
    {
        static Logger instance;
        return instance;
    }

    /// Messages below @p level are dropped.
    void setLogLevel(LogLevel level)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        minLevel_ = level;
    }

    LogLevel getLogLevel() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return minLevel_;
    }

    /// Turn the stderr copy of each line on or off. File output is unaffected.
    void setConsoleOutput(bool enabled)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        console_ = enabled;
    }

    /**
     * @brief Mirror every line into @p filename.
     * @return false if the file cannot be opened; logging continues without it.
     */
    bool enableFileOutput(const std::string &filename, bool append = false)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ios::openmode mode = std::ios::out | (append ? std::ios::app : std::ios::trunc);
        auto stream = std::make_unique<std::ofstream>(filename, mode);
        if (!stream->is_open()) {
            std::cerr << "[Logger] cannot open log file " << filename << std::endl;
            return false;
        }
        file_ = std::move(stream);
        return true;
    }

    void disableFileOutput()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        file_.reset();
    }

    void log(LogLevel level, const std::string &msg)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < minLevel_ || (!console_ && !file_)) {
            return;
        }
        const std::string line = format(level, msg);
        if (console_) {
            std::cerr << line << std::flush;
        }
        if (file_) {
            (*file_) << line << std::flush;
        }
    }

    void debug(const std::string &msg) { log(LogLevel::DEBUG, msg); }
    void info(const std::string &msg) { log(LogLevel::INFO, msg); }
    void warn(const std::string &msg) { log(LogLevel::WARN, msg); }
    void error(const std::string &msg) { log(LogLevel::ERROR, msg); }
    void critical(const std::string &msg) { log(LogLevel::CRITICAL, msg); }

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static std::string format(LogLevel level, const std::string &msg)
    {
        std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local{};
#ifdef _WIN32
        localtime_s(&local, &now);
#else
        localtime_r(&now, &local);
#endif
        std::ostringstream line;
        line << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << "]["
             << levelName(level) << "] " << msg << "\n";
        return line.str();
    }

    mutable std::mutex mutex_;
    LogLevel minLevel_ = LogLevel::INFO;
    bool console_ = true;
    std::unique_ptr<std::ofstream> file_;
};

// ----------------------------------------------------------------------------
//  Shortcuts onto the singleton
// ----------------------------------------------------------------------------
inline void setLogLevel(LogLevel level) { Logger::getInstance().setLogLevel(level); }
inline void setConsoleOutput(bool enabled) { Logger::getInstance().setConsoleOutput(enabled); }

inline bool enableFileOutput(const std::string &filename, bool append = false)
{
    return Logger::getInstance().enableFileOutput(filename, append);
}

inline void disableFileOutput() { Logger::getInstance().disableFileOutput(); }

inline void debug(const std::string &msg) { Logger::getInstance().debug(msg); }
inline void info(const std::string &msg) { Logger::getInstance().info(msg); }
inline void warn(const std::string &msg) { Logger::getInstance().warn(msg); }
inline void error(const std::string &msg) { Logger::getInstance().error(msg); }
inline void critical(const std::string &msg) { Logger::getInstance().critical(msg); }

} // namespace logger
} // namespace util
} // namespace docshield

#endif // DOCSHIELD_UTIL_LOGGER_HPP
