/**
 * @file logger.hpp
 * @brief Timestamped console and file logging for ReStore.
 *
 * Every line is written as "[YYYY-mm-dd HH:MM:SS] LEVEL: message" to the console and, when
 * configured, appended to a log file. Errors are additionally appended to a dedicated error
 * log file. Safe to share between threads.
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <string>
#include <mutex>
#include <optional>

/**
 * @brief Severity of a log line, ordered from most to least verbose.
 */
enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

/**
 * @brief Thread-safe logger writing to stdout/stderr and optional log files.
 */
class Logger {
public:
    /**
     * @brief Creates a console-only logger at Info level.
     */
    Logger();

    /**
     * @brief Creates a logger that also appends to files.
     *
     * @param logFile File receiving every line at or above the threshold. Empty disables it.
     * @param errorLogFile File receiving error lines only. Empty disables it.
     * @param level Minimum level written.
     * @note Parent directories of both files are created on first use.
     */
    Logger(std::string logFile, std::string errorLogFile, LogLevel level);

    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);

    /**
     * @brief Writes a message at the given level if it passes the threshold.
     */
    void log(LogLevel level, const std::string& message);

    void setLevel(LogLevel level);
    LogLevel level() const;

    /**
     * @brief Enables or disables console echo. File output is unaffected.
     */
    void setConsoleOutput(bool enabled);

    /**
     * @brief Parses "debug", "info", "warning" or "error" (case-insensitive).
     */
    static std::optional<LogLevel> parseLevel(const std::string& text);

private:
    void appendToFile(const std::string& path, const std::string& line);

    mutable std::mutex mutex_;
    std::string logFile_;       ///< Main log file, empty if disabled.
    std::string errorLogFile_;  ///< Error log file, empty if disabled.
    LogLevel level_;            ///< Minimum level written.
    bool console_ = true;       ///< Echo to stdout/stderr.
};

#endif // LOGGER_HPP
