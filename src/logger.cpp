#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

namespace {

const char* levelTag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG: ";
        case LogLevel::Info: return "";
        case LogLevel::Warning: return "WARNING: ";
        case LogLevel::Error: return "ERROR: ";
    }
    return "";
}

std::string timestampNow() {
    auto now = std::chrono::system_clock::now();
    auto timeT = std::chrono::system_clock::to_time_t(now);
    std::tm tmLocal{};
    localtime_r(&timeT, &tmLocal);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", &tmLocal);
    return timeBuf;
}

} // namespace

Logger::Logger() : level_(LogLevel::Info) {}

Logger::Logger(std::string logFile, std::string errorLogFile, LogLevel level)
    : logFile_(std::move(logFile)), errorLogFile_(std::move(errorLogFile)), level_(level) {}

void Logger::debug(const std::string& message) { log(LogLevel::Debug, message); }
void Logger::info(const std::string& message) { log(LogLevel::Info, message); }
void Logger::warning(const std::string& message) { log(LogLevel::Warning, message); }
void Logger::error(const std::string& message) { log(LogLevel::Error, message); }

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < level_) {
        return;
    }

    std::string logEntry = "[" + timestampNow() + "] " + levelTag(level) + message;

    if (console_) {
        if (level >= LogLevel::Warning) {
            std::cerr << logEntry << std::endl;
        } else {
            std::cout << logEntry << std::endl;
        }
    }

    if (!logFile_.empty()) {
        appendToFile(logFile_, logEntry);
    }
    if (level == LogLevel::Error && !errorLogFile_.empty()) {
        appendToFile(errorLogFile_, logEntry);
    }
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::setConsoleOutput(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_ = enabled;
}

std::optional<LogLevel> Logger::parseLevel(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "error") return LogLevel::Error;
    return std::nullopt;
}

void Logger::appendToFile(const std::string& path, const std::string& line) {
    fs::path logPath(path);
    if (logPath.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(logPath.parent_path(), ec);
    }
    std::ofstream log(path, std::ios::app);
    if (log.is_open()) {
        log << line << '\n';
        log.flush();
    } else if (console_) {
        std::cerr << "Error: Cannot write to log file: " << path << std::endl;
    }
}
