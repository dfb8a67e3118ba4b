#include "password_provider.hpp"
#include <cstdlib>
#include <algorithm>
#include <iostream>
#include <termios.h>
#include <unistd.h>

StaticPasswordProvider::StaticPasswordProvider(std::optional<std::string> password) : password_(std::move(password)) {}

std::optional<std::string> StaticPasswordProvider::password() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!password_ || password_->empty()) {
        return std::nullopt;
    }
    return password_;
}

void StaticPasswordProvider::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    password_.reset();
}

EnvironmentPasswordProvider::EnvironmentPasswordProvider(std::string variable) : variable_(std::move(variable)) {}

std::optional<std::string> EnvironmentPasswordProvider::password() {
    const char* value = std::getenv(variable_.c_str());
    if (!value || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

TerminalPasswordProvider::TerminalPasswordProvider(std::string prompt) : prompt_(std::move(prompt)) {}

std::optional<std::string> TerminalPasswordProvider::password() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cached_) {
        return cached_;
    }
    if (!isatty(STDIN_FILENO)) {
        return std::nullopt;
    }

    std::cerr << prompt_ << std::flush;
    termios original{};
    bool restore = tcgetattr(STDIN_FILENO, &original) == 0;
    if (restore) {
        termios silent = original;
        silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        tcsetattr(STDIN_FILENO, TCSANOW, &silent);
    }
    std::string line;
    bool ok = static_cast<bool>(std::getline(std::cin, line));
    if (restore) {
        tcsetattr(STDIN_FILENO, TCSANOW, &original);
    }
    std::cerr << std::endl;

    if (!ok || line.empty()) {
        return std::nullopt;
    }
    cached_ = line;
    return cached_;
}

void TerminalPasswordProvider::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cached_) {
        std::fill(cached_->begin(), cached_->end(), '\0');
        cached_.reset();
    }
}
