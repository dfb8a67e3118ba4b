#include "fs_util.hpp"
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <vector>

namespace fs = std::filesystem;

Result<TempDir> TempDir::create(const std::string& prefix) {
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec) {
        base = "/tmp";
    }
    std::string pattern = (base / (prefix + "-XXXXXX")).string();
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');
    if (!mkdtemp(buf.data())) {
        return makeError(ErrorKind::Io, "Failed to create temporary directory under " + base.string());
    }
    return TempDir(fs::path(buf.data()));
}

TempDir::TempDir(TempDir&& other) noexcept : path_(std::move(other.path_)) {
    other.path_.clear();
}

TempDir& TempDir::operator=(TempDir&& other) noexcept {
    if (this != &other) {
        removeAll();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

TempDir::~TempDir() {
    removeAll();
}

void TempDir::removeAll() {
    if (!path_.empty()) {
        std::error_code ec;
        fs::remove_all(path_, ec);
        path_.clear();
    }
}

std::string sanitizeName(const std::string& directory) {
    std::string trimmed = directory;
    while (trimmed.size() > 1 && (trimmed.back() == '/' || trimmed.back() == '\\')) {
        trimmed.pop_back();
    }
    std::string leaf = fs::path(trimmed).filename().string();
    std::string result;
    for (unsigned char c : leaf) {
        result += (std::isalnum(c) || c == '-' || c == '_' || c == '.') ? static_cast<char>(c) : '_';
    }
    if (result.empty() || result == "." || result == "..") {
        return "root";
    }
    return result;
}

namespace {

std::tm utcParts(std::chrono::system_clock::time_point time, int& millis) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
    millis = static_cast<int>(((ms % 1000) + 1000) % 1000);
    std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    std::tm tmUtc{};
    gmtime_r(&seconds, &tmUtc);
    return tmUtc;
}

} // namespace

std::string compactUtcTimestamp(std::chrono::system_clock::time_point time) {
    int millis = 0;
    std::tm tmUtc = utcParts(time, millis);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d%02d%02dT%02d%02d%02d%03dZ", tmUtc.tm_year + 1900, tmUtc.tm_mon + 1,
                  tmUtc.tm_mday, tmUtc.tm_hour, tmUtc.tm_min, tmUtc.tm_sec, millis);
    return buf;
}

std::string isoUtcTimestamp(std::chrono::system_clock::time_point time) {
    int millis = 0;
    std::tm tmUtc = utcParts(time, millis);
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", tmUtc.tm_year + 1900, tmUtc.tm_mon + 1,
                  tmUtc.tm_mday, tmUtc.tm_hour, tmUtc.tm_min, tmUtc.tm_sec, millis);
    return buf;
}

std::optional<std::chrono::system_clock::time_point> parseIsoUtcTimestamp(const std::string& text) {
    std::tm tmUtc{};
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &tmUtc.tm_year, &tmUtc.tm_mon, &tmUtc.tm_mday,
                    &tmUtc.tm_hour, &tmUtc.tm_min, &tmUtc.tm_sec, &consumed) != 6) {
        return std::nullopt;
    }
    int millis = 0;
    size_t pos = static_cast<size_t>(consumed);
    if (pos < text.size() && text[pos] == '.') {
        int scale = 100;
        ++pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            millis += (text[pos] - '0') * scale;
            scale /= 10;
            ++pos;
        }
    }
    if (pos < text.size() && text[pos] != 'Z') {
        return std::nullopt;
    }
    if (tmUtc.tm_mon < 1 || tmUtc.tm_mon > 12 || tmUtc.tm_mday < 1 || tmUtc.tm_mday > 31) {
        return std::nullopt;
    }
    tmUtc.tm_year -= 1900;
    tmUtc.tm_mon -= 1;
    std::time_t seconds = timegm(&tmUtc);
    return std::chrono::system_clock::from_time_t(seconds) + std::chrono::milliseconds(millis);
}

std::string expandPath(const std::string& path) {
    std::string input = path;
    if (!input.empty() && input[0] == '~' && (input.size() == 1 || input[1] == '/')) {
        const char* home = std::getenv("HOME");
        input = std::string(home ? home : "") + input.substr(1);
    }

    std::string result;
    for (size_t i = 0; i < input.size(); ++i) {
        if (input[i] != '$' || i + 1 >= input.size()) {
            result += input[i];
            continue;
        }
        std::string name;
        size_t end = i + 1;
        if (input[end] == '{') {
            size_t close = input.find('}', end);
            if (close == std::string::npos) {
                result += input[i];
                continue;
            }
            name = input.substr(end + 1, close - end - 1);
            end = close + 1;
        } else {
            while (end < input.size() && (std::isalnum(static_cast<unsigned char>(input[end])) || input[end] == '_')) {
                name += input[end++];
            }
            if (name.empty()) {
                result += input[i];
                continue;
            }
        }
        const char* value = std::getenv(name.c_str());
        result += value ? value : "";
        i = end - 1;
    }
    return result;
}

std::string normalizeSourcePath(const std::string& path) {
    if (path.empty()) {
        return path;
    }
    std::error_code ec;
    fs::path absolute = fs::absolute(expandPath(path), ec);
    if (ec) {
        absolute = expandPath(path);
    }
    std::string normal = absolute.lexically_normal().string();
    while (normal.size() > 1 && normal.back() == '/') {
        normal.pop_back();
    }
    return normal;
}

std::string formatBytes(std::uintmax_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    if (bytes < 1024) {
        return std::to_string(bytes) + " B";
    }
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f %s", value, units[unit]);
    return buf;
}

Result<std::uintmax_t> regularFileSize(const fs::path& file) {
    std::error_code ec;
    auto size = fs::file_size(file, ec);
    if (ec) {
        return makeError(ErrorKind::Io, "Cannot read the size of " + file.string() + ": " + ec.message());
    }
    return static_cast<std::uintmax_t>(size);
}

std::optional<fs::file_time_type> newestWriteTime(const fs::path& directory) {
    std::error_code ec;
    auto newest = fs::last_write_time(directory, ec);
    if (ec) {
        return std::nullopt;
    }
    for (auto it = fs::recursive_directory_iterator(directory, fs::directory_options::skip_permission_denied, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code entryEc;
        auto time = it->last_write_time(entryEc);
        if (!entryEc && time > newest) {
            newest = time;
        }
    }
    return newest;
}

std::chrono::system_clock::time_point toSystemTime(fs::file_time_type time) {
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(std::chrono::file_clock::to_sys(time));
}
