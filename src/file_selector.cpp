#include "file_selector.hpp"
#include "fs_util.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>

namespace fs = std::filesystem;

namespace {

fs::path normalizedAbsolute(const fs::path& path) {
    std::error_code ec;
    fs::path absolute = fs::absolute(path, ec);
    if (ec) {
        absolute = path;
    }
    fs::path normal = absolute.lexically_normal();
    if (!normal.has_filename() && normal.has_parent_path() && normal != normal.root_path()) {
        normal = normal.parent_path();
    }
    return normal;
}

} // namespace

FileSelector::FileSelector(FileSelectionRules rules, Logger& logger) : rules_(std::move(rules)), logger_(logger) {
    for (const auto& excluded : rules_.excludedPaths) {
        if (!excluded.empty()) {
            excludedRoots_.push_back(normalizedAbsolute(expandPath(excluded)));
        }
    }
}

bool FileSelector::wildcardMatch(const std::string& name, const std::string& pattern) {
    auto same = [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    };
    size_t n = 0, p = 0;
    size_t starPos = std::string::npos, resume = 0;
    while (n < name.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || (pattern[p] != '*' && same(pattern[p], name[n])))) {
            ++n;
            ++p;
        } else if (p < pattern.size() && pattern[p] == '*') {
            starPos = p++;
            resume = n;
        } else if (starPos != std::string::npos) {
            p = starPos + 1;
            n = ++resume;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

bool FileSelector::underExcludedPath(const fs::path& path) const {
    if (excludedRoots_.empty()) {
        return false;
    }
    fs::path candidate = normalizedAbsolute(path);
    for (const auto& root : excludedRoots_) {
        auto mismatch = std::mismatch(root.begin(), root.end(), candidate.begin(), candidate.end());
        if (mismatch.first == root.end()) {
            return true;
        }
    }
    return false;
}

bool FileSelector::includeDirectory(const fs::path& path) const {
    std::string leaf = path.filename().string();
    if (rules_.skipHidden && leaf.size() > 1 && leaf[0] == '.') {
        return false;
    }
    return !underExcludedPath(path);
}

bool FileSelector::includeFile(const fs::path& path, std::uintmax_t size) const {
    std::string leaf = path.filename().string();
    if (rules_.skipHidden && !leaf.empty() && leaf[0] == '.') {
        return false;
    }
    if (underExcludedPath(path)) {
        return false;
    }
    if (rules_.maxFileSizeMB > 0 && size > rules_.maxFileSizeMB * 1024 * 1024) {
        logger_.debug("Skipping large file: " + path.string() + " (" + formatBytes(size) + ")");
        return false;
    }
    for (const auto& pattern : rules_.excludedPatterns) {
        if (wildcardMatch(leaf, pattern)) {
            return false;
        }
    }
    return true;
}
