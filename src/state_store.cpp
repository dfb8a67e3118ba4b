#include "state_store.hpp"
#include "fs_util.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

std::string backupTypeName(BackupType type) {
    switch (type) {
        case BackupType::Incremental: return "incremental";
        case BackupType::Differential: return "differential";
        case BackupType::Full: break;
    }
    return "full";
}

std::optional<BackupType> parseBackupType(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    for (BackupType type : {BackupType::Full, BackupType::Incremental, BackupType::Differential}) {
        if (lower == backupTypeName(type)) {
            return type;
        }
    }
    return std::nullopt;
}

StateStore::StateStore(std::string stateFile, Logger& logger) : stateFile_(std::move(stateFile)), logger_(logger) {}

void StateStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    paths_.clear();

    std::error_code ec;
    if (!fs::exists(stateFile_, ec)) {
        logger_.info("No backup state at " + stateFile_ + ", starting fresh");
        return;
    }

    std::ifstream file(stateFile_);
    Json::Value root;
    Json::Reader reader;
    if (!file.is_open() || !reader.parse(file, root) || !root.isObject()) {
        file.close();
        std::string aside = stateFile_ + ".corrupt";
        fs::rename(stateFile_, aside, ec);
        logger_.warning("Backup state " + stateFile_ + " is unreadable or corrupt, starting with empty state" +
                        (ec ? std::string() : " (previous file kept as " + aside + ")"));
        return;
    }

    int version = root.get("version", 1).asInt();
    if (version > 1) {
        logger_.warning("Backup state version " + std::to_string(version) + " is newer than supported, reading known fields");
    }

    const Json::Value& paths = root["paths"];
    if (!paths.isObject()) {
        return;
    }
    std::size_t skipped = 0;
    for (const auto& path : paths.getMemberNames()) {
        std::string key = normalizeSourcePath(path);
        auto& history = paths_[key];
        for (const auto& item : paths[path]["history"]) {
            auto parsed = recordFromJson(item, key);
            if (parsed) {
                history.push_back(*parsed);
            } else {
                ++skipped;
            }
        }
        std::stable_sort(history.begin(), history.end(),
                         [](const BackupRecord& a, const BackupRecord& b) { return a.timestamp < b.timestamp; });
        if (history.size() > kMaxHistory) {
            history.erase(history.begin(), history.end() - static_cast<std::ptrdiff_t>(kMaxHistory));
        }
        if (history.empty()) {
            paths_.erase(key);
        }
    }
    if (skipped > 0) {
        logger_.warning("Ignored " + std::to_string(skipped) + " malformed record(s) in " + stateFile_);
    }
    logger_.debug("Loaded backup state for " + std::to_string(paths_.size()) + " path(s) from " + stateFile_);
}

Result<void> StateStore::record(const std::string& sourcePath, BackupRecord record) {
    std::string key = normalizeSourcePath(sourcePath);
    record.sourcePath = key;

    std::lock_guard<std::mutex> lock(mutex_);
    auto previous = paths_;
    auto& history = paths_[key];
    auto position = std::upper_bound(history.begin(), history.end(), record,
                                     [](const BackupRecord& a, const BackupRecord& b) { return a.timestamp < b.timestamp; });
    history.insert(position, std::move(record));
    if (history.size() > kMaxHistory) {
        history.erase(history.begin(), history.end() - static_cast<std::ptrdiff_t>(kMaxHistory));
    }

    auto persisted = persistLocked();
    if (!persisted) {
        paths_ = std::move(previous);
        return persisted;
    }
    return {};
}

std::optional<BackupRecord> StateStore::latest(const std::string& sourcePath) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = paths_.find(normalizeSourcePath(sourcePath));
    if (it == paths_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second.back();
}

std::optional<BackupRecord> StateStore::latestFull(const std::string& sourcePath) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = paths_.find(normalizeSourcePath(sourcePath));
    if (it == paths_.end()) {
        return std::nullopt;
    }
    auto full = std::find_if(it->second.rbegin(), it->second.rend(),
                             [](const BackupRecord& record) { return record.type == BackupType::Full; });
    if (full == it->second.rend()) {
        return std::nullopt;
    }
    return *full;
}

std::vector<BackupRecord> StateStore::history(const std::string& sourcePath) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = paths_.find(normalizeSourcePath(sourcePath));
    if (it == paths_.end()) {
        return {};
    }
    return it->second;
}

std::optional<BackupRecord> StateStore::findByRemotePath(const std::string& remotePath) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [path, history] : paths_) {
        for (auto it = history.rbegin(); it != history.rend(); ++it) {
            if (it->remotePath == remotePath) {
                return *it;
            }
        }
    }
    return std::nullopt;
}

Result<void> StateStore::removeRecords(const std::string& sourcePath, const std::vector<std::string>& remotePaths) {
    std::string key = normalizeSourcePath(sourcePath);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = paths_.find(key);
    if (it == paths_.end() || remotePaths.empty()) {
        return {};
    }
    auto previous = paths_;
    auto& history = it->second;
    history.erase(std::remove_if(history.begin(), history.end(),
                                 [&](const BackupRecord& record) {
                                     return std::find(remotePaths.begin(), remotePaths.end(), record.remotePath) !=
                                            remotePaths.end();
                                 }),
                  history.end());
    if (history.empty()) {
        paths_.erase(it);
    }

    auto persisted = persistLocked();
    if (!persisted) {
        paths_ = std::move(previous);
        return persisted;
    }
    return {};
}

std::vector<std::string> StateStore::trackedPaths() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    for (const auto& [path, history] : paths_) {
        if (!history.empty()) {
            result.push_back(path);
        }
    }
    return result;
}

Json::Value StateStore::recordToJson(const BackupRecord& record) {
    Json::Value value;
    value["sourcePath"] = record.sourcePath;
    value["remotePath"] = record.remotePath;
    value["timestamp"] = isoUtcTimestamp(record.timestamp);
    value["sizeBytesOriginal"] = static_cast<Json::UInt64>(record.sizeBytesOriginal);
    value["sizeBytesStored"] = static_cast<Json::UInt64>(record.sizeBytesStored);
    value["storageType"] = record.storageType;
    value["encrypted"] = record.encrypted;
    value["fileCount"] = static_cast<Json::UInt64>(record.fileCount);
    value["backupType"] = backupTypeName(record.type);
    return value;
}

std::optional<BackupRecord> StateStore::recordFromJson(const Json::Value& value, const std::string& sourcePath) {
    if (!value.isObject() || !value["remotePath"].isString() || !value["timestamp"].isString()) {
        return std::nullopt;
    }
    auto timestamp = parseIsoUtcTimestamp(value["timestamp"].asString());
    if (!timestamp) {
        return std::nullopt;
    }
    BackupRecord record;
    record.sourcePath = sourcePath;
    record.remotePath = value["remotePath"].asString();
    record.timestamp = *timestamp;
    record.sizeBytesOriginal = value["sizeBytesOriginal"].isUInt64() ? value["sizeBytesOriginal"].asUInt64() : 0;
    record.sizeBytesStored = value["sizeBytesStored"].isUInt64() ? value["sizeBytesStored"].asUInt64() : 0;
    record.storageType = value.get("storageType", "").asString();
    record.encrypted = value.get("encrypted", false).asBool();
    record.fileCount = value["fileCount"].isUInt64() ? static_cast<std::size_t>(value["fileCount"].asUInt64()) : 0;
    // Records written before backup types existed are full backups.
    record.type = parseBackupType(value.get("backupType", "full").asString()).value_or(BackupType::Full);
    return record;
}

Json::Value StateStore::toJsonLocked() const {
    Json::Value root;
    root["version"] = 1;
    root["paths"] = Json::Value(Json::objectValue);
    for (const auto& [path, history] : paths_) {
        Json::Value entry;
        entry["history"] = Json::Value(Json::arrayValue);
        for (const auto& record : history) {
            entry["history"].append(recordToJson(record));
        }
        root["paths"][path] = entry;
    }
    return root;
}

Result<void> StateStore::persistLocked() const {
    fs::path target(stateFile_);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return makeError(ErrorKind::Io, "Failed to create state directory " + target.parent_path().string() + ": " + ec.message());
        }
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::string document = Json::writeString(builder, toJsonLocked());

    std::string tempPath = stateFile_ + ".tmp." + std::to_string(::getpid());
    FILE* out = std::fopen(tempPath.c_str(), "wb");
    if (!out) {
        return makeError(ErrorKind::Io, "Failed to write state file " + tempPath);
    }
    bool written = std::fwrite(document.data(), 1, document.size(), out) == document.size();
    written = std::fflush(out) == 0 && written;
    written = ::fsync(fileno(out)) == 0 && written;
    written = std::fclose(out) == 0 && written;
    if (!written) {
        fs::remove(tempPath, ec);
        return makeError(ErrorKind::Io, "Failed to write state file " + tempPath);
    }

    fs::rename(tempPath, target, ec);
    if (ec) {
        std::error_code removeEc;
        fs::remove(tempPath, removeEc);
        return makeError(ErrorKind::Io, "Failed to replace state file " + stateFile_ + ": " + ec.message());
    }
    return {};
}
