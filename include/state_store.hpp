/**
 * @file state_store.hpp
 * @brief Persisted record of completed backups per source directory.
 *
 * The state file is a JSON document:
 *
 *   {"version": 1, "paths": {"/home/u/docs": {"history": [record, ...]}}}
 *
 * History is kept oldest first and capped per path. Every mutation rewrites the file
 * through a temporary file in the same directory followed by a rename, so a crash never
 * leaves a truncated document behind.
 */

#ifndef STATE_STORE_HPP
#define STATE_STORE_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>
#include "backup_error.hpp"

class Logger;

/**
 * @brief Which files a backup takes.
 */
enum class BackupType {
    Full,           ///< Every selected file.
    Incremental,    ///< Files changed since the previous backup of any type.
    Differential    ///< Files changed since the previous full backup.
};

/**
 * @brief Lower-case name ("full", "incremental", "differential").
 */
std::string backupTypeName(BackupType type);

/**
 * @brief Parses a backup type name (case-insensitive).
 */
std::optional<BackupType> parseBackupType(const std::string& text);

/**
 * @brief One fully successful backup.
 */
struct BackupRecord {
    std::string sourcePath;                             ///< Normalized source directory.
    std::string remotePath;                             ///< Object path in the backend.
    std::chrono::system_clock::time_point timestamp;    ///< Time the source was read (UTC).
    std::uintmax_t sizeBytesOriginal = 0;               ///< Bytes of archived files.
    std::uintmax_t sizeBytesStored = 0;                 ///< Bytes uploaded.
    std::string storageType;                            ///< Backend name.
    bool encrypted = false;                             ///< Whether the object is encrypted.
    std::size_t fileCount = 0;                          ///< Files in the archive.
    BackupType type = BackupType::Full;                 ///< Which files the archive holds.
};

/**
 * @brief Thread-safe store of backup history, persisted atomically.
 */
class StateStore {
public:
    static constexpr std::size_t kMaxHistory = 32;

    StateStore(std::string stateFile, Logger& logger);

    /**
     * @brief Loads the state file.
     *
     * A missing file yields an empty state. An unreadable or corrupt file is moved aside to
     * "<file>.corrupt", logged as a warning and replaced by an empty state.
     */
    void load();

    /**
     * @brief Appends a record for sourcePath and persists the store.
     *
     * The in-memory state is left unchanged when the file cannot be written.
     *
     * @return Result<void> Io error when persisting fails.
     */
    Result<void> record(const std::string& sourcePath, BackupRecord record);

    /**
     * @brief Newest record for a source directory.
     */
    std::optional<BackupRecord> latest(const std::string& sourcePath) const;

    /**
     * @brief Newest full backup of a source directory, the base of differential backups.
     */
    std::optional<BackupRecord> latestFull(const std::string& sourcePath) const;

    /**
     * @brief All records for a source directory, oldest first.
     */
    std::vector<BackupRecord> history(const std::string& sourcePath) const;

    /**
     * @brief Finds the record that produced a remote object.
     */
    std::optional<BackupRecord> findByRemotePath(const std::string& remotePath) const;

    /**
     * @brief Drops the records of sourcePath whose remotePath is listed, then persists.
     */
    Result<void> removeRecords(const std::string& sourcePath, const std::vector<std::string>& remotePaths);

    /**
     * @brief Source directories with at least one record.
     */
    std::vector<std::string> trackedPaths() const;

    const std::string& file() const { return stateFile_; }

private:
    Json::Value toJsonLocked() const;
    Result<void> persistLocked() const;
    static Json::Value recordToJson(const BackupRecord& record);
    static std::optional<BackupRecord> recordFromJson(const Json::Value& value, const std::string& sourcePath);

    mutable std::mutex mutex_;
    std::string stateFile_;
    Logger& logger_;
    std::map<std::string, std::vector<BackupRecord>> paths_;    ///< History per normalized path.
};

#endif // STATE_STORE_HPP
