/**
 * @file backup_engine.hpp
 * @brief Backup pipeline: archive, compress, encrypt, upload, record.
 *
 * Every stage works on files inside a private temporary directory that is removed on every
 * exit path. A BackupRecord is written only after the upload succeeded, so the state store
 * never references an incomplete backup.
 */

#ifndef BACKUP_ENGINE_HPP
#define BACKUP_ENGINE_HPP

#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include "backup_config.hpp"
#include "state_store.hpp"

class Logger;
class PasswordProvider;
class StorageRegistry;

/**
 * @brief Runs single directory backups against the configured backends.
 *
 * The engine holds no per-backup state; concurrent calls for different directories are safe.
 */
class BackupEngine {
public:
    BackupEngine(const BackupConfig& config, const StorageRegistry& registry, StateStore& state,
                 PasswordProvider& passwords, Logger& logger);

    /**
     * @brief Backs up one directory.
     *
     * An incremental or differential backup takes only files modified after its baseline
     * (the newest record, or the newest full record). Without a baseline it falls back to a
     * full backup; with no changed file nothing is uploaded or recorded.
     *
     * @param sourcePath Directory to back up.
     * @param storageOverride Backend to use instead of the configured one.
     * @param cancel Optional flag polled between stages, archive entries and transfer chunks.
     * @return Result<std::optional<BackupRecord>> The record written to the state store,
     * std::nullopt when there was nothing to back up, or the first error tagged with the
     * failing stage.
     */
    Result<std::optional<BackupRecord>> backupDirectory(const std::string& sourcePath,
                                                        const std::optional<std::string>& storageOverride = std::nullopt,
                                                        const std::atomic<bool>* cancel = nullptr);

    /**
     * @brief Archive file name: backup_{dir}_{yyyymmddThhmmssmmmZ}.{tar.gz|tar|zip}[.enc].
     */
    static std::string archiveName(const std::string& sourcePath, ArchiveFormat format, bool compressed,
                                   bool encrypted, std::chrono::system_clock::time_point time);

    /**
     * @brief Remote object path: backups/{dir}/{fileName}.
     */
    static std::string remotePathFor(const std::string& sourcePath, const std::string& fileName);

private:
    std::uintmax_t directorySize(const std::string& sourcePath) const;
    std::optional<std::chrono::system_clock::time_point> changeBaseline(const std::string& source, BackupType& type) const;

    const BackupConfig& config_;
    const StorageRegistry& registry_;
    StateStore& state_;
    PasswordProvider& passwords_;
    Logger& logger_;
};

#endif // BACKUP_ENGINE_HPP
