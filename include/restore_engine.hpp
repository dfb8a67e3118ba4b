/**
 * @file restore_engine.hpp
 * @brief Restore pipeline: download, decrypt, decompress, extract.
 */

#ifndef RESTORE_ENGINE_HPP
#define RESTORE_ENGINE_HPP

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include "backup_config.hpp"
#include "state_store.hpp"

class Logger;
class PasswordProvider;
class StorageRegistry;

/**
 * @brief Outcome of a successful restore.
 */
struct RestoreResult {
    std::size_t files = 0;          ///< Regular files written.
    std::uintmax_t bytes = 0;       ///< Bytes written.
    std::string storageType;        ///< Backend the archive came from.
};

/**
 * @brief Restores archives produced by BackupEngine.
 */
class RestoreEngine {
public:
    RestoreEngine(const BackupConfig& config, const StorageRegistry& registry, const StateStore& state,
                  PasswordProvider& passwords, Logger& logger);

    /**
     * @brief Restores one backup into targetDir.
     *
     * The backend is the override when given, else the one recorded for backupPath in the
     * state store, else the global default. Encrypted archives are fully decrypted and
     * authenticated before anything is extracted; a wrong password extracts nothing and
     * clears the password provider's cached secret. Existing files in targetDir are
     * overwritten.
     *
     * @param backupPath Remote object path, e.g. "backups/docs/backup_docs_....tar.gz.enc".
     * @param targetDir Directory to unpack into, created when missing.
     * @param storageOverride Backend to use instead of the resolved one.
     * @param cancel Optional flag polled during the download.
     * @return Result<RestoreResult> Counters, or the first error tagged with its stage.
     */
    Result<RestoreResult> restoreFromBackup(const std::string& backupPath, const std::string& targetDir,
                                            const std::optional<std::string>& storageOverride = std::nullopt,
                                            const std::atomic<bool>* cancel = nullptr);

    /**
     * @brief Backend name restoreFromBackup() would use.
     */
    std::string resolveStorageType(const std::string& backupPath, const std::optional<std::string>& storageOverride) const;

private:
    const BackupConfig& config_;
    const StorageRegistry& registry_;
    const StateStore& state_;
    PasswordProvider& passwords_;
    Logger& logger_;
};

#endif // RESTORE_ENGINE_HPP
