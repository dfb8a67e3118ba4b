/**
 * @file backup_api.hpp
 * @brief High-level API for interacting with the ReStore backup system.
 *
 * Provides a single entry point for backups, restores, share links and watch mode,
 * owning every long-lived component (logger, storage registry, state store, engines and the
 * watch orchestrator). main() creates one instance; there are no globals.
 *
 * @note Dependencies (libarchive, libssh, libcurl, OpenSSL, zlib, jsoncpp) must be installed.
 */

#ifndef BACKUP_API_HPP
#define BACKUP_API_HPP

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "backup_config.hpp"
#include "backup_engine.hpp"
#include "change_monitor.hpp"
#include "logger.hpp"
#include "password_provider.hpp"
#include "restore_engine.hpp"
#include "share_link_issuer.hpp"
#include "state_store.hpp"
#include "storage_registry.hpp"
#include "watch_orchestrator.hpp"

/**
 * @brief API for managing backups in ReStore.
 *
 * Direct calls run on the caller's thread. Watch mode runs on background threads until
 * stopWatch() is called, typically from the signal handling thread.
 */
class BackupApi {
public:
    /**
     * @brief Builds every component from a configuration and loads the state file.
     *
     * @param config Loaded configuration.
     * @param passwords Password source for encryption and decryption.
     * @param logger Logger to use; when null one is created from the configured log files and level.
     */
    BackupApi(BackupConfig config, std::unique_ptr<PasswordProvider> passwords,
              std::unique_ptr<Logger> logger = nullptr);
    ~BackupApi();

    BackupApi(const BackupApi&) = delete;
    BackupApi& operator=(const BackupApi&) = delete;

    /**
     * @brief Backs up one directory. See BackupEngine::backupDirectory.
     */
    Result<std::optional<BackupRecord>> backupDirectory(const std::string& sourcePath,
                                                        const std::optional<std::string>& storageOverride = std::nullopt);

    /**
     * @brief Restores one backup. See RestoreEngine::restoreFromBackup.
     */
    Result<RestoreResult> restoreFromBackup(const std::string& backupPath, const std::string& targetDir,
                                            const std::optional<std::string>& storageOverride = std::nullopt);

    /**
     * @brief Uploads a file and returns a time-limited link. See ShareLinkIssuer::shareFile.
     */
    Result<ShareLink> shareFile(const std::string& localPath, const std::string& storageType,
                                std::chrono::seconds expiration);

    /**
     * @brief Starts watch mode over the configured watchDirectories with an inotify monitor.
     */
    Result<void> startWatch();

    /**
     * @brief Starts watch mode with a given change source.
     *
     * @param monitor Change source, may be null to accept changes through watcher() only.
     * @return Result<void> Configuration error when nothing is configured to watch or watch
     * mode is already running, or the monitor's start error.
     */
    Result<void> startWatch(std::unique_ptr<ChangeMonitor> monitor);

    /**
     * @brief Stops watch mode and joins its threads. Safe to call from any thread, and when
     * watch mode never started.
     */
    void stopWatch();

    /**
     * @brief Blocks until watch mode has been stopped. Returns at once if it never started.
     */
    void waitForWatch();

    /**
     * @brief The current orchestrator, null before watch mode was started.
     *
     * The returned handle stays valid after a later startWatch() replaces it.
     */
    std::shared_ptr<WatchOrchestrator> watcher();

    const BackupConfig& config() const { return config_; }
    Logger& logger() { return *logger_; }
    StorageRegistry& registry() { return registry_; }
    StateStore& state() { return state_; }

private:
    BackupConfig config_;
    std::unique_ptr<Logger> logger_;
    std::unique_ptr<PasswordProvider> passwords_;
    StorageRegistry registry_;
    StateStore state_;
    BackupEngine backupEngine_;
    RestoreEngine restoreEngine_;
    ShareLinkIssuer shareIssuer_;

    std::mutex watchMutex_;
    std::shared_ptr<WatchOrchestrator> watcher_;     ///< Guarded by watchMutex_; copied out before use.
};

#endif // BACKUP_API_HPP
