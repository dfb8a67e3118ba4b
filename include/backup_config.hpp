/**
 * @file backup_config.hpp
 * @brief Configuration management for ReStore.
 *
 * Defines the configuration view consumed by the engines: watched directories with optional
 * per-path storage, per-backend option maps, pipeline settings, exclusion rules, retention,
 * watch timing and file locations.
 *
 * @note Configuration is loaded from a JSON file. Paths may use "~" and $VAR references,
 * which are expanded at load time.
 */

#ifndef BACKUP_CONFIG_HPP
#define BACKUP_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>
#include "archive.hpp"
#include "file_selector.hpp"
#include "state_store.hpp"
#include "storage_backend.hpp"

/**
 * @brief A configured watched directory.
 */
struct BackupTarget {
    std::string path;                           ///< Normalized absolute directory.
    std::optional<std::string> storageType;     ///< Per-path backend, falls back to the global default.
};

/**
 * @brief Encryption stage settings. The password itself never appears in configuration.
 */
struct EncryptionSettings {
    bool enabled = false;                       ///< Encrypt archives before upload.
    std::uint32_t iterations = 100000;          ///< PBKDF2 iterations for new archives.
};

/**
 * @brief Retention policy applied after each successful backup.
 */
struct RetentionSettings {
    bool enabled = false;                       ///< Delete old backups after each run.
    int keepLast = 10;                          ///< Newest backups always kept per directory.
    int maxAgeDays = 30;                        ///< Backups younger than this are kept. 0 disables.
};

/**
 * @brief Watch mode timing.
 */
struct WatchSettings {
    std::chrono::milliseconds debounce{10000};  ///< Quiet period before a triggered backup.
    bool initialBackup = true;                  ///< Reconcile against state at startup.
};

/**
 * @brief Storage overrides for system inventory components.
 */
struct ComponentStorageSettings {
    std::optional<std::string> storageType;             ///< Default for all components.
    std::optional<std::string> programsStorageType;     ///< Installed program list.
    std::optional<std::string> environmentStorageType;  ///< Environment variables.
    std::optional<std::string> settingsStorageType;     ///< Desktop settings snapshot.
};

/**
 * @brief Configuration class for the backup system.
 *
 * Loads settings from a JSON file, providing defaults for every key.
 */
class BackupConfig {
public:
    /**
     * @brief Constructs a configuration with defaults only.
     */
    BackupConfig();

    /**
     * @brief Constructs a configuration instance from a JSON file.
     *
     * @param configFile Path to the JSON configuration file.
     * @throws std::runtime_error If the file is unreadable, is not valid JSON, or names an
     * unknown archive format or log level.
     */
    explicit BackupConfig(const std::string& configFile);

    /**
     * @brief Builds a configuration from an already parsed document.
     *
     * @throws std::runtime_error On invalid values, as the file constructor.
     */
    static BackupConfig fromJson(const Json::Value& root);

    /**
     * @brief Default location of the configuration file (~/ReStore/config.json).
     */
    static std::string defaultConfigPath();

    /**
     * @brief Effective storage type for a source directory.
     *
     * Order: explicit override, then the per-path configured type, then globalStorageType.
     */
    std::string resolveStorageType(const std::string& sourcePath, const std::optional<std::string>& storageOverride) const;

    /**
     * @brief Option map configured for a backend, empty when none is configured.
     */
    StorageOptions storageOptions(const std::string& storageType) const;

    /**
     * @brief Storage type for a system inventory component ("programs", "environment", "settings").
     */
    std::string componentStorage(const std::string& component) const;

    /**
     * @brief Exclusion rules in the form consumed by FileSelector.
     */
    FileSelectionRules selectionRules() const;

    std::vector<BackupTarget> watchDirectories;             ///< Directories watched in watch mode.
    std::string globalStorageType = "local";                ///< Default backend name.
    std::map<std::string, StorageOptions> storageSources;   ///< Options per backend, keyed lower-case.
    ComponentStorageSettings components;                    ///< System inventory overrides.
    BackupType backupType = BackupType::Full;               ///< Which files each backup takes.
    ArchiveFormat archiveFormat = ArchiveFormat::Tar;       ///< Archive container.
    bool compress = true;                                   ///< Gzip tar archives.
    EncryptionSettings encryption;                          ///< Encryption stage.
    std::vector<std::string> excludedPatterns;              ///< Filename wildcards to skip.
    std::vector<std::string> excludedPaths;                 ///< Trees to skip.
    std::uintmax_t maxFileSizeMB = 100;                     ///< Larger files are skipped.
    bool skipHidden = true;                                 ///< Skip dot-files.
    std::uintmax_t sizeThresholdMB = 500;                   ///< Warn when a directory is larger.
    RetentionSettings retention;                            ///< Retention policy.
    WatchSettings watch;                                    ///< Watch mode timing.
    std::string stateFile;                                  ///< Persisted backup state.
    std::string logFile;                                    ///< Main log file.
    std::string errorLogFile;                               ///< Error log file.
    std::string logLevel = "info";                          ///< Minimum log level.
};

#endif // BACKUP_CONFIG_HPP
