/**
 * @file retention.hpp
 * @brief Removal of old backups according to the configured retention policy.
 */

#ifndef RETENTION_HPP
#define RETENTION_HPP

#include <chrono>
#include <string>
#include <vector>
#include "backup_config.hpp"
#include "state_store.hpp"

class Logger;
class StorageBackend;
class StorageRegistry;

/**
 * @brief Picks the backups a retention policy would delete.
 *
 * The newest keepLast backups are kept, as is every backup younger than maxAgeDays (when
 * positive). The newest backup is always kept. keepLast below 1 counts as 1.
 *
 * @param history Records of one source directory, any order.
 * @return Records to delete, newest first.
 */
std::vector<BackupRecord> selectExpiredBackups(const std::vector<BackupRecord>& history,
                                               const RetentionSettings& settings,
                                               std::chrono::system_clock::time_point now);

/**
 * @brief Deletes expired backups from their backends and prunes them from the state store.
 */
class RetentionPolicy {
public:
    RetentionPolicy(const BackupConfig& config, const StorageRegistry& registry, StateStore& state, Logger& logger);

    /**
     * @brief Applies the policy to one source directory.
     *
     * Failures are logged and never propagated. A backup already missing from storage is
     * dropped from state.
     *
     * @param sourcePath Source directory.
     * @param openBackend Backend already open for openType, reused instead of reconnecting.
     * @param openType Registry name of openBackend.
     * @return Number of backups removed from state.
     */
    std::size_t apply(const std::string& sourcePath, StorageBackend* openBackend = nullptr,
                      const std::string& openType = "");

private:
    const BackupConfig& config_;
    const StorageRegistry& registry_;
    StateStore& state_;
    Logger& logger_;
};

#endif // RETENTION_HPP
