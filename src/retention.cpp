#include "retention.hpp"
#include "logger.hpp"
#include "storage_registry.hpp"
#include <algorithm>
#include <map>
#include <set>

std::vector<BackupRecord> selectExpiredBackups(const std::vector<BackupRecord>& history,
                                               const RetentionSettings& settings,
                                               std::chrono::system_clock::time_point now) {
    std::vector<BackupRecord> ordered;
    for (const auto& record : history) {
        if (!record.remotePath.empty()) {
            ordered.push_back(record);
        }
    }
    if (ordered.size() <= 1) {
        return {};
    }
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const BackupRecord& a, const BackupRecord& b) { return a.timestamp > b.timestamp; });

    std::size_t keepLast = static_cast<std::size_t>(std::max(1, settings.keepLast));
    std::set<std::string> keep;
    for (std::size_t i = 0; i < ordered.size() && i < keepLast; ++i) {
        keep.insert(ordered[i].remotePath);
    }
    if (settings.maxAgeDays > 0) {
        auto cutoff = now - std::chrono::hours(24) * settings.maxAgeDays;
        for (const auto& record : ordered) {
            if (record.timestamp >= cutoff) {
                keep.insert(record.remotePath);
            }
        }
    }
    keep.insert(ordered.front().remotePath);

    std::vector<BackupRecord> expired;
    for (const auto& record : ordered) {
        if (keep.find(record.remotePath) == keep.end()) {
            expired.push_back(record);
        }
    }
    return expired;
}

RetentionPolicy::RetentionPolicy(const BackupConfig& config, const StorageRegistry& registry, StateStore& state, Logger& logger)
    : config_(config), registry_(registry), state_(state), logger_(logger) {}

std::size_t RetentionPolicy::apply(const std::string& sourcePath, StorageBackend* openBackend, const std::string& openType) {
    if (!config_.retention.enabled) {
        return 0;
    }
    auto expired = selectExpiredBackups(state_.history(sourcePath), config_.retention, std::chrono::system_clock::now());
    if (expired.empty()) {
        return 0;
    }
    logger_.info("Retention: " + sourcePath + " will delete " + std::to_string(expired.size()) + " backup(s)");

    std::map<std::string, std::vector<BackupRecord>> byStorage;
    for (const auto& record : expired) {
        std::string type = record.storageType.empty() ? config_.globalStorageType : StorageRegistry::normalizeName(record.storageType);
        byStorage[type].push_back(record);
    }

    std::vector<std::string> removed;
    for (const auto& [type, records] : byStorage) {
        ScopedStorage opened;
        StorageBackend* backend = nullptr;
        if (openBackend && StorageRegistry::normalizeName(openType) == type) {
            backend = openBackend;
        } else {
            auto storage = registry_.open(type, config_.storageOptions(type));
            if (!storage) {
                logger_.error("Retention: failed to open storage '" + type + "': " + storage.error().describe());
                continue;
            }
            opened = std::move(*storage);
            backend = opened.get();
        }

        for (const auto& record : records) {
            auto present = backend->exists(record.remotePath);
            if (!present) {
                logger_.warning("Retention: failed checking " + record.remotePath + ": " + present.error().describe());
                continue;
            }
            if (!*present) {
                logger_.warning("Retention: backup missing in storage (will drop from state): " + record.remotePath);
                removed.push_back(record.remotePath);
                continue;
            }
            auto deleted = backend->remove(record.remotePath);
            if (!deleted) {
                logger_.warning("Retention: failed deleting " + record.remotePath + ": " + deleted.error().describe());
                continue;
            }
            logger_.info("Retention: deleted backup: " + record.remotePath);
            removed.push_back(record.remotePath);
        }
    }

    if (removed.empty()) {
        return 0;
    }
    auto pruned = state_.removeRecords(sourcePath, removed);
    if (!pruned) {
        logger_.error("Retention: failed to update backup state: " + pruned.error().describe());
        return 0;
    }
    return removed.size();
}
