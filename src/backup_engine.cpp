#include "backup_engine.hpp"
#include "archive.hpp"
#include "compression.hpp"
#include "encryption.hpp"
#include "file_selector.hpp"
#include "fs_util.hpp"
#include "logger.hpp"
#include "password_provider.hpp"
#include "retention.hpp"
#include "storage_registry.hpp"
#include <cstdio>
#include <filesystem>

namespace fs = std::filesystem;

namespace {

std::unexpected<BackupError> staged(const BackupError& error, const char* stage) {
    return std::unexpected(error.atStage(stage));
}

std::unexpected<BackupError> cancelledAt(const char* stage, const std::string& sourcePath) {
    return std::unexpected(BackupError{ErrorKind::Cancelled, "Backup of " + sourcePath + " was cancelled", stage});
}

bool isCancelled(const std::atomic<bool>* cancel) {
    return cancel && cancel->load();
}

std::string formatSeconds(std::chrono::milliseconds elapsed) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2fs", static_cast<double>(elapsed.count()) / 1000.0);
    return buf;
}

} // namespace

BackupEngine::BackupEngine(const BackupConfig& config, const StorageRegistry& registry, StateStore& state,
                           PasswordProvider& passwords, Logger& logger)
    : config_(config), registry_(registry), state_(state), passwords_(passwords), logger_(logger) {}

std::string BackupEngine::archiveName(const std::string& sourcePath, ArchiveFormat format, bool compressed,
                                      bool encrypted, std::chrono::system_clock::time_point time) {
    std::string name = "backup_" + sanitizeName(sourcePath) + "_" + compactUtcTimestamp(time) + "." + archiveExtension(format);
    if (compressed) {
        name += ".gz";
    }
    if (encrypted) {
        name += ".enc";
    }
    return name;
}

std::string BackupEngine::remotePathFor(const std::string& sourcePath, const std::string& fileName) {
    return "backups/" + sanitizeName(sourcePath) + "/" + fileName;
}

std::uintmax_t BackupEngine::directorySize(const std::string& sourcePath) const {
    std::uintmax_t total = 0;
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(sourcePath, fs::directory_options::skip_permission_denied, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code sizeEc;
        if (it->is_regular_file(sizeEc)) {
            auto size = it->file_size(sizeEc);
            if (!sizeEc) {
                total += size;
            }
        }
    }
    return total;
}

std::optional<std::chrono::system_clock::time_point> BackupEngine::changeBaseline(const std::string& source,
                                                                                 BackupType& type) const {
    if (type == BackupType::Full) {
        return std::nullopt;
    }
    auto baseline = type == BackupType::Incremental ? state_.latest(source) : state_.latestFull(source);
    if (!baseline) {
        logger_.info("No earlier full backup of " + source + ", taking a full backup");
        type = BackupType::Full;
        return std::nullopt;
    }
    logger_.debug("Taking files of " + source + " changed since " + isoUtcTimestamp(baseline->timestamp));
    return baseline->timestamp;
}

Result<std::optional<BackupRecord>> BackupEngine::backupDirectory(const std::string& sourcePath,
                                                                  const std::optional<std::string>& storageOverride,
                                                                  const std::atomic<bool>* cancel) {
    auto started = std::chrono::steady_clock::now();
    std::string source = normalizeSourcePath(sourcePath);

    // resolve
    std::string storageType = config_.resolveStorageType(source, storageOverride);
    auto storage = registry_.open(storageType, config_.storageOptions(storageType));
    if (!storage) {
        return staged(storage.error(), "resolve");
    }
    (*storage)->setCancelFlag(cancel);
    logger_.info("Starting " + backupTypeName(config_.backupType) + " backup of " + source + " to " + storageType + " storage");

    // validate
    std::error_code ec;
    if (source.empty() || !fs::is_directory(source, ec)) {
        return std::unexpected(BackupError{ErrorKind::NotFound, "Source directory does not exist: " + sourcePath, "validate"});
    }
    std::optional<std::string> password;
    if (config_.encryption.enabled) {
        password = passwords_.password();
        if (!password || password->empty()) {
            return std::unexpected(BackupError{ErrorKind::Configuration,
                                               "Encryption is enabled but no password is available", "validate"});
        }
    }

    std::uintmax_t totalSize = directorySize(source);
    if (config_.sizeThresholdMB > 0 && totalSize > config_.sizeThresholdMB * 1024 * 1024) {
        logger_.warning("Directory " + source + " is " + formatBytes(totalSize) + ", above the " +
                        std::to_string(config_.sizeThresholdMB) + " MB threshold");
    }

    BackupType type = config_.backupType;
    auto changedSince = changeBaseline(source, type);

    auto workDir = TempDir::create("restore-backup");
    if (!workDir) {
        return staged(workDir.error(), "archive");
    }

    // archive
    auto now = std::chrono::system_clock::now();
    bool compress = config_.compress && config_.archiveFormat == ArchiveFormat::Tar;
    bool encrypt = config_.encryption.enabled;
    std::string finalName = archiveName(source, config_.archiveFormat, compress, encrypt, now);

    FileSelector selector(config_.selectionRules(), logger_);
    DirectoryArchiver archiver(config_.archiveFormat, selector, logger_);
    archiver.setChangedSince(changedSince);
    std::string current = workDir->file("archive." + archiveExtension(config_.archiveFormat)).string();
    auto archived = archiver.create(source, current, cancel);
    if (!archived) {
        return staged(archived.error(), "archive");
    }
    auto verified = DirectoryArchiver::verify(current);
    if (!verified) {
        return staged(verified.error(), "archive");
    }
    logger_.debug("Archived " + std::to_string(archived->files) + " file(s), " + formatBytes(archived->bytes));
    if (isCancelled(cancel)) {
        return cancelledAt("archive", source);
    }
    if (changedSince && archived->files == 0) {
        logger_.info("No changes in " + source + " since the last backup, skipping");
        return std::optional<BackupRecord>();
    }

    // compress
    if (compress) {
        std::string gzipped = current + ".gz";
        auto compressed = gzipFile(current, gzipped);
        if (!compressed) {
            return staged(compressed.error(), "compress");
        }
        fs::remove(current, ec);
        current = gzipped;
        if (isCancelled(cancel)) {
            return cancelledAt("compress", source);
        }
    }

    // encrypt
    if (encrypt) {
        std::string encryptedPath = current + ".enc";
        FileEncryptor encryptor(config_.encryption.iterations);
        auto encrypted = encryptor.encrypt(current, encryptedPath, *password);
        if (!encrypted) {
            return staged(encrypted.error(), "encrypt");
        }
        fs::remove(current, ec);
        current = encryptedPath;
        if (isCancelled(cancel)) {
            return cancelledAt("encrypt", source);
        }
    }

    // upload
    auto storedSize = regularFileSize(current);
    if (!storedSize) {
        return staged(storedSize.error(), "upload");
    }
    std::string remotePath = remotePathFor(source, finalName);
    auto uploaded = (*storage)->upload(current, remotePath);
    if (!uploaded) {
        return staged(uploaded.error(), "upload");
    }

    // record
    BackupRecord record;
    record.sourcePath = source;
    record.remotePath = remotePath;
    record.timestamp = now;
    record.sizeBytesOriginal = archived->bytes;
    record.sizeBytesStored = *storedSize;
    record.storageType = StorageRegistry::normalizeName(storageType);
    record.encrypted = encrypt;
    record.fileCount = archived->files;
    record.type = type;
    if (isCancelled(cancel)) {
        auto removed = (*storage)->remove(remotePath);
        if (!removed) {
            logger_.warning("Failed to remove cancelled upload " + remotePath + ": " + removed.error().describe());
        }
        return cancelledAt("record", source);
    }
    auto recorded = state_.record(source, record);
    if (!recorded) {
        auto removed = (*storage)->remove(remotePath);
        if (!removed) {
            logger_.warning("Failed to remove unrecorded upload " + remotePath + ": " + removed.error().describe());
        }
        return staged(recorded.error(), "record");
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    logger_.info("Backup completed: " + source + " -> " + remotePath + " (" + formatBytes(record.sizeBytesOriginal) +
                 " archived, " + formatBytes(record.sizeBytesStored) + " stored, " + std::to_string(record.fileCount) +
                 " file(s), " + formatSeconds(elapsed) + ")");

    RetentionPolicy retention(config_, registry_, state_, logger_);
    retention.apply(source, storage->get(), storageType);
    return record;
}
