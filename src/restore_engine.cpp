#include "restore_engine.hpp"
#include "archive.hpp"
#include "compression.hpp"
#include "encryption.hpp"
#include "fs_util.hpp"
#include "logger.hpp"
#include "password_provider.hpp"
#include "storage_registry.hpp"
#include <filesystem>

namespace fs = std::filesystem;

namespace {

std::unexpected<BackupError> staged(const BackupError& error, const char* stage) {
    return std::unexpected(error.atStage(stage));
}

bool endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

RestoreEngine::RestoreEngine(const BackupConfig& config, const StorageRegistry& registry, const StateStore& state,
                             PasswordProvider& passwords, Logger& logger)
    : config_(config), registry_(registry), state_(state), passwords_(passwords), logger_(logger) {}

std::string RestoreEngine::resolveStorageType(const std::string& backupPath,
                                              const std::optional<std::string>& storageOverride) const {
    if (storageOverride && !storageOverride->empty()) {
        return StorageRegistry::normalizeName(*storageOverride);
    }
    auto record = state_.findByRemotePath(backupPath);
    if (record && !record->storageType.empty()) {
        return StorageRegistry::normalizeName(record->storageType);
    }
    return config_.globalStorageType;
}

Result<RestoreResult> RestoreEngine::restoreFromBackup(const std::string& backupPath, const std::string& targetDir,
                                                       const std::optional<std::string>& storageOverride,
                                                       const std::atomic<bool>* cancel) {
    if (backupPath.empty()) {
        return std::unexpected(BackupError{ErrorKind::InvalidArgument, "Backup path must not be empty", "resolve"});
    }
    if (targetDir.empty()) {
        return std::unexpected(BackupError{ErrorKind::InvalidArgument, "Target directory must not be empty", "resolve"});
    }

    std::string storageType = resolveStorageType(backupPath, storageOverride);
    auto storage = registry_.open(storageType, config_.storageOptions(storageType));
    if (!storage) {
        return staged(storage.error(), "resolve");
    }
    (*storage)->setCancelFlag(cancel);
    logger_.info("Restoring " + backupPath + " from " + storageType + " storage into " + targetDir);

    auto workDir = TempDir::create("restore-restore");
    if (!workDir) {
        return staged(workDir.error(), "download");
    }

    // download
    std::string fileName = fs::path(backupPath).filename().string();
    if (fileName.empty()) {
        return std::unexpected(BackupError{ErrorKind::InvalidArgument, "Backup path has no file name: " + backupPath, "download"});
    }
    std::string current = workDir->file(fileName).string();
    auto downloaded = (*storage)->download(backupPath, current);
    if (!downloaded) {
        return staged(downloaded.error(), "download");
    }
    std::error_code ec;

    // decrypt
    if (endsWith(current, ".enc")) {
        auto password = passwords_.password();
        if (!password || password->empty()) {
            return std::unexpected(BackupError{ErrorKind::Configuration,
                                               "Backup is encrypted but no password is available", "decrypt"});
        }
        std::string decryptedPath = current.substr(0, current.size() - 4);
        FileEncryptor encryptor;
        auto decrypted = encryptor.decrypt(current, decryptedPath, *password);
        if (!decrypted) {
            if (decrypted.error().kind == ErrorKind::Authentication) {
                passwords_.clear();
            }
            return staged(decrypted.error(), "decrypt");
        }
        fs::remove(current, ec);
        current = decryptedPath;
    }

    // extract
    if (endsWith(current, ".gz")) {
        std::string plainPath = current.substr(0, current.size() - 3);
        auto decompressed = gunzipFile(current, plainPath);
        if (!decompressed) {
            return staged(decompressed.error(), "extract");
        }
        fs::remove(current, ec);
        current = plainPath;
    }

    ArchiveExtractor extractor(logger_);
    auto extracted = extractor.extract(current, targetDir);
    if (!extracted) {
        return staged(extracted.error(), "extract");
    }

    RestoreResult result;
    result.files = extracted->files;
    result.bytes = extracted->bytes;
    result.storageType = storageType;
    logger_.info("Restore completed: " + std::to_string(result.files) + " file(s), " + formatBytes(result.bytes) +
                 " restored to " + targetDir);
    return result;
}
