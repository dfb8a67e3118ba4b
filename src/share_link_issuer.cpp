#include "share_link_issuer.hpp"
#include "crypto_util.hpp"
#include "logger.hpp"
#include "storage_registry.hpp"
#include <filesystem>

namespace fs = std::filesystem;

ShareLinkIssuer::ShareLinkIssuer(const BackupConfig& config, const StorageRegistry& registry, Logger& logger)
    : config_(config), registry_(registry), logger_(logger) {}

Result<ShareLink> ShareLinkIssuer::shareFile(const std::string& localPath, const std::string& storageType,
                                             std::chrono::seconds expiration) {
    std::error_code ec;
    if (!fs::is_regular_file(localPath, ec)) {
        return makeError(ErrorKind::NotFound, "File not found: " + localPath);
    }
    if (expiration.count() <= 0) {
        return makeError(ErrorKind::InvalidArgument, "Share link expiration must be positive");
    }

    auto storage = registry_.open(storageType, config_.storageOptions(storageType));
    if (!storage) {
        return std::unexpected(storage.error());
    }
    if (!(*storage)->supportsSharing()) {
        return makeError(ErrorKind::UnsupportedOperation, "Storage '" + (*storage)->name() + "' does not support share links");
    }

    auto id = randomHex(16);
    if (!id) {
        return std::unexpected(id.error());
    }
    std::string fileName = fs::path(localPath).filename().string();
    std::string remotePath = "shared/" + *id + "/" + fileName;

    logger_.info("Uploading " + fileName + " to " + storageType + " for sharing...");
    auto uploaded = (*storage)->upload(localPath, remotePath);
    if (!uploaded) {
        return std::unexpected(uploaded.error());
    }

    logger_.info("Generating share link for " + fileName + "...");
    auto url = (*storage)->generateShareLink(remotePath, expiration);
    if (!url) {
        auto removed = (*storage)->remove(remotePath);
        if (!removed) {
            logger_.error("Failed to remove shared upload " + remotePath + " after link failure: " + removed.error().describe());
        }
        return std::unexpected(url.error());
    }

    ShareLink link;
    link.remotePath = remotePath;
    link.expiresAt = std::chrono::system_clock::now() + expiration;
    link.url = *url;
    return link;
}
