/**
 * @file share_link_issuer.hpp
 * @brief Uploads a local file and hands out a time-limited public link to it.
 */

#ifndef SHARE_LINK_ISSUER_HPP
#define SHARE_LINK_ISSUER_HPP

#include <chrono>
#include <string>
#include "backup_config.hpp"

class Logger;
class StorageRegistry;

/**
 * @brief A generated share link. Never persisted.
 */
struct ShareLink {
    std::string remotePath;                             ///< Uploaded object.
    std::chrono::system_clock::time_point expiresAt;    ///< Link expiry.
    std::string url;                                    ///< Public URL.
};

/**
 * @brief Issues share links on backends that support them.
 */
class ShareLinkIssuer {
public:
    ShareLinkIssuer(const BackupConfig& config, const StorageRegistry& registry, Logger& logger);

    /**
     * @brief Uploads localPath under shared/{random id}/ and returns a link to it.
     *
     * The backend capability is checked before anything is uploaded. When link generation
     * fails after the upload, the object is deleted again and the link error is returned;
     * a failing delete is only logged.
     *
     * @return Result<ShareLink> NotFound for a missing file, UnsupportedOperation for a
     * backend without sharing, or the upload or link error.
     */
    Result<ShareLink> shareFile(const std::string& localPath, const std::string& storageType,
                                std::chrono::seconds expiration);

private:
    const BackupConfig& config_;
    const StorageRegistry& registry_;
    Logger& logger_;
};

#endif // SHARE_LINK_ISSUER_HPP
