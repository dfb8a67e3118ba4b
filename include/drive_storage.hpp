/**
 * @file drive_storage.hpp
 * @brief Google Drive backend using an OAuth refresh token.
 *
 * Remote paths map onto a folder tree below a root folder ("ReStore Backups" unless
 * backup_folder_name is set). Folder ids are cached for the session.
 */

#ifndef DRIVE_STORAGE_HPP
#define DRIVE_STORAGE_HPP

#include <map>
#include <optional>
#include "http_storage.hpp"

/**
 * @brief Drive storage. Options: client_id, client_secret, refresh_token;
 * optional backup_folder_name.
 */
class DriveStorage : public HttpStorageBackend {
public:
    using HttpStorageBackend::HttpStorageBackend;

    std::string name() const override { return "gdrive"; }
    Result<void> initialize(const StorageOptions& options) override;
    Result<void> upload(const std::string& localPath, const std::string& remotePath) override;
    Result<void> download(const std::string& remotePath, const std::string& localPath) override;
    Result<bool> exists(const std::string& remotePath) override;
    Result<void> remove(const std::string& remotePath) override;
    void release() override;

private:
    Result<std::string> fetchAccessToken(const StorageOptions& options);

    /**
     * @brief Finds a child by name; folders only when folder is true.
     */
    Result<std::optional<std::string>> findChild(const std::string& parentId, const std::string& name, bool folder);
    Result<std::string> createFolder(const std::string& parentId, const std::string& name);

    /**
     * @brief Resolves the folder holding remotePath, creating missing folders when create is set.
     */
    Result<std::optional<std::string>> resolveParent(const std::string& remotePath, bool create);
    Result<std::optional<std::string>> resolveFile(const std::string& remotePath);
    Result<HttpResponse> send(HttpRequest request);

    std::string accessToken_;
    std::string rootFolderId_;
    std::map<std::string, std::string> folderCache_;   ///< Relative folder path -> id.
};

#endif // DRIVE_STORAGE_HPP
