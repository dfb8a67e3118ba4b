/**
 * @file dropbox_storage.hpp
 * @brief Dropbox backend over the HTTP API v2.
 */

#ifndef DROPBOX_STORAGE_HPP
#define DROPBOX_STORAGE_HPP

#include <cstdint>
#include "http_storage.hpp"

/**
 * @brief Dropbox storage.
 *
 * Options: accessToken, or refreshToken together with appKey and appSecret. Paths are
 * rooted at "/" of the app folder or account.
 */
class DropboxStorage : public HttpStorageBackend {
public:
    /// Single-request upload limit of the files/upload endpoint.
    static constexpr uint64_t kMaxSingleUpload = 150ULL * 1024 * 1024;

    using HttpStorageBackend::HttpStorageBackend;

    std::string name() const override { return "dropbox"; }
    Result<void> initialize(const StorageOptions& options) override;
    Result<void> upload(const std::string& localPath, const std::string& remotePath) override;
    Result<void> download(const std::string& remotePath, const std::string& localPath) override;
    Result<bool> exists(const std::string& remotePath) override;
    Result<void> remove(const std::string& remotePath) override;
    bool supportsSharing() const override { return true; }
    void release() override;

    /**
     * @brief Converts a remote path to Dropbox form (leading '/', forward slashes).
     */
    static std::string normalizePath(const std::string& remotePath);

protected:
    Result<std::string> doGenerateShareLink(const std::string& remotePath, std::chrono::seconds expiration) override;

private:
    Result<std::string> refreshAccessToken(const StorageOptions& options);
    Result<HttpResponse> rpc(const std::string& endpoint, const Json::Value& argument);
    static bool isNotFound(const HttpResponse& response);

    std::string accessToken_;
};

#endif // DROPBOX_STORAGE_HPP
