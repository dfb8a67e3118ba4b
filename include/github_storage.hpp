/**
 * @file github_storage.hpp
 * @brief Stores backups as files in a GitHub repository through the contents API.
 *
 * Every upload is a commit. Files above the API's 100 MB limit are rejected before any
 * network traffic.
 */

#ifndef GITHUB_STORAGE_HPP
#define GITHUB_STORAGE_HPP

#include <cstdint>
#include <optional>
#include "http_storage.hpp"

/**
 * @brief Repository-backed storage. Options: token, owner, repo; optional branch, apiUrl.
 */
class GitHubStorage : public HttpStorageBackend {
public:
    static constexpr uint64_t kMaxFileSize = 100ULL * 1024 * 1024;

    using HttpStorageBackend::HttpStorageBackend;

    std::string name() const override { return "github"; }
    Result<void> initialize(const StorageOptions& options) override;
    Result<void> upload(const std::string& localPath, const std::string& remotePath) override;
    Result<void> download(const std::string& remotePath, const std::string& localPath) override;
    Result<bool> exists(const std::string& remotePath) override;
    Result<void> remove(const std::string& remotePath) override;

private:
    std::string contentsUrl(const std::string& remotePath, bool withRef) const;
    std::vector<std::string> headers(const std::string& accept) const;

    /**
     * @brief Blob sha of an existing file, std::nullopt when absent.
     */
    Result<std::optional<std::string>> fileSha(const std::string& remotePath);

    std::string token_;
    std::string owner_;
    std::string repo_;
    std::string branch_;
    std::string apiUrl_;
};

#endif // GITHUB_STORAGE_HPP
