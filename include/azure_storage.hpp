/**
 * @file azure_storage.hpp
 * @brief Azure Blob Storage backend using SharedKey authorization.
 */

#ifndef AZURE_STORAGE_HPP
#define AZURE_STORAGE_HPP

#include <cstdint>
#include <optional>
#include "http_storage.hpp"

/**
 * @brief Fields extracted from an Azure storage connection string.
 */
struct AzureConnection {
    std::string accountName;
    std::string accountKey;     ///< Base64 encoded.
    std::string blobEndpoint;   ///< e.g. "https://acct.blob.core.windows.net", no trailing slash.
};

/**
 * @brief Parses "Key=Value;Key=Value" connection strings.
 *
 * @return Result<AzureConnection> ConfigurationError naming AccountName/AccountKey when absent.
 */
Result<AzureConnection> parseAzureConnectionString(const std::string& connectionString);

/**
 * @brief Block blob storage in one container.
 *
 * Options: connectionString, containerName. The container is created on initialize if it
 * does not exist. Share links are read-only service SAS URLs.
 */
class AzureStorage : public HttpStorageBackend {
public:
    using HttpStorageBackend::HttpStorageBackend;

    std::string name() const override { return "azure"; }
    Result<void> initialize(const StorageOptions& options) override;
    Result<void> upload(const std::string& localPath, const std::string& remotePath) override;
    Result<void> download(const std::string& remotePath, const std::string& localPath) override;
    Result<bool> exists(const std::string& remotePath) override;
    Result<void> remove(const std::string& remotePath) override;
    bool supportsSharing() const override { return true; }

    /**
     * @brief Computes the SAS signature for a read-only blob URL.
     *
     * @param blobPath Unencoded blob name inside the container.
     * @param expiry ISO-8601 UTC expiry ("2024-01-01T00:00:00Z").
     */
    std::string sasSignature(const std::string& blobPath, const std::string& expiry) const;

protected:
    Result<std::string> doGenerateShareLink(const std::string& remotePath, std::chrono::seconds expiration) override;

private:
    Result<HttpResponse> send(HttpRequest request, const std::string& blobPath, const std::string& query, uint64_t contentLength);
    std::string sign(const HttpRequest& request, const std::string& blobPath, const std::string& query, uint64_t contentLength) const;

    AzureConnection connection_;
    std::string container_;
};

#endif // AZURE_STORAGE_HPP
