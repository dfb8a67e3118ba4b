/**
 * @file object_storage.hpp
 * @brief S3-compatible object storage backends: AWS S3, Backblaze B2 and Google Cloud Storage.
 *
 * All three speak the S3 REST dialect signed with SigV4. They differ only in how options
 * map onto endpoint, region and credentials.
 */

#ifndef OBJECT_STORAGE_HPP
#define OBJECT_STORAGE_HPP

#include <optional>
#include "http_storage.hpp"
#include "sigv4_signer.hpp"

/**
 * @brief Where an S3-compatible service lives and how buckets are addressed.
 */
struct ObjectEndpoint {
    std::string scheme = "https";
    std::string host;               ///< host[:port] of the service (or of the bucket when virtual-hosted).
    std::string bucket;
    bool pathStyle = true;          ///< true: /bucket/key, false: bucket in host name.
};

/**
 * @brief Parses "scheme://host[:port][/...]" into scheme and host.
 *
 * @return std::nullopt when the URL has no scheme or host.
 */
std::optional<ObjectEndpoint> parseEndpointUrl(const std::string& url);

/**
 * @brief Shared implementation for SigV4 object stores.
 */
class ObjectStorage : public HttpStorageBackend {
public:
    using HttpStorageBackend::HttpStorageBackend;

    Result<void> upload(const std::string& localPath, const std::string& remotePath) override;
    Result<void> download(const std::string& remotePath, const std::string& localPath) override;
    Result<bool> exists(const std::string& remotePath) override;
    Result<void> remove(const std::string& remotePath) override;
    bool supportsSharing() const override { return true; }

    /**
     * @brief Absolute URL of an object, without query string.
     */
    std::string objectUrl(const std::string& key) const;

protected:
    /**
     * @brief Installs credentials and endpoint, then checks the bucket is reachable.
     */
    Result<void> connect(SigV4Credentials credentials, ObjectEndpoint endpoint);

    Result<std::string> doGenerateShareLink(const std::string& remotePath, std::chrono::seconds expiration) override;

private:
    std::string canonicalUri(const std::string& key) const;
    Result<HttpResponse> send(HttpRequest request, const std::string& key, const std::string& payloadHash);
    Result<void> verifyBucket();

    std::optional<SigV4Signer> signer_;
    ObjectEndpoint endpoint_;
};

/**
 * @brief Amazon S3. Options: accessKeyId, secretAccessKey, region, bucketName; optional
 * endpoint, pathStyle, sessionToken.
 */
class S3Storage : public ObjectStorage {
public:
    using ObjectStorage::ObjectStorage;
    std::string name() const override { return "s3"; }
    Result<void> initialize(const StorageOptions& options) override;
};

/**
 * @brief Backblaze B2 through its S3-compatible API. Options: keyId, applicationKey,
 * serviceUrl, bucketName.
 */
class B2Storage : public ObjectStorage {
public:
    using ObjectStorage::ObjectStorage;
    std::string name() const override { return "b2"; }
    Result<void> initialize(const StorageOptions& options) override;
};

/**
 * @brief Google Cloud Storage through the XML interoperability API with HMAC keys.
 * Options: bucketName, hmacAccessId, hmacSecret; optional endpoint.
 */
class GcsStorage : public ObjectStorage {
public:
    using ObjectStorage::ObjectStorage;
    std::string name() const override { return "gcp"; }
    Result<void> initialize(const StorageOptions& options) override;
};

#endif // OBJECT_STORAGE_HPP
