#include "object_storage.hpp"
#include "crypto_util.hpp"
#include "logger.hpp"
#include <filesystem>

namespace fs = std::filesystem;

namespace {

const char kEmptyPayloadHash[] = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

bool isTrue(const std::string& value) {
    return value == "true" || value == "1" || value == "yes";
}

} // namespace

std::optional<ObjectEndpoint> parseEndpointUrl(const std::string& url) {
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) {
        return std::nullopt;
    }
    ObjectEndpoint endpoint;
    endpoint.scheme = url.substr(0, schemeEnd);
    std::string rest = url.substr(schemeEnd + 3);
    auto slash = rest.find('/');
    endpoint.host = rest.substr(0, slash);
    if (endpoint.host.empty()) {
        return std::nullopt;
    }
    return endpoint;
}

std::string ObjectStorage::canonicalUri(const std::string& key) const {
    std::string uri = "/";
    if (endpoint_.pathStyle) {
        uri += uriEncode(endpoint_.bucket);
        if (key.empty()) {
            return uri;
        }
        uri += "/";
    }
    return uri + uriEncode(key, false);
}

std::string ObjectStorage::objectUrl(const std::string& key) const {
    return endpoint_.scheme + "://" + endpoint_.host + canonicalUri(key);
}

Result<void> ObjectStorage::connect(SigV4Credentials credentials, ObjectEndpoint endpoint) {
    signer_.emplace(std::move(credentials));
    endpoint_ = std::move(endpoint);
    return verifyBucket();
}

Result<HttpResponse> ObjectStorage::send(HttpRequest request, const std::string& key, const std::string& payloadHash) {
    if (!signer_) {
        return makeError(ErrorKind::Configuration, "Storage '" + name() + "' used before initialize()");
    }
    std::string uri = canonicalUri(key);
    request.url = endpoint_.scheme + "://" + endpoint_.host + uri;
    auto authHeaders = signer_->signHeaders(request.method, endpoint_.host, uri, {}, payloadHash,
                                            std::chrono::system_clock::now());
    request.headers.insert(request.headers.end(), authHeaders.begin(), authHeaders.end());
    return http_->perform(request);
}

Result<void> ObjectStorage::verifyBucket() {
    HttpRequest request;
    request.method = "HEAD";
    auto response = send(request, "", kEmptyPayloadHash);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (response->ok()) {
        logger_.debug(name() + ": connected to bucket " + endpoint_.bucket);
        return {};
    }
    switch (response->status) {
        case 301:
        case 400:
            return makeError(ErrorKind::Configuration, "Bucket '" + endpoint_.bucket + "' is not reachable in the configured region");
        case 401:
        case 403:
            return makeError(ErrorKind::Configuration, "Access denied to bucket '" + endpoint_.bucket + "'");
        case 404:
            return makeError(ErrorKind::Configuration, "Bucket '" + endpoint_.bucket + "' does not exist");
        default:
            return std::unexpected(httpError("bucket check", endpoint_.bucket, *response));
    }
}

Result<void> ObjectStorage::upload(const std::string& localPath, const std::string& remotePath) {
    if (!fs::is_regular_file(localPath)) {
        return makeError(ErrorKind::NotFound, "Local file not found: " + localPath);
    }
    auto payloadHash = sha256FileHex(localPath);
    if (!payloadHash) {
        return std::unexpected(payloadHash.error());
    }

    HttpRequest request;
    request.method = "PUT";
    request.uploadFile = localPath;
    request.headers.push_back("Content-Type: application/octet-stream");
    auto response = send(request, remotePath, *payloadHash);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (!response->ok()) {
        auto error = httpError("upload", remotePath, *response);
        error.kind = ErrorKind::Transfer;
        return std::unexpected(error);
    }
    logger_.debug(name() + ": uploaded " + remotePath);
    return {};
}

Result<void> ObjectStorage::download(const std::string& remotePath, const std::string& localPath) {
    HttpRequest request;
    request.downloadFile = localPath;
    auto response = send(request, remotePath, kEmptyPayloadHash);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (!response->ok()) {
        return std::unexpected(httpError("download", remotePath, *response));
    }
    return {};
}

Result<bool> ObjectStorage::exists(const std::string& remotePath) {
    HttpRequest request;
    request.method = "HEAD";
    auto response = send(request, remotePath, kEmptyPayloadHash);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (response->status == 404) {
        return false;
    }
    if (!response->ok()) {
        return std::unexpected(httpError("exists", remotePath, *response));
    }
    return true;
}

Result<void> ObjectStorage::remove(const std::string& remotePath) {
    HttpRequest request;
    request.method = "DELETE";
    auto response = send(request, remotePath, kEmptyPayloadHash);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (!response->ok() && response->status != 404) {
        return std::unexpected(httpError("delete", remotePath, *response));
    }
    return {};
}

Result<std::string> ObjectStorage::doGenerateShareLink(const std::string& remotePath, std::chrono::seconds expiration) {
    if (!signer_) {
        return makeError(ErrorKind::Configuration, "Storage '" + name() + "' used before initialize()");
    }
    // SigV4 presigned URLs are capped at seven days.
    constexpr std::chrono::seconds kMaxExpiry{7 * 24 * 3600};
    if (expiration > kMaxExpiry) {
        return makeError(ErrorKind::InvalidArgument, "Presigned URLs cannot be valid for more than 7 days");
    }
    std::string uri = canonicalUri(remotePath);
    std::string query = signer_->presignQuery("GET", endpoint_.host, uri, expiration, std::chrono::system_clock::now());
    return endpoint_.scheme + "://" + endpoint_.host + uri + "?" + query;
}

Result<void> S3Storage::initialize(const StorageOptions& options) {
    auto check = requireOptions(options, {"accessKeyId", "secretAccessKey", "region", "bucketName"});
    if (!check) {
        return check;
    }

    SigV4Credentials credentials;
    credentials.accessKeyId = options.at("accessKeyId");
    credentials.secretAccessKey = options.at("secretAccessKey");
    credentials.sessionToken = optionOr(options, "sessionToken", "");
    credentials.region = options.at("region");

    ObjectEndpoint endpoint;
    std::string customEndpoint = optionOr(options, "endpoint", "");
    if (!customEndpoint.empty()) {
        auto parsed = parseEndpointUrl(customEndpoint);
        if (!parsed) {
            return makeError(ErrorKind::Configuration, "Storage 's3' has an invalid endpoint: " + customEndpoint);
        }
        endpoint = *parsed;
        endpoint.pathStyle = true;
    }
    endpoint.bucket = options.at("bucketName");
    if (options.contains("pathStyle")) {
        endpoint.pathStyle = isTrue(options.at("pathStyle"));
    } else if (customEndpoint.empty()) {
        // Dotted bucket names break TLS validation of virtual-hosted URLs.
        endpoint.pathStyle = endpoint.bucket.find('.') != std::string::npos;
    }
    if (customEndpoint.empty()) {
        endpoint.host = endpoint.pathStyle ? "s3." + credentials.region + ".amazonaws.com"
                                           : endpoint.bucket + ".s3." + credentials.region + ".amazonaws.com";
    }
    return connect(std::move(credentials), std::move(endpoint));
}

Result<void> B2Storage::initialize(const StorageOptions& options) {
    auto check = requireOptions(options, {"keyId", "applicationKey", "serviceUrl", "bucketName"});
    if (!check) {
        return check;
    }
    auto endpoint = parseEndpointUrl(options.at("serviceUrl"));
    if (!endpoint) {
        return makeError(ErrorKind::Configuration, "Storage 'b2' has an invalid serviceUrl: " + options.at("serviceUrl"));
    }
    endpoint->bucket = options.at("bucketName");
    endpoint->pathStyle = true;

    SigV4Credentials credentials;
    credentials.accessKeyId = options.at("keyId");
    credentials.secretAccessKey = options.at("applicationKey");
    // s3.<region>.backblazeb2.com
    credentials.region = "us-west-004";
    const std::string& host = endpoint->host;
    if (host.rfind("s3.", 0) == 0) {
        auto dot = host.find('.', 3);
        if (dot != std::string::npos) {
            credentials.region = host.substr(3, dot - 3);
        }
    }
    return connect(std::move(credentials), std::move(*endpoint));
}

Result<void> GcsStorage::initialize(const StorageOptions& options) {
    auto check = requireOptions(options, {"bucketName", "hmacAccessId", "hmacSecret"});
    if (!check) {
        return check;
    }
    std::string url = optionOr(options, "endpoint", "https://storage.googleapis.com");
    auto endpoint = parseEndpointUrl(url);
    if (!endpoint) {
        return makeError(ErrorKind::Configuration, "Storage 'gcp' has an invalid endpoint: " + url);
    }
    endpoint->bucket = options.at("bucketName");
    endpoint->pathStyle = true;

    SigV4Credentials credentials;
    credentials.accessKeyId = options.at("hmacAccessId");
    credentials.secretAccessKey = options.at("hmacSecret");
    credentials.region = "auto";
    return connect(std::move(credentials), std::move(*endpoint));
}
