#include "azure_storage.hpp"
#include "crypto_util.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <map>
#include <sstream>

namespace fs = std::filesystem;

namespace {

const char kApiVersion[] = "2020-10-02";

std::string httpDate(std::chrono::system_clock::time_point time) {
    auto timeT = std::chrono::system_clock::to_time_t(time);
    std::tm tmUtc{};
    gmtime_r(&timeT, &tmUtc);
    char buf[64];
    std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S GMT", &tmUtc);
    return buf;
}

std::string isoDate(std::chrono::system_clock::time_point time) {
    auto timeT = std::chrono::system_clock::to_time_t(time);
    std::tm tmUtc{};
    gmtime_r(&timeT, &tmUtc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tmUtc);
    return buf;
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string trim(const std::string& text) {
    auto first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

} // namespace

Result<AzureConnection> parseAzureConnectionString(const std::string& connectionString) {
    std::map<std::string, std::string> fields;
    std::stringstream stream(connectionString);
    std::string part;
    while (std::getline(stream, part, ';')) {
        auto eq = part.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        // Account keys end in '=' padding, so only the first '=' separates.
        fields[trim(part.substr(0, eq))] = trim(part.substr(eq + 1));
    }

    std::string missing;
    for (const char* key : {"AccountName", "AccountKey"}) {
        if (fields[key].empty()) {
            missing += missing.empty() ? key : std::string(", ") + key;
        }
    }
    if (!missing.empty()) {
        return makeError(ErrorKind::Configuration, "Storage 'azure' connectionString is missing: " + missing);
    }

    AzureConnection connection;
    connection.accountName = fields["AccountName"];
    connection.accountKey = fields["AccountKey"];
    if (!fields["BlobEndpoint"].empty()) {
        connection.blobEndpoint = fields["BlobEndpoint"];
    } else {
        std::string protocol = fields["DefaultEndpointsProtocol"].empty() ? "https" : fields["DefaultEndpointsProtocol"];
        std::string suffix = fields["EndpointSuffix"].empty() ? "core.windows.net" : fields["EndpointSuffix"];
        connection.blobEndpoint = protocol + "://" + connection.accountName + ".blob." + suffix;
    }
    while (!connection.blobEndpoint.empty() && connection.blobEndpoint.back() == '/') {
        connection.blobEndpoint.pop_back();
    }
    return connection;
}

Result<void> AzureStorage::initialize(const StorageOptions& options) {
    auto check = requireOptions(options, {"connectionString", "containerName"});
    if (!check) {
        return check;
    }
    auto connection = parseAzureConnectionString(options.at("connectionString"));
    if (!connection) {
        return std::unexpected(connection.error());
    }
    if (!base64Decode(connection->accountKey)) {
        return makeError(ErrorKind::Configuration, "Storage 'azure' AccountKey is not valid base64");
    }
    connection_ = *connection;
    container_ = options.at("containerName");

    HttpRequest request;
    request.method = "PUT";
    auto response = send(request, "", "restype=container", 0);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (response->status == 409) {
        logger_.debug("azure: container " + container_ + " already exists");
        return {};
    }
    if (response->status == 401 || response->status == 403) {
        return makeError(ErrorKind::Configuration, "Access denied to Azure container '" + container_ + "'");
    }
    if (!response->ok()) {
        return std::unexpected(httpError("create container", container_, *response));
    }
    logger_.info("azure: created container " + container_);
    return {};
}

std::string AzureStorage::sign(const HttpRequest& request, const std::string& blobPath, const std::string& query, uint64_t contentLength) const {
    std::string contentType;
    std::map<std::string, std::string> msHeaders;
    for (const auto& line : request.headers) {
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::string name = toLower(trim(line.substr(0, colon)));
        std::string value = trim(line.substr(colon + 1));
        if (name == "content-type") {
            contentType = value;
        } else if (name.rfind("x-ms-", 0) == 0) {
            msHeaders[name] = value;
        }
    }

    std::string stringToSign = request.method + "\n";
    stringToSign += "\n";   // Content-Encoding
    stringToSign += "\n";   // Content-Language
    stringToSign += (contentLength > 0 ? std::to_string(contentLength) : "") + "\n";
    stringToSign += "\n";   // Content-MD5
    stringToSign += contentType + "\n";
    stringToSign += "\n";   // Date, x-ms-date is used instead
    stringToSign += "\n";   // If-Modified-Since
    stringToSign += "\n";   // If-Match
    stringToSign += "\n";   // If-None-Match
    stringToSign += "\n";   // If-Unmodified-Since
    stringToSign += "\n";   // Range
    for (const auto& [name, value] : msHeaders) {
        stringToSign += name + ":" + value + "\n";
    }

    stringToSign += "/" + connection_.accountName + "/" + container_;
    if (!blobPath.empty()) {
        stringToSign += "/" + blobPath;
    }
    std::map<std::string, std::string> params;
    std::stringstream stream(query);
    std::string param;
    while (std::getline(stream, param, '&')) {
        auto eq = param.find('=');
        if (eq == std::string::npos) {
            params[toLower(param)] = "";
        } else {
            params[toLower(param.substr(0, eq))] = param.substr(eq + 1);
        }
    }
    for (const auto& [name, value] : params) {
        stringToSign += "\n" + name + ":" + value;
    }

    auto key = base64Decode(connection_.accountKey).value_or("");
    return "Authorization: SharedKey " + connection_.accountName + ":" + base64Encode(hmacSha256(key, stringToSign));
}

Result<HttpResponse> AzureStorage::send(HttpRequest request, const std::string& blobPath, const std::string& query, uint64_t contentLength) {
    request.url = connection_.blobEndpoint + "/" + uriEncode(container_);
    if (!blobPath.empty()) {
        request.url += "/" + blobPath;
    }
    if (!query.empty()) {
        request.url += "?" + query;
    }
    request.headers.push_back("x-ms-date: " + httpDate(std::chrono::system_clock::now()));
    request.headers.push_back(std::string("x-ms-version: ") + kApiVersion);
    request.headers.push_back(sign(request, blobPath, query, contentLength));
    return http_->perform(request);
}

Result<void> AzureStorage::upload(const std::string& localPath, const std::string& remotePath) {
    std::error_code ec;
    auto size = fs::file_size(localPath, ec);
    if (ec) {
        return makeError(ErrorKind::NotFound, "Local file not found: " + localPath);
    }

    HttpRequest request;
    request.method = "PUT";
    request.uploadFile = localPath;
    request.headers.push_back("Content-Type: application/octet-stream");
    request.headers.push_back("x-ms-blob-type: BlockBlob");
    auto response = send(request, uriEncode(remotePath, false), "", size);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (!response->ok()) {
        auto error = httpError("upload", remotePath, *response);
        error.kind = ErrorKind::Transfer;
        return std::unexpected(error);
    }
    logger_.debug("azure: uploaded " + remotePath);
    return {};
}

Result<void> AzureStorage::download(const std::string& remotePath, const std::string& localPath) {
    HttpRequest request;
    request.downloadFile = localPath;
    auto response = send(request, uriEncode(remotePath, false), "", 0);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (!response->ok()) {
        return std::unexpected(httpError("download", remotePath, *response));
    }
    return {};
}

Result<bool> AzureStorage::exists(const std::string& remotePath) {
    HttpRequest request;
    request.method = "HEAD";
    auto response = send(request, uriEncode(remotePath, false), "", 0);
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

Result<void> AzureStorage::remove(const std::string& remotePath) {
    HttpRequest request;
    request.method = "DELETE";
    auto response = send(request, uriEncode(remotePath, false), "", 0);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (!response->ok() && response->status != 404) {
        return std::unexpected(httpError("delete", remotePath, *response));
    }
    return {};
}

std::string AzureStorage::sasSignature(const std::string& blobPath, const std::string& expiry) const {
    // Field order of the service SAS string-to-sign for version 2020-10-02.
    std::string stringToSign;
    stringToSign += "r\n";                                                   // signedPermissions
    stringToSign += "\n";                                                    // signedStart
    stringToSign += expiry + "\n";                                           // signedExpiry
    stringToSign += "/blob/" + connection_.accountName + "/" + container_ + "/" + blobPath + "\n";
    stringToSign += "\n";                                                    // signedIdentifier
    stringToSign += "\n";                                                    // signedIP
    stringToSign += "\n";                                                    // signedProtocol
    stringToSign += std::string(kApiVersion) + "\n";                         // signedVersion
    stringToSign += "b\n";                                                   // signedResource
    stringToSign += "\n";                                                    // signedSnapshotTime
    stringToSign += "\n\n\n\n";                                              // rscc, rscd, rsce, rscl; rsct empty
    auto key = base64Decode(connection_.accountKey).value_or("");
    return base64Encode(hmacSha256(key, stringToSign));
}

Result<std::string> AzureStorage::doGenerateShareLink(const std::string& remotePath, std::chrono::seconds expiration) {
    std::string expiry = isoDate(std::chrono::system_clock::now() + expiration);
    std::string signature = sasSignature(remotePath, expiry);
    return connection_.blobEndpoint + "/" + uriEncode(container_) + "/" + uriEncode(remotePath, false) +
           "?sv=" + kApiVersion + "&se=" + uriEncode(expiry) + "&sr=b&sp=r&sig=" + uriEncode(signature);
}
