#include "dropbox_storage.hpp"
#include "crypto_util.hpp"
#include "logger.hpp"
#include <algorithm>
#include <ctime>
#include <filesystem>

namespace fs = std::filesystem;

namespace {

const char kApiUrl[] = "https://api.dropboxapi.com/2/";
const char kContentUrl[] = "https://content.dropboxapi.com/2/";

std::string isoDate(std::chrono::system_clock::time_point time) {
    auto timeT = std::chrono::system_clock::to_time_t(time);
    std::tm tmUtc{};
    gmtime_r(&timeT, &tmUtc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tmUtc);
    return buf;
}

} // namespace

std::string DropboxStorage::normalizePath(const std::string& remotePath) {
    std::string normalized = remotePath;
    std::replace(normalized.begin(), normalized.end(), '\\', '/');
    if (normalized.empty() || normalized.front() != '/') {
        normalized = "/" + normalized;
    }
    return normalized;
}

Result<void> DropboxStorage::initialize(const StorageOptions& options) {
    bool hasAccessToken = !optionOr(options, "accessToken", "").empty();
    bool hasRefreshFlow = !optionOr(options, "refreshToken", "").empty() &&
                          !optionOr(options, "appKey", "").empty() &&
                          !optionOr(options, "appSecret", "").empty();
    if (!hasAccessToken && !hasRefreshFlow) {
        return makeError(ErrorKind::Configuration,
                         "Storage 'dropbox' is missing required options: accessToken or (refreshToken, appKey, appSecret)");
    }

    if (hasRefreshFlow) {
        auto token = refreshAccessToken(options);
        if (!token) {
            return std::unexpected(token.error());
        }
        accessToken_ = *token;
    } else {
        accessToken_ = options.at("accessToken");
    }

    auto response = rpc("users/get_current_account", Json::Value(Json::nullValue));
    if (!response) {
        return std::unexpected(response.error());
    }
    if (response->status == 400 || response->status == 401) {
        return makeError(ErrorKind::Configuration, "Dropbox rejected the access token");
    }
    if (!response->ok()) {
        return std::unexpected(httpError("account check", "account", *response));
    }
    auto account = parseJson(response->body);
    if (account) {
        logger_.info("Connected to Dropbox as: " + (*account)["name"].get("display_name", "unknown").asString());
    }
    return {};
}

void DropboxStorage::release() {
    HttpStorageBackend::release();
    accessToken_.clear();
}

Result<std::string> DropboxStorage::refreshAccessToken(const StorageOptions& options) {
    HttpRequest request;
    request.method = "POST";
    request.url = "https://api.dropboxapi.com/oauth2/token";
    request.headers.push_back("Authorization: Basic " + base64Encode(options.at("appKey") + ":" + options.at("appSecret")));
    request.headers.push_back("Content-Type: application/x-www-form-urlencoded");
    request.body = HttpClient::formEncode({
        {"grant_type", "refresh_token"},
        {"refresh_token", options.at("refreshToken")},
    });
    auto response = http_->perform(request);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (response->status == 400 || response->status == 401) {
        return makeError(ErrorKind::Configuration, "Dropbox rejected the refresh token");
    }
    if (!response->ok()) {
        return std::unexpected(httpError("token refresh", "oauth2", *response));
    }
    auto json = parseJson(response->body);
    if (!json) {
        return std::unexpected(json.error());
    }
    std::string token = (*json).get("access_token", "").asString();
    if (token.empty()) {
        return makeError(ErrorKind::Configuration, "Dropbox token response has no access_token");
    }
    return token;
}

Result<HttpResponse> DropboxStorage::rpc(const std::string& endpoint, const Json::Value& argument) {
    HttpRequest request;
    request.method = "POST";
    request.url = std::string(kApiUrl) + endpoint;
    request.headers.push_back("Authorization: Bearer " + accessToken_);
    request.headers.push_back("Content-Type: application/json");
    request.body = toJson(argument);
    return http_->perform(request);
}

bool DropboxStorage::isNotFound(const HttpResponse& response) {
    return response.status == 409 && response.body.find("not_found") != std::string::npos;
}

Result<void> DropboxStorage::upload(const std::string& localPath, const std::string& remotePath) {
    std::error_code ec;
    auto size = fs::file_size(localPath, ec);
    if (ec) {
        return makeError(ErrorKind::NotFound, "Local file not found: " + localPath);
    }
    if (size > kMaxSingleUpload) {
        return makeError(ErrorKind::Transfer, "File '" + fs::path(localPath).filename().string() +
                                              "' exceeds Dropbox's 150MB single upload limit");
    }

    Json::Value argument;
    argument["path"] = normalizePath(remotePath);
    argument["mode"] = "overwrite";
    argument["mute"] = true;

    HttpRequest request;
    request.method = "POST";
    request.url = std::string(kContentUrl) + "files/upload";
    request.headers.push_back("Authorization: Bearer " + accessToken_);
    request.headers.push_back("Dropbox-API-Arg: " + toJson(argument));
    request.headers.push_back("Content-Type: application/octet-stream");
    request.uploadFile = localPath;
    auto response = http_->perform(request);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (!response->ok()) {
        auto error = httpError("upload", remotePath, *response);
        error.kind = ErrorKind::Transfer;
        return std::unexpected(error);
    }
    logger_.debug("dropbox: uploaded " + remotePath);
    return {};
}

Result<void> DropboxStorage::download(const std::string& remotePath, const std::string& localPath) {
    Json::Value argument;
    argument["path"] = normalizePath(remotePath);

    HttpRequest request;
    request.method = "POST";
    request.url = std::string(kContentUrl) + "files/download";
    request.headers.push_back("Authorization: Bearer " + accessToken_);
    request.headers.push_back("Dropbox-API-Arg: " + toJson(argument));
    request.downloadFile = localPath;
    auto response = http_->perform(request);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (isNotFound(*response)) {
        return makeError(ErrorKind::NotFound, "File not found in Dropbox: " + remotePath);
    }
    if (!response->ok()) {
        return std::unexpected(httpError("download", remotePath, *response));
    }
    return {};
}

Result<bool> DropboxStorage::exists(const std::string& remotePath) {
    Json::Value argument;
    argument["path"] = normalizePath(remotePath);
    auto response = rpc("files/get_metadata", argument);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (isNotFound(*response)) {
        return false;
    }
    if (!response->ok()) {
        return std::unexpected(httpError("exists", remotePath, *response));
    }
    return true;
}

Result<void> DropboxStorage::remove(const std::string& remotePath) {
    Json::Value argument;
    argument["path"] = normalizePath(remotePath);
    auto response = rpc("files/delete_v2", argument);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (isNotFound(*response)) {
        logger_.debug("dropbox: file already absent: " + remotePath);
        return {};
    }
    if (!response->ok()) {
        return std::unexpected(httpError("delete", remotePath, *response));
    }
    return {};
}

Result<std::string> DropboxStorage::doGenerateShareLink(const std::string& remotePath, std::chrono::seconds expiration) {
    Json::Value argument;
    argument["path"] = normalizePath(remotePath);
    argument["settings"]["requested_visibility"] = "public";
    argument["settings"]["expires"] = isoDate(std::chrono::system_clock::now() + expiration);

    auto response = rpc("sharing/create_shared_link_with_settings", argument);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (response->ok()) {
        auto json = parseJson(response->body);
        if (!json) {
            return std::unexpected(json.error());
        }
        return (*json).get("url", "").asString();
    }
    if (response->status != 409 || response->body.find("shared_link_already_exists") == std::string::npos) {
        if (isNotFound(*response)) {
            return makeError(ErrorKind::NotFound, "File not found in Dropbox: " + remotePath);
        }
        return std::unexpected(httpError("share", remotePath, *response));
    }

    Json::Value listArgument;
    listArgument["path"] = normalizePath(remotePath);
    listArgument["direct_only"] = true;
    auto listed = rpc("sharing/list_shared_links", listArgument);
    if (!listed) {
        return std::unexpected(listed.error());
    }
    if (!listed->ok()) {
        return std::unexpected(httpError("share", remotePath, *listed));
    }
    auto json = parseJson(listed->body);
    if (!json) {
        return std::unexpected(json.error());
    }
    const Json::Value& links = (*json)["links"];
    if (!links.isArray() || links.empty()) {
        return makeError(ErrorKind::Transfer, "Dropbox reported an existing link but listed none for " + remotePath);
    }
    return links[0].get("url", "").asString();
}
