#include "drive_storage.hpp"
#include "crypto_util.hpp"
#include "logger.hpp"
#include <filesystem>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace {

const char kFilesUrl[] = "https://www.googleapis.com/drive/v3/files";
const char kUploadUrl[] = "https://www.googleapis.com/upload/drive/v3/files";
const char kFolderMime[] = "application/vnd.google-apps.folder";

std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::stringstream stream(path);
    std::string part;
    while (std::getline(stream, part, '/')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

std::string quoteForQuery(const std::string& text) {
    std::string quoted;
    for (char c : text) {
        if (c == '\'' || c == '\\') {
            quoted += '\\';
        }
        quoted += c;
    }
    return quoted;
}

} // namespace

Result<void> DriveStorage::initialize(const StorageOptions& options) {
    auto check = requireOptions(options, {"client_id", "client_secret", "refresh_token"});
    if (!check) {
        return check;
    }
    auto token = fetchAccessToken(options);
    if (!token) {
        return std::unexpected(token.error());
    }
    accessToken_ = *token;

    std::string folderName = optionOr(options, "backup_folder_name", "ReStore Backups");
    auto existing = findChild("root", folderName, true);
    if (!existing) {
        return std::unexpected(existing.error());
    }
    if (*existing) {
        rootFolderId_ = **existing;
    } else {
        auto created = createFolder("root", folderName);
        if (!created) {
            return std::unexpected(created.error());
        }
        rootFolderId_ = *created;
        logger_.info("Created Google Drive folder: " + folderName);
    }
    folderCache_.clear();
    folderCache_[""] = rootFolderId_;
    logger_.debug("gdrive: using folder " + folderName + " (" + rootFolderId_ + ")");
    return {};
}

void DriveStorage::release() {
    HttpStorageBackend::release();
    accessToken_.clear();
    folderCache_.clear();
}

Result<std::string> DriveStorage::fetchAccessToken(const StorageOptions& options) {
    HttpRequest request;
    request.method = "POST";
    request.url = "https://oauth2.googleapis.com/token";
    request.headers.push_back("Content-Type: application/x-www-form-urlencoded");
    request.body = HttpClient::formEncode({
        {"client_id", options.at("client_id")},
        {"client_secret", options.at("client_secret")},
        {"refresh_token", options.at("refresh_token")},
        {"grant_type", "refresh_token"},
    });
    auto response = http_->perform(request);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (response->status == 400 || response->status == 401) {
        return makeError(ErrorKind::Configuration, "Google OAuth rejected the refresh token");
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
        return makeError(ErrorKind::Configuration, "Google OAuth response has no access_token");
    }
    return token;
}

Result<HttpResponse> DriveStorage::send(HttpRequest request) {
    request.headers.push_back("Authorization: Bearer " + accessToken_);
    return http_->perform(request);
}

Result<std::optional<std::string>> DriveStorage::findChild(const std::string& parentId, const std::string& name, bool folder) {
    std::string query = "name = '" + quoteForQuery(name) + "' and '" + quoteForQuery(parentId) +
                        "' in parents and trashed = false";
    query += folder ? std::string(" and mimeType = '") + kFolderMime + "'"
                    : std::string(" and mimeType != '") + kFolderMime + "'";

    HttpRequest request;
    request.url = std::string(kFilesUrl) + "?q=" + uriEncode(query) + "&fields=" + uriEncode("files(id,name)") +
                  "&spaces=drive&pageSize=10";
    auto response = send(request);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (!response->ok()) {
        return std::unexpected(httpError("lookup", name, *response));
    }
    auto json = parseJson(response->body);
    if (!json) {
        return std::unexpected(json.error());
    }
    const Json::Value& files = (*json)["files"];
    if (!files.isArray() || files.empty()) {
        return std::optional<std::string>();
    }
    return std::optional<std::string>(files[0]["id"].asString());
}

Result<std::string> DriveStorage::createFolder(const std::string& parentId, const std::string& name) {
    Json::Value metadata;
    metadata["name"] = name;
    metadata["mimeType"] = kFolderMime;
    metadata["parents"].append(parentId);

    HttpRequest request;
    request.method = "POST";
    request.url = std::string(kFilesUrl) + "?fields=id";
    request.headers.push_back("Content-Type: application/json");
    request.body = toJson(metadata);
    auto response = send(request);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (!response->ok()) {
        return std::unexpected(httpError("create folder", name, *response));
    }
    auto json = parseJson(response->body);
    if (!json) {
        return std::unexpected(json.error());
    }
    std::string id = (*json).get("id", "").asString();
    if (id.empty()) {
        return makeError(ErrorKind::Transfer, "Google Drive returned no folder id for " + name);
    }
    return id;
}

Result<std::optional<std::string>> DriveStorage::resolveParent(const std::string& remotePath, bool create) {
    auto parts = splitPath(remotePath);
    if (parts.empty()) {
        return makeError(ErrorKind::InvalidArgument, "Empty remote path");
    }
    parts.pop_back();

    std::string currentPath;
    std::string currentId = rootFolderId_;
    for (const auto& folder : parts) {
        currentPath += currentPath.empty() ? folder : "/" + folder;
        auto cached = folderCache_.find(currentPath);
        if (cached != folderCache_.end()) {
            currentId = cached->second;
            continue;
        }
        auto child = findChild(currentId, folder, true);
        if (!child) {
            return std::unexpected(child.error());
        }
        if (!*child) {
            if (!create) {
                return std::optional<std::string>();
            }
            auto created = createFolder(currentId, folder);
            if (!created) {
                return std::unexpected(created.error());
            }
            *child = *created;
        }
        currentId = **child;
        folderCache_[currentPath] = currentId;
    }
    return std::optional<std::string>(currentId);
}

Result<std::optional<std::string>> DriveStorage::resolveFile(const std::string& remotePath) {
    auto parent = resolveParent(remotePath, false);
    if (!parent) {
        return std::unexpected(parent.error());
    }
    if (!*parent) {
        return std::optional<std::string>();
    }
    return findChild(**parent, splitPath(remotePath).back(), false);
}

Result<void> DriveStorage::upload(const std::string& localPath, const std::string& remotePath) {
    if (!fs::is_regular_file(localPath)) {
        return makeError(ErrorKind::NotFound, "Local file not found: " + localPath);
    }
    auto parent = resolveParent(remotePath, true);
    if (!parent) {
        return std::unexpected(parent.error());
    }
    std::string fileName = splitPath(remotePath).back();
    auto existing = findChild(**parent, fileName, false);
    if (!existing) {
        return std::unexpected(existing.error());
    }

    std::string fileId;
    if (*existing) {
        fileId = **existing;
    } else {
        Json::Value metadata;
        metadata["name"] = fileName;
        metadata["parents"].append(**parent);

        HttpRequest create;
        create.method = "POST";
        create.url = std::string(kFilesUrl) + "?fields=id";
        create.headers.push_back("Content-Type: application/json");
        create.body = toJson(metadata);
        auto response = send(create);
        if (!response) {
            return std::unexpected(response.error());
        }
        if (!response->ok()) {
            auto error = httpError("upload", remotePath, *response);
            error.kind = ErrorKind::Transfer;
            return std::unexpected(error);
        }
        auto json = parseJson(response->body);
        if (!json) {
            return std::unexpected(json.error());
        }
        fileId = (*json).get("id", "").asString();
        if (fileId.empty()) {
            return makeError(ErrorKind::Transfer, "Google Drive returned no file id for " + remotePath);
        }
    }

    HttpRequest media;
    media.method = "PATCH";
    media.url = std::string(kUploadUrl) + "/" + uriEncode(fileId) + "?uploadType=media";
    media.headers.push_back("Content-Type: application/octet-stream");
    media.uploadFile = localPath;
    auto response = send(media);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (!response->ok()) {
        auto error = httpError("upload", remotePath, *response);
        error.kind = ErrorKind::Transfer;
        return std::unexpected(error);
    }
    logger_.debug("gdrive: uploaded " + remotePath);
    return {};
}

Result<void> DriveStorage::download(const std::string& remotePath, const std::string& localPath) {
    auto fileId = resolveFile(remotePath);
    if (!fileId) {
        return std::unexpected(fileId.error());
    }
    if (!*fileId) {
        return makeError(ErrorKind::NotFound, "File not found in Google Drive: " + remotePath);
    }

    HttpRequest request;
    request.url = std::string(kFilesUrl) + "/" + uriEncode(**fileId) + "?alt=media";
    request.downloadFile = localPath;
    auto response = send(request);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (!response->ok()) {
        return std::unexpected(httpError("download", remotePath, *response));
    }
    return {};
}

Result<bool> DriveStorage::exists(const std::string& remotePath) {
    auto fileId = resolveFile(remotePath);
    if (!fileId) {
        return std::unexpected(fileId.error());
    }
    return fileId->has_value();
}

Result<void> DriveStorage::remove(const std::string& remotePath) {
    auto fileId = resolveFile(remotePath);
    if (!fileId) {
        return std::unexpected(fileId.error());
    }
    if (!*fileId) {
        logger_.debug("gdrive: file already absent: " + remotePath);
        return {};
    }

    HttpRequest request;
    request.method = "DELETE";
    request.url = std::string(kFilesUrl) + "/" + uriEncode(**fileId);
    auto response = send(request);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (!response->ok() && response->status != 404) {
        return std::unexpected(httpError("delete", remotePath, *response));
    }
    return {};
}
