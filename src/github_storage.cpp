#include "github_storage.hpp"
#include "crypto_util.hpp"
#include "logger.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

Result<void> GitHubStorage::initialize(const StorageOptions& options) {
    auto check = requireOptions(options, {"token", "owner", "repo"});
    if (!check) {
        return check;
    }
    token_ = options.at("token");
    owner_ = options.at("owner");
    repo_ = options.at("repo");
    branch_ = optionOr(options, "branch", "");
    apiUrl_ = optionOr(options, "apiUrl", "https://api.github.com");
    while (!apiUrl_.empty() && apiUrl_.back() == '/') {
        apiUrl_.pop_back();
    }

    HttpRequest request;
    request.url = apiUrl_ + "/repos/" + uriEncode(owner_) + "/" + uriEncode(repo_);
    request.headers = headers("application/vnd.github+json");
    auto response = http_->perform(request);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (response->status == 401 || response->status == 403 || response->status == 404) {
        return makeError(ErrorKind::Configuration, "Cannot access GitHub repository " + owner_ + "/" + repo_ +
                                                   " (HTTP " + std::to_string(response->status) + ")");
    }
    if (!response->ok()) {
        return std::unexpected(httpError("repository check", owner_ + "/" + repo_, *response));
    }
    logger_.info("Connected to GitHub repository: " + owner_ + "/" + repo_);
    return {};
}

std::vector<std::string> GitHubStorage::headers(const std::string& accept) const {
    return {
        "Authorization: Bearer " + token_,
        "Accept: " + accept,
        "X-GitHub-Api-Version: 2022-11-28",
        "User-Agent: ReStore",
    };
}

std::string GitHubStorage::contentsUrl(const std::string& remotePath, bool withRef) const {
    std::string url = apiUrl_ + "/repos/" + uriEncode(owner_) + "/" + uriEncode(repo_) + "/contents/" + uriEncode(remotePath, false);
    if (withRef && !branch_.empty()) {
        url += "?ref=" + uriEncode(branch_);
    }
    return url;
}

Result<std::optional<std::string>> GitHubStorage::fileSha(const std::string& remotePath) {
    HttpRequest request;
    request.url = contentsUrl(remotePath, true);
    request.headers = headers("application/vnd.github+json");
    auto response = http_->perform(request);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (response->status == 404) {
        return std::optional<std::string>();
    }
    if (!response->ok()) {
        return std::unexpected(httpError("lookup", remotePath, *response));
    }
    auto json = parseJson(response->body);
    if (!json) {
        return std::unexpected(json.error());
    }
    if (!json->isObject() || !(*json)["sha"].isString()) {
        return makeError(ErrorKind::Transfer, "GitHub path is not a file: " + remotePath);
    }
    return std::optional<std::string>((*json)["sha"].asString());
}

Result<void> GitHubStorage::upload(const std::string& localPath, const std::string& remotePath) {
    std::error_code ec;
    auto size = fs::file_size(localPath, ec);
    if (ec) {
        return makeError(ErrorKind::NotFound, "Local file not found: " + localPath);
    }
    if (size > kMaxFileSize) {
        return makeError(ErrorKind::Transfer, "File '" + fs::path(localPath).filename().string() + "' is " +
                                              std::to_string(size / (1024 * 1024)) +
                                              "MB which exceeds GitHub's 100MB file size limit");
    }

    std::ifstream input(localPath, std::ios::binary);
    if (!input) {
        return makeError(ErrorKind::Io, "Failed to open local file: " + localPath);
    }
    std::string content((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());

    auto sha = fileSha(remotePath);
    if (!sha) {
        return std::unexpected(sha.error());
    }

    Json::Value body;
    body["message"] = (*sha ? "Update " : "Create ") + remotePath;
    body["content"] = base64Encode(content);
    if (*sha) {
        body["sha"] = **sha;
    }
    if (!branch_.empty()) {
        body["branch"] = branch_;
    }

    HttpRequest request;
    request.method = "PUT";
    request.url = contentsUrl(remotePath, false);
    request.headers = headers("application/vnd.github+json");
    request.headers.push_back("Content-Type: application/json");
    request.body = toJson(body);
    auto response = http_->perform(request);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (!response->ok()) {
        auto error = httpError("upload", remotePath, *response);
        error.kind = ErrorKind::Transfer;
        return std::unexpected(error);
    }
    logger_.info("Uploaded " + fs::path(localPath).filename().string() + " to GitHub");
    return {};
}

Result<void> GitHubStorage::download(const std::string& remotePath, const std::string& localPath) {
    HttpRequest request;
    request.url = contentsUrl(remotePath, true);
    request.headers = headers("application/vnd.github.raw");
    request.downloadFile = localPath;
    auto response = http_->perform(request);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (!response->ok()) {
        return std::unexpected(httpError("download", remotePath, *response));
    }
    return {};
}

Result<bool> GitHubStorage::exists(const std::string& remotePath) {
    auto sha = fileSha(remotePath);
    if (!sha) {
        return std::unexpected(sha.error());
    }
    return sha->has_value();
}

Result<void> GitHubStorage::remove(const std::string& remotePath) {
    auto sha = fileSha(remotePath);
    if (!sha) {
        return std::unexpected(sha.error());
    }
    if (!*sha) {
        logger_.debug("GitHub file already absent: " + remotePath);
        return {};
    }

    Json::Value body;
    body["message"] = "Delete " + remotePath;
    body["sha"] = **sha;
    if (!branch_.empty()) {
        body["branch"] = branch_;
    }

    HttpRequest request;
    request.method = "DELETE";
    request.url = contentsUrl(remotePath, false);
    request.headers = headers("application/vnd.github+json");
    request.headers.push_back("Content-Type: application/json");
    request.body = toJson(body);
    auto response = http_->perform(request);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (!response->ok() && response->status != 404) {
        return std::unexpected(httpError("delete", remotePath, *response));
    }
    return {};
}
