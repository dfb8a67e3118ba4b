#include "local_storage.hpp"
#include "logger.hpp"

namespace fs = std::filesystem;

LocalStorage::LocalStorage(Logger& logger) : logger_(logger) {}

Result<void> LocalStorage::initialize(const StorageOptions& options) {
    auto check = requireOptions(options, {"path"});
    if (!check) {
        return check;
    }
    std::error_code ec;
    fs::path base = fs::absolute(options.at("path"), ec);
    if (ec) {
        return makeError(ErrorKind::Configuration, "Invalid local storage path: " + options.at("path"));
    }
    fs::create_directories(base, ec);
    if (ec || !fs::is_directory(base)) {
        return makeError(ErrorKind::Configuration, "Failed to create local storage directory: " + base.string() +
                                                   (ec ? " (" + ec.message() + ")" : ""));
    }
    basePath_ = base.lexically_normal();
    logger_.debug("local: storing backups in " + basePath_.string());
    return {};
}

Result<fs::path> LocalStorage::resolve(const std::string& remotePath) const {
    fs::path relative(remotePath);
    if (remotePath.empty() || relative.is_absolute() || relative.has_root_name()) {
        return makeError(ErrorKind::InvalidArgument, "Remote path must be relative: '" + remotePath + "'");
    }
    fs::path normalized = relative.lexically_normal();
    if (normalized.empty() || normalized == "." || *normalized.begin() == "..") {
        return makeError(ErrorKind::InvalidArgument, "Remote path escapes the storage directory: '" + remotePath + "'");
    }
    return basePath_ / normalized;
}

Result<void> LocalStorage::upload(const std::string& localPath, const std::string& remotePath) {
    auto target = resolve(remotePath);
    if (!target) {
        return std::unexpected(target.error());
    }
    if (!fs::is_regular_file(localPath)) {
        return makeError(ErrorKind::NotFound, "Local file not found: " + localPath);
    }
    std::error_code ec;
    fs::create_directories(target->parent_path(), ec);
    if (ec) {
        return makeError(ErrorKind::Transfer, "Failed to create directory " + target->parent_path().string() + ": " + ec.message());
    }
    fs::copy_file(localPath, *target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return makeError(ErrorKind::Transfer, "Failed to copy " + localPath + " to " + target->string() + ": " + ec.message());
    }
    logger_.debug("local: stored " + remotePath);
    return {};
}

Result<void> LocalStorage::download(const std::string& remotePath, const std::string& localPath) {
    auto source = resolve(remotePath);
    if (!source) {
        return std::unexpected(source.error());
    }
    if (!fs::is_regular_file(*source)) {
        return makeError(ErrorKind::NotFound, "Backup not found in local storage: " + remotePath);
    }

    fs::path target(localPath);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
    }
    std::string partPath = localPath + ".part";
    fs::copy_file(*source, partPath, fs::copy_options::overwrite_existing, ec);
    if (!ec) {
        fs::rename(partPath, target, ec);
    }
    if (ec) {
        std::error_code removeEc;
        fs::remove(partPath, removeEc);
        return makeError(ErrorKind::Transfer, "Failed to copy " + source->string() + " to " + localPath + ": " + ec.message());
    }
    return {};
}

Result<bool> LocalStorage::exists(const std::string& remotePath) {
    auto target = resolve(remotePath);
    if (!target) {
        return std::unexpected(target.error());
    }
    std::error_code ec;
    return fs::is_regular_file(*target, ec);
}

Result<void> LocalStorage::remove(const std::string& remotePath) {
    auto target = resolve(remotePath);
    if (!target) {
        return std::unexpected(target.error());
    }
    std::error_code ec;
    if (!fs::remove(*target, ec)) {
        if (ec) {
            return makeError(ErrorKind::Io, "Failed to delete " + target->string() + ": " + ec.message());
        }
        logger_.debug("local: file already absent: " + remotePath);
    }
    return {};
}
