#include "storage_registry.hpp"
#include "azure_storage.hpp"
#include "drive_storage.hpp"
#include "dropbox_storage.hpp"
#include "github_storage.hpp"
#include "local_storage.hpp"
#include "logger.hpp"
#include "object_storage.hpp"
#include "sftp_storage.hpp"
#include <algorithm>
#include <cctype>

StorageRegistry StorageRegistry::withDefaults(Logger& logger) {
    StorageRegistry registry;
    registry.registerBackend("local", [&logger] { return std::make_unique<LocalStorage>(logger); });
    registry.registerBackend("s3", [&logger] { return std::make_unique<S3Storage>(logger); });
    registry.registerBackend("b2", [&logger] { return std::make_unique<B2Storage>(logger); });
    registry.registerBackend("gcp", [&logger] { return std::make_unique<GcsStorage>(logger); });
    registry.registerBackend("azure", [&logger] { return std::make_unique<AzureStorage>(logger); });
    registry.registerBackend("github", [&logger] { return std::make_unique<GitHubStorage>(logger); });
    registry.registerBackend("gdrive", [&logger] { return std::make_unique<DriveStorage>(logger); });
    registry.registerBackend("dropbox", [&logger] { return std::make_unique<DropboxStorage>(logger); });
    registry.registerBackend("sftp", [&logger] { return std::make_unique<SftpStorage>(logger); });
    return registry;
}

void StorageRegistry::registerBackend(const std::string& name, Factory factory) {
    factories_[normalizeName(name)] = std::move(factory);
}

Result<ScopedStorage> StorageRegistry::open(const std::string& name, const StorageOptions& options) const {
    auto it = factories_.find(normalizeName(name));
    if (it == factories_.end()) {
        std::string valid;
        for (const auto& known : names()) {
            if (!valid.empty()) {
                valid += ", ";
            }
            valid += known;
        }
        return makeError(ErrorKind::Configuration, "Unknown storage type '" + name + "'. Valid types: " + valid);
    }

    ScopedStorage storage(it->second());
    if (!storage) {
        return makeError(ErrorKind::Configuration, "Storage factory for '" + name + "' returned no backend");
    }
    auto initResult = storage->initialize(options);
    if (!initResult) {
        return std::unexpected(initResult.error());
    }
    return storage;
}

bool StorageRegistry::contains(const std::string& name) const {
    return factories_.contains(normalizeName(name));
}

std::vector<std::string> StorageRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(factories_.size());
    for (const auto& [name, factory] : factories_) {
        result.push_back(name);
    }
    return result;
}

std::string StorageRegistry::normalizeName(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}
