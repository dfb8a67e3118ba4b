#include "storage_backend.hpp"

Result<std::string> StorageBackend::generateShareLink(const std::string& remotePath, std::chrono::seconds expiration) {
    if (!supportsSharing()) {
        return makeError(ErrorKind::UnsupportedOperation, "Storage '" + name() + "' does not support share links");
    }
    if (expiration.count() <= 0) {
        return makeError(ErrorKind::InvalidArgument, "Share link expiration must be positive");
    }
    return doGenerateShareLink(remotePath, expiration);
}

Result<std::string> StorageBackend::doGenerateShareLink(const std::string& /*remotePath*/, std::chrono::seconds /*expiration*/) {
    return makeError(ErrorKind::UnsupportedOperation, "Storage '" + name() + "' does not support share links");
}

Result<void> StorageBackend::requireOptions(const StorageOptions& options, std::initializer_list<const char*> keys) const {
    std::string missing;
    for (const char* key : keys) {
        auto it = options.find(key);
        if (it == options.end() || it->second.empty()) {
            if (!missing.empty()) {
                missing += ", ";
            }
            missing += key;
        }
    }
    if (!missing.empty()) {
        return makeError(ErrorKind::Configuration, "Storage '" + name() + "' is missing required options: " + missing);
    }
    return {};
}

std::string StorageBackend::optionOr(const StorageOptions& options, const std::string& key, const std::string& fallback) {
    auto it = options.find(key);
    if (it == options.end() || it->second.empty()) {
        return fallback;
    }
    return it->second;
}

ScopedStorage::ScopedStorage(std::unique_ptr<StorageBackend> backend) : backend_(std::move(backend)) {}

ScopedStorage::~ScopedStorage() {
    if (backend_) {
        backend_->release();
    }
}

ScopedStorage& ScopedStorage::operator=(ScopedStorage&& other) noexcept {
    if (this != &other) {
        if (backend_) {
            backend_->release();
        }
        backend_ = std::move(other.backend_);
    }
    return *this;
}
