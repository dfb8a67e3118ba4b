/**
 * @file storage_backend.hpp
 * @brief Storage contract implemented by every ReStore backend.
 *
 * A backend stores opaque files under slash-separated remote paths. Instances are created
 * per unit of work, initialized once with their option map and released deterministically
 * through ScopedStorage on every exit path.
 */

#ifndef STORAGE_BACKEND_HPP
#define STORAGE_BACKEND_HPP

#include <atomic>
#include <chrono>
#include <initializer_list>
#include <map>
#include <memory>
#include <string>
#include "backup_error.hpp"

/**
 * @brief Backend-specific key/value options, fixed after initialization.
 */
using StorageOptions = std::map<std::string, std::string>;

/**
 * @brief Interface for remote storage backends.
 *
 * All operations use overwrite semantics for writes, map "not found" to false in exists(),
 * and treat deletion of a missing object as success.
 */
class StorageBackend {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~StorageBackend() = default;

    /**
     * @brief Registry name of the backend ("s3", "local", ...).
     */
    virtual std::string name() const = 0;

    /**
     * @brief Validates options and establishes the session.
     *
     * @param options Backend-specific configuration.
     * @return Result<void> ConfigurationError naming every missing key, or a session error.
     */
    virtual Result<void> initialize(const StorageOptions& options) = 0;

    /**
     * @brief Uploads a local file, replacing any existing object at remotePath.
     */
    virtual Result<void> upload(const std::string& localPath, const std::string& remotePath) = 0;

    /**
     * @brief Downloads an object to localPath, creating parent directories.
     *
     * @return Result<void> NotFoundError when the object is absent. A failed download never
     * leaves a partial file at localPath.
     */
    virtual Result<void> download(const std::string& remotePath, const std::string& localPath) = 0;

    /**
     * @brief Reports whether an object exists.
     */
    virtual Result<bool> exists(const std::string& remotePath) = 0;

    /**
     * @brief Deletes an object. Deleting a missing object succeeds.
     */
    virtual Result<void> remove(const std::string& remotePath) = 0;

    /**
     * @brief Whether generateShareLink() is available on this backend.
     */
    virtual bool supportsSharing() const { return false; }

    /**
     * @brief Produces a time-limited public URL for an uploaded object.
     *
     * Fails with UnsupportedOperationError, without touching the network, when the backend
     * does not support sharing.
     */
    Result<std::string> generateShareLink(const std::string& remotePath, std::chrono::seconds expiration);

    /**
     * @brief Releases the session. Safe to call more than once.
     */
    virtual void release() {}

    /**
     * @brief Installs a flag polled during long transfers. Null clears it.
     */
    virtual void setCancelFlag(const std::atomic<bool>* flag) { cancelFlag_ = flag; }

protected:
    /**
     * @brief Backend-specific share link generation, called only when supportsSharing().
     */
    virtual Result<std::string> doGenerateShareLink(const std::string& remotePath, std::chrono::seconds expiration);

    /**
     * @brief Checks that every key is present and non-empty.
     *
     * @return Result<void> ConfigurationError listing all missing keys at once.
     */
    Result<void> requireOptions(const StorageOptions& options, std::initializer_list<const char*> keys) const;

    /**
     * @brief Returns the option value or a fallback when absent or empty.
     */
    static std::string optionOr(const StorageOptions& options, const std::string& key, const std::string& fallback);

    bool cancelled() const { return cancelFlag_ && cancelFlag_->load(); }

    const std::atomic<bool>* cancelFlag_ = nullptr;
};

/**
 * @brief Owning handle that releases its backend when it goes out of scope.
 */
class ScopedStorage {
public:
    ScopedStorage() = default;
    explicit ScopedStorage(std::unique_ptr<StorageBackend> backend);
    ~ScopedStorage();

    ScopedStorage(ScopedStorage&& other) noexcept = default;
    ScopedStorage& operator=(ScopedStorage&& other) noexcept;
    ScopedStorage(const ScopedStorage&) = delete;
    ScopedStorage& operator=(const ScopedStorage&) = delete;

    StorageBackend* operator->() const { return backend_.get(); }
    StorageBackend& operator*() const { return *backend_; }
    StorageBackend* get() const { return backend_.get(); }
    explicit operator bool() const { return static_cast<bool>(backend_); }

private:
    std::unique_ptr<StorageBackend> backend_;
};

#endif // STORAGE_BACKEND_HPP
