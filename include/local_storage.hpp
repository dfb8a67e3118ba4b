/**
 * @file local_storage.hpp
 * @brief Storage backend writing into a directory on the local filesystem.
 *
 * Useful for external drives and network mounts, and as the reference backend in tests.
 */

#ifndef LOCAL_STORAGE_HPP
#define LOCAL_STORAGE_HPP

#include <filesystem>
#include "storage_backend.hpp"

class Logger;

/**
 * @brief Local directory storage.
 *
 * Options: path (base directory, created at initialization). Remote paths are resolved
 * below the base directory; absolute paths and paths escaping it are rejected.
 */
class LocalStorage : public StorageBackend {
public:
    explicit LocalStorage(Logger& logger);

    std::string name() const override { return "local"; }
    Result<void> initialize(const StorageOptions& options) override;
    Result<void> upload(const std::string& localPath, const std::string& remotePath) override;
    Result<void> download(const std::string& remotePath, const std::string& localPath) override;
    Result<bool> exists(const std::string& remotePath) override;
    Result<void> remove(const std::string& remotePath) override;

private:
    /**
     * @brief Maps a remote path to a file below the base directory.
     *
     * @return Result<std::filesystem::path> InvalidArgumentError for absolute or escaping paths.
     */
    Result<std::filesystem::path> resolve(const std::string& remotePath) const;

    Logger& logger_;
    std::filesystem::path basePath_;    ///< Normalized base directory.
};

#endif // LOCAL_STORAGE_HPP
