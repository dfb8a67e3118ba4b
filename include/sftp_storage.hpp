/**
 * @file sftp_storage.hpp
 * @brief SFTP storage backend.
 *
 * Keeps one SSH session and SFTP channel open from initialize() until release().
 *
 * @note Requires libssh. Install via vcpkg on Windows, Homebrew on macOS, or apt on Linux.
 */

#ifndef SFTP_STORAGE_HPP
#define SFTP_STORAGE_HPP

#include <string>
#include "storage_backend.hpp"

class Logger;

struct ssh_session_struct;
struct sftp_session_struct;

/**
 * @brief SFTP storage.
 *
 * Options: host, username, and password or privateKeyPath; optional port (default 22),
 * passphrase and remoteDir (prefix for every remote path).
 */
class SftpStorage : public StorageBackend {
public:
    explicit SftpStorage(Logger& logger);
    ~SftpStorage() override;

    std::string name() const override { return "sftp"; }
    Result<void> initialize(const StorageOptions& options) override;
    Result<void> upload(const std::string& localPath, const std::string& remotePath) override;
    Result<void> download(const std::string& remotePath, const std::string& localPath) override;
    Result<bool> exists(const std::string& remotePath) override;
    Result<void> remove(const std::string& remotePath) override;
    void release() override;

private:
    std::string fullPath(const std::string& remotePath) const;
    Result<void> ensureSession() const;
    Result<void> makeDirectories(const std::string& remoteDir);
    std::string sshError() const;

    Logger& logger_;
    ssh_session_struct* ssh_ = nullptr;     ///< SSH session, owned.
    sftp_session_struct* sftp_ = nullptr;   ///< SFTP channel on ssh_, owned.
    std::string host_;                      ///< SFTP host address.
    std::string remoteDir_;                 ///< Remote directory prefix, may be empty.
};

#endif // SFTP_STORAGE_HPP
