#include "sftp_storage.hpp"
#include "logger.hpp"
#include <libssh/libssh.h>
#include <libssh/sftp.h>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;

SftpStorage::SftpStorage(Logger& logger) : logger_(logger) {}

SftpStorage::~SftpStorage() {
    release();
}

void SftpStorage::release() {
    if (sftp_) {
        sftp_free(sftp_);
        sftp_ = nullptr;
    }
    if (ssh_) {
        ssh_disconnect(ssh_);
        ssh_free(ssh_);
        ssh_ = nullptr;
    }
}

std::string SftpStorage::sshError() const {
    return ssh_ ? ssh_get_error(ssh_) : "no session";
}

Result<void> SftpStorage::initialize(const StorageOptions& options) {
    auto check = requireOptions(options, {"host", "username"});
    std::string password = optionOr(options, "password", "");
    std::string keyPath = optionOr(options, "privateKeyPath", "");
    if (!check) {
        if (password.empty() && keyPath.empty()) {
            check.error().message += ", password or privateKeyPath";
        }
        return check;
    }
    if (password.empty() && keyPath.empty()) {
        return makeError(ErrorKind::Configuration, "Storage 'sftp' is missing required options: password or privateKeyPath");
    }

    int port = 22;
    std::string portText = optionOr(options, "port", "22");
    try {
        size_t consumed = 0;
        port = std::stoi(portText, &consumed);
        if (consumed != portText.size() || port <= 0 || port > 65535) {
            throw std::out_of_range(portText);
        }
    } catch (const std::exception&) {
        return makeError(ErrorKind::Configuration, "Storage 'sftp' has an invalid port: " + portText);
    }

    release();
    host_ = options.at("host");
    remoteDir_ = optionOr(options, "remoteDir", "");
    while (remoteDir_.size() > 1 && remoteDir_.back() == '/') {
        remoteDir_.pop_back();
    }
    std::string user = options.at("username");

    ssh_ = ssh_new();
    if (!ssh_) {
        return makeError(ErrorKind::Transfer, "Failed to create SSH session");
    }
    ssh_options_set(ssh_, SSH_OPTIONS_HOST, host_.c_str());
    ssh_options_set(ssh_, SSH_OPTIONS_PORT, &port);
    ssh_options_set(ssh_, SSH_OPTIONS_USER, user.c_str());
    if (ssh_connect(ssh_) != SSH_OK) {
        std::string detail = sshError();
        release();
        return makeError(ErrorKind::Transfer, "SSH connection to " + host_ + " failed: " + detail);
    }

    switch (ssh_session_is_known_server(ssh_)) {
        case SSH_KNOWN_HOSTS_OK:
            break;
        case SSH_KNOWN_HOSTS_CHANGED:
        case SSH_KNOWN_HOSTS_OTHER:
            release();
            return makeError(ErrorKind::Configuration, "Host key for " + host_ + " does not match known_hosts");
        default:
            logger_.warning("sftp: host key for " + host_ + " is not in known_hosts");
            break;
    }

    int auth = SSH_AUTH_DENIED;
    if (!keyPath.empty()) {
        std::string passphrase = optionOr(options, "passphrase", "");
        ssh_key key = nullptr;
        if (ssh_pki_import_privkey_file(keyPath.c_str(), passphrase.empty() ? nullptr : passphrase.c_str(),
                                        nullptr, nullptr, &key) != SSH_OK) {
            release();
            return makeError(ErrorKind::Configuration, "Failed to load SSH private key: " + keyPath);
        }
        auth = ssh_userauth_publickey(ssh_, nullptr, key);
        ssh_key_free(key);
    } else {
        auth = ssh_userauth_password(ssh_, nullptr, password.c_str());
    }
    if (auth != SSH_AUTH_SUCCESS) {
        release();
        return makeError(ErrorKind::Configuration, "SSH authentication failed for " + user + "@" + host_);
    }

    sftp_ = sftp_new(ssh_);
    if (!sftp_ || sftp_init(sftp_) != SSH_OK) {
        std::string detail = sshError();
        release();
        return makeError(ErrorKind::Transfer, "SFTP initialization failed: " + detail);
    }
    logger_.info("Connected to SFTP server " + host_ + " as " + user);
    return {};
}

Result<void> SftpStorage::ensureSession() const {
    if (!sftp_) {
        return makeError(ErrorKind::Configuration, "SFTP session is not open");
    }
    return {};
}

std::string SftpStorage::fullPath(const std::string& remotePath) const {
    if (remoteDir_.empty()) {
        return remotePath;
    }
    return remoteDir_ + "/" + remotePath;
}

Result<void> SftpStorage::makeDirectories(const std::string& remoteDir) {
    std::string current;
    size_t start = 0;
    if (!remoteDir.empty() && remoteDir.front() == '/') {
        current = "/";
        start = 1;
    }
    while (start <= remoteDir.size()) {
        size_t slash = remoteDir.find('/', start);
        std::string part = remoteDir.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
        if (!part.empty()) {
            current += (current.empty() || current == "/") ? part : "/" + part;
            sftp_attributes attrs = sftp_stat(sftp_, current.c_str());
            if (attrs) {
                sftp_attributes_free(attrs);
            } else if (sftp_mkdir(sftp_, current.c_str(), 0755) != SSH_OK &&
                       sftp_get_error(sftp_) != SSH_FX_FILE_ALREADY_EXISTS) {
                return makeError(ErrorKind::Transfer, "Failed to create remote directory " + current + ": " + sshError());
            }
        }
        if (slash == std::string::npos) {
            break;
        }
        start = slash + 1;
    }
    return {};
}

Result<void> SftpStorage::upload(const std::string& localPath, const std::string& remotePath) {
    auto session = ensureSession();
    if (!session) {
        return session;
    }
    std::ifstream input(localPath, std::ios::binary);
    if (!input) {
        return makeError(ErrorKind::NotFound, "Local file not found: " + localPath);
    }

    std::string target = fullPath(remotePath);
    auto slash = target.rfind('/');
    if (slash != std::string::npos && slash > 0) {
        auto dirs = makeDirectories(target.substr(0, slash));
        if (!dirs) {
            return dirs;
        }
    }

    sftp_file file = sftp_open(sftp_, target.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (!file) {
        return makeError(ErrorKind::Transfer, "Failed to open remote file " + target + ": " + sshError());
    }

    std::vector<char> buf(32 * 1024);
    while (input) {
        if (cancelled()) {
            sftp_close(file);
            sftp_unlink(sftp_, target.c_str());
            return makeError(ErrorKind::Cancelled, "Upload cancelled: " + remotePath);
        }
        input.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        auto count = input.gcount();
        if (count > 0 && sftp_write(file, buf.data(), static_cast<size_t>(count)) != count) {
            sftp_close(file);
            return makeError(ErrorKind::Transfer, "Failed to write remote file " + target + ": " + sshError());
        }
    }
    if (input.bad()) {
        sftp_close(file);
        return makeError(ErrorKind::Io, "Failed to read local file: " + localPath);
    }
    if (sftp_close(file) != SSH_OK) {
        return makeError(ErrorKind::Transfer, "Failed to close remote file " + target + ": " + sshError());
    }
    logger_.debug("Transferred file to remote: " + target);
    return {};
}

Result<void> SftpStorage::download(const std::string& remotePath, const std::string& localPath) {
    auto session = ensureSession();
    if (!session) {
        return session;
    }
    std::string source = fullPath(remotePath);
    sftp_file file = sftp_open(sftp_, source.c_str(), O_RDONLY, 0);
    if (!file) {
        if (sftp_get_error(sftp_) == SSH_FX_NO_SUCH_FILE) {
            return makeError(ErrorKind::NotFound, "Remote file not found: " + source);
        }
        return makeError(ErrorKind::Transfer, "Failed to open remote file " + source + ": " + sshError());
    }

    fs::path target(localPath);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
    }
    std::string partPath = localPath + ".part";
    std::ofstream output(partPath, std::ios::binary | std::ios::trunc);
    if (!output) {
        sftp_close(file);
        return makeError(ErrorKind::Io, "Failed to create local file: " + partPath);
    }

    auto fail = [&](ErrorKind kind, const std::string& message) -> Result<void> {
        sftp_close(file);
        output.close();
        std::error_code removeEc;
        fs::remove(partPath, removeEc);
        return makeError(kind, message);
    };

    std::vector<char> buf(32 * 1024);
    while (true) {
        if (cancelled()) {
            return fail(ErrorKind::Cancelled, "Download cancelled: " + remotePath);
        }
        ssize_t count = sftp_read(file, buf.data(), buf.size());
        if (count < 0) {
            return fail(ErrorKind::Transfer, "Failed to read remote file " + source + ": " + sshError());
        }
        if (count == 0) {
            break;
        }
        output.write(buf.data(), count);
        if (!output) {
            return fail(ErrorKind::Io, "Failed to write local file: " + partPath);
        }
    }
    sftp_close(file);
    output.close();
    fs::rename(partPath, localPath, ec);
    if (ec) {
        fs::remove(partPath, ec);
        return makeError(ErrorKind::Io, "Failed to move download into place: " + localPath);
    }
    return {};
}

Result<bool> SftpStorage::exists(const std::string& remotePath) {
    auto session = ensureSession();
    if (!session) {
        return std::unexpected(session.error());
    }
    std::string target = fullPath(remotePath);
    sftp_attributes attrs = sftp_stat(sftp_, target.c_str());
    if (attrs) {
        sftp_attributes_free(attrs);
        return true;
    }
    if (sftp_get_error(sftp_) == SSH_FX_NO_SUCH_FILE) {
        return false;
    }
    return makeError(ErrorKind::Transfer, "Failed to stat remote file " + target + ": " + sshError());
}

Result<void> SftpStorage::remove(const std::string& remotePath) {
    auto session = ensureSession();
    if (!session) {
        return session;
    }
    std::string target = fullPath(remotePath);
    if (sftp_unlink(sftp_, target.c_str()) != SSH_OK) {
        if (sftp_get_error(sftp_) == SSH_FX_NO_SUCH_FILE) {
            logger_.debug("sftp: file already absent: " + target);
            return {};
        }
        return makeError(ErrorKind::Transfer, "Failed to delete remote file " + target + ": " + sshError());
    }
    return {};
}
