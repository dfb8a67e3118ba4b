/**
 * @file encryption.hpp
 * @brief Password based file encryption for backup archives.
 *
 * Files are encrypted with AES-256-GCM under a key derived by PBKDF2-HMAC-SHA256. The
 * layout is self-describing:
 *
 *   "RSTE" | version (1 byte) | iterations (4 bytes, big endian) | salt (32) | iv (12)
 *   | ciphertext | tag (16)
 *
 * The whole header is authenticated as additional data, so a modified iteration count or
 * salt fails like a wrong password.
 *
 * @note Requires OpenSSL (libcrypto).
 */

#ifndef ENCRYPTION_HPP
#define ENCRYPTION_HPP

#include <cstdint>
#include <string>
#include "backup_error.hpp"

/**
 * @brief Encrypts and decrypts whole files with a password.
 */
class FileEncryptor {
public:
    static constexpr std::uint32_t kDefaultIterations = 100000;
    static constexpr std::size_t kSaltSize = 32;
    static constexpr std::size_t kIvSize = 12;
    static constexpr std::size_t kTagSize = 16;
    static constexpr std::size_t kHeaderSize = 4 + 1 + 4 + kSaltSize + kIvSize;

    /**
     * @param iterations PBKDF2 iteration count written into new files.
     */
    explicit FileEncryptor(std::uint32_t iterations = kDefaultIterations);

    /**
     * @brief Encrypts inputFile into outputFile with a fresh salt and IV.
     *
     * @return Result<void> Configuration error for an empty password, Io error otherwise.
     */
    Result<void> encrypt(const std::string& inputFile, const std::string& outputFile, const std::string& password) const;

    /**
     * @brief Decrypts a file produced by encrypt().
     *
     * The iteration count is taken from the file header. outputFile is removed again when the
     * authentication tag does not verify, so callers never see unauthenticated plaintext.
     *
     * @return Result<void> Authentication error for a wrong password or tampered data, Format
     * error for a truncated file or unknown header.
     */
    Result<void> decrypt(const std::string& inputFile, const std::string& outputFile, const std::string& password) const;

    std::uint32_t iterations() const { return iterations_; }

private:
    std::uint32_t iterations_;
};

#endif // ENCRYPTION_HPP
