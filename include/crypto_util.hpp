/**
 * @file crypto_util.hpp
 * @brief Hashing, HMAC, encoding and random helpers built on OpenSSL.
 *
 * Binary values are carried in std::string. Used by request signers (SigV4, Azure
 * SharedKey), the share link issuer and the encryption stage.
 */

#ifndef CRYPTO_UTIL_HPP
#define CRYPTO_UTIL_HPP

#include <cstddef>
#include <optional>
#include <string>
#include "backup_error.hpp"

/**
 * @brief Lower-case hex SHA-256 of a byte string.
 */
std::string sha256Hex(const std::string& data);

/**
 * @brief Lower-case hex SHA-256 of a file's content, streamed in chunks.
 */
Result<std::string> sha256FileHex(const std::string& path);

/**
 * @brief Raw HMAC-SHA256 digest (32 bytes).
 */
std::string hmacSha256(const std::string& key, const std::string& data);

std::string toHex(const std::string& bytes);

std::string base64Encode(const std::string& bytes);

/**
 * @brief Decodes standard base64, ignoring whitespace.
 *
 * @return std::nullopt on invalid input.
 */
std::optional<std::string> base64Decode(const std::string& encoded);

/**
 * @brief Hex string of cryptographically secure random bytes.
 */
Result<std::string> randomHex(std::size_t byteCount);

/**
 * @brief Percent-encodes everything except unreserved characters (A-Z a-z 0-9 - _ . ~).
 *
 * @param encodeSlash When false, '/' is kept, as required for object key paths.
 */
std::string uriEncode(const std::string& text, bool encodeSlash = true);

#endif // CRYPTO_UTIL_HPP
