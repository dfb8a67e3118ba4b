#include "crypto_util.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <cstdint>
#include <fstream>
#include <memory>
#include <vector>

namespace {

using MdContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

const char kHexDigits[] = "0123456789abcdef";
const char kBase64Alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int base64Value(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

} // namespace

std::string sha256Hex(const std::string& data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest);
    return toHex(std::string(reinterpret_cast<const char*>(digest), sizeof(digest)));
}

Result<std::string> sha256FileHex(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return makeError(ErrorKind::Io, "Failed to open file for hashing: " + path);
    }

    MdContext ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return makeError(ErrorKind::Io, "Failed to initialize SHA-256 context");
    }

    std::vector<char> buf(64 * 1024);
    while (file) {
        file.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        if (file.gcount() > 0 && EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<size_t>(file.gcount())) != 1) {
            return makeError(ErrorKind::Io, "SHA-256 update failed for " + path);
        }
    }
    if (file.bad()) {
        return makeError(ErrorKind::Io, "Failed to read file for hashing: " + path);
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &digestLen) != 1) {
        return makeError(ErrorKind::Io, "SHA-256 finalization failed for " + path);
    }
    return toHex(std::string(reinterpret_cast<const char*>(digest), digestLen));
}

std::string hmacSha256(const std::string& key, const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest, &digestLen);
    return std::string(reinterpret_cast<const char*>(digest), digestLen);
}

std::string toHex(const std::string& bytes) {
    std::string hex;
    hex.reserve(bytes.size() * 2);
    for (unsigned char c : bytes) {
        hex += kHexDigits[c >> 4];
        hex += kHexDigits[c & 0x0f];
    }
    return hex;
}

std::string base64Encode(const std::string& bytes) {
    std::string out;
    out.reserve((bytes.size() + 2) / 3 * 4);
    size_t i = 0;
    while (i + 2 < bytes.size()) {
        uint32_t n = (static_cast<unsigned char>(bytes[i]) << 16) |
                     (static_cast<unsigned char>(bytes[i + 1]) << 8) |
                     static_cast<unsigned char>(bytes[i + 2]);
        out += kBase64Alphabet[(n >> 18) & 0x3f];
        out += kBase64Alphabet[(n >> 12) & 0x3f];
        out += kBase64Alphabet[(n >> 6) & 0x3f];
        out += kBase64Alphabet[n & 0x3f];
        i += 3;
    }
    size_t rest = bytes.size() - i;
    if (rest == 1) {
        uint32_t n = static_cast<unsigned char>(bytes[i]) << 16;
        out += kBase64Alphabet[(n >> 18) & 0x3f];
        out += kBase64Alphabet[(n >> 12) & 0x3f];
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (static_cast<unsigned char>(bytes[i]) << 16) |
                     (static_cast<unsigned char>(bytes[i + 1]) << 8);
        out += kBase64Alphabet[(n >> 18) & 0x3f];
        out += kBase64Alphabet[(n >> 12) & 0x3f];
        out += kBase64Alphabet[(n >> 6) & 0x3f];
        out += '=';
    }
    return out;
}

std::optional<std::string> base64Decode(const std::string& encoded) {
    std::string out;
    uint32_t buffer = 0;
    int bits = 0;
    size_t padding = 0;
    for (char c : encoded) {
        if (c == ' ' || c == '\n' || c == '\r' || c == '\t') {
            continue;
        }
        if (c == '=') {
            ++padding;
            continue;
        }
        if (padding > 0) {
            return std::nullopt;
        }
        int value = base64Value(c);
        if (value < 0) {
            return std::nullopt;
        }
        buffer = (buffer << 6) | static_cast<uint32_t>(value);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out += static_cast<char>((buffer >> bits) & 0xff);
        }
    }
    if (padding > 2) {
        return std::nullopt;
    }
    return out;
}

Result<std::string> randomHex(std::size_t byteCount) {
    std::string bytes(byteCount, '\0');
    if (RAND_bytes(reinterpret_cast<unsigned char*>(bytes.data()), static_cast<int>(byteCount)) != 1) {
        return makeError(ErrorKind::Io, "Secure random generator failed");
    }
    return toHex(bytes);
}

std::string uriEncode(const std::string& text, bool encodeSlash) {
    std::string out;
    out.reserve(text.size() * 3);
    for (unsigned char c : text) {
        bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                          c == '-' || c == '_' || c == '.' || c == '~';
        if (unreserved || (c == '/' && !encodeSlash)) {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += "0123456789ABCDEF"[c >> 4];
            out += "0123456789ABCDEF"[c & 0x0f];
        }
    }
    return out;
}
