#include "encryption.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <algorithm>
#include <array>
#include <filesystem>
#include <fstream>
#include <memory>
#include <vector>

namespace fs = std::filesystem;

namespace {

const char kMagic[4] = {'R', 'S', 'T', 'E'};
const unsigned char kVersion = 1;
const std::size_t kKeySize = 32;
const std::size_t kChunkSize = 64 * 1024;

using CipherContext = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

/**
 * @brief Derived key wiped from memory when it goes out of scope.
 */
struct DerivedKey {
    std::array<unsigned char, kKeySize> bytes{};
    ~DerivedKey() { OPENSSL_cleanse(bytes.data(), bytes.size()); }
};

bool deriveKey(const std::string& password, const unsigned char* salt, std::uint32_t iterations, DerivedKey& key) {
    return PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()), salt, static_cast<int>(FileEncryptor::kSaltSize),
                             static_cast<int>(iterations), EVP_sha256(), static_cast<int>(key.bytes.size()),
                             key.bytes.data()) == 1;
}

void removeQuietly(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
}

} // namespace

FileEncryptor::FileEncryptor(std::uint32_t iterations) : iterations_(iterations == 0 ? kDefaultIterations : iterations) {}

Result<void> FileEncryptor::encrypt(const std::string& inputFile, const std::string& outputFile, const std::string& password) const {
    if (password.empty()) {
        return makeError(ErrorKind::Configuration, "Encryption requires a non-empty password");
    }
    std::ifstream in(inputFile, std::ios::binary);
    if (!in) {
        return makeError(ErrorKind::Io, "Failed to open file for encryption: " + inputFile);
    }

    std::array<unsigned char, kHeaderSize> header{};
    std::copy(kMagic, kMagic + 4, header.begin());
    header[4] = kVersion;
    header[5] = static_cast<unsigned char>(iterations_ >> 24);
    header[6] = static_cast<unsigned char>(iterations_ >> 16);
    header[7] = static_cast<unsigned char>(iterations_ >> 8);
    header[8] = static_cast<unsigned char>(iterations_);
    unsigned char* salt = header.data() + 9;
    unsigned char* iv = salt + kSaltSize;
    if (RAND_bytes(salt, static_cast<int>(kSaltSize)) != 1 || RAND_bytes(iv, static_cast<int>(kIvSize)) != 1) {
        return makeError(ErrorKind::Io, "Failed to generate random salt and IV");
    }

    DerivedKey key;
    if (!deriveKey(password, salt, iterations_, key)) {
        return makeError(ErrorKind::Io, "Key derivation failed");
    }

    CipherContext ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    int len = 0;
    if (!ctx || EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kIvSize), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.bytes.data(), iv) != 1 ||
        EVP_EncryptUpdate(ctx.get(), nullptr, &len, header.data(), static_cast<int>(header.size())) != 1) {
        return makeError(ErrorKind::Io, "Failed to initialize AES-256-GCM");
    }

    std::ofstream out(outputFile, std::ios::binary | std::ios::trunc);
    if (!out) {
        return makeError(ErrorKind::Io, "Failed to create encrypted file: " + outputFile);
    }
    out.write(reinterpret_cast<const char*>(header.data()), static_cast<std::streamsize>(header.size()));

    std::vector<unsigned char> plain(kChunkSize);
    std::vector<unsigned char> cipher(kChunkSize + 16);
    while (in) {
        in.read(reinterpret_cast<char*>(plain.data()), static_cast<std::streamsize>(plain.size()));
        auto count = in.gcount();
        if (count <= 0) {
            break;
        }
        if (EVP_EncryptUpdate(ctx.get(), cipher.data(), &len, plain.data(), static_cast<int>(count)) != 1) {
            out.close();
            removeQuietly(outputFile);
            return makeError(ErrorKind::Io, "Encryption failed for " + inputFile);
        }
        out.write(reinterpret_cast<const char*>(cipher.data()), len);
    }
    OPENSSL_cleanse(plain.data(), plain.size());
    if (in.bad()) {
        out.close();
        removeQuietly(outputFile);
        return makeError(ErrorKind::Io, "Failed to read " + inputFile);
    }

    std::array<unsigned char, kTagSize> tag{};
    if (EVP_EncryptFinal_ex(ctx.get(), cipher.data(), &len) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagSize), tag.data()) != 1) {
        out.close();
        removeQuietly(outputFile);
        return makeError(ErrorKind::Io, "Encryption failed for " + inputFile);
    }
    out.write(reinterpret_cast<const char*>(cipher.data()), len);
    out.write(reinterpret_cast<const char*>(tag.data()), static_cast<std::streamsize>(tag.size()));
    out.close();
    if (!out) {
        removeQuietly(outputFile);
        return makeError(ErrorKind::Io, "Failed to write encrypted file: " + outputFile);
    }
    return {};
}

Result<void> FileEncryptor::decrypt(const std::string& inputFile, const std::string& outputFile, const std::string& password) const {
    std::error_code ec;
    auto total = fs::file_size(inputFile, ec);
    if (ec) {
        return makeError(ErrorKind::Io, "Failed to open encrypted file: " + inputFile);
    }
    if (total < kHeaderSize + kTagSize) {
        return makeError(ErrorKind::Format, "Encrypted file is truncated: " + inputFile);
    }
    std::ifstream in(inputFile, std::ios::binary);
    if (!in) {
        return makeError(ErrorKind::Io, "Failed to open encrypted file: " + inputFile);
    }

    std::array<unsigned char, kHeaderSize> header{};
    in.read(reinterpret_cast<char*>(header.data()), static_cast<std::streamsize>(header.size()));
    if (!in || !std::equal(kMagic, kMagic + 4, header.begin())) {
        return makeError(ErrorKind::Format, "Not a ReStore encrypted file: " + inputFile);
    }
    if (header[4] != kVersion) {
        return makeError(ErrorKind::Format, "Unsupported encryption format version " + std::to_string(header[4]));
    }
    std::uint32_t iterations = (static_cast<std::uint32_t>(header[5]) << 24) | (static_cast<std::uint32_t>(header[6]) << 16) |
                               (static_cast<std::uint32_t>(header[7]) << 8) | static_cast<std::uint32_t>(header[8]);
    if (iterations == 0 || iterations > 10000000) {
        return makeError(ErrorKind::Format, "Invalid key derivation iteration count in " + inputFile);
    }
    const unsigned char* salt = header.data() + 9;
    const unsigned char* iv = salt + kSaltSize;

    std::array<unsigned char, kTagSize> tag{};
    in.seekg(static_cast<std::streamoff>(total - kTagSize));
    in.read(reinterpret_cast<char*>(tag.data()), static_cast<std::streamsize>(tag.size()));
    in.seekg(static_cast<std::streamoff>(kHeaderSize));
    if (!in) {
        return makeError(ErrorKind::Format, "Failed to read authentication tag from " + inputFile);
    }

    DerivedKey key;
    if (!deriveKey(password, salt, iterations, key)) {
        return makeError(ErrorKind::Io, "Key derivation failed");
    }

    CipherContext ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    int len = 0;
    if (!ctx || EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kIvSize), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.bytes.data(), iv) != 1 ||
        EVP_DecryptUpdate(ctx.get(), nullptr, &len, header.data(), static_cast<int>(header.size())) != 1) {
        return makeError(ErrorKind::Io, "Failed to initialize AES-256-GCM");
    }

    std::ofstream out(outputFile, std::ios::binary | std::ios::trunc);
    if (!out) {
        return makeError(ErrorKind::Io, "Failed to create decrypted file: " + outputFile);
    }
    auto fail = [&](ErrorKind kind, const std::string& message) -> Result<void> {
        out.close();
        removeQuietly(outputFile);
        return makeError(kind, message);
    };

    std::uintmax_t remaining = total - kHeaderSize - kTagSize;
    std::vector<unsigned char> cipher(kChunkSize);
    std::vector<unsigned char> plain(kChunkSize + 16);
    while (remaining > 0) {
        auto want = static_cast<std::streamsize>(std::min<std::uintmax_t>(remaining, cipher.size()));
        in.read(reinterpret_cast<char*>(cipher.data()), want);
        if (in.gcount() != want) {
            return fail(ErrorKind::Format, "Encrypted file is truncated: " + inputFile);
        }
        if (EVP_DecryptUpdate(ctx.get(), plain.data(), &len, cipher.data(), static_cast<int>(want)) != 1) {
            return fail(ErrorKind::Authentication, "Decryption failed. Invalid password or corrupted data.");
        }
        out.write(reinterpret_cast<const char*>(plain.data()), len);
        remaining -= static_cast<std::uintmax_t>(want);
    }

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagSize), tag.data()) != 1 ||
        EVP_DecryptFinal_ex(ctx.get(), plain.data(), &len) != 1) {
        return fail(ErrorKind::Authentication, "Decryption failed. Invalid password or corrupted data.");
    }
    out.write(reinterpret_cast<const char*>(plain.data()), len);
    out.close();
    if (!out) {
        removeQuietly(outputFile);
        return makeError(ErrorKind::Io, "Failed to write decrypted file: " + outputFile);
    }
    return {};
}
