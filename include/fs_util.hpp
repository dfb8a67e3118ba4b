/**
 * @file fs_util.hpp
 * @brief Filesystem, naming and time helpers shared by the engines.
 */

#ifndef FS_UTIL_HPP
#define FS_UTIL_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "backup_error.hpp"

/**
 * @brief Private temporary directory removed with its contents on destruction.
 */
class TempDir {
public:
    /**
     * @brief Creates a fresh directory under the system temporary directory.
     *
     * @param prefix Directory name prefix.
     * @return Result<TempDir> The directory, or an Io error.
     */
    static Result<TempDir> create(const std::string& prefix);

    TempDir(TempDir&& other) noexcept;
    TempDir& operator=(TempDir&& other) noexcept;
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
    ~TempDir();

    const std::filesystem::path& path() const { return path_; }

    /**
     * @brief Returns path() / name.
     */
    std::filesystem::path file(const std::string& name) const { return path_ / name; }

private:
    explicit TempDir(std::filesystem::path path) : path_(std::move(path)) {}
    void removeAll();

    std::filesystem::path path_;
};

/**
 * @brief Reduces a directory's final component to [A-Za-z0-9._-], other characters become '_'.
 *
 * Trailing separators are ignored. An empty result becomes "root".
 */
std::string sanitizeName(const std::string& directory);

/**
 * @brief Compact UTC timestamp used in archive names: yyyymmddThhmmssmmmZ.
 */
std::string compactUtcTimestamp(std::chrono::system_clock::time_point time);

/**
 * @brief ISO 8601 UTC timestamp with milliseconds: yyyy-mm-ddThh:mm:ss.mmmZ.
 */
std::string isoUtcTimestamp(std::chrono::system_clock::time_point time);

/**
 * @brief Parses the output of isoUtcTimestamp(). Fractional seconds are optional.
 */
std::optional<std::chrono::system_clock::time_point> parseIsoUtcTimestamp(const std::string& text);

/**
 * @brief Expands a leading "~" and $VAR / ${VAR} references. Unset variables expand to "".
 */
std::string expandPath(const std::string& path);

/**
 * @brief Canonical form of a source directory used as configuration and state key.
 *
 * Expands the path, makes it absolute, normalizes it lexically and drops a trailing separator.
 */
std::string normalizeSourcePath(const std::string& path);

/**
 * @brief Human readable byte count ("512 B", "1.50 MB").
 */
std::string formatBytes(std::uintmax_t bytes);

/**
 * @brief Size of a regular file.
 *
 * @return Result<std::uintmax_t> The size, or an Io error naming the file.
 */
Result<std::uintmax_t> regularFileSize(const std::filesystem::path& file);

/**
 * @brief Newest modification time of any entry below directory, including the directory.
 */
std::optional<std::filesystem::file_time_type> newestWriteTime(const std::filesystem::path& directory);

/**
 * @brief Converts a filesystem timestamp to system_clock.
 */
std::chrono::system_clock::time_point toSystemTime(std::filesystem::file_time_type time);

#endif // FS_UTIL_HPP
