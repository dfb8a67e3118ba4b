/**
 * @file archive.hpp
 * @brief Directory archiving and extraction on top of libarchive.
 *
 * Archives store paths relative to the source directory with forward slashes, so an
 * archive created on one host unpacks into any target directory.
 *
 * @note Requires libarchive. Install via vcpkg on Windows, Homebrew on macOS, or apt on Linux.
 */

#ifndef ARCHIVE_HPP
#define ARCHIVE_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "backup_error.hpp"

class FileSelector;
class Logger;

/**
 * @brief Container format of a backup archive.
 */
enum class ArchiveFormat {
    Tar,    ///< POSIX pax tar, compressed afterwards by the gzip stage.
    Zip     ///< Zip with per-entry deflate, never compressed again.
};

/**
 * @brief File extension without a dot ("tar" or "zip").
 */
std::string archiveExtension(ArchiveFormat format);

/**
 * @brief Parses "tar" or "zip" (case-insensitive).
 */
std::optional<ArchiveFormat> parseArchiveFormat(const std::string& text);

/**
 * @brief Counters reported by archive creation, verification and extraction.
 */
struct ArchiveStats {
    std::size_t files = 0;          ///< Regular files.
    std::size_t directories = 0;    ///< Directory entries.
    std::uintmax_t bytes = 0;       ///< Sum of regular file sizes.
};

/**
 * @brief Writes a directory tree into a single archive file.
 */
class DirectoryArchiver {
public:
    DirectoryArchiver(ArchiveFormat format, const FileSelector& selector, Logger& logger);

    /**
     * @brief Restricts create() to files modified after the given time. Directories are
     * always archived so the tree layout survives.
     */
    void setChangedSince(std::optional<std::chrono::system_clock::time_point> time) { changedSince_ = time; }

    /**
     * @brief Archives sourceDir recursively into outputFile.
     *
     * Files and directories rejected by the selector are skipped, as are entries that cannot
     * be read (logged as warnings). Symbolic links are not followed.
     *
     * @param sourceDir Directory to archive.
     * @param outputFile Archive to create, replaced if present.
     * @param cancel Optional flag checked between entries.
     * @return Result<ArchiveStats> Counters, or an Io, Format or Cancelled error.
     */
    Result<ArchiveStats> create(const std::filesystem::path& sourceDir,
                                const std::filesystem::path& outputFile,
                                const std::atomic<bool>* cancel = nullptr) const;

    /**
     * @brief Reads every header of an archive to prove it is well formed.
     *
     * @return Result<ArchiveStats> Counters of the entries found, or a Format error.
     */
    static Result<ArchiveStats> verify(const std::filesystem::path& archiveFile);

private:
    ArchiveFormat format_;
    const FileSelector& selector_;
    Logger& logger_;
    std::optional<std::chrono::system_clock::time_point> changedSince_;
};

/**
 * @brief Unpacks an archive below a target directory.
 */
class ArchiveExtractor {
public:
    explicit ArchiveExtractor(Logger& logger);

    /**
     * @brief Extracts every entry of archiveFile into targetDir, overwriting existing files.
     *
     * All entry names are checked before anything is written: an archive containing an
     * absolute path or a ".." component is refused as a whole with a Format error.
     *
     * @return Result<ArchiveStats> Counters of extracted entries.
     */
    Result<ArchiveStats> extract(const std::filesystem::path& archiveFile,
                                 const std::filesystem::path& targetDir) const;

    /**
     * @brief Whether an entry name is relative and free of ".." components.
     */
    static bool isSafeEntryName(const std::string& name);

private:
    Logger& logger_;
};

#endif // ARCHIVE_HPP
