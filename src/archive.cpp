#include "archive.hpp"
#include "file_selector.hpp"
#include "logger.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <memory>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace {

using ReadArchive = std::unique_ptr<struct archive, decltype(&archive_read_free)>;
using WriteArchive = std::unique_ptr<struct archive, decltype(&archive_write_free)>;
using Entry = std::unique_ptr<struct archive_entry, decltype(&archive_entry_free)>;

std::string archiveError(struct archive* a) {
    const char* message = archive_error_string(a);
    return message ? message : "unknown libarchive error";
}

Result<ReadArchive> openForReading(const fs::path& archiveFile) {
    ReadArchive reader(archive_read_new(), archive_read_free);
    if (!reader) {
        return makeError(ErrorKind::Io, "Failed to allocate archive reader");
    }
    archive_read_support_filter_all(reader.get());
    archive_read_support_format_all(reader.get());
    if (archive_read_open_filename(reader.get(), archiveFile.c_str(), 10240) != ARCHIVE_OK) {
        return makeError(ErrorKind::Format, "Failed to open archive " + archiveFile.string() + " (error: " +
                                            archiveError(reader.get()) + ")");
    }
    return reader;
}

std::chrono::system_clock::time_point modificationTime(const struct stat& st) {
    auto sinceEpoch = std::chrono::seconds(st.st_mtim.tv_sec) + std::chrono::nanoseconds(st.st_mtim.tv_nsec);
    return std::chrono::system_clock::time_point(std::chrono::duration_cast<std::chrono::system_clock::duration>(sinceEpoch));
}

} // namespace

std::string archiveExtension(ArchiveFormat format) {
    return format == ArchiveFormat::Zip ? "zip" : "tar";
}

std::optional<ArchiveFormat> parseArchiveFormat(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    if (lower == "tar") {
        return ArchiveFormat::Tar;
    }
    if (lower == "zip") {
        return ArchiveFormat::Zip;
    }
    return std::nullopt;
}

DirectoryArchiver::DirectoryArchiver(ArchiveFormat format, const FileSelector& selector, Logger& logger)
    : format_(format), selector_(selector), logger_(logger) {}

Result<ArchiveStats> DirectoryArchiver::create(const fs::path& sourceDir, const fs::path& outputFile,
                                               const std::atomic<bool>* cancel) const {
    if (!fs::is_directory(sourceDir)) {
        return makeError(ErrorKind::NotFound, "Source directory does not exist: " + sourceDir.string());
    }

    WriteArchive writer(archive_write_new(), archive_write_free);
    if (!writer) {
        return makeError(ErrorKind::Io, "Failed to allocate archive writer");
    }
    if (format_ == ArchiveFormat::Zip) {
        archive_write_set_format_zip(writer.get());
    } else {
        archive_write_set_format_pax_restricted(writer.get());
    }
    if (archive_write_open_filename(writer.get(), outputFile.c_str()) != ARCHIVE_OK) {
        return makeError(ErrorKind::Io, "Failed to open archive file: " + outputFile.string() + " (error: " +
                                        archiveError(writer.get()) + ")");
    }

    ArchiveStats stats;
    std::error_code ec;
    auto it = fs::recursive_directory_iterator(sourceDir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return makeError(ErrorKind::Io, "Failed to access directory " + sourceDir.string() + ": " + ec.message());
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            logger_.warning("Failed to access directory entry under " + sourceDir.string() + ": " + ec.message());
            ec.clear();
            continue;
        }
        if (cancel && cancel->load()) {
            return makeError(ErrorKind::Cancelled, "Archiving of " + sourceDir.string() + " was cancelled");
        }

        const fs::path& path = it->path();
        std::error_code typeEc;
        if (it->is_symlink(typeEc)) {
            logger_.debug("Skipping symbolic link: " + path.string());
            continue;
        }
        bool isDirectory = it->is_directory(typeEc);
        if (isDirectory && !selector_.includeDirectory(path)) {
            it.disable_recursion_pending();
            continue;
        }
        if (!isDirectory && !it->is_regular_file(typeEc)) {
            continue;
        }

        struct stat st {};
        if (::lstat(path.c_str(), &st) != 0) {
            logger_.warning("Failed to stat " + path.string() + " (error: " + std::strerror(errno) + "), skipping");
            continue;
        }
        if (!isDirectory && !selector_.includeFile(path, static_cast<std::uintmax_t>(st.st_size))) {
            continue;
        }
        if (!isDirectory && changedSince_ && modificationTime(st) <= *changedSince_) {
            continue;
        }

        std::string name = path.lexically_relative(sourceDir).generic_string();
        std::ifstream file;
        if (!isDirectory) {
            file.open(path, std::ios::binary);
            if (!file) {
                logger_.warning("Failed to open file: " + path.string() + " (error: " + std::strerror(errno) + "), skipping");
                continue;
            }
        }

        Entry entry(archive_entry_new(), archive_entry_free);
        archive_entry_copy_stat(entry.get(), &st);
        archive_entry_set_pathname(entry.get(), name.c_str());
        int status = archive_write_header(writer.get(), entry.get());
        if (status < ARCHIVE_WARN) {
            return makeError(ErrorKind::Io, "Failed to write archive header for " + name + " (error: " +
                                            archiveError(writer.get()) + ")");
        }
        if (isDirectory) {
            ++stats.directories;
            continue;
        }

        char buf[8192];
        while (file) {
            file.read(buf, sizeof(buf));
            auto count = file.gcount();
            if (count > 0 && archive_write_data(writer.get(), buf, static_cast<size_t>(count)) < 0) {
                return makeError(ErrorKind::Io, "Failed to write archive data for " + name + " (error: " +
                                                archiveError(writer.get()) + ")");
            }
        }
        ++stats.files;
        stats.bytes += static_cast<std::uintmax_t>(st.st_size);
    }

    if (archive_write_close(writer.get()) != ARCHIVE_OK) {
        return makeError(ErrorKind::Io, "Failed to finalize archive " + outputFile.string() + " (error: " +
                                        archiveError(writer.get()) + ")");
    }
    return stats;
}

Result<ArchiveStats> DirectoryArchiver::verify(const fs::path& archiveFile) {
    auto reader = openForReading(archiveFile);
    if (!reader) {
        return std::unexpected(reader.error());
    }

    ArchiveStats stats;
    struct archive_entry* entry = nullptr;
    int status;
    while ((status = archive_read_next_header(reader->get(), &entry)) == ARCHIVE_OK || status == ARCHIVE_WARN) {
        if (archive_entry_filetype(entry) == AE_IFDIR) {
            ++stats.directories;
        } else {
            ++stats.files;
            stats.bytes += static_cast<std::uintmax_t>(archive_entry_size(entry));
        }
        if (archive_read_data_skip(reader->get()) != ARCHIVE_OK) {
            return makeError(ErrorKind::Format, "Corrupt archive data in " + archiveFile.string() + " (error: " +
                                                archiveError(reader->get()) + ")");
        }
    }
    if (status != ARCHIVE_EOF) {
        return makeError(ErrorKind::Format, "Corrupt archive " + archiveFile.string() + " (error: " +
                                            archiveError(reader->get()) + ")");
    }
    return stats;
}

ArchiveExtractor::ArchiveExtractor(Logger& logger) : logger_(logger) {}

bool ArchiveExtractor::isSafeEntryName(const std::string& name) {
    if (name.empty() || name.front() == '/' || name.front() == '\\') {
        return false;
    }
    if (name.size() > 1 && name[1] == ':') {
        return false;
    }
    size_t start = 0;
    while (start <= name.size()) {
        size_t end = name.find_first_of("/\\", start);
        std::string part = name.substr(start, end == std::string::npos ? std::string::npos : end - start);
        if (part == "..") {
            return false;
        }
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
    return true;
}

Result<ArchiveStats> ArchiveExtractor::extract(const fs::path& archiveFile, const fs::path& targetDir) const {
    {
        auto scan = openForReading(archiveFile);
        if (!scan) {
            return std::unexpected(scan.error());
        }
        struct archive_entry* entry = nullptr;
        int status;
        while ((status = archive_read_next_header(scan->get(), &entry)) == ARCHIVE_OK || status == ARCHIVE_WARN) {
            const char* name = archive_entry_pathname(entry);
            const char* link = archive_entry_hardlink(entry);
            if (!name || !isSafeEntryName(name) || (link && !isSafeEntryName(link))) {
                return makeError(ErrorKind::Format, std::string("Archive entry escapes the target directory: ") +
                                                    (name ? name : "<unnamed>"));
            }
            archive_read_data_skip(scan->get());
        }
        if (status != ARCHIVE_EOF) {
            return makeError(ErrorKind::Format, "Corrupt archive " + archiveFile.string() + " (error: " +
                                                archiveError(scan->get()) + ")");
        }
    }

    std::error_code ec;
    fs::create_directories(targetDir, ec);
    if (ec) {
        return makeError(ErrorKind::Io, "Failed to create target directory " + targetDir.string() + ": " + ec.message());
    }

    auto reader = openForReading(archiveFile);
    if (!reader) {
        return std::unexpected(reader.error());
    }
    WriteArchive disk(archive_write_disk_new(), archive_write_free);
    if (!disk) {
        return makeError(ErrorKind::Io, "Failed to allocate disk writer");
    }
    archive_write_disk_set_options(disk.get(), ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM |
                                               ARCHIVE_EXTRACT_SECURE_NODOTDOT | ARCHIVE_EXTRACT_SECURE_SYMLINKS |
                                               ARCHIVE_EXTRACT_UNLINK);
    archive_write_disk_set_standard_lookup(disk.get());

    ArchiveStats stats;
    struct archive_entry* entry = nullptr;
    int status;
    while ((status = archive_read_next_header(reader->get(), &entry)) == ARCHIVE_OK || status == ARCHIVE_WARN) {
        std::string name = archive_entry_pathname(entry);
        std::string destination = (targetDir / name).string();
        archive_entry_set_pathname(entry, destination.c_str());
        if (const char* link = archive_entry_hardlink(entry)) {
            std::string linkDestination = (targetDir / link).string();
            archive_entry_set_hardlink(entry, linkDestination.c_str());
        }

        if (archive_write_header(disk.get(), entry) < ARCHIVE_WARN) {
            return makeError(ErrorKind::Io, "Failed to create " + destination + " (error: " + archiveError(disk.get()) + ")");
        }
        const void* block = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;
        int readStatus;
        while ((readStatus = archive_read_data_block(reader->get(), &block, &size, &offset)) == ARCHIVE_OK) {
            if (archive_write_data_block(disk.get(), block, size, offset) < ARCHIVE_OK) {
                return makeError(ErrorKind::Io, "Failed to write " + destination + " (error: " + archiveError(disk.get()) + ")");
            }
        }
        if (readStatus != ARCHIVE_EOF) {
            return makeError(ErrorKind::Format, "Corrupt archive data for " + name + " (error: " +
                                                archiveError(reader->get()) + ")");
        }
        if (archive_write_finish_entry(disk.get()) < ARCHIVE_WARN) {
            return makeError(ErrorKind::Io, "Failed to finish " + destination + " (error: " + archiveError(disk.get()) + ")");
        }

        if (archive_entry_filetype(entry) == AE_IFDIR) {
            ++stats.directories;
        } else {
            ++stats.files;
            stats.bytes += static_cast<std::uintmax_t>(archive_entry_size(entry));
        }
        logger_.debug("Restored: " + name);
    }
    if (status != ARCHIVE_EOF) {
        return makeError(ErrorKind::Format, "Corrupt archive " + archiveFile.string() + " (error: " +
                                            archiveError(reader->get()) + ")");
    }
    if (archive_write_close(disk.get()) != ARCHIVE_OK) {
        return makeError(ErrorKind::Io, "Failed to finalize extraction into " + targetDir.string());
    }
    return stats;
}
