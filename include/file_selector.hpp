/**
 * @file file_selector.hpp
 * @brief Rules deciding which files and directories enter a backup.
 */

#ifndef FILE_SELECTOR_HPP
#define FILE_SELECTOR_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

class Logger;

/**
 * @brief Exclusion settings, usually taken from BackupConfig.
 */
struct FileSelectionRules {
    std::vector<std::string> excludedPatterns;  ///< Filename wildcards ('*', '?'), case-insensitive.
    std::vector<std::string> excludedPaths;     ///< Files or directory trees to skip.
    std::uintmax_t maxFileSizeMB = 100;         ///< Larger files are skipped. 0 disables the limit.
    bool skipHidden = true;                     ///< Skip dot-files and dot-directories.
};

/**
 * @brief Applies FileSelectionRules to paths met while walking a source tree.
 */
class FileSelector {
public:
    FileSelector(FileSelectionRules rules, Logger& logger);

    /**
     * @brief Whether a regular file of the given size should be archived.
     */
    bool includeFile(const std::filesystem::path& path, std::uintmax_t size) const;

    /**
     * @brief Whether the walk should descend into a directory.
     */
    bool includeDirectory(const std::filesystem::path& path) const;

    /**
     * @brief Case-insensitive match of a whole name against a '*' / '?' pattern.
     */
    static bool wildcardMatch(const std::string& name, const std::string& pattern);

    const FileSelectionRules& rules() const { return rules_; }

private:
    bool underExcludedPath(const std::filesystem::path& path) const;

    FileSelectionRules rules_;
    std::vector<std::filesystem::path> excludedRoots_;  ///< Normalized absolute excludedPaths.
    Logger& logger_;
};

#endif // FILE_SELECTOR_HPP
