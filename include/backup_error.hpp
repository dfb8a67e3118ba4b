/**
 * @file backup_error.hpp
 * @brief Error model shared by every ReStore component.
 *
 * Operations report failures through std::expected carrying a BackupError. The error kind
 * tells callers how to react (fix configuration, retry later, ask for a new password), the
 * stage names the pipeline step that failed.
 */

#ifndef BACKUP_ERROR_HPP
#define BACKUP_ERROR_HPP

#include <string>
#include <expected>
#include <utility>

/**
 * @brief Categories of failure surfaced by storage adapters and engines.
 */
enum class ErrorKind {
    Configuration,          ///< Missing or invalid option, unknown backend name.
    NotFound,               ///< Remote object or local source does not exist.
    Transfer,               ///< Network or remote service failure.
    Authentication,         ///< Wrong password or tampered ciphertext.
    UnsupportedOperation,   ///< Backend lacks the requested capability.
    StateCorruption,        ///< Persisted state could not be parsed.
    Format,                 ///< Malformed archive or encrypted header.
    InvalidArgument,        ///< Caller supplied a path or value that is not allowed.
    Io,                     ///< Local filesystem failure.
    Cancelled               ///< Operation stopped by a cancellation request.
};

/**
 * @brief Returns a stable, human readable name for an error kind.
 */
const char* errorKindName(ErrorKind kind);

/**
 * @brief Typed error value returned by all fallible operations.
 */
struct BackupError {
    ErrorKind kind;         ///< Failure category.
    std::string message;    ///< Description, never contains secrets.
    std::string stage;      ///< Pipeline stage ("archive", "upload", ...), empty if not staged.

    /**
     * @brief Returns a copy of this error tagged with a pipeline stage.
     *
     * An existing stage is kept so the innermost stage wins.
     */
    BackupError atStage(const std::string& stageName) const;

    /**
     * @brief Formats the error as "Kind[ at stage]: message".
     */
    std::string describe() const;
};

template <typename T>
using Result = std::expected<T, BackupError>;

/**
 * @brief Convenience constructor for an unexpected BackupError.
 */
inline std::unexpected<BackupError> makeError(ErrorKind kind, std::string message) {
    return std::unexpected(BackupError{kind, std::move(message), {}});
}

#endif // BACKUP_ERROR_HPP
