#include "backup_error.hpp"

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Configuration: return "ConfigurationError";
        case ErrorKind::NotFound: return "NotFoundError";
        case ErrorKind::Transfer: return "TransferError";
        case ErrorKind::Authentication: return "AuthenticationError";
        case ErrorKind::UnsupportedOperation: return "UnsupportedOperationError";
        case ErrorKind::StateCorruption: return "StateCorruptionError";
        case ErrorKind::Format: return "FormatError";
        case ErrorKind::InvalidArgument: return "InvalidArgumentError";
        case ErrorKind::Io: return "IoError";
        case ErrorKind::Cancelled: return "CancelledError";
    }
    return "UnknownError";
}

BackupError BackupError::atStage(const std::string& stageName) const {
    BackupError copy = *this;
    if (copy.stage.empty()) {
        copy.stage = stageName;
    }
    return copy;
}

std::string BackupError::describe() const {
    std::string text = errorKindName(kind);
    if (!stage.empty()) {
        text += " at " + stage;
    }
    text += ": " + message;
    return text;
}
