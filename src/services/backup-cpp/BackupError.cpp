#include "BackupError.hpp"

std::string ToString(BackupErrorKind kind) {
    switch (kind) {
    case BackupErrorKind::NONE:
        return "NONE";
    case BackupErrorKind::CONFIG:
        return "CONFIG";
    case BackupErrorKind::CACHE_CREATION:
        return "CACHE_CREATION";
    case BackupErrorKind::NOT_FOUND:
        return "NOT_FOUND";
    case BackupErrorKind::CONNECTION_FAILED:
        return "CONNECTION_FAILED";
    case BackupErrorKind::PERMISSION_DENIED:
        return "PERMISSION_DENIED";
    case BackupErrorKind::TRANSFER_FAILED:
        return "TRANSFER_FAILED";
    case BackupErrorKind::INTERRUPTED:
        return "INTERRUPTED";
    case BackupErrorKind::ARCHIVE:
        return "ARCHIVE";
    case BackupErrorKind::PLACEMENT_EXHAUSTED:
        return "PLACEMENT_EXHAUSTED";
    case BackupErrorKind::PLACEMENT_FAILED:
        return "PLACEMENT_FAILED";
    }

    return "UNKNOWN";
}

std::string Describe(const BackupError& error) {
    switch (error.kind) {
    case BackupErrorKind::NONE:
        return {};
    case BackupErrorKind::NOT_FOUND:
        return "No such file/path: \"" + error.target + "\"";
    case BackupErrorKind::TRANSFER_FAILED:
        return "Could not finish data retrieval of \"" + error.target + "\": " + error.message;
    case BackupErrorKind::CONNECTION_FAILED:
        return "Connection error: " + error.message;
    case BackupErrorKind::PERMISSION_DENIED:
        return "Permission denied: " + error.message;
    case BackupErrorKind::INTERRUPTED:
        return "Interrupted while processing \"" + error.target + "\"";
    case BackupErrorKind::PLACEMENT_EXHAUSTED:
        return "Amount of numbered suffix limit reached: " + error.message;
    default:
        break;
    }

    if (error.target.empty()) {
        return error.message;
    }
    return error.message + " (" + error.target + ")";
}
