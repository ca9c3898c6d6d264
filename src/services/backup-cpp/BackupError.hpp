#pragma once

#include <string>

enum class BackupErrorKind {
    NONE,
    CONFIG,
    CACHE_CREATION,
    NOT_FOUND,
    CONNECTION_FAILED,
    PERMISSION_DENIED,
    TRANSFER_FAILED,
    INTERRUPTED,
    ARCHIVE,
    PLACEMENT_EXHAUSTED,
    PLACEMENT_FAILED
};

struct BackupError {
    BackupErrorKind kind = BackupErrorKind::NONE;
    // Remote target or local path the failure is about, empty when not applicable.
    std::string target;
    std::string message;

    bool IsSet() const { return kind != BackupErrorKind::NONE; }
};

std::string ToString(BackupErrorKind kind);
std::string Describe(const BackupError& error);
