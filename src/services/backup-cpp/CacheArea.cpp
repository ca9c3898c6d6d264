#include "CacheArea.hpp"

#include <fstream>
#include <iostream>
#include <system_error>
#include <utility>

namespace {
bool ProbeWritable(const std::filesystem::path& dir) {
    const auto probePath = dir / ".write-probe";
    {
        std::ofstream probe(probePath, std::ios::binary | std::ios::trunc);
        if (!probe) {
            return false;
        }
    }

    std::error_code error;
    std::filesystem::remove(probePath, error);
    return !error;
}
} // namespace

CacheArea::CacheArea(std::filesystem::path baseDir)
    : path_(std::move(baseDir)) {}

CacheArea::~CacheArea() {
    if (!Exists()) {
        return;
    }

    BackupError error;
    if (!Destroy(error)) {
        std::cerr << "[Cache] " << error.message << std::endl;
    }
}

bool CacheArea::Create(BackupError& outError) {
    if (created_) {
        outError = {BackupErrorKind::CACHE_CREATION, path_.string(), "Cache area already created for this run"};
        return false;
    }

    std::error_code error;
    const auto status = std::filesystem::symlink_status(path_, error);
    if (std::filesystem::exists(status)) {
        if (!std::filesystem::is_directory(status)) {
            outError = {BackupErrorKind::CACHE_CREATION, path_.string(), "Cache path exists and is not a directory"};
            return false;
        }

        const bool empty = std::filesystem::is_empty(path_, error);
        if (error) {
            outError = {BackupErrorKind::CACHE_CREATION, path_.string(), "Cache path is not readable: " + error.message()};
            return false;
        }
        if (!empty) {
            outError = {BackupErrorKind::CACHE_CREATION, path_.string(), "Cache path contains leftovers from an earlier run"};
            return false;
        }
    } else {
        std::filesystem::create_directories(path_, error);
        if (error) {
            outError = {BackupErrorKind::CACHE_CREATION, path_.string(), "Could not create cache: " + error.message()};
            return false;
        }
    }

    created_ = true;

    if (!ProbeWritable(path_)) {
        outError = {BackupErrorKind::CACHE_CREATION, path_.string(), "Cache path is not writable"};
        BackupError cleanupError;
        if (!Destroy(cleanupError)) {
            outError.message += "; " + cleanupError.message;
        }
        return false;
    }

    return true;
}

bool CacheArea::Destroy(BackupError& outError) {
    if (!Exists()) {
        return true;
    }

    destroyed_ = true;

    std::error_code error;
    std::filesystem::remove_all(path_, error);
    if (error) {
        outError = {BackupErrorKind::CACHE_CREATION, path_.string(), "Could not clear cache: " + error.message()};
        return false;
    }

    return true;
}
