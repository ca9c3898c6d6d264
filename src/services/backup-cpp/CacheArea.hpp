#pragma once

#include "BackupError.hpp"

#include <filesystem>

// Ephemeral staging directory for one backup run.
//
// Create() refuses a path that is a file or a directory with leftover content,
// so every run starts from an empty staging area. Destroy() removes the tree and
// is safe to call more than once; the destructor calls it for any path that
// never reached an explicit Destroy().
class CacheArea {
public:
    explicit CacheArea(std::filesystem::path baseDir);
    ~CacheArea();

    CacheArea(const CacheArea&) = delete;
    CacheArea& operator=(const CacheArea&) = delete;

    bool Create(BackupError& outError);
    bool Destroy(BackupError& outError);

    const std::filesystem::path& Path() const { return path_; }
    bool Exists() const { return created_ && !destroyed_; }

private:
    std::filesystem::path path_;
    bool created_ = false;
    bool destroyed_ = false;
};
