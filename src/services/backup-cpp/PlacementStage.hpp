#pragma once

#include "ArchiveManager.hpp"
#include "BackupError.hpp"

#include <filesystem>
#include <functional>
#include <string>
#include <system_error>

class Logger;

constexpr int kDefaultRetryLimit = 10;

struct PlacementOutcome {
    std::filesystem::path finalPath;
    // Collisions seen before the archive landed (or before giving up).
    int attempts = 0;
};

// Moves the staged archive into the destination directory without replacing
// anything already there. A taken name is retried as "<name>(1).7z",
// "<name>(2).7z" and so on until retryLimit collisions have been counted.
class PlacementStage {
public:
    // Same contract as std::filesystem::rename with an error_code.
    using RenameFunction = std::function<void(
        const std::filesystem::path& from,
        const std::filesystem::path& to,
        std::error_code& error)>;

    explicit PlacementStage(Logger& logger, RenameFunction rename = RenameFunction());

    bool Place(
        const ArchiveArtifact& artifact,
        const std::filesystem::path& destinationDir,
        int retryLimit,
        PlacementOutcome& outOutcome,
        BackupError& outError);

    static std::string CandidateFileName(const std::string& generatedName, int attempts);
    // Hidden name a cross-device copy is written to before it is renamed into place.
    static std::filesystem::path PartialPath(const std::filesystem::path& destination);

private:
    enum class MoveResult {
        MOVED,
        COLLISION,
        FAILED
    };

    MoveResult MoveWithoutOverwrite(
        const std::filesystem::path& source,
        const std::filesystem::path& destination,
        std::string& outError) const;
    MoveResult CopyIntoPlace(
        const std::filesystem::path& source,
        const std::filesystem::path& destination,
        std::string& outError) const;
    void Rename(const std::filesystem::path& from, const std::filesystem::path& to, std::error_code& error) const;
    void DiscardPartial(const std::filesystem::path& partial) const;

    Logger& logger_;
    RenameFunction rename_;
};
