#include "PlacementStage.hpp"

#include "Logger.hpp"

#include <utility>

PlacementStage::PlacementStage(Logger& logger, RenameFunction rename)
    : logger_(logger),
      rename_(std::move(rename)) {}

bool PlacementStage::Place(
    const ArchiveArtifact& artifact,
    const std::filesystem::path& destinationDir,
    int retryLimit,
    PlacementOutcome& outOutcome,
    BackupError& outError) {
    outOutcome = PlacementOutcome{};

    if (retryLimit <= 0) {
        outError = {BackupErrorKind::PLACEMENT_FAILED, destinationDir.string(), "Retry limit must be positive"};
        return false;
    }

    std::error_code error;
    if (!std::filesystem::is_directory(destinationDir, error)) {
        outError = {BackupErrorKind::PLACEMENT_FAILED, destinationDir.string(), "Destination is not a directory"};
        return false;
    }

    int attempts = 0;
    while (true) {
        const auto candidate = destinationDir / CandidateFileName(artifact.generatedName, attempts);

        std::string moveError;
        const MoveResult result = MoveWithoutOverwrite(artifact.stagingPath, candidate, moveError);
        if (result == MoveResult::MOVED) {
            outOutcome.finalPath = candidate;
            outOutcome.attempts = attempts;
            return true;
        }

        if (result == MoveResult::FAILED) {
            outOutcome.attempts = attempts;
            outError = {BackupErrorKind::PLACEMENT_FAILED, candidate.string(), moveError};
            return false;
        }

        ++attempts;
        outOutcome.attempts = attempts;
        logger_.Warning("Backup file already exists, adding numbered suffix to filename: " + std::to_string(attempts));

        if (attempts >= retryLimit) {
            outError = {BackupErrorKind::PLACEMENT_EXHAUSTED, destinationDir.string(), std::to_string(retryLimit)};
            return false;
        }
    }
}

std::string PlacementStage::CandidateFileName(const std::string& generatedName, int attempts) {
    if (attempts == 0) {
        return generatedName + ".7z";
    }
    return generatedName + "(" + std::to_string(attempts) + ").7z";
}

std::filesystem::path PlacementStage::PartialPath(const std::filesystem::path& destination) {
    return destination.parent_path() / ("." + destination.filename().string() + ".partial");
}

PlacementStage::MoveResult PlacementStage::MoveWithoutOverwrite(
    const std::filesystem::path& source,
    const std::filesystem::path& destination,
    std::string& outError) const {
    std::error_code error;
    if (std::filesystem::exists(std::filesystem::symlink_status(destination, error))) {
        return MoveResult::COLLISION;
    }

    Rename(source, destination, error);
    if (!error) {
        return MoveResult::MOVED;
    }

    if (error != std::errc::cross_device_link) {
        outError = "Could not move archive: " + error.message();
        return MoveResult::FAILED;
    }

    return CopyIntoPlace(source, destination, outError);
}

// Different filesystem: the copy lands under a hidden name in the destination
// directory and is renamed in only once complete, so a failed copy never
// leaves a truncated archive under a real backup name.
PlacementStage::MoveResult PlacementStage::CopyIntoPlace(
    const std::filesystem::path& source,
    const std::filesystem::path& destination,
    std::string& outError) const {
    const auto partial = PartialPath(destination);

    std::error_code error;
    std::filesystem::copy_file(source, partial, std::filesystem::copy_options::overwrite_existing, error);
    if (error) {
        outError = "Could not copy archive: " + error.message();
        DiscardPartial(partial);
        return MoveResult::FAILED;
    }

    if (std::filesystem::exists(std::filesystem::symlink_status(destination, error))) {
        DiscardPartial(partial);
        return MoveResult::COLLISION;
    }

    Rename(partial, destination, error);
    if (error) {
        outError = "Could not move copied archive into place: " + error.message();
        DiscardPartial(partial);
        return MoveResult::FAILED;
    }

    std::filesystem::remove(source, error);
    if (error) {
        logger_.Warning("Archive copied but staging file could not be removed: " + error.message());
    }

    return MoveResult::MOVED;
}

void PlacementStage::Rename(
    const std::filesystem::path& from,
    const std::filesystem::path& to,
    std::error_code& error) const {
    error.clear();
    if (rename_) {
        rename_(from, to, error);
        return;
    }
    std::filesystem::rename(from, to, error);
}

void PlacementStage::DiscardPartial(const std::filesystem::path& partial) const {
    std::error_code error;
    std::filesystem::remove(partial, error);
    if (error) {
        logger_.Warning("Could not remove partial copy " + partial.string() + ": " + error.message());
    }
}
