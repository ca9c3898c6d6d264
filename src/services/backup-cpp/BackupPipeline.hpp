#pragma once

#include "ArchiveManager.hpp"
#include "BackupConfig.hpp"
#include "BackupError.hpp"
#include "CacheArea.hpp"
#include "PlacementStage.hpp"
#include "TimeFormat.hpp"
#include "Tracing.hpp"
#include "TransferClient.hpp"

#include <filesystem>
#include <string>

class Logger;

enum class PipelineState {
    IDLE,
    RETRIEVING,
    ARCHIVING,
    PLACING,
    SUCCEEDED,
    FAILED
};

std::string ToString(PipelineState state);

struct PipelineOptions {
    std::filesystem::path cacheDir;
    std::filesystem::path destinationDir;
    int retryLimit = kDefaultRetryLimit;
    Clock clock;
};

struct PipelineResult {
    PipelineState state = PipelineState::IDLE;
    // Last state entered before FAILED, IDLE when cache creation failed.
    PipelineState failedDuring = PipelineState::IDLE;
    BackupError error;
    std::string archiveName;
    std::filesystem::path finalPath;
    int placementAttempts = 0;
    std::string traceparent;

    bool Succeeded() const { return state == PipelineState::SUCCEEDED; }
};

// Runs one backup: create cache, retrieve, archive, place, clear cache. Every
// path out of Run() goes through the same cleanup, so the cache area is removed
// exactly once whatever stage failed.
class BackupPipeline {
public:
    BackupPipeline(TransferClient& client, ArchiveManager& archive, Logger& logger);

    PipelineResult Run(const BackupConfig& config, const PipelineOptions& options);

    PipelineState State() const { return state_; }

private:
    bool RunStages(
        const CacheArea& cache,
        const BackupConfig& config,
        const PipelineOptions& options,
        SpanHandle& runSpan,
        PipelineResult& result);
    void Transition(PipelineState next);

    TransferClient& client_;
    ArchiveManager& archive_;
    Logger& logger_;
    PipelineState state_ = PipelineState::IDLE;
};
