#include "BackupPipeline.hpp"

#include "Logger.hpp"
#include "RetrievalStage.hpp"

#include <utility>

std::string ToString(PipelineState state) {
    switch (state) {
    case PipelineState::IDLE:
        return "IDLE";
    case PipelineState::RETRIEVING:
        return "RETRIEVING";
    case PipelineState::ARCHIVING:
        return "ARCHIVING";
    case PipelineState::PLACING:
        return "PLACING";
    case PipelineState::SUCCEEDED:
        return "SUCCEEDED";
    case PipelineState::FAILED:
        return "FAILED";
    }
    return "UNKNOWN";
}

BackupPipeline::BackupPipeline(TransferClient& client, ArchiveManager& archive, Logger& logger)
    : client_(client),
      archive_(archive),
      logger_(logger) {}

PipelineResult BackupPipeline::Run(const BackupConfig& config, const PipelineOptions& options) {
    state_ = PipelineState::IDLE;

    PipelineResult result;
    auto runSpan = Tracer::Instance().StartRun(config.archiveBaseName);
    Tracer::Instance().SetAttribute(runSpan, "backup.target_count", static_cast<int64_t>(config.remoteTargets.size()));
    result.traceparent = runSpan.traceparent;

    CacheArea cache(options.cacheDir);
    if (!cache.Create(result.error)) {
        logger_.Error(Describe(result.error));
        state_ = PipelineState::FAILED;
        result.state = state_;
        Tracer::Instance().SetAttribute(runSpan, "backup.error_kind", ToString(result.error.kind));
        Tracer::Instance().EndSpan(runSpan, false);
        return result;
    }

    const bool stagesOk = RunStages(cache, config, options, runSpan, result);
    if (stagesOk) {
        Transition(PipelineState::SUCCEEDED);
    } else {
        result.failedDuring = state_;
        logger_.Error(Describe(result.error));
        Transition(PipelineState::FAILED);
    }
    result.state = state_;

    logger_.Info("Clearing cache");
    BackupError cleanupError;
    if (!cache.Destroy(cleanupError)) {
        logger_.Warning(Describe(cleanupError));
    }

    if (!stagesOk) {
        Tracer::Instance().SetAttribute(runSpan, "backup.error_kind", ToString(result.error.kind));
    }
    Tracer::Instance().EndSpan(runSpan, stagesOk);
    return result;
}

bool BackupPipeline::RunStages(
    const CacheArea& cache,
    const BackupConfig& config,
    const PipelineOptions& options,
    SpanHandle& runSpan,
    PipelineResult& result) {
    Transition(PipelineState::RETRIEVING);
    {
        auto span = Tracer::Instance().StartStage(runSpan, "backup.retrieve");
        RetrievalStage retrieval(client_, logger_);
        const bool retrieved = retrieval.Retrieve(config.sftp, config.remoteTargets, cache.Path(), result.error);
        Tracer::Instance().EndSpan(span, retrieved);
        if (!retrieved) {
            return false;
        }
    }

    Transition(PipelineState::ARCHIVING);
    ArchiveArtifact artifact;
    {
        logger_.Info("Creating archive");
        auto span = Tracer::Instance().StartStage(runSpan, "backup.archive");
        const auto now = options.clock ? options.clock() : SystemNow();
        std::string toolOutput;
        const bool built = archive_.Build(cache.Path(), config.archiveBaseName, now, artifact, result.error, &toolOutput);
        if (!toolOutput.empty()) {
            logger_.Debug("Archiver output:\n" + toolOutput);
        }
        Tracer::Instance().SetAttribute(span, "backup.archive_name", artifact.generatedName);
        Tracer::Instance().EndSpan(span, built);
        if (!built) {
            return false;
        }
        result.archiveName = artifact.generatedName;
    }

    Transition(PipelineState::PLACING);
    {
        logger_.Info("Moving backup");
        auto span = Tracer::Instance().StartStage(runSpan, "backup.place");
        PlacementStage placement(logger_);
        PlacementOutcome outcome;
        const bool placed = placement.Place(artifact, options.destinationDir, options.retryLimit, outcome, result.error);
        result.placementAttempts = outcome.attempts;
        Tracer::Instance().SetAttribute(span, "backup.placement_attempts", static_cast<int64_t>(outcome.attempts));
        if (placed) {
            result.finalPath = outcome.finalPath;
            Tracer::Instance().SetAttribute(span, "backup.final_path", outcome.finalPath.string());
        }
        Tracer::Instance().EndSpan(span, placed);
        return placed;
    }
}

void BackupPipeline::Transition(PipelineState next) {
    logger_.Debug("Pipeline " + ToString(state_) + " -> " + ToString(next));
    state_ = next;
}
