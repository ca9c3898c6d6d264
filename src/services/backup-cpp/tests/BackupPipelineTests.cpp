#include "BackupPipeline.hpp"
#include "Logger.hpp"
#include "TestSupport.hpp"

#include <sstream>

namespace {
BackupConfig MakeConfig() {
    BackupConfig config;
    config.archiveBaseName = "mc";
    config.sftp.host = "mc.example.org";
    config.remoteTargets = {"world"};
    return config;
}

PipelineOptions MakeOptions(const ScopedTempDir& temp, int retryLimit = kDefaultRetryLimit) {
    PipelineOptions options;
    options.cacheDir = temp.Path() / "cache";
    options.destinationDir = temp.Path() / "dest";
    options.retryLimit = retryLimit;
    options.clock = FixedNoon;
    return options;
}

// Stands in for 7z: writes the archive the command asks for into the cache.
ArchiveManager::CommandRunner FakeArchiver(const std::filesystem::path& cacheDir, int& calls) {
    return [cacheDir, &calls](const std::string&, std::string& output) {
        ++calls;
        WriteFile(cacheDir / (ArchiveManager::GenerateName("mc", FixedNoon()) + ".7z"), "archive");
        output = "Everything is Ok";
        return 0;
    };
}
} // namespace

int main() {
    const std::string expectedName = "mc-01.01.25-1200";

    {
        ScopedTempDir temp;
        const auto options = MakeOptions(temp);
        std::filesystem::create_directories(options.destinationDir);
        std::ostringstream out;
        std::ostringstream err;
        Logger logger("test", out, err, false);
        FakeTransferClient client;
        int archiverCalls = 0;
        ArchiveManager archive("7z", FakeArchiver(options.cacheDir, archiverCalls));
        BackupPipeline pipeline(client, archive, logger);

        const PipelineResult first = pipeline.Run(MakeConfig(), options);
        if (!first.Succeeded() || pipeline.State() != PipelineState::SUCCEEDED) {
            return Fail("First run should succeed: " + Describe(first.error));
        }
        if (first.finalPath != options.destinationDir / (expectedName + ".7z") || first.archiveName != expectedName) {
            return Fail("Unexpected final path: " + first.finalPath.string());
        }
        if (std::filesystem::exists(options.cacheDir)) {
            return Fail("Cache must be removed after a successful run.");
        }
        if (archiverCalls != 1 || CountEntries(options.destinationDir) != 1) {
            return Fail("Expected exactly one archive per run.");
        }
        if (out.str().find("Clearing cache") == std::string::npos) {
            return Fail("Cleanup was not reported.");
        }

        const PipelineResult second = pipeline.Run(MakeConfig(), options);
        if (!second.Succeeded()) {
            return Fail("Second run should succeed: " + Describe(second.error));
        }
        if (second.finalPath != options.destinationDir / (expectedName + "(1).7z") || second.placementAttempts != 1) {
            return Fail("Second run should land on the (1) suffix: " + second.finalPath.string());
        }
        if (std::filesystem::exists(options.cacheDir) || CountEntries(options.destinationDir) != 2) {
            return Fail("Second run left the cache behind or lost an archive.");
        }
    }

    {
        ScopedTempDir temp;
        const auto options = MakeOptions(temp);
        std::filesystem::create_directories(options.destinationDir);
        std::ostringstream out;
        std::ostringstream err;
        Logger logger("test", out, err, false);
        FakeTransferClient client;
        client.connectError = {BackupErrorKind::CONNECTION_FAILED, "mc.example.org", "Name or service not known"};
        int archiverCalls = 0;
        ArchiveManager archive("7z", FakeArchiver(options.cacheDir, archiverCalls));
        BackupPipeline pipeline(client, archive, logger);

        const PipelineResult result = pipeline.Run(MakeConfig(), options);
        if (result.state != PipelineState::FAILED || result.failedDuring != PipelineState::RETRIEVING) {
            return Fail("Unreachable host should fail during retrieval.");
        }
        if (result.error.kind != BackupErrorKind::CONNECTION_FAILED) {
            return Fail("Expected a connection-class error.");
        }
        if (std::filesystem::exists(options.cacheDir) || CountEntries(options.destinationDir) != 0 || archiverCalls != 0) {
            return Fail("Failed retrieval must clear the cache and leave the destination untouched.");
        }
        if (err.str().find("Connection error: Name or service not known") == std::string::npos) {
            return Fail("Connection failure diagnostic missing.");
        }
    }

    {
        ScopedTempDir temp;
        const auto options = MakeOptions(temp);
        std::filesystem::create_directories(options.destinationDir);
        std::ostringstream out;
        std::ostringstream err;
        Logger logger("test", out, err, false);
        FakeTransferClient client;
        client.missing.insert("plugins");
        int archiverCalls = 0;
        ArchiveManager archive("7z", FakeArchiver(options.cacheDir, archiverCalls));
        BackupPipeline pipeline(client, archive, logger);

        BackupConfig config = MakeConfig();
        config.remoteTargets = {"world", "plugins", "logs"};
        const PipelineResult result = pipeline.Run(config, options);
        if (result.Succeeded() || result.error.kind != BackupErrorKind::NOT_FOUND || result.error.target != "plugins") {
            return Fail("Missing target should fail the run naming it.");
        }
        if (std::filesystem::exists(options.cacheDir) || archiverCalls != 0) {
            return Fail("Missing target must clear the cache before archiving.");
        }
    }

    {
        ScopedTempDir temp;
        const auto options = MakeOptions(temp);
        std::filesystem::create_directories(options.destinationDir);
        std::ostringstream out;
        std::ostringstream err;
        Logger logger("test", out, err, false);
        FakeTransferClient client;
        client.requestStopAfter = "world";
        int archiverCalls = 0;
        ArchiveManager archive("7z", FakeArchiver(options.cacheDir, archiverCalls));
        BackupPipeline pipeline(client, archive, logger);

        BackupConfig config = MakeConfig();
        config.remoteTargets = {"world", "plugins"};
        const PipelineResult result = pipeline.Run(config, options);
        const bool stopSeen = StopRequested();
        ResetStop();

        if (!stopSeen) {
            return Fail("Stop flag was not raised during retrieval.");
        }
        if (result.state != PipelineState::FAILED || result.failedDuring != PipelineState::RETRIEVING
            || result.error.kind != BackupErrorKind::INTERRUPTED || result.error.target != "plugins") {
            return Fail("Interrupted retrieval should fail naming the target in progress.");
        }
        if (client.counters.fetched != std::vector<std::string>{"world"} || archiverCalls != 0) {
            return Fail("Nothing may be fetched or archived after the stop request.");
        }
        if (std::filesystem::exists(options.cacheDir) || CountEntries(options.destinationDir) != 0) {
            return Fail("Interrupted run must clear the cache and leave the destination untouched.");
        }
        if (err.str().find("Interrupted while processing \"plugins\"") == std::string::npos) {
            return Fail("Interruption diagnostic missing.");
        }
    }

    {
        ScopedTempDir temp;
        const auto options = MakeOptions(temp);
        std::filesystem::create_directories(options.destinationDir);
        std::ostringstream out;
        std::ostringstream err;
        Logger logger("test", out, err, false);
        FakeTransferClient client;
        ArchiveManager archive("7z", [](const std::string&, std::string& output) {
            output = "ERROR: unsupported";
            return 7;
        });
        BackupPipeline pipeline(client, archive, logger);

        const PipelineResult result = pipeline.Run(MakeConfig(), options);
        if (result.Succeeded() || result.error.kind != BackupErrorKind::ARCHIVE
            || result.failedDuring != PipelineState::ARCHIVING) {
            return Fail("Archiver failure should fail the run during archiving.");
        }
        if (std::filesystem::exists(options.cacheDir) || CountEntries(options.destinationDir) != 0) {
            return Fail("Archive failure must clear the cache and leave the destination untouched.");
        }
    }

    {
        ScopedTempDir temp;
        const auto options = MakeOptions(temp, 2);
        std::filesystem::create_directories(options.destinationDir);
        WriteFile(options.destinationDir / (expectedName + ".7z"), "old");
        WriteFile(options.destinationDir / (expectedName + "(1).7z"), "old");
        std::ostringstream out;
        std::ostringstream err;
        Logger logger("test", out, err, false);
        FakeTransferClient client;
        int archiverCalls = 0;
        ArchiveManager archive("7z", FakeArchiver(options.cacheDir, archiverCalls));
        BackupPipeline pipeline(client, archive, logger);

        const PipelineResult result = pipeline.Run(MakeConfig(), options);
        if (result.Succeeded() || result.error.kind != BackupErrorKind::PLACEMENT_EXHAUSTED
            || result.failedDuring != PipelineState::PLACING || result.placementAttempts != 2) {
            return Fail("Full destination should exhaust placement.");
        }
        if (std::filesystem::exists(options.cacheDir) || CountEntries(options.destinationDir) != 2) {
            return Fail("Exhausted placement must clear the cache without writing.");
        }
        if (err.str().find("Amount of numbered suffix limit reached: 2") == std::string::npos) {
            return Fail("Exhaustion diagnostic missing.");
        }
    }

    {
        ScopedTempDir temp;
        auto options = MakeOptions(temp);
        WriteFile(options.cacheDir, "not a directory");
        std::filesystem::create_directories(options.destinationDir);
        std::ostringstream out;
        std::ostringstream err;
        Logger logger("test", out, err, false);
        FakeTransferClient client;
        int archiverCalls = 0;
        ArchiveManager archive("7z", FakeArchiver(options.cacheDir, archiverCalls));
        BackupPipeline pipeline(client, archive, logger);

        const PipelineResult result = pipeline.Run(MakeConfig(), options);
        if (result.Succeeded() || result.error.kind != BackupErrorKind::CACHE_CREATION
            || result.failedDuring != PipelineState::IDLE) {
            return Fail("Blocked cache path should fail before retrieval.");
        }
        if (client.counters.connects != 0 || !std::filesystem::is_regular_file(options.cacheDir)) {
            return Fail("Cache creation failure must not connect or touch the blocking file.");
        }
    }

    return 0;
}
