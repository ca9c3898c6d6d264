#include "ArchiveManager.hpp"
#include "BackupConfig.hpp"
#include "BackupPipeline.hpp"
#include "CommandLine.hpp"
#include "Logger.hpp"
#include "NotificationClient.hpp"
#include "SftpTransferClient.hpp"
#include "StopFlag.hpp"
#include "Tracing.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

namespace {
const char* const kBanner = R"(
            _____ ______ _______ _____     ____             _
           / ____|  ____|__   __|  __ \   |  _ \           | |
  ______  | (___ | |__     | |  | |__) |  | |_) | __ _  ___| | ___   _ _ __    ______
 |______|  \___ \|  __|    | |  |  ___/   |  _ < / _` |/ __| |/ / | | | '_ \  |______|
           ____) | |       | |  | |       | |_) | (_| | (__|   <| |_| | |_) |
          |_____/|_|       |_|  |_|       |____/ \__,_|\___|_|\_\\__,_| .__/
                                                                      | |
                                                                      |_|
 v1.0.0
)";

std::filesystem::path DetectProgramDir(const char* argv0) {
    std::error_code error;
#ifndef _WIN32
    const auto self = std::filesystem::read_symlink("/proc/self/exe", error);
    if (!error && !self.empty()) {
        return self.parent_path();
    }
    error.clear();
#endif
    if (argv0 == nullptr) {
        return {};
    }

    const auto absolute = std::filesystem::absolute(argv0, error);
    if (error) {
        return {};
    }
    return absolute.parent_path();
}

std::filesystem::path ResolveAgainst(const std::filesystem::path& base, const std::string& value, const char* fallback) {
    const std::filesystem::path path = value.empty() ? std::filesystem::path(fallback) : std::filesystem::path(value);
    if (path.is_absolute()) {
        return path;
    }
    return base / path;
}
} // namespace

int main(int argc, char** argv) {
    std::cout << kBanner << std::endl;

    CommandLineOptions options;
    std::string argumentError;
    const bool argumentsOk = ParseCommandLine(argc, argv, options, argumentError);

    std::error_code cwdError;
    const auto workingDir = std::filesystem::current_path(cwdError);
    if (cwdError) {
        std::cerr << "[Backup] Cannot determine working directory: " << cwdError.message() << std::endl;
        return 1;
    }

    const bool color = options.color && IsTerminal(std::cout) && IsTerminal(std::cerr);
    Logger logger("SFTP-Backup", std::cout, std::cerr, color);

    if (argumentsOk && options.help) {
        std::cout << UsageText(argc > 0 ? argv[0] : "sftp-backup");
        return 0;
    }

    const auto logDir = ResolveAgainst(workingDir, options.logDir, "logs");
    if (!logger.OpenFile(logDir / Logger::BuildLogFileName(std::chrono::system_clock::now()))) {
        logger.Warning("Continuing without a log file");
    }

    if (!argumentsOk) {
        logger.Error(argumentError);
        return 1;
    }

    BackupConfig config;
    std::string configError;
    if (!LoadConfig(options.configPath, config, configError)) {
        logger.Error(configError);
        return 1;
    }

    std::error_code destinationError;
    const std::filesystem::path destinationDir = options.destinationDir;
    if (!std::filesystem::is_directory(destinationDir, destinationError)) {
        logger.Error("Output directory does not exist: " + options.destinationDir);
        return 1;
    }

    Tracer::Instance().Configure(config.tracing);
    InstallStopHandlers();

    const std::string archiver = config.archiver.empty()
        ? ArchiveManager::DefaultExecutable(DetectProgramDir(argc > 0 ? argv[0] : nullptr))
        : config.archiver;

    SftpTransferClient transferClient;
    ArchiveManager archiveManager(archiver);
    BackupPipeline pipeline(transferClient, archiveManager, logger);

    PipelineOptions pipelineOptions;
    pipelineOptions.cacheDir = ResolveAgainst(workingDir, config.cacheDir, "cache");
    pipelineOptions.destinationDir = destinationDir;
    pipelineOptions.retryLimit = options.retryLimit;
    pipelineOptions.clock = SystemNow;

    const PipelineResult result = pipeline.Run(config, pipelineOptions);

    NotificationClient notifier(config.notify, logger);
    if (notifier.Enabled() && !notifier.SendRunReport(BuildRunReport(config.archiveBaseName, result))) {
        logger.Warning("Run report could not be delivered to " + config.notify.url);
    }

    Tracer::Instance().Shutdown();

    if (!result.Succeeded()) {
        return 1;
    }

    std::cout << "\nFinished!\nBackup saved: \"" << result.finalPath.string() << "\"\n" << std::endl;
    logger.Info("Backup saved: \"" + result.finalPath.string() + "\"");
    return 0;
}
