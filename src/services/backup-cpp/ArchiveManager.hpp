#pragma once

#include "BackupError.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

struct ArchiveArtifact {
    std::string generatedName;
    std::filesystem::path stagingPath;
};

class ArchiveManager {
public:
    // Runs a shell command line, returns its exit status and fills output with
    // the combined stdout/stderr of the command.
    using CommandRunner = std::function<int(const std::string& command, std::string& output)>;

    explicit ArchiveManager(std::string executable, CommandRunner runner = CommandRunner());

    bool Build(
        const std::filesystem::path& cacheDir,
        const std::string& baseName,
        std::chrono::system_clock::time_point now,
        ArchiveArtifact& outArtifact,
        BackupError& outError,
        std::string* outToolOutput = nullptr) const;

    bool EnsureExecutable(BackupError& outError) const;

    const std::string& Executable() const { return executable_; }

    static std::string GenerateName(const std::string& baseName, std::chrono::system_clock::time_point time);
    static std::string BuildCompressCommand(
        const std::string& executable,
        const std::filesystem::path& workingDir,
        const std::string& archiveFileName,
        const std::vector<std::string>& inputs);
    static std::string DefaultExecutable(const std::filesystem::path& programDir);
    static std::string QuoteArgument(const std::string& argument);

private:
    int Run(const std::string& command, std::string& output) const;

    std::string executable_;
    CommandRunner runner_;
};
