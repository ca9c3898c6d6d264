#include "ArchiveManager.hpp"

#include "TimeFormat.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <sstream>
#include <system_error>
#include <utility>

#ifndef _WIN32
#include <sys/wait.h>
#endif

namespace {
constexpr size_t kMaxDiagnosticChars = 512;

std::string Tail(const std::string& text) {
    if (text.size() <= kMaxDiagnosticChars) {
        return text;
    }
    return text.substr(text.size() - kMaxDiagnosticChars);
}

bool HasPathSeparator(const std::string& value) {
    return value.find('/') != std::string::npos || value.find('\\') != std::string::npos;
}
} // namespace

ArchiveManager::ArchiveManager(std::string executable, CommandRunner runner)
    : executable_(std::move(executable)),
      runner_(std::move(runner)) {}

bool ArchiveManager::Build(
    const std::filesystem::path& cacheDir,
    const std::string& baseName,
    std::chrono::system_clock::time_point now,
    ArchiveArtifact& outArtifact,
    BackupError& outError,
    std::string* outToolOutput) const {
    if (cacheDir.empty() || baseName.empty() || executable_.empty()) {
        outError = {BackupErrorKind::ARCHIVE, cacheDir.string(), "Archive inputs are incomplete"};
        return false;
    }

    std::vector<std::string> inputs;
    try {
        for (const auto& entry : std::filesystem::directory_iterator(cacheDir)) {
            inputs.push_back(entry.path().filename().string());
        }
    } catch (const std::filesystem::filesystem_error& ex) {
        outError = {BackupErrorKind::ARCHIVE, cacheDir.string(), std::string("Cannot list cache: ") + ex.what()};
        return false;
    }
    std::sort(inputs.begin(), inputs.end());

    if (inputs.empty()) {
        outError = {BackupErrorKind::ARCHIVE, cacheDir.string(), "Nothing was retrieved to archive"};
        return false;
    }

    if (!EnsureExecutable(outError)) {
        return false;
    }

    const std::string generatedName = GenerateName(baseName, now);
    const std::string archiveFileName = generatedName + ".7z";
    const std::string command = BuildCompressCommand(executable_, cacheDir, archiveFileName, inputs);

    std::string output;
    const int status = Run(command, output);
    if (outToolOutput != nullptr) {
        *outToolOutput = output;
    }

    if (status != 0) {
        std::ostringstream message;
        message << "Archiver exited with status " << status;
        const std::string tail = Tail(output);
        if (!tail.empty()) {
            message << ": " << tail;
        }
        outError = {BackupErrorKind::ARCHIVE, archiveFileName, message.str()};
        return false;
    }

    const auto stagingPath = cacheDir / archiveFileName;
    std::error_code error;
    if (!std::filesystem::is_regular_file(stagingPath, error)) {
        outError = {BackupErrorKind::ARCHIVE, archiveFileName, "Archiver reported success but produced no archive"};
        return false;
    }

    outArtifact.generatedName = generatedName;
    outArtifact.stagingPath = stagingPath;
    return true;
}

bool ArchiveManager::EnsureExecutable(BackupError& outError) const {
#ifdef _WIN32
    (void)outError;
    return true;
#else
    if (!HasPathSeparator(executable_)) {
        return true;
    }

    std::error_code error;
    if (!std::filesystem::is_regular_file(executable_, error)) {
        outError = {BackupErrorKind::ARCHIVE, executable_, "Archiver executable not found"};
        return false;
    }

    std::filesystem::permissions(
        executable_,
        std::filesystem::perms::owner_exec | std::filesystem::perms::group_exec | std::filesystem::perms::others_exec,
        std::filesystem::perm_options::add,
        error);
    if (error) {
        outError = {BackupErrorKind::ARCHIVE, executable_, "Cannot mark archiver executable: " + error.message()};
        return false;
    }
    return true;
#endif
}

std::string ArchiveManager::GenerateName(const std::string& baseName, std::chrono::system_clock::time_point time) {
    return baseName + "-" + FormatLocalTime(time, "%d.%m.%y-%H%M");
}

std::string ArchiveManager::BuildCompressCommand(
    const std::string& executable,
    const std::filesystem::path& workingDir,
    const std::string& archiveFileName,
    const std::vector<std::string>& inputs) {
    if (executable.empty() || workingDir.empty() || archiveFileName.empty() || inputs.empty()) {
        return {};
    }

    std::ostringstream command;
#ifdef _WIN32
    command << "cd /d " << QuoteArgument(workingDir.string()) << " && ";
#else
    command << "cd " << QuoteArgument(workingDir.string()) << " && ";
#endif
    // -snl stores links as links. Inputs are anchored at "./" so a name such as
    // "-sdel" or "@list" is never read as a switch or a list file.
    command << QuoteArgument(executable) << " a -t7z -snl " << QuoteArgument(archiveFileName);
    for (const auto& input : inputs) {
        command << ' ' << QuoteArgument("./" + input);
    }
    return command.str();
}

std::string ArchiveManager::DefaultExecutable(const std::filesystem::path& programDir) {
#ifdef _WIN32
    const auto bundled = programDir / "7z" / "win" / "7za.exe";
#else
    const auto bundled = programDir / "7z" / "linux" / "7zz";
#endif
    std::error_code error;
    if (!programDir.empty() && std::filesystem::is_regular_file(bundled, error)) {
        return bundled.string();
    }
    return "7z";
}

std::string ArchiveManager::QuoteArgument(const std::string& argument) {
#ifdef _WIN32
    return "\"" + argument + "\"";
#else
    std::string quoted = "'";
    for (char ch : argument) {
        if (ch == '\'') {
            quoted += "'\\''";
        } else {
            quoted += ch;
        }
    }
    quoted += "'";
    return quoted;
#endif
}

int ArchiveManager::Run(const std::string& command, std::string& output) const {
    output.clear();
    if (runner_) {
        return runner_(command, output);
    }

    const std::string redirected = command + " 2>&1";
#ifdef _WIN32
    FILE* pipe = _popen(redirected.c_str(), "r");
#else
    FILE* pipe = popen(redirected.c_str(), "r");
#endif
    if (pipe == nullptr) {
        output = "Unable to start archiver";
        return -1;
    }

    std::array<char, 4096> buffer{};
    size_t bytesRead = 0;
    while ((bytesRead = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        output.append(buffer.data(), bytesRead);
    }

#ifdef _WIN32
    return _pclose(pipe);
#else
    const int status = pclose(pipe);
    if (status == -1) {
        return -1;
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return -1;
#endif
}
