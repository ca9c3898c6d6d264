#pragma once

#include "BackupConfig.hpp"
#include "BackupError.hpp"
#include "TransferClient.hpp"

#include <filesystem>
#include <string>
#include <vector>

class Logger;

class RetrievalStage {
public:
    RetrievalStage(TransferClient& client, Logger& logger);

    // One connection and one session for the whole batch. Targets are fetched in
    // order and the first failure ends the stage with that target in outError.
    bool Retrieve(
        const SftpSettings& settings,
        const std::vector<std::string>& remoteTargets,
        const std::filesystem::path& cacheDir,
        BackupError& outError);

private:
    TransferClient& client_;
    Logger& logger_;
};
