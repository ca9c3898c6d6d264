#include "RetrievalStage.hpp"

#include "Logger.hpp"

RetrievalStage::RetrievalStage(TransferClient& client, Logger& logger)
    : client_(client),
      logger_(logger) {}

bool RetrievalStage::Retrieve(
    const SftpSettings& settings,
    const std::vector<std::string>& remoteTargets,
    const std::filesystem::path& cacheDir,
    BackupError& outError) {
    logger_.Info("Connecting [HOST: " + settings.host + " | PORT: " + std::to_string(settings.port) + "]");

    auto connection = client_.Connect(settings, outError);
    if (!connection) {
        if (!outError.IsSet()) {
            outError = {BackupErrorKind::CONNECTION_FAILED, settings.host, "Connection to " + settings.host + " failed"};
        }
        return false;
    }

    auto session = connection->StartSession(outError);
    if (!session) {
        if (!outError.IsSet()) {
            outError = {BackupErrorKind::CONNECTION_FAILED, settings.host, "Could not start SFTP session"};
        }
        return false;
    }

    logger_.Info("Retrieving data (this might take a while)");

    for (const auto& target : remoteTargets) {
        logger_.Info("Retrieving \"" + target + "\"");

        if (!session->Fetch(target, cacheDir, true, outError)) {
            if (!outError.IsSet()) {
                outError.kind = BackupErrorKind::TRANSFER_FAILED;
                outError.message = "Transfer failed";
            }
            outError.target = target;
            return false;
        }
    }

    return true;
}
