#pragma once

#include "BackupConfig.hpp"
#include "BackupError.hpp"

#include <filesystem>
#include <memory>
#include <string>

class TransferSession {
public:
    virtual ~TransferSession() = default;

    // Copies remotePath into localDir under its base name. Directories are
    // mirrored when recursive is set. Failures carry remotePath as target.
    virtual bool Fetch(
        const std::string& remotePath,
        const std::filesystem::path& localDir,
        bool recursive,
        BackupError& outError) = 0;
};

class TransferConnection {
public:
    virtual ~TransferConnection() = default;

    virtual std::unique_ptr<TransferSession> StartSession(BackupError& outError) = 0;
};

class TransferClient {
public:
    virtual ~TransferClient() = default;

    virtual std::unique_ptr<TransferConnection> Connect(const SftpSettings& settings, BackupError& outError) = 0;
};
