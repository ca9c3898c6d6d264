#pragma once

#include "TransferClient.hpp"

// libssh implementation of the transfer capability.
//
// A session returned by StartSession() borrows the connection's SSH session and
// must be destroyed before the connection that created it.
class SftpTransferClient : public TransferClient {
public:
    std::unique_ptr<TransferConnection> Connect(const SftpSettings& settings, BackupError& outError) override;
};
