#pragma once

#include "BackupError.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

// Local name for a fetched remote path: its last component, ignoring trailing
// slashes. "/", "." and ".." have no usable name and map to "root".
std::string RemoteBaseName(std::string remotePath);
std::string JoinRemote(const std::string& dir, const std::string& name);

enum class RemoteEntryAction {
    MIRROR_DIRECTORY,
    COPY_FILE,
    RECREATE_LINK,
    SKIP
};

// Maps an SSH_FILEXFER_TYPE_* value to what the mirror does with the entry.
// Links are never followed inside a mirrored tree.
RemoteEntryAction ClassifyRemoteEntry(uint8_t fileType);

// Maps an SSH_FX_* status for remotePath to a BackupError charged to target.
BackupError MapSftpStatus(int status, const std::string& target, const std::string& remotePath, const std::string& sessionMessage);

// Creates localPath as a symlink holding linkTarget verbatim.
bool RecreateLink(const std::string& linkTarget, const std::filesystem::path& localPath, std::string& outError);
