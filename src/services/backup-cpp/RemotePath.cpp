#include "RemotePath.hpp"

#include <libssh/sftp.h>

#include <system_error>

std::string RemoteBaseName(std::string remotePath) {
    while (remotePath.size() > 1 && remotePath.back() == '/') {
        remotePath.pop_back();
    }

    const auto slash = remotePath.find_last_of('/');
    std::string name = slash == std::string::npos ? remotePath : remotePath.substr(slash + 1);
    if (name.empty() || name == "." || name == "..") {
        return "root";
    }
    return name;
}

std::string JoinRemote(const std::string& dir, const std::string& name) {
    if (dir.empty()) {
        return name;
    }
    if (dir.back() == '/') {
        return dir + name;
    }
    return dir + "/" + name;
}

RemoteEntryAction ClassifyRemoteEntry(uint8_t fileType) {
    switch (fileType) {
    case SSH_FILEXFER_TYPE_DIRECTORY:
        return RemoteEntryAction::MIRROR_DIRECTORY;
    case SSH_FILEXFER_TYPE_REGULAR:
        return RemoteEntryAction::COPY_FILE;
    case SSH_FILEXFER_TYPE_SYMLINK:
        return RemoteEntryAction::RECREATE_LINK;
    default:
        // Sockets, devices and other special files are not copied.
        return RemoteEntryAction::SKIP;
    }
}

BackupError MapSftpStatus(int status, const std::string& target, const std::string& remotePath, const std::string& sessionMessage) {
    switch (status) {
    case SSH_FX_NO_SUCH_FILE:
    case SSH_FX_NO_SUCH_PATH:
        return {BackupErrorKind::NOT_FOUND, target, "No such file: " + remotePath};
    case SSH_FX_PERMISSION_DENIED:
        return {BackupErrorKind::TRANSFER_FAILED, target, "Permission denied reading " + remotePath};
    default:
        return {BackupErrorKind::TRANSFER_FAILED, target, sessionMessage.empty() ? "Transfer of " + remotePath + " failed" : sessionMessage};
    }
}

bool RecreateLink(const std::string& linkTarget, const std::filesystem::path& localPath, std::string& outError) {
    if (linkTarget.empty()) {
        outError = "Empty link target for " + localPath.string();
        return false;
    }

    std::error_code error;
    std::filesystem::create_symlink(linkTarget, localPath, error);
    if (error) {
        outError = "Cannot create link " + localPath.string() + ": " + error.message();
        return false;
    }
    return true;
}
