#include "SftpTransferClient.hpp"

#include "RemotePath.hpp"
#include "StopFlag.hpp"

#include <libssh/libssh.h>
#include <libssh/sftp.h>

#include <fcntl.h>

#include <array>
#include <cstdint>
#include <fstream>
#include <system_error>
#include <utility>

namespace {
constexpr size_t kReadChunkBytes = 32 * 1024;

struct SshSessionDeleter {
    void operator()(ssh_session session) const {
        if (ssh_is_connected(session)) {
            ssh_disconnect(session);
        }
        ssh_free(session);
    }
};

struct SftpSessionDeleter {
    void operator()(sftp_session sftp) const { sftp_free(sftp); }
};

struct SftpAttributesDeleter {
    void operator()(sftp_attributes attributes) const { sftp_attributes_free(attributes); }
};

struct SftpDirDeleter {
    void operator()(sftp_dir dir) const { sftp_closedir(dir); }
};

struct SftpFileDeleter {
    void operator()(sftp_file file) const { sftp_close(file); }
};

struct SshStringDeleter {
    void operator()(char* value) const { ssh_string_free_char(value); }
};

struct SshKeyDeleter {
    void operator()(ssh_key key) const { ssh_key_free(key); }
};

using SshSessionPtr = std::unique_ptr<ssh_session_struct, SshSessionDeleter>;
using SftpSessionPtr = std::unique_ptr<sftp_session_struct, SftpSessionDeleter>;
using SftpAttributesPtr = std::unique_ptr<sftp_attributes_struct, SftpAttributesDeleter>;
using SftpDirPtr = std::unique_ptr<sftp_dir_struct, SftpDirDeleter>;
using SftpFilePtr = std::unique_ptr<sftp_file_struct, SftpFileDeleter>;
using SshKeyPtr = std::unique_ptr<ssh_key_struct, SshKeyDeleter>;
using SshStringPtr = std::unique_ptr<char, SshStringDeleter>;

bool VerifyHostKey(ssh_session session, const SftpSettings& settings, BackupError& outError) {
    if (settings.hostKeyPolicy == HostKeyPolicy::ACCEPT_ANY) {
        return true;
    }

    switch (ssh_session_is_known_server(session)) {
    case SSH_KNOWN_HOSTS_OK:
        return true;
    case SSH_KNOWN_HOSTS_CHANGED:
        outError = {BackupErrorKind::CONNECTION_FAILED, settings.host, "Host key for " + settings.host + " has changed"};
        return false;
    case SSH_KNOWN_HOSTS_OTHER:
        outError = {BackupErrorKind::CONNECTION_FAILED, settings.host, "Host key type for " + settings.host + " does not match known_hosts"};
        return false;
    case SSH_KNOWN_HOSTS_UNKNOWN:
    case SSH_KNOWN_HOSTS_NOT_FOUND:
        outError = {BackupErrorKind::CONNECTION_FAILED, settings.host, "Host key for " + settings.host + " is not trusted"};
        return false;
    case SSH_KNOWN_HOSTS_ERROR:
    default:
        outError = {BackupErrorKind::CONNECTION_FAILED, settings.host, ssh_get_error(session)};
        return false;
    }
}

bool Authenticate(ssh_session session, const SftpSettings& settings, BackupError& outError) {
    const char* passphrase = settings.passphrase.empty() ? nullptr : settings.passphrase.c_str();

    for (const auto& keyPath : settings.clientKeys) {
        ssh_key rawKey = nullptr;
        if (ssh_pki_import_privkey_file(keyPath.c_str(), passphrase, nullptr, nullptr, &rawKey) != SSH_OK) {
            continue;
        }

        SshKeyPtr key(rawKey);
        const int result = ssh_userauth_publickey(session, nullptr, key.get());
        if (result == SSH_AUTH_SUCCESS) {
            return true;
        }
        if (result == SSH_AUTH_ERROR) {
            outError = {BackupErrorKind::CONNECTION_FAILED, settings.host, ssh_get_error(session)};
            return false;
        }
    }

    int result = SSH_AUTH_DENIED;
    if (!settings.password.empty()) {
        result = ssh_userauth_password(session, nullptr, settings.password.c_str());
    } else if (settings.clientKeys.empty()) {
        result = ssh_userauth_publickey_auto(session, nullptr, passphrase);
    }

    if (result == SSH_AUTH_SUCCESS) {
        return true;
    }
    if (result == SSH_AUTH_ERROR) {
        outError = {BackupErrorKind::CONNECTION_FAILED, settings.host, ssh_get_error(session)};
        return false;
    }

    outError = {BackupErrorKind::PERMISSION_DENIED, settings.host, "Authentication failed for user \"" + settings.username + "\""};
    return false;
}

class SftpSession : public TransferSession {
public:
    SftpSession(SftpSessionPtr sftp, ssh_session session)
        : sftp_(std::move(sftp)),
          session_(session) {}

    bool Fetch(
        const std::string& remotePath,
        const std::filesystem::path& localDir,
        bool recursive,
        BackupError& outError) override {
        target_ = remotePath;

        SftpAttributesPtr attributes(sftp_stat(sftp_.get(), remotePath.c_str()));
        if (!attributes) {
            outError = SftpError(remotePath);
            return false;
        }

        const auto localPath = localDir / RemoteBaseName(remotePath);
        return FetchEntry(remotePath, localPath, attributes->type, recursive, outError);
    }

private:
    BackupError SftpError(const std::string& remotePath) const {
        return MapSftpStatus(sftp_get_error(sftp_.get()), target_, remotePath, ssh_get_error(session_));
    }

    bool FetchEntry(
        const std::string& remotePath,
        const std::filesystem::path& localPath,
        uint8_t type,
        bool recursive,
        BackupError& outError) {
        if (StopRequested()) {
            outError = {BackupErrorKind::INTERRUPTED, target_, "Interrupted"};
            return false;
        }

        switch (ClassifyRemoteEntry(type)) {
        case RemoteEntryAction::MIRROR_DIRECTORY:
            if (!recursive) {
                outError = {BackupErrorKind::TRANSFER_FAILED, target_, remotePath + " is a directory"};
                return false;
            }
            return FetchDirectory(remotePath, localPath, outError);
        case RemoteEntryAction::COPY_FILE:
            return FetchFile(remotePath, localPath, outError);
        case RemoteEntryAction::RECREATE_LINK:
            return FetchLink(remotePath, localPath, outError);
        case RemoteEntryAction::SKIP:
            break;
        }
        return true;
    }

    // Links inside a mirrored tree are copied as links, so a link to "." or
    // "/" never pulls in more than the link itself.
    bool FetchLink(const std::string& remotePath, const std::filesystem::path& localPath, BackupError& outError) {
        SshStringPtr linkTarget(sftp_readlink(sftp_.get(), remotePath.c_str()));
        if (!linkTarget) {
            outError = SftpError(remotePath);
            return false;
        }

        std::string linkError;
        if (!RecreateLink(linkTarget.get(), localPath, linkError)) {
            outError = {BackupErrorKind::TRANSFER_FAILED, target_, linkError};
            return false;
        }
        return true;
    }

    bool FetchDirectory(const std::string& remotePath, const std::filesystem::path& localPath, BackupError& outError) {
        std::error_code error;
        std::filesystem::create_directories(localPath, error);
        if (error) {
            outError = {BackupErrorKind::TRANSFER_FAILED, target_, "Cannot create " + localPath.string() + ": " + error.message()};
            return false;
        }

        SftpDirPtr dir(sftp_opendir(sftp_.get(), remotePath.c_str()));
        if (!dir) {
            outError = SftpError(remotePath);
            return false;
        }

        while (true) {
            SftpAttributesPtr entry(sftp_readdir(sftp_.get(), dir.get()));
            if (!entry) {
                break;
            }

            const std::string name = entry->name != nullptr ? entry->name : "";
            if (name.empty() || name == "." || name == "..") {
                continue;
            }

            if (!FetchEntry(JoinRemote(remotePath, name), localPath / name, entry->type, true, outError)) {
                return false;
            }
        }

        if (!sftp_dir_eof(dir.get())) {
            outError = SftpError(remotePath);
            return false;
        }

        return true;
    }

    bool FetchFile(const std::string& remotePath, const std::filesystem::path& localPath, BackupError& outError) {
        SftpFilePtr file(sftp_open(sftp_.get(), remotePath.c_str(), O_RDONLY, 0));
        if (!file) {
            outError = SftpError(remotePath);
            return false;
        }

        std::ofstream output(localPath, std::ios::binary | std::ios::trunc);
        if (!output) {
            outError = {BackupErrorKind::TRANSFER_FAILED, target_, "Cannot write " + localPath.string()};
            return false;
        }

        std::array<char, kReadChunkBytes> buffer{};
        while (true) {
            if (StopRequested()) {
                outError = {BackupErrorKind::INTERRUPTED, target_, "Interrupted"};
                return false;
            }

            const ssize_t bytesRead = sftp_read(file.get(), buffer.data(), buffer.size());
            if (bytesRead == 0) {
                break;
            }
            if (bytesRead < 0) {
                outError = SftpError(remotePath);
                return false;
            }

            output.write(buffer.data(), static_cast<std::streamsize>(bytesRead));
            if (!output) {
                outError = {BackupErrorKind::TRANSFER_FAILED, target_, "Write failed for " + localPath.string()};
                return false;
            }
        }

        return true;
    }

    SftpSessionPtr sftp_;
    ssh_session session_;
    std::string target_;
};

class SshConnection : public TransferConnection {
public:
    SshConnection(SshSessionPtr session, std::string host)
        : session_(std::move(session)),
          host_(std::move(host)) {}

    std::unique_ptr<TransferSession> StartSession(BackupError& outError) override {
        SftpSessionPtr sftp(sftp_new(session_.get()));
        if (!sftp) {
            outError = {BackupErrorKind::CONNECTION_FAILED, host_, ssh_get_error(session_.get())};
            return nullptr;
        }

        if (sftp_init(sftp.get()) != SSH_OK) {
            outError = {BackupErrorKind::CONNECTION_FAILED, host_,
                        "SFTP subsystem unavailable: " + std::string(ssh_get_error(session_.get()))};
            return nullptr;
        }

        return std::make_unique<SftpSession>(std::move(sftp), session_.get());
    }

private:
    SshSessionPtr session_;
    std::string host_;
};
} // namespace

std::unique_ptr<TransferConnection> SftpTransferClient::Connect(const SftpSettings& settings, BackupError& outError) {
    SshSessionPtr session(ssh_new());
    if (!session) {
        outError = {BackupErrorKind::CONNECTION_FAILED, settings.host, "Unable to allocate SSH session"};
        return nullptr;
    }

    const unsigned int port = static_cast<unsigned int>(settings.port);
    const long timeout = settings.connectTimeoutSeconds;
    bool optionsOk = ssh_options_set(session.get(), SSH_OPTIONS_HOST, settings.host.c_str()) == SSH_OK
        && ssh_options_set(session.get(), SSH_OPTIONS_PORT, &port) == SSH_OK
        && ssh_options_set(session.get(), SSH_OPTIONS_TIMEOUT, &timeout) == SSH_OK;
    if (optionsOk && !settings.username.empty()) {
        optionsOk = ssh_options_set(session.get(), SSH_OPTIONS_USER, settings.username.c_str()) == SSH_OK;
    }
    if (optionsOk && settings.hostKeyPolicy == HostKeyPolicy::KNOWN_HOSTS_FILE) {
        optionsOk = ssh_options_set(session.get(), SSH_OPTIONS_KNOWNHOSTS, settings.knownHostsPath.c_str()) == SSH_OK;
    }
    if (!optionsOk) {
        outError = {BackupErrorKind::CONNECTION_FAILED, settings.host, ssh_get_error(session.get())};
        return nullptr;
    }

    if (ssh_connect(session.get()) != SSH_OK) {
        outError = {BackupErrorKind::CONNECTION_FAILED, settings.host, ssh_get_error(session.get())};
        return nullptr;
    }

    if (!VerifyHostKey(session.get(), settings, outError)) {
        return nullptr;
    }

    if (!Authenticate(session.get(), settings, outError)) {
        return nullptr;
    }

    return std::make_unique<SshConnection>(std::move(session), settings.host);
}
