#pragma once

#include <string>
#include <vector>

enum class HostKeyPolicy {
    DEFAULT_KNOWN_HOSTS,
    KNOWN_HOSTS_FILE,
    ACCEPT_ANY
};

// Connection parameters handed to the transfer client as-is.
struct SftpSettings {
    std::string host;
    int port = 22;
    std::string username;
    std::string password;
    std::vector<std::string> clientKeys;
    std::string passphrase;
    HostKeyPolicy hostKeyPolicy = HostKeyPolicy::DEFAULT_KNOWN_HOSTS;
    std::string knownHostsPath;
    long connectTimeoutSeconds = 10;
};

struct NotifySettings {
    std::string url;
    std::string apiKey;
};

struct TraceSettings {
    bool enabled = false;
    std::string endpoint;
    std::string serviceName;
};

struct BackupConfig {
    std::string archiveBaseName;
    SftpSettings sftp;
    std::vector<std::string> remoteTargets;
    std::string cacheDir;
    std::string archiver;
    NotifySettings notify;
    TraceSettings tracing;
};

bool ParseConfig(const std::string& text, BackupConfig& outConfig, std::string& outError);
bool LoadConfig(const std::string& path, BackupConfig& outConfig, std::string& outError);
