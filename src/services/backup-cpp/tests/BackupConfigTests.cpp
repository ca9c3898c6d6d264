#include "BackupConfig.hpp"
#include "TestSupport.hpp"

int main() {
    {
        const std::string text = R"({
            "archive_name": "mc",
            "sftp_config": {
                "host": "backup.example.org",
                "port": 2222,
                "username": "minecraft",
                "client_keys": "/home/mc/.ssh/id_ed25519",
                "known_hosts": null
            },
            "data": ["/srv/world", "/srv/plugins"]
        })";
        BackupConfig config;
        std::string error;
        if (!ParseConfig(text, config, error)) {
            return Fail("Valid config rejected: " + error);
        }
        if (config.archiveBaseName != "mc" || config.sftp.host != "backup.example.org" || config.sftp.port != 2222) {
            return Fail("Config fields were not read.");
        }
        if (config.remoteTargets != std::vector<std::string>{"/srv/world", "/srv/plugins"}) {
            return Fail("Remote targets lost their order.");
        }
        if (config.sftp.clientKeys != std::vector<std::string>{"/home/mc/.ssh/id_ed25519"}) {
            return Fail("A single client key string should become a one-element list.");
        }
        if (config.sftp.hostKeyPolicy != HostKeyPolicy::ACCEPT_ANY) {
            return Fail("known_hosts null should disable host key checking.");
        }
        if (!config.notify.url.empty() || config.tracing.enabled) {
            return Fail("Optional sections should default to disabled.");
        }
    }

    {
        const std::string text = R"({
            "archive_name": "mc",
            "sftp_config": {"host": "h", "client_keys": ["a", "b"], "known_hosts": "/etc/ssh/known"},
            "data": ["/srv"],
            "cache_dir": "/var/tmp/mc-cache",
            "notify": {"url": "http://localhost:8080/report", "api_key": "k"},
            "tracing": {"enabled": true, "endpoint": "http://localhost:4318/v1/traces"}
        })";
        BackupConfig config;
        std::string error;
        if (!ParseConfig(text, config, error)) {
            return Fail("Config with optional sections rejected: " + error);
        }
        if (config.sftp.port != 22 || config.sftp.clientKeys.size() != 2) {
            return Fail("Default port or key list not applied.");
        }
        if (config.sftp.hostKeyPolicy != HostKeyPolicy::KNOWN_HOSTS_FILE || config.sftp.knownHostsPath != "/etc/ssh/known") {
            return Fail("known_hosts path was not kept.");
        }
        if (config.cacheDir != "/var/tmp/mc-cache" || config.notify.apiKey != "k") {
            return Fail("Optional settings were not read.");
        }
        if (!config.tracing.enabled || config.tracing.serviceName != "sftp-backup") {
            return Fail("Tracing settings were not read.");
        }
    }

    {
        BackupConfig config;
        std::string error;
        if (ParseConfig(R"({"sftp_config": {"host": "h"}, "data": ["/a"]})", config, error)
            || error != "Could not extract data from config: 'archive_name'") {
            return Fail("Missing archive_name not reported: " + error);
        }
        if (ParseConfig(R"({"archive_name": "mc", "data": ["/a"]})", config, error)
            || error != "Could not extract data from config: 'sftp_config'") {
            return Fail("Missing sftp_config not reported: " + error);
        }
        if (ParseConfig(R"({"archive_name": "mc", "sftp_config": {"host": "h"}})", config, error)
            || error != "Could not extract data from config: 'data'") {
            return Fail("Missing data not reported: " + error);
        }
        if (ParseConfig(R"({"archive_name": "mc", "sftp_config": {"host": "h", "port": "22"}, "data": ["/a"]})",
                config, error)) {
            return Fail("A string port should be rejected.");
        }
        for (const char* port : {"4294967318", "18446744073709551615", "-65514", "0", "65536"}) {
            const std::string text = std::string(R"({"archive_name": "mc", "sftp_config": {"host": "h", "port": )") + port
                + R"(}, "data": ["/a"]})";
            if (ParseConfig(text, config, error)) {
                return Fail(std::string("Out-of-range port accepted: ") + port);
            }
        }
        if (ParseConfig(R"({"archive_name": "mc", "sftp_config": {"host": "h", "connect_timeout": 4294967306}, "data": ["/a"]})",
                config, error)) {
            return Fail("Out-of-range connect_timeout accepted.");
        }
        if (ParseConfig("{not json", config, error)) {
            return Fail("Malformed JSON should be rejected.");
        }
    }

    {
        ScopedTempDir temp;
        BackupConfig config;
        std::string error;
        const auto missing = (temp.Path() / "config.json").string();
        if (LoadConfig(missing, config, error) || error != missing + " file not found") {
            return Fail("Missing config file not reported: " + error);
        }

        WriteFile(temp.Path() / "config.json", R"({"archive_name": "srv", "sftp_config": {"host": "h"}, "data": ["/x"]})");
        if (!LoadConfig(missing, config, error) || config.archiveBaseName != "srv") {
            return Fail("Config file was not loaded: " + error);
        }
    }

    return 0;
}
