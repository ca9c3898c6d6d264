#include "BackupConfig.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <sstream>
#include <utility>

namespace {
bool ReadOptionalString(const nlohmann::json& object, const char* key, std::string& outValue, std::string& outError) {
    if (!object.contains(key) || object[key].is_null()) {
        return true;
    }
    if (!object[key].is_string()) {
        outError = std::string("'") + key + "' must be a string";
        return false;
    }
    outValue = object[key].get<std::string>();
    return true;
}

bool ParseSftpSettings(const nlohmann::json& object, SftpSettings& outSettings, std::string& outError) {
    if (!object.is_object()) {
        outError = "'sftp_config' must be an object";
        return false;
    }

    if (!object.contains("host") || !object["host"].is_string() || object["host"].get<std::string>().empty()) {
        outError = "'sftp_config.host' is missing or empty";
        return false;
    }
    outSettings.host = object["host"].get<std::string>();

    if (object.contains("port")) {
        const auto& port = object["port"];
        if (!port.is_number_integer() || (port.is_number_unsigned() && port.get<uint64_t>() > 65535)
            || port.get<int64_t>() <= 0 || port.get<int64_t>() > 65535) {
            outError = "'sftp_config.port' must be an integer between 1 and 65535";
            return false;
        }
        outSettings.port = static_cast<int>(port.get<int64_t>());
    }

    if (!ReadOptionalString(object, "username", outSettings.username, outError)
        || !ReadOptionalString(object, "password", outSettings.password, outError)
        || !ReadOptionalString(object, "passphrase", outSettings.passphrase, outError)) {
        outError = "sftp_config: " + outError;
        return false;
    }

    if (object.contains("client_keys")) {
        const auto& keys = object["client_keys"];
        if (keys.is_string()) {
            outSettings.clientKeys.push_back(keys.get<std::string>());
        } else if (keys.is_array()) {
            for (const auto& key : keys) {
                if (!key.is_string()) {
                    outError = "'sftp_config.client_keys' must contain only strings";
                    return false;
                }
                outSettings.clientKeys.push_back(key.get<std::string>());
            }
        } else if (!keys.is_null()) {
            outError = "'sftp_config.client_keys' must be a string or an array of strings";
            return false;
        }
    }

    if (object.contains("known_hosts")) {
        const auto& knownHosts = object["known_hosts"];
        if (knownHosts.is_null()) {
            outSettings.hostKeyPolicy = HostKeyPolicy::ACCEPT_ANY;
        } else if (knownHosts.is_string()) {
            outSettings.hostKeyPolicy = HostKeyPolicy::KNOWN_HOSTS_FILE;
            outSettings.knownHostsPath = knownHosts.get<std::string>();
        } else {
            outError = "'sftp_config.known_hosts' must be a path or null";
            return false;
        }
    }

    if (object.contains("connect_timeout")) {
        const auto& timeout = object["connect_timeout"];
        constexpr int64_t kMaxTimeoutSeconds = 24 * 60 * 60;
        if (!timeout.is_number_integer() || (timeout.is_number_unsigned() && timeout.get<uint64_t>() > kMaxTimeoutSeconds)
            || timeout.get<int64_t>() <= 0 || timeout.get<int64_t>() > kMaxTimeoutSeconds) {
            outError = "'sftp_config.connect_timeout' must be a positive number of seconds up to one day";
            return false;
        }
        outSettings.connectTimeoutSeconds = static_cast<long>(timeout.get<int64_t>());
    }

    return true;
}
} // namespace

bool ParseConfig(const std::string& text, BackupConfig& outConfig, std::string& outError) {
    auto json = nlohmann::json::parse(text, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        outError = "config is not a valid JSON object";
        return false;
    }

    BackupConfig config;

    if (!json.contains("archive_name") || !json["archive_name"].is_string()
        || json["archive_name"].get<std::string>().empty()) {
        outError = "Could not extract data from config: 'archive_name'";
        return false;
    }
    config.archiveBaseName = json["archive_name"].get<std::string>();

    if (!json.contains("sftp_config")) {
        outError = "Could not extract data from config: 'sftp_config'";
        return false;
    }
    if (!ParseSftpSettings(json["sftp_config"], config.sftp, outError)) {
        return false;
    }

    if (!json.contains("data") || !json["data"].is_array() || json["data"].empty()) {
        outError = "Could not extract data from config: 'data'";
        return false;
    }
    for (const auto& item : json["data"]) {
        if (!item.is_string() || item.get<std::string>().empty()) {
            outError = "'data' must contain only non-empty remote paths";
            return false;
        }
        config.remoteTargets.push_back(item.get<std::string>());
    }

    if (!ReadOptionalString(json, "cache_dir", config.cacheDir, outError)
        || !ReadOptionalString(json, "archiver", config.archiver, outError)) {
        return false;
    }

    if (json.contains("notify") && !json["notify"].is_null()) {
        const auto& notify = json["notify"];
        if (!notify.is_object()) {
            outError = "'notify' must be an object";
            return false;
        }
        if (!ReadOptionalString(notify, "url", config.notify.url, outError)
            || !ReadOptionalString(notify, "api_key", config.notify.apiKey, outError)) {
            outError = "notify: " + outError;
            return false;
        }
    }

    if (json.contains("tracing") && !json["tracing"].is_null()) {
        const auto& tracing = json["tracing"];
        if (!tracing.is_object()) {
            outError = "'tracing' must be an object";
            return false;
        }
        try {
            config.tracing.enabled = tracing.value("enabled", false);
            config.tracing.endpoint = tracing.value("endpoint", "");
            config.tracing.serviceName = tracing.value("service_name", "sftp-backup");
        } catch (const nlohmann::json::exception& ex) {
            outError = std::string("tracing: ") + ex.what();
            return false;
        }
    }

    outConfig = std::move(config);
    return true;
}

bool LoadConfig(const std::string& path, BackupConfig& outConfig, std::string& outError) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        outError = path + " file not found";
        return false;
    }

    std::ostringstream buffer;
    buffer << input.rdbuf();
    return ParseConfig(buffer.str(), outConfig, outError);
}
