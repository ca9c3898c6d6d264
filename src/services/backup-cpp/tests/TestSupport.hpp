#pragma once

#include "StopFlag.hpp"
#include "TransferClient.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <random>
#include <set>
#include <string>
#include <system_error>
#include <vector>

inline int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

class ScopedTempDir {
public:
    ScopedTempDir() {
        std::random_device device;
        path_ = std::filesystem::temp_directory_path() / ("sftp-backup-test-" + std::to_string(device()));
        std::filesystem::create_directories(path_);
    }

    ~ScopedTempDir() {
        std::error_code error;
        std::filesystem::remove_all(path_, error);
    }

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    const std::filesystem::path& Path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline void WriteFile(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    output << content;
}

inline std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
}

inline size_t CountEntries(const std::filesystem::path& dir) {
    size_t count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        (void)entry;
        ++count;
    }
    return count;
}

// 01.01.25 12:00 local time.
inline std::chrono::system_clock::time_point FixedNoon() {
    std::tm value = {};
    value.tm_year = 125;
    value.tm_mon = 0;
    value.tm_mday = 1;
    value.tm_hour = 12;
    value.tm_min = 0;
    value.tm_sec = 30;
    value.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&value));
}

// In-memory stand-in for an SFTP server. Every fetched target becomes a
// directory named after the remote base name holding one payload file.
class FakeTransferClient : public TransferClient {
public:
    struct Counters {
        int connects = 0;
        int sessions = 0;
        std::vector<std::string> fetched;
    };

    std::set<std::string> missing;
    std::set<std::string> broken;
    // Raises the process stop flag once this target has been fetched.
    std::string requestStopAfter;
    BackupError connectError;
    BackupError sessionError;
    Counters counters;

    std::unique_ptr<TransferConnection> Connect(const SftpSettings&, BackupError& outError) override {
        ++counters.connects;
        if (connectError.IsSet()) {
            outError = connectError;
            return nullptr;
        }
        return std::make_unique<Connection>(*this);
    }

private:
    class Session : public TransferSession {
    public:
        explicit Session(FakeTransferClient& owner)
            : owner_(owner) {}

        bool Fetch(
            const std::string& remotePath,
            const std::filesystem::path& localDir,
            bool,
            BackupError& outError) override {
            if (StopRequested()) {
                outError = {BackupErrorKind::INTERRUPTED, remotePath, "Interrupted"};
                return false;
            }
            if (owner_.missing.count(remotePath) != 0) {
                outError = {BackupErrorKind::NOT_FOUND, remotePath, "No such file: " + remotePath};
                return false;
            }
            if (owner_.broken.count(remotePath) != 0) {
                outError = {BackupErrorKind::TRANSFER_FAILED, remotePath, "Connection reset"};
                return false;
            }

            owner_.counters.fetched.push_back(remotePath);
            const auto name = std::filesystem::path(remotePath).filename();
            WriteFile(localDir / name / "payload.dat", remotePath);
            if (remotePath == owner_.requestStopAfter) {
                RequestStop();
            }
            return true;
        }

    private:
        FakeTransferClient& owner_;
    };

    class Connection : public TransferConnection {
    public:
        explicit Connection(FakeTransferClient& owner)
            : owner_(owner) {}

        std::unique_ptr<TransferSession> StartSession(BackupError& outError) override {
            ++owner_.counters.sessions;
            if (owner_.sessionError.IsSet()) {
                outError = owner_.sessionError;
                return nullptr;
            }
            return std::make_unique<Session>(owner_);
        }

    private:
        FakeTransferClient& owner_;
    };
};
