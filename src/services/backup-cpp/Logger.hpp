#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iosfwd>
#include <mutex>
#include <string>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

class Logger {
public:
    Logger(std::string name, std::ostream& out, std::ostream& err, bool color);

    // Appends to the file, creating its directory first. Console logging keeps working on failure.
    bool OpenFile(const std::filesystem::path& filePath);
    const std::filesystem::path& FilePath() const;

    void SetMinimumLevel(LogLevel level);

    void Log(LogLevel level, const std::string& message);
    void Debug(const std::string& message);
    void Info(const std::string& message);
    void Warning(const std::string& message);
    void Error(const std::string& message);
    void Critical(const std::string& message);

    static std::string BuildLogFileName(std::chrono::system_clock::time_point time);
    static std::string LevelName(LogLevel level);

    std::string FormatConsoleLine(LogLevel level, const std::string& message, std::chrono::system_clock::time_point time) const;
    std::string FormatFileLine(LogLevel level, const std::string& message, std::chrono::system_clock::time_point time) const;

private:
    std::string LevelColor(LogLevel level) const;

    std::string name_;
    std::ostream& out_;
    std::ostream& err_;
    bool color_;
    LogLevel minimumLevel_ = LogLevel::INFO;
    std::filesystem::path filePath_;
    std::ofstream file_;
    std::mutex mutex_;
};

// True when the stream is attached to an interactive terminal.
bool IsTerminal(const std::ostream& stream);
