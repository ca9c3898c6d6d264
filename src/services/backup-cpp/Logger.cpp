#include "Logger.hpp"

#include "TimeFormat.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>
#include <utility>

#ifdef _WIN32
#include <io.h>
#include <cstdio>
#else
#include <unistd.h>
#endif

namespace {
constexpr const char* kReset = "\x1b[0m";
constexpr const char* kBold = "\x1b[1m";
constexpr const char* kBlack = "\x1b[30m";
constexpr const char* kRed = "\x1b[31m";
constexpr const char* kGreen = "\x1b[32m";
constexpr const char* kYellow = "\x1b[33m";
constexpr const char* kBlue = "\x1b[34m";
constexpr const char* kGray = "\x1b[38m";

std::string PadLevel(const std::string& level) {
    std::ostringstream output;
    output << std::left << std::setw(8) << level;
    return output.str();
}
} // namespace

Logger::Logger(std::string name, std::ostream& out, std::ostream& err, bool color)
    : name_(std::move(name)),
      out_(out),
      err_(err),
      color_(color) {}

bool Logger::OpenFile(const std::filesystem::path& filePath) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!filePath.parent_path().empty()) {
        std::error_code error;
        std::filesystem::create_directories(filePath.parent_path(), error);
        if (error) {
            err_ << "[Logger] Failed to create log directory " << filePath.parent_path().string()
                 << ": " << error.message() << std::endl;
            return false;
        }
    }

    file_.open(filePath, std::ios::out | std::ios::app);
    if (!file_.is_open()) {
        err_ << "[Logger] Failed to open log file: " << filePath.string() << std::endl;
        return false;
    }

    filePath_ = filePath;
    return true;
}

const std::filesystem::path& Logger::FilePath() const {
    return filePath_;
}

void Logger::SetMinimumLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    minimumLevel_ = level;
}

void Logger::Log(LogLevel level, const std::string& message) {
    const auto now = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_ << FormatFileLine(level, message, now) << '\n';
        file_.flush();
    }

    if (level == LogLevel::DEBUG || level < minimumLevel_) {
        return;
    }

    std::ostream& stream = level >= LogLevel::WARNING ? err_ : out_;
    stream << FormatConsoleLine(level, message, now) << std::endl;
}

void Logger::Debug(const std::string& message) {
    Log(LogLevel::DEBUG, message);
}

void Logger::Info(const std::string& message) {
    Log(LogLevel::INFO, message);
}

void Logger::Warning(const std::string& message) {
    Log(LogLevel::WARNING, message);
}

void Logger::Error(const std::string& message) {
    Log(LogLevel::ERROR, message);
}

void Logger::Critical(const std::string& message) {
    Log(LogLevel::CRITICAL, message);
}

std::string Logger::BuildLogFileName(std::chrono::system_clock::time_point time) {
    return "sftp-backup-" + FormatLocalTime(time, "%d.%m.%y-%H%M%S") + ".log";
}

std::string Logger::LevelName(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARNING:
        return "WARNING";
    case LogLevel::ERROR:
        return "ERROR";
    case LogLevel::CRITICAL:
        return "CRITICAL";
    }
    return "INFO";
}

std::string Logger::FormatConsoleLine(
    LogLevel level,
    const std::string& message,
    std::chrono::system_clock::time_point time) const {
    const std::string timestamp = FormatLocalTime(time, "%d-%m-%y %H:%M:%S");
    const std::string levelName = PadLevel(LevelName(level));

    std::ostringstream line;
    if (color_) {
        line << kBlack << kBold << timestamp << kReset << ' '
             << LevelColor(level) << levelName << kReset << ' '
             << kGreen << kBold << name_ << kReset << ' '
             << message;
    } else {
        line << timestamp << ' ' << levelName << ' ' << name_ << ' ' << message;
    }
    return line.str();
}

std::string Logger::FormatFileLine(
    LogLevel level,
    const std::string& message,
    std::chrono::system_clock::time_point time) const {
    std::ostringstream line;
    line << '[' << FormatLocalTime(time, "%Y-%m-%d %H:%M:%S") << "] "
         << '[' << PadLevel(LevelName(level)) << "] "
         << name_ << ": " << message;
    return line.str();
}

std::string Logger::LevelColor(LogLevel level) const {
    switch (level) {
    case LogLevel::DEBUG:
        return std::string(kGray) + kBold;
    case LogLevel::INFO:
        return std::string(kBlue) + kBold;
    case LogLevel::WARNING:
        return std::string(kYellow) + kBold;
    case LogLevel::ERROR:
        return kRed;
    case LogLevel::CRITICAL:
        return std::string(kRed) + kBold;
    }
    return kReset;
}

bool IsTerminal(const std::ostream& stream) {
#ifdef _WIN32
    if (&stream == &std::cout) {
        return _isatty(_fileno(stdout)) != 0;
    }
    if (&stream == &std::cerr) {
        return _isatty(_fileno(stderr)) != 0;
    }
#else
    if (&stream == &std::cout) {
        return isatty(STDOUT_FILENO) != 0;
    }
    if (&stream == &std::cerr) {
        return isatty(STDERR_FILENO) != 0;
    }
#endif
    return false;
}
