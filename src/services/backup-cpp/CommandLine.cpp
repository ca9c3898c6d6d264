#include "CommandLine.hpp"

#include <exception>
#include <sstream>

namespace {
bool ParsePositiveInt(const std::string& text, int& outValue) {
    try {
        size_t index = 0;
        const int value = std::stoi(text, &index);
        if (index == text.size() && value > 0) {
            outValue = value;
            return true;
        }
    } catch (const std::exception&) {
        return false;
    }

    return false;
}

bool TakeValue(
    const std::string& flag,
    const std::string& inlineValue,
    bool hasInlineValue,
    int argc,
    const char* const* argv,
    int& index,
    std::string& outValue,
    std::string& outError) {
    if (hasInlineValue) {
        outValue = inlineValue;
        return true;
    }

    if (index + 1 >= argc) {
        outError = flag + " requires a value";
        return false;
    }

    outValue = argv[++index];
    return true;
}
} // namespace

bool ParseCommandLine(int argc, const char* const* argv, CommandLineOptions& outOptions, std::string& outError) {
    CommandLineOptions options;

    for (int index = 1; index < argc; ++index) {
        std::string argument = argv[index];
        std::string inlineValue;
        bool hasInlineValue = false;

        const auto equals = argument.find('=');
        if (argument.rfind("--", 0) == 0 && equals != std::string::npos) {
            inlineValue = argument.substr(equals + 1);
            argument = argument.substr(0, equals);
            hasInlineValue = true;
        }

        if (argument == "-h" || argument == "--help") {
            options.help = true;
            continue;
        }

        if (argument == "--no-color") {
            options.color = false;
            continue;
        }

        std::string value;
        if (argument == "--dir") {
            if (!TakeValue(argument, inlineValue, hasInlineValue, argc, argv, index, value, outError)) {
                return false;
            }
            options.destinationDir = value;
        } else if (argument == "--retries") {
            if (!TakeValue(argument, inlineValue, hasInlineValue, argc, argv, index, value, outError)) {
                return false;
            }
            if (!ParsePositiveInt(value, options.retryLimit)) {
                outError = "--retries argument must be an integer";
                return false;
            }
        } else if (argument == "--config") {
            if (!TakeValue(argument, inlineValue, hasInlineValue, argc, argv, index, value, outError)) {
                return false;
            }
            options.configPath = value;
        } else if (argument == "--log-dir") {
            if (!TakeValue(argument, inlineValue, hasInlineValue, argc, argv, index, value, outError)) {
                return false;
            }
            options.logDir = value;
        } else {
            outError = "Unknown argument: " + argument;
            return false;
        }
    }

    if (!options.help && options.destinationDir.empty()) {
        outError = "Output directory not specified";
        return false;
    }

    outOptions = options;
    return true;
}

std::string UsageText(const std::string& programName) {
    std::ostringstream usage;
    usage << "usage: " << programName << " --dir DIR [--retries N] [--config PATH] [--log-dir DIR] [--no-color]\n"
          << "\n"
          << "SFTP Server Backup\n"
          << "\n"
          << "options:\n"
          << "  --dir DIR        Directory to save the backup archive to\n"
          << "  --retries N      How many numbered suffixes to try when the archive name is taken (default "
          << kDefaultRetryLimit << ")\n"
          << "  --config PATH    Configuration file (default config.json)\n"
          << "  --log-dir DIR    Directory for log files (default ./logs)\n"
          << "  --no-color       Disable colored console output\n"
          << "  -h, --help       Show this help and exit\n";
    return usage.str();
}
