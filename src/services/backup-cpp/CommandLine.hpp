#pragma once

#include "PlacementStage.hpp"

#include <string>

struct CommandLineOptions {
    std::string destinationDir;
    int retryLimit = kDefaultRetryLimit;
    std::string configPath = "config.json";
    std::string logDir;
    bool color = true;
    bool help = false;
};

// Accepts "--flag value" and "--flag=value". Returns false with outError set
// on unknown flags, missing values or a --retries value that is not a positive integer.
bool ParseCommandLine(int argc, const char* const* argv, CommandLineOptions& outOptions, std::string& outError);

std::string UsageText(const std::string& programName);
