#pragma once

#include "BackupConfig.hpp"
#include "BackupPipeline.hpp"

#include <string>

class Logger;

struct RunReport {
    std::string archiveName;
    std::string state;
    bool success = false;
    std::string finalPath;
    std::string error;
    std::string errorKind;
    std::string target;
    int placementAttempts = 0;
    std::string traceparent;
};

RunReport BuildRunReport(const std::string& archiveBaseName, const PipelineResult& result);
std::string SerializeRunReport(const RunReport& report);

// Posts the run outcome to an HTTP endpoint after the pipeline has finished.
class NotificationClient {
public:
    NotificationClient(NotifySettings settings, Logger& logger);

    bool Enabled() const;
    bool SendRunReport(const RunReport& report);

private:
    NotifySettings settings_;
    Logger& logger_;
};
