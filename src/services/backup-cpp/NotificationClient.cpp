#include "NotificationClient.hpp"

#include "Logger.hpp"

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <thread>
#include <utility>

namespace {
constexpr int kMaxRetries = 3;
constexpr auto kConnectTimeout = std::chrono::seconds(3);
constexpr auto kRequestTimeout = std::chrono::seconds(10);

bool IsSuccessStatus(const cpr::Response& response) {
    return response.status_code >= 200 && response.status_code < 300;
}

int BackoffSeconds(int attempt) {
    return 1 << attempt;
}
} // namespace

RunReport BuildRunReport(const std::string& archiveBaseName, const PipelineResult& result) {
    RunReport report;
    report.archiveName = result.archiveName.empty() ? archiveBaseName : result.archiveName;
    report.state = ToString(result.state);
    report.success = result.Succeeded();
    report.finalPath = result.finalPath.string();
    report.placementAttempts = result.placementAttempts;
    report.traceparent = result.traceparent;
    if (result.error.IsSet()) {
        report.error = Describe(result.error);
        report.errorKind = ToString(result.error.kind);
        report.target = result.error.target;
    }
    return report;
}

std::string SerializeRunReport(const RunReport& report) {
    nlohmann::json payload = {
        {"archiveName", report.archiveName},
        {"state", report.state},
        {"success", report.success},
        {"finalPath", report.finalPath},
        {"error", report.error},
        {"errorKind", report.errorKind},
        {"target", report.target},
        {"placementAttempts", report.placementAttempts}
    };
    return payload.dump();
}

NotificationClient::NotificationClient(NotifySettings settings, Logger& logger)
    : settings_(std::move(settings)),
      logger_(logger) {}

bool NotificationClient::Enabled() const {
    return !settings_.url.empty();
}

bool NotificationClient::SendRunReport(const RunReport& report) {
    if (!Enabled()) {
        return true;
    }

    const std::string body = SerializeRunReport(report);

    for (int attempt = 0; attempt < kMaxRetries; ++attempt) {
        cpr::Header headers{{"Content-Type", "application/json"}};
        if (!report.traceparent.empty()) {
            headers["traceparent"] = report.traceparent;
        }
        if (!settings_.apiKey.empty()) {
            headers["X-API-Key"] = settings_.apiKey;
        }

        cpr::Response response = cpr::Post(
            cpr::Url{settings_.url},
            cpr::Body{body},
            headers,
            cpr::ConnectTimeout{kConnectTimeout},
            cpr::Timeout{kRequestTimeout});

        const bool requestOk = response.error.code == cpr::ErrorCode::OK;
        if (requestOk && IsSuccessStatus(response)) {
            return true;
        }

        if (attempt + 1 < kMaxRetries) {
            const int waitSeconds = BackoffSeconds(attempt);
            logger_.Warning("Run report failed (Attempt " + std::to_string(attempt + 1) + "/"
                + std::to_string(kMaxRetries) + "). Retrying in " + std::to_string(waitSeconds) + "s...");
            std::this_thread::sleep_for(std::chrono::seconds(waitSeconds));
            continue;
        }

        if (!requestOk) {
            logger_.Warning("Run report failed: " + response.error.message);
        } else {
            logger_.Warning("Run report failed with HTTP " + std::to_string(response.status_code));
        }
    }

    return false;
}
