#include "Logger.hpp"
#include "NotificationClient.hpp"
#include "TestSupport.hpp"

#include <nlohmann/json.hpp>

#include <sstream>

int main() {
    {
        PipelineResult result;
        result.state = PipelineState::SUCCEEDED;
        result.archiveName = "mc-01.01.25-1200";
        result.finalPath = "/backups/mc-01.01.25-1200(1).7z";
        result.placementAttempts = 1;

        const auto payload = nlohmann::json::parse(SerializeRunReport(BuildRunReport("mc", result)), nullptr, false);
        if (payload.is_discarded()) {
            return Fail("Run report is not valid JSON.");
        }
        if (payload.value("success", false) != true || payload.value("state", "") != "SUCCEEDED") {
            return Fail("Successful run was not reported as such.");
        }
        if (payload.value("finalPath", "") != "/backups/mc-01.01.25-1200(1).7z" || payload.value("placementAttempts", 0) != 1) {
            return Fail("Placement details missing from report.");
        }
        if (!payload.value("error", "x").empty()) {
            return Fail("Successful report should carry no error.");
        }
    }

    {
        PipelineResult result;
        result.state = PipelineState::FAILED;
        result.failedDuring = PipelineState::RETRIEVING;
        result.error = {BackupErrorKind::NOT_FOUND, "/srv/plugins", "No such file"};

        const RunReport report = BuildRunReport("mc", result);
        if (report.success || report.archiveName != "mc" || report.errorKind != "NOT_FOUND") {
            return Fail("Failed run report is incomplete.");
        }
        if (report.error != "No such file/path: \"/srv/plugins\"" || report.target != "/srv/plugins") {
            return Fail("Failed run report lost the diagnostic: " + report.error);
        }
    }

    {
        std::ostringstream out;
        std::ostringstream err;
        Logger logger("test", out, err, false);
        NotificationClient client(NotifySettings{}, logger);
        if (client.Enabled() || !client.SendRunReport(RunReport{})) {
            return Fail("A client without a URL should be a no-op.");
        }
        if (!out.str().empty() || !err.str().empty()) {
            return Fail("A disabled client should not log.");
        }
    }

    return 0;
}
