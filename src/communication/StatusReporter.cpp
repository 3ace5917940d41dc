/**
 * ============================================================================
 * StatusReporter.cpp - Run summary implementation
 * ============================================================================
 */

#include "communication/StatusReporter.h"
#include "core/Config.h"
#include "core/Format.h"
#include "core/UtilityEngine.h"

StatusReporter& StatusReporter::getInstance() {
    static StatusReporter instance;
    return instance;
}

// ============================================================================
// SUMMARY DOCUMENT
// ============================================================================

void StatusReporter::buildSummary(const TestProfile& profile, const RunReport& report,
                                  const std::string& csvPath, JsonDocument& doc) const {
    doc["generatedAt"] = engine->getFormattedTime();
    doc["csv"] = csvPath;

    // Profile
    JsonObject profileObj = doc["profile"].to<JsonObject>();
    profileObj["kind"] = toString(profile.kind);
    if (profile.isSinusoid()) {
        profileObj["amplitudeDeg"] = serialized(toFixed(profile.amplitudeDeg, 4));
        profileObj["frequencyHz"] = serialized(toFixed(profile.frequencyHz, 4));
        profileObj["cycleCount"] = profile.cycleCount;
        profileObj["expectedMotionSec"] = serialized(toFixed(profile.expectedMotionSec(), 3));
    } else {
        profileObj["targetPositionDeg"] = serialized(toFixed(profile.targetPositionDeg, 4));
    }
    profileObj["samplePeriodSec"] = serialized(toFixed(profile.samplePeriodSec, 6));
    profileObj["durationSec"] = serialized(toFixed(profile.effectiveDurationSec(), 3));

    // Outcome
    doc["outcome"] = toString(report.outcome);
    doc["failure"] = toString(report.failure);
    doc["lastActiveState"] = toString(report.lastActiveState);
    doc["stop"] = toString(report.stop);
    doc["message"] = report.message;

    // Acquisition statistics
    const AcquisitionStats& acq = report.acquisition;
    JsonObject acqObj = doc["acquisition"].to<JsonObject>();
    acqObj["plannedTicks"] = acq.plannedTicks;
    acqObj["ticksAttempted"] = acq.ticksAttempted;
    acqObj["samplesRecorded"] = acq.samplesRecorded;
    acqObj["gaps"] = acq.gaps;
    acqObj["gapRatio"] = serialized(toFixed(acq.gapRatio(), 6));
    acqObj["retries"] = acq.retries;
    acqObj["lateTicks"] = acq.lateTicks;
    acqObj["maxLatencyMs"] = serialized(toFixed(acq.maxLatency.count() / 1000.0, 3));
    acqObj["elapsedSec"] = serialized(toFixed(acq.elapsedSec, 3));
    acqObj["cancelled"] = acq.cancelled;
}

std::string StatusReporter::summaryPathFor(const std::string& csvPath) {
    if (csvPath.empty()) return "";

    std::string base = csvPath;
    size_t slash = base.find_last_of('/');
    size_t dot = base.find_last_of('.');
    bool hasExtension = (dot != std::string::npos) &&
                        (slash == std::string::npos ? dot > 0 : dot > slash + 1);
    if (hasExtension) {
        base.erase(dot);
    }
    return base + SUMMARY_FILE_SUFFIX;
}

bool StatusReporter::saveSummary(const TestProfile& profile, const RunReport& report,
                                 const std::string& csvPath, std::string& errorMsg) const {
    std::string path = summaryPathFor(csvPath);
    if (path.empty()) {
        errorMsg = "No CSV path, summary not written";
        return false;
    }

    JsonDocument doc;
    buildSummary(profile, report, engine->resolvePath(csvPath), doc);

    if (!engine->saveJsonFile(path, doc, errorMsg)) {
        return false;
    }
    engine->info("[Report] 💾 Summary saved: " + path);
    return true;
}

// ============================================================================
// LOG BLOCK
// ============================================================================

void StatusReporter::logReport(const RunReport& report) const {
    const AcquisitionStats& acq = report.acquisition;
    LogLevel level = report.completed() ? LogLevel::LOG_INFO : LogLevel::LOG_WARNING;
    if (report.outcome == TerminalOutcome::OUTCOME_FAILED) level = LogLevel::LOG_ERROR;

    engine->log(level, "════════════════════════════════════════");
    engine->log(level, std::string("  RUN ") + toString(report.outcome) +
                       (report.failure != ErrorKind::ERR_NONE ? std::string(" (") + toString(report.failure) + ")" : ""));
    if (!report.message.empty()) {
        engine->log(level, "  " + report.message);
    }
    engine->log(level, "  Samples: " + std::to_string(acq.samplesRecorded) + "/" + std::to_string(acq.plannedTicks) +
                       ", gaps " + std::to_string(acq.gaps) + " (" + toFixed(acq.gapRatio() * 100.0, 2) + "%)" +
                       ", retries " + std::to_string(acq.retries) + ", late " + std::to_string(acq.lateTicks));
    engine->log(level, "════════════════════════════════════════");

    // STOP outcome is a safety fact: never below ERROR when it failed
    switch (report.stop) {
        case StopOutcome::STOP_ACKNOWLEDGED:
            engine->info("[Report] 🛑 Final STOP acknowledged");
            break;
        case StopOutcome::STOP_FAILED:
            engine->error("[Report] ❌ Final STOP FAILED: check the table, it may still be moving");
            break;
        case StopOutcome::STOP_NOT_ATTEMPTED:
            engine->error("[Report] ❌ Final STOP was never sent");
            break;
    }
}
