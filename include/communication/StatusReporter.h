/**
 * ============================================================================
 * StatusReporter.h - Run summary (log + JSON file)
 * ============================================================================
 *
 * Turns a RunReport into:
 * - a console/log block at the end of the run (ERROR level when the final
 *   STOP was not acknowledged)
 * - a JSON summary written next to the CSV: <csv basename>.summary.json
 */

#ifndef STATUS_REPORTER_H
#define STATUS_REPORTER_H

#include <ArduinoJson.h>
#include <string>
#include "core/Types.h"

class StatusReporter {
public:
    // Singleton pattern
    static StatusReporter& getInstance();

    /**
     * Fill a JSON document with profile, outcome, STOP outcome and statistics
     * @param csvPath Series file the summary belongs to (may be empty)
     */
    void buildSummary(const TestProfile& profile, const RunReport& report,
                      const std::string& csvPath, JsonDocument& doc) const;

    /** "data/run.csv" → "data/run.summary.json" ("" → "") */
    static std::string summaryPathFor(const std::string& csvPath);

    /**
     * Build + write the summary next to the CSV
     * @return false (with errorMsg) if the file could not be written
     */
    bool saveSummary(const TestProfile& profile, const RunReport& report,
                     const std::string& csvPath, std::string& errorMsg) const;

    /** Print the end-of-run block */
    void logReport(const RunReport& report) const;

private:
    StatusReporter() = default;
    StatusReporter(const StatusReporter&) = delete;
    StatusReporter& operator=(const StatusReporter&) = delete;
};

#endif // STATUS_REPORTER_H
