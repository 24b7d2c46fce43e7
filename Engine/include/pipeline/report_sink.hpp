/**
 * @file report_sink.hpp
 * @brief Destinations a finished RunReport is persisted to
 */

#pragma once

#include <pipeline/run_report.hpp>
#include <export.hpp>
#include <string>

namespace Driftwatch {

class ReportSink {
public:
    virtual ~ReportSink() = default;

    /**
     * @throws DriftwatchError (or a subclass) when the report cannot be stored
     */
    virtual void persist(const RunReport& report) = 0;
};

/**
 * @brief Writes drift_report_YYYYMMDD_HHMMSS.json into a directory.
 *
 * Write-once: an existing file of the same name is never overwritten.
 */
class DRIFTWATCH_API JsonFileReportSink : public ReportSink {
public:
    explicit JsonFileReportSink(std::string directory);

    void persist(const RunReport& report) override;

    std::string path_for(const RunReport& report) const;

private:
    std::string directory_;
};

/**
 * @brief Appends one summary row per run to the drift_events table.
 */
class DRIFTWATCH_API PostgresEventSink : public ReportSink {
public:
    explicit PostgresEventSink(std::string conninfo);

    void persist(const RunReport& report) override;

private:
    std::string conninfo_;
};

} // namespace Driftwatch
