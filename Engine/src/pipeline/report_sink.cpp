/**
 * @file report_sink.cpp
 * @brief JSON file and drift_events table persistence
 */

#include <pipeline/report_sink.hpp>
#include <core/errors.hpp>
#include <database/postgres_connection.hpp>
#include <utils/logger.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace Driftwatch {

JsonFileReportSink::JsonFileReportSink(std::string directory) : directory_(std::move(directory)) {}

std::string JsonFileReportSink::path_for(const RunReport& report) const {
    return (fs::path(directory_) / RunReport::file_name_for(report.start_time)).string();
}

void JsonFileReportSink::persist(const RunReport& report) {
    const std::string path = path_for(report);

    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throw DriftwatchError("Cannot create report directory " + directory_ + ": " + ec.message());
    }
    if (fs::exists(path)) {
        throw DriftwatchError("Run report already exists, refusing to overwrite: " + path);
    }

    std::ofstream out(path);
    if (!out) {
        throw DriftwatchError("Cannot open run report for writing: " + path);
    }

    nlohmann::json j = report;
    // Monitor and runner messages may carry bytes that are not UTF-8
    out << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    out.close();
    if (!out) {
        throw DriftwatchError("Failed writing run report: " + path);
    }

    Logger::success("report", "Report saved to " + path);
}

PostgresEventSink::PostgresEventSink(std::string conninfo) : conninfo_(std::move(conninfo)) {}

void PostgresEventSink::persist(const RunReport& report) {
    std::ostringstream actions;
    actions << '{';
    for (size_t i = 0; i < report.actions_taken.size(); ++i) {
        if (i) actions << ',';
        actions << to_string(report.actions_taken[i]);
    }
    actions << '}';

    nlohmann::json details = {
        {"run_id", report.run_id},
        {"outcome", to_string(report.outcome)},
        {"detection_complete", report.detection_complete},
        {"duration_seconds", report.duration_seconds},
        {"drift_report", report.drift}
    };

    PostgresConnection db(conninfo_);
    db.execute("SET TIME ZONE 'UTC'");
    db.execute(
        "INSERT INTO drift_events (timestamp, event_type, drift_score, details, actions_taken) "
        "VALUES ($1::timestamp, $2, $3::float8, $4::jsonb, $5::text[])",
        {
            to_sql_timestamp(report.start_time),
            report.drift.overall_drift_detected ? "drift_detected" : "no_drift",
            std::to_string(report.drift.overall_drift_score),
            details.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
            actions.str()
        });

    Logger::info("report", "Recorded run " + report.run_id + " in drift_events");
}

} // namespace Driftwatch
