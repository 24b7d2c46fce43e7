/**
 * @file run_report.hpp
 * @brief The persisted record of one pipeline run
 */

#pragma once

#include <actions/action.hpp>
#include <monitors/drift_report.hpp>
#include <utils/time.hpp>
#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace Driftwatch {

enum class RunOutcome {
    NoDrift,
    DetectionIncomplete,            ///< At least one monitor failed
    DriftNoAction,                  ///< Drift seen but no decision rule covers it
    DriftActionsExecuted,
    DriftActionsPartiallyFailed,
    Cancelled
};

std::string to_string(RunOutcome outcome);

struct EventRecord {
    Timestamp timestamp;
    std::string event_type;
    nlohmann::json details = nlohmann::json::object();
};

struct RunReport {
    std::string run_id;
    Timestamp start_time;
    Timestamp end_time;
    double duration_seconds = 0.0;

    RunOutcome outcome = RunOutcome::NoDrift;
    bool detection_complete = false;

    CombinedDriftReport drift;
    std::vector<Action> actions_taken;
    std::map<Action, ActionOutcome> action_results;
    std::vector<EventRecord> events;

    /**
     * @return "drift-YYYYMMDD-HHMMSS" (UTC)
     */
    static std::string run_id_for(Timestamp start);

    /**
     * @return "drift_report_YYYYMMDD_HHMMSS.json" (UTC)
     */
    static std::string file_name_for(Timestamp start);
};

void to_json(nlohmann::json& j, const EventRecord& e);
void to_json(nlohmann::json& j, const RunReport& r);

} // namespace Driftwatch
