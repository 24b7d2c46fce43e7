/**
 * @file run_report.cpp
 * @brief Run outcome names, file naming and report serialization
 */

#include <pipeline/run_report.hpp>

namespace Driftwatch {

using nlohmann::json;

std::string to_string(RunOutcome outcome) {
    switch (outcome) {
        case RunOutcome::NoDrift:                     return "no_drift";
        case RunOutcome::DetectionIncomplete:         return "detection_incomplete";
        case RunOutcome::DriftNoAction:               return "drift_no_action";
        case RunOutcome::DriftActionsExecuted:        return "drift_actions_executed";
        case RunOutcome::DriftActionsPartiallyFailed: return "drift_actions_partially_failed";
        case RunOutcome::Cancelled:                   return "cancelled";
    }
    return "unknown";
}

std::string RunReport::run_id_for(Timestamp start) {
    return "drift-" + format_utc(start, "%Y%m%d-%H%M%S");
}

std::string RunReport::file_name_for(Timestamp start) {
    return "drift_report_" + format_utc(start, "%Y%m%d_%H%M%S") + ".json";
}

void to_json(json& j, const EventRecord& e) {
    j = json{
        {"timestamp", to_iso8601(e.timestamp)},
        {"event_type", e.event_type},
        {"details", e.details}
    };
}

void to_json(json& j, const RunReport& r) {
    json actions = json::array();
    for (Action a : r.actions_taken) actions.push_back(to_string(a));

    json results = json::object();
    for (const auto& [action, outcome] : r.action_results) {
        results[to_string(action)] = outcome;
    }

    j = json{
        {"run_id", r.run_id},
        {"start_time", to_iso8601(r.start_time)},
        {"end_time", to_iso8601(r.end_time)},
        {"duration_seconds", r.duration_seconds},
        {"outcome", to_string(r.outcome)},
        {"detection_complete", r.detection_complete},
        {"drift_report", r.drift},
        {"actions_taken", actions},
        {"action_results", results},
        {"events", r.events}
    };
}

} // namespace Driftwatch
