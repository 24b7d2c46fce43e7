/**
 * @file action.cpp
 * @brief Action names and outcome serialization
 */

#include <actions/action.hpp>
#include <core/errors.hpp>

namespace Driftwatch {

std::string to_string(Action action) {
    switch (action) {
        case Action::ReindexDocuments:    return "reindex_documents";
        case Action::FineTuneModel:       return "fine_tune_model";
        case Action::UpdateSafetyFilters: return "update_safety_filters";
    }
    return "unknown";
}

Action action_from_string(const std::string& name) {
    if (name == "reindex_documents") return Action::ReindexDocuments;
    if (name == "fine_tune_model") return Action::FineTuneModel;
    if (name == "update_safety_filters") return Action::UpdateSafetyFilters;
    throw ConfigurationError("Unknown action '" + name + "'");
}

void to_json(nlohmann::json& j, const ActionOutcome& outcome) {
    if (outcome.succeeded()) {
        j = nlohmann::json{{"status", "success"}, {"details", outcome.details}};
    } else {
        j = nlohmann::json{{"status", "failed"}, {"error", outcome.error}};
    }
}

} // namespace Driftwatch
