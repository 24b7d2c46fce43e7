/**
 * @file action.hpp
 * @brief Corrective actions a run may take, and the result of taking one
 */

#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace Driftwatch {

enum class Action {
    ReindexDocuments,
    FineTuneModel,
    UpdateSafetyFilters
};

/**
 * @return "reindex_documents", "fine_tune_model" or "update_safety_filters"
 */
std::string to_string(Action action);

/**
 * @throws ConfigurationError for an unknown name
 */
Action action_from_string(const std::string& name);

struct ActionOutcome {
    enum class Status { Success, Failed };

    Status status = Status::Failed;
    nlohmann::json details = nlohmann::json::object();   ///< Runner response on success
    std::string error;                                   ///< Failure message otherwise

    bool succeeded() const { return status == Status::Success; }

    static ActionOutcome success(nlohmann::json details) {
        ActionOutcome o;
        o.status = Status::Success;
        o.details = std::move(details);
        return o;
    }

    static ActionOutcome failed(std::string message) {
        ActionOutcome o;
        o.status = Status::Failed;
        o.error = std::move(message);
        return o;
    }
};

void to_json(nlohmann::json& j, const ActionOutcome& outcome);

} // namespace Driftwatch
