/**
 * @file action_runner.hpp
 * @brief Boundary to the external systems that carry out corrective actions
 */

#pragma once

#include <data/records.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace Driftwatch {

/**
 * @brief The only information a runner receives about the run that triggered it.
 */
struct ActionContext {
    std::string run_id;
    WindowPair windows;
};

void to_json(nlohmann::json& j, const ActionContext& ctx);

/**
 * @brief Executes corrective actions in external systems.
 *
 * Each call is made at most once per run and never retried. Implementations
 * throw ActionExecutionError (or any std::exception) on failure and return
 * the external system's response on success:
 *   reindex()               -> {"documents_processed": N, ...}
 *   trigger_fine_tune()     -> {"job_id": "...", ...}
 *   update_safety_filters() -> {"status": "...", ...}
 */
class ActionRunner {
public:
    virtual ~ActionRunner() = default;

    virtual nlohmann::json reindex(const ActionContext& ctx) = 0;
    virtual nlohmann::json trigger_fine_tune(const ActionContext& ctx) = 0;
    virtual nlohmann::json update_safety_filters(const ActionContext& ctx) = 0;
};

} // namespace Driftwatch
