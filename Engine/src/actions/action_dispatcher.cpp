/**
 * @file action_dispatcher.cpp
 * @brief Action dispatch with failure capture
 */

#include <actions/action_dispatcher.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>

namespace Driftwatch {

namespace {

constexpr const char* kComponent = "actions";

} // namespace

void to_json(nlohmann::json& j, const ActionContext& ctx) {
    j = nlohmann::json{
        {"run_id", ctx.run_id},
        {"baseline_start", to_iso8601(ctx.windows.baseline.start)},
        {"baseline_end", to_iso8601(ctx.windows.baseline.end)},
        {"current_start", to_iso8601(ctx.windows.current.start)},
        {"current_end", to_iso8601(ctx.windows.current.end)}
    };
}

ActionDispatcher::ActionDispatcher(ActionRunner& runner) : runner_(runner) {}

void ActionDispatcher::validate_response(Action action, const nlohmann::json& response) {
    if (!response.is_object()) {
        throw ActionExecutionError(to_string(action) + ": runner response is not a JSON object");
    }

    const char* required = nullptr;
    switch (action) {
        case Action::ReindexDocuments:    required = "documents_processed"; break;
        case Action::FineTuneModel:       required = "job_id"; break;
        case Action::UpdateSafetyFilters: required = "status"; break;
    }

    if (!response.contains(required)) {
        throw ActionExecutionError(to_string(action) + ": runner response lacks '" + required + "'");
    }
}

ActionOutcome ActionDispatcher::dispatch(Action action, const ActionContext& ctx) {
    const std::string name = to_string(action);

    if (!dispatched_.insert(action).second) {
        Logger::warn(kComponent, name + " already dispatched in this run; skipping");
        return ActionOutcome::failed("action already dispatched in this run");
    }

    Logger::step(kComponent, "Executing " + name);
    Timer timer;

    try {
        nlohmann::json response;
        switch (action) {
            case Action::ReindexDocuments:    response = runner_.reindex(ctx); break;
            case Action::FineTuneModel:       response = runner_.trigger_fine_tune(ctx); break;
            case Action::UpdateSafetyFilters: response = runner_.update_safety_filters(ctx); break;
        }
        validate_response(action, response);

        Logger::success(kComponent, name + " completed in " + std::to_string(static_cast<long>(timer.elapsed_ms())) + " ms");
        return ActionOutcome::success(std::move(response));
    } catch (const std::exception& e) {
        Logger::error(kComponent, name + " failed: " + e.what());
        return ActionOutcome::failed(e.what());
    }
}

std::map<Action, ActionOutcome> ActionDispatcher::dispatch_all(const std::vector<Action>& actions,
                                                               const ActionContext& ctx) {
    std::map<Action, ActionOutcome> results;
    for (Action action : actions) {
        results.emplace(action, dispatch(action, ctx));
    }
    return results;
}

} // namespace Driftwatch
