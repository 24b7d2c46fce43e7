/**
 * @file action_dispatcher.hpp
 * @brief At-most-once execution of decided actions with per-action failure isolation
 */

#pragma once

#include <actions/action.hpp>
#include <actions/action_runner.hpp>
#include <map>
#include <set>
#include <vector>

namespace Driftwatch {

class ActionDispatcher {
public:
    explicit ActionDispatcher(ActionRunner& runner);

    /**
     * @brief Run one action. Never throws; failures come back as a failed outcome.
     *
     * A second dispatch of the same action on this dispatcher is refused.
     */
    ActionOutcome dispatch(Action action, const ActionContext& ctx);

    /**
     * @brief Run each action in order; one failure does not stop the rest.
     */
    std::map<Action, ActionOutcome> dispatch_all(const std::vector<Action>& actions, const ActionContext& ctx);

    /**
     * @brief Check the fields the runner contract promises for an action.
     * @throws ActionExecutionError when a field is missing
     */
    static void validate_response(Action action, const nlohmann::json& response);

private:
    ActionRunner& runner_;
    std::set<Action> dispatched_;
};

} // namespace Driftwatch
