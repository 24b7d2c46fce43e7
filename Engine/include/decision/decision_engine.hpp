/**
 * @file decision_engine.hpp
 * @brief Maps monitor reports to an ordered, duplicate-free set of corrective actions
 */

#pragma once

#include <actions/action.hpp>
#include <monitors/drift_report.hpp>
#include <functional>
#include <string>
#include <vector>

namespace Driftwatch {

/**
 * @brief One row of the decision table: when a signal is raised, take an action.
 */
struct DecisionRule {
    std::string signal;                 ///< e.g. "behavior.refusal_drift"
    std::string description;            ///< Human-readable trigger condition
    Action action;
    std::function<bool(const CombinedDriftReport&)> fires;
};

struct FiredRule {
    std::string signal;
    std::string description;
    Action action;
};

struct Decision {
    std::vector<Action> actions;        ///< First rule to add an action fixes its position
    std::vector<FiredRule> fired_rules;
    std::string summary;

    bool empty() const { return actions.empty(); }
};

/**
 * @brief Pure function of the combined report.
 *
 * Absent reports (failed monitors) and insufficient-data reports raise no
 * signal. No side effects: calling decide() twice on the same report
 * returns the same decision.
 */
class DecisionEngine {
public:
    DecisionEngine();
    explicit DecisionEngine(std::vector<DecisionRule> rules);

    static std::vector<DecisionRule> default_rules();

    Decision decide(const CombinedDriftReport& report) const;

    const std::vector<DecisionRule>& rules() const { return rules_; }

    static constexpr const char* kNoActionsMessage = "no drift detected - no actions needed";

private:
    std::vector<DecisionRule> rules_;
};

} // namespace Driftwatch
