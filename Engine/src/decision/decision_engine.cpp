/**
 * @file decision_engine.cpp
 * @brief Default decision table and rule evaluation
 */

#include <decision/decision_engine.hpp>
#include <algorithm>

namespace Driftwatch {

std::vector<DecisionRule> DecisionEngine::default_rules() {
    return {
        {"embedding.drift_detected",
         "any embedding drift method tripped",
         Action::ReindexDocuments,
         [](const CombinedDriftReport& r) {
             return r.embedding && !r.embedding->insufficient_data && r.embedding->drift_detected;
         }},
        {"behavior.refusal_drift",
         "current refusal rate above refusal_rate_threshold",
         Action::FineTuneModel,
         [](const CombinedDriftReport& r) {
             return r.behavior && !r.behavior->insufficient_data && r.behavior->refusal_drift;
         }},
        {"behavior.toxicity_drift",
         "current toxicity rate above toxicity_rate_threshold",
         Action::UpdateSafetyFilters,
         [](const CombinedDriftReport& r) {
             return r.behavior && !r.behavior->insufficient_data && r.behavior->toxicity_drift;
         }},
        {"accuracy.drift_detected",
         "accuracy, feedback or task success dropped beyond threshold",
         Action::FineTuneModel,
         [](const CombinedDriftReport& r) {
             return r.accuracy && r.accuracy->drift_detected;
         }},
    };
}

DecisionEngine::DecisionEngine() : rules_(default_rules()) {}

DecisionEngine::DecisionEngine(std::vector<DecisionRule> rules) : rules_(std::move(rules)) {}

Decision DecisionEngine::decide(const CombinedDriftReport& report) const {
    Decision decision;

    for (const auto& rule : rules_) {
        if (!rule.fires(report)) continue;

        decision.fired_rules.push_back({rule.signal, rule.description, rule.action});
        if (std::find(decision.actions.begin(), decision.actions.end(), rule.action) == decision.actions.end()) {
            decision.actions.push_back(rule.action);
        }
    }

    if (decision.actions.empty()) {
        decision.summary = kNoActionsMessage;
    } else {
        decision.summary = "actions required:";
        for (size_t i = 0; i < decision.actions.size(); ++i) {
            decision.summary += (i == 0 ? " " : ", ") + to_string(decision.actions[i]);
        }
    }
    return decision;
}

} // namespace Driftwatch
