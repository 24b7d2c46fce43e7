/**
 * @file behavior_drift_monitor.hpp
 * @brief Refusal, toxicity, error and response-length drift in model outputs
 */

#pragma once

#include <config/drift_config.hpp>
#include <data/log_accessor.hpp>
#include <monitors/drift_report.hpp>
#include <monitors/refusal_classifier.hpp>
#include <export.hpp>
#include <vector>

namespace Driftwatch {

/**
 * @brief Compares output-behavior rates of the current window with the baseline.
 *
 * Refusal and toxicity use absolute thresholds on the current rate: a
 * baseline that was already bad does not make the current window acceptable.
 */
class DRIFTWATCH_API BehaviorDriftMonitor {
public:
    BehaviorDriftMonitor(LogAccessor& logs,
                         BehaviorThresholds thresholds = {},
                         size_t max_rows_per_window = 100000);

    /**
     * @throws DataSourceError if the interaction query fails
     */
    BehaviorDriftReport detect(const WindowPair& windows);

    /**
     * @brief Build the report from already-fetched interactions.
     */
    BehaviorDriftReport analyze(const std::vector<InteractionRecord>& baseline,
                                const std::vector<InteractionRecord>& current) const;

    static BehaviorPeriodStats summarize(const std::vector<InteractionRecord>& records);

    /**
     * @brief Most recent refusal-flagged interactions, newest first.
     *
     * Independent of any drift verdict.
     * @param now   end of the inspected range
     * @param days  length of the inspected range
     * @param limit maximum number of examples
     */
    std::vector<RefusalExample> recent_refusals(Timestamp now, int days = 7, size_t limit = 20);

private:
    LogAccessor& logs_;
    BehaviorThresholds thresholds_;
    size_t max_rows_;
    RefusalClassifier classifier_;
};

} // namespace Driftwatch
