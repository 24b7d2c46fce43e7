/**
 * @file accuracy_drift_monitor.hpp
 * @brief Task-performance drift from evaluations, user feedback and task outcomes
 */

#pragma once

#include <config/drift_config.hpp>
#include <data/log_accessor.hpp>
#include <monitors/drift_report.hpp>
#include <export.hpp>
#include <optional>
#include <vector>

namespace Driftwatch {

/**
 * @brief Three drop measurements between baseline and current window.
 *
 * A measurement is taken only when both windows hold at least one
 * qualifying record; the others are left out of the verdict and score.
 */
class DRIFTWATCH_API AccuracyDriftMonitor {
public:
    AccuracyDriftMonitor(LogAccessor& logs,
                         AccuracyThresholds thresholds = {},
                         size_t max_rows_per_window = 100000);

    /**
     * @throws DataSourceError if any query fails
     */
    AccuracyDriftReport detect(const WindowPair& windows);

    static EvaluationSummary summarize_evaluations(const std::vector<EvaluationRecord>& records);
    static FeedbackSummary summarize_feedback(const std::vector<InteractionRecord>& records);
    static TaskSummary summarize_tasks(const std::optional<std::vector<TaskRecord>>& records);

    /**
     * @brief Compute drops, verdict and score from two period summaries.
     */
    AccuracyDriftReport compare(const AccuracyPeriodStats& baseline, const AccuracyPeriodStats& current) const;

private:
    LogAccessor& logs_;
    AccuracyThresholds thresholds_;
    size_t max_rows_;
};

} // namespace Driftwatch
