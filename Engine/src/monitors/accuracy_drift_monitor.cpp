/**
 * @file accuracy_drift_monitor.cpp
 * @brief Accuracy, feedback and task-success drops between windows
 */

#include <monitors/accuracy_drift_monitor.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <algorithm>
#include <sstream>

namespace Driftwatch {

namespace {

constexpr const char* kComponent = "accuracy";

std::string fixed(double v) {
    std::ostringstream ss;
    ss.setf(std::ios::fixed);
    ss.precision(4);
    ss << v;
    return ss.str();
}

} // namespace

AccuracyDriftMonitor::AccuracyDriftMonitor(LogAccessor& logs, AccuracyThresholds thresholds, size_t max_rows_per_window)
    : logs_(logs), thresholds_(thresholds), max_rows_(max_rows_per_window) {}

EvaluationSummary AccuracyDriftMonitor::summarize_evaluations(const std::vector<EvaluationRecord>& records) {
    EvaluationSummary s;
    s.evaluation_count = records.size();
    if (records.empty()) return s;

    for (const auto& r : records) {
        s.avg_accuracy += r.accuracy;
        s.avg_precision += r.precision;
        s.avg_recall += r.recall;
        s.avg_f1 += r.f1_score;
    }
    const double n = static_cast<double>(records.size());
    s.avg_accuracy /= n;
    s.avg_precision /= n;
    s.avg_recall /= n;
    s.avg_f1 /= n;
    return s;
}

FeedbackSummary AccuracyDriftMonitor::summarize_feedback(const std::vector<InteractionRecord>& records) {
    FeedbackSummary s;
    double total = 0.0;

    for (const auto& r : records) {
        if (!r.user_feedback_score) continue;
        const double rating = *r.user_feedback_score;
        total += rating;
        s.feedback_count++;
        if (rating >= 4.0) s.positive_count++;
        if (rating <= 2.0) s.negative_count++;
    }

    if (s.feedback_count > 0) {
        const double n = static_cast<double>(s.feedback_count);
        s.avg_rating = total / n;
        s.positive_rate = s.positive_count / n;
        s.negative_rate = s.negative_count / n;
    }
    return s;
}

TaskSummary AccuracyDriftMonitor::summarize_tasks(const std::optional<std::vector<TaskRecord>>& records) {
    TaskSummary s;
    if (!records) return s;

    s.stream_available = true;
    s.total_tasks = records->size();
    for (const auto& r : *records) {
        if (r.success_flag) s.successful_tasks++;
    }
    if (s.total_tasks > 0) {
        s.success_rate = static_cast<double>(s.successful_tasks) / static_cast<double>(s.total_tasks);
    }
    return s;
}

AccuracyDriftReport AccuracyDriftMonitor::detect(const WindowPair& windows) {
    Logger::step(kComponent, "Checking accuracy drift");

    RecordQuery query;
    query.limit = max_rows_;
    query.spread = true;

    bool truncated = false;
    auto check = [&](LogStream stream, const TimeWindow& window, size_t returned) {
        if (was_truncated(logs_, stream, window, query, returned)) {
            Logger::warn(kComponent, to_string(stream) + " window from " + to_iso8601(window.start) +
                                     " holds more than " + std::to_string(max_rows_) + " rows; using an even sample");
            truncated = true;
        }
    };

    auto period = [&](const TimeWindow& window) {
        AccuracyPeriodStats p;
        p.start = window.start;
        p.end = window.end;

        auto evaluations = logs_.evaluations(window, query);
        check(LogStream::Evaluations, window, evaluations.size());
        p.evaluation = summarize_evaluations(evaluations);

        auto interactions = logs_.interactions(window, query);
        check(LogStream::Interactions, window, interactions.size());
        p.feedback = summarize_feedback(interactions);

        auto tasks = logs_.tasks(window, query);
        if (tasks) check(LogStream::Tasks, window, tasks->size());
        p.tasks = summarize_tasks(tasks);
        return p;
    };

    AccuracyDriftReport report = compare(period(windows.baseline), period(windows.current));
    report.truncated = truncated;

    if (!report.accuracy_drop && !report.feedback_drop_pct && !report.task_success_drop) {
        Logger::warn(kComponent, "No comparable evaluation, feedback or task data in both windows");
    } else if (report.drift_detected) {
        Logger::warn(kComponent, "Accuracy drift detected (score " + fixed(report.drift_score) + ")");
    } else {
        Logger::success(kComponent, "No accuracy drift");
    }
    return report;
}

AccuracyDriftReport AccuracyDriftMonitor::compare(const AccuracyPeriodStats& baseline,
                                                  const AccuracyPeriodStats& current) const {
    AccuracyDriftReport report;
    report.baseline = baseline;
    report.current = current;
    report.thresholds = thresholds_;

    double score = 0.0;

    if (baseline.evaluation.evaluation_count > 0 && current.evaluation.evaluation_count > 0) {
        const double drop = baseline.evaluation.avg_accuracy - current.evaluation.avg_accuracy;
        report.accuracy_drop = drop;
        report.accuracy_drift = drop > thresholds_.accuracy_threshold;
        score = std::max(score, drop / thresholds_.accuracy_threshold);
        if (report.accuracy_drift) {
            Logger::warn(kComponent, "Accuracy dropped by " + fixed(drop));
        }
    }

    if (baseline.feedback.feedback_count > 0 && current.feedback.feedback_count > 0 &&
        baseline.feedback.avg_rating != 0.0) {
        const double drop_pct = (baseline.feedback.avg_rating - current.feedback.avg_rating) /
                                baseline.feedback.avg_rating;
        report.feedback_drop_pct = drop_pct;
        report.feedback_drift = drop_pct > thresholds_.feedback_threshold;
        score = std::max(score, drop_pct / thresholds_.feedback_threshold);
        if (report.feedback_drift) {
            Logger::warn(kComponent, "Average feedback rating dropped by " + fixed(drop_pct * 100.0) + "%");
        }
    }

    if (baseline.tasks.total_tasks > 0 && current.tasks.total_tasks > 0) {
        const double drop = baseline.tasks.success_rate - current.tasks.success_rate;
        report.task_success_drop = drop;
        report.task_success_drift = drop > thresholds_.accuracy_threshold;
        score = std::max(score, drop / thresholds_.accuracy_threshold);
        if (report.task_success_drift) {
            Logger::warn(kComponent, "Task success rate dropped by " + fixed(drop));
        }
    }

    report.drift_detected = report.accuracy_drift || report.feedback_drift || report.task_success_drift;
    report.drift_score = std::clamp(score, 0.0, 1.0);
    return report;
}

} // namespace Driftwatch
