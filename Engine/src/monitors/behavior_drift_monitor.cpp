/**
 * @file behavior_drift_monitor.cpp
 * @brief Output-behavior rates, their drift signals and the refusal inspector
 */

#include <monitors/behavior_drift_monitor.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <utils/unicode.hpp>
#include <algorithm>
#include <cmath>
#include <sstream>

namespace Driftwatch {

namespace {

constexpr const char* kComponent = "behavior";

std::string percent(double rate) {
    std::ostringstream ss;
    ss.setf(std::ios::fixed);
    ss.precision(2);
    ss << rate * 100.0 << '%';
    return ss.str();
}

} // namespace

BehaviorDriftMonitor::BehaviorDriftMonitor(LogAccessor& logs, BehaviorThresholds thresholds, size_t max_rows_per_window)
    : logs_(logs), thresholds_(thresholds), max_rows_(max_rows_per_window) {}

BehaviorPeriodStats BehaviorDriftMonitor::summarize(const std::vector<InteractionRecord>& records) {
    BehaviorPeriodStats stats;
    stats.total_interactions = records.size();

    double total_length = 0.0;
    for (const auto& r : records) {
        if (r.refusal_flag) stats.refusals++;
        if (r.toxicity_flag) stats.toxic_responses++;
        if (r.error_flag) stats.errors++;
        if (r.model_response) {
            total_length += static_cast<double>(utf8_length(*r.model_response));
            stats.responses_measured++;
        }
    }

    if (stats.total_interactions > 0) {
        const double n = static_cast<double>(stats.total_interactions);
        stats.refusal_rate = stats.refusals / n;
        stats.toxicity_rate = stats.toxic_responses / n;
        stats.error_rate = stats.errors / n;
    }
    if (stats.responses_measured > 0) {
        stats.avg_response_length = total_length / static_cast<double>(stats.responses_measured);
    }
    return stats;
}

BehaviorDriftReport BehaviorDriftMonitor::detect(const WindowPair& windows) {
    Logger::step(kComponent, "Checking behavior drift");

    RecordQuery query;
    query.limit = max_rows_;
    query.spread = true;

    bool truncated = false;
    auto read = [&](const TimeWindow& window) {
        auto records = logs_.interactions(window, query);
        if (was_truncated(logs_, LogStream::Interactions, window, query, records.size())) {
            Logger::warn(kComponent, "Window from " + to_iso8601(window.start) + " holds more than " +
                                     std::to_string(max_rows_) + " interactions; rates use an even sample");
            truncated = true;
        }
        return records;
    };

    auto baseline = read(windows.baseline);
    auto current = read(windows.current);

    BehaviorDriftReport report = analyze(baseline, current);
    report.truncated = truncated;
    report.baseline.start = windows.baseline.start;
    report.baseline.end = windows.baseline.end;
    report.current.start = windows.current.start;
    report.current.end = windows.current.end;

    if (report.insufficient_data) {
        Logger::warn(kComponent, report.error + " (baseline " + std::to_string(baseline.size()) +
                                 ", current " + std::to_string(current.size()) + ")");
    } else if (report.drift_detected) {
        Logger::warn(kComponent, "Behavior drift detected");
    } else {
        Logger::success(kComponent, "No behavior drift");
    }
    return report;
}

BehaviorDriftReport BehaviorDriftMonitor::analyze(const std::vector<InteractionRecord>& baseline,
                                                  const std::vector<InteractionRecord>& current) const {
    BehaviorDriftReport report;
    report.thresholds = thresholds_;

    if (baseline.empty() || current.empty()) {
        report.insufficient_data = true;
        report.error = "Insufficient data for behavior drift detection";
        report.baseline.total_interactions = baseline.size();
        report.current.total_interactions = current.size();
        return report;
    }

    report.baseline = summarize(baseline);
    report.current = summarize(current);
    const BehaviorPeriodStats& b = report.baseline;
    const BehaviorPeriodStats& c = report.current;

    report.refusal_rate_change = c.refusal_rate - b.refusal_rate;
    report.toxicity_rate_change = c.toxicity_rate - b.toxicity_rate;
    report.error_rate_change = c.error_rate - b.error_rate;
    report.length_change = b.avg_response_length > 0.0
        ? std::abs(c.avg_response_length - b.avg_response_length) / b.avg_response_length
        : 0.0;

    report.refusal_drift = c.refusal_rate > thresholds_.refusal_rate_threshold;
    report.toxicity_drift = c.toxicity_rate > thresholds_.toxicity_rate_threshold;
    report.error_drift = c.error_rate > thresholds_.error_rate_threshold;
    report.length_anomaly = report.length_change > thresholds_.length_change_threshold;

    if (report.refusal_drift) {
        Logger::warn(kComponent, "Refusal rate " + percent(c.refusal_rate) + " exceeds " +
                                 percent(thresholds_.refusal_rate_threshold) + " (baseline " + percent(b.refusal_rate) + ")");
    }
    if (report.toxicity_drift) {
        Logger::warn(kComponent, "Toxicity rate " + percent(c.toxicity_rate) + " exceeds " +
                                 percent(thresholds_.toxicity_rate_threshold));
    }
    if (report.error_drift) {
        Logger::warn(kComponent, "Error rate " + percent(c.error_rate) + " exceeds " +
                                 percent(thresholds_.error_rate_threshold));
    }
    if (report.length_anomaly) {
        Logger::warn(kComponent, "Average response length changed by " + percent(report.length_change));
    }

    report.drift_detected = report.refusal_drift || report.toxicity_drift ||
                            report.error_drift || report.length_anomaly;

    const double score = std::max({
        c.refusal_rate / thresholds_.refusal_rate_threshold,
        c.toxicity_rate / thresholds_.toxicity_rate_threshold,
        c.error_rate / thresholds_.error_rate_threshold,
        report.length_change / thresholds_.length_change_threshold
    });
    report.drift_score = std::clamp(score, 0.0, 1.0);

    return report;
}

std::vector<RefusalExample> BehaviorDriftMonitor::recent_refusals(Timestamp now, int days, size_t limit) {
    TimeWindow window{days_before(now, days), now};

    RecordQuery query;
    query.limit = limit;
    query.order = RecordOrder::NewestFirst;
    query.refusals_only = true;

    std::vector<RefusalExample> examples;
    for (auto& record : logs_.interactions(window, query)) {
        RefusalExample e;
        e.timestamp = record.timestamp;
        e.user_query = std::move(record.user_query);
        if (record.model_response) {
            e.matched_phrase = classifier_.matched_phrase(*record.model_response);
        }
        e.model_response = std::move(record.model_response);
        examples.push_back(std::move(e));
    }

    Logger::info(kComponent, "Found " + std::to_string(examples.size()) + " recent refusals");
    return examples;
}

} // namespace Driftwatch
