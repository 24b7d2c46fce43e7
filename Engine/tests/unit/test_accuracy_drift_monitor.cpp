/**
 * @file test_accuracy_drift_monitor.cpp
 * @brief Unit tests for evaluation, feedback and task-success drift
 */

#include <gtest/gtest.h>
#include <data/memory_log_accessor.hpp>
#include <decision/decision_engine.hpp>
#include <monitors/accuracy_drift_monitor.hpp>
#include <chrono>

using namespace Driftwatch;

static const Timestamp kNow = parse_sql_timestamp("2026-06-01 00:00:00");

static void add_evaluations(MemoryLogAccessor& logs, const TimeWindow& window, int n, double accuracy) {
    for (int i = 0; i < n; ++i) {
        EvaluationRecord r;
        r.timestamp = window.start + std::chrono::hours(i);
        r.evaluation_set_name = "golden";
        r.accuracy = accuracy;
        r.precision = accuracy;
        r.recall = accuracy;
        r.f1_score = accuracy;
        logs.add(r);
    }
}

static void add_feedback(MemoryLogAccessor& logs, const TimeWindow& window, const std::vector<double>& ratings) {
    for (size_t i = 0; i < ratings.size(); ++i) {
        InteractionRecord r;
        r.timestamp = window.start + std::chrono::minutes(static_cast<int>(i));
        r.user_query = "q";
        r.model_response = "a";
        r.user_feedback_score = ratings[i];
        logs.add(r);
    }
}

static void add_tasks(MemoryLogAccessor& logs, const TimeWindow& window, int n, int successes) {
    for (int i = 0; i < n; ++i) {
        logs.add(TaskRecord{window.start + std::chrono::minutes(i), i < successes});
    }
}

// ============================================================================
// detect()
// ============================================================================

TEST(AccuracyDriftMonitorTest, EvaluationAccuracyDrop) {
    MemoryLogAccessor logs;
    WindowPair windows = WindowPair::relative_to(kNow, 30, 7);
    add_evaluations(logs, windows.baseline, 3, 0.90);
    add_evaluations(logs, windows.current, 2, 0.80);

    AccuracyDriftMonitor monitor(logs);
    AccuracyDriftReport r = monitor.detect(windows);

    ASSERT_TRUE(r.accuracy_drop.has_value());
    EXPECT_NEAR(*r.accuracy_drop, 0.10, 1e-12);
    EXPECT_TRUE(r.accuracy_drift);
    EXPECT_TRUE(r.drift_detected);
    EXPECT_DOUBLE_EQ(r.drift_score, 1.0);
    EXPECT_EQ(r.baseline.evaluation.evaluation_count, 3u);
    EXPECT_EQ(r.current.evaluation.evaluation_count, 2u);

    CombinedDriftReport combined;
    combined.accuracy = r;
    Decision d = DecisionEngine().decide(combined);
    ASSERT_EQ(d.actions.size(), 1u);
    EXPECT_EQ(d.actions[0], Action::FineTuneModel);
}

TEST(AccuracyDriftMonitorTest, MissingTaskStreamIsNotAnError) {
    MemoryLogAccessor logs;
    logs.set_task_stream_available(false);
    WindowPair windows = WindowPair::relative_to(kNow, 30, 7);
    add_evaluations(logs, windows.baseline, 2, 0.9);
    add_evaluations(logs, windows.current, 2, 0.9);

    AccuracyDriftMonitor monitor(logs);
    AccuracyDriftReport r;
    ASSERT_NO_THROW(r = monitor.detect(windows));

    EXPECT_FALSE(r.baseline.tasks.stream_available);
    EXPECT_FALSE(r.task_success_drop.has_value());
    EXPECT_FALSE(r.drift_detected);
    EXPECT_DOUBLE_EQ(r.drift_score, 0.0);
}

TEST(AccuracyDriftMonitorTest, TaskSuccessDrop) {
    MemoryLogAccessor logs;
    WindowPair windows = WindowPair::relative_to(kNow, 30, 7);
    add_tasks(logs, windows.baseline, 10, 9);
    add_tasks(logs, windows.current, 10, 5);

    AccuracyDriftMonitor monitor(logs);
    AccuracyDriftReport r = monitor.detect(windows);

    EXPECT_TRUE(r.current.tasks.stream_available);
    ASSERT_TRUE(r.task_success_drop.has_value());
    EXPECT_NEAR(*r.task_success_drop, 0.4, 1e-12);
    EXPECT_TRUE(r.task_success_drift);
    EXPECT_FALSE(r.accuracy_drop.has_value());
}

TEST(AccuracyDriftMonitorTest, FeedbackRatingDrop) {
    MemoryLogAccessor logs;
    WindowPair windows = WindowPair::relative_to(kNow, 30, 7);
    add_feedback(logs, windows.baseline, {4.0, 4.0, 5.0, 3.0});
    add_feedback(logs, windows.current, {2.0, 2.0, 1.0, 3.0});

    AccuracyDriftMonitor monitor(logs);
    AccuracyDriftReport r = monitor.detect(windows);

    EXPECT_DOUBLE_EQ(r.baseline.feedback.avg_rating, 4.0);
    EXPECT_DOUBLE_EQ(r.current.feedback.avg_rating, 2.0);
    EXPECT_EQ(r.baseline.feedback.positive_count, 3u);
    EXPECT_EQ(r.current.feedback.negative_count, 3u);
    ASSERT_TRUE(r.feedback_drop_pct.has_value());
    EXPECT_DOUBLE_EQ(*r.feedback_drop_pct, 0.5);
    EXPECT_TRUE(r.feedback_drift);
    EXPECT_TRUE(r.drift_detected);
}

TEST(AccuracyDriftMonitorTest, InteractionsWithoutFeedbackAreIgnored) {
    std::vector<InteractionRecord> records(3);
    records[0].user_feedback_score = 5.0;
    records[2].user_feedback_score = 1.0;

    FeedbackSummary s = AccuracyDriftMonitor::summarize_feedback(records);
    EXPECT_EQ(s.feedback_count, 2u);
    EXPECT_DOUBLE_EQ(s.avg_rating, 3.0);
    EXPECT_DOUBLE_EQ(s.positive_rate, 0.5);
    EXPECT_DOUBLE_EQ(s.negative_rate, 0.5);
}

TEST(AccuracyDriftMonitorTest, NoComparableDataMeansNoDrift) {
    MemoryLogAccessor logs;
    WindowPair windows = WindowPair::relative_to(kNow, 30, 7);
    add_evaluations(logs, windows.baseline, 3, 0.9);

    AccuracyDriftMonitor monitor(logs);
    AccuracyDriftReport r = monitor.detect(windows);
    EXPECT_FALSE(r.accuracy_drop.has_value());
    EXPECT_FALSE(r.feedback_drop_pct.has_value());
    EXPECT_FALSE(r.task_success_drop.has_value());
    EXPECT_FALSE(r.drift_detected);
    EXPECT_DOUBLE_EQ(r.drift_score, 0.0);
}

// ============================================================================
// compare()
// ============================================================================

TEST(AccuracyCompareTest, ZeroBaselineRatingSkipsFeedbackComparison) {
    MemoryLogAccessor logs;
    AccuracyDriftMonitor monitor(logs);

    AccuracyPeriodStats baseline, current;
    baseline.feedback.feedback_count = 5;
    baseline.feedback.avg_rating = 0.0;
    current.feedback.feedback_count = 5;
    current.feedback.avg_rating = 3.0;

    AccuracyDriftReport r = monitor.compare(baseline, current);
    EXPECT_FALSE(r.feedback_drop_pct.has_value());
    EXPECT_FALSE(r.drift_detected);
}

TEST(AccuracyCompareTest, ImprovementClampsScoreToZero) {
    MemoryLogAccessor logs;
    AccuracyDriftMonitor monitor(logs);

    AccuracyPeriodStats baseline, current;
    baseline.evaluation.evaluation_count = 1;
    baseline.evaluation.avg_accuracy = 0.7;
    current.evaluation.evaluation_count = 1;
    current.evaluation.avg_accuracy = 0.9;

    AccuracyDriftReport r = monitor.compare(baseline, current);
    ASSERT_TRUE(r.accuracy_drop.has_value());
    EXPECT_LT(*r.accuracy_drop, 0.0);
    EXPECT_FALSE(r.accuracy_drift);
    EXPECT_DOUBLE_EQ(r.drift_score, 0.0);
}

TEST(AccuracyCompareTest, ScoreIsMaxOfNormalizedDrops) {
    AccuracyThresholds thresholds;
    thresholds.accuracy_threshold = 0.1;
    MemoryLogAccessor logs;
    AccuracyDriftMonitor monitor(logs, thresholds);

    AccuracyPeriodStats baseline, current;
    baseline.evaluation.evaluation_count = 1;
    baseline.evaluation.avg_accuracy = 0.90;
    current.evaluation.evaluation_count = 1;
    current.evaluation.avg_accuracy = 0.87;
    baseline.tasks.total_tasks = 10;
    baseline.tasks.success_rate = 0.8;
    current.tasks.total_tasks = 10;
    current.tasks.success_rate = 0.75;

    AccuracyDriftReport r = monitor.compare(baseline, current);
    EXPECT_NEAR(r.drift_score, 0.5, 1e-9);
    EXPECT_FALSE(r.drift_detected);
}
