/**
 * @file test_run_report.cpp
 * @brief Unit tests for run naming, report serialization, the file sink and the phase machine
 */

#include <gtest/gtest.h>
#include <core/errors.hpp>
#include <core/outcome.hpp>
#include <pipeline/report_sink.hpp>
#include <pipeline/run_report.hpp>
#include <pipeline/run_state.hpp>
#include <filesystem>
#include <fstream>
#include <random>

using namespace Driftwatch;
namespace fs = std::filesystem;

static RunReport sample_report() {
    RunReport r;
    r.start_time = parse_sql_timestamp("2026-03-05 07:08:09");
    r.end_time = parse_sql_timestamp("2026-03-05 07:08:11");
    r.run_id = RunReport::run_id_for(r.start_time);
    r.duration_seconds = 2.0;
    r.outcome = RunOutcome::DriftActionsPartiallyFailed;
    r.detection_complete = true;
    r.actions_taken = {Action::FineTuneModel, Action::UpdateSafetyFilters};
    r.action_results.emplace(Action::FineTuneModel, ActionOutcome::success({{"job_id", "ft-7"}}));
    r.action_results.emplace(Action::UpdateSafetyFilters, ActionOutcome::failed("filter service down"));
    r.events.push_back({r.start_time, "run_started", {{"run_id", r.run_id}}});
    return r;
}

class ScratchDirTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        dir_ = fs::temp_directory_path() / ("driftwatch_report_test_" + std::to_string(rd()));
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }
    fs::path dir_;
};

// ============================================================================
// Naming and serialization
// ============================================================================

TEST(RunReportTest, NamesDeriveFromStartTime) {
    Timestamp t = parse_sql_timestamp("2026-03-05 07:08:09");
    EXPECT_EQ(RunReport::run_id_for(t), "drift-20260305-070809");
    EXPECT_EQ(RunReport::file_name_for(t), "drift_report_20260305_070809.json");
}

TEST(RunReportTest, JsonLayout) {
    nlohmann::json j = sample_report();
    EXPECT_EQ(j["run_id"], "drift-20260305-070809");
    EXPECT_EQ(j["start_time"], "2026-03-05T07:08:09.000000Z");
    EXPECT_EQ(j["outcome"], "drift_actions_partially_failed");
    EXPECT_EQ(j["actions_taken"], nlohmann::json::array({"fine_tune_model", "update_safety_filters"}));
    EXPECT_EQ(j["action_results"]["fine_tune_model"]["status"], "success");
    EXPECT_EQ(j["action_results"]["update_safety_filters"]["error"], "filter service down");
    EXPECT_EQ(j["events"][0]["event_type"], "run_started");
    EXPECT_TRUE(j.contains("drift_report"));
}

TEST(RunReportTest, OutcomeNames) {
    EXPECT_EQ(to_string(RunOutcome::NoDrift), "no_drift");
    EXPECT_EQ(to_string(RunOutcome::DetectionIncomplete), "detection_incomplete");
    EXPECT_EQ(to_string(RunOutcome::DriftNoAction), "drift_no_action");
    EXPECT_EQ(to_string(RunOutcome::DriftActionsExecuted), "drift_actions_executed");
    EXPECT_EQ(to_string(RunOutcome::Cancelled), "cancelled");
}

// ============================================================================
// File sink
// ============================================================================

TEST_F(ScratchDirTest, FileSinkWritesOnce) {
    JsonFileReportSink sink(dir_.string());
    RunReport report = sample_report();

    sink.persist(report);
    const std::string path = sink.path_for(report);
    ASSERT_TRUE(fs::exists(path));
    EXPECT_EQ(fs::path(path).filename().string(), "drift_report_20260305_070809.json");

    std::ifstream in(path);
    nlohmann::json stored = nlohmann::json::parse(in);
    EXPECT_EQ(stored["run_id"], report.run_id);

    // A second run in the same second must not clobber the first report
    RunReport other = sample_report();
    other.outcome = RunOutcome::NoDrift;
    EXPECT_THROW(sink.persist(other), DriftwatchError);

    std::ifstream again(path);
    EXPECT_EQ(nlohmann::json::parse(again)["outcome"], "drift_actions_partially_failed");
}

TEST_F(ScratchDirTest, FileSinkCreatesNestedDirectory) {
    JsonFileReportSink sink((dir_ / "nested" / "reports").string());
    sink.persist(sample_report());
    EXPECT_TRUE(fs::exists(dir_ / "nested" / "reports" / "drift_report_20260305_070809.json"));
}

TEST(PostgresEventSinkTest, UnreachableDatabaseThrows) {
    PostgresEventSink sink("host=127.0.0.1 port=1 dbname=none user=none connect_timeout=1");
    EXPECT_THROW(sink.persist(sample_report()), DriftwatchError);
}

// ============================================================================
// Phase machine
// ============================================================================

TEST(RunStateMachineTest, AdvancesForwardAndMaySkip) {
    RunStateMachine sm;
    EXPECT_EQ(sm.state(), PipelineState::Init);
    sm.advance(PipelineState::Detecting);
    sm.advance(PipelineState::Deciding);
    sm.advance(PipelineState::Reporting);     // Executing skipped
    sm.advance(PipelineState::Done);
    EXPECT_EQ(sm.state(), PipelineState::Done);
}

TEST(RunStateMachineTest, NeverRevisitsAPhase) {
    RunStateMachine sm;
    sm.advance(PipelineState::Deciding);
    EXPECT_THROW(sm.advance(PipelineState::Detecting), std::logic_error);
    EXPECT_THROW(sm.advance(PipelineState::Deciding), std::logic_error);
    EXPECT_EQ(sm.state(), PipelineState::Deciding);
}

TEST(RunStateMachineTest, StateNames) {
    EXPECT_EQ(to_string(PipelineState::Init), "INIT");
    EXPECT_EQ(to_string(PipelineState::Executing), "EXECUTING");
    EXPECT_EQ(to_string(PipelineState::Done), "DONE");
}

// ============================================================================
// Outcome
// ============================================================================

TEST(OutcomeTest, HoldsValueOrFailure) {
    auto good = Outcome<int>::success(7);
    ASSERT_TRUE(good);
    EXPECT_EQ(good.value(), 7);
    EXPECT_THROW(good.error(), std::logic_error);

    auto bad = Outcome<int>::failure("data_source", "relation \"interaction_log\" does not exist");
    EXPECT_FALSE(bad.ok());
    EXPECT_EQ(bad.error().kind, "data_source");
    EXPECT_THROW(bad.value(), std::logic_error);
}
