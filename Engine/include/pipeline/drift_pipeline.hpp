/**
 * @file drift_pipeline.hpp
 * @brief Orchestrates detection, decision, corrective actions and reporting for one run
 *
 * INIT -> DETECTING -> DECIDING -> EXECUTING -> REPORTING -> DONE
 *
 * Monitor and action failures are isolated and recorded; a run always ends
 * with a RunReport. cancel() is honoured between phases: the run skips to
 * REPORTING and finishes with outcome "cancelled".
 */

#pragma once

#include <actions/action_runner.hpp>
#include <config/drift_config.hpp>
#include <core/outcome.hpp>
#include <data/log_accessor.hpp>
#include <decision/decision_engine.hpp>
#include <metrics/metrics_registry.hpp>
#include <pipeline/report_sink.hpp>
#include <pipeline/run_report.hpp>
#include <pipeline/run_state.hpp>
#include <export.hpp>
#include <atomic>
#include <vector>

namespace Driftwatch {

class DRIFTWATCH_API DriftPipeline {
public:
    /**
     * @throws ConfigurationError if the configuration is invalid; nothing runs
     */
    DriftPipeline(DriftConfig config, LogAccessor& logs, ActionRunner& runner);

    DriftPipeline(const DriftPipeline&) = delete;
    DriftPipeline& operator=(const DriftPipeline&) = delete;

    void set_metrics_sink(MetricsSink* metrics) { metrics_ = metrics; }
    void add_report_sink(ReportSink* sink) { sinks_.push_back(sink); }

    /**
     * @brief Execute the run. A pipeline instance runs once.
     * @param now end of the current window
     * @throws std::logic_error if called a second time
     */
    RunReport run(Timestamp now = Clock::now());

    /**
     * @brief Request cancellation; safe to call from any thread.
     */
    void cancel() { cancelled_.store(true); }

    PipelineState state() const { return state_.state(); }

    const DriftConfig& config() const { return config_; }

private:
    void enter(PipelineState next);
    void record(const std::string& event_type, nlohmann::json details = nlohmann::json::object());
    bool should_stop();

    void detect(const WindowPair& windows);
    Decision decide();
    void execute(const Decision& decision, const WindowPair& windows);
    void publish_metrics();
    void finalize();
    void persist();

    DriftConfig config_;
    LogAccessor& logs_;
    ActionRunner& runner_;
    MetricsSink* metrics_ = nullptr;
    std::vector<ReportSink*> sinks_;
    DecisionEngine decision_engine_;

    RunStateMachine state_;
    std::atomic<bool> cancelled_{false};
    bool cancellation_recorded_ = false;
    Timer timer_;
    RunReport report_;
};

} // namespace Driftwatch
