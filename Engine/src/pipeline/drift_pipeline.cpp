/**
 * @file drift_pipeline.cpp
 * @brief Run orchestration: isolated monitors, rule-based decision, at-most-once actions
 */

#include <pipeline/drift_pipeline.hpp>
#include <actions/action_dispatcher.hpp>
#include <core/errors.hpp>
#include <monitors/accuracy_drift_monitor.hpp>
#include <monitors/behavior_drift_monitor.hpp>
#include <monitors/embedding_drift_detector.hpp>
#include <utils/logger.hpp>
#include <future>

namespace Driftwatch {

namespace {

constexpr const char* kComponent = "pipeline";

template <typename Report, typename Fn>
Outcome<Report> isolate(Fn&& fn) {
    try {
        return Outcome<Report>::success(fn());
    } catch (const DataSourceError& e) {
        return Outcome<Report>::failure("data_source", e.what());
    } catch (const std::exception& e) {
        return Outcome<Report>::failure("internal", e.what());
    }
}

nlohmann::json window_json(const TimeWindow& w) {
    return {{"start", to_iso8601(w.start)}, {"end", to_iso8601(w.end)}};
}

} // namespace

DriftPipeline::DriftPipeline(DriftConfig config, LogAccessor& logs, ActionRunner& runner)
    : config_(std::move(config)), logs_(logs), runner_(runner) {
    config_.validate();
}

void DriftPipeline::enter(PipelineState next) {
    PipelineState previous = state_.state();
    state_.advance(next);
    record("state_transition", {{"from", to_string(previous)}, {"to", to_string(next)}});
}

void DriftPipeline::record(const std::string& event_type, nlohmann::json details) {
    // Failure messages come from drivers and webhooks and may not be valid UTF-8
    const std::string text = details.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    Logger::info(kComponent, "Event: " + event_type + " " + text);
    report_.events.push_back({Clock::now(), event_type, std::move(details)});
}

bool DriftPipeline::should_stop() {
    if (!cancelled_.load()) return false;
    if (!cancellation_recorded_) {
        cancellation_recorded_ = true;
        Logger::warn(kComponent, "Run cancelled during " + to_string(state_.state()));
        record("run_cancelled", {{"state", to_string(state_.state())}});
    }
    return true;
}

RunReport DriftPipeline::run(Timestamp now) {
    if (state_.state() != PipelineState::Init) {
        throw std::logic_error("DriftPipeline::run called twice");
    }

    timer_.reset();
    report_.start_time = Clock::now();
    report_.run_id = RunReport::run_id_for(report_.start_time);

    const WindowPair windows = WindowPair::relative_to(now, config_.baseline_days, config_.current_days);

    Logger::info(kComponent, "Starting run " + report_.run_id);
    record("run_started", {
        {"run_id", report_.run_id},
        {"baseline_window", window_json(windows.baseline)},
        {"current_window", window_json(windows.current)}
    });

    if (!should_stop()) {
        enter(PipelineState::Detecting);
        detect(windows);
    }

    Decision decision;
    if (!should_stop()) {
        enter(PipelineState::Deciding);
        decision = decide();
    }

    if (!should_stop()) {
        enter(PipelineState::Executing);
        execute(decision, windows);
    }

    enter(PipelineState::Reporting);
    publish_metrics();
    finalize();
    persist();

    state_.advance(PipelineState::Done);
    Logger::success(kComponent, "Run " + report_.run_id + " finished: " + to_string(report_.outcome));
    return report_;
}

void DriftPipeline::detect(const WindowPair& windows) {
    EmbeddingDriftDetector embedding(logs_, config_.embedding, config_.analysis, config_.max_embeddings_per_window);
    BehaviorDriftMonitor behavior(logs_, config_.behavior, config_.max_rows_per_window);
    AccuracyDriftMonitor accuracy(logs_, config_.accuracy, config_.max_rows_per_window);

    auto run_embedding = [&]() { return isolate<EmbeddingDriftReport>([&]() { return embedding.detect(windows); }); };
    auto run_behavior = [&]() { return isolate<BehaviorDriftReport>([&]() { return behavior.detect(windows); }); };
    auto run_accuracy = [&]() { return isolate<AccuracyDriftReport>([&]() { return accuracy.detect(windows); }); };

    Timer timer;
    std::optional<Outcome<EmbeddingDriftReport>> e;
    std::optional<Outcome<BehaviorDriftReport>> b;
    std::optional<Outcome<AccuracyDriftReport>> a;

    if (config_.parallel_monitors) {
        auto fe = std::async(std::launch::async, run_embedding);
        auto fb = std::async(std::launch::async, run_behavior);
        auto fa = std::async(std::launch::async, run_accuracy);
        e.emplace(fe.get());
        b.emplace(fb.get());
        a.emplace(fa.get());
    } else {
        e.emplace(run_embedding());
        b.emplace(run_behavior());
        a.emplace(run_accuracy());
    }

    CombinedDriftReport& drift = report_.drift;

    auto collect = [&](const char* name, auto& outcome, auto& slot) {
        if (outcome->ok()) {
            slot = outcome->value();
            record("monitor_completed", {{"monitor", name}, {"drift_detected", slot->drift_detected}});
        } else {
            const Failure& f = outcome->error();
            drift.failures[name] = f.message;
            Logger::error(kComponent, std::string(name) + " monitor failed: " + f.message);
            record("monitor_failed", {{"monitor", name}, {"kind", f.kind}, {"error", f.message}});
        }
    };

    collect("embedding", e, drift.embedding);
    collect("behavior", b, drift.behavior);
    collect("accuracy", a, drift.accuracy);

    drift.combine();
    report_.detection_complete = drift.failures.empty();

    record("drift_detection_complete", {
        {"drift_detected", drift.overall_drift_detected},
        {"drift_score", drift.overall_drift_score},
        {"detection_complete", report_.detection_complete},
        {"elapsed_ms", timer.elapsed_ms()}
    });
}

Decision DriftPipeline::decide() {
    Decision decision = decision_engine_.decide(report_.drift);

    nlohmann::json actions = nlohmann::json::array();
    for (Action a : decision.actions) actions.push_back(to_string(a));

    nlohmann::json rules = nlohmann::json::array();
    for (const auto& r : decision.fired_rules) {
        rules.push_back({{"signal", r.signal}, {"condition", r.description}, {"action", to_string(r.action)}});
    }

    record("decision", {{"message", decision.summary}, {"actions", actions}, {"fired_rules", rules}});

    if (decision.empty()) {
        Logger::success(kComponent, decision.summary);
    } else {
        Logger::warn(kComponent, decision.summary);
    }
    return decision;
}

void DriftPipeline::execute(const Decision& decision, const WindowPair& windows) {
    if (decision.empty()) return;

    ActionDispatcher dispatcher(runner_);
    ActionContext ctx{report_.run_id, windows};

    report_.actions_taken = decision.actions;
    report_.action_results = dispatcher.dispatch_all(decision.actions, ctx);

    nlohmann::json results = nlohmann::json::object();
    for (const auto& [action, outcome] : report_.action_results) {
        results[to_string(action)] = outcome;
        if (outcome.succeeded()) {
            record("action_completed", {{"action", to_string(action)}, {"details", outcome.details}});
        } else {
            record("action_failed", {{"action", to_string(action)}, {"error", outcome.error}});
        }
    }

    nlohmann::json actions = nlohmann::json::array();
    for (Action a : decision.actions) actions.push_back(to_string(a));
    record("actions_executed", {{"actions", actions}, {"results", results}});

    if (!metrics_) return;

    try {
        for (const auto& [action, outcome] : report_.action_results) {
            if (!outcome.succeeded()) continue;

            if (action == Action::FineTuneModel) {
                metrics_->increment_counter(metric_names::kRetrainEvents);
            } else if (action == Action::ReindexDocuments) {
                metrics_->increment_counter(metric_names::kReindexEvents);
            }

            auto cost = outcome.details.find("cost_usd");
            if (cost != outcome.details.end() && cost->is_number()) {
                metrics_->add_to_gauge(metric_names::kApiCost, cost->get<double>());
            }
        }
    } catch (const std::exception& e) {
        Logger::warn(kComponent, std::string("Could not update action metrics: ") + e.what());
    }
}

void DriftPipeline::publish_metrics() {
    if (!metrics_) return;

    const CombinedDriftReport& drift = report_.drift;
    try {
        if (drift.embedding && drift.embedding->drift_score) {
            metrics_->set_gauge(metric_names::kEmbeddingScore, *drift.embedding->drift_score);
        }
        if (drift.behavior && !drift.behavior->insufficient_data) {
            metrics_->set_gauge(metric_names::kBehaviorScore, drift.behavior->drift_score.value_or(0.0));
            metrics_->set_gauge(metric_names::kRefusalRate, drift.behavior->current.refusal_rate);
            metrics_->set_gauge(metric_names::kToxicityRate, drift.behavior->current.toxicity_rate);
        }
        if (drift.accuracy) {
            metrics_->set_gauge(metric_names::kAccuracyScore, drift.accuracy->drift_score);
            if (drift.accuracy->current.evaluation.evaluation_count > 0) {
                metrics_->set_gauge(metric_names::kModelAccuracy, drift.accuracy->current.evaluation.avg_accuracy);
            }
        }
        if (drift.embedding || drift.behavior || drift.accuracy) {
            metrics_->set_gauge(metric_names::kOverallScore, drift.overall_drift_score);
        }
    } catch (const std::exception& e) {
        Logger::warn(kComponent, std::string("Could not update drift metrics: ") + e.what());
    }
}

void DriftPipeline::finalize() {
    const CombinedDriftReport& drift = report_.drift;

    if (cancellation_recorded_) {
        report_.outcome = RunOutcome::Cancelled;
    } else if (!drift.failures.empty()) {
        report_.outcome = RunOutcome::DetectionIncomplete;
    } else if (report_.actions_taken.empty()) {
        report_.outcome = drift.overall_drift_detected ? RunOutcome::DriftNoAction : RunOutcome::NoDrift;
    } else {
        bool any_failed = false;
        for (const auto& [action, outcome] : report_.action_results) {
            any_failed = any_failed || !outcome.succeeded();
        }
        report_.outcome = any_failed ? RunOutcome::DriftActionsPartiallyFailed : RunOutcome::DriftActionsExecuted;
    }

    report_.end_time = Clock::now();
    report_.duration_seconds = timer_.elapsed_sec();

    record("run_finished", {
        {"outcome", to_string(report_.outcome)},
        {"duration_seconds", report_.duration_seconds},
        {"actions_taken", report_.actions_taken.size()}
    });
}

void DriftPipeline::persist() {
    for (ReportSink* sink : sinks_) {
        try {
            sink->persist(report_);
        } catch (const std::exception& e) {
            Logger::error(kComponent, std::string("Could not persist run report: ") + e.what());
        }
    }
}

} // namespace Driftwatch
