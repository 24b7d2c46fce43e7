/**
 * @file drift_monitor.cpp
 * @brief Command-line entry point: one drift run against PostgreSQL, optionally serving /metrics afterwards
 */

#include <actions/http_action_runner.hpp>
#include <config/drift_config.hpp>
#include <data/postgres_log_accessor.hpp>
#include <database/postgres_connection.hpp>
#include <metrics/metrics_server.hpp>
#include <monitors/behavior_drift_monitor.hpp>
#include <pipeline/drift_pipeline.hpp>
#include <utils/stop_signal.hpp>
#include <iomanip>
#include <iostream>
#include <string>

using namespace Driftwatch;

static void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [config.json] [--serve] [--refusals]\n";
    std::cerr << "\nOptions:\n";
    std::cerr << "  --serve      keep serving /metrics after the run until interrupted\n";
    std::cerr << "  --refusals   print the most recent refusal examples after the run\n";
    std::cerr << "\nDatabase settings come from the config file or the PG* environment variables.\n";
}

int main(int argc, char** argv) {
    std::string config_path;
    bool serve = false;
    bool show_refusals = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--serve") {
            serve = true;
        } else if (arg == "--refusals") {
            show_refusals = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            print_usage(argv[0]);
            return 1;
        } else {
            config_path = arg;
        }
    }

    try {
        DriftConfig config = config_path.empty() ? DriftConfig{} : DriftConfig::load_file(config_path);
        config.apply_env();
        if (config.conninfo.empty()) {
            config.conninfo = PostgresConnection::conninfo_from_env();
        }

        PostgresLogAccessor logs(config.conninfo, config.statement_timeout_ms);
        HttpActionRunner runner(config.actions);

        auto registry = MetricsRegistry::with_drift_metrics();
        MetricsServer server(*registry);
        if (config.metrics_port > 0) {
            server.start("0.0.0.0", config.metrics_port);
        }

        DriftPipeline pipeline(config, logs, runner);
        pipeline.set_metrics_sink(registry.get());

        JsonFileReportSink file_sink(config.report_dir);
        pipeline.add_report_sink(&file_sink);

        PostgresEventSink event_sink(config.conninfo);
        if (config.record_runs_in_database) {
            pipeline.add_report_sink(&event_sink);
        }

        RunReport report = pipeline.run();

        std::cout << "\n=== Drift Run Complete ===\n"
                  << "Run ID: " << report.run_id << "\n"
                  << "Duration: " << std::fixed << std::setprecision(2) << report.duration_seconds << "s\n"
                  << "Outcome: " << to_string(report.outcome) << "\n"
                  << "Drift Detected: " << (report.drift.overall_drift_detected ? "yes" : "no") << "\n"
                  << "Overall Drift Score: " << std::setprecision(3) << report.drift.overall_drift_score << "\n";

        for (const auto& [monitor, message] : report.drift.failures) {
            std::cout << "Monitor failed: " << monitor << ": " << message << "\n";
        }

        std::cout << "\nActions Taken:";
        if (report.actions_taken.empty()) std::cout << " None";
        for (const auto& [action, outcome] : report.action_results) {
            std::cout << "\n  " << to_string(action) << ": "
                      << (outcome.succeeded() ? "success" : "failed (" + outcome.error + ")");
        }
        std::cout << "\n";

        if (show_refusals) {
            BehaviorDriftMonitor behavior(logs, config.behavior, config.max_rows_per_window);
            nlohmann::json examples = behavior.recent_refusals(Clock::now());
            std::cout << "\nRecent refusals:\n"
                      << examples.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
        }

        if (serve && server.running()) {
            install_stop_handlers();
            std::cout << "\nServing metrics on port " << config.metrics_port << " (Ctrl-C to stop)\n";
            wait_for_stop_signal();
            server.stop();
        }

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
