/**
 * @file metrics_registry.hpp
 * @brief Thread-safe gauges and counters rendered in Prometheus text format
 */

#pragma once

#include <export.hpp>
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>

namespace Driftwatch {

/**
 * @brief Where the pipeline publishes numbers. Implementations must tolerate
 * concurrent calls.
 */
class MetricsSink {
public:
    virtual ~MetricsSink() = default;

    virtual void set_gauge(const std::string& name, double value) = 0;
    virtual void add_to_gauge(const std::string& name, double delta) = 0;
    virtual void increment_counter(const std::string& name, uint64_t by = 1) = 0;
};

namespace metric_names {
    inline constexpr const char* kEmbeddingScore = "drift_embedding_score";
    inline constexpr const char* kBehaviorScore = "drift_behavior_score";
    inline constexpr const char* kAccuracyScore = "drift_accuracy_score";
    inline constexpr const char* kOverallScore = "drift_overall_score";
    inline constexpr const char* kModelAccuracy = "model_accuracy";
    inline constexpr const char* kRefusalRate = "model_refusal_rate";
    inline constexpr const char* kToxicityRate = "model_toxicity_rate";
    inline constexpr const char* kApiCost = "api_cost_usd_total";
    inline constexpr const char* kRetrainEvents = "retrain_events_total";
    inline constexpr const char* kReindexEvents = "reindex_events_total";
}

/**
 * @brief In-process metric store.
 *
 * Registration takes an exclusive lock; updates take a shared lock and
 * modify atomics, so concurrent increments never lose updates. Gauges
 * are last-writer-wins, counters only go up.
 */
class DRIFTWATCH_API MetricsRegistry : public MetricsSink {
public:
    MetricsRegistry() = default;

    /**
     * @brief Registry pre-populated with every drift metric the pipeline publishes
     */
    static std::unique_ptr<MetricsRegistry> with_drift_metrics();

    void register_gauge(const std::string& name, const std::string& help);
    void register_counter(const std::string& name, const std::string& help);

    /**
     * @throws std::invalid_argument for an unregistered name or a counter/gauge mix-up
     */
    void set_gauge(const std::string& name, double value) override;
    void add_to_gauge(const std::string& name, double delta) override;
    void increment_counter(const std::string& name, uint64_t by = 1) override;

    double gauge(const std::string& name) const;
    uint64_t counter(const std::string& name) const;

    /**
     * @brief Prometheus text exposition format 0.0.4
     */
    std::string render() const;

    static constexpr const char* kContentType = "text/plain; version=0.0.4; charset=utf-8";

private:
    enum class Kind { Gauge, Counter };

    struct Metric {
        Kind kind;
        std::string help;
        std::atomic<double> gauge{0.0};
        std::atomic<uint64_t> counter{0};
    };

    Metric& find(const std::string& name, Kind kind) const;
    void add(const std::string& name, const std::string& help, Kind kind);

    mutable std::shared_mutex mutex_;
    std::map<std::string, std::unique_ptr<Metric>> metrics_;
};

} // namespace Driftwatch
