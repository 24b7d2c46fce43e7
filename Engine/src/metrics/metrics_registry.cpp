/**
 * @file metrics_registry.cpp
 * @brief Metric storage and Prometheus rendering
 */

#include <metrics/metrics_registry.hpp>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace Driftwatch {

std::unique_ptr<MetricsRegistry> MetricsRegistry::with_drift_metrics() {
    auto registry = std::make_unique<MetricsRegistry>();
    namespace m = metric_names;

    registry->register_gauge(m::kEmbeddingScore, "Embedding drift score (0-1)");
    registry->register_gauge(m::kBehaviorScore, "Behavior metrics drift score (0-1)");
    registry->register_gauge(m::kAccuracyScore, "Accuracy drift score (0-1)");
    registry->register_gauge(m::kOverallScore, "Overall drift score (0-1)");
    registry->register_gauge(m::kModelAccuracy, "Current model accuracy");
    registry->register_gauge(m::kRefusalRate, "Model refusal rate");
    registry->register_gauge(m::kToxicityRate, "Model toxicity rate");
    registry->register_gauge(m::kApiCost, "Total API cost in USD");
    registry->register_counter(m::kRetrainEvents, "Total number of retraining events");
    registry->register_counter(m::kReindexEvents, "Total number of document reindexing events");

    return registry;
}

void MetricsRegistry::add(const std::string& name, const std::string& help, Kind kind) {
    std::unique_lock lock(mutex_);
    auto it = metrics_.find(name);
    if (it != metrics_.end()) {
        if (it->second->kind != kind) {
            throw std::invalid_argument("Metric '" + name + "' already registered with another type");
        }
        return;
    }
    auto metric = std::make_unique<Metric>();
    metric->kind = kind;
    metric->help = help;
    metrics_.emplace(name, std::move(metric));
}

void MetricsRegistry::register_gauge(const std::string& name, const std::string& help) {
    add(name, help, Kind::Gauge);
}

void MetricsRegistry::register_counter(const std::string& name, const std::string& help) {
    add(name, help, Kind::Counter);
}

MetricsRegistry::Metric& MetricsRegistry::find(const std::string& name, Kind kind) const {
    auto it = metrics_.find(name);
    if (it == metrics_.end()) {
        throw std::invalid_argument("Unknown metric '" + name + "'");
    }
    if (it->second->kind != kind) {
        throw std::invalid_argument("Metric '" + name + "' is not a " +
                                    (kind == Kind::Gauge ? "gauge" : "counter"));
    }
    return *it->second;
}

void MetricsRegistry::set_gauge(const std::string& name, double value) {
    std::shared_lock lock(mutex_);
    find(name, Kind::Gauge).gauge.store(value);
}

void MetricsRegistry::add_to_gauge(const std::string& name, double delta) {
    std::shared_lock lock(mutex_);
    auto& g = find(name, Kind::Gauge).gauge;
    double current = g.load();
    while (!g.compare_exchange_weak(current, current + delta)) {
    }
}

void MetricsRegistry::increment_counter(const std::string& name, uint64_t by) {
    std::shared_lock lock(mutex_);
    find(name, Kind::Counter).counter.fetch_add(by);
}

double MetricsRegistry::gauge(const std::string& name) const {
    std::shared_lock lock(mutex_);
    return find(name, Kind::Gauge).gauge.load();
}

uint64_t MetricsRegistry::counter(const std::string& name) const {
    std::shared_lock lock(mutex_);
    return find(name, Kind::Counter).counter.load();
}

std::string MetricsRegistry::render() const {
    std::shared_lock lock(mutex_);
    std::ostringstream out;
    out.precision(15);

    for (const auto& [name, metric] : metrics_) {
        out << "# HELP " << name << ' ' << metric->help << '\n';
        if (metric->kind == Kind::Gauge) {
            out << "# TYPE " << name << " gauge\n";
            out << name << ' ' << metric->gauge.load() << '\n';
        } else {
            out << "# TYPE " << name << " counter\n";
            out << name << ' ' << metric->counter.load() << '\n';
        }
    }
    return out.str();
}

} // namespace Driftwatch
