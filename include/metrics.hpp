#pragma once

#include <string>
#include <map>
#include <mutex>
#include <sstream>

namespace veil {

// Singleton Metrics Registry for anonymization observability.
// Advisory failures (best-effort store writes, degraded crypto, abuse signals)
// are surfaced here instead of being swallowed.
class MetricsRegistry {
public:
    /**
     * Access the global instance of the metrics registry.
     */
    static MetricsRegistry& instance() {
        static MetricsRegistry instance;
        return instance;
    }

    // Increment a cumulative counter (Only increases).
    void increment_counter(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_[name] += value;
    }

    double get_counter(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counters_.find(name);
        return (it != counters_.end()) ? it->second : 0.0;
    }

    // Sets a gauge to a specific instantaneous value.
    void set_gauge(const std::string& name, double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name] = value;
    }

    void increment_gauge(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name] += value;
    }

    void decrement_gauge(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name] -= value;
    }

    double get_gauge(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = gauges_.find(name);
        return (it != gauges_.end()) ? it->second : 0.0;
    }

    // Records one latency observation, exported as a Prometheus summary (_sum/_count).
    void observe_ms(const std::string& name, double millis) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& s = timings_[name];
        s.sum += millis;
        s.count += 1;
    }

    /**
     * Serializes all recorded metrics into Prometheus exposition format (text version 0.0.4).
     */
    std::string collect_prometheus() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::stringstream ss;

        for (const auto& [name, val] : counters_) {
            ss << "# TYPE " << name << " counter\n";
            ss << name << " " << val << "\n";
        }

        for (const auto& [name, val] : gauges_) {
            ss << "# TYPE " << name << " gauge\n";
            ss << name << " " << val << "\n";
        }

        for (const auto& [name, s] : timings_) {
            ss << "# TYPE " << name << " summary\n";
            ss << name << "_sum " << s.sum << "\n";
            ss << name << "_count " << s.count << "\n";
        }

        return ss.str();
    }

    // Clears every series. Intended for tests and process re-initialisation.
    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_.clear();
        gauges_.clear();
        timings_.clear();
    }

private:
    MetricsRegistry() = default;

    struct Summary {
        double sum = 0.0;
        unsigned long long count = 0;
    };

    std::map<std::string, double> counters_;
    std::map<std::string, double> gauges_;
    std::map<std::string, Summary> timings_;
    std::mutex mutex_;
};

}
