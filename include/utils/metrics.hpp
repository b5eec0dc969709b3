#pragma once

#include <string>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <atomic>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace settle {

/**
 * Sliding-window latency histogram. Keeps the most recent max_samples
 * observations for percentiles and an all-time count and sum.
 */
class LatencyHistogram {
public:
    explicit LatencyHistogram(const std::string& name, size_t max_samples = 4096);

    void record(Duration d);

    Duration p50() const { return percentile(50.0); }
    Duration p95() const { return percentile(95.0); }
    Duration p99() const { return percentile(99.0); }

    int64_t count() const { return count_.load(); }
    int64_t sum_ns() const { return sum_ns_.load(); }
    void reset();

    const std::string& name() const { return name_; }

private:
    std::string name_;
    size_t max_samples_;
    std::atomic<int64_t> count_{0};
    std::atomic<int64_t> sum_ns_{0};

    mutable std::mutex mutex_;
    std::deque<int64_t> window_ns_;

    Duration percentile(double p) const;
};

/**
 * Monotonic counter.
 */
class Counter {
public:
    explicit Counter(const std::string& name) : name_(name) {}

    void increment(int64_t delta = 1) { value_ += delta; }
    int64_t value() const { return value_.load(); }
    void reset() { value_ = 0; }

    const std::string& name() const { return name_; }

private:
    std::string name_;
    std::atomic<int64_t> value_{0};
};

/**
 * Gauge metric (can go up or down).
 */
class Gauge {
public:
    explicit Gauge(const std::string& name) : name_(name) {}

    void set(double value) { value_ = value; }
    void increment(double delta = 1.0);
    double value() const { return value_.load(); }

    const std::string& name() const { return name_; }

private:
    std::string name_;
    std::atomic<double> value_{0.0};
};

/**
 * Process-wide metrics, exported on GET /metrics.
 */
class MetricsRegistry {
public:
    static MetricsRegistry& instance();

    // Get or create metrics
    Counter& counter(const std::string& name);
    Gauge& gauge(const std::string& name);
    LatencyHistogram& histogram(const std::string& name);

    nlohmann::json to_json() const;

    // Prometheus text exposition, names prefixed with "settle_"
    std::string to_prometheus() const;

    void reset_all();

private:
    MetricsRegistry() = default;

    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<Counter>> counters_;
    std::map<std::string, std::unique_ptr<Gauge>> gauges_;
    std::map<std::string, std::unique_ptr<LatencyHistogram>> histograms_;
};

// Convenience macros
#define SETTLE_COUNTER(name) ::settle::MetricsRegistry::instance().counter(name)
#define SETTLE_GAUGE(name) ::settle::MetricsRegistry::instance().gauge(name)
#define SETTLE_HISTOGRAM(name) ::settle::MetricsRegistry::instance().histogram(name)

/**
 * Scoped latency measurement that records to histogram on destruction.
 */
class ScopedLatency {
public:
    explicit ScopedLatency(LatencyHistogram& histogram);
    ~ScopedLatency();

    void stop();  // Early stop

private:
    LatencyHistogram& histogram_;
    Timestamp start_;
    bool stopped_{false};
};

} // namespace settle
