#include "utils/metrics.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <vector>

namespace settle {

// LatencyHistogram implementation

LatencyHistogram::LatencyHistogram(const std::string& name, size_t max_samples)
    : name_(name)
    , max_samples_(max_samples)
{
}

void LatencyHistogram::record(Duration d) {
    std::lock_guard<std::mutex> lock(mutex_);

    window_ns_.push_back(d.count());
    if (window_ns_.size() > max_samples_) {
        window_ns_.pop_front();
    }
    count_++;
    sum_ns_ += d.count();
}

Duration LatencyHistogram::percentile(double p) const {
    std::vector<int64_t> sorted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sorted.assign(window_ns_.begin(), window_ns_.end());
    }
    if (sorted.empty()) return Duration::zero();

    size_t idx = static_cast<size_t>((p / 100.0) * static_cast<double>(sorted.size() - 1));
    std::nth_element(sorted.begin(), sorted.begin() + static_cast<std::ptrdiff_t>(idx), sorted.end());
    return Duration(sorted[idx]);
}

void LatencyHistogram::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    window_ns_.clear();
    count_ = 0;
    sum_ns_ = 0;
}

// Gauge implementation

void Gauge::increment(double delta) {
    double old = value_.load();
    while (!value_.compare_exchange_weak(old, old + delta)) {}
}

// MetricsRegistry implementation

MetricsRegistry& MetricsRegistry::instance() {
    static MetricsRegistry registry;
    return registry;
}

Counter& MetricsRegistry::counter(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = counters_[name];
    if (!slot) slot = std::make_unique<Counter>(name);
    return *slot;
}

Gauge& MetricsRegistry::gauge(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = gauges_[name];
    if (!slot) slot = std::make_unique<Gauge>(name);
    return *slot;
}

LatencyHistogram& MetricsRegistry::histogram(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = histograms_[name];
    if (!slot) slot = std::make_unique<LatencyHistogram>(name);
    return *slot;
}

nlohmann::json MetricsRegistry::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::json j;
    j["counters"] = nlohmann::json::object();
    j["gauges"] = nlohmann::json::object();
    j["histograms"] = nlohmann::json::object();

    for (const auto& [name, counter] : counters_) {
        j["counters"][name] = counter->value();
    }
    for (const auto& [name, gauge] : gauges_) {
        j["gauges"][name] = gauge->value();
    }
    for (const auto& [name, hist] : histograms_) {
        j["histograms"][name] = {
            {"count", hist->count()},
            {"p50_us", std::chrono::duration_cast<std::chrono::microseconds>(hist->p50()).count()},
            {"p95_us", std::chrono::duration_cast<std::chrono::microseconds>(hist->p95()).count()},
            {"p99_us", std::chrono::duration_cast<std::chrono::microseconds>(hist->p99()).count()}
        };
    }
    return j;
}

std::string MetricsRegistry::to_prometheus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string out;

    for (const auto& [name, counter] : counters_) {
        out += fmt::format("# TYPE settle_{0}_total counter\nsettle_{0}_total {1}\n",
                           name, counter->value());
    }
    for (const auto& [name, gauge] : gauges_) {
        out += fmt::format("# TYPE settle_{0} gauge\nsettle_{0} {1}\n", name, gauge->value());
    }
    for (const auto& [name, hist] : histograms_) {
        out += fmt::format("# TYPE settle_{}_seconds summary\n", name);
        const std::pair<const char*, Duration> quantiles[] = {
            {"0.5", hist->p50()}, {"0.95", hist->p95()}, {"0.99", hist->p99()}
        };
        for (const auto& [q, d] : quantiles) {
            out += fmt::format("settle_{}_seconds{{quantile=\"{}\"}} {:.6f}\n",
                               name, q, std::chrono::duration<double>(d).count());
        }
        out += fmt::format("settle_{}_seconds_sum {:.6f}\n", name,
                           static_cast<double>(hist->sum_ns()) / 1e9);
        out += fmt::format("settle_{}_seconds_count {}\n", name, hist->count());
    }
    return out;
}

void MetricsRegistry::reset_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [name, counter] : counters_) {
        counter->reset();
    }
    for (auto& [name, gauge] : gauges_) {
        gauge->set(0.0);
    }
    for (auto& [name, hist] : histograms_) {
        hist->reset();
    }
}

// ScopedLatency implementation

ScopedLatency::ScopedLatency(LatencyHistogram& histogram)
    : histogram_(histogram)
    , start_(now())
{
}

ScopedLatency::~ScopedLatency() {
    stop();
}

void ScopedLatency::stop() {
    if (!stopped_) {
        histogram_.record(now() - start_);
        stopped_ = true;
    }
}

} // namespace settle
