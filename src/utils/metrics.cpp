#include "utils/metrics.hpp"
#include <nlohmann/json.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <numeric>

namespace binbot {

namespace {

int64_t to_ms(Duration d) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
}

nlohmann::json latency_json(const LatencyHistogram& hist) {
    return {
        {"count", hist.count()},
        {"mean_ms", to_ms(hist.mean())},
        {"p50_ms", to_ms(hist.p50())},
        {"p95_ms", to_ms(hist.p95())},
        {"max_ms", to_ms(hist.max())}
    };
}

} // namespace

LatencyHistogram::LatencyHistogram(size_t capacity)
    : capacity_(std::max<size_t>(capacity, 1))
{
    ring_ns_.reserve(capacity_);
}

void LatencyHistogram::record(Duration d) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ring_ns_.size() < capacity_) {
        ring_ns_.push_back(d.count());
    } else {
        ring_ns_[next_] = d.count();
    }
    next_ = (next_ + 1) % capacity_;
    count_++;
}

void LatencyHistogram::record_since(Timestamp start) {
    record(std::chrono::duration_cast<Duration>(now() - start));
}

int64_t LatencyHistogram::percentile_locked(double p) const {
    if (ring_ns_.empty()) return 0;

    std::vector<int64_t> samples = ring_ns_;
    size_t idx = static_cast<size_t>((p / 100.0) * (samples.size() - 1));
    std::nth_element(samples.begin(), samples.begin() + idx, samples.end());
    return samples[idx];
}

Duration LatencyHistogram::p50() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Duration(percentile_locked(50.0));
}

Duration LatencyHistogram::p95() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Duration(percentile_locked(95.0));
}

Duration LatencyHistogram::max() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ring_ns_.empty()) return Duration::zero();
    return Duration(*std::max_element(ring_ns_.begin(), ring_ns_.end()));
}

Duration LatencyHistogram::mean() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ring_ns_.empty()) return Duration::zero();
    int64_t sum = std::accumulate(ring_ns_.begin(), ring_ns_.end(), int64_t{0});
    return Duration(sum / static_cast<int64_t>(ring_ns_.size()));
}

void LatencyHistogram::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    ring_ns_.clear();
    next_ = 0;
    count_ = 0;
}

void RequestStats::record(RequestOutcome outcome, Duration latency) {
    switch (outcome) {
        case RequestOutcome::ANSWERED:
            answered_++;
            latency_.record(latency);
            break;
        case RequestOutcome::REJECTED:
            rejected_++;
            latency_.record(latency);
            break;
        case RequestOutcome::TIMED_OUT:
            timed_out_++;
            break;
    }
}

void RequestStats::reset() {
    answered_ = 0;
    rejected_ = 0;
    timed_out_ = 0;
    latency_.reset();
}

MetricsRegistry& MetricsRegistry::instance() {
    static MetricsRegistry registry;
    return registry;
}

Counter& MetricsRegistry::counter(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = counters_[name];
    if (!slot) slot = std::make_unique<Counter>();
    return *slot;
}

Gauge& MetricsRegistry::gauge(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = gauges_[name];
    if (!slot) slot = std::make_unique<Gauge>();
    return *slot;
}

LatencyHistogram& MetricsRegistry::histogram(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = histograms_[name];
    if (!slot) slot = std::make_unique<LatencyHistogram>();
    return *slot;
}

RequestStats& MetricsRegistry::request(const std::string& request_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = requests_[request_name];
    if (!slot) slot = std::make_unique<RequestStats>();
    return *slot;
}

std::string MetricsRegistry::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::json j;
    j["counters"] = nlohmann::json::object();
    for (const auto& [name, counter] : counters_) {
        j["counters"][name] = counter->value();
    }
    j["gauges"] = nlohmann::json::object();
    for (const auto& [name, gauge] : gauges_) {
        j["gauges"][name] = gauge->value();
    }
    j["histograms"] = nlohmann::json::object();
    for (const auto& [name, hist] : histograms_) {
        j["histograms"][name] = latency_json(*hist);
    }
    j["requests"] = nlohmann::json::object();
    for (const auto& [name, stats] : requests_) {
        nlohmann::json r;
        r["answered"] = stats->answered();
        r["rejected"] = stats->rejected();
        r["timed_out"] = stats->timed_out();
        r["latency"] = latency_json(stats->latency());
        j["requests"][name] = r;
    }
    return j.dump(2);
}

std::vector<std::string> MetricsRegistry::request_report() const {
    std::vector<std::pair<std::string, const RequestStats*>> rows;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [name, stats] : requests_) {
            if (stats->total() > 0) rows.emplace_back(name, stats.get());
        }
    }
    std::stable_sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
        return a.second->total() > b.second->total();
    });

    std::vector<std::string> lines;
    lines.reserve(rows.size());
    for (const auto& [name, stats] : rows) {
        const auto& hist = stats->latency();
        lines.push_back(fmt::format("{}: {} sent, {} rejected, {} timed out, p50 {}ms, p95 {}ms, max {}ms",
                                    name, stats->total(), stats->rejected(), stats->timed_out(),
                                    to_ms(hist.p50()), to_ms(hist.p95()), to_ms(hist.max())));
    }
    return lines;
}

void MetricsRegistry::reset_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [name, counter] : counters_) counter->reset();
    for (auto& [name, gauge] : gauges_) gauge->set(0.0);
    for (auto& [name, hist] : histograms_) hist->reset();
    for (auto& [name, stats] : requests_) stats->reset();
}

} // namespace binbot
