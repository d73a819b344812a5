#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <atomic>
#include <algorithm>
#include "common/types.hpp"

namespace binbot {

// Metric names shared by the connector and the trading loop
namespace metric_names {
    inline constexpr const char* REQUESTS_SENT = "venue.requests_sent";
    inline constexpr const char* REQUEST_TIMEOUTS = "venue.request_timeouts";
    inline constexpr const char* REQUEST_REJECTS = "venue.request_rejects";
    inline constexpr const char* LATE_RESPONSES = "venue.late_responses";
    inline constexpr const char* TICKS_RECEIVED = "venue.ticks_received";
    inline constexpr const char* RECONNECTS = "venue.reconnects";

    inline constexpr const char* SIGNALS_ACCEPTED = "trader.signals_accepted";
    inline constexpr const char* SIGNALS_IGNORED = "trader.signals_ignored";
    inline constexpr const char* TRADES_OPENED = "trader.trades_opened";
    inline constexpr const char* TRADES_WON = "trader.trades_won";
    inline constexpr const char* TRADES_LOST = "trader.trades_lost";
    inline constexpr const char* CYCLES_ABORTED = "trader.cycles_aborted";
    inline constexpr const char* CONTRACTS_STUCK = "trader.contracts_stuck";
    inline constexpr const char* PAUSES = "trader.pauses";
    inline constexpr const char* POLL_FAILURES = "tracker.poll_failures";
    inline constexpr const char* CUMULATIVE_PROFIT = "trader.cumulative_profit";
    inline constexpr const char* RECOVERY_LEVEL = "trader.recovery_level";
    inline constexpr const char* BALANCE = "trader.balance";
}

/**
 * Latency samples over a fixed-size ring; percentiles cover the most recent
 * `capacity` samples, count() covers everything recorded since reset().
 */
class LatencyHistogram {
public:
    explicit LatencyHistogram(size_t capacity = 4096);

    void record(Duration d);
    void record_since(Timestamp start);

    Duration p50() const;
    Duration p95() const;
    Duration max() const;
    Duration mean() const;

    int64_t count() const { return count_.load(); }
    void reset();

private:
    size_t capacity_;
    std::atomic<int64_t> count_{0};

    mutable std::mutex mutex_;
    std::vector<int64_t> ring_ns_;
    size_t next_{0};

    int64_t percentile_locked(double p) const;
};

enum class RequestOutcome {
    ANSWERED,
    REJECTED,
    TIMED_OUT
};

/**
 * Outcome counts and answer latency for one venue request type
 * (proposal, buy, proposal_open_contract...).
 */
class RequestStats {
public:
    void record(RequestOutcome outcome, Duration latency = Duration::zero());

    int64_t answered() const { return answered_.load(); }
    int64_t rejected() const { return rejected_.load(); }
    int64_t timed_out() const { return timed_out_.load(); }
    int64_t total() const { return answered() + rejected() + timed_out(); }
    const LatencyHistogram& latency() const { return latency_; }

    void reset();

private:
    std::atomic<int64_t> answered_{0};
    std::atomic<int64_t> rejected_{0};
    std::atomic<int64_t> timed_out_{0};
    LatencyHistogram latency_;  // Answered and rejected replies only
};

class Counter {
public:
    void increment(int64_t delta = 1) { value_ += delta; }
    int64_t value() const { return value_.load(); }
    void reset() { value_ = 0; }

private:
    std::atomic<int64_t> value_{0};
};

class Gauge {
public:
    void set(double value) { value_ = value; }
    double value() const { return value_.load(); }

private:
    std::atomic<double> value_{0.0};
};

/**
 * Process-wide metrics. Entries are created on first use and live until
 * exit, so references returned here stay valid.
 */
class MetricsRegistry {
public:
    static MetricsRegistry& instance();

    // Get or create metrics
    Counter& counter(const std::string& name);
    Gauge& gauge(const std::string& name);
    LatencyHistogram& histogram(const std::string& name);
    RequestStats& request(const std::string& request_name);

    // Export all metrics as JSON
    std::string to_json() const;

    // One line per request type, busiest first
    std::vector<std::string> request_report() const;

    // Reset all metrics
    void reset_all();

private:
    MetricsRegistry() = default;

    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<Counter>> counters_;
    std::map<std::string, std::unique_ptr<Gauge>> gauges_;
    std::map<std::string, std::unique_ptr<LatencyHistogram>> histograms_;
    std::map<std::string, std::unique_ptr<RequestStats>> requests_;
};

// Convenience macros
#define METRIC_COUNTER(name) ::binbot::MetricsRegistry::instance().counter(name)
#define METRIC_GAUGE(name) ::binbot::MetricsRegistry::instance().gauge(name)
#define METRIC_HISTOGRAM(name) ::binbot::MetricsRegistry::instance().histogram(name)
#define METRIC_REQUEST(name) ::binbot::MetricsRegistry::instance().request(name)

} // namespace binbot
