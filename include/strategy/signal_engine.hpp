#pragma once

#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "common/types.hpp"
#include "config/config.hpp"
#include "strategy/strategy_base.hpp"

namespace binbot {

/**
 * Combine indicator votes into a signal direction and confidence.
 * Confidence is the winning side's share of the total weight, rounded to a
 * whole percent and capped at max_confidence. Equal scores resolve to
 * tie_direction; no votes yields confidence 0.
 */
Signal aggregate_votes(const std::vector<IndicatorVote>& votes, int max_confidence, Direction tie_direction);

/**
 * Maintains a rolling price window per symbol and emits a Signal on every
 * tick once the window holds the strategy's minimum sample count.
 */
class SignalEngine {
public:
    using SignalCallback = std::function<void(const Signal&)>;

    SignalEngine(const SignalConfig& config, std::unique_ptr<SignalStrategy> strategy);

    // Feed one tick; returns the signal computed on it, if any
    std::optional<Signal> on_tick(const Tick& tick);

    // Seed a symbol's window from history (oldest first) without emitting
    void preload(const std::string& symbol, const std::vector<Tick>& history);

    void set_signal_callback(SignalCallback cb) { on_signal_ = std::move(cb); }

    // Drop a symbol's window (or every window)
    void reset(const std::string& symbol);
    void reset_all();

    size_t window_length(const std::string& symbol) const;
    size_t capacity() const { return capacity_; }
    const SignalStrategy& strategy() const { return *strategy_; }

    // Stats
    int64_t ticks_processed() const { return ticks_processed_; }
    int64_t signals_generated() const { return signals_generated_; }

private:
    SignalConfig config_;
    std::unique_ptr<SignalStrategy> strategy_;
    size_t capacity_;

    mutable std::mutex mutex_;
    std::map<std::string, std::deque<double>> windows_;

    SignalCallback on_signal_;

    int64_t ticks_processed_{0};
    int64_t signals_generated_{0};

    void push_price(std::deque<double>& window, double price);
};

} // namespace binbot
