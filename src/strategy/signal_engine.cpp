#include "strategy/signal_engine.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace binbot {

Signal aggregate_votes(const std::vector<IndicatorVote>& votes, int max_confidence, Direction tie_direction) {
    Signal signal;
    for (const auto& vote : votes) {
        if (vote.side == Direction::RISE) signal.bullish_score += vote.weight;
        else signal.bearish_score += vote.weight;
    }
    signal.votes = votes;

    if (signal.bullish_score > signal.bearish_score) signal.direction = Direction::RISE;
    else if (signal.bearish_score > signal.bullish_score) signal.direction = Direction::FALL;
    else signal.direction = tie_direction;

    double total = signal.bullish_score + signal.bearish_score;
    if (total > 0) {
        double share = std::max(signal.bullish_score, signal.bearish_score) / total;
        int confidence = static_cast<int>(std::lround(share * 100.0));
        signal.confidence = std::min(confidence, max_confidence);
    }

    return signal;
}

SignalEngine::SignalEngine(const SignalConfig& config, std::unique_ptr<SignalStrategy> strategy)
    : config_(config)
    , strategy_(std::move(strategy))
    , capacity_(std::max(static_cast<size_t>(config.window_size), strategy_->min_ticks()))
{
    spdlog::info("SignalEngine initialized: strategy={} window={} min_ticks={}",
                 strategy_->name(), capacity_, strategy_->min_ticks());
}

void SignalEngine::push_price(std::deque<double>& window, double price) {
    window.push_back(price);
    while (window.size() > capacity_) {
        window.pop_front();
    }
}

std::optional<Signal> SignalEngine::on_tick(const Tick& tick) {
    std::vector<double> prices;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& window = windows_[tick.symbol];
        push_price(window, tick.price);
        ticks_processed_++;

        if (window.size() < strategy_->min_ticks()) {
            return std::nullopt;
        }
        prices.assign(window.begin(), window.end());
    }

    Signal signal = aggregate_votes(strategy_->evaluate(prices), config_.max_confidence, config_.tie_direction);
    signal.symbol = tick.symbol;
    signal.strategy_name = strategy_->name();
    signal.last_price = tick.price;
    signal.generated_at = now();
    signals_generated_++;

    spdlog::debug("Signal {} {} conf={} bull={:.1f} bear={:.1f}",
                  signal.symbol, direction_to_string(signal.direction),
                  signal.confidence, signal.bullish_score, signal.bearish_score);

    if (on_signal_) on_signal_(signal);
    return signal;
}

void SignalEngine::preload(const std::string& symbol, const std::vector<Tick>& history) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& window = windows_[symbol];
    for (const auto& tick : history) {
        push_price(window, tick.price);
    }
    spdlog::info("Preloaded {} ticks for {} (window {}/{})",
                 history.size(), symbol, window.size(), capacity_);
}

void SignalEngine::reset(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    windows_.erase(symbol);
}

void SignalEngine::reset_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    windows_.clear();
}

size_t SignalEngine::window_length(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = windows_.find(symbol);
    return it == windows_.end() ? 0 : it->second.size();
}

} // namespace binbot
