#pragma once

#include <memory>
#include <string>
#include <vector>
#include "common/types.hpp"

namespace binbot {

/**
 * Base class for all signal strategies.
 * A strategy turns a price window into weighted bullish/bearish indicator
 * votes; the SignalEngine combines the votes into a direction and confidence.
 */
class SignalStrategy {
public:
    SignalStrategy(const std::string& name, size_t min_ticks,
                   int default_threshold = DEFAULT_CONFIDENCE_THRESHOLD);
    virtual ~SignalStrategy() = default;

    // Votes for the latest price in the window (oldest first)
    virtual std::vector<IndicatorVote> evaluate(const std::vector<double>& prices) const = 0;

    const std::string& name() const { return name_; }

    // Window length required before the strategy may vote
    size_t min_ticks() const { return min_ticks_; }

    // Entry threshold used when the trading config does not set one
    int default_confidence_threshold() const { return default_threshold_; }

protected:
    std::string name_;
    size_t min_ticks_;
    int default_threshold_;
};

/**
 * Momentum confluence: RSI(14), EMA 9/21 crossover, MACD histogram and a
 * 20-tick trend classifier. RSI carries double weight at the extremes.
 */
class MomentumStrategy : public SignalStrategy {
public:
    MomentumStrategy();

    std::vector<IndicatorVote> evaluate(const std::vector<double>& prices) const override;

private:
    static constexpr int RSI_PERIOD = 14;
    static constexpr int EMA_FAST = 9;
    static constexpr int EMA_SLOW = 21;
    static constexpr size_t TREND_LOOKBACK = 20;
};

/**
 * Multi-indicator confluence scored out of 100:
 * RSI 25, EMA crossover 20, MACD 15, Stochastic 15, ADX 15, z-score 10.
 * Entries default to 60% confidence.
 */
class MultiIndicatorStrategy : public SignalStrategy {
public:
    MultiIndicatorStrategy();

    std::vector<IndicatorVote> evaluate(const std::vector<double>& prices) const override;

private:
    static constexpr double RSI_WEIGHT = 25.0;
    static constexpr double EMA_WEIGHT = 20.0;
    static constexpr double MACD_WEIGHT = 15.0;
    static constexpr double STOCH_WEIGHT = 15.0;
    static constexpr double ADX_WEIGHT = 15.0;
    static constexpr double ZSCORE_WEIGHT = 10.0;

    static constexpr double RSI_OVERSOLD = 28.0;
    static constexpr double RSI_OVERBOUGHT = 72.0;
    static constexpr double STOCH_OVERSOLD = 20.0;
    static constexpr double STOCH_OVERBOUGHT = 80.0;
    static constexpr double ADX_MODERATE = 20.0;
    static constexpr double ZSCORE_EXTREME = 2.0;
};

// Throws std::invalid_argument for an unknown name
std::unique_ptr<SignalStrategy> make_strategy(const std::string& name);

// Names accepted by make_strategy
std::vector<std::string> strategy_names();

} // namespace binbot
