#include "strategy/strategy_base.hpp"
#include "indicators/indicators.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <cmath>
#include <stdexcept>

namespace binbot {

SignalStrategy::SignalStrategy(const std::string& name, size_t min_ticks, int default_threshold)
    : name_(name)
    , min_ticks_(min_ticks)
    , default_threshold_(default_threshold)
{
}

namespace {
    double last_defined(const std::vector<double>& series) {
        for (auto it = series.rbegin(); it != series.rend(); ++it) {
            if (!std::isnan(*it)) return *it;
        }
        return std::nan("");
    }

    void add_vote(std::vector<IndicatorVote>& votes, const std::string& indicator,
                  Direction side, double weight, const std::string& detail) {
        votes.push_back(IndicatorVote{indicator, side, weight, detail});
    }
}

// ============================================================================
// MomentumStrategy Implementation
// ============================================================================

MomentumStrategy::MomentumStrategy()
    : SignalStrategy("momentum", 35)  // MACD(12,26,9) needs 34 samples
{
}

std::vector<IndicatorVote> MomentumStrategy::evaluate(const std::vector<double>& prices) const {
    std::vector<IndicatorVote> votes;
    if (prices.size() < min_ticks_) return votes;

    if (auto rsi = indicators::rsi(prices, RSI_PERIOD)) {
        std::string detail = fmt::format("rsi={:.1f}", *rsi);
        if (*rsi < 30) add_vote(votes, "rsi", Direction::RISE, 2.0, detail + " oversold");
        else if (*rsi < 40) add_vote(votes, "rsi", Direction::RISE, 1.0, detail);
        else if (*rsi > 70) add_vote(votes, "rsi", Direction::FALL, 2.0, detail + " overbought");
        else if (*rsi > 60) add_vote(votes, "rsi", Direction::FALL, 1.0, detail);
    }

    double fast = last_defined(indicators::ema(prices, EMA_FAST));
    double slow = last_defined(indicators::ema(prices, EMA_SLOW));
    if (!std::isnan(fast) && !std::isnan(slow) && fast != slow) {
        add_vote(votes, "ema_cross", fast > slow ? Direction::RISE : Direction::FALL, 1.0,
                 fmt::format("ema{}={:.4f} ema{}={:.4f}", EMA_FAST, fast, EMA_SLOW, slow));
    }

    if (auto macd = indicators::macd(prices)) {
        add_vote(votes, "macd", macd->histogram > 0 ? Direction::RISE : Direction::FALL, 1.0,
                 fmt::format("hist={:.5f}", macd->histogram));
    }

    std::vector<double> recent(prices.end() - TREND_LOOKBACK, prices.end());
    auto pattern = indicators::analyze_tick_pattern(recent);
    if (pattern.trend != indicators::Trend::SIDEWAYS) {
        add_vote(votes, "trend", pattern.trend == indicators::Trend::UP ? Direction::RISE : Direction::FALL,
                 1.0, fmt::format("up_ratio={:.2f}", pattern.up_ratio));
    }

    return votes;
}

// ============================================================================
// MultiIndicatorStrategy Implementation
// ============================================================================

MultiIndicatorStrategy::MultiIndicatorStrategy()
    : SignalStrategy("multi_indicator", 50, 60)
{
}

std::vector<IndicatorVote> MultiIndicatorStrategy::evaluate(const std::vector<double>& prices) const {
    std::vector<IndicatorVote> votes;
    if (prices.size() < min_ticks_) return votes;

    if (auto rsi = indicators::rsi(prices)) {
        std::string detail = fmt::format("rsi={:.1f}", *rsi);
        if (*rsi < RSI_OVERSOLD) add_vote(votes, "rsi", Direction::RISE, RSI_WEIGHT, detail);
        else if (*rsi > RSI_OVERBOUGHT) add_vote(votes, "rsi", Direction::FALL, RSI_WEIGHT, detail);
        else if (*rsi < 40) add_vote(votes, "rsi", Direction::RISE, RSI_WEIGHT * 0.4, detail);
        else if (*rsi > 60) add_vote(votes, "rsi", Direction::FALL, RSI_WEIGHT * 0.4, detail);
    }

    double fast = last_defined(indicators::ema(prices, 9));
    double slow = last_defined(indicators::ema(prices, 21));
    if (!std::isnan(fast) && !std::isnan(slow) && fast != slow) {
        add_vote(votes, "ema_cross", fast > slow ? Direction::RISE : Direction::FALL, EMA_WEIGHT,
                 fmt::format("spread={:.5f}", fast - slow));
    }

    if (auto macd = indicators::macd(prices)) {
        if (macd->histogram > 0) {
            add_vote(votes, "macd", Direction::RISE, MACD_WEIGHT, fmt::format("hist={:.5f}", macd->histogram));
        } else if (macd->histogram < 0) {
            add_vote(votes, "macd", Direction::FALL, MACD_WEIGHT, fmt::format("hist={:.5f}", macd->histogram));
        }
    }

    if (auto stoch = indicators::stochastic(prices)) {
        std::string detail = fmt::format("k={:.1f} d={:.1f}", stoch->k, stoch->d);
        if (stoch->k < STOCH_OVERSOLD) add_vote(votes, "stochastic", Direction::RISE, STOCH_WEIGHT, detail);
        else if (stoch->k > STOCH_OVERBOUGHT) add_vote(votes, "stochastic", Direction::FALL, STOCH_WEIGHT, detail);
        else if (stoch->k > stoch->d) add_vote(votes, "stochastic", Direction::RISE, STOCH_WEIGHT / 2, detail);
        else if (stoch->k < stoch->d) add_vote(votes, "stochastic", Direction::FALL, STOCH_WEIGHT / 2, detail);
    }

    // Directional movement only counts when a trend is present
    if (auto adx = indicators::adx(prices)) {
        if (adx->adx >= ADX_MODERATE && adx->plus_di != adx->minus_di) {
            add_vote(votes, "adx", adx->plus_di > adx->minus_di ? Direction::RISE : Direction::FALL,
                     ADX_WEIGHT, fmt::format("adx={:.1f} +di={:.1f} -di={:.1f}", adx->adx, adx->plus_di, adx->minus_di));
        }
    }

    if (auto z = indicators::zscore(prices)) {
        if (*z <= -ZSCORE_EXTREME) add_vote(votes, "zscore", Direction::RISE, ZSCORE_WEIGHT, fmt::format("z={:.2f}", *z));
        else if (*z >= ZSCORE_EXTREME) add_vote(votes, "zscore", Direction::FALL, ZSCORE_WEIGHT, fmt::format("z={:.2f}", *z));
    }

    return votes;
}

std::unique_ptr<SignalStrategy> make_strategy(const std::string& name) {
    if (name == "momentum") return std::make_unique<MomentumStrategy>();
    if (name == "multi_indicator") return std::make_unique<MultiIndicatorStrategy>();
    throw std::invalid_argument("Unknown strategy: " + name);
}

std::vector<std::string> strategy_names() {
    return {"momentum", "multi_indicator"};
}

} // namespace binbot
