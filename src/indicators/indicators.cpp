#include "indicators/indicators.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace binbot {
namespace indicators {

namespace {
    constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

    // Defined (non-NaN) tail of a series
    std::vector<double> defined_values(const std::vector<double>& series) {
        std::vector<double> out;
        out.reserve(series.size());
        for (double v : series) {
            if (!std::isnan(v)) out.push_back(v);
        }
        return out;
    }

    double mean_of(const std::vector<double>& values, size_t begin, size_t end) {
        double sum = std::accumulate(values.begin() + begin, values.begin() + end, 0.0);
        return sum / static_cast<double>(end - begin);
    }

    double stddev_of(const std::vector<double>& values, size_t begin, size_t end, double mean) {
        double sq = 0.0;
        for (size_t i = begin; i < end; i++) {
            double d = values[i] - mean;
            sq += d * d;
        }
        return std::sqrt(sq / static_cast<double>(end - begin));
    }
}

std::vector<double> sma(const std::vector<double>& values, int period) {
    std::vector<double> out(values.size(), NaN);
    if (period <= 0 || values.size() < static_cast<size_t>(period)) return out;

    double sum = 0.0;
    for (size_t i = 0; i < values.size(); i++) {
        sum += values[i];
        if (i >= static_cast<size_t>(period)) {
            sum -= values[i - period];
        }
        if (i + 1 >= static_cast<size_t>(period)) {
            out[i] = sum / period;
        }
    }
    return out;
}

std::vector<double> ema(const std::vector<double>& values, int period) {
    std::vector<double> out(values.size(), NaN);
    if (period <= 0 || values.size() < static_cast<size_t>(period)) return out;

    double k = 2.0 / (period + 1);
    double prev = mean_of(values, 0, period);
    out[period - 1] = prev;

    for (size_t i = period; i < values.size(); i++) {
        prev = values[i] * k + prev * (1.0 - k);
        out[i] = prev;
    }
    return out;
}

std::optional<double> rsi(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period) + 1) return std::nullopt;

    double gains = 0.0;
    double losses = 0.0;
    for (size_t i = prices.size() - period; i < prices.size(); i++) {
        double change = prices[i] - prices[i - 1];
        if (change > 0) gains += change;
        else losses -= change;
    }

    double avg_gain = gains / period;
    double avg_loss = losses / period;

    if (avg_loss == 0.0) {
        return avg_gain == 0.0 ? 50.0 : 100.0;
    }

    double rs = avg_gain / avg_loss;
    return 100.0 - (100.0 / (1.0 + rs));
}

std::optional<Macd> macd(const std::vector<double>& prices, int fast, int slow, int signal) {
    if (prices.size() < static_cast<size_t>(slow + signal - 1)) return std::nullopt;

    auto fast_ema = ema(prices, fast);
    auto slow_ema = ema(prices, slow);

    std::vector<double> line;
    line.reserve(prices.size());
    for (size_t i = 0; i < prices.size(); i++) {
        if (!std::isnan(fast_ema[i]) && !std::isnan(slow_ema[i])) {
            line.push_back(fast_ema[i] - slow_ema[i]);
        }
    }

    auto signal_line = defined_values(ema(line, signal));
    if (signal_line.empty()) return std::nullopt;

    Macd result;
    result.macd = line.back();
    result.signal = signal_line.back();
    result.histogram = result.macd - result.signal;
    return result;
}

std::optional<Stochastic> stochastic(const std::vector<double>& prices, int k_period, int d_period) {
    if (k_period <= 0 || d_period <= 0) return std::nullopt;
    if (prices.size() < static_cast<size_t>(k_period + d_period - 1)) return std::nullopt;

    std::vector<double> k_values;
    for (size_t end = prices.size() - d_period + 1; end <= prices.size(); end++) {
        auto first = prices.begin() + (end - k_period);
        auto last = prices.begin() + end;
        auto [lo, hi] = std::minmax_element(first, last);
        double range = *hi - *lo;
        double close = prices[end - 1];
        k_values.push_back(range > 0 ? (close - *lo) / range * 100.0 : 50.0);
    }

    Stochastic result;
    result.k = k_values.back();
    result.d = mean_of(k_values, 0, k_values.size());
    return result;
}

std::optional<BollingerBands> bollinger(const std::vector<double>& prices, int period, double num_std) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) return std::nullopt;

    size_t begin = prices.size() - period;
    double middle = mean_of(prices, begin, prices.size());
    double sd = stddev_of(prices, begin, prices.size(), middle);

    BollingerBands bands;
    bands.middle = middle;
    bands.upper = middle + num_std * sd;
    bands.lower = middle - num_std * sd;
    double width = bands.upper - bands.lower;
    bands.percent_b = width > 0 ? (prices.back() - bands.lower) / width : 0.5;
    return bands;
}

std::optional<double> atr(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period) + 1) return std::nullopt;

    double sum = 0.0;
    for (size_t i = prices.size() - period; i < prices.size(); i++) {
        sum += std::abs(prices[i] - prices[i - 1]);
    }
    return sum / period;
}

std::optional<Adx> adx(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(2 * period)) return std::nullopt;

    std::vector<double> tr, plus_dm, minus_dm;
    for (size_t i = 1; i < prices.size(); i++) {
        double up = prices[i] - prices[i - 1];
        double down = prices[i - 1] - prices[i];
        tr.push_back(std::abs(up));
        plus_dm.push_back(up > down && up > 0 ? up : 0.0);
        minus_dm.push_back(down > up && down > 0 ? down : 0.0);
    }

    auto tr_s = ema(tr, period);
    auto plus_s = ema(plus_dm, period);
    auto minus_s = ema(minus_dm, period);

    std::vector<double> dx;
    double plus_di = 0.0;
    double minus_di = 0.0;
    for (size_t i = 0; i < tr_s.size(); i++) {
        if (std::isnan(tr_s[i])) continue;
        if (tr_s[i] <= 0) {
            plus_di = 0.0;
            minus_di = 0.0;
            dx.push_back(0.0);
            continue;
        }
        plus_di = 100.0 * plus_s[i] / tr_s[i];
        minus_di = 100.0 * minus_s[i] / tr_s[i];
        double sum = plus_di + minus_di;
        dx.push_back(sum > 0 ? 100.0 * std::abs(plus_di - minus_di) / sum : 0.0);
    }

    auto adx_series = defined_values(ema(dx, period));
    if (adx_series.empty()) return std::nullopt;

    Adx result;
    result.adx = adx_series.back();
    result.plus_di = plus_di;
    result.minus_di = minus_di;
    return result;
}

std::optional<double> zscore(const std::vector<double>& prices, int period) {
    if (period <= 1 || prices.size() < static_cast<size_t>(period)) return std::nullopt;

    size_t begin = prices.size() - period;
    double mean = mean_of(prices, begin, prices.size());
    double sd = stddev_of(prices, begin, prices.size(), mean);
    if (sd == 0.0) return 0.0;
    return (prices.back() - mean) / sd;
}

TickPattern analyze_tick_pattern(const std::vector<double>& prices) {
    TickPattern pattern;
    if (prices.size() < 5) return pattern;

    int ups = 0;
    int downs = 0;
    int last_direction = 0;
    for (size_t i = 1; i < prices.size(); i++) {
        double diff = prices[i] - prices[i - 1];
        int direction = diff > 0 ? 1 : (diff < 0 ? -1 : 0);
        if (direction == 0) continue;

        if (direction > 0) ups++;
        else downs++;

        if (direction == last_direction) {
            pattern.consecutive++;
        } else {
            pattern.consecutive = 1;
            last_direction = direction;
        }
    }

    int total = ups + downs;
    pattern.up_ratio = total > 0 ? static_cast<double>(ups) / total : 0.5;
    pattern.strength = std::abs(pattern.up_ratio - 0.5) * 200.0;

    if (pattern.up_ratio > 0.6) pattern.trend = Trend::UP;
    else if (pattern.up_ratio < 0.4) pattern.trend = Trend::DOWN;
    else pattern.trend = Trend::SIDEWAYS;

    return pattern;
}

MarketRegime classify_regime(double adx_value) {
    if (adx_value >= 25.0) return MarketRegime::TRENDING;
    if (adx_value <= 15.0) return MarketRegime::RANGING;
    return MarketRegime::TRANSITIONAL;
}

} // namespace indicators
} // namespace binbot
