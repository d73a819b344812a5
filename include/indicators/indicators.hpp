#pragma once

#include <vector>
#include <optional>
#include <string>

namespace binbot {
namespace indicators {

// Series-valued indicators return one value per input sample; samples before
// the first complete window hold NaN. Scalar indicators return the latest
// value, or nullopt when the series is too short.

std::vector<double> sma(const std::vector<double>& values, int period);

// Seeded with the SMA of the first `period` samples
std::vector<double> ema(const std::vector<double>& values, int period);

// Simple-average RSI over the last `period` changes
std::optional<double> rsi(const std::vector<double>& prices, int period = 14);

struct Macd {
    double macd{0.0};
    double signal{0.0};
    double histogram{0.0};
};

std::optional<Macd> macd(const std::vector<double>& prices,
                         int fast = 12, int slow = 26, int signal = 9);

struct Stochastic {
    double k{0.0};
    double d{0.0};
};

// Tick series have no high/low, so each price serves as its own range
std::optional<Stochastic> stochastic(const std::vector<double>& prices,
                                     int k_period = 14, int d_period = 3);

struct BollingerBands {
    double upper{0.0};
    double middle{0.0};
    double lower{0.0};
    double percent_b{0.5};   // 0 at lower band, 1 at upper band
};

std::optional<BollingerBands> bollinger(const std::vector<double>& prices,
                                        int period = 20, double num_std = 2.0);

// Mean absolute tick-to-tick move
std::optional<double> atr(const std::vector<double>& prices, int period = 14);

struct Adx {
    double adx{0.0};
    double plus_di{0.0};
    double minus_di{0.0};
};

std::optional<Adx> adx(const std::vector<double>& prices, int period = 14);

// Distance of the last price from the window mean, in standard deviations
std::optional<double> zscore(const std::vector<double>& prices, int period = 20);

enum class Trend {
    UP,
    DOWN,
    SIDEWAYS
};

inline std::string trend_to_string(Trend t) {
    switch (t) {
        case Trend::UP: return "up";
        case Trend::DOWN: return "down";
        case Trend::SIDEWAYS: return "sideways";
    }
    return "unknown";
}

struct TickPattern {
    Trend trend{Trend::SIDEWAYS};
    double up_ratio{0.5};     // Up moves over all non-flat moves
    double strength{0.0};     // 0..100
    int consecutive{0};       // Length of the current run
};

/**
 * Classify the direction of a short price series by counting up and down
 * moves. UP above 60% up moves, DOWN below 40%.
 */
TickPattern analyze_tick_pattern(const std::vector<double>& prices);

enum class MarketRegime {
    TRENDING,
    RANGING,
    TRANSITIONAL
};

// ADX >= 25 trends, ADX <= 15 ranges
MarketRegime classify_regime(double adx_value);

} // namespace indicators
} // namespace binbot
