#include <gtest/gtest.h>
#include <algorithm>
#include "strategy/signal_engine.hpp"
#include "strategy/strategy_base.hpp"

using namespace binbot;

namespace {

// Returns the same votes for any window
class ScriptedStrategy : public SignalStrategy {
public:
    ScriptedStrategy(size_t min_ticks, std::vector<IndicatorVote> votes)
        : SignalStrategy("scripted", min_ticks)
        , votes_(std::move(votes))
    {}

    std::vector<IndicatorVote> evaluate(const std::vector<double>& prices) const override {
        last_window_ = prices.size();
        return votes_;
    }

    mutable size_t last_window_{0};

private:
    std::vector<IndicatorVote> votes_;
};

IndicatorVote vote(Direction side, double weight = 1.0) {
    return IndicatorVote{"test", side, weight, ""};
}

const IndicatorVote* find_vote(const std::vector<IndicatorVote>& votes, const std::string& indicator) {
    auto it = std::find_if(votes.begin(), votes.end(),
                           [&](const IndicatorVote& v) { return v.indicator == indicator; });
    return it == votes.end() ? nullptr : &*it;
}

} // namespace

class SignalEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.window_size = 10;
        config_.max_confidence = 95;
        config_.tie_direction = Direction::FALL;
    }

    Tick tick(const std::string& symbol, double price) {
        Tick t;
        t.symbol = symbol;
        t.price = price;
        t.received = now();
        return t;
    }

    SignalConfig config_;
};

TEST_F(SignalEngineTest, AggregateVotes_MajorityDirectionAndConfidence) {
    std::vector<IndicatorVote> votes = {
        vote(Direction::RISE), vote(Direction::RISE), vote(Direction::RISE),
        vote(Direction::RISE), vote(Direction::FALL)
    };

    Signal s = aggregate_votes(votes, 95, Direction::FALL);

    EXPECT_EQ(s.direction, Direction::RISE);
    EXPECT_EQ(s.confidence, 80);
    EXPECT_DOUBLE_EQ(s.bullish_score, 4.0);
    EXPECT_DOUBLE_EQ(s.bearish_score, 1.0);
}

TEST_F(SignalEngineTest, AggregateVotes_WeightsCount) {
    Signal s = aggregate_votes({vote(Direction::RISE, 1.0), vote(Direction::FALL, 3.0)}, 95, Direction::RISE);

    EXPECT_EQ(s.direction, Direction::FALL);
    EXPECT_EQ(s.confidence, 75);
}

TEST_F(SignalEngineTest, AggregateVotes_TieUsesConfiguredDirection) {
    std::vector<IndicatorVote> votes = {vote(Direction::RISE, 2.0), vote(Direction::FALL, 2.0)};

    EXPECT_EQ(aggregate_votes(votes, 95, Direction::FALL).direction, Direction::FALL);
    EXPECT_EQ(aggregate_votes(votes, 95, Direction::RISE).direction, Direction::RISE);
    EXPECT_EQ(aggregate_votes(votes, 95, Direction::FALL).confidence, 50);
}

TEST_F(SignalEngineTest, AggregateVotes_ConfidenceCappedBelowHundred) {
    Signal s = aggregate_votes({vote(Direction::RISE), vote(Direction::RISE)}, 95, Direction::FALL);

    EXPECT_EQ(s.direction, Direction::RISE);
    EXPECT_EQ(s.confidence, 95);
}

TEST_F(SignalEngineTest, AggregateVotes_NoVotesHasZeroConfidence) {
    Signal s = aggregate_votes({}, 95, Direction::FALL);

    EXPECT_EQ(s.confidence, 0);
    EXPECT_EQ(s.direction, Direction::FALL);
}

TEST_F(SignalEngineTest, OnTick_NoSignalBeforeMinimumWindow) {
    SignalEngine engine(config_, std::make_unique<ScriptedStrategy>(5, std::vector<IndicatorVote>{vote(Direction::RISE)}));
    int callbacks = 0;
    engine.set_signal_callback([&](const Signal&) { callbacks++; });

    for (int i = 0; i < 4; i++) {
        EXPECT_FALSE(engine.on_tick(tick("R_100", 100.0 + i)).has_value());
    }
    auto signal = engine.on_tick(tick("R_100", 104.0));

    ASSERT_TRUE(signal.has_value());
    EXPECT_EQ(signal->symbol, "R_100");
    EXPECT_EQ(signal->strategy_name, "scripted");
    EXPECT_DOUBLE_EQ(signal->last_price, 104.0);
    EXPECT_EQ(callbacks, 1);
    EXPECT_EQ(engine.signals_generated(), 1);
    EXPECT_EQ(engine.ticks_processed(), 5);
}

TEST_F(SignalEngineTest, OnTick_WindowIsBounded) {
    auto strategy = std::make_unique<ScriptedStrategy>(3, std::vector<IndicatorVote>{vote(Direction::FALL)});
    auto* scripted = strategy.get();
    SignalEngine engine(config_, std::move(strategy));

    for (int i = 0; i < 25; i++) {
        engine.on_tick(tick("R_100", 100.0 + i));
    }

    EXPECT_EQ(engine.window_length("R_100"), 10u);
    EXPECT_EQ(scripted->last_window_, 10u);
}

TEST_F(SignalEngineTest, Capacity_CoversStrategyMinimum) {
    SignalEngine engine(config_, std::make_unique<ScriptedStrategy>(50, std::vector<IndicatorVote>{}));

    EXPECT_EQ(engine.capacity(), 50u);
}

TEST_F(SignalEngineTest, Preload_CountsTowardMinimumWindow) {
    SignalEngine engine(config_, std::make_unique<ScriptedStrategy>(5, std::vector<IndicatorVote>{vote(Direction::RISE)}));
    std::vector<Tick> history;
    for (int i = 0; i < 4; i++) {
        history.push_back(tick("R_100", 100.0 + i));
    }

    engine.preload("R_100", history);

    EXPECT_EQ(engine.window_length("R_100"), 4u);
    EXPECT_EQ(engine.signals_generated(), 0);
    EXPECT_TRUE(engine.on_tick(tick("R_100", 105.0)).has_value());
}

TEST_F(SignalEngineTest, Windows_AreKeptPerSymbol) {
    SignalEngine engine(config_, std::make_unique<ScriptedStrategy>(3, std::vector<IndicatorVote>{vote(Direction::RISE)}));

    engine.on_tick(tick("R_100", 1.0));
    engine.on_tick(tick("R_100", 2.0));
    engine.on_tick(tick("R_50", 1.0));

    EXPECT_EQ(engine.window_length("R_100"), 2u);
    EXPECT_EQ(engine.window_length("R_50"), 1u);
    EXPECT_FALSE(engine.on_tick(tick("R_50", 2.0)).has_value());
    EXPECT_TRUE(engine.on_tick(tick("R_100", 3.0)).has_value());

    engine.reset("R_100");
    EXPECT_EQ(engine.window_length("R_100"), 0u);
}

TEST_F(SignalEngineTest, MakeStrategy_KnownAndUnknownNames) {
    auto momentum = make_strategy("momentum");
    EXPECT_EQ(momentum->name(), "momentum");
    EXPECT_EQ(momentum->min_ticks(), 35u);

    EXPECT_EQ(make_strategy("multi_indicator")->min_ticks(), 50u);
    EXPECT_THROW(make_strategy("martingale_magic"), std::invalid_argument);
}

TEST_F(SignalEngineTest, MakeStrategy_DefaultEntryThresholds) {
    EXPECT_EQ(make_strategy("momentum")->default_confidence_threshold(), 70);
    EXPECT_EQ(make_strategy("multi_indicator")->default_confidence_threshold(), 60);
}

TEST_F(SignalEngineTest, Momentum_NoVotesBelowMinimum) {
    MomentumStrategy strategy;
    std::vector<double> prices(34, 100.0);

    EXPECT_TRUE(strategy.evaluate(prices).empty());
}

TEST_F(SignalEngineTest, Momentum_SteadyClimbIsOverboughtAndTrendingUp) {
    MomentumStrategy strategy;
    std::vector<double> prices;
    for (int i = 0; i < 60; i++) prices.push_back(100.0 + i * 0.5);

    auto votes = strategy.evaluate(prices);

    auto rsi = find_vote(votes, "rsi");
    ASSERT_NE(rsi, nullptr);
    EXPECT_EQ(rsi->side, Direction::FALL);
    EXPECT_DOUBLE_EQ(rsi->weight, 2.0);

    auto trend = find_vote(votes, "trend");
    ASSERT_NE(trend, nullptr);
    EXPECT_EQ(trend->side, Direction::RISE);

    auto ema = find_vote(votes, "ema_cross");
    ASSERT_NE(ema, nullptr);
    EXPECT_EQ(ema->side, Direction::RISE);
}

TEST_F(SignalEngineTest, MultiIndicator_SteadyDeclineVotes) {
    MultiIndicatorStrategy strategy;
    std::vector<double> prices;
    for (int i = 0; i < 80; i++) prices.push_back(200.0 - i * 0.5);

    auto votes = strategy.evaluate(prices);

    auto rsi = find_vote(votes, "rsi");
    ASSERT_NE(rsi, nullptr);
    EXPECT_EQ(rsi->side, Direction::RISE);
    EXPECT_DOUBLE_EQ(rsi->weight, 25.0);

    auto adx = find_vote(votes, "adx");
    ASSERT_NE(adx, nullptr);
    EXPECT_EQ(adx->side, Direction::FALL);

    auto stoch = find_vote(votes, "stochastic");
    ASSERT_NE(stoch, nullptr);
    EXPECT_EQ(stoch->side, Direction::RISE);
}

TEST_F(SignalEngineTest, Engine_WithMomentumEmitsBoundedConfidence) {
    config_.window_size = 100;
    SignalEngine engine(config_, make_strategy("momentum"));
    std::optional<Signal> last;

    for (int i = 0; i < 60; i++) {
        last = engine.on_tick(tick("R_100", 100.0 + i * 0.5));
    }

    ASSERT_TRUE(last.has_value());
    EXPECT_GE(last->confidence, 0);
    EXPECT_LE(last->confidence, 95);
    EXPECT_EQ(engine.signals_generated(), 26);
}
