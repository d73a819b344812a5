#include <gtest/gtest.h>
#include "risk/stake_manager.hpp"
#include "common/errors.hpp"
#include <chrono>
#include <thread>

using namespace binbot;

class StakeManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.base_stake = 1.0;
        config_.recovery_mode = RecoveryMode::GEOMETRIC;
        config_.recovery_multiplier = 2.0;
        config_.max_recovery_level = 5;
        config_.max_stake_fraction = 0.5;
        config_.target_profit = 10.0;
        config_.stop_loss = 20.0;
        config_.max_trades = 0;

        stake_manager_ = std::make_unique<StakeManager>(config_);
    }

    TradingConfig config_;
    std::unique_ptr<StakeManager> stake_manager_;

    Contract settled(ContractStatus status, Money profit) {
        Contract contract;
        contract.contract_id = 42;
        contract.status = status;
        contract.profit = profit;
        return contract;
    }

    void lose(Money amount = 1.0) {
        stake_manager_->record_outcome(settled(ContractStatus::LOST, -amount));
    }

    void win(Money amount = 0.95) {
        stake_manager_->record_outcome(settled(ContractStatus::WON, amount));
    }
};

TEST_F(StakeManagerTest, NextStake_StartsAtBaseStake) {
    auto decision = stake_manager_->next_stake(1000.0);

    EXPECT_DOUBLE_EQ(decision.stake, 1.0);
    EXPECT_EQ(decision.level, 0);
    EXPECT_FALSE(decision.capped);
}

TEST_F(StakeManagerTest, NextStake_DoublesAfterEachLoss) {
    std::vector<Money> stakes;
    for (int i = 0; i < 4; i++) {
        stakes.push_back(stake_manager_->next_stake(1000.0).stake);
        lose(stakes.back());
    }

    EXPECT_EQ(stakes, (std::vector<Money>{1.0, 2.0, 4.0, 8.0}));
    EXPECT_EQ(stake_manager_->level(), 4);
}

TEST_F(StakeManagerTest, RecordOutcome_WinResetsLevel) {
    lose();
    lose(2.0);
    win(3.8);

    EXPECT_EQ(stake_manager_->level(), 0);
    EXPECT_EQ(stake_manager_->consecutive_losses(), 0);
    EXPECT_DOUBLE_EQ(stake_manager_->next_stake(1000.0).stake, 1.0);
}

TEST_F(StakeManagerTest, RecordOutcome_LevelClampedAtMaximum) {
    for (int i = 0; i < 8; i++) lose(0.1);

    EXPECT_EQ(stake_manager_->level(), 5);
    EXPECT_EQ(stake_manager_->consecutive_losses(), 8);
    EXPECT_DOUBLE_EQ(stake_manager_->next_stake(1000.0).stake, 32.0);
}

TEST_F(StakeManagerTest, RecoveryFactor_Fibonacci) {
    config_.recovery_mode = RecoveryMode::FIBONACCI;
    StakeManager fib(config_);

    std::vector<double> factors;
    for (int level = 0; level <= 5; level++) factors.push_back(fib.recovery_factor(level));

    EXPECT_EQ(factors, (std::vector<double>{1, 1, 2, 3, 5, 8}));
}

TEST_F(StakeManagerTest, RecoveryFactor_FixedIgnoresLevel) {
    config_.recovery_mode = RecoveryMode::FIXED;
    StakeManager fixed(config_);

    fixed.record_outcome(settled(ContractStatus::LOST, -1.0));
    fixed.record_outcome(settled(ContractStatus::LOST, -1.0));

    EXPECT_DOUBLE_EQ(fixed.next_stake(1000.0).stake, 1.0);
}

TEST_F(StakeManagerTest, RecoveryFactor_CustomMultiplier) {
    config_.recovery_multiplier = 2.5;
    StakeManager manager(config_);

    EXPECT_DOUBLE_EQ(manager.scheduled_stake(2), 6.25);
    EXPECT_DOUBLE_EQ(manager.scheduled_stake(9), manager.scheduled_stake(5));
}

TEST_F(StakeManagerTest, NextStake_CappedToBalanceFraction) {
    for (int i = 0; i < 3; i++) lose();  // level 3, scheduled 8.0

    auto decision = stake_manager_->next_stake(10.0);

    EXPECT_TRUE(decision.capped);
    EXPECT_DOUBLE_EQ(decision.scheduled_stake, 8.0);
    EXPECT_DOUBLE_EQ(decision.stake, 5.0);
}

TEST_F(StakeManagerTest, NextStake_FlooredToCents) {
    auto decision = stake_manager_->next_stake(1.555);  // cap 0.7775

    EXPECT_TRUE(decision.capped);
    EXPECT_DOUBLE_EQ(decision.stake, 0.77);
}

TEST_F(StakeManagerTest, NextStake_NegativeBalanceGivesZero) {
    auto decision = stake_manager_->next_stake(-5.0);

    EXPECT_DOUBLE_EQ(decision.stake, 0.0);
    EXPECT_TRUE(decision.capped);
}

TEST_F(StakeManagerTest, CheckLimits_AllowsFreshSession) {
    auto result = stake_manager_->check_limits();

    EXPECT_TRUE(result.allowed);
    EXPECT_NO_THROW(stake_manager_->ensure_within_limits());
}

TEST_F(StakeManagerTest, CheckLimits_TargetProfitReached) {
    win(6.0);
    EXPECT_TRUE(stake_manager_->check_limits().allowed);

    win(5.0);
    auto result = stake_manager_->check_limits();

    EXPECT_FALSE(result.allowed);
    EXPECT_NE(result.reason.find("Target profit"), std::string::npos);
    EXPECT_THROW(stake_manager_->ensure_within_limits(), LimitReachedError);
}

TEST_F(StakeManagerTest, CheckLimits_StopLossReached) {
    lose(12.0);
    lose(8.0);  // exactly -20

    auto result = stake_manager_->check_limits();

    EXPECT_FALSE(result.allowed);
    EXPECT_NE(result.reason.find("Stop loss"), std::string::npos);
}

TEST_F(StakeManagerTest, CheckLimits_MaxTrades) {
    config_.max_trades = 2;
    StakeManager limited(config_);

    limited.record_outcome(settled(ContractStatus::WON, 0.1));
    EXPECT_TRUE(limited.check_limits().allowed);
    limited.record_outcome(settled(ContractStatus::LOST, -0.1));

    auto result = limited.check_limits();
    EXPECT_FALSE(result.allowed);
    EXPECT_EQ(result.reason, "Max trades reached: 2");
}

TEST_F(StakeManagerTest, LossWarnings_EachThresholdOnce) {
    lose(10.0);  // 50%
    EXPECT_EQ(stake_manager_->take_loss_warnings(), (std::vector<int>{50}));
    EXPECT_TRUE(stake_manager_->take_loss_warnings().empty());

    lose(8.5);   // 92.5%
    EXPECT_EQ(stake_manager_->take_loss_warnings(), (std::vector<int>{75, 90}));

    win(1.0);
    lose(1.0);
    EXPECT_TRUE(stake_manager_->take_loss_warnings().empty());
}

TEST_F(StakeManagerTest, RecordOutcome_TracksStats) {
    win(0.95);
    lose(2.0);
    lose(1.0);

    EXPECT_EQ(stake_manager_->trades(), 3);
    EXPECT_EQ(stake_manager_->wins(), 1);
    EXPECT_EQ(stake_manager_->losses(), 2);
    EXPECT_NEAR(stake_manager_->cumulative_profit(), -2.05, 1e-9);
}

TEST_F(StakeManagerTest, Reset_StartsNewSession) {
    lose(15.0);
    lose(1.0);
    stake_manager_->reset();

    EXPECT_EQ(stake_manager_->level(), 0);
    EXPECT_EQ(stake_manager_->trades(), 0);
    EXPECT_DOUBLE_EQ(stake_manager_->cumulative_profit(), 0.0);
    EXPECT_TRUE(stake_manager_->take_loss_warnings().empty());
    EXPECT_TRUE(stake_manager_->check_limits().allowed);
}

TEST_F(StakeManagerTest, BalanceGuard_StopsBelowFractionOfStart) {
    config_.balance_guard_fraction = 0.10;
    stake_manager_ = std::make_unique<StakeManager>(config_);

    stake_manager_->observe_balance(500.0);
    stake_manager_->observe_balance(50.0);
    EXPECT_TRUE(stake_manager_->check_limits().allowed);
    EXPECT_DOUBLE_EQ(stake_manager_->start_balance(), 500.0);

    stake_manager_->observe_balance(49.99);
    auto result = stake_manager_->check_limits();
    EXPECT_FALSE(result.allowed);
    EXPECT_NE(result.reason.find("Balance guard"), std::string::npos);
    EXPECT_THROW(stake_manager_->ensure_within_limits(), LimitReachedError);
}

TEST_F(StakeManagerTest, BalanceGuard_DisabledAtZero) {
    config_.balance_guard_fraction = 0.0;
    stake_manager_ = std::make_unique<StakeManager>(config_);

    stake_manager_->observe_balance(500.0);
    stake_manager_->observe_balance(0.5);

    EXPECT_TRUE(stake_manager_->check_limits().allowed);
}

TEST_F(StakeManagerTest, Pause_AfterConsecutiveLossesThenResumes) {
    config_.pause_after_losses = 3;
    config_.pause_cooldown_ms = 40;
    stake_manager_ = std::make_unique<StakeManager>(config_);

    lose();
    lose();
    EXPECT_TRUE(stake_manager_->check_pause().allowed);
    lose(4.0);

    EXPECT_TRUE(stake_manager_->paused());
    auto gate = stake_manager_->check_pause();
    EXPECT_FALSE(gate.allowed);
    EXPECT_NE(gate.reason.find("3 consecutive losses"), std::string::npos);
    auto transitions = stake_manager_->take_pause_transitions();
    EXPECT_TRUE(transitions.paused);
    EXPECT_FALSE(transitions.resumed);

    // A pause is not a session limit
    EXPECT_TRUE(stake_manager_->check_limits().allowed);

    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    EXPECT_TRUE(stake_manager_->check_pause().allowed);
    EXPECT_FALSE(stake_manager_->paused());
    EXPECT_EQ(stake_manager_->consecutive_losses(), 0);
    EXPECT_EQ(stake_manager_->level(), 3);
    transitions = stake_manager_->take_pause_transitions();
    EXPECT_FALSE(transitions.paused);
    EXPECT_TRUE(transitions.resumed);
    EXPECT_FALSE(stake_manager_->take_pause_transitions().resumed);
}

TEST_F(StakeManagerTest, Pause_WinBreaksStreak) {
    config_.pause_after_losses = 2;
    stake_manager_ = std::make_unique<StakeManager>(config_);

    lose();
    win();
    lose();

    EXPECT_FALSE(stake_manager_->paused());
    EXPECT_TRUE(stake_manager_->check_pause().allowed);
}

TEST_F(StakeManagerTest, Pause_DisabledByDefault) {
    for (int i = 0; i < 6; i++) lose();

    EXPECT_FALSE(stake_manager_->paused());
    EXPECT_TRUE(stake_manager_->check_pause().allowed);
}
