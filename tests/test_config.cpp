#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include "config/config.hpp"

using namespace binbot;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = std::filesystem::temp_directory_path() /
                ("binbot_config_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                 "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".json");
        unsetenv("DERIV_API_TOKEN");
        unsetenv("DERIV_APP_ID");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        unsetenv("DERIV_API_TOKEN");
        unsetenv("DERIV_APP_ID");
    }

    void write(const std::string& contents) {
        std::ofstream file(path_);
        file << contents;
    }

    std::filesystem::path path_;
};

TEST_F(ConfigTest, Defaults_AreValid) {
    Config config;

    EXPECT_TRUE(config.validate());
    EXPECT_EQ(config.trading.symbol, "R_100");
    EXPECT_EQ(config.connection.request_timeout_ms, 30000);
    EXPECT_EQ(config.signal.tie_direction, Direction::FALL);
}

TEST_F(ConfigTest, Load_PartialFileKeepsDefaults) {
    write(R"({"trading": {"symbol": "R_50", "base_stake": 2.5, "recovery_mode": "fibonacci"},
              "signal": {"strategy": "multi_indicator", "tie_direction": "rise"}})");

    auto config = Config::load(path_.string());

    EXPECT_EQ(config.trading.symbol, "R_50");
    EXPECT_DOUBLE_EQ(config.trading.base_stake, 2.5);
    EXPECT_EQ(config.trading.recovery_mode, RecoveryMode::FIBONACCI);
    EXPECT_EQ(config.signal.strategy, "multi_indicator");
    EXPECT_EQ(config.signal.tie_direction, Direction::RISE);
    EXPECT_DOUBLE_EQ(config.trading.target_profit, 10.0);
}

TEST_F(ConfigTest, Load_MissingFileThrows) {
    EXPECT_THROW(Config::load((path_.parent_path() / "does_not_exist_binbot.json").string()), std::runtime_error);
}

TEST_F(ConfigTest, Load_InvalidValuesThrow) {
    write(R"({"trading": {"base_stake": 0.1, "min_stake": 0.35}})");

    EXPECT_THROW(Config::load(path_.string()), std::runtime_error);
}

TEST_F(ConfigTest, Load_UnknownRecoveryModeThrows) {
    write(R"({"trading": {"recovery_mode": "double_or_nothing"}})");

    EXPECT_THROW(Config::load(path_.string()), std::runtime_error);
}

TEST_F(ConfigTest, Save_RoundTripsWithoutToken) {
    Config config;
    config.connection.api_token = "secret-token";
    config.trading.symbol = "R_25";
    config.trading.max_trades = 12;
    config.trading.recovery_mode = RecoveryMode::FIXED;

    config.save(path_.string());
    auto loaded = Config::load(path_.string());

    EXPECT_EQ(loaded.trading.symbol, "R_25");
    EXPECT_EQ(loaded.trading.max_trades, 12);
    EXPECT_EQ(loaded.trading.recovery_mode, RecoveryMode::FIXED);
    EXPECT_TRUE(loaded.connection.api_token.empty());
}

TEST_F(ConfigTest, Validate_RejectsOutOfRangeValues) {
    Config config;
    config.trading.confidence_threshold = 101;
    EXPECT_FALSE(config.validate());

    config = Config{};
    config.trading.max_stake_fraction = 0.0;
    EXPECT_FALSE(config.validate());

    config = Config{};
    config.trading.stop_loss = 0.0;
    EXPECT_FALSE(config.validate());

    config = Config{};
    config.signal.max_confidence = 100;
    EXPECT_FALSE(config.validate());

    config = Config{};
    config.trading.recovery_multiplier = 0.5;
    EXPECT_FALSE(config.validate());
}

TEST_F(ConfigTest, ParseRecoveryMode_AcceptsAliases) {
    EXPECT_EQ(parse_recovery_mode("Martingale"), RecoveryMode::GEOMETRIC);
    EXPECT_EQ(parse_recovery_mode("fibonacci"), RecoveryMode::FIBONACCI);
    EXPECT_EQ(parse_recovery_mode("none"), RecoveryMode::FIXED);
    EXPECT_FALSE(parse_recovery_mode("labouchere").has_value());
}

TEST_F(ConfigTest, ParseDirection_AcceptsContractTypes) {
    EXPECT_EQ(parse_direction("CALL"), Direction::RISE);
    EXPECT_EQ(parse_direction("put"), Direction::FALL);
    EXPECT_FALSE(parse_direction("sideways").has_value());
}

TEST_F(ConfigTest, ApplyEnv_OverridesTokenAndAppId) {
    setenv("DERIV_API_TOKEN", "env-token", 1);
    setenv("DERIV_APP_ID", "4242", 1);

    Config config;
    config.apply_env();

    EXPECT_EQ(config.connection.api_token, "env-token");
    EXPECT_EQ(config.connection.app_id, "4242");
}

TEST_F(ConfigTest, ApplyEnv_KeepsValuesWhenUnset) {
    Config config;
    config.connection.api_token = "from-file";
    config.apply_env();

    EXPECT_EQ(config.connection.api_token, "from-file");
    EXPECT_EQ(config.connection.app_id, "1089");
}

TEST_F(ConfigTest, Validate_RejectsThresholdAboveMaxConfidence) {
    Config config;
    config.signal.max_confidence = 90;
    config.trading.confidence_threshold = 91;
    EXPECT_FALSE(config.validate());

    config.trading.confidence_threshold = 90;
    EXPECT_TRUE(config.validate());
}

TEST_F(ConfigTest, Validate_RejectsNonPositiveWatchdogInterval) {
    Config config;
    config.connection.watchdog_interval_ms = 0;
    EXPECT_FALSE(config.validate());

    config.connection.watchdog_interval_ms = -5;
    EXPECT_FALSE(config.validate());
}

TEST_F(ConfigTest, Validate_RejectsBadPauseAndGuardSettings) {
    Config config;
    config.trading.pause_after_losses = -1;
    EXPECT_FALSE(config.validate());

    config = Config{};
    config.trading.balance_guard_fraction = 1.0;
    EXPECT_FALSE(config.validate());
}

TEST_F(ConfigTest, Load_ThresholdUnsetUntilConfigured) {
    write(R"({"trading": {"pause_after_losses": 3, "pause_cooldown_ms": 30000}})");
    auto config = Config::load(path_.string());
    EXPECT_FALSE(config.trading.confidence_threshold.has_value());
    EXPECT_EQ(config.trading.entry_threshold(), DEFAULT_CONFIDENCE_THRESHOLD);
    EXPECT_EQ(config.trading.pause_after_losses, 3);
    EXPECT_EQ(config.trading.pause_cooldown_ms, 30000);

    write(R"({"trading": {"confidence_threshold": 65}})");
    config = Config::load(path_.string());
    EXPECT_EQ(config.trading.confidence_threshold.value_or(-1), 65);
    EXPECT_EQ(config.trading.entry_threshold(), 65);
}
