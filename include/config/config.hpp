#pragma once

#include <string>
#include <optional>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace binbot {

struct ConnectionConfig {
    std::string ws_url{"wss://ws.derivws.com/websockets/v3"};
    std::string app_id{"1089"};
    std::string api_token;                   // Never written back to disk

    int request_timeout_ms{30000};           // Per-request response window
    int reconnect_delay_ms{5000};            // First retry delay, doubled per attempt
    int max_reconnect_delay_ms{30000};
    int max_reconnect_attempts{5};
    int heartbeat_interval_ms{30000};        // Keepalive ping
    int connection_timeout_ms{10000};        // Socket open + authorize handshake
    int max_consecutive_timeouts{5};         // Force reconnect after this many
    int watchdog_interval_ms{100};
};

struct SignalConfig {
    std::string strategy{"momentum"};        // momentum, multi_indicator
    int window_size{100};                    // Rolling window per symbol
    int max_confidence{95};                  // Confidence never reaches 100
    Direction tie_direction{Direction::FALL};
    int history_preload{100};                // Ticks fetched before trading
};

struct TradingConfig {
    std::string symbol{"R_100"};
    std::string currency{"USD"};
    double base_stake{1.0};
    int duration{5};
    std::string duration_unit{"t"};          // t=ticks, s=seconds, m=minutes

    std::optional<int> confidence_threshold; // Minimum confidence to enter; unset = strategy default
    double target_profit{10.0};
    double stop_loss{20.0};
    int max_trades{0};                       // 0 = unlimited

    int pause_after_losses{0};               // Consecutive losses that pause entries; 0 = never
    int pause_cooldown_ms{60000};            // Pause length before entries resume
    double balance_guard_fraction{0.10};     // Stop below this fraction of the starting balance; 0 = off

    RecoveryMode recovery_mode{RecoveryMode::GEOMETRIC};
    double recovery_multiplier{2.0};
    int max_recovery_level{5};
    double max_stake_fraction{0.20};         // Stake cap as fraction of balance
    double min_stake{0.35};                  // Venue minimum

    int signal_cooldown_ms{0};
    bool dry_run{false};                     // Stream signals, never buy

    int entry_threshold() const { return confidence_threshold.value_or(DEFAULT_CONFIDENCE_THRESHOLD); }
};

struct TrackerConfig {
    int poll_interval_ms{1000};
    int poll_timeout_ms{10000};
    int max_tracking_ms{600000};
    int max_poll_backoff_ms{8000};           // Ceiling for retries after failed polls
};

struct LoggingConfig {
    std::string log_dir{"./logs"};
    std::string log_level{"info"};           // debug, info, warn, error
    bool log_to_console{true};
    bool log_to_file{true};
    bool json_format{true};                  // JSON lines format
    int max_log_file_size_mb{100};
    int max_log_files{5};
};

struct Config {
    ConnectionConfig connection;
    SignalConfig signal;
    TradingConfig trading;
    TrackerConfig tracker;
    LoggingConfig logging;

    std::string trade_ledger_path{"./data/trades.jsonl"};

    // Load from file
    static Config load(const std::string& path);

    // Save to file
    void save(const std::string& path) const;

    // Validate configuration
    bool validate() const;

    // Fill secrets and overrides from the environment
    void apply_env();

    // Get environment variable with default
    static std::string get_env(const std::string& name, const std::string& default_val = "");
};

std::optional<RecoveryMode> parse_recovery_mode(const std::string& s);
std::optional<Direction> parse_direction(const std::string& s);

// JSON serialization
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

} // namespace binbot
