#include "config/config.hpp"
#include <fstream>
#include <cstdlib>
#include <algorithm>
#include <spdlog/spdlog.h>

namespace binbot {

std::optional<RecoveryMode> parse_recovery_mode(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    if (lower == "geometric" || lower == "martingale") return RecoveryMode::GEOMETRIC;
    if (lower == "fibonacci") return RecoveryMode::FIBONACCI;
    if (lower == "fixed" || lower == "none") return RecoveryMode::FIXED;
    return std::nullopt;
}

std::optional<Direction> parse_direction(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    if (lower == "rise" || lower == "call") return Direction::RISE;
    if (lower == "fall" || lower == "put") return Direction::FALL;
    return std::nullopt;
}

void to_json(nlohmann::json& j, const ConnectionConfig& c) {
    j = nlohmann::json{
        {"ws_url", c.ws_url},
        {"app_id", c.app_id},
        {"request_timeout_ms", c.request_timeout_ms},
        {"reconnect_delay_ms", c.reconnect_delay_ms},
        {"max_reconnect_delay_ms", c.max_reconnect_delay_ms},
        {"max_reconnect_attempts", c.max_reconnect_attempts},
        {"heartbeat_interval_ms", c.heartbeat_interval_ms},
        {"connection_timeout_ms", c.connection_timeout_ms},
        {"max_consecutive_timeouts", c.max_consecutive_timeouts},
        {"watchdog_interval_ms", c.watchdog_interval_ms}
    };
}

void from_json(const nlohmann::json& j, ConnectionConfig& c) {
    if (j.contains("ws_url")) j.at("ws_url").get_to(c.ws_url);
    if (j.contains("app_id")) j.at("app_id").get_to(c.app_id);
    if (j.contains("api_token")) j.at("api_token").get_to(c.api_token);
    if (j.contains("request_timeout_ms")) j.at("request_timeout_ms").get_to(c.request_timeout_ms);
    if (j.contains("reconnect_delay_ms")) j.at("reconnect_delay_ms").get_to(c.reconnect_delay_ms);
    if (j.contains("max_reconnect_delay_ms")) j.at("max_reconnect_delay_ms").get_to(c.max_reconnect_delay_ms);
    if (j.contains("max_reconnect_attempts")) j.at("max_reconnect_attempts").get_to(c.max_reconnect_attempts);
    if (j.contains("heartbeat_interval_ms")) j.at("heartbeat_interval_ms").get_to(c.heartbeat_interval_ms);
    if (j.contains("connection_timeout_ms")) j.at("connection_timeout_ms").get_to(c.connection_timeout_ms);
    if (j.contains("max_consecutive_timeouts")) j.at("max_consecutive_timeouts").get_to(c.max_consecutive_timeouts);
    if (j.contains("watchdog_interval_ms")) j.at("watchdog_interval_ms").get_to(c.watchdog_interval_ms);
}

void to_json(nlohmann::json& j, const SignalConfig& c) {
    j = nlohmann::json{
        {"strategy", c.strategy},
        {"window_size", c.window_size},
        {"max_confidence", c.max_confidence},
        {"tie_direction", c.tie_direction == Direction::RISE ? "rise" : "fall"},
        {"history_preload", c.history_preload}
    };
}

void from_json(const nlohmann::json& j, SignalConfig& c) {
    if (j.contains("strategy")) j.at("strategy").get_to(c.strategy);
    if (j.contains("window_size")) j.at("window_size").get_to(c.window_size);
    if (j.contains("max_confidence")) j.at("max_confidence").get_to(c.max_confidence);
    if (j.contains("tie_direction")) {
        auto dir = parse_direction(j.at("tie_direction").get<std::string>());
        if (dir) c.tie_direction = *dir;
    }
    if (j.contains("history_preload")) j.at("history_preload").get_to(c.history_preload);
}

void to_json(nlohmann::json& j, const TradingConfig& c) {
    j = nlohmann::json{
        {"symbol", c.symbol},
        {"currency", c.currency},
        {"base_stake", c.base_stake},
        {"duration", c.duration},
        {"duration_unit", c.duration_unit},
        {"target_profit", c.target_profit},
        {"stop_loss", c.stop_loss},
        {"max_trades", c.max_trades},
        {"pause_after_losses", c.pause_after_losses},
        {"pause_cooldown_ms", c.pause_cooldown_ms},
        {"balance_guard_fraction", c.balance_guard_fraction},
        {"recovery_mode", recovery_mode_to_string(c.recovery_mode)},
        {"recovery_multiplier", c.recovery_multiplier},
        {"max_recovery_level", c.max_recovery_level},
        {"max_stake_fraction", c.max_stake_fraction},
        {"min_stake", c.min_stake},
        {"signal_cooldown_ms", c.signal_cooldown_ms},
        {"dry_run", c.dry_run}
    };
    if (c.confidence_threshold) j["confidence_threshold"] = *c.confidence_threshold;
}

void from_json(const nlohmann::json& j, TradingConfig& c) {
    if (j.contains("symbol")) j.at("symbol").get_to(c.symbol);
    if (j.contains("currency")) j.at("currency").get_to(c.currency);
    if (j.contains("base_stake")) j.at("base_stake").get_to(c.base_stake);
    if (j.contains("duration")) j.at("duration").get_to(c.duration);
    if (j.contains("duration_unit")) j.at("duration_unit").get_to(c.duration_unit);
    if (j.contains("confidence_threshold") && !j.at("confidence_threshold").is_null()) {
        c.confidence_threshold = j.at("confidence_threshold").get<int>();
    }
    if (j.contains("target_profit")) j.at("target_profit").get_to(c.target_profit);
    if (j.contains("stop_loss")) j.at("stop_loss").get_to(c.stop_loss);
    if (j.contains("max_trades")) j.at("max_trades").get_to(c.max_trades);
    if (j.contains("pause_after_losses")) j.at("pause_after_losses").get_to(c.pause_after_losses);
    if (j.contains("pause_cooldown_ms")) j.at("pause_cooldown_ms").get_to(c.pause_cooldown_ms);
    if (j.contains("balance_guard_fraction")) j.at("balance_guard_fraction").get_to(c.balance_guard_fraction);
    if (j.contains("recovery_mode")) {
        std::string mode_str = j.at("recovery_mode").get<std::string>();
        auto mode = parse_recovery_mode(mode_str);
        if (!mode) {
            throw std::runtime_error("Unknown recovery_mode: " + mode_str);
        }
        c.recovery_mode = *mode;
    }
    if (j.contains("recovery_multiplier")) j.at("recovery_multiplier").get_to(c.recovery_multiplier);
    if (j.contains("max_recovery_level")) j.at("max_recovery_level").get_to(c.max_recovery_level);
    if (j.contains("max_stake_fraction")) j.at("max_stake_fraction").get_to(c.max_stake_fraction);
    if (j.contains("min_stake")) j.at("min_stake").get_to(c.min_stake);
    if (j.contains("signal_cooldown_ms")) j.at("signal_cooldown_ms").get_to(c.signal_cooldown_ms);
    if (j.contains("dry_run")) j.at("dry_run").get_to(c.dry_run);
}

void to_json(nlohmann::json& j, const TrackerConfig& c) {
    j = nlohmann::json{
        {"poll_interval_ms", c.poll_interval_ms},
        {"poll_timeout_ms", c.poll_timeout_ms},
        {"max_tracking_ms", c.max_tracking_ms},
        {"max_poll_backoff_ms", c.max_poll_backoff_ms}
    };
}

void from_json(const nlohmann::json& j, TrackerConfig& c) {
    if (j.contains("poll_interval_ms")) j.at("poll_interval_ms").get_to(c.poll_interval_ms);
    if (j.contains("poll_timeout_ms")) j.at("poll_timeout_ms").get_to(c.poll_timeout_ms);
    if (j.contains("max_tracking_ms")) j.at("max_tracking_ms").get_to(c.max_tracking_ms);
    if (j.contains("max_poll_backoff_ms")) j.at("max_poll_backoff_ms").get_to(c.max_poll_backoff_ms);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = nlohmann::json{
        {"log_dir", c.log_dir},
        {"log_level", c.log_level},
        {"log_to_console", c.log_to_console},
        {"log_to_file", c.log_to_file},
        {"json_format", c.json_format},
        {"max_log_file_size_mb", c.max_log_file_size_mb},
        {"max_log_files", c.max_log_files}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    if (j.contains("log_dir")) j.at("log_dir").get_to(c.log_dir);
    if (j.contains("log_level")) j.at("log_level").get_to(c.log_level);
    if (j.contains("log_to_console")) j.at("log_to_console").get_to(c.log_to_console);
    if (j.contains("log_to_file")) j.at("log_to_file").get_to(c.log_to_file);
    if (j.contains("json_format")) j.at("json_format").get_to(c.json_format);
    if (j.contains("max_log_file_size_mb")) j.at("max_log_file_size_mb").get_to(c.max_log_file_size_mb);
    if (j.contains("max_log_files")) j.at("max_log_files").get_to(c.max_log_files);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"connection", c.connection},
        {"signal", c.signal},
        {"trading", c.trading},
        {"tracker", c.tracker},
        {"logging", c.logging},
        {"trade_ledger_path", c.trade_ledger_path}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("connection")) j.at("connection").get_to(c.connection);
    if (j.contains("signal")) j.at("signal").get_to(c.signal);
    if (j.contains("trading")) j.at("trading").get_to(c.trading);
    if (j.contains("tracker")) j.at("tracker").get_to(c.tracker);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
    if (j.contains("trade_ledger_path")) j.at("trade_ledger_path").get_to(c.trade_ledger_path);
}

Config Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    nlohmann::json j;
    file >> j;

    Config config;
    from_json(j, config);

    if (!config.validate()) {
        throw std::runtime_error("Invalid configuration in: " + path);
    }

    return config;
}

void Config::save(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to create config file: " + path);
    }

    nlohmann::json j;
    to_json(j, *this);
    file << j.dump(2);
}

bool Config::validate() const {
    if (trading.base_stake <= 0) {
        spdlog::error("base_stake must be positive");
        return false;
    }

    if (trading.base_stake < trading.min_stake) {
        spdlog::error("base_stake {} is below the venue minimum {}", trading.base_stake, trading.min_stake);
        return false;
    }

    if (trading.target_profit <= 0 || trading.stop_loss <= 0) {
        spdlog::error("target_profit and stop_loss must be positive");
        return false;
    }

    if (trading.confidence_threshold &&
        (*trading.confidence_threshold < 0 || *trading.confidence_threshold > 100)) {
        spdlog::error("confidence_threshold must be within [0, 100]");
        return false;
    }

    if (trading.entry_threshold() > signal.max_confidence) {
        spdlog::error("confidence_threshold {} is above max_confidence {}, no signal could pass",
                      trading.entry_threshold(), signal.max_confidence);
        return false;
    }

    if (trading.pause_after_losses < 0 || trading.pause_cooldown_ms < 0) {
        spdlog::error("pause_after_losses and pause_cooldown_ms must be non-negative");
        return false;
    }

    if (trading.balance_guard_fraction < 0 || trading.balance_guard_fraction >= 1.0) {
        spdlog::error("balance_guard_fraction must be within [0, 1)");
        return false;
    }

    if (trading.max_stake_fraction <= 0 || trading.max_stake_fraction > 1.0) {
        spdlog::error("max_stake_fraction must be within (0, 1]");
        return false;
    }

    if (trading.max_stake_fraction > 0.25) {
        spdlog::warn("max_stake_fraction is > 25% of balance, this is risky");
    }

    if (trading.recovery_multiplier < 1.0) {
        spdlog::error("recovery_multiplier must be >= 1");
        return false;
    }

    if (trading.max_recovery_level < 0) {
        spdlog::error("max_recovery_level must be non-negative");
        return false;
    }

    if (trading.duration <= 0) {
        spdlog::error("duration must be positive");
        return false;
    }

    if (signal.max_confidence <= 0 || signal.max_confidence >= 100) {
        spdlog::error("max_confidence must be within (0, 100)");
        return false;
    }

    if (signal.window_size < 2) {
        spdlog::error("window_size must be at least 2");
        return false;
    }

    if (connection.request_timeout_ms <= 0 || connection.max_reconnect_attempts < 0) {
        spdlog::error("request_timeout_ms must be positive and max_reconnect_attempts non-negative");
        return false;
    }

    if (connection.watchdog_interval_ms <= 0) {
        spdlog::error("watchdog_interval_ms must be positive");
        return false;
    }

    if (tracker.poll_interval_ms <= 0 || tracker.max_tracking_ms < tracker.poll_interval_ms) {
        spdlog::error("tracker poll_interval_ms must be positive and below max_tracking_ms");
        return false;
    }

    return true;
}

void Config::apply_env() {
    std::string token = get_env("DERIV_API_TOKEN");
    if (!token.empty()) connection.api_token = token;

    std::string app_id = get_env("DERIV_APP_ID");
    if (!app_id.empty()) connection.app_id = app_id;
}

std::string Config::get_env(const std::string& name, const std::string& default_val) {
    const char* val = std::getenv(name.c_str());
    return val ? std::string(val) : default_val;
}

} // namespace binbot
