#pragma once

#include <optional>
#include <string>
#include "common/types.hpp"

namespace binbot {

enum class TradeEventType {
    STATE_CHANGED,
    TRADE_OPENED,
    CONTRACT_UPDATE,
    TRADE_SETTLED,
    CYCLE_ABORTED,
    LIMIT_REACHED,
    LOSS_WARNING,
    CONTRACT_STUCK,
    SESSION_FAILED,
    TRADING_PAUSED,
    TRADING_RESUMED
};

inline std::string trade_event_type_to_string(TradeEventType t) {
    switch (t) {
        case TradeEventType::STATE_CHANGED: return "state_changed";
        case TradeEventType::TRADE_OPENED: return "trade_opened";
        case TradeEventType::CONTRACT_UPDATE: return "contract_update";
        case TradeEventType::TRADE_SETTLED: return "trade_settled";
        case TradeEventType::CYCLE_ABORTED: return "cycle_aborted";
        case TradeEventType::LIMIT_REACHED: return "limit_reached";
        case TradeEventType::LOSS_WARNING: return "loss_warning";
        case TradeEventType::CONTRACT_STUCK: return "contract_stuck";
        case TradeEventType::SESSION_FAILED: return "session_failed";
        case TradeEventType::TRADING_PAUSED: return "trading_paused";
        case TradeEventType::TRADING_RESUMED: return "trading_resumed";
    }
    return "unknown";
}

// Discrete notification from the trading loop to hosts and notifiers
struct TradeEvent {
    TradeEventType type{TradeEventType::STATE_CHANGED};
    TraderState state{TraderState::IDLE};
    std::string message;
    std::string symbol;
    std::optional<Direction> direction;
    Money stake{0.0};
    std::optional<Contract> contract;
    Money cumulative_profit{0.0};
    int recovery_level{0};
    WallClock time;
};

// Balance/profit view of a trading session
struct SessionSnapshot {
    TraderState state{TraderState::IDLE};
    bool running{false};
    std::string symbol;
    Money balance{0.0};
    std::string currency;
    Money base_stake{0.0};
    Money current_stake{0.0};
    int recovery_level{0};
    Money cumulative_profit{0.0};
    Money target_profit{0.0};
    Money stop_loss{0.0};
    int trades{0};
    int wins{0};
    int losses{0};
    int consecutive_losses{0};
    double win_rate{0.0};
    std::optional<Contract> open_contract;
    std::string stop_reason;
    bool paused{false};
    Money start_balance{0.0};
};

} // namespace binbot
