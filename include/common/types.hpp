#pragma once

#include <string>
#include <chrono>
#include <vector>
#include <cstdint>

namespace binbot {

// Time types
using Timestamp = std::chrono::time_point<std::chrono::steady_clock>;
using WallClock = std::chrono::time_point<std::chrono::system_clock>;
using Duration = std::chrono::nanoseconds;

inline Timestamp now() {
    return std::chrono::steady_clock::now();
}

inline WallClock wall_now() {
    return std::chrono::system_clock::now();
}

inline int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

// Money is quoted in account currency units (e.g. 1.0 = $1.00)
using Price = double;
using Money = double;

// Entry threshold for strategies that do not set their own
constexpr int DEFAULT_CONFIDENCE_THRESHOLD = 70;

// Contract direction
enum class Direction {
    RISE,
    FALL
};

inline std::string direction_to_string(Direction d) {
    return d == Direction::RISE ? "RISE" : "FALL";
}

// Venue contract type for a rise/fall direction
inline std::string direction_to_contract_type(Direction d) {
    return d == Direction::RISE ? "CALL" : "PUT";
}

// Contract status
enum class ContractStatus {
    OPEN,
    WON,
    LOST
};

inline std::string contract_status_to_string(ContractStatus s) {
    switch (s) {
        case ContractStatus::OPEN: return "open";
        case ContractStatus::WON: return "won";
        case ContractStatus::LOST: return "lost";
    }
    return "unknown";
}

// Connection status
enum class ConnectionStatus {
    DISCONNECTED,
    CONNECTING,
    CONNECTED,
    RECONNECTING,
    ERROR
};

inline std::string connection_status_to_string(ConnectionStatus s) {
    switch (s) {
        case ConnectionStatus::DISCONNECTED: return "DISCONNECTED";
        case ConnectionStatus::CONNECTING: return "CONNECTING";
        case ConnectionStatus::CONNECTED: return "CONNECTED";
        case ConnectionStatus::RECONNECTING: return "RECONNECTING";
        case ConnectionStatus::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

// Auto-trading loop state
enum class TraderState {
    IDLE,
    WAITING_SIGNAL,
    EXECUTING,
    MONITORING,
    WON,
    LOST,
    STOPPED
};

inline std::string trader_state_to_string(TraderState s) {
    switch (s) {
        case TraderState::IDLE: return "IDLE";
        case TraderState::WAITING_SIGNAL: return "WAITING_SIGNAL";
        case TraderState::EXECUTING: return "EXECUTING";
        case TraderState::MONITORING: return "MONITORING";
        case TraderState::WON: return "WON";
        case TraderState::LOST: return "LOST";
        case TraderState::STOPPED: return "STOPPED";
    }
    return "UNKNOWN";
}

// Loss-recovery schedule
enum class RecoveryMode {
    GEOMETRIC,  // base * multiplier^level
    FIBONACCI,  // base * fib(level)
    FIXED       // base stake every trade
};

inline std::string recovery_mode_to_string(RecoveryMode m) {
    switch (m) {
        case RecoveryMode::GEOMETRIC: return "geometric";
        case RecoveryMode::FIBONACCI: return "fibonacci";
        case RecoveryMode::FIXED: return "fixed";
    }
    return "unknown";
}

// One price update for a symbol
struct Tick {
    std::string symbol;
    Price price{0.0};
    int64_t epoch{0};         // Venue timestamp (seconds)
    int pip_size{2};          // Decimal places quoted by the venue
    Timestamp received;
};

// Priced, time-limited offer to open a contract
struct Proposal {
    std::string id;
    Money ask_price{0.0};
    Money payout{0.0};
    Price spot{0.0};
    int64_t date_expiry{0};
};

// Opened position, tracked until settlement
struct Contract {
    int64_t contract_id{0};
    Money buy_price{0.0};
    Money payout{0.0};
    Money profit{0.0};
    ContractStatus status{ContractStatus::OPEN};
    bool is_sold{false};
    int64_t start_time{0};
    std::string symbol;
    std::string contract_type;

    bool is_settled() const {
        return status != ContractStatus::OPEN;
    }
};

// Account details returned on authorization
struct AccountInfo {
    std::string loginid;
    std::string currency{"USD"};
    Money balance{0.0};
    bool is_virtual{false};
};

// Tradable instrument
struct SymbolInfo {
    std::string symbol;
    std::string display_name;
    std::string market;
};

// One indicator's contribution to a signal
struct IndicatorVote {
    std::string indicator;
    Direction side{Direction::RISE};
    double weight{0.0};
    std::string detail;
};

// Trading signal
struct Signal {
    std::string symbol;
    std::string strategy_name;
    Direction direction{Direction::FALL};
    int confidence{0};         // 0..100
    double bullish_score{0.0};
    double bearish_score{0.0};
    std::vector<IndicatorVote> votes;
    Price last_price{0.0};
    Timestamp generated_at;
};

// Result of a local gate check
struct CheckResult {
    bool allowed{true};
    std::string reason;

    static CheckResult ok() { return {true, ""}; }
    static CheckResult reject(const std::string& reason) { return {false, reason}; }
};

} // namespace binbot
