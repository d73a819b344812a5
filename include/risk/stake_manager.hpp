#pragma once

#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "common/types.hpp"
#include "config/config.hpp"

namespace binbot {

struct StakeDecision {
    Money stake{0.0};            // Amount to charge, after the balance cap
    Money scheduled_stake{0.0};  // Base stake scaled by the recovery schedule
    int level{0};
    bool capped{false};
};

// Pause state changes since the last take_pause_transitions()
struct PauseTransitions {
    bool paused{false};
    bool resumed{false};
    std::string reason;  // Why the pause started
};

/**
 * Loss-recovery stake sizing and session limits.
 *
 * Hard limits (target, stop loss, trade count, balance guard) end the
 * session. A run of `pause_after_losses` consecutive losses only pauses new
 * entries for `pause_cooldown_ms`; the first check after the cooldown
 * resumes trading and clears the loss streak, keeping the recovery level.
 * Thread-safe; the trading loop mutates it only around a cycle.
 */
class StakeManager {
public:
    explicit StakeManager(const TradingConfig& config);

    // Stake sizing
    double recovery_factor(int level) const;
    Money scheduled_stake(int level) const;
    StakeDecision next_stake(Money balance) const;

    // Session limits
    CheckResult check_limits() const;
    void ensure_within_limits() const;  // Throws LimitReachedError

    // Balance fetched before an entry; the first one is the guard reference
    void observe_balance(Money balance);

    // Entry gate for the loss-streak pause; resumes once the cooldown passed
    CheckResult check_pause();
    PauseTransitions take_pause_transitions();

    // Settlement
    void record_outcome(const Contract& contract);

    // Loss-warning thresholds (percent of stop loss) crossed since last call
    std::vector<int> take_loss_warnings();

    // New session with the same configuration
    void reset();

    // Queries
    int level() const;
    Money cumulative_profit() const;
    int trades() const;
    int wins() const;
    int losses() const;
    int consecutive_losses() const;
    bool paused() const;
    Money start_balance() const;
    const TradingConfig& config() const { return config_; }

    static constexpr int LOSS_WARNING_THRESHOLDS[] = {50, 75, 90};

private:
    TradingConfig config_;

    mutable std::mutex mutex_;
    int level_{0};
    Money cumulative_profit_{0.0};
    int trades_{0};
    int wins_{0};
    int losses_{0};
    int consecutive_losses_{0};
    std::set<int> warned_thresholds_;
    std::vector<int> pending_warnings_;

    bool balance_observed_{false};
    Money start_balance_{0.0};
    Money last_balance_{0.0};

    bool paused_{false};
    Timestamp pause_until_{};
    PauseTransitions pending_transitions_;

    CheckResult check_limits_locked() const;
};

} // namespace binbot
