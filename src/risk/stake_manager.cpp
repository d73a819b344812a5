#include "risk/stake_manager.hpp"
#include "common/errors.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>

namespace binbot {

StakeManager::StakeManager(const TradingConfig& config)
    : config_(config)
{
    spdlog::info("StakeManager initialized: base=${:.2f} recovery={} x{:.2f} max_level={} target=${:.2f} stop=${:.2f}",
                 config.base_stake, recovery_mode_to_string(config.recovery_mode),
                 config.recovery_multiplier, config.max_recovery_level,
                 config.target_profit, config.stop_loss);
}

double StakeManager::recovery_factor(int level) const {
    level = std::clamp(level, 0, config_.max_recovery_level);

    switch (config_.recovery_mode) {
        case RecoveryMode::GEOMETRIC:
            return std::pow(config_.recovery_multiplier, level);
        case RecoveryMode::FIBONACCI: {
            // 1, 1, 2, 3, 5, 8, ...
            double prev = 1.0;
            double curr = 1.0;
            for (int i = 1; i < level; i++) {
                double next = prev + curr;
                prev = curr;
                curr = next;
            }
            return curr;
        }
        case RecoveryMode::FIXED:
            return 1.0;
    }
    return 1.0;
}

Money StakeManager::scheduled_stake(int level) const {
    return config_.base_stake * recovery_factor(level);
}

StakeDecision StakeManager::next_stake(Money balance) const {
    StakeDecision decision;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        decision.level = level_;
    }
    decision.scheduled_stake = scheduled_stake(decision.level);

    Money cap = std::max(0.0, balance) * config_.max_stake_fraction;
    Money stake = decision.scheduled_stake;
    if (stake > cap) {
        stake = cap;
        decision.capped = true;
    }

    // Whole cents, never above the cap
    decision.stake = std::floor(stake * 100.0 + 1e-9) / 100.0;

    if (decision.capped) {
        spdlog::warn("Stake ${:.2f} at level {} capped to ${:.2f} ({:.0f}% of ${:.2f})",
                     decision.scheduled_stake, decision.level, decision.stake,
                     config_.max_stake_fraction * 100.0, balance);
    }
    return decision;
}

CheckResult StakeManager::check_limits_locked() const {
    if (cumulative_profit_ >= config_.target_profit) {
        return CheckResult::reject(fmt::format("Target profit reached: ${:.2f} >= ${:.2f}",
                                               cumulative_profit_, config_.target_profit));
    }
    if (cumulative_profit_ <= -config_.stop_loss) {
        return CheckResult::reject(fmt::format("Stop loss reached: ${:.2f} <= -${:.2f}",
                                               cumulative_profit_, config_.stop_loss));
    }
    if (config_.max_trades > 0 && trades_ >= config_.max_trades) {
        return CheckResult::reject(fmt::format("Max trades reached: {}", trades_));
    }
    if (balance_observed_ && config_.balance_guard_fraction > 0 &&
        last_balance_ < start_balance_ * config_.balance_guard_fraction) {
        return CheckResult::reject(fmt::format("Balance guard: ${:.2f} below {:.0f}% of starting ${:.2f}",
                                               last_balance_, config_.balance_guard_fraction * 100.0,
                                               start_balance_));
    }
    return CheckResult::ok();
}

CheckResult StakeManager::check_limits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return check_limits_locked();
}

void StakeManager::ensure_within_limits() const {
    auto result = check_limits();
    if (!result.allowed) {
        throw LimitReachedError(result.reason);
    }
}

void StakeManager::observe_balance(Money balance) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!balance_observed_) {
        balance_observed_ = true;
        start_balance_ = balance;
        spdlog::info("Session starting balance ${:.2f}, guard at ${:.2f}",
                     balance, balance * config_.balance_guard_fraction);
    }
    last_balance_ = balance;
}

CheckResult StakeManager::check_pause() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!paused_) return CheckResult::ok();

    auto now_ts = now();
    if (now_ts < pause_until_) {
        auto left_ms = std::chrono::duration_cast<std::chrono::milliseconds>(pause_until_ - now_ts).count();
        return CheckResult::reject(fmt::format("Paused after {} consecutive losses, {}s left",
                                               consecutive_losses_, (left_ms + 999) / 1000));
    }

    paused_ = false;
    consecutive_losses_ = 0;
    pending_transitions_.resumed = true;
    spdlog::info("Loss-streak pause over, resuming at level {}", level_);
    return CheckResult::ok();
}

PauseTransitions StakeManager::take_pause_transitions() {
    std::lock_guard<std::mutex> lock(mutex_);
    PauseTransitions out = pending_transitions_;
    pending_transitions_ = PauseTransitions{};
    return out;
}

void StakeManager::record_outcome(const Contract& contract) {
    std::lock_guard<std::mutex> lock(mutex_);

    trades_++;
    cumulative_profit_ += contract.profit;

    if (contract.status == ContractStatus::WON) {
        wins_++;
        consecutive_losses_ = 0;
        level_ = 0;
    } else {
        losses_++;
        consecutive_losses_++;
        level_ = std::min(level_ + 1, config_.max_recovery_level);
    }

    spdlog::info("Contract {} {} profit=${:.2f} cumulative=${:.2f} next_level={}",
                 contract.contract_id, contract_status_to_string(contract.status),
                 contract.profit, cumulative_profit_, level_);

    if (config_.pause_after_losses > 0 && !paused_ && consecutive_losses_ >= config_.pause_after_losses) {
        paused_ = true;
        pause_until_ = now() + std::chrono::milliseconds(config_.pause_cooldown_ms);
        pending_transitions_.paused = true;
        pending_transitions_.reason = fmt::format("{} consecutive losses, pausing entries for {}ms",
                                                  consecutive_losses_, config_.pause_cooldown_ms);
        spdlog::warn("Trading paused: {}", pending_transitions_.reason);
    }

    if (cumulative_profit_ < 0 && config_.stop_loss > 0) {
        double loss_pct = -cumulative_profit_ / config_.stop_loss * 100.0;
        for (int threshold : LOSS_WARNING_THRESHOLDS) {
            if (loss_pct >= threshold && warned_thresholds_.insert(threshold).second) {
                pending_warnings_.push_back(threshold);
            }
        }
    }
}

std::vector<int> StakeManager::take_loss_warnings() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<int> warnings;
    warnings.swap(pending_warnings_);
    return warnings;
}

void StakeManager::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = 0;
    cumulative_profit_ = 0.0;
    trades_ = 0;
    wins_ = 0;
    losses_ = 0;
    consecutive_losses_ = 0;
    warned_thresholds_.clear();
    pending_warnings_.clear();
    balance_observed_ = false;
    start_balance_ = 0.0;
    last_balance_ = 0.0;
    paused_ = false;
    pause_until_ = Timestamp{};
    pending_transitions_ = PauseTransitions{};
}

int StakeManager::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

Money StakeManager::cumulative_profit() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cumulative_profit_;
}

int StakeManager::trades() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trades_;
}

int StakeManager::wins() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return wins_;
}

int StakeManager::losses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return losses_;
}

int StakeManager::consecutive_losses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return consecutive_losses_;
}

bool StakeManager::paused() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return paused_;
}

Money StakeManager::start_balance() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return start_balance_;
}

} // namespace binbot
