#include "execution/auto_trader.hpp"
#include "common/errors.hpp"
#include "utils/metrics.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>

namespace binbot {

namespace {

Money floor_to_cents(Money amount) {
    return std::floor(amount * 100.0 + 1e-9) / 100.0;
}

} // namespace

AutoTrader::AutoTrader(VenueConnector& connector, const TradingConfig& config, const TrackerConfig& tracker_config)
    : connector_(connector)
    , config_(config)
    , stake_manager_(std::make_unique<StakeManager>(config))
    , tracker_(connector, tracker_config)
{
    tracker_.set_progress_callback([this](const Contract& update) {
        std::vector<TradeEvent> events;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!open_contract_) return;
            open_contract_->profit = update.profit;
            open_contract_->is_sold = update.is_sold;
            events.push_back(make_event_locked(TradeEventType::CONTRACT_UPDATE,
                fmt::format("Contract {} open, profit {:.2f}", update.contract_id, update.profit)));
        }
        emit(events);
    });

    worker_thread_ = std::thread(&AutoTrader::run_worker, this);
}

AutoTrader::~AutoTrader() {
    shutdown();
}

// ============================================================================
// Lifecycle
// ============================================================================

CheckResult AutoTrader::start() {
    TradingConfig params;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        params = config_;
    }
    return start(params);
}

CheckResult AutoTrader::start(const TradingConfig& params) {
    if (params.base_stake < params.min_stake) {
        return CheckResult::reject(fmt::format("Base stake {:.2f} below minimum {:.2f}",
                                               params.base_stake, params.min_stake));
    }
    if (params.entry_threshold() < 0 || params.entry_threshold() > 100) {
        return CheckResult::reject("Confidence threshold must be within 0..100");
    }
    if (params.target_profit <= 0 || params.stop_loss <= 0) {
        return CheckResult::reject("Target profit and stop loss must be positive");
    }
    if (params.max_stake_fraction <= 0 || params.max_stake_fraction > 1.0) {
        return CheckResult::reject("Max stake fraction must be within (0, 1]");
    }

    std::vector<TradeEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_) {
            return CheckResult::reject("Trader is shut down");
        }
        if (in_flight_) {
            return CheckResult::reject("A contract is still in flight");
        }
        if (auto_running_) {
            return CheckResult::reject("Already running");
        }

        config_ = params;
        stake_manager_ = std::make_unique<StakeManager>(config_);
        cancel_.reset();
        auto_running_ = true;
        stop_requested_ = false;
        stop_reason_.clear();
        open_contract_.reset();
        current_stake_ = config_.base_stake;
        last_accepted_ = Timestamp{};

        spdlog::info("Auto-trading {} from ${:.2f} (threshold {}%, target ${:.2f}, stop ${:.2f}, {} x{:.2f} up to level {})",
                     config_.symbol, config_.base_stake, config_.entry_threshold(),
                     config_.target_profit, config_.stop_loss,
                     recovery_mode_to_string(config_.recovery_mode),
                     config_.recovery_multiplier, config_.max_recovery_level);

        transition_locked(TraderState::WAITING_SIGNAL, "Session started", events);
    }
    METRIC_GAUGE(metric_names::CUMULATIVE_PROFIT).set(0.0);
    METRIC_GAUGE(metric_names::RECOVERY_LEVEL).set(0.0);
    emit(events);
    return CheckResult::ok();
}

void AutoTrader::stop(const std::string& reason) {
    std::vector<TradeEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_.load() == TraderState::STOPPED && !in_flight_) return;

        auto_running_ = false;
        stop_requested_ = true;
        stop_reason_ = reason;

        if (queued_) {
            // Claimed but never started: nothing was sent to the venue
            events = std::move(queued_->events);
            queued_.reset();
            in_flight_ = false;
        }

        if (in_flight_) {
            spdlog::info("Stop requested, tracking open contract to settlement");
        } else {
            transition_locked(TraderState::STOPPED, reason, events);
        }
    }
    idle_cv_.notify_all();
    emit(events);
}

void AutoTrader::shutdown() {
    std::vector<TradeEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_) return;
        shutting_down_ = true;
        auto_running_ = false;
        stop_requested_ = true;
        if (stop_reason_.empty()) stop_reason_ = "Shutdown";
        queued_.reset();
        if (!in_flight_ && state_.load() != TraderState::STOPPED && state_.load() != TraderState::IDLE) {
            transition_locked(TraderState::STOPPED, stop_reason_, events);
        }
    }
    cancel_.cancel();
    work_cv_.notify_all();
    emit(events);

    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    in_flight_ = false;
    idle_cv_.notify_all();
}

void AutoTrader::on_connection_failed(const std::string& reason) {
    std::vector<TradeEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto_running_ = false;
        stop_requested_ = true;
        stop_reason_ = "Connection lost: " + reason;
        if (queued_) {
            events = std::move(queued_->events);
            queued_.reset();
            in_flight_ = false;
        }
        events.push_back(make_event_locked(TradeEventType::SESSION_FAILED, stop_reason_));
        if (!in_flight_) {
            transition_locked(TraderState::STOPPED, stop_reason_, events);
        }
    }
    spdlog::error("Trading halted: {}", reason);
    cancel_.cancel();
    idle_cv_.notify_all();
    emit(events);
}

bool AutoTrader::wait_until_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return !in_flight_; });
}

// ============================================================================
// Entry
// ============================================================================

bool AutoTrader::on_signal(const Signal& signal) {
    std::vector<TradeEvent> pause_events;
    bool accepted = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::string ignore_reason;
        if (!auto_running_) {
            ignore_reason = "not running";
        } else if (in_flight_ || state_.load() != TraderState::WAITING_SIGNAL) {
            ignore_reason = "contract in flight";
        } else if (signal.symbol != config_.symbol) {
            ignore_reason = "symbol " + signal.symbol;
        } else if (auto pause = stake_manager_->check_pause(); !pause.allowed) {
            ignore_reason = pause.reason;
        } else if (signal.confidence < config_.entry_threshold()) {
            ignore_reason = fmt::format("confidence {}% < {}%", signal.confidence, config_.entry_threshold());
        } else if (config_.signal_cooldown_ms > 0 && last_accepted_ != Timestamp{} &&
                   time_utils::elapsed_ms(last_accepted_) < config_.signal_cooldown_ms) {
            ignore_reason = "cooldown";
        }
        collect_pause_events_locked(pause_events);

        if (!ignore_reason.empty()) {
            signals_ignored_++;
            METRIC_COUNTER(metric_names::SIGNALS_IGNORED).increment();
            spdlog::debug("Signal {} {}% ignored: {}", direction_to_string(signal.direction),
                          signal.confidence, ignore_reason);
        } else {
            spdlog::info("Signal accepted: {} {} {}% ({})", signal.symbol, direction_to_string(signal.direction),
                         signal.confidence, signal.strategy_name);

            CycleRequest req;
            req.direction = signal.direction;
            req.confidence = signal.confidence;
            req.events = std::move(pause_events);
            pause_events.clear();
            transition_locked(TraderState::EXECUTING,
                              fmt::format("{} signal at {}%", direction_to_string(signal.direction), signal.confidence),
                              req.events);
            claim_locked(std::move(req));
            last_accepted_ = now();
            accepted = true;
        }
    }

    if (!accepted) {
        emit(pause_events);
        return false;
    }
    METRIC_COUNTER(metric_names::SIGNALS_ACCEPTED).increment();
    work_cv_.notify_one();
    return true;
}

CheckResult AutoTrader::place_trade(Direction direction, std::optional<Money> stake) {
    if (stake && *stake <= 0) {
        return CheckResult::reject("Stake must be positive");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_) {
            return CheckResult::reject("Trader is shut down");
        }
        if (in_flight_) {
            return CheckResult::reject("A contract is already in flight");
        }

        spdlog::info("Manual {} trade requested", direction_to_string(direction));
        if (!auto_running_) {
            // A manual trade outside a session clears an earlier stop
            stop_requested_ = false;
            stop_reason_.clear();
        }

        CycleRequest req;
        req.direction = direction;
        req.stake = stake;
        req.manual = true;
        transition_locked(TraderState::EXECUTING,
                          fmt::format("Manual {} trade", direction_to_string(direction)), req.events);
        claim_locked(std::move(req));
    }
    work_cv_.notify_one();
    return CheckResult::ok();
}

void AutoTrader::claim_locked(CycleRequest req) {
    in_flight_ = true;
    queued_ = std::move(req);
}

// ============================================================================
// Worker
// ============================================================================

void AutoTrader::run_worker() {
    while (true) {
        CycleRequest req;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, [this] { return shutting_down_ || queued_.has_value(); });
            if (shutting_down_) return;
            req = std::move(*queued_);
            queued_.reset();
        }
        emit(req.events);
        run_cycle(req);
    }
}

void AutoTrader::run_cycle(const CycleRequest& req) {
    // Limits
    try {
        stake_manager_->ensure_within_limits();
    } catch (const LimitReachedError& e) {
        std::vector<TradeEvent> events;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto_running_ = false;
            stop_reason_ = e.what();
            events.push_back(make_event_locked(TradeEventType::LIMIT_REACHED, e.what()));
        }
        spdlog::info("Limit reached: {}", e.what());
        finish_cycle(std::move(events));
        return;
    }

    // Stake
    Money balance = 0.0;
    try {
        balance = connector_.get_balance();
    } catch (const std::exception& e) {
        abort_cycle(fmt::format("Balance request failed: {}", e.what()));
        return;
    }
    METRIC_GAUGE(metric_names::BALANCE).set(balance);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_balance_ = balance;
    }
    stake_manager_->observe_balance(balance);
    if (halt_entry_if_stopped()) return;

    Money stake = 0.0;
    if (req.stake) {
        stake = floor_to_cents(std::min(*req.stake, balance * config_.max_stake_fraction));
    } else {
        stake = stake_manager_->next_stake(balance).stake;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        current_stake_ = stake;
    }

    if (stake < config_.min_stake) {
        abort_cycle(fmt::format("Stake ${:.2f} below venue minimum ${:.2f} (balance ${:.2f})",
                                stake, config_.min_stake, balance));
        return;
    }

    // Proposal and buy
    ProposalRequest proposal_req;
    proposal_req.symbol = config_.symbol;
    proposal_req.direction = req.direction;
    proposal_req.amount = stake;
    proposal_req.duration = config_.duration;
    proposal_req.duration_unit = config_.duration_unit;
    proposal_req.currency = config_.currency;

    Contract contract;
    try {
        Proposal proposal = connector_.get_proposal(proposal_req);
        spdlog::debug("Proposal {} ask ${:.2f} payout ${:.2f}", proposal.id, proposal.ask_price, proposal.payout);

        // The proposal round-trip is the window in which stop() can land
        if (halt_entry_if_stopped()) return;

        buys_sent_++;
        contract = connector_.buy(proposal.id, proposal.ask_price);
    } catch (const std::exception& e) {
        abort_cycle(fmt::format("Entry failed: {}", e.what()));
        return;
    }

    if (contract.symbol.empty()) contract.symbol = config_.symbol;
    if (contract.contract_type.empty()) contract.contract_type = direction_to_contract_type(req.direction);
    if (contract.buy_price <= 0) contract.buy_price = stake;
    METRIC_COUNTER(metric_names::TRADES_OPENED).increment();

    {
        std::vector<TradeEvent> events;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_contract_ = contract;
            current_stake_ = contract.buy_price;
            events.push_back(make_event_locked(TradeEventType::TRADE_OPENED,
                fmt::format("Bought {} {} for ${:.2f} (payout ${:.2f})", contract.contract_id,
                            contract.contract_type, contract.buy_price, contract.payout)));
            events.back().direction = req.direction;
            transition_locked(TraderState::MONITORING,
                              fmt::format("Tracking contract {}", contract.contract_id), events);
        }
        emit(events);
    }
    spdlog::info("Bought contract {} {} {} stake=${:.2f} level={}", contract.contract_id, contract.symbol,
                 contract.contract_type, contract.buy_price, stake_manager_->level());

    // Monitoring
    Contract settled;
    try {
        settled = tracker_.track(contract.contract_id, cancel_);
    } catch (const CancelledError& e) {
        spdlog::warn("{}", e.what());
        finish_cycle();
        return;
    } catch (const std::exception& e) {
        // StuckContractError, or anything else that left a bought contract unresolved
        spdlog::error("Contract {} unresolved: {}", contract.contract_id, e.what());
        METRIC_COUNTER(metric_names::CONTRACTS_STUCK).increment();
        std::vector<TradeEvent> events;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            events.push_back(make_event_locked(TradeEventType::CONTRACT_STUCK, e.what()));
        }
        finish_cycle(std::move(events));
        return;
    }

    settled.symbol = contract.symbol;
    settled.contract_type = contract.contract_type;
    if (settled.buy_price <= 0) settled.buy_price = contract.buy_price;

    // Settlement
    stake_manager_->record_outcome(settled);
    bool won = settled.status == ContractStatus::WON;
    METRIC_COUNTER(won ? metric_names::TRADES_WON : metric_names::TRADES_LOST).increment();
    METRIC_GAUGE(metric_names::CUMULATIVE_PROFIT).set(stake_manager_->cumulative_profit());
    METRIC_GAUGE(metric_names::RECOVERY_LEVEL).set(stake_manager_->level());

    spdlog::info("Contract {} {} profit=${:.2f} session=${:.2f} level={}",
                 settled.contract_id, won ? "WON" : "LOST", settled.profit,
                 stake_manager_->cumulative_profit(), stake_manager_->level());

    std::vector<TradeEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        open_contract_ = settled;
        events.push_back(make_event_locked(TradeEventType::TRADE_SETTLED,
            fmt::format("Contract {} {} {:+.2f}", settled.contract_id,
                        contract_status_to_string(settled.status), settled.profit)));
        events.back().direction = req.direction;
        transition_locked(won ? TraderState::WON : TraderState::LOST, "", events);

        for (int pct : stake_manager_->take_loss_warnings()) {
            events.push_back(make_event_locked(TradeEventType::LOSS_WARNING,
                fmt::format("Session loss at {}% of stop loss (${:.2f} of ${:.2f})",
                            pct, -stake_manager_->cumulative_profit(), config_.stop_loss)));
            spdlog::warn("Session loss reached {}% of stop loss", pct);
        }
        collect_pause_events_locked(events);
    }
    finish_cycle(std::move(events));
}

bool AutoTrader::halt_entry_if_stopped() {
    std::string reason;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_requested_) {
            reason = stop_reason_;
        } else {
            CheckResult limits = stake_manager_->check_limits();
            if (limits.allowed) return false;
            reason = limits.reason;
        }
    }
    spdlog::info("Entry halted before buy: {}", reason);
    finish_cycle();
    return true;
}

void AutoTrader::collect_pause_events_locked(std::vector<TradeEvent>& events) {
    PauseTransitions t = stake_manager_->take_pause_transitions();
    if (t.paused) {
        METRIC_COUNTER(metric_names::PAUSES).increment();
        events.push_back(make_event_locked(TradeEventType::TRADING_PAUSED, t.reason));
    }
    if (t.resumed) {
        events.push_back(make_event_locked(TradeEventType::TRADING_RESUMED, "Loss-streak pause over"));
    }
}

void AutoTrader::abort_cycle(const std::string& reason) {
    spdlog::warn("Cycle aborted: {}", reason);
    METRIC_COUNTER(metric_names::CYCLES_ABORTED).increment();

    std::vector<TradeEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events.push_back(make_event_locked(TradeEventType::CYCLE_ABORTED, reason));
    }
    finish_cycle(std::move(events));
}

void AutoTrader::finish_cycle(std::vector<TradeEvent> events) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        in_flight_ = false;
        open_contract_.reset();

        CheckResult limits = stake_manager_->check_limits();
        current_stake_ = stake_manager_->scheduled_stake(stake_manager_->level());

        if (stop_requested_) {
            transition_locked(TraderState::STOPPED, stop_reason_, events);
        } else if (!limits.allowed) {
            auto_running_ = false;
            stop_reason_ = limits.reason;
            if (events.empty() || events.back().type != TradeEventType::LIMIT_REACHED) {
                events.push_back(make_event_locked(TradeEventType::LIMIT_REACHED, limits.reason));
            }
            spdlog::info("Session finished: {}", limits.reason);
            transition_locked(TraderState::STOPPED, limits.reason, events);
        } else if (auto_running_) {
            transition_locked(TraderState::WAITING_SIGNAL, "", events);
        } else {
            transition_locked(TraderState::IDLE, "", events);
        }
    }
    idle_cv_.notify_all();
    emit(events);
}

// ============================================================================
// Events and state
// ============================================================================

void AutoTrader::transition_locked(TraderState s, const std::string& message, std::vector<TradeEvent>& events) {
    TraderState prev = state_.exchange(s);
    spdlog::debug("Trader {} -> {}", trader_state_to_string(prev), trader_state_to_string(s));
    events.push_back(make_event_locked(TradeEventType::STATE_CHANGED,
        message.empty() ? trader_state_to_string(s) : message));
}

TradeEvent AutoTrader::make_event_locked(TradeEventType type, const std::string& message) const {
    TradeEvent event;
    event.type = type;
    event.state = state_.load();
    event.message = message;
    event.symbol = config_.symbol;
    event.stake = current_stake_;
    event.contract = open_contract_;
    event.cumulative_profit = stake_manager_->cumulative_profit();
    event.recovery_level = stake_manager_->level();
    event.time = wall_now();
    return event;
}

void AutoTrader::emit(const std::vector<TradeEvent>& events) {
    if (!on_event_) return;
    for (const auto& event : events) {
        on_event_(event);
    }
}

SessionSnapshot AutoTrader::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SessionSnapshot snap;
    snap.state = state_.load();
    snap.running = auto_running_;
    snap.symbol = config_.symbol;
    snap.balance = last_balance_;
    snap.currency = config_.currency;
    snap.base_stake = config_.base_stake;
    snap.recovery_level = stake_manager_->level();
    snap.current_stake = in_flight_ ? current_stake_ : stake_manager_->scheduled_stake(snap.recovery_level);
    snap.cumulative_profit = stake_manager_->cumulative_profit();
    snap.target_profit = config_.target_profit;
    snap.stop_loss = config_.stop_loss;
    snap.trades = stake_manager_->trades();
    snap.wins = stake_manager_->wins();
    snap.losses = stake_manager_->losses();
    snap.consecutive_losses = stake_manager_->consecutive_losses();
    snap.win_rate = snap.trades > 0 ? 100.0 * snap.wins / snap.trades : 0.0;
    snap.open_contract = open_contract_;
    snap.stop_reason = stop_reason_;
    snap.paused = stake_manager_->paused();
    snap.start_balance = stake_manager_->start_balance();
    return snap;
}

} // namespace binbot
