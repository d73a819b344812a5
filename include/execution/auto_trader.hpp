#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "common/types.hpp"
#include "config/config.hpp"
#include "execution/contract_tracker.hpp"
#include "execution/trade_event.hpp"
#include "risk/stake_manager.hpp"
#include "utils/cancellation.hpp"
#include "venue/venue_connector.hpp"

namespace binbot {

/**
 * Auto-trading loop.
 *
 * IDLE -> WAITING_SIGNAL -> EXECUTING -> MONITORING -> WON|LOST -> WAITING_SIGNAL,
 * with STOPPED reachable from any state. At most one contract is in
 * EXECUTING/MONITORING at a time; signals arriving meanwhile are ignored.
 * Cycles run on a dedicated worker thread so on_signal() never blocks the
 * tick-delivery path.
 */
class AutoTrader {
public:
    using EventCallback = std::function<void(const TradeEvent&)>;

    AutoTrader(VenueConnector& connector, const TradingConfig& config, const TrackerConfig& tracker_config);
    ~AutoTrader();

    AutoTrader(const AutoTrader&) = delete;
    AutoTrader& operator=(const AutoTrader&) = delete;

    // Start a fresh session (stake, recovery level and profit reset)
    CheckResult start();
    CheckResult start(const TradingConfig& params);

    // Graceful stop: an in-flight contract is tracked to settlement first
    void stop(const std::string& reason = "Stopped by user");

    // Stop, cancel tracking and join the worker
    void shutdown();

    // Offer a signal; returns true if it started a cycle
    bool on_signal(const Signal& signal);

    // Single manual trade through the same one-contract slot
    CheckResult place_trade(Direction direction, std::optional<Money> stake = std::nullopt);

    // Terminal connector failure
    void on_connection_failed(const std::string& reason);

    // Block until no cycle is queued or in flight
    bool wait_until_idle(std::chrono::milliseconds timeout);

    TraderState state() const { return state_.load(); }
    SessionSnapshot snapshot() const;
    const StakeManager& stake_manager() const { return *stake_manager_; }

    void set_event_callback(EventCallback cb) { on_event_ = std::move(cb); }

    // Stats
    int64_t buys_sent() const { return buys_sent_.load(); }
    int64_t signals_ignored() const { return signals_ignored_.load(); }

private:
    struct CycleRequest {
        Direction direction{Direction::RISE};
        std::optional<Money> stake;   // Manual override
        bool manual{false};
        int confidence{0};
        std::vector<TradeEvent> events;  // Emitted by the worker ahead of the cycle's own
    };

    VenueConnector& connector_;
    TradingConfig config_;
    std::unique_ptr<StakeManager> stake_manager_;
    ContractTracker tracker_;
    CancellationToken cancel_;

    std::atomic<TraderState> state_{TraderState::IDLE};
    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::optional<CycleRequest> queued_;
    bool in_flight_{false};        // Claimed by a signal or manual trade until finish
    bool auto_running_{false};
    bool stop_requested_{false};
    bool shutting_down_{false};
    std::string stop_reason_;
    std::optional<Contract> open_contract_;
    Money current_stake_{0.0};
    Money last_balance_{0.0};
    Timestamp last_accepted_{};

    std::thread worker_thread_;
    EventCallback on_event_;

    std::atomic<int64_t> buys_sent_{0};
    std::atomic<int64_t> signals_ignored_{0};

    void run_worker();
    void run_cycle(const CycleRequest& req);
    void abort_cycle(const std::string& reason);
    // Finishes the cycle and returns true when a stop or a session limit
    // landed before the buy was sent
    bool halt_entry_if_stopped();
    void finish_cycle(std::vector<TradeEvent> events = {});

    // Callers hold mutex_
    void transition_locked(TraderState s, const std::string& message, std::vector<TradeEvent>& events);
    TradeEvent make_event_locked(TradeEventType type, const std::string& message) const;
    void claim_locked(CycleRequest req);
    void collect_pause_events_locked(std::vector<TradeEvent>& events);

    void emit(const std::vector<TradeEvent>& events);
};

} // namespace binbot
