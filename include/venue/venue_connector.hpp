#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "config/config.hpp"
#include "venue/transport.hpp"
#include "venue/venue_protocol.hpp"

namespace binbot {

/**
 * Single authoritative connection to the venue.
 *
 * Requests are correlated by req_id and may be in flight concurrently; ticks
 * are routed by symbol to one handler each. A receive thread demultiplexes
 * the inbound stream and a watchdog thread expires overdue requests and
 * sends keepalives.
 *
 * Tick handlers and callbacks run on the receive thread. They must not call
 * blocking members (call(), subscribe_ticks(), get_*(), disconnect()).
 */
class VenueConnector {
public:
    using TickHandler = std::function<void(const Tick&)>;
    using StatusCallback = std::function<void(ConnectionStatus)>;
    using ErrorCallback = std::function<void(const std::string&)>;

    VenueConnector(const ConnectionConfig& config, std::unique_ptr<Transport> transport);
    ~VenueConnector();

    VenueConnector(const VenueConnector&) = delete;
    VenueConnector& operator=(const VenueConnector&) = delete;

    // Open and authorize. Throws AuthError or TransportError.
    AccountInfo connect();

    // Close, cancel pending requests, clear subscriptions. Idempotent.
    void disconnect();

    // Correlated request; the future fails with TimeoutError, RejectedError,
    // AuthError, TransportError or CancelledError
    std::future<nlohmann::json> request(nlohmann::json msg);
    std::future<nlohmann::json> request(nlohmann::json msg, std::chrono::milliseconds timeout);

    // Blocking request
    nlohmann::json call(nlohmann::json msg);
    nlohmann::json call(nlohmann::json msg, std::chrono::milliseconds timeout);

    // Tick subscriptions, one handler per symbol
    void subscribe_ticks(const std::string& symbol, TickHandler handler);
    bool unsubscribe_ticks(const std::string& symbol);
    void forget_all_ticks();

    // Typed venue operations
    std::vector<Tick> get_history(const std::string& symbol, int count);
    Money get_balance();
    Proposal get_proposal(const ProposalRequest& req);
    Contract buy(const std::string& proposal_id, Money price);
    Contract get_contract(int64_t contract_id);
    Contract get_contract(int64_t contract_id, std::chrono::milliseconds timeout);
    std::vector<SymbolInfo> get_active_symbols(const std::string& market = "");

    // State
    ConnectionStatus status() const { return status_.load(); }
    bool is_connected() const { return status_.load() == ConnectionStatus::CONNECTED; }
    AccountInfo account() const;
    size_t pending_count() const;
    std::vector<std::string> subscribed_symbols() const;
    int reconnect_count() const { return reconnect_count_.load(); }

    // Callbacks
    void set_status_callback(StatusCallback cb) { on_status_ = std::move(cb); }
    void set_error_callback(ErrorCallback cb) { on_error_ = std::move(cb); }

private:
    struct PendingRequest {
        std::promise<nlohmann::json> promise;
        Timestamp deadline;
        Timestamp sent_at;
        std::string name;
    };

    struct Subscription {
        TickHandler handler;
        std::string subscription_id;
    };

    ConnectionConfig config_;
    std::unique_ptr<Transport> transport_;

    std::atomic<ConnectionStatus> status_{ConnectionStatus::DISCONNECTED};
    std::atomic<bool> running_{false};
    std::atomic<bool> loop_exited_{true};
    std::atomic<int> reconnect_count_{0};
    std::atomic<int> consecutive_timeouts_{0};

    std::mutex lifecycle_mutex_;
    std::thread recv_thread_;
    std::thread watchdog_thread_;

    // Wakes the watchdog and reconnect backoff on shutdown
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;

    mutable std::mutex pending_mutex_;
    std::map<int64_t, PendingRequest> pending_;
    std::atomic<int64_t> next_req_id_{1};

    mutable std::mutex subs_mutex_;
    std::map<std::string, Subscription> subscriptions_;

    mutable std::mutex account_mutex_;
    AccountInfo account_;

    // Session establishment (authorize + resubscribe) runs synchronously on
    // the thread that owns receive(); ticks seen meanwhile wait here
    std::vector<Tick> held_ticks_;
    std::atomic<int64_t> establish_deadline_ms_{0};
    std::atomic<bool> establish_timed_out_{false};

    Timestamp last_ping_;

    StatusCallback on_status_;
    ErrorCallback on_error_;

    // Connection lifecycle
    void establish_session();
    nlohmann::json exchange(nlohmann::json msg);
    bool reconnect();
    void run_connection_loop();
    void run_watchdog();
    void stop_threads();

    // Inbound
    void handle_message(const std::string& raw);
    void resolve(const nlohmann::json& msg);
    void dispatch_tick(const Tick& tick);
    void flush_held_ticks();

    // Pending requests
    void expire_pending();
    template <typename Error>
    void fail_all_pending(const std::string& reason);

    void set_status(ConnectionStatus s);
    void report_error(const std::string& message);
};

} // namespace binbot
