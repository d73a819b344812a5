#include "venue/venue_connector.hpp"
#include "common/errors.hpp"
#include "utils/metrics.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <stdexcept>

namespace binbot {

namespace {
    int64_t steady_ms() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now().time_since_epoch()
        ).count();
    }

    // Clears the session-setup deadline on every exit path
    struct DeadlineGuard {
        std::atomic<int64_t>& deadline;
        ~DeadlineGuard() { deadline = 0; }
    };
}

VenueConnector::VenueConnector(const ConnectionConfig& config, std::unique_ptr<Transport> transport)
    : config_(config)
    , transport_(std::move(transport))
{
    if (!transport_) {
        throw std::invalid_argument("VenueConnector requires a transport");
    }
}

VenueConnector::~VenueConnector() {
    disconnect();
}

// ============================================================================
// Connection lifecycle
// ============================================================================

AccountInfo VenueConnector::connect() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (running_.load()) {
        spdlog::warn("VenueConnector already running");
        return account();
    }

    // Threads left behind by a terminal failure
    stop_threads();

    running_ = true;
    set_status(ConnectionStatus::CONNECTING);
    last_ping_ = now();
    watchdog_thread_ = std::thread(&VenueConnector::run_watchdog, this);

    try {
        establish_session();
    } catch (const std::exception& e) {
        spdlog::error("Venue connect failed: {}", e.what());
        stop_threads();
        transport_->close();
        held_ticks_.clear();
        set_status(ConnectionStatus::DISCONNECTED);
        throw;
    }

    set_status(ConnectionStatus::CONNECTED);
    flush_held_ticks();

    loop_exited_ = false;
    recv_thread_ = std::thread(&VenueConnector::run_connection_loop, this);
    return account();
}

void VenueConnector::disconnect() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    bool active = running_.load() || recv_thread_.joinable() || watchdog_thread_.joinable();
    if (!active && status_.load() == ConnectionStatus::DISCONNECTED) {
        return;
    }

    spdlog::info("Disconnecting from venue");

    if (is_connected()) {
        // Best effort; the venue drops subscriptions with the socket anyway
        nlohmann::json msg = protocol::forget_all("ticks");
        msg["req_id"] = next_req_id_++;
        transport_->send(msg.dump());
    }

    stop_threads();
    transport_->close();

    fail_all_pending<CancelledError>("Connector disconnected");
    {
        std::lock_guard<std::mutex> subs_lock(subs_mutex_);
        subscriptions_.clear();
    }
    held_ticks_.clear();

    set_status(ConnectionStatus::DISCONNECTED);
}

void VenueConnector::stop_threads() {
    running_ = false;
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
    }
    wake_cv_.notify_all();

    if (recv_thread_.joinable()) {
        // The receive thread may be between open() and receive(); keep
        // interrupting until it notices running_ is false
        while (!loop_exited_.load()) {
            transport_->interrupt();
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        recv_thread_.join();
    }

    if (watchdog_thread_.joinable()) {
        watchdog_thread_.join();
    }
}

void VenueConnector::establish_session() {
    establish_timed_out_ = false;
    establish_deadline_ms_ = steady_ms() + config_.connection_timeout_ms;
    DeadlineGuard guard{establish_deadline_ms_};

    if (!transport_->open()) {
        throw TransportError("Failed to open connection to venue");
    }
    if (!running_.load()) {
        throw CancelledError("Connector stopped during connect");
    }

    if (config_.api_token.empty()) {
        spdlog::warn("No API token configured, session is unauthenticated (market data only)");
    } else {
        auto response = exchange(protocol::authorize(config_.api_token));
        AccountInfo info = protocol::parse_authorize(response);
        {
            std::lock_guard<std::mutex> lock(account_mutex_);
            account_ = info;
        }
        METRIC_GAUGE(metric_names::BALANCE).set(info.balance);
        spdlog::info("Authorized {} ({} account), balance {:.2f} {}",
                     info.loginid, info.is_virtual ? "demo" : "real", info.balance, info.currency);
    }

    std::vector<std::string> symbols;
    {
        std::lock_guard<std::mutex> lock(subs_mutex_);
        for (const auto& [symbol, sub] : subscriptions_) {
            symbols.push_back(symbol);
        }
    }

    for (const auto& symbol : symbols) {
        try {
            auto response = exchange(protocol::ticks_subscribe(symbol));
            std::lock_guard<std::mutex> lock(subs_mutex_);
            auto it = subscriptions_.find(symbol);
            if (it != subscriptions_.end()) {
                it->second.subscription_id = protocol::parse_subscription_id(response);
            }
            spdlog::info("Resubscribed to {} ticks", symbol);
        } catch (const RejectedError& e) {
            spdlog::warn("Venue refused resubscription to {}, dropping it: {}", symbol, e.what());
            std::lock_guard<std::mutex> lock(subs_mutex_);
            subscriptions_.erase(symbol);
        }
    }
}

nlohmann::json VenueConnector::exchange(nlohmann::json msg) {
    int64_t id = next_req_id_++;
    msg["req_id"] = id;
    std::string name = protocol::request_name(msg);

    if (!transport_->send(msg.dump())) {
        throw TransportError("Failed to send " + name);
    }

    while (true) {
        std::string raw = transport_->receive();
        if (raw.empty()) {
            if (establish_timed_out_.load()) {
                throw TimeoutError(fmt::format("{} timed out after {}ms during session setup",
                                               name, config_.connection_timeout_ms));
            }
            throw TransportError("Connection closed during " + name);
        }

        auto inbound = nlohmann::json::parse(raw, nullptr, false);
        if (inbound.is_discarded()) {
            spdlog::warn("Discarding malformed venue message ({} bytes)", raw.size());
            continue;
        }

        bool matches = inbound.contains("req_id") && inbound.at("req_id").is_number_integer()
            && inbound.at("req_id").get<int64_t>() == id;
        if (matches) {
            protocol::throw_if_error(inbound);
        }
        if (protocol::is_tick(inbound)) {
            held_ticks_.push_back(protocol::parse_tick(inbound));
        }
        if (matches) {
            return inbound;
        }
    }
}

bool VenueConnector::reconnect() {
    set_status(ConnectionStatus::RECONNECTING);

    for (int attempt = 1; attempt <= config_.max_reconnect_attempts; attempt++) {
        int64_t delay = time_utils::backoff_delay_ms(
            config_.reconnect_delay_ms, attempt, config_.max_reconnect_delay_ms);
        spdlog::info("Reconnecting in {}ms (attempt {}/{})", delay, attempt, config_.max_reconnect_attempts);

        {
            std::unique_lock<std::mutex> lock(wake_mutex_);
            if (wake_cv_.wait_for(lock, std::chrono::milliseconds(delay), [this] { return !running_.load(); })) {
                return false;
            }
        }

        reconnect_count_++;
        METRIC_COUNTER(metric_names::RECONNECTS).increment();

        try {
            establish_session();
            consecutive_timeouts_ = 0;
            set_status(ConnectionStatus::CONNECTED);
            spdlog::info("Reconnected after {} attempt(s), {} subscription(s) restored",
                         attempt, subscribed_symbols().size());
            flush_held_ticks();
            return true;
        } catch (const AuthError& e) {
            spdlog::error("Re-authorization failed: {}", e.what());
            transport_->close();
            held_ticks_.clear();
            running_ = false;
            wake_cv_.notify_all();
            set_status(ConnectionStatus::ERROR);
            report_error(std::string("Re-authorization failed: ") + e.what());
            return false;
        } catch (const std::exception& e) {
            spdlog::warn("Reconnect attempt {} failed: {}", attempt, e.what());
            transport_->close();
            held_ticks_.clear();
            if (!running_.load()) return false;
        }
    }

    spdlog::error("Max reconnect attempts reached");
    running_ = false;
    wake_cv_.notify_all();
    set_status(ConnectionStatus::ERROR);
    report_error("Max reconnect attempts reached");
    return false;
}

void VenueConnector::run_connection_loop() {
    while (running_.load()) {
        std::string raw = transport_->receive();
        if (raw.empty()) {
            if (!running_.load()) break;

            spdlog::warn("Venue connection lost");
            transport_->close();
            fail_all_pending<TransportError>("Connection lost");
            if (!reconnect()) break;
            continue;
        }

        handle_message(raw);
    }
    loop_exited_ = true;
}

void VenueConnector::run_watchdog() {
    auto interval = std::chrono::milliseconds(config_.watchdog_interval_ms);
    auto heartbeat = std::chrono::milliseconds(config_.heartbeat_interval_ms);

    while (running_.load()) {
        {
            std::unique_lock<std::mutex> lock(wake_mutex_);
            wake_cv_.wait_for(lock, interval, [this] { return !running_.load(); });
        }
        if (!running_.load()) break;

        expire_pending();

        int64_t deadline = establish_deadline_ms_.load();
        if (deadline > 0 && steady_ms() > deadline && !establish_timed_out_.load()) {
            establish_timed_out_ = true;
            spdlog::warn("Session setup exceeded {}ms, dropping connection", config_.connection_timeout_ms);
            transport_->interrupt();
        }

        if (config_.heartbeat_interval_ms > 0 && is_connected() && now() - last_ping_ >= heartbeat) {
            last_ping_ = now();
            // Unanswered pings count toward the forced-reconnect threshold
            request(protocol::ping());
        }
    }
}

// ============================================================================
// Inbound messages
// ============================================================================

void VenueConnector::handle_message(const std::string& raw) {
    auto msg = nlohmann::json::parse(raw, nullptr, false);
    if (msg.is_discarded()) {
        spdlog::warn("Discarding malformed venue message ({} bytes)", raw.size());
        return;
    }

    std::string type = msg.value("msg_type", "");
    try {
        if (protocol::is_tick(msg)) {
            dispatch_tick(protocol::parse_tick(msg));
        } else if (type == "balance" && !msg.contains("error")) {
            Money balance = protocol::parse_balance(msg);
            {
                std::lock_guard<std::mutex> lock(account_mutex_);
                account_.balance = balance;
            }
            METRIC_GAUGE(metric_names::BALANCE).set(balance);
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to handle {} message: {}", type, e.what());
    }

    if (msg.contains("req_id")) {
        resolve(msg);
    }
}

void VenueConnector::resolve(const nlohmann::json& msg) {
    if (!msg.at("req_id").is_number_integer()) return;
    int64_t id = msg.at("req_id").get<int64_t>();

    PendingRequest entry;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            // Streamed ticks echo their subscription's req_id
            if (!protocol::is_tick(msg)) {
                spdlog::debug("Discarding late response req_id={}", id);
                METRIC_COUNTER(metric_names::LATE_RESPONSES).increment();
            }
            return;
        }
        entry = std::move(it->second);
        pending_.erase(it);
    }

    auto latency = std::chrono::duration_cast<Duration>(now() - entry.sent_at);
    consecutive_timeouts_ = 0;

    if (auto err = protocol::error_to_exception(msg)) {
        METRIC_COUNTER(metric_names::REQUEST_REJECTS).increment();
        METRIC_REQUEST(entry.name).record(RequestOutcome::REJECTED, latency);
        spdlog::warn("{} req_id={} rejected: {}", entry.name, id, msg.at("error").value("message", ""));
        entry.promise.set_exception(err);
    } else {
        METRIC_REQUEST(entry.name).record(RequestOutcome::ANSWERED, latency);
        entry.promise.set_value(msg);
    }
}

void VenueConnector::dispatch_tick(const Tick& tick) {
    METRIC_COUNTER(metric_names::TICKS_RECEIVED).increment();

    TickHandler handler;
    {
        std::lock_guard<std::mutex> lock(subs_mutex_);
        auto it = subscriptions_.find(tick.symbol);
        if (it == subscriptions_.end()) return;
        handler = it->second.handler;
    }
    if (handler) handler(tick);
}

void VenueConnector::flush_held_ticks() {
    std::vector<Tick> held;
    held.swap(held_ticks_);
    for (const auto& tick : held) {
        try {
            dispatch_tick(tick);
        } catch (const std::exception& e) {
            spdlog::error("Tick handler for {} failed: {}", tick.symbol, e.what());
        }
    }
}

// ============================================================================
// Requests
// ============================================================================

std::future<nlohmann::json> VenueConnector::request(nlohmann::json msg) {
    return request(std::move(msg), std::chrono::milliseconds(config_.request_timeout_ms));
}

std::future<nlohmann::json> VenueConnector::request(nlohmann::json msg, std::chrono::milliseconds timeout) {
    std::promise<nlohmann::json> promise;
    auto future = promise.get_future();
    std::string name = protocol::request_name(msg);

    if (!is_connected()) {
        promise.set_exception(std::make_exception_ptr(TransportError(
            fmt::format("Cannot send {}: venue {}", name, connection_status_to_string(status())))));
        return future;
    }

    int64_t id = next_req_id_++;
    msg["req_id"] = id;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        PendingRequest entry;
        entry.promise = std::move(promise);
        entry.sent_at = now();
        entry.deadline = entry.sent_at + timeout;
        entry.name = name;
        pending_.emplace(id, std::move(entry));
    }

    METRIC_COUNTER(metric_names::REQUESTS_SENT).increment();
    spdlog::debug("-> {} req_id={}", name, id);

    if (!transport_->send(msg.dump())) {
        PendingRequest entry;
        bool found = false;
        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            auto it = pending_.find(id);
            if (it != pending_.end()) {
                entry = std::move(it->second);
                pending_.erase(it);
                found = true;
            }
        }
        if (found) {
            entry.promise.set_exception(std::make_exception_ptr(TransportError("Failed to send " + name)));
        }
    }

    return future;
}

nlohmann::json VenueConnector::call(nlohmann::json msg) {
    return request(std::move(msg)).get();
}

nlohmann::json VenueConnector::call(nlohmann::json msg, std::chrono::milliseconds timeout) {
    return request(std::move(msg), timeout).get();
}

void VenueConnector::expire_pending() {
    std::vector<std::pair<int64_t, PendingRequest>> expired;
    auto t = now();
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        for (auto it = pending_.begin(); it != pending_.end();) {
            if (it->second.deadline <= t) {
                expired.emplace_back(it->first, std::move(it->second));
                it = pending_.erase(it);
            } else {
                ++it;
            }
        }
    }

    if (expired.empty()) return;

    for (auto& [id, entry] : expired) {
        METRIC_COUNTER(metric_names::REQUEST_TIMEOUTS).increment();
        METRIC_REQUEST(entry.name).record(RequestOutcome::TIMED_OUT);
        int64_t waited = time_utils::elapsed_ms(entry.sent_at);
        spdlog::warn("{} req_id={} timed out after {}ms", entry.name, id, waited);
        entry.promise.set_exception(std::make_exception_ptr(
            TimeoutError(fmt::format("{} req_id={} timed out after {}ms", entry.name, id, waited))));
    }

    int timeouts = consecutive_timeouts_ += static_cast<int>(expired.size());
    if (config_.max_consecutive_timeouts > 0 && timeouts >= config_.max_consecutive_timeouts && is_connected()) {
        spdlog::warn("{} consecutive request timeouts, forcing reconnect", timeouts);
        consecutive_timeouts_ = 0;
        transport_->interrupt();
    }
}

template <typename Error>
void VenueConnector::fail_all_pending(const std::string& reason) {
    std::map<int64_t, PendingRequest> failed;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        failed.swap(pending_);
    }
    if (!failed.empty()) {
        spdlog::warn("Failing {} pending request(s): {}", failed.size(), reason);
    }
    for (auto& [id, entry] : failed) {
        entry.promise.set_exception(std::make_exception_ptr(Error(reason)));
    }
}

// ============================================================================
// Subscriptions
// ============================================================================

void VenueConnector::subscribe_ticks(const std::string& symbol, TickHandler handler) {
    {
        std::lock_guard<std::mutex> lock(subs_mutex_);
        auto it = subscriptions_.find(symbol);
        if (it != subscriptions_.end()) {
            it->second.handler = std::move(handler);
            spdlog::info("Replaced tick handler for {}", symbol);
            return;
        }
        // Registered before the request so the first tick is not missed
        subscriptions_[symbol] = Subscription{std::move(handler), ""};
    }

    try {
        auto response = call(protocol::ticks_subscribe(symbol));
        std::string id = protocol::parse_subscription_id(response);
        {
            std::lock_guard<std::mutex> lock(subs_mutex_);
            auto it = subscriptions_.find(symbol);
            if (it != subscriptions_.end()) it->second.subscription_id = id;
        }
        spdlog::info("Subscribed to {} ticks (subscription {})", symbol, id);
    } catch (const std::exception& e) {
        spdlog::error("Subscription to {} failed: {}", symbol, e.what());
        {
            std::lock_guard<std::mutex> lock(subs_mutex_);
            subscriptions_.erase(symbol);
        }
        throw;
    }
}

bool VenueConnector::unsubscribe_ticks(const std::string& symbol) {
    std::string subscription_id;
    {
        std::lock_guard<std::mutex> lock(subs_mutex_);
        auto it = subscriptions_.find(symbol);
        if (it == subscriptions_.end()) return false;
        subscription_id = it->second.subscription_id;
        subscriptions_.erase(it);
    }

    if (!subscription_id.empty() && is_connected()) {
        // Not awaited; ticks may still arrive until the venue acknowledges
        request(protocol::forget(subscription_id));
    }
    spdlog::info("Unsubscribed from {} ticks", symbol);
    return true;
}

void VenueConnector::forget_all_ticks() {
    {
        std::lock_guard<std::mutex> lock(subs_mutex_);
        subscriptions_.clear();
    }
    call(protocol::forget_all("ticks"));
}

// ============================================================================
// Typed operations
// ============================================================================

std::vector<Tick> VenueConnector::get_history(const std::string& symbol, int count) {
    return protocol::parse_history(call(protocol::ticks_history(symbol, count)), symbol);
}

Money VenueConnector::get_balance() {
    Money balance = protocol::parse_balance(call(protocol::balance()));
    {
        std::lock_guard<std::mutex> lock(account_mutex_);
        account_.balance = balance;
    }
    METRIC_GAUGE(metric_names::BALANCE).set(balance);
    return balance;
}

Proposal VenueConnector::get_proposal(const ProposalRequest& req) {
    return protocol::parse_proposal(call(protocol::proposal(req)));
}

Contract VenueConnector::buy(const std::string& proposal_id, Money price) {
    return protocol::parse_buy(call(protocol::buy(proposal_id, price)));
}

Contract VenueConnector::get_contract(int64_t contract_id) {
    return protocol::parse_open_contract(call(protocol::open_contract(contract_id)));
}

Contract VenueConnector::get_contract(int64_t contract_id, std::chrono::milliseconds timeout) {
    return protocol::parse_open_contract(call(protocol::open_contract(contract_id), timeout));
}

std::vector<SymbolInfo> VenueConnector::get_active_symbols(const std::string& market) {
    auto symbols = protocol::parse_active_symbols(call(protocol::active_symbols()));
    if (market.empty()) return symbols;

    std::vector<SymbolInfo> filtered;
    for (const auto& s : symbols) {
        if (s.market == market) filtered.push_back(s);
    }
    return filtered;
}

// ============================================================================
// State
// ============================================================================

AccountInfo VenueConnector::account() const {
    std::lock_guard<std::mutex> lock(account_mutex_);
    return account_;
}

size_t VenueConnector::pending_count() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.size();
}

std::vector<std::string> VenueConnector::subscribed_symbols() const {
    std::lock_guard<std::mutex> lock(subs_mutex_);
    std::vector<std::string> symbols;
    for (const auto& [symbol, sub] : subscriptions_) {
        symbols.push_back(symbol);
    }
    return symbols;
}

void VenueConnector::set_status(ConnectionStatus s) {
    ConnectionStatus old = status_.exchange(s);
    if (old == s) return;

    spdlog::info("Venue connection {} -> {}", connection_status_to_string(old), connection_status_to_string(s));
    if (on_status_) on_status_(s);
}

void VenueConnector::report_error(const std::string& message) {
    if (on_error_) on_error_(message);
}

} // namespace binbot
