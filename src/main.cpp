#include <iostream>
#include <iomanip>
#include <csignal>
#include <atomic>
#include <filesystem>
#include <thread>
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include "common/errors.hpp"
#include "common/types.hpp"
#include "config/config.hpp"
#include "execution/auto_trader.hpp"
#include "persistence/trade_ledger.hpp"
#include "strategy/signal_engine.hpp"
#include "strategy/strategy_base.hpp"
#include "utils/metrics.hpp"
#include "utils/time_utils.hpp"
#include "venue/venue_connector.hpp"
#include "venue/websocket_transport.hpp"

using namespace binbot;

// Global shutdown flags; a second Ctrl+C abandons an open contract
std::atomic<bool> g_shutdown{false};
std::atomic<bool> g_force_shutdown{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        if (g_shutdown) {
            g_force_shutdown = true;
        }
        g_shutdown = true;
    }
}

void setup_logging(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.log_to_console) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);
    }

    if (config.log_to_file) {
        std::filesystem::create_directories(config.log_dir);
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_dir + "/binbot.log",
            config.max_log_file_size_mb * 1024 * 1024,
            config.max_log_files
        );
        if (config.json_format) {
            file_sink->set_pattern(R"({"time":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","thread":%t,"msg":"%v"})");
        }
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("binbot", sinks.begin(), sinks.end());

    if (config.log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (config.log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (config.log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
}

void print_startup_banner(const Config& config, const AccountInfo& account) {
    const auto& t = config.trading;
    std::cout << "\n┌─────────────────────────────────────────────────────────────────────────────┐\n";
    std::cout << "│ BINBOT  rise/fall auto-trader                                               │\n";
    std::cout << "├─────────────────────────────────────────────────────────────────────────────┤\n";
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "│ Account:    " << account.loginid << (account.is_virtual ? " (demo)" : " (REAL)") << "\n";
    std::cout << "│ Balance:    " << account.balance << " " << account.currency << "\n";
    std::cout << "│ Symbol:     " << t.symbol << "  " << t.duration << t.duration_unit << " contracts\n";
    std::cout << "│ Strategy:   " << config.signal.strategy << "  threshold " << t.entry_threshold() << "%\n";
    std::cout << "│ Stake:      " << t.base_stake << "  " << recovery_mode_to_string(t.recovery_mode)
              << " x" << t.recovery_multiplier << " up to level " << t.max_recovery_level << "\n";
    std::cout << "│ Target:     +" << t.target_profit << "   Stop loss: -" << t.stop_loss << "\n";
    std::cout << "└─────────────────────────────────────────────────────────────────────────────┘\n\n";

    if (t.dry_run) {
        std::cout << "[DRY-RUN MODE] Signals computed, no contracts bought.\n\n";
    } else if (!account.is_virtual) {
        std::cout << "╔═══════════════════════════════════════════════════════════════════════════════╗\n";
        std::cout << "║  WARNING: REAL ACCOUNT. Contracts will be bought with real money.            ║\n";
        std::cout << "╚═══════════════════════════════════════════════════════════════════════════════╝\n\n";
    }
}

void print_ledger_summary(const TradeLedger& ledger) {
    auto totals = ledger.get_summary();
    double win_rate = totals.trades > 0 ? 100.0 * totals.wins / totals.trades : 0.0;
    spdlog::info("Ledger {}: {} settled (won {}, lost {}, win rate {:.1f}%) staked {:.2f} profit {:+.2f}",
                 ledger.path(), totals.trades, totals.wins, totals.losses, win_rate,
                 totals.staked, totals.profit);
}

void log_trade_event(const TradeEvent& event) {
    switch (event.type) {
        case TradeEventType::TRADE_SETTLED:
            if (event.contract) {
                spdlog::info("[{}] {} {} {:+.2f} | session {:+.2f} | level {}",
                             trader_state_to_string(event.state), event.symbol,
                             event.contract->contract_type, event.contract->profit,
                             event.cumulative_profit, event.recovery_level);
            }
            break;
        case TradeEventType::LOSS_WARNING:
        case TradeEventType::TRADING_PAUSED:
        case TradeEventType::CYCLE_ABORTED:
        case TradeEventType::CONTRACT_STUCK:
            spdlog::warn("[{}] {}", trade_event_type_to_string(event.type), event.message);
            break;
        case TradeEventType::LIMIT_REACHED:
        case TradeEventType::TRADING_RESUMED:
        case TradeEventType::SESSION_FAILED:
            spdlog::info("[{}] {}", trade_event_type_to_string(event.type), event.message);
            break;
        default:
            break;
    }
}

int main(int argc, char* argv[]) {
    // CLI parsing
    CLI::App app{"binbot - rise/fall binary option auto-trader"};

    std::string config_path = "configs/binbot.json";
    std::string symbol;
    std::string strategy;
    std::string recovery;
    double stake = 0.0;
    double target = 0.0;
    double stop_loss = 0.0;
    int threshold = -1;
    bool dry_run = false;
    bool list_symbols = false;
    bool ledger_summary = false;
    bool verbose = false;
    bool show_version = false;

    app.add_option("-c,--config", config_path, "Path to configuration file");
    app.add_option("-s,--symbol", symbol, "Symbol to trade (e.g. R_100)");
    app.add_option("--strategy", strategy, "Signal strategy")
        ->check(CLI::IsMember(strategy_names()));
    app.add_option("--stake", stake, "Base stake")->check(CLI::PositiveNumber);
    app.add_option("--target", target, "Session target profit")->check(CLI::PositiveNumber);
    app.add_option("--stop-loss", stop_loss, "Session stop loss")->check(CLI::PositiveNumber);
    app.add_option("--threshold", threshold, "Minimum signal confidence (0-100)")->check(CLI::Range(0, 100));
    app.add_option("--recovery", recovery, "Recovery schedule: geometric, fibonacci, fixed");
    app.add_flag("--list-symbols", list_symbols, "List tradable symbols and exit");
    app.add_flag("--summary", ledger_summary, "Print totals from the trade ledger and exit");
    app.add_flag("--dry-run", dry_run, "Dry-run mode: stream signals without buying");
    app.add_flag("--verbose", verbose, "Debug logging");
    app.add_flag("-v,--version", show_version, "Show version information");

    CLI11_PARSE(app, argc, argv);

    if (show_version) {
        std::cout << "binbot v1.0.0\n";
        std::cout << "Built with C++20\n";
        return 0;
    }

    // Load config
    Config config;
    try {
        if (std::filesystem::exists(config_path)) {
            config = Config::load(config_path);
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << "\n";
        return 1;
    }
    config.apply_env();

    // Command line overrides
    if (!symbol.empty()) config.trading.symbol = symbol;
    if (!strategy.empty()) config.signal.strategy = strategy;
    if (stake > 0) config.trading.base_stake = stake;
    if (target > 0) config.trading.target_profit = target;
    if (stop_loss > 0) config.trading.stop_loss = stop_loss;
    if (threshold >= 0) config.trading.confidence_threshold = threshold;
    if (!recovery.empty()) {
        auto mode = parse_recovery_mode(recovery);
        if (!mode) {
            std::cerr << "Unknown recovery schedule: " << recovery << "\n";
            return 1;
        }
        config.trading.recovery_mode = *mode;
    }
    if (dry_run) config.trading.dry_run = true;
    if (verbose) config.logging.log_level = "debug";

    // Setup logging
    setup_logging(config.logging);

    if (!config.validate()) {
        spdlog::error("Invalid configuration, exiting");
        return 1;
    }

    if (ledger_summary) {
        TradeLedger ledger(config.trade_ledger_path);
        print_ledger_summary(ledger);
        return 0;
    }

    if (config.connection.api_token.empty() && !list_symbols && !config.trading.dry_run) {
        spdlog::error("Trading requires an API token. Set DERIV_API_TOKEN or use --dry-run");
        return 1;
    }

    // Signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // Connect
    std::string url = config.connection.ws_url + "?app_id=" + config.connection.app_id;
    VenueConnector connector(config.connection,
        std::make_unique<WebSocketTransport>(url, config.connection.connection_timeout_ms));

    connector.set_status_callback([](ConnectionStatus s) {
        spdlog::info("Connection {}", connection_status_to_string(s));
    });

    AccountInfo account;
    try {
        account = connector.connect();
    } catch (const VenueError& e) {
        spdlog::error("Connection failed: {}", e.what());
        return 1;
    }

    if (list_symbols) {
        try {
            auto symbols = connector.get_active_symbols();
            std::cout << "\n" << std::left << std::setw(16) << "SYMBOL" << std::setw(36) << "NAME" << "MARKET\n";
            for (const auto& s : symbols) {
                std::cout << std::left << std::setw(16) << s.symbol << std::setw(36) << s.display_name
                          << s.market << "\n";
            }
            std::cout << "\n" << symbols.size() << " symbols\n";
        } catch (const VenueError& e) {
            spdlog::error("Failed to list symbols: {}", e.what());
            connector.disconnect();
            return 1;
        }
        connector.disconnect();
        return 0;
    }

    // Signal engine
    std::unique_ptr<SignalStrategy> signal_strategy;
    try {
        signal_strategy = make_strategy(config.signal.strategy);
    } catch (const std::invalid_argument& e) {
        spdlog::error("{}", e.what());
        connector.disconnect();
        return 1;
    }
    if (!config.trading.confidence_threshold) {
        config.trading.confidence_threshold = signal_strategy->default_confidence_threshold();
    }

    print_startup_banner(config, account);
    SignalEngine engine(config.signal, std::move(signal_strategy));
    try {
        auto history = connector.get_history(config.trading.symbol, config.signal.history_preload);
        engine.preload(config.trading.symbol, history);
        spdlog::info("Preloaded {} ticks of {} history", history.size(), config.trading.symbol);
    } catch (const std::exception& e) {
        spdlog::warn("History preload failed, warming up from live ticks: {}", e.what());
    }

    // Ledger and trader
    TradeLedger ledger(config.trade_ledger_path);
    AutoTrader trader(connector, config.trading, config.tracker);

    trader.set_event_callback([&ledger](const TradeEvent& event) {
        ledger.record_trade_event(event);
        log_trade_event(event);
    });

    connector.set_error_callback([&trader](const std::string& message) {
        spdlog::error("Venue connection failed: {}", message);
        trader.on_connection_failed(message);
    });

    bool dry = config.trading.dry_run;
    engine.set_signal_callback([&trader, dry](const Signal& signal) {
        if (dry) {
            spdlog::info("[SIGNAL] {} {} {}% (bull {:.1f} / bear {:.1f}) @ {}",
                         signal.symbol, direction_to_string(signal.direction), signal.confidence,
                         signal.bullish_score, signal.bearish_score, signal.last_price);
            return;
        }
        trader.on_signal(signal);
    });

    try {
        connector.subscribe_ticks(config.trading.symbol, [&engine](const Tick& tick) {
            engine.on_tick(tick);
        });
    } catch (const VenueError& e) {
        spdlog::error("Tick subscription failed: {}", e.what());
        connector.disconnect();
        return 1;
    }

    if (!dry) {
        auto started = trader.start();
        if (!started.allowed) {
            spdlog::error("Cannot start trading: {}", started.reason);
            connector.disconnect();
            return 1;
        }
    }

    // Main loop
    auto last_status = now();
    while (!g_shutdown) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        if (!dry && trader.state() == TraderState::STOPPED) {
            break;
        }
        if (connector.status() == ConnectionStatus::ERROR) {
            break;
        }

        if (time_utils::elapsed_ms(last_status) >= 30000) {
            last_status = now();
            auto snap = trader.snapshot();
            spdlog::info("[{}] trades={} W/L={}/{} session={:+.2f} level={} ticks={} signals={}",
                         trader_state_to_string(snap.state), snap.trades, snap.wins, snap.losses,
                         snap.cumulative_profit, snap.recovery_level,
                         engine.ticks_processed(), engine.signals_generated());
        }
    }

    // Shutdown
    spdlog::info("Shutting down...");

    trader.stop(g_shutdown ? "Stopped by user" : "Session finished");
    while (!trader.wait_until_idle(std::chrono::milliseconds(500))) {
        if (g_force_shutdown || connector.status() == ConnectionStatus::ERROR) {
            spdlog::warn("Abandoning open contract");
            break;
        }
        spdlog::info("Waiting for open contract to settle (Ctrl+C again to abandon)");
    }

    connector.disconnect();
    trader.shutdown();

    auto snap = trader.snapshot();
    ledger.record_session(snap);
    ledger.flush();

    // Print final stats
    spdlog::info("Stop reason: {}", snap.stop_reason.empty() ? "none" : snap.stop_reason);
    spdlog::info("Trades: {} (won {}, lost {}, win rate {:.1f}%)", snap.trades, snap.wins, snap.losses, snap.win_rate);
    spdlog::info("Session profit: {:+.2f} {}", snap.cumulative_profit, snap.currency);
    print_ledger_summary(ledger);
    for (const auto& line : MetricsRegistry::instance().request_report()) {
        spdlog::info("Requests {}", line);
    }

    std::cout << "\nMetrics:\n" << MetricsRegistry::instance().to_json() << "\n";

    spdlog::info("binbot shutdown complete.");
    return 0;
}
