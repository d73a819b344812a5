#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "execution/trade_event.hpp"

namespace binbot {

/**
 * Persistent trade ledger for recording all trading activity.
 * Writes to JSON lines format for easy processing.
 */
class TradeLedger {
public:
    explicit TradeLedger(const std::string& path);
    ~TradeLedger();

    // Record events
    void record_trade_event(const TradeEvent& event);
    void record_session(const SessionSnapshot& snapshot);

    // Generic event recording
    void record_event(const std::string& event_type, const nlohmann::json& data);

    // Query historical data
    std::vector<nlohmann::json> load_events(const std::string& event_type = "") const;
    std::vector<Contract> get_settled_contracts() const;

    // Summary statistics over settled contracts
    struct Summary {
        int trades{0};
        int wins{0};
        int losses{0};
        Money staked{0.0};
        Money profit{0.0};
    };

    Summary get_summary() const;

    // Ledger management
    void flush();
    void rotate();  // Rotate to new file if too large
    size_t file_size() const;
    const std::string& path() const { return current_path_; }

private:
    std::string base_path_;
    std::string current_path_;
    std::ofstream file_;
    mutable std::mutex mutex_;

    static constexpr size_t MAX_FILE_SIZE = 100 * 1024 * 1024;  // 100MB

    void open_file();
    void write_line(const nlohmann::json& j);
};

// JSON serialization for persistence types
void to_json(nlohmann::json& j, const Contract& c);
void from_json(const nlohmann::json& j, Contract& c);

void to_json(nlohmann::json& j, const TradeEvent& e);
void to_json(nlohmann::json& j, const SessionSnapshot& s);

} // namespace binbot
