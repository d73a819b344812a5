#include "persistence/trade_ledger.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace binbot {

// JSON serialization helpers

void to_json(nlohmann::json& j, const Contract& c) {
    j = nlohmann::json{
        {"contract_id", c.contract_id},
        {"symbol", c.symbol},
        {"contract_type", c.contract_type},
        {"buy_price", c.buy_price},
        {"payout", c.payout},
        {"profit", c.profit},
        {"status", contract_status_to_string(c.status)},
        {"is_sold", c.is_sold},
        {"start_time", c.start_time}
    };
}

void from_json(const nlohmann::json& j, Contract& c) {
    c.contract_id = j.value("contract_id", int64_t{0});
    c.symbol = j.value("symbol", "");
    c.contract_type = j.value("contract_type", "");
    c.buy_price = j.value("buy_price", 0.0);
    c.payout = j.value("payout", 0.0);
    c.profit = j.value("profit", 0.0);
    std::string status = j.value("status", "open");
    if (status == "won") {
        c.status = ContractStatus::WON;
    } else if (status == "lost") {
        c.status = ContractStatus::LOST;
    } else {
        c.status = ContractStatus::OPEN;
    }
    c.is_sold = j.value("is_sold", false);
    c.start_time = j.value("start_time", int64_t{0});
}

void to_json(nlohmann::json& j, const TradeEvent& e) {
    j = nlohmann::json{
        {"type", trade_event_type_to_string(e.type)},
        {"state", trader_state_to_string(e.state)},
        {"message", e.message},
        {"symbol", e.symbol},
        {"stake", e.stake},
        {"cumulative_profit", e.cumulative_profit},
        {"recovery_level", e.recovery_level},
        {"time", time_utils::to_iso8601(e.time)}
    };
    if (e.direction) {
        j["direction"] = direction_to_string(*e.direction);
    }
    if (e.contract) {
        j["contract"] = *e.contract;
    }
}

void to_json(nlohmann::json& j, const SessionSnapshot& s) {
    j = nlohmann::json{
        {"state", trader_state_to_string(s.state)},
        {"symbol", s.symbol},
        {"balance", s.balance},
        {"start_balance", s.start_balance},
        {"currency", s.currency},
        {"base_stake", s.base_stake},
        {"recovery_level", s.recovery_level},
        {"cumulative_profit", s.cumulative_profit},
        {"target_profit", s.target_profit},
        {"stop_loss", s.stop_loss},
        {"trades", s.trades},
        {"wins", s.wins},
        {"losses", s.losses},
        {"win_rate", s.win_rate},
        {"paused", s.paused},
        {"stop_reason", s.stop_reason}
    };
}

// TradeLedger implementation

TradeLedger::TradeLedger(const std::string& path)
    : base_path_(path)
    , current_path_(path)
{
    open_file();
}

TradeLedger::~TradeLedger() {
    flush();
    if (file_.is_open()) {
        file_.close();
    }
}

void TradeLedger::open_file() {
    // Create directory if needed
    std::filesystem::path p(current_path_);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec) {
            spdlog::error("Failed to create ledger directory {}: {}", p.parent_path().string(), ec.message());
        }
    }

    file_.open(current_path_, std::ios::app);
    if (!file_.is_open()) {
        spdlog::error("Failed to open trade ledger: {}", current_path_);
    } else {
        spdlog::info("Trade ledger opened: {}", current_path_);
    }
}

void TradeLedger::write_line(const nlohmann::json& j) {
    bool needs_rotation = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!file_.is_open()) return;
        file_ << j.dump() << "\n";
        file_.flush();
        needs_rotation = static_cast<size_t>(file_.tellp()) > MAX_FILE_SIZE;
    }
    if (needs_rotation) {
        rotate();
    }
}

void TradeLedger::record_trade_event(const TradeEvent& event) {
    record_event(trade_event_type_to_string(event.type), event);
}

void TradeLedger::record_session(const SessionSnapshot& snapshot) {
    record_event("session_summary", snapshot);
}

void TradeLedger::record_event(const std::string& event_type, const nlohmann::json& data) {
    nlohmann::json j;
    j["event_type"] = event_type;
    j["timestamp"] = time_utils::now_iso8601();
    j["data"] = data;
    write_line(j);
}

std::vector<nlohmann::json> TradeLedger::load_events(const std::string& event_type) const {
    std::vector<nlohmann::json> events;

    std::ifstream file(current_path_);
    std::string line;

    while (std::getline(file, line)) {
        if (line.empty()) continue;
        try {
            auto j = nlohmann::json::parse(line);
            if (event_type.empty() || j.value("event_type", "") == event_type) {
                events.push_back(std::move(j));
            }
        } catch (const nlohmann::json::parse_error& e) {
            spdlog::warn("Skipping malformed ledger line in {}: {}", current_path_, e.what());
        }
    }

    return events;
}

std::vector<Contract> TradeLedger::get_settled_contracts() const {
    std::vector<Contract> contracts;
    for (const auto& j : load_events(trade_event_type_to_string(TradeEventType::TRADE_SETTLED))) {
        if (!j.contains("data") || !j["data"].contains("contract")) continue;
        Contract c;
        from_json(j["data"]["contract"], c);
        contracts.push_back(c);
    }
    return contracts;
}

TradeLedger::Summary TradeLedger::get_summary() const {
    Summary summary;
    for (const auto& c : get_settled_contracts()) {
        summary.trades++;
        summary.staked += c.buy_price;
        summary.profit += c.profit;
        if (c.status == ContractStatus::WON) {
            summary.wins++;
        } else if (c.status == ContractStatus::LOST) {
            summary.losses++;
        }
    }
    return summary;
}

void TradeLedger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

void TradeLedger::rotate() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (file_.is_open()) {
        file_.close();
    }

    // Create new filename with timestamp
    auto now_time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm = *std::localtime(&now_time);

    std::ostringstream ss;
    ss << base_path_ << "." << std::put_time(&tm, "%Y%m%d_%H%M%S");
    current_path_ = ss.str();

    open_file();
}

size_t TradeLedger::file_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    auto size = std::filesystem::file_size(current_path_, ec);
    return ec ? 0 : static_cast<size_t>(size);
}

} // namespace binbot
