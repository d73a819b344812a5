#include "venue/venue_protocol.hpp"
#include "common/errors.hpp"
#include <cmath>
#include <cstdlib>

namespace binbot {
namespace protocol {

namespace {
    // Request keys in the order they identify a message
    const std::vector<std::string> REQUEST_KEYS = {
        "authorize", "balance", "ticks", "forget", "forget_all", "ticks_history",
        "proposal_open_contract", "proposal", "buy", "active_symbols", "ping"
    };

    double round_cents(double amount) {
        return std::round(amount * 100.0) / 100.0;
    }

    const nlohmann::json& section(const nlohmann::json& msg, const std::string& key) {
        if (!msg.contains(key) || !msg.at(key).is_object()) {
            throw std::runtime_error("Malformed venue response: missing '" + key + "'");
        }
        return msg.at(key);
    }

    int64_t int_field(const nlohmann::json& obj, const std::string& key, int64_t default_val = 0) {
        if (!obj.contains(key)) return default_val;
        const auto& v = obj.at(key);
        if (v.is_number()) return v.get<int64_t>();
        if (v.is_string()) return std::strtoll(v.get<std::string>().c_str(), nullptr, 10);
        return default_val;
    }
}

nlohmann::json authorize(const std::string& token) {
    return {{"authorize", token}};
}

nlohmann::json balance() {
    return {{"balance", 1}};
}

nlohmann::json ticks_subscribe(const std::string& symbol) {
    return {{"ticks", symbol}, {"subscribe", 1}};
}

nlohmann::json forget(const std::string& subscription_id) {
    return {{"forget", subscription_id}};
}

nlohmann::json forget_all(const std::string& category) {
    return {{"forget_all", category}};
}

nlohmann::json ticks_history(const std::string& symbol, int count) {
    return {
        {"ticks_history", symbol},
        {"count", count},
        {"end", "latest"},
        {"style", "ticks"}
    };
}

nlohmann::json proposal(const ProposalRequest& req) {
    nlohmann::json msg = {
        {"proposal", 1},
        {"amount", round_cents(req.amount)},
        {"basis", "stake"},
        {"contract_type", direction_to_contract_type(req.direction)},
        {"currency", req.currency},
        {"duration", req.duration},
        {"duration_unit", req.duration_unit},
        {"symbol", req.symbol}
    };
    if (req.barrier) {
        msg["barrier"] = *req.barrier;
    }
    return msg;
}

nlohmann::json buy(const std::string& proposal_id, Money price) {
    return {{"buy", proposal_id}, {"price", round_cents(price)}};
}

nlohmann::json open_contract(int64_t contract_id) {
    return {{"proposal_open_contract", 1}, {"contract_id", contract_id}};
}

nlohmann::json active_symbols(const std::string& product_type) {
    return {{"active_symbols", "brief"}, {"product_type", product_type}};
}

nlohmann::json ping() {
    return {{"ping", 1}};
}

std::string request_name(const nlohmann::json& msg) {
    for (const auto& key : REQUEST_KEYS) {
        if (msg.contains(key)) return key;
    }
    return "unknown";
}

std::exception_ptr error_to_exception(const nlohmann::json& msg) {
    if (!msg.contains("error") || !msg.at("error").is_object()) {
        return nullptr;
    }

    const auto& err = msg.at("error");
    std::string code = err.value("code", "");
    std::string message = err.value("message", "Unknown venue error");

    bool auth_failure = msg.value("msg_type", "") == "authorize"
        || code == "InvalidToken" || code == "AuthorizationRequired";
    if (auth_failure) {
        return std::make_exception_ptr(AuthError(code.empty() ? message : code + ": " + message));
    }
    return std::make_exception_ptr(RejectedError(code, message));
}

void throw_if_error(const nlohmann::json& msg) {
    if (auto err = error_to_exception(msg)) {
        std::rethrow_exception(err);
    }
}

double number_field(const nlohmann::json& obj, const std::string& key, double default_val) {
    if (!obj.contains(key)) return default_val;
    const auto& v = obj.at(key);
    if (v.is_number()) return v.get<double>();
    if (v.is_string()) return std::strtod(v.get<std::string>().c_str(), nullptr);
    return default_val;
}

bool is_tick(const nlohmann::json& msg) {
    return msg.value("msg_type", "") == "tick" && msg.contains("tick") && msg.at("tick").is_object();
}

Tick parse_tick(const nlohmann::json& msg) {
    const auto& t = section(msg, "tick");
    Tick tick;
    tick.symbol = t.value("symbol", "");
    tick.price = number_field(t, "quote");
    tick.epoch = int_field(t, "epoch");
    tick.pip_size = static_cast<int>(int_field(t, "pip_size", 2));
    tick.received = now();
    return tick;
}

AccountInfo parse_authorize(const nlohmann::json& msg) {
    const auto& a = section(msg, "authorize");
    AccountInfo info;
    info.loginid = a.value("loginid", "");
    info.currency = a.value("currency", "USD");
    info.balance = number_field(a, "balance");
    info.is_virtual = info.loginid.rfind("VRTC", 0) == 0;
    return info;
}

Money parse_balance(const nlohmann::json& msg) {
    return number_field(section(msg, "balance"), "balance");
}

std::string parse_subscription_id(const nlohmann::json& msg) {
    if (msg.contains("subscription") && msg.at("subscription").is_object()) {
        return msg.at("subscription").value("id", "");
    }
    return "";
}

std::vector<Tick> parse_history(const nlohmann::json& msg, const std::string& symbol) {
    const auto& h = section(msg, "history");
    std::vector<Tick> ticks;
    if (!h.contains("prices") || !h.at("prices").is_array()) return ticks;

    const auto& prices = h.at("prices");
    const nlohmann::json empty = nlohmann::json::array();
    const auto& times = h.contains("times") ? h.at("times") : empty;
    int pip_size = static_cast<int>(int_field(msg, "pip_size", 2));

    for (size_t i = 0; i < prices.size(); i++) {
        Tick tick;
        tick.symbol = symbol;
        tick.price = prices[i].is_string() ? std::strtod(prices[i].get<std::string>().c_str(), nullptr)
                                           : prices[i].get<double>();
        tick.epoch = i < times.size() ? times[i].get<int64_t>() : 0;
        tick.pip_size = pip_size;
        tick.received = now();
        ticks.push_back(tick);
    }
    return ticks;
}

Proposal parse_proposal(const nlohmann::json& msg) {
    const auto& p = section(msg, "proposal");
    Proposal proposal;
    proposal.id = p.value("id", "");
    proposal.ask_price = number_field(p, "ask_price");
    proposal.payout = number_field(p, "payout");
    proposal.spot = number_field(p, "spot");
    proposal.date_expiry = int_field(p, "date_expiry");
    if (proposal.id.empty()) {
        throw std::runtime_error("Malformed venue response: proposal without id");
    }
    return proposal;
}

Contract parse_buy(const nlohmann::json& msg) {
    const auto& b = section(msg, "buy");
    Contract contract;
    contract.contract_id = int_field(b, "contract_id");
    contract.buy_price = number_field(b, "buy_price");
    contract.payout = number_field(b, "payout");
    contract.start_time = int_field(b, "start_time");
    contract.status = ContractStatus::OPEN;
    if (contract.contract_id == 0) {
        throw std::runtime_error("Malformed venue response: buy without contract_id");
    }
    return contract;
}

Contract parse_open_contract(const nlohmann::json& msg) {
    const auto& c = section(msg, "proposal_open_contract");
    Contract contract;
    contract.contract_id = int_field(c, "contract_id");
    contract.buy_price = number_field(c, "buy_price");
    contract.payout = number_field(c, "payout");
    contract.profit = number_field(c, "profit");
    contract.is_sold = int_field(c, "is_sold") == 1;
    contract.start_time = int_field(c, "date_start");
    contract.symbol = c.value("underlying", "");
    contract.contract_type = c.value("contract_type", "");

    std::string status = c.value("status", "open");
    if (status == "won") {
        contract.status = ContractStatus::WON;
    } else if (status == "lost") {
        contract.status = ContractStatus::LOST;
    } else if (status == "sold" || contract.is_sold) {
        // Sold before expiry settles on the sign of the realized profit
        contract.status = contract.profit > 0 ? ContractStatus::WON : ContractStatus::LOST;
    } else {
        contract.status = ContractStatus::OPEN;
    }
    return contract;
}

std::vector<SymbolInfo> parse_active_symbols(const nlohmann::json& msg) {
    std::vector<SymbolInfo> symbols;
    if (!msg.contains("active_symbols") || !msg.at("active_symbols").is_array()) return symbols;

    for (const auto& s : msg.at("active_symbols")) {
        SymbolInfo info;
        info.symbol = s.value("symbol", "");
        info.display_name = s.value("display_name", "");
        info.market = s.value("market", "");
        symbols.push_back(info);
    }
    return symbols;
}

} // namespace protocol
} // namespace binbot
