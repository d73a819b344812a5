#pragma once

#include <exception>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace binbot {

// Parameters for pricing a contract
struct ProposalRequest {
    std::string symbol;
    Direction direction{Direction::RISE};
    Money amount{0.0};
    int duration{5};
    std::string duration_unit{"t"};
    std::string currency{"USD"};
    std::optional<std::string> barrier;
};

/**
 * Venue message builders and response parsers.
 * Builders leave req_id to the connector.
 */
namespace protocol {

// Outbound
nlohmann::json authorize(const std::string& token);
nlohmann::json balance();
nlohmann::json ticks_subscribe(const std::string& symbol);
nlohmann::json forget(const std::string& subscription_id);
nlohmann::json forget_all(const std::string& category);
nlohmann::json ticks_history(const std::string& symbol, int count);
nlohmann::json proposal(const ProposalRequest& req);
nlohmann::json buy(const std::string& proposal_id, Money price);
nlohmann::json open_contract(int64_t contract_id);
nlohmann::json active_symbols(const std::string& product_type = "basic");
nlohmann::json ping();

// Name of the request carried by an outbound message, for logs
std::string request_name(const nlohmann::json& msg);

// Exception for an error response, or nullptr when the message is not one.
// Authorization failures map to AuthError, everything else to RejectedError.
std::exception_ptr error_to_exception(const nlohmann::json& msg);

// Throws the exception from error_to_exception, if any
void throw_if_error(const nlohmann::json& msg);

// Inbound
bool is_tick(const nlohmann::json& msg);
Tick parse_tick(const nlohmann::json& msg);
AccountInfo parse_authorize(const nlohmann::json& msg);
Money parse_balance(const nlohmann::json& msg);
std::string parse_subscription_id(const nlohmann::json& msg);
std::vector<Tick> parse_history(const nlohmann::json& msg, const std::string& symbol);
Proposal parse_proposal(const nlohmann::json& msg);
Contract parse_buy(const nlohmann::json& msg);
Contract parse_open_contract(const nlohmann::json& msg);
std::vector<SymbolInfo> parse_active_symbols(const nlohmann::json& msg);

// Numeric field that the venue may send as a number or a numeric string
double number_field(const nlohmann::json& obj, const std::string& key, double default_val = 0.0);

} // namespace protocol
} // namespace binbot
