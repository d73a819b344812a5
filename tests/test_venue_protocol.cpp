#include <gtest/gtest.h>
#include "venue/venue_protocol.hpp"
#include "common/errors.hpp"

using namespace binbot;
using json = nlohmann::json;

class VenueProtocolTest : public ::testing::Test {
protected:
    json error_response(const std::string& msg_type, const std::string& code, const std::string& message) {
        return json{
            {"msg_type", msg_type},
            {"error", {{"code", code}, {"message", message}}}
        };
    }
};

TEST_F(VenueProtocolTest, Proposal_BuildsStakeBasedRiseFall) {
    ProposalRequest req;
    req.symbol = "R_100";
    req.direction = Direction::FALL;
    req.amount = 1.2345;
    req.duration = 5;
    req.duration_unit = "t";

    auto msg = protocol::proposal(req);

    EXPECT_EQ(msg["proposal"], 1);
    EXPECT_DOUBLE_EQ(msg["amount"].get<double>(), 1.23);
    EXPECT_EQ(msg["basis"], "stake");
    EXPECT_EQ(msg["contract_type"], "PUT");
    EXPECT_EQ(msg["symbol"], "R_100");
    EXPECT_EQ(msg["duration_unit"], "t");
    EXPECT_FALSE(msg.contains("barrier"));
}

TEST_F(VenueProtocolTest, Proposal_RiseIsCall) {
    ProposalRequest req;
    req.direction = Direction::RISE;
    req.amount = 1.0;

    EXPECT_EQ(protocol::proposal(req)["contract_type"], "CALL");
}

TEST_F(VenueProtocolTest, RequestName_PrefersOpenContractOverProposal) {
    EXPECT_EQ(protocol::request_name(protocol::open_contract(7)), "proposal_open_contract");
    EXPECT_EQ(protocol::request_name(protocol::buy("abc", 1.0)), "buy");
    EXPECT_EQ(protocol::request_name(protocol::ticks_subscribe("R_50")), "ticks");
    EXPECT_EQ(protocol::request_name(json{{"foo", 1}}), "unknown");
}

TEST_F(VenueProtocolTest, ErrorToException_NoErrorIsNull) {
    EXPECT_EQ(protocol::error_to_exception(json{{"msg_type", "balance"}}), nullptr);
    EXPECT_NO_THROW(protocol::throw_if_error(json{{"msg_type", "ping"}, {"ping", "pong"}}));
}

TEST_F(VenueProtocolTest, ErrorToException_AuthorizeFailureIsAuthError) {
    auto msg = error_response("authorize", "InvalidToken", "The token is invalid.");

    EXPECT_THROW(protocol::throw_if_error(msg), AuthError);
}

TEST_F(VenueProtocolTest, ErrorToException_AuthorizationRequiredOnOtherCall) {
    auto msg = error_response("buy", "AuthorizationRequired", "Please log in.");

    EXPECT_THROW(protocol::throw_if_error(msg), AuthError);
}

TEST_F(VenueProtocolTest, ErrorToException_RejectionKeepsCode) {
    auto msg = error_response("buy", "InsufficientBalance", "Your account balance is insufficient.");

    try {
        protocol::throw_if_error(msg);
        FAIL() << "Expected RejectedError";
    } catch (const RejectedError& e) {
        EXPECT_EQ(e.code(), "InsufficientBalance");
        EXPECT_NE(std::string(e.what()).find("insufficient"), std::string::npos);
    }
}

TEST_F(VenueProtocolTest, ParseTick_AcceptsNumericStrings) {
    json msg = {
        {"msg_type", "tick"},
        {"tick", {{"symbol", "R_100"}, {"quote", "1234.56"}, {"epoch", 1700000000}, {"pip_size", 2}}}
    };

    ASSERT_TRUE(protocol::is_tick(msg));
    auto tick = protocol::parse_tick(msg);

    EXPECT_EQ(tick.symbol, "R_100");
    EXPECT_DOUBLE_EQ(tick.price, 1234.56);
    EXPECT_EQ(tick.epoch, 1700000000);
}

TEST_F(VenueProtocolTest, IsTick_SubscriptionAckIsNotATick) {
    json ack = {{"msg_type", "tick"}, {"subscription", {{"id", "abc"}}}};

    EXPECT_FALSE(protocol::is_tick(ack));
    EXPECT_EQ(protocol::parse_subscription_id(ack), "abc");
}

TEST_F(VenueProtocolTest, ParseAuthorize_DetectsVirtualAccount) {
    json demo = {{"authorize", {{"loginid", "VRTC123"}, {"currency", "USD"}, {"balance", 10000}}}};
    json real = {{"authorize", {{"loginid", "CR456"}, {"currency", "EUR"}, {"balance", "25.50"}}}};

    auto demo_info = protocol::parse_authorize(demo);
    auto real_info = protocol::parse_authorize(real);

    EXPECT_TRUE(demo_info.is_virtual);
    EXPECT_DOUBLE_EQ(demo_info.balance, 10000.0);
    EXPECT_FALSE(real_info.is_virtual);
    EXPECT_EQ(real_info.currency, "EUR");
    EXPECT_DOUBLE_EQ(real_info.balance, 25.5);
}

TEST_F(VenueProtocolTest, ParseHistory_PairsPricesWithTimes) {
    json msg = {
        {"msg_type", "history"},
        {"history", {{"prices", {100.1, 100.2, "100.3"}}, {"times", {1, 2, 3}}}}
    };

    auto ticks = protocol::parse_history(msg, "R_10");

    ASSERT_EQ(ticks.size(), 3u);
    EXPECT_EQ(ticks[0].symbol, "R_10");
    EXPECT_DOUBLE_EQ(ticks[2].price, 100.3);
    EXPECT_EQ(ticks[2].epoch, 3);
}

TEST_F(VenueProtocolTest, ParseProposal_RequiresId) {
    json ok = {{"proposal", {{"id", "p-1"}, {"ask_price", 1.0}, {"payout", 1.95}}}};
    json missing = {{"proposal", {{"ask_price", 1.0}}}};

    auto proposal = protocol::parse_proposal(ok);
    EXPECT_EQ(proposal.id, "p-1");
    EXPECT_DOUBLE_EQ(proposal.payout, 1.95);
    EXPECT_THROW(protocol::parse_proposal(missing), std::runtime_error);
}

TEST_F(VenueProtocolTest, ParseBuy_RequiresContractId) {
    json ok = {{"buy", {{"contract_id", 555}, {"buy_price", 2.0}, {"payout", 3.9}}}};
    json missing = {{"buy", {{"buy_price", 2.0}}}};

    auto contract = protocol::parse_buy(ok);
    EXPECT_EQ(contract.contract_id, 555);
    EXPECT_EQ(contract.status, ContractStatus::OPEN);
    EXPECT_THROW(protocol::parse_buy(missing), std::runtime_error);
    EXPECT_THROW(protocol::parse_buy(json{{"msg_type", "buy"}}), std::runtime_error);
}

TEST_F(VenueProtocolTest, ParseOpenContract_Statuses) {
    auto make = [](const std::string& status, double profit, int is_sold) {
        return json{{"proposal_open_contract", {
            {"contract_id", 9}, {"status", status}, {"profit", profit},
            {"is_sold", is_sold}, {"buy_price", 1.0}, {"underlying", "R_100"}
        }}};
    };

    EXPECT_EQ(protocol::parse_open_contract(make("open", 0.2, 0)).status, ContractStatus::OPEN);
    EXPECT_EQ(protocol::parse_open_contract(make("won", 0.95, 1)).status, ContractStatus::WON);
    EXPECT_EQ(protocol::parse_open_contract(make("lost", -1.0, 1)).status, ContractStatus::LOST);
    EXPECT_EQ(protocol::parse_open_contract(make("sold", 0.4, 1)).status, ContractStatus::WON);
    EXPECT_EQ(protocol::parse_open_contract(make("sold", -0.3, 1)).status, ContractStatus::LOST);
    EXPECT_EQ(protocol::parse_open_contract(make("open", 0.0, 1)).status, ContractStatus::LOST);

    auto contract = protocol::parse_open_contract(make("won", 0.95, 1));
    EXPECT_EQ(contract.symbol, "R_100");
    EXPECT_TRUE(contract.is_sold);
}

TEST_F(VenueProtocolTest, ParseActiveSymbols) {
    json msg = {{"active_symbols", json::array({
        {{"symbol", "R_100"}, {"display_name", "Volatility 100 Index"}, {"market", "synthetic_index"}},
        {{"symbol", "frxEURUSD"}, {"display_name", "EUR/USD"}, {"market", "forex"}}
    })}};

    auto symbols = protocol::parse_active_symbols(msg);

    ASSERT_EQ(symbols.size(), 2u);
    EXPECT_EQ(symbols[1].market, "forex");
    EXPECT_TRUE(protocol::parse_active_symbols(json::object()).empty());
}
