#include <gtest/gtest.h>
#include <atomic>
#include <mutex>
#include "common/errors.hpp"
#include "fake_venue.hpp"
#include "utils/metrics.hpp"
#include "venue/venue_connector.hpp"

using namespace binbot;
using binbot::test_support::FakeVenue;
using binbot::test_support::eventually;
using nlohmann::json;

class VenueConnectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.api_token = "test-token";
        config_.request_timeout_ms = 200;
        config_.reconnect_delay_ms = 10;
        config_.max_reconnect_delay_ms = 40;
        config_.max_reconnect_attempts = 3;
        config_.heartbeat_interval_ms = 0;
        config_.connection_timeout_ms = 1000;
        config_.max_consecutive_timeouts = 100;
        config_.watchdog_interval_ms = 5;

        auto transport = std::make_unique<FakeVenue>();
        venue_ = transport.get();
        connector_ = std::make_unique<VenueConnector>(config_, std::move(transport));
    }

    void TearDown() override {
        connector_.reset();
    }

    ConnectionConfig config_;
    FakeVenue* venue_{nullptr};
    std::unique_ptr<VenueConnector> connector_;
};

TEST_F(VenueConnectorTest, Connect_AuthorizesAndReportsAccount) {
    venue_->set_loginid("VRTC4242");
    venue_->set_balance(250.5);

    AccountInfo account = connector_->connect();

    EXPECT_EQ(account.loginid, "VRTC4242");
    EXPECT_TRUE(account.is_virtual);
    EXPECT_DOUBLE_EQ(account.balance, 250.5);
    EXPECT_EQ(connector_->status(), ConnectionStatus::CONNECTED);
    EXPECT_EQ(venue_->count_sent("authorize"), 1u);
    EXPECT_EQ(venue_->sent("authorize")[0].at("authorize"), "test-token");
}

TEST_F(VenueConnectorTest, Connect_RealAccountIsNotVirtual) {
    venue_->set_loginid("CR90000");

    AccountInfo account = connector_->connect();

    EXPECT_FALSE(account.is_virtual);
}

TEST_F(VenueConnectorTest, Connect_InvalidTokenThrowsAuthError) {
    venue_->on("authorize", [](const json&) -> std::optional<json> {
        return json{{"error", {{"code", "InvalidToken"}, {"message", "The token is invalid."}}}};
    });

    EXPECT_THROW(connector_->connect(), AuthError);
    EXPECT_EQ(connector_->status(), ConnectionStatus::DISCONNECTED);
}

TEST_F(VenueConnectorTest, Connect_OpenFailureThrowsTransportError) {
    venue_->fail_opens(1);

    EXPECT_THROW(connector_->connect(), TransportError);
    EXPECT_FALSE(connector_->is_connected());
}

TEST_F(VenueConnectorTest, Connect_WithoutTokenSkipsAuthorize) {
    config_.api_token.clear();
    auto transport = std::make_unique<FakeVenue>();
    venue_ = transport.get();
    connector_ = std::make_unique<VenueConnector>(config_, std::move(transport));

    connector_->connect();

    EXPECT_TRUE(connector_->is_connected());
    EXPECT_EQ(venue_->count_sent("authorize"), 0u);
}

TEST_F(VenueConnectorTest, Request_WhileDisconnectedFailsImmediately) {
    auto future = connector_->request(protocol::balance());

    EXPECT_THROW(future.get(), TransportError);
    EXPECT_EQ(venue_->count_sent("balance"), 0u);
}

TEST_F(VenueConnectorTest, Request_OutOfOrderResponsesReachTheirCallers) {
    venue_->on("ticks_history", [](const json& req) -> std::optional<json> {
        double base = req.at("ticks_history") == "R_100" ? 100.0 : 50.0;
        return json{{"history", {{"prices", {base, base + 1}}, {"times", {1, 2}}}}};
    });
    connector_->connect();
    venue_->hold("ticks_history");

    auto first = connector_->request(protocol::ticks_history("R_100", 2));
    auto second = connector_->request(protocol::ticks_history("R_50", 2));
    ASSERT_TRUE(eventually([&] { return venue_->count_sent("ticks_history") == 2; }));
    venue_->release_held_reversed();

    auto r100 = protocol::parse_history(first.get(), "R_100");
    auto r50 = protocol::parse_history(second.get(), "R_50");
    ASSERT_EQ(r100.size(), 2u);
    ASSERT_EQ(r50.size(), 2u);
    EXPECT_DOUBLE_EQ(r100[0].price, 100.0);
    EXPECT_DOUBLE_EQ(r50[0].price, 50.0);
    EXPECT_EQ(connector_->pending_count(), 0u);
}

TEST_F(VenueConnectorTest, Request_TimeoutRemovesPendingAndDiscardsLateResponse) {
    connector_->connect();
    venue_->hold("balance");
    auto late_before = METRIC_COUNTER(metric_names::LATE_RESPONSES).value();

    auto future = connector_->request(protocol::balance(), std::chrono::milliseconds(30));

    EXPECT_THROW(future.get(), TimeoutError);
    EXPECT_EQ(connector_->pending_count(), 0u);

    venue_->release_held_reversed();
    EXPECT_TRUE(eventually([&] {
        return METRIC_COUNTER(metric_names::LATE_RESPONSES).value() == late_before + 1;
    }));

    // Connection stays usable
    EXPECT_DOUBLE_EQ(connector_->get_balance(), 1000.0);
}

TEST_F(VenueConnectorTest, Request_VenueErrorBecomesRejectedError) {
    venue_->on("proposal", [](const json&) -> std::optional<json> {
        return json{{"error", {{"code", "ContractBuyValidationError"}, {"message", "Stake too low"}}}};
    });
    connector_->connect();

    ProposalRequest req;
    req.symbol = "R_100";
    req.amount = 0.1;

    try {
        connector_->get_proposal(req);
        FAIL() << "expected RejectedError";
    } catch (const RejectedError& e) {
        EXPECT_EQ(e.code(), "ContractBuyValidationError");
    }
    EXPECT_TRUE(connector_->is_connected());
}

TEST_F(VenueConnectorTest, Disconnect_FailsPendingWithCancelledError) {
    connector_->connect();
    connector_->subscribe_ticks("R_100", [](const Tick&) {});
    venue_->hold("balance");

    auto future = connector_->request(protocol::balance());
    ASSERT_TRUE(eventually([&] { return venue_->count_sent("balance") == 1; }));

    connector_->disconnect();

    EXPECT_THROW(future.get(), CancelledError);
    EXPECT_TRUE(connector_->subscribed_symbols().empty());
    EXPECT_EQ(connector_->status(), ConnectionStatus::DISCONNECTED);
    EXPECT_EQ(venue_->count_sent("forget_all"), 1u);
}

TEST_F(VenueConnectorTest, Disconnect_IsIdempotent) {
    connector_->connect();

    connector_->disconnect();
    EXPECT_NO_THROW(connector_->disconnect());
    EXPECT_EQ(connector_->status(), ConnectionStatus::DISCONNECTED);
    EXPECT_EQ(venue_->count_sent("forget_all"), 1u);
}

TEST_F(VenueConnectorTest, SubscribeTicks_DeliversOnlyToItsSymbol) {
    connector_->connect();
    std::atomic<int> r100{0};
    std::atomic<int> r50{0};
    connector_->subscribe_ticks("R_100", [&](const Tick& t) {
        EXPECT_EQ(t.symbol, "R_100");
        r100++;
    });
    connector_->subscribe_ticks("R_50", [&](const Tick&) { r50++; });

    venue_->push_tick("R_100", 1234.5);
    venue_->push_tick("R_100", 1234.6);
    venue_->push_tick("R_25", 10.0);
    venue_->push_tick("R_50", 99.1);

    ASSERT_TRUE(eventually([&] { return r100 == 2 && r50 == 1; }));
}

TEST_F(VenueConnectorTest, SubscribeTicks_ResubscribeReplacesHandler) {
    connector_->connect();
    std::atomic<int> first{0};
    std::atomic<int> second{0};
    connector_->subscribe_ticks("R_100", [&](const Tick&) { first++; });
    connector_->subscribe_ticks("R_100", [&](const Tick&) { second++; });

    venue_->push_tick("R_100", 1.0);

    ASSERT_TRUE(eventually([&] { return second == 1; }));
    EXPECT_EQ(first.load(), 0);
    EXPECT_EQ(venue_->count_sent("ticks"), 1u);
}

TEST_F(VenueConnectorTest, UnsubscribeTicks_ForgetsSubscription) {
    connector_->connect();
    std::atomic<int> ticks{0};
    connector_->subscribe_ticks("R_100", [&](const Tick&) { ticks++; });

    EXPECT_TRUE(connector_->unsubscribe_ticks("R_100"));
    EXPECT_FALSE(connector_->unsubscribe_ticks("R_100"));

    ASSERT_TRUE(eventually([&] { return venue_->count_sent("forget") == 1; }));
    EXPECT_EQ(venue_->sent("forget")[0].at("forget"), "sub-R_100");

    venue_->push_tick("R_100", 1.0);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_EQ(ticks.load(), 0);
}

TEST_F(VenueConnectorTest, Reconnect_RestoresSubscriptionsBeforeAnyTick) {
    connector_->connect();

    std::mutex mutex;
    std::vector<size_t> subscribes_seen;
    auto record = [&](const Tick&) {
        std::lock_guard<std::mutex> lock(mutex);
        subscribes_seen.push_back(venue_->count_sent("ticks"));
    };
    connector_->subscribe_ticks("R_100", record);
    connector_->subscribe_ticks("R_50", record);
    ASSERT_EQ(venue_->count_sent("ticks"), 2u);

    // Arrives on the new socket ahead of the authorize response
    venue_->queue_on_open(FakeVenue::tick_message("R_100", 101.0));
    venue_->drop();

    ASSERT_TRUE(eventually([&] {
        std::lock_guard<std::mutex> lock(mutex);
        return !subscribes_seen.empty();
    }));

    {
        std::lock_guard<std::mutex> lock(mutex);
        EXPECT_EQ(subscribes_seen.front(), 4u);
    }
    EXPECT_EQ(connector_->reconnect_count(), 1);
    EXPECT_EQ(venue_->count_sent("authorize"), 2u);
    EXPECT_EQ(connector_->status(), ConnectionStatus::CONNECTED);
    EXPECT_EQ(connector_->subscribed_symbols().size(), 2u);
}

TEST_F(VenueConnectorTest, Reconnect_DropFailsPendingWithTransportError) {
    connector_->connect();
    venue_->hold("balance");

    auto future = connector_->request(protocol::balance());
    ASSERT_TRUE(eventually([&] { return venue_->count_sent("balance") == 1; }));
    venue_->drop();

    EXPECT_THROW(future.get(), TransportError);
    EXPECT_TRUE(eventually([&] { return connector_->is_connected(); }));
}

TEST_F(VenueConnectorTest, Reconnect_GivesUpAfterMaxAttempts) {
    std::mutex mutex;
    std::string error;
    connector_->set_error_callback([&](const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex);
        error = message;
    });
    connector_->connect();

    venue_->fail_opens(-1);
    venue_->drop();

    ASSERT_TRUE(eventually([&] { return connector_->status() == ConnectionStatus::ERROR; }));
    EXPECT_EQ(connector_->reconnect_count(), config_.max_reconnect_attempts);
    EXPECT_EQ(venue_->opens(), 1 + config_.max_reconnect_attempts);
    {
        std::lock_guard<std::mutex> lock(mutex);
        EXPECT_NE(error.find("Max reconnect attempts"), std::string::npos);
    }

    EXPECT_THROW(connector_->get_balance(), TransportError);
    EXPECT_NO_THROW(connector_->disconnect());
}

TEST_F(VenueConnectorTest, Reconnect_AuthFailureIsTerminal) {
    connector_->connect();
    venue_->on("authorize", [](const json&) -> std::optional<json> {
        return json{{"error", {{"code", "InvalidToken"}, {"message", "Token revoked"}}}};
    });

    venue_->drop();

    ASSERT_TRUE(eventually([&] { return connector_->status() == ConnectionStatus::ERROR; }));
    EXPECT_EQ(connector_->reconnect_count(), 1);
}
