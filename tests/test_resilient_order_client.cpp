#include <gtest/gtest.h>
#include "resilient_order_client.hpp"
#include "exceptions.hpp"
#include "test_support.hpp"

using namespace execution;
using test_support::FakeOrderGateway;
using test_support::fastRetry;

namespace {

    const std::string kKey = "NSE_EQ|INE002A01018";

    OrderRequest entry(long long quantity = 10) {
        OrderRequest request;
        request.instrument_key = kKey;
        request.side = OrderSide::Buy;
        request.quantity = quantity;
        request.reference_price = 100.0;
        request.tag = "ENTRY";
        return request;
    }

} // namespace

TEST(ResilientOrderClientTest, RetriesTransientErrorsUnderOneClientId) {
    FakeOrderGateway gateway;
    gateway.script(OrderResult::failed(OrderErrorKind::Timeout, "slow"));
    gateway.script(OrderResult::failed(OrderErrorKind::Network, "reset"));
    ResilientOrderClient client(gateway, core::RetryPolicy(fastRetry(3)));

    auto result = client.placeOrder(entry());
    ASSERT_TRUE(result.ok());
    auto requests = gateway.requests();
    ASSERT_EQ(requests.size(), 3u);
    EXPECT_EQ(requests[0].client_order_id, "ENTRY-" + kKey + "-1");
    EXPECT_EQ(requests[1].client_order_id, requests[0].client_order_id);
    EXPECT_EQ(requests[2].client_order_id, requests[0].client_order_id);
}

TEST(ResilientOrderClientTest, KeepsCallerClientId) {
    FakeOrderGateway gateway;
    ResilientOrderClient client(gateway, core::RetryPolicy(fastRetry(3)));
    auto request = entry();
    request.client_order_id = "EXIT-custom";
    client.placeOrder(request);
    EXPECT_EQ(gateway.requests().at(0).client_order_id, "EXIT-custom");
}

TEST(ResilientOrderClientTest, RejectionIsNotRetried) {
    FakeOrderGateway gateway;
    gateway.script(OrderResult::failed(OrderErrorKind::Rejected, "insufficient margin"));
    ResilientOrderClient client(gateway, core::RetryPolicy(fastRetry(3)));

    auto result = client.placeOrder(entry());
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->kind, OrderErrorKind::Rejected);
    EXPECT_EQ(gateway.requestCount(), 1u);
}

TEST(ResilientOrderClientTest, ExhaustedRetriesReportTheLastError) {
    FakeOrderGateway gateway;
    gateway.script(OrderResult::failed(OrderErrorKind::RateLimited, "429"));
    gateway.script(OrderResult::failed(OrderErrorKind::RateLimited, "429"));
    ResilientOrderClient client(gateway, core::RetryPolicy(fastRetry(2)));

    auto result = client.placeOrder(entry());
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->kind, OrderErrorKind::RateLimited);
    EXPECT_EQ(gateway.requestCount(), 2u);
}

TEST(ResilientOrderClientTest, AuthenticationFailureFiresCallbackOnce) {
    FakeOrderGateway gateway;
    gateway.script(OrderResult::failed(OrderErrorKind::Authentication, "token expired"));
    int callbacks = 0;
    std::string reason;
    ResilientOrderClient client(gateway, core::RetryPolicy(fastRetry(3)),
                                [&](const std::string& r) { ++callbacks; reason = r; });

    auto result = client.placeOrder(entry());
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->kind, OrderErrorKind::Authentication);
    EXPECT_EQ(callbacks, 1);
    EXPECT_EQ(reason, "token expired");
    EXPECT_EQ(gateway.requestCount(), 1u);
}

TEST(ResilientOrderClientTest, PositionQueriesRetryThenThrow) {
    FakeOrderGateway gateway;
    gateway.setVenuePosition(kKey, 10, 100.0);
    ResilientOrderClient client(gateway, core::RetryPolicy(fastRetry(3)));

    gateway.failPositionQueries(2);
    auto positions = client.getOpenPositions();
    ASSERT_EQ(positions.size(), 1u);
    EXPECT_EQ(positions[0].net_quantity, 10);
    EXPECT_EQ(gateway.positionQueries(), 3);

    gateway.failPositionQueries(5);
    EXPECT_THROW(client.getOpenPositions(), core::TimeoutException);
}

TEST(ResilientOrderClientTest, PositionQueryAuthFailureNotifiesAndPropagates) {
    FakeOrderGateway gateway;
    gateway.setPositionsAuthFailure(true);
    int callbacks = 0;
    ResilientOrderClient client(gateway, core::RetryPolicy(fastRetry(3)), [&](const std::string&) { ++callbacks; });

    EXPECT_THROW(client.getOpenPositions(), core::AuthenticationException);
    EXPECT_EQ(callbacks, 1);
    EXPECT_EQ(gateway.positionQueries(), 1);
}
