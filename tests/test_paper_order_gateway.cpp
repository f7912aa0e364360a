#include <gtest/gtest.h>
#include "paper_order_gateway.hpp"
#include "test_support.hpp"

using namespace execution;

namespace {

    const std::string kKey = "NSE_EQ|INE002A01018";

    OrderRequest order(OrderSide side, long long quantity, double reference, const std::string& client_id = "") {
        OrderRequest request;
        request.client_order_id = client_id;
        request.instrument_key = kKey;
        request.side = side;
        request.quantity = quantity;
        request.reference_price = reference;
        request.tag = "TEST";
        return request;
    }

    core::VenuePosition venuePosition(PaperOrderGateway& gateway) {
        for (const auto& p : gateway.getOpenPositions()) {
            if (p.instrument_key == kKey) return p;
        }
        return core::VenuePosition{kKey, 0, 0.0};
    }

} // namespace

TEST(PaperOrderGatewayTest, FillsAtLatestPriceWhenAvailable) {
    PaperOrderGateway gateway([](const std::string&) -> std::optional<double> { return 101.25; });
    auto result = gateway.placeOrder(order(OrderSide::Buy, 10, 100.0));
    ASSERT_TRUE(result.ok());
    EXPECT_DOUBLE_EQ(result.fill_price, 101.25);
    EXPECT_EQ(result.filled_quantity, 10);
    EXPECT_EQ(result.order_id, "PAPER-1");
}

TEST(PaperOrderGatewayTest, FallsBackToReferencePrice) {
    PaperOrderGateway gateway([](const std::string&) -> std::optional<double> { return std::nullopt; });
    auto result = gateway.placeOrder(order(OrderSide::Buy, 10, 100.0));
    ASSERT_TRUE(result.ok());
    EXPECT_DOUBLE_EQ(result.fill_price, 100.0);

    PaperOrderGateway no_source;
    EXPECT_DOUBLE_EQ(no_source.placeOrder(order(OrderSide::Sell, 1, 99.0)).fill_price, 99.0);
}

TEST(PaperOrderGatewayTest, RejectsWithoutPriceOrQuantity) {
    PaperOrderGateway gateway;
    auto no_price = gateway.placeOrder(order(OrderSide::Buy, 10, 0.0));
    ASSERT_FALSE(no_price.ok());
    EXPECT_EQ(no_price.error->kind, OrderErrorKind::Rejected);

    auto no_quantity = gateway.placeOrder(order(OrderSide::Buy, 0, 100.0));
    ASSERT_FALSE(no_quantity.ok());
    EXPECT_EQ(gateway.orderCount(), 0u);
}

TEST(PaperOrderGatewayTest, TracksNetPositionAndAveragePrice) {
    PaperOrderGateway gateway;
    gateway.placeOrder(order(OrderSide::Buy, 10, 100.0));
    gateway.placeOrder(order(OrderSide::Buy, 10, 110.0));
    auto grown = venuePosition(gateway);
    EXPECT_EQ(grown.net_quantity, 20);
    EXPECT_DOUBLE_EQ(grown.average_price, 105.0);

    gateway.placeOrder(order(OrderSide::Sell, 5, 120.0));
    auto reduced = venuePosition(gateway);
    EXPECT_EQ(reduced.net_quantity, 15);
    EXPECT_DOUBLE_EQ(reduced.average_price, 105.0);

    gateway.placeOrder(order(OrderSide::Sell, 15, 120.0));
    EXPECT_TRUE(gateway.getOpenPositions().empty());
}

TEST(PaperOrderGatewayTest, FlippingThroughZeroResetsAverage) {
    PaperOrderGateway gateway;
    gateway.placeOrder(order(OrderSide::Buy, 10, 100.0));
    gateway.placeOrder(order(OrderSide::Sell, 15, 90.0));
    auto flipped = venuePosition(gateway);
    EXPECT_EQ(flipped.net_quantity, -5);
    EXPECT_DOUBLE_EQ(flipped.average_price, 90.0);
}

TEST(PaperOrderGatewayTest, ReplayedClientIdReturnsOriginalFill) {
    PaperOrderGateway gateway;
    auto first = gateway.placeOrder(order(OrderSide::Buy, 10, 100.0, "ENTRY-1"));
    auto replay = gateway.placeOrder(order(OrderSide::Buy, 10, 105.0, "ENTRY-1"));
    EXPECT_EQ(replay.order_id, first.order_id);
    EXPECT_DOUBLE_EQ(replay.fill_price, 100.0);
    EXPECT_EQ(gateway.orderCount(), 1u);
    EXPECT_EQ(venuePosition(gateway).net_quantity, 10);
}
