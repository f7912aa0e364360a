#pragma once

#include <optional>
#include <string>
#include <vector>

#include "datatypes.hpp"

namespace execution {

    enum class OrderSide {
        Buy,
        Sell
    };

    inline const char* orderSideToString(OrderSide side) {
        return side == OrderSide::Buy ? "BUY" : "SELL";
    }

    // Side that opens (or, inverted, closes) a position in the given direction
    inline OrderSide entrySide(core::Direction direction) {
        return direction == core::Direction::Long ? OrderSide::Buy : OrderSide::Sell;
    }
    inline OrderSide exitSide(core::Direction direction) {
        return direction == core::Direction::Long ? OrderSide::Sell : OrderSide::Buy;
    }

    // Market order. client_order_id is reused across retries so the venue can de-duplicate.
    struct OrderRequest {
        std::string client_order_id;
        std::string instrument_key;
        OrderSide side = OrderSide::Buy;
        long long quantity = 0;
        double reference_price = 0.0; // Price the decision was made at, for logs and paper fills
        std::string tag;              // "ENTRY", "EXIT:STOP_LOSS", ...
    };

    enum class OrderErrorKind {
        Timeout,
        RateLimited,
        Rejected,
        Authentication,
        Network
    };

    inline const char* orderErrorKindToString(OrderErrorKind kind) {
        switch (kind) {
            case OrderErrorKind::Timeout: return "TIMEOUT";
            case OrderErrorKind::RateLimited: return "RATE_LIMITED";
            case OrderErrorKind::Rejected: return "REJECTED";
            case OrderErrorKind::Authentication: return "AUTHENTICATION";
            case OrderErrorKind::Network: return "NETWORK";
        }
        return "UNKNOWN";
    }

    struct OrderError {
        OrderErrorKind kind = OrderErrorKind::Rejected;
        std::string message;
    };

    // Either a fill (order id + price) or an error
    struct OrderResult {
        std::string order_id;
        double fill_price = 0.0;
        long long filled_quantity = 0;
        std::optional<OrderError> error;

        bool ok() const { return !error.has_value(); }

        static OrderResult filled(std::string id, double price, long long quantity) {
            OrderResult r;
            r.order_id = std::move(id);
            r.fill_price = price;
            r.filled_quantity = quantity;
            return r;
        }
        static OrderResult failed(OrderErrorKind kind, std::string message) {
            OrderResult r;
            r.error = OrderError{kind, std::move(message)};
            return r;
        }
    };

    // The venue. Implementations report order problems through OrderResult;
    // getOpenPositions throws core::TransientException / core::AuthenticationException.
    class OrderGateway {
    public:
        virtual ~OrderGateway() = default;

        virtual OrderResult placeOrder(const OrderRequest& request) = 0;
        virtual std::vector<core::VenuePosition> getOpenPositions() = 0;
    };

} // namespace execution
