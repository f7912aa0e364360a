#include "paper_order_gateway.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <cstdlib>

namespace execution {

PaperOrderGateway::PaperOrderGateway(PriceSource prices) : prices_(std::move(prices)) {
    core::logging::getLogger()->info("PaperOrderGateway active: orders are simulated, nothing reaches a broker.");
}

OrderResult PaperOrderGateway::placeOrder(const OrderRequest& request) {
    auto logger = core::logging::getLogger();
    if (request.quantity <= 0) {
        return OrderResult::failed(OrderErrorKind::Rejected, fmt::format("Invalid quantity {}", request.quantity));
    }

    std::optional<double> price;
    if (prices_) price = prices_(request.instrument_key);
    if (!price || *price <= 0.0) {
        if (request.reference_price <= 0.0) {
            return OrderResult::failed(OrderErrorKind::Rejected, fmt::format("No price available for {}", request.instrument_key));
        }
        price = request.reference_price;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto previous = fills_by_client_id_.find(request.client_order_id);
    if (!request.client_order_id.empty() && previous != fills_by_client_id_.end()) {
        logger->debug("Paper: duplicate client id {}, returning original fill.", request.client_order_id);
        return previous->second;
    }

    auto& position = positions_[request.instrument_key];
    position.instrument_key = request.instrument_key;
    long long signed_qty = request.side == OrderSide::Buy ? request.quantity : -request.quantity;
    long long new_qty = position.net_quantity + signed_qty;

    // Average price only moves when the position grows in its own direction
    if (position.net_quantity == 0 || (position.net_quantity > 0) == (signed_qty > 0)) {
        double old_value = position.average_price * std::llabs(position.net_quantity);
        position.average_price = (old_value + *price * request.quantity) / std::llabs(new_qty);
    } else if (new_qty != 0 && (new_qty > 0) != (position.net_quantity > 0)) {
        position.average_price = *price; // Flipped through zero
    }
    position.net_quantity = new_qty;
    if (position.net_quantity == 0) {
        positions_.erase(request.instrument_key);
    }

    OrderResult result = OrderResult::filled(fmt::format("PAPER-{}", next_order_id_++), *price, request.quantity);
    if (!request.client_order_id.empty()) {
        fills_by_client_id_[request.client_order_id] = result;
    }
    logger->info("Paper fill: {} {} x{} @ {:.2f} ({}) -> net {}", orderSideToString(request.side), request.instrument_key,
                 request.quantity, *price, request.tag, new_qty);
    return result;
}

std::vector<core::VenuePosition> PaperOrderGateway::getOpenPositions() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<core::VenuePosition> result;
    for (const auto& pair : positions_) {
        result.push_back(pair.second);
    }
    return result;
}

std::size_t PaperOrderGateway::orderCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(next_order_id_ - 1);
}

} // namespace execution
