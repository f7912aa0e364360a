#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "order_gateway.hpp"

namespace execution {

    // Simulated venue for paper trading. Market orders fill immediately at the
    // latest known price (falling back to the request's reference price) and
    // the net position per instrument is tracked like a broker would.
    class PaperOrderGateway : public OrderGateway {
    public:
        using PriceSource = std::function<std::optional<double>(const std::string&)>;

        explicit PaperOrderGateway(PriceSource prices = {});

        OrderResult placeOrder(const OrderRequest& request) override;
        std::vector<core::VenuePosition> getOpenPositions() override;

        std::size_t orderCount() const;

    private:
        PriceSource prices_;
        mutable std::mutex mutex_;
        std::map<std::string, core::VenuePosition> positions_;
        std::map<std::string, OrderResult> fills_by_client_id_; // Replays of the same client id are idempotent
        std::uint64_t next_order_id_ = 1;
    };

} // namespace execution
