#pragma once

#include "datatypes.hpp"
#include <functional>
#include <string>
#include <vector>

namespace market_data {

    using TickHandler = std::function<void(const core::Tick&)>;

    // Streaming price source. Implementations report failures by throwing
    // core::DisconnectedException or core::TimeoutException.
    class MarketFeed {
    public:
        virtual ~MarketFeed() = default;

        virtual void connect() = 0;
        virtual void subscribe(const std::vector<std::string>& instrument_keys) = 0;
        virtual bool isConnected() const = 0;
        virtual void disconnect() = 0;

        // Called on the feed's own thread for every tick
        virtual void setTickHandler(TickHandler handler) = 0;
    };

} // namespace market_data
