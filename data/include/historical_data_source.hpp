#pragma once

#include <string>
#include "datatypes.hpp"

namespace data {

// Source of warm-up bars fetched once at startup
class HistoricalDataSource {
public:
    virtual ~HistoricalDataSource() = default;

    // Dates are exchange-local "YYYY-MM-DD". Bars come back in ascending time order.
    // Throws core::TransientException subclasses for retryable failures and
    // core::AuthenticationException when credentials are rejected.
    virtual core::TimeSeries<core::Candle> fetchCandles(const std::string& instrument_key,
                                                        const std::string& interval,
                                                        const std::string& from_date,
                                                        const std::string& to_date) = 0;
};

} // namespace data
