#pragma once

#include <chrono>
#include <string>
#include "historical_data_source.hpp"

namespace data {

class RestHistoricalClient : public HistoricalDataSource {
public:
    RestHistoricalClient(std::string base_url,
                         std::string access_token,
                         std::chrono::milliseconds timeout = std::chrono::milliseconds(15000));

    core::TimeSeries<core::Candle> fetchCandles(const std::string& instrument_key,
                                                const std::string& interval,
                                                const std::string& from_date,
                                                const std::string& to_date) override;

    // Parses the broker's {"status":..., "data":{"candles":[[ts,o,h,l,c,v,...],...]}} body.
    // Exposed for tests; malformed rows are skipped, a malformed envelope throws core::DataException.
    static core::TimeSeries<core::Candle> parseCandleResponse(const std::string& body,
                                                              const std::string& instrument_key);

private:
    std::string base_url_;
    std::string access_token_;
    std::string api_version_ = "v2";
    std::chrono::milliseconds timeout_;
};

} // namespace data
