#include "rest_historical_client.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cstdint>

namespace data {

RestHistoricalClient::RestHistoricalClient(std::string base_url,
                                           std::string access_token,
                                           std::chrono::milliseconds timeout)
    : base_url_(std::move(base_url)),
      access_token_(std::move(access_token)),
      timeout_(timeout)
{
    core::logging::getLogger()->debug("RestHistoricalClient created for {}", base_url_);
    if (access_token_.empty()) {
        core::logging::getLogger()->warn("RestHistoricalClient created without access token.");
    }
}

core::TimeSeries<core::Candle> RestHistoricalClient::fetchCandles(
    const std::string& instrument_key,
    const std::string& interval,
    const std::string& from_date,
    const std::string& to_date)
{
    auto logger = core::logging::getLogger();

    if (access_token_.empty()) {
        throw core::AuthenticationException("Cannot fetch historical candles: access token is missing.");
    }

    // /v2/historical-candle/INSTRUMENT_KEY/INTERVAL/TO_DATE/FROM_DATE
    // Instrument keys contain '|' and must be URL encoded
    std::string endpoint = fmt::format("/{}/historical-candle/{}/{}/{}/{}",
                                       api_version_,
                                       cpr::util::urlEncode(instrument_key),
                                       cpr::util::urlEncode(interval),
                                       to_date,
                                       from_date);
    std::string full_url = base_url_ + endpoint;
    logger->debug("Requesting historical candles: {}", full_url);

    cpr::Header headers = {
        {"Accept", "application/json"},
        {"Api-Version", "2.0"},
        {"Authorization", "Bearer " + access_token_}
    };

    cpr::Response response = cpr::Get(cpr::Url{full_url}, headers,
                                      cpr::Timeout{static_cast<std::int32_t>(timeout_.count())});

    logger->debug("Historical API Response Status: {}, Body size: {}", response.status_code, response.text.length());

    // --- Transport errors ---
    if (response.error) {
        if (response.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT) {
            throw core::TimeoutException(fmt::format("Historical request for {} timed out after {} ms",
                                                     instrument_key, timeout_.count()));
        }
        throw core::DisconnectedException(fmt::format("Historical request for {} failed: {}",
                                                      instrument_key, response.error.message));
    }

    // --- HTTP status mapping ---
    if (response.status_code == 401 || response.status_code == 403) {
        logger->critical("Historical API returned {}. Access token may be invalid or expired.", response.status_code);
        throw core::AuthenticationException(fmt::format("Historical API rejected credentials ({})", response.status_code));
    }
    if (response.status_code == 429) {
        throw core::RateLimitException(fmt::format("Historical API rate limit hit for {}", instrument_key));
    }
    if (response.status_code >= 500) {
        throw core::DisconnectedException(fmt::format("Historical API server error {} for {}",
                                                      response.status_code, instrument_key));
    }
    if (response.status_code != 200) {
        throw core::ApiRequestException(fmt::format("Historical API request failed: Status Code={}, Body='{}'",
                                                    response.status_code, response.text.substr(0, 500)));
    }

    core::TimeSeries<core::Candle> candles = parseCandleResponse(response.text, instrument_key);
    logger->info("Received {} historical candles for {} ({} -> {})", candles.size(), instrument_key, from_date, to_date);
    return candles;
}

core::TimeSeries<core::Candle> RestHistoricalClient::parseCandleResponse(const std::string& body,
                                                                         const std::string& instrument_key)
{
    auto logger = core::logging::getLogger();
    core::TimeSeries<core::Candle> candles;

    nlohmann::json json_response;
    try {
        json_response = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw core::DataException(fmt::format("Failed to parse historical response JSON: {}", e.what()));
    }

    if (json_response.contains("status") && json_response["status"] != "success") {
        std::string api_error_msg = json_response.value("message", "Unknown API error message");
        throw core::ApiRequestException(fmt::format("Historical API returned non-success status: {}", api_error_msg));
    }

    if (!json_response.contains("data") || !json_response["data"].contains("candles") ||
        !json_response["data"]["candles"].is_array()) {
        throw core::DataException("Unexpected JSON structure: 'data.candles' array not found.");
    }

    for (const auto& json_candle : json_response["data"]["candles"]) {
        // [timestamp, open, high, low, close, volume, (oi)]
        if (!json_candle.is_array() || json_candle.size() < 6) {
            logger->warn("Skipping invalid candle data format in JSON array.");
            continue;
        }
        try {
            core::Candle candle;
            candle.instrument_key = instrument_key;
            candle.timestamp = core::utils::stringToTimestamp(json_candle[0].get<std::string>());
            candle.open  = json_candle[1].get<double>();
            candle.high  = json_candle[2].get<double>();
            candle.low   = json_candle[3].get<double>();
            candle.close = json_candle[4].get<double>();
            candle.volume = json_candle[5].get<long long>();
            candles.push_back(candle);
        } catch (const nlohmann::json::exception& e) {
            logger->warn("Error parsing individual candle JSON data: {}", e.what());
        } catch (const core::DataException& e) {
            logger->warn("Error converting candle timestamp: {}", e.what());
        }
    }

    // The API returns newest first
    std::sort(candles.begin(), candles.end());
    return candles;
}

} // namespace data
