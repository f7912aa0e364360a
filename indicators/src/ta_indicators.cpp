#include "ta_indicators.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"  // TA-Lib C API header
#include <spdlog/fmt/fmt.h>
#include <limits>
#include <stdexcept>
#include <vector>

namespace indicators {

namespace {

    constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

    std::vector<double> closes(const core::TimeSeries<core::Candle>& input) {
        std::vector<double> values;
        values.reserve(input.size());
        for (const auto& candle : input) {
            values.push_back(candle.close);
        }
        return values;
    }

    struct HighLowClose {
        std::vector<double> high;
        std::vector<double> low;
        std::vector<double> close;
    };

    HighLowClose highLowClose(const core::TimeSeries<core::Candle>& input) {
        HighLowClose hlc;
        hlc.high.reserve(input.size());
        hlc.low.reserve(input.size());
        hlc.close.reserve(input.size());
        for (const auto& candle : input) {
            hlc.high.push_back(candle.high);
            hlc.low.push_back(candle.low);
            hlc.close.push_back(candle.close);
        }
        return hlc;
    }

    void requirePositivePeriod(int period, const char* kind) {
        if (period <= 0) {
            throw std::invalid_argument(fmt::format("{} period must be positive.", kind));
        }
    }

    void checkLookback(int lookback, const char* function) {
        if (lookback < 0) {
            throw std::runtime_error(fmt::format("{} returned an unexpected value: {}", function, lookback));
        }
    }

} // end anonymous namespace

// --- TaLibIndicator ---

TaLibIndicator::TaLibIndicator(std::string name, int lookback)
    : name_(std::move(name)), lookback_(lookback)
{
    core::logging::getLogger()->trace("Indicator created: Name='{}', Lookback={}", name_, lookback_);
}

void TaLibIndicator::storeAligned(std::size_t input_size, int out_begin_idx, int out_nb_element,
                                  const std::vector<double>& raw)
{
    results_.assign(input_size, kNaN);
    if (out_begin_idx != lookback_) {
        core::logging::getLogger()->warn("{}: out_begin_idx ({}) does not match lookback ({}). Aligning on out_begin_idx.",
                                         name_, out_begin_idx, lookback_);
    }
    for (int i = 0; i < out_nb_element; ++i) {
        std::size_t target = static_cast<std::size_t>(out_begin_idx + i);
        if (target < input_size) {
            results_[target] = raw[static_cast<std::size_t>(i)];
        }
    }
}

void TaLibIndicator::checkRetCode(int ret_code, const char* function) const {
    if (ret_code != TA_SUCCESS) {
        throw core::IndicatorCalculationException(
            fmt::format("TA-Lib {} calculation failed for {} with error code: {}", function, name_, ret_code));
    }
}

// --- SMA ---

SmaIndicator::SmaIndicator(int period)
    : TaLibIndicator(fmt::format("SMA({})", period), (requirePositivePeriod(period, "SMA"), TA_MA_Lookback(period, TA_MAType_SMA))),
      period_(period)
{
    checkLookback(lookback_, "TA_MA_Lookback");
}

void SmaIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    results_.assign(input.size(), kNaN);
    if (input.size() <= static_cast<std::size_t>(lookback_)) {
        return; // Not enough data to calculate anything
    }
    std::vector<double> close_prices = closes(input);
    std::vector<double> raw(close_prices.size());
    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_MA(0, static_cast<int>(close_prices.size()) - 1, close_prices.data(),
                                period_, TA_MAType_SMA, &out_begin_idx, &out_nb_element, raw.data());
    checkRetCode(static_cast<int>(ret_code), "TA_MA");
    storeAligned(input.size(), out_begin_idx, out_nb_element, raw);
}

// --- EMA ---

EmaIndicator::EmaIndicator(int period)
    : TaLibIndicator(fmt::format("EMA({})", period), (requirePositivePeriod(period, "EMA"), TA_EMA_Lookback(period))),
      period_(period)
{
    checkLookback(lookback_, "TA_EMA_Lookback");
}

void EmaIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    results_.assign(input.size(), kNaN);
    if (input.size() <= static_cast<std::size_t>(lookback_)) {
        return;
    }
    std::vector<double> close_prices = closes(input);
    std::vector<double> raw(close_prices.size());
    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_EMA(0, static_cast<int>(close_prices.size()) - 1, close_prices.data(),
                                 period_, &out_begin_idx, &out_nb_element, raw.data());
    checkRetCode(static_cast<int>(ret_code), "TA_EMA");
    storeAligned(input.size(), out_begin_idx, out_nb_element, raw);
}

// --- RSI ---

RsiIndicator::RsiIndicator(int period)
    : TaLibIndicator(fmt::format("RSI({})", period), (requirePositivePeriod(period, "RSI"), TA_RSI_Lookback(period))),
      period_(period)
{
    checkLookback(lookback_, "TA_RSI_Lookback");
}

void RsiIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    results_.assign(input.size(), kNaN);
    if (input.size() <= static_cast<std::size_t>(lookback_)) {
        return;
    }
    std::vector<double> close_prices = closes(input);
    std::vector<double> raw(close_prices.size());
    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_RSI(0, static_cast<int>(close_prices.size()) - 1, close_prices.data(),
                                 period_, &out_begin_idx, &out_nb_element, raw.data());
    checkRetCode(static_cast<int>(ret_code), "TA_RSI");
    storeAligned(input.size(), out_begin_idx, out_nb_element, raw);
}

// --- ATR ---

AtrIndicator::AtrIndicator(int period)
    : TaLibIndicator(fmt::format("ATR({})", period), (requirePositivePeriod(period, "ATR"), TA_ATR_Lookback(period))),
      period_(period)
{
    checkLookback(lookback_, "TA_ATR_Lookback");
}

void AtrIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    results_.assign(input.size(), kNaN);
    if (input.size() <= static_cast<std::size_t>(lookback_)) {
        return;
    }
    HighLowClose hlc = highLowClose(input);
    std::vector<double> raw(input.size());
    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_ATR(0, static_cast<int>(input.size()) - 1,
                                 hlc.high.data(), hlc.low.data(), hlc.close.data(),
                                 period_, &out_begin_idx, &out_nb_element, raw.data());
    checkRetCode(static_cast<int>(ret_code), "TA_ATR");
    storeAligned(input.size(), out_begin_idx, out_nb_element, raw);
}

// --- ADX ---

AdxIndicator::AdxIndicator(int period)
    : TaLibIndicator(fmt::format("ADX({})", period), (requirePositivePeriod(period, "ADX"), TA_ADX_Lookback(period))),
      period_(period)
{
    checkLookback(lookback_, "TA_ADX_Lookback");
}

void AdxIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    results_.assign(input.size(), kNaN);
    if (input.size() <= static_cast<std::size_t>(lookback_)) {
        return;
    }
    HighLowClose hlc = highLowClose(input);
    std::vector<double> raw(input.size());
    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_ADX(0, static_cast<int>(input.size()) - 1,
                                 hlc.high.data(), hlc.low.data(), hlc.close.data(),
                                 period_, &out_begin_idx, &out_nb_element, raw.data());
    checkRetCode(static_cast<int>(ret_code), "TA_ADX");
    storeAligned(input.size(), out_begin_idx, out_nb_element, raw);
}

// --- Bollinger Bands ---

namespace {
    const char* bandPrefix(BollingerBandIndicator::Band band) {
        switch (band) {
            case BollingerBandIndicator::Band::Upper: return "BB_UPPER";
            case BollingerBandIndicator::Band::Middle: return "BB_MIDDLE";
            case BollingerBandIndicator::Band::Lower: return "BB_LOWER";
        }
        return "BB";
    }
} // end anonymous namespace

BollingerBandIndicator::BollingerBandIndicator(int period, double deviations, Band band)
    : TaLibIndicator(fmt::format("{}({},{:g})", bandPrefix(band), period, deviations),
                     (requirePositivePeriod(period, "BBANDS"),
                      TA_BBANDS_Lookback(period, deviations, deviations, TA_MAType_SMA))),
      period_(period), deviations_(deviations), band_(band)
{
    checkLookback(lookback_, "TA_BBANDS_Lookback");
    if (deviations_ <= 0.0) {
        throw std::invalid_argument("Bollinger band deviations must be positive.");
    }
}

void BollingerBandIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    results_.assign(input.size(), kNaN);
    if (input.size() <= static_cast<std::size_t>(lookback_)) {
        return;
    }
    std::vector<double> close_prices = closes(input);
    std::vector<double> upper(close_prices.size());
    std::vector<double> middle(close_prices.size());
    std::vector<double> lower(close_prices.size());
    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_BBANDS(0, static_cast<int>(close_prices.size()) - 1, close_prices.data(),
                                    period_, deviations_, deviations_, TA_MAType_SMA,
                                    &out_begin_idx, &out_nb_element,
                                    upper.data(), middle.data(), lower.data());
    checkRetCode(static_cast<int>(ret_code), "TA_BBANDS");

    switch (band_) {
        case Band::Upper: storeAligned(input.size(), out_begin_idx, out_nb_element, upper); break;
        case Band::Middle: storeAligned(input.size(), out_begin_idx, out_nb_element, middle); break;
        case Band::Lower: storeAligned(input.size(), out_begin_idx, out_nb_element, lower); break;
    }
}

} // namespace indicators
