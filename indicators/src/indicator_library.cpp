#include "indicator_library.hpp"
#include "ta_indicators.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <mutex>
#include <regex>
#include <sstream>

namespace indicators {

namespace {

    std::once_flag ta_lib_init_flag;

    void initializeTaLib() {
        std::call_once(ta_lib_init_flag, []() {
            TA_RetCode ret_code = TA_Initialize();
            if (ret_code != TA_SUCCESS) {
                core::logging::getLogger()->error("TA_Initialize failed with error code: {}", static_cast<int>(ret_code));
                return;
            }
            core::logging::getLogger()->debug("TA-Lib initialized.");
        });
    }

    int periodParam(const IndicatorSpec& spec, std::size_t index, const std::string& name) {
        if (spec.params.size() <= index) {
            throw core::IndicatorCalculationException(fmt::format("Indicator '{}' is missing parameter #{}", name, index + 1));
        }
        double value = spec.params[index];
        if (value <= 0.0 || std::floor(value) != value) {
            throw core::IndicatorCalculationException(fmt::format("Indicator '{}' needs a positive integer period", name));
        }
        return static_cast<int>(value);
    }

} // end anonymous namespace

double lastValue(const core::TimeSeries<double>& series) {
    return series.empty() ? std::numeric_limits<double>::quiet_NaN() : series.back();
}

IndicatorSpec parseIndicatorName(const std::string& name) {
    static const std::regex indicator_regex(R"(^\s*([A-Za-z_]+)\s*\(([^)]*)\)\s*$)"); // e.g., ADX(14), BB_UPPER(20,2)
    std::smatch match;
    if (!std::regex_match(name, match, indicator_regex)) {
        throw core::IndicatorCalculationException(fmt::format("Malformed indicator name '{}'", name));
    }

    IndicatorSpec spec;
    spec.kind = match[1].str();
    std::transform(spec.kind.begin(), spec.kind.end(), spec.kind.begin(),
                   [](unsigned char c){ return static_cast<char>(std::toupper(c)); });

    std::stringstream params(match[2].str());
    std::string token;
    while (std::getline(params, token, ',')) {
        try {
            std::size_t consumed = 0;
            double value = std::stod(token, &consumed);
            if (token.find_first_not_of(" \t", consumed) != std::string::npos) {
                throw std::invalid_argument(token);
            }
            spec.params.push_back(value);
        } catch (const std::exception&) {
            throw core::IndicatorCalculationException(fmt::format("Invalid parameter '{}' in indicator '{}'", token, name));
        }
    }
    return spec;
}

std::unique_ptr<IIndicator> createIndicator(const IndicatorSpec& spec) {
    const std::string& kind = spec.kind;
    if (kind == "SMA") return std::make_unique<SmaIndicator>(periodParam(spec, 0, kind));
    if (kind == "EMA") return std::make_unique<EmaIndicator>(periodParam(spec, 0, kind));
    if (kind == "RSI") return std::make_unique<RsiIndicator>(periodParam(spec, 0, kind));
    if (kind == "ATR") return std::make_unique<AtrIndicator>(periodParam(spec, 0, kind));
    if (kind == "ADX") return std::make_unique<AdxIndicator>(periodParam(spec, 0, kind));

    if (kind == "BB_UPPER" || kind == "BB_MIDDLE" || kind == "BB_LOWER") {
        int period = periodParam(spec, 0, kind);
        double deviations = spec.params.size() > 1 ? spec.params[1] : 2.0;
        auto band = kind == "BB_UPPER" ? BollingerBandIndicator::Band::Upper
                  : kind == "BB_MIDDLE" ? BollingerBandIndicator::Band::Middle
                                        : BollingerBandIndicator::Band::Lower;
        return std::make_unique<BollingerBandIndicator>(period, deviations, band);
    }

    throw core::IndicatorCalculationException(fmt::format("Unknown indicator kind '{}'", kind));
}

TaLibIndicatorLibrary::TaLibIndicatorLibrary() {
    initializeTaLib();
}

core::TimeSeries<double> TaLibIndicatorLibrary::compute(const core::TimeSeries<core::Candle>& bars,
                                                        const std::string& name) const
{
    std::unique_ptr<IIndicator> indicator;
    try {
        indicator = createIndicator(parseIndicatorName(name));
    } catch (const std::invalid_argument& e) {
        throw core::IndicatorCalculationException(fmt::format("Cannot create indicator '{}': {}", name, e.what()));
    }
    indicator->calculate(bars);
    return indicator->getResult();
}

} // namespace indicators
