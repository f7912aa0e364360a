#pragma once

#include "indicators.hpp"
#include <string>
#include <vector>

namespace indicators {

// Shared bookkeeping for TA-Lib backed indicators: name, lookback and the aligned result
class TaLibIndicator : public IIndicator {
public:
    std::string getName() const override { return name_; }
    int getLookback() const override { return lookback_; }
    const core::TimeSeries<double>& getResult() const override { return results_; }

protected:
    TaLibIndicator(std::string name, int lookback);

    // Resets results_ to input_size NaNs and copies TA-Lib's compact output in at out_begin_idx
    void storeAligned(std::size_t input_size, int out_begin_idx, int out_nb_element,
                      const std::vector<double>& raw);

    // Throws IndicatorCalculationException when ret_code is not TA_SUCCESS
    void checkRetCode(int ret_code, const char* function) const;

    std::string name_;
    int lookback_ = 0;
    core::TimeSeries<double> results_;
};

class SmaIndicator : public TaLibIndicator {
public:
    explicit SmaIndicator(int period);
    void calculate(const core::TimeSeries<core::Candle>& input) override;

private:
    const int period_;
};

class EmaIndicator : public TaLibIndicator {
public:
    explicit EmaIndicator(int period);
    void calculate(const core::TimeSeries<core::Candle>& input) override;

private:
    const int period_;
};

class RsiIndicator : public TaLibIndicator {
public:
    explicit RsiIndicator(int period);
    void calculate(const core::TimeSeries<core::Candle>& input) override;

private:
    const int period_;
};

class AtrIndicator : public TaLibIndicator {
public:
    explicit AtrIndicator(int period);
    void calculate(const core::TimeSeries<core::Candle>& input) override;

private:
    const int period_;
};

// Trend strength, drives the regime split in the strategy router
class AdxIndicator : public TaLibIndicator {
public:
    explicit AdxIndicator(int period);
    void calculate(const core::TimeSeries<core::Candle>& input) override;

private:
    const int period_;
};

class BollingerBandIndicator : public TaLibIndicator {
public:
    enum class Band { Upper, Middle, Lower };

    BollingerBandIndicator(int period, double deviations, Band band);
    void calculate(const core::TimeSeries<core::Candle>& input) override;

private:
    const int period_;
    const double deviations_;
    const Band band_;
};

} // namespace indicators
