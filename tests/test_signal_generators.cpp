#include <gtest/gtest.h>
#include "mean_reversion_generator.hpp"
#include "breakout_generator.hpp"
#include "generator_factory.hpp"
#include "exceptions.hpp"
#include "test_support.hpp"

#include <limits>

using namespace strategy_engine;
using test_support::at;
using test_support::StubIndicatorLibrary;

namespace {

    const std::string kKey = "NSE_EQ|INE467B01029";

    MarketContext contextFor(const core::TimeSeries<core::Candle>& bars, double regime = 20.0) {
        MarketContext context;
        context.instrument_key = kKey;
        context.bars = &bars;
        context.now = at("10:30:00");
        context.regime_value = regime;
        return context;
    }

    // 20 flat bars (high 100.5, low 99.5, volume 1000) then one breakout bar
    core::TimeSeries<core::Candle> channelThenBreak(double close, long long volume) {
        auto bars = test_support::flatBars(kKey, 20, at("10:20:00"));
        double high = std::max(100.5, close + 0.5);
        double low = std::min(99.5, close - 0.5);
        bars.push_back(test_support::makeBar(kKey, at("10:20:00"), 100.0, high, low, close, volume));
        return bars;
    }

} // namespace

// --- Mean reversion ---

TEST(MeanReversionGeneratorTest, RequiredHistoryCoversEveryIndicator) {
    StubIndicatorLibrary stub;
    MeanReversionGenerator generator(MeanReversionParams{}, stub);
    EXPECT_EQ(generator.requiredHistory(), 20u);

    MeanReversionParams long_rsi;
    long_rsi.rsi_period = 30;
    EXPECT_EQ(MeanReversionGenerator(long_rsi, stub).requiredHistory(), 31u);
}

TEST(MeanReversionGeneratorTest, LongAtLowerBandWhenOversold) {
    StubIndicatorLibrary stub;
    stub.set("BB_UPPER(20,2)", 110.0);
    stub.set("BB_LOWER(20,2)", 100.5);
    stub.set("RSI(14)", 20.0);
    stub.set("ATR(14)", 2.0);
    MeanReversionGenerator generator(MeanReversionParams{}, stub);

    auto bars = test_support::flatBars(kKey, 25, at("10:30:00"));
    auto signal = generator.generateSignal(contextFor(bars));

    ASSERT_TRUE(signal.has_value());
    EXPECT_EQ(signal->direction, core::Direction::Long);
    EXPECT_EQ(signal->instrument_key, kKey);
    EXPECT_EQ(signal->strategy_id, "mean_reversion");
    EXPECT_FALSE(signal->requires_retest);
    EXPECT_DOUBLE_EQ(signal->entry_price, 100.0);
    EXPECT_DOUBLE_EQ(signal->stop_loss, 97.0);
    EXPECT_DOUBLE_EQ(signal->target, 104.5);
    EXPECT_DOUBLE_EQ(signal->confidence, 75.0);
    EXPECT_EQ(signal->timestamp, at("10:30:00"));
}

TEST(MeanReversionGeneratorTest, ShortAtUpperBandWhenOverbought) {
    StubIndicatorLibrary stub;
    stub.set("BB_UPPER(20,2)", 99.5);
    stub.set("BB_LOWER(20,2)", 90.0);
    stub.set("RSI(14)", 80.0);
    stub.set("ATR(14)", 2.0);
    MeanReversionGenerator generator(MeanReversionParams{}, stub);

    auto bars = test_support::flatBars(kKey, 25, at("10:30:00"));
    auto signal = generator.generateSignal(contextFor(bars));

    ASSERT_TRUE(signal.has_value());
    EXPECT_EQ(signal->direction, core::Direction::Short);
    EXPECT_DOUBLE_EQ(signal->stop_loss, 103.0);
    EXPECT_DOUBLE_EQ(signal->target, 95.5);
    EXPECT_DOUBLE_EQ(signal->confidence, 75.0);
}

TEST(MeanReversionGeneratorTest, NoSignalInsideTheBands) {
    StubIndicatorLibrary stub;
    stub.set("BB_UPPER(20,2)", 105.0);
    stub.set("BB_LOWER(20,2)", 95.0);
    stub.set("RSI(14)", 20.0);
    stub.set("ATR(14)", 2.0);
    MeanReversionGenerator generator(MeanReversionParams{}, stub);

    auto bars = test_support::flatBars(kKey, 25, at("10:30:00"));
    EXPECT_FALSE(generator.generateSignal(contextFor(bars)).has_value());
}

TEST(MeanReversionGeneratorTest, BandTouchWithoutRsiConfirmationIsIgnored) {
    StubIndicatorLibrary stub;
    stub.set("BB_UPPER(20,2)", 110.0);
    stub.set("BB_LOWER(20,2)", 100.5);
    stub.set("RSI(14)", 45.0);
    stub.set("ATR(14)", 2.0);
    MeanReversionGenerator generator(MeanReversionParams{}, stub);

    auto bars = test_support::flatBars(kKey, 25, at("10:30:00"));
    EXPECT_FALSE(generator.generateSignal(contextFor(bars)).has_value());
}

TEST(MeanReversionGeneratorTest, UnreadyIndicatorsRaiseDataException) {
    StubIndicatorLibrary stub;
    stub.set("BB_UPPER(20,2)", 110.0);
    stub.set("BB_LOWER(20,2)", 100.5);
    stub.setSeries("RSI(14)", {}); // all NaN
    stub.set("ATR(14)", 2.0);
    MeanReversionGenerator generator(MeanReversionParams{}, stub);

    auto bars = test_support::flatBars(kKey, 25, at("10:30:00"));
    EXPECT_THROW(generator.generateSignal(contextFor(bars)), core::DataException);
}

TEST(MeanReversionGeneratorTest, ZeroAtrProducesNothing) {
    StubIndicatorLibrary stub;
    stub.set("BB_UPPER(20,2)", 110.0);
    stub.set("BB_LOWER(20,2)", 100.5);
    stub.set("RSI(14)", 20.0);
    stub.set("ATR(14)", 0.0);
    MeanReversionGenerator generator(MeanReversionParams{}, stub);

    auto bars = test_support::flatBars(kKey, 25, at("10:30:00"));
    EXPECT_FALSE(generator.generateSignal(contextFor(bars)).has_value());
}

TEST(MeanReversionGeneratorTest, ShortHistoryReturnsNothingWithoutComputing) {
    StubIndicatorLibrary stub; // no values configured, any compute() would throw
    MeanReversionGenerator generator(MeanReversionParams{}, stub);
    auto bars = test_support::flatBars(kKey, 10, at("10:30:00"));
    EXPECT_FALSE(generator.generateSignal(contextFor(bars)).has_value());
}

TEST(MeanReversionGeneratorTest, RejectsInvertedRsiThresholds) {
    StubIndicatorLibrary stub;
    MeanReversionParams params;
    params.rsi_oversold = 70.0;
    params.rsi_overbought = 30.0;
    EXPECT_THROW(MeanReversionGenerator(params, stub), core::StrategyException);
}

// --- Breakout ---

TEST(BreakoutGeneratorTest, LongBreakEntersAtChannelLevelAndWaitsForRetest) {
    StubIndicatorLibrary stub;
    stub.set("ATR(14)", 1.0);
    BreakoutGenerator generator(BreakoutParams{}, stub);
    ASSERT_EQ(generator.requiredHistory(), 21u);

    auto bars = channelThenBreak(102.0, 2000);
    auto signal = generator.generateSignal(contextFor(bars, 35.0));

    ASSERT_TRUE(signal.has_value());
    EXPECT_EQ(signal->direction, core::Direction::Long);
    EXPECT_EQ(signal->strategy_id, "trend_breakout");
    EXPECT_TRUE(signal->requires_retest);
    EXPECT_DOUBLE_EQ(signal->entry_price, 100.5);
    EXPECT_DOUBLE_EQ(signal->stop_loss, 99.0);
    EXPECT_DOUBLE_EQ(signal->target, 103.5);
    // 55 + (35 - 25) * 1.5 + (2 - 1) * 10
    EXPECT_DOUBLE_EQ(signal->confidence, 80.0);
}

TEST(BreakoutGeneratorTest, WithoutRetestEntersAtTheBreakoutClose) {
    StubIndicatorLibrary stub;
    stub.set("ATR(14)", 1.0);
    BreakoutParams params;
    params.require_retest = false;
    BreakoutGenerator generator(params, stub);

    auto bars = channelThenBreak(102.0, 2000);
    auto signal = generator.generateSignal(contextFor(bars, 35.0));

    ASSERT_TRUE(signal.has_value());
    EXPECT_FALSE(signal->requires_retest);
    EXPECT_DOUBLE_EQ(signal->entry_price, 102.0);
    EXPECT_DOUBLE_EQ(signal->stop_loss, 100.5);
    EXPECT_DOUBLE_EQ(signal->target, 105.0);
}

TEST(BreakoutGeneratorTest, ShortBreakBelowChannelLow) {
    StubIndicatorLibrary stub;
    stub.set("ATR(14)", 1.0);
    BreakoutGenerator generator(BreakoutParams{}, stub);

    auto bars = channelThenBreak(98.0, 2000);
    auto signal = generator.generateSignal(contextFor(bars, 30.0));

    ASSERT_TRUE(signal.has_value());
    EXPECT_EQ(signal->direction, core::Direction::Short);
    EXPECT_DOUBLE_EQ(signal->entry_price, 99.5);
    EXPECT_DOUBLE_EQ(signal->stop_loss, 101.0);
    EXPECT_DOUBLE_EQ(signal->target, 96.5);
}

TEST(BreakoutGeneratorTest, ThinVolumeBreakIsIgnoredUnlessFilterDisabled) {
    StubIndicatorLibrary stub;
    stub.set("ATR(14)", 1.0);
    auto bars = channelThenBreak(102.0, 500);

    BreakoutGenerator filtered(BreakoutParams{}, stub);
    EXPECT_FALSE(filtered.generateSignal(contextFor(bars, 35.0)).has_value());

    BreakoutParams params;
    params.volume_multiplier = 0.0;
    BreakoutGenerator unfiltered(params, stub);
    EXPECT_TRUE(unfiltered.generateSignal(contextFor(bars, 35.0)).has_value());
}

TEST(BreakoutGeneratorTest, CloseInsideChannelProducesNothing) {
    StubIndicatorLibrary stub;
    stub.set("ATR(14)", 1.0);
    BreakoutGenerator generator(BreakoutParams{}, stub);

    auto bars = channelThenBreak(100.2, 3000);
    EXPECT_FALSE(generator.generateSignal(contextFor(bars, 35.0)).has_value());
}

TEST(BreakoutGeneratorTest, NanRegimeContributesNoTrendBonus) {
    StubIndicatorLibrary stub;
    stub.set("ATR(14)", 1.0);
    BreakoutGenerator generator(BreakoutParams{}, stub);

    auto bars = channelThenBreak(102.0, 1000);
    auto signal = generator.generateSignal(contextFor(bars, std::numeric_limits<double>::quiet_NaN()));
    ASSERT_TRUE(signal.has_value());
    EXPECT_DOUBLE_EQ(signal->confidence, 55.0);
}

TEST(BreakoutGeneratorTest, MissingAtrRaisesDataException) {
    StubIndicatorLibrary stub;
    stub.setSeries("ATR(14)", {});
    BreakoutGenerator generator(BreakoutParams{}, stub);

    auto bars = channelThenBreak(102.0, 2000);
    EXPECT_THROW(generator.generateSignal(contextFor(bars, 35.0)), core::DataException);
}

// --- Factory ---

TEST(GeneratorFactoryTest, AppliesParameterOverrides) {
    StubIndicatorLibrary stub;
    auto generator = GeneratorFactory::createGenerator(
        GeneratorKind::Breakout, json{{"channel_lookback", 10}, {"require_retest", false}}, stub);
    ASSERT_NE(generator, nullptr);

    auto* breakout = dynamic_cast<BreakoutGenerator*>(generator.get());
    ASSERT_NE(breakout, nullptr);
    EXPECT_EQ(breakout->params().channel_lookback, 10);
    EXPECT_FALSE(breakout->params().require_retest);
    EXPECT_DOUBLE_EQ(breakout->params().reward_risk, 2.0);
}

TEST(GeneratorFactoryTest, InvalidParametersReturnNull) {
    StubIndicatorLibrary stub;
    EXPECT_EQ(GeneratorFactory::createGenerator(GeneratorKind::MeanReversion, json{{"bb_period", "twenty"}}, stub), nullptr);
    EXPECT_EQ(GeneratorFactory::createGenerator(GeneratorKind::Breakout, json{{"require_retest", 1}}, stub), nullptr);
    EXPECT_EQ(GeneratorFactory::createGenerator(GeneratorKind::Breakout, json{{"channel_lookback", 1}}, stub), nullptr);
    EXPECT_EQ(GeneratorFactory::createGenerator(GeneratorKind::MeanReversion, json::array(), stub), nullptr);
}

TEST(GeneratorFactoryTest, CreateGeneratorsBuildsBothWithDefaults) {
    StubIndicatorLibrary stub;
    auto set = GeneratorFactory::createGenerators(json::object(), stub);
    ASSERT_NE(set.mean_reversion, nullptr);
    ASSERT_NE(set.breakout, nullptr);
    EXPECT_EQ(set.mean_reversion->kind(), GeneratorKind::MeanReversion);
    EXPECT_EQ(set.breakout->kind(), GeneratorKind::Breakout);

    auto from_null = GeneratorFactory::createGenerators(json(), stub);
    EXPECT_NE(from_null.breakout, nullptr);
}

TEST(GeneratorFactoryTest, CreateGeneratorsThrowsOnBadSection) {
    StubIndicatorLibrary stub;
    EXPECT_THROW(GeneratorFactory::createGenerators(json::array(), stub), core::ConfigException);
    EXPECT_THROW(GeneratorFactory::createGenerators(json{{"breakout", {{"atr_period", 0}}}}, stub),
                 core::ConfigException);
}
