#include <gtest/gtest.h>
#include "strategy_router.hpp"
#include "mean_reversion_generator.hpp"
#include "breakout_generator.hpp"
#include "exceptions.hpp"
#include "test_support.hpp"

using namespace strategy_engine;
using test_support::at;
using test_support::StubIndicatorLibrary;

namespace {

    const std::string kReliance = "NSE_EQ|INE002A01018";
    const std::string kInfy = "NSE_EQ|INE009A01021";
    const std::string kTcs = "NSE_EQ|INE467B01029";

    core::SessionConfig sessionWithBlackout() {
        core::SessionConfig session;
        session.blackout_windows.push_back(core::TimeWindow{9 * 60 + 15, 9 * 60 + 30});
        return session;
    }

    class StrategyRouterTest : public ::testing::Test {
    protected:
        StrategyRouterTest()
            : calendar_(sessionWithBlackout()),
              aggregator_(1000, std::chrono::seconds(60), 500) {
            // Range-bound long setup on flat bars
            stub_.set("BB_UPPER(20,2)", 110.0);
            stub_.set("BB_LOWER(20,2)", 100.5);
            stub_.set("RSI(14)", 20.0);
            stub_.set("ATR(14)", 2.0);
        }

        std::unique_ptr<StrategyRouter> makeRouter() {
            return std::make_unique<StrategyRouter>(
                core::RouterConfig{}, stub_, calendar_,
                std::make_unique<MeanReversionGenerator>(MeanReversionParams{}, stub_),
                std::make_unique<BreakoutGenerator>(BreakoutParams{}, stub_));
        }

        StubIndicatorLibrary stub_;
        core::SessionCalendar calendar_;
        market_data::CandleAggregator aggregator_;
    };

} // namespace

TEST_F(StrategyRouterTest, RegimeThresholdSelectsGenerator) {
    auto router = makeRouter();
    EXPECT_EQ(router->selectGenerator(10.0), GeneratorKind::MeanReversion);
    EXPECT_EQ(router->selectGenerator(24.99), GeneratorKind::MeanReversion);
    EXPECT_EQ(router->selectGenerator(25.0), GeneratorKind::Breakout);
    EXPECT_EQ(router->selectGenerator(60.0), GeneratorKind::Breakout);
}

TEST_F(StrategyRouterTest, RejectsMissingOrSwappedGenerators) {
    EXPECT_THROW(StrategyRouter(core::RouterConfig{}, stub_, calendar_, nullptr,
                                std::make_unique<BreakoutGenerator>(BreakoutParams{}, stub_)),
                 core::ConfigException);
    EXPECT_THROW(StrategyRouter(core::RouterConfig{}, stub_, calendar_,
                                std::make_unique<BreakoutGenerator>(BreakoutParams{}, stub_),
                                std::make_unique<MeanReversionGenerator>(MeanReversionParams{}, stub_)),
                 core::ConfigException);
}

TEST_F(StrategyRouterTest, LowRegimeRoutesToMeanReversion) {
    stub_.set("ADX(14)", 15.0);
    auto router = makeRouter();
    auto bars = test_support::flatBars(kReliance, 60, at("10:30:00"));

    auto signal = router->evaluate(kReliance, bars, at("10:30:00"));
    ASSERT_TRUE(signal.has_value());
    EXPECT_EQ(signal->strategy_id, "mean_reversion");
    EXPECT_EQ(signal->direction, core::Direction::Long);
}

TEST_F(StrategyRouterTest, HighRegimeRoutesToBreakoutOnly) {
    stub_.set("ADX(14)", 35.0);
    stub_.set("ATR(14)", 1.0);
    auto router = makeRouter();

    // Flat bars satisfy the band setup but the breakout generator sees no break
    auto flat = test_support::flatBars(kReliance, 60, at("10:30:00"));
    EXPECT_FALSE(router->evaluate(kReliance, flat, at("10:30:00")).has_value());

    auto bars = test_support::flatBars(kReliance, 59, at("10:29:00"));
    bars.push_back(test_support::makeBar(kReliance, at("10:29:00"), 100.0, 102.5, 99.8, 102.0, 2000));
    auto signal = router->evaluate(kReliance, bars, at("10:30:00"));
    ASSERT_TRUE(signal.has_value());
    EXPECT_EQ(signal->strategy_id, "trend_breakout");
    EXPECT_TRUE(signal->requires_retest);
    EXPECT_DOUBLE_EQ(signal->entry_price, 100.5);
}

TEST_F(StrategyRouterTest, EvaluateRejectsShortHistoryAndNanRegime) {
    auto router = makeRouter();
    auto short_bars = test_support::flatBars(kReliance, 10, at("10:30:00"));
    EXPECT_THROW(router->evaluate(kReliance, short_bars, at("10:30:00")), core::DataException);

    stub_.setSeries("ADX(14)", {});
    auto bars = test_support::flatBars(kReliance, 60, at("10:30:00"));
    EXPECT_THROW(router->evaluate(kReliance, bars, at("10:30:00")), core::DataException);
}

TEST_F(StrategyRouterTest, BlackoutSkipsTheWholeCycle) {
    stub_.set("ADX(14)", 15.0);
    auto router = makeRouter();
    aggregator_.mergeHistorical(kReliance, test_support::flatBars(kReliance, 60, at("09:20:00")));

    auto result = router->runCycle({kReliance}, aggregator_, at("09:20:00"), nullptr);
    EXPECT_TRUE(result.blackout);
    EXPECT_EQ(result.evaluated, 0);
    EXPECT_TRUE(result.signals.empty());

    auto after_close = router->runCycle({kReliance}, aggregator_, at("15:20:00"), nullptr);
    EXPECT_TRUE(after_close.blackout);
}

TEST_F(StrategyRouterTest, CycleSkipsOccupiedAndShortHistoryInstruments) {
    stub_.set("ADX(14)", 15.0);
    auto router = makeRouter();
    aggregator_.mergeHistorical(kReliance, test_support::flatBars(kReliance, 60, at("10:30:00")));
    aggregator_.mergeHistorical(kInfy, test_support::flatBars(kInfy, 60, at("10:30:00")));
    aggregator_.mergeHistorical(kTcs, test_support::flatBars(kTcs, 10, at("10:30:00")));

    auto result = router->runCycle({kReliance, kInfy, kTcs}, aggregator_, at("10:30:00"),
                                   [](const std::string& key) { return key == kInfy; });

    EXPECT_FALSE(result.blackout);
    EXPECT_EQ(result.evaluated, 1);
    EXPECT_EQ(result.skipped_occupied, 1);
    EXPECT_EQ(result.skipped_history, 1);
    ASSERT_EQ(result.signals.size(), 1u);
    EXPECT_EQ(result.signals[0].instrument_key, kReliance);
}

TEST_F(StrategyRouterTest, IndicatorFailureSkipsOnlyThatInstrument) {
    stub_.set("ADX(14)", 15.0);
    stub_.failOn("RSI(14)");
    auto router = makeRouter();
    aggregator_.mergeHistorical(kReliance, test_support::flatBars(kReliance, 60, at("10:30:00")));

    auto result = router->runCycle({kReliance}, aggregator_, at("10:30:00"), nullptr);
    EXPECT_EQ(result.evaluated, 1);
    EXPECT_EQ(result.skipped_data, 1);
    EXPECT_TRUE(result.signals.empty());
}

TEST(StrategyRouterRankTest, RanksByConfidenceTimesRewardRisk) {
    using test_support::makeSignal;
    auto a = makeSignal("A", core::Direction::Long, 100.0, 99.0, 101.0);  // rr 1
    auto b = makeSignal("B", core::Direction::Long, 100.0, 99.0, 103.0);  // rr 3
    auto c = makeSignal("C", core::Direction::Short, 100.0, 101.0, 98.0); // rr 2
    a.confidence = 90.0; // 90
    b.confidence = 40.0; // 120
    c.confidence = 50.0; // 100

    auto ranked = StrategyRouter::rankSignals({a, b, c}, 10);
    ASSERT_EQ(ranked.size(), 3u);
    EXPECT_EQ(ranked[0].instrument_key, "B");
    EXPECT_EQ(ranked[1].instrument_key, "C");
    EXPECT_EQ(ranked[2].instrument_key, "A");

    auto top = StrategyRouter::rankSignals({a, b, c}, 2);
    ASSERT_EQ(top.size(), 2u);
    EXPECT_EQ(top[1].instrument_key, "C");
    EXPECT_TRUE(StrategyRouter::rankSignals({a, b}, 0).empty());
}
