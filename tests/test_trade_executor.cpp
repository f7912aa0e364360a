#include <gtest/gtest.h>
#include "trade_executor.hpp"
#include "exceptions.hpp"
#include "test_support.hpp"

#include <thread>

using namespace execution;
using test_support::at;
using test_support::makeSignal;

namespace {

    const std::string kKey = "NSE_EQ|INE002A01018";

    class BlockEverything : public screening::IScreeningLevel {
    public:
        std::string name() const override { return "block_everything"; }
        bool isCritical() const override { return true; }
        screening::LevelResult evaluate(const core::Signal&, const screening::MarketState&,
                                        const std::vector<core::Position>&) const override {
            return screening::LevelResult::block("closed for testing");
        }
    };

    core::RiskConfig testRisk(int max_positions = 5) {
        core::RiskConfig risk;
        risk.capital = 100000.0;
        risk.risk_per_trade_pct = 0.01;
        risk.max_quantity = 1000;
        risk.max_positions = max_positions;
        return risk;
    }

    core::Signal retestSignal(const std::string& key = kKey) {
        auto signal = makeSignal(key, core::Direction::Long, 100.0, 98.5, 103.0, {}, "trend_breakout");
        signal.requires_retest = true;
        return signal;
    }

    class TradeExecutorTest : public ::testing::Test {
    protected:
        TradeExecutorTest()
            : retests_(std::chrono::minutes(30), 0.004),
              orders_(gateway_, core::RetryPolicy(test_support::fastRetry(2))),
              pipeline_(true),
              entry_worker_("entry"),
              executor_(testRisk(), pipeline_, ledger_, retests_, orders_, entry_worker_, &audit_) {}

        void TearDown() override { entry_worker_.stop(); }

        test_support::FakeOrderGateway gateway_;
        test_support::CapturingAuditPublisher audit_;
        PositionLedger ledger_;
        RetestWaitQueue retests_;
        ResilientOrderClient orders_;
        screening::ScreeningPipeline pipeline_;
        OrderWorker entry_worker_;
        TradeExecutor executor_;
        screening::MarketState state_;
    };

} // namespace

TEST_F(TradeExecutorTest, PositionSizeFollowsRiskBudget) {
    EXPECT_EQ(executor_.positionSize(100.0, 98.0), 500);
    EXPECT_EQ(executor_.positionSize(100.0, 99.9), 1000);   // capped
    EXPECT_EQ(executor_.positionSize(100.0, 100.0), 0);
    EXPECT_EQ(executor_.positionSize(5000.0, 3000.0), 1);   // floor would be 0
    EXPECT_EQ(executor_.positionSize(100.0, 102.0), 500);
}

TEST_F(TradeExecutorTest, PlacesScreenedEntryAndOpensPosition) {
    auto outcome = executor_.submitSignal(makeSignal(kKey, core::Direction::Long, 100.0, 98.0, 104.0), state_,
                                          at("10:00:00"));
    ASSERT_EQ(outcome, EntryOutcome::Placed);

    auto position = ledger_.get(kKey);
    ASSERT_TRUE(position.has_value());
    EXPECT_EQ(position->quantity, 500);
    EXPECT_DOUBLE_EQ(position->entry_price, 100.0);
    EXPECT_DOUBLE_EQ(position->stop_loss, 98.0);
    EXPECT_DOUBLE_EQ(position->initial_stop_loss, 98.0);
    EXPECT_EQ(position->opened_at, at("10:00:00"));
    EXPECT_EQ(position->order_id, "FAKE-1");

    auto requests = gateway_.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].side, OrderSide::Buy);
    EXPECT_EQ(requests[0].tag, "ENTRY");

    EXPECT_EQ(audit_.count(audit::AuditEventType::OrderPlaced), 1u);
    EXPECT_EQ(audit_.count(audit::AuditEventType::PositionOpened), 1u);
    EXPECT_EQ(executor_.inFlightCount(), 0u);
}

TEST_F(TradeExecutorTest, ShortEntrySells) {
    executor_.submitSignal(makeSignal(kKey, core::Direction::Short, 100.0, 102.0, 96.0), state_, at("10:00:00"));
    EXPECT_EQ(gateway_.requests().at(0).side, OrderSide::Sell);
    EXPECT_EQ(ledger_.get(kKey)->direction, core::Direction::Short);
}

TEST_F(TradeExecutorTest, SecondSignalForOpenInstrumentIsOccupied) {
    auto signal = makeSignal(kKey, core::Direction::Long, 100.0, 98.0, 104.0);
    ASSERT_EQ(executor_.submitSignal(signal, state_, at("10:00:00")), EntryOutcome::Placed);
    EXPECT_EQ(executor_.submitSignal(signal, state_, at("10:05:00")), EntryOutcome::Occupied);
    EXPECT_EQ(gateway_.requestCount(), 1u);
}

TEST_F(TradeExecutorTest, BlockedSignalLeavesInstrumentFree) {
    screening::ScreeningPipeline closed(true);
    closed.addLevel(std::make_unique<BlockEverything>());
    TradeExecutor executor(testRisk(), closed, ledger_, retests_, orders_, entry_worker_);

    auto outcome = executor.submitSignal(makeSignal(kKey, core::Direction::Long, 100.0, 98.0, 104.0), state_,
                                         at("10:00:00"));
    EXPECT_EQ(outcome, EntryOutcome::Blocked);
    EXPECT_FALSE(executor.isOccupied(kKey));
    EXPECT_EQ(gateway_.requestCount(), 0u);
}

TEST_F(TradeExecutorTest, ZeroRiskSignalIsNotSized) {
    auto outcome = executor_.submitSignal(makeSignal(kKey, core::Direction::Long, 100.0, 100.0, 104.0), state_,
                                          at("10:00:00"));
    EXPECT_EQ(outcome, EntryOutcome::SizingRejected);
    EXPECT_FALSE(executor_.isOccupied(kKey));
}

TEST_F(TradeExecutorTest, FailedOrderReleasesTheClaim) {
    gateway_.script(OrderResult::failed(OrderErrorKind::Rejected, "circuit limit"));
    auto outcome = executor_.submitSignal(makeSignal(kKey, core::Direction::Long, 100.0, 98.0, 104.0), state_,
                                          at("10:00:00"));
    EXPECT_EQ(outcome, EntryOutcome::OrderFailed);
    EXPECT_FALSE(executor_.isOccupied(kKey));
    EXPECT_FALSE(ledger_.has(kKey));
    EXPECT_EQ(audit_.count(audit::AuditEventType::OrderFailed), 1u);
}

TEST_F(TradeExecutorTest, InFlightEntryOccupiesTheInstrument) {
    bool occupied_during_order = false;
    EntryOutcome nested = EntryOutcome::Placed;
    gateway_.setBeforeFill([&](const OrderRequest&) {
        occupied_during_order = executor_.isOccupied(kKey);
        nested = executor_.submitSignal(makeSignal(kKey, core::Direction::Long, 100.0, 98.0, 104.0), state_,
                                        at("10:00:01"));
    });

    auto outcome = executor_.submitSignal(makeSignal(kKey, core::Direction::Long, 100.0, 98.0, 104.0), state_,
                                          at("10:00:00"));
    EXPECT_EQ(outcome, EntryOutcome::Placed);
    EXPECT_TRUE(occupied_during_order);
    EXPECT_EQ(nested, EntryOutcome::Occupied);
    EXPECT_EQ(gateway_.requestCount(), 1u);
}

TEST_F(TradeExecutorTest, ConcurrentSignalsOpenOnePosition) {
    gateway_.setBeforeFill([](const OrderRequest&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    });

    std::atomic<int> placed{0};
    std::atomic<int> occupied{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            auto outcome = executor_.submitSignal(makeSignal(kKey, core::Direction::Long, 100.0, 98.0, 104.0),
                                                  state_, at("10:00:00"));
            if (outcome == EntryOutcome::Placed) ++placed;
            if (outcome == EntryOutcome::Occupied) ++occupied;
        });
    }
    for (auto& thread : threads) thread.join();

    EXPECT_EQ(placed.load(), 1);
    EXPECT_EQ(occupied.load(), 7);
    EXPECT_EQ(gateway_.requestCount(), 1u);
    EXPECT_EQ(ledger_.size(), 1u);
}

TEST_F(TradeExecutorTest, RetestSignalIsQueuedNotOrdered) {
    auto outcome = executor_.submitSignal(retestSignal(), state_, at("10:00:00"));
    EXPECT_EQ(outcome, EntryOutcome::Queued);
    EXPECT_EQ(gateway_.requestCount(), 0u);
    EXPECT_TRUE(executor_.isOccupied(kKey));
    EXPECT_EQ(executor_.inFlightCount(), 0u);
    ASSERT_TRUE(retests_.get(kKey).has_value());
    EXPECT_EQ(retests_.get(kKey)->quantity, 666);
    EXPECT_EQ(audit_.count(audit::AuditEventType::RetestQueued), 1u);

    EXPECT_EQ(executor_.submitSignal(retestSignal(), state_, at("10:01:00")), EntryOutcome::Occupied);
}

TEST_F(TradeExecutorTest, RetestTouchOrdersOnTheEntryWorker) {
    entry_worker_.start();
    executor_.submitSignal(retestSignal(), state_, at("10:00:00"));
    executor_.evaluateRetests({{kKey, 101.0}}, at("10:05:00"));

    auto evaluation = executor_.evaluateRetests({{kKey, 100.2}}, at("10:07:00"));
    ASSERT_EQ(evaluation.filled.size(), 1u);
    entry_worker_.waitIdle();

    auto position = ledger_.get(kKey);
    ASSERT_TRUE(position.has_value());
    EXPECT_DOUBLE_EQ(position->entry_price, 100.2);
    EXPECT_DOUBLE_EQ(position->stop_loss, 98.5);
    EXPECT_EQ(position->quantity, 666);
    EXPECT_EQ(position->strategy_id, "trend_breakout");
    EXPECT_EQ(audit_.count(audit::AuditEventType::RetestFilled), 1u);
    EXPECT_FALSE(retests_.has(kKey));
}

TEST_F(TradeExecutorTest, RetestFillInFlightBlocksNewSignals) {
    entry_worker_.start();
    EntryOutcome during_fill = EntryOutcome::Placed;
    gateway_.setBeforeFill([&](const OrderRequest&) {
        during_fill = executor_.submitSignal(makeSignal(kKey, core::Direction::Long, 100.0, 98.0, 104.0), state_,
                                             at("10:07:01"));
    });
    executor_.submitSignal(retestSignal(), state_, at("10:00:00"));
    executor_.evaluateRetests({{kKey, 101.0}}, at("10:05:00"));
    executor_.evaluateRetests({{kKey, 100.1}}, at("10:07:00"));
    entry_worker_.waitIdle();

    EXPECT_EQ(during_fill, EntryOutcome::Occupied);
    EXPECT_EQ(gateway_.requestCount(), 1u);
    EXPECT_TRUE(ledger_.has(kKey));
}

TEST_F(TradeExecutorTest, RetestFillRechecksSuspension) {
    entry_worker_.start();
    executor_.submitSignal(retestSignal(), state_, at("10:00:00"));
    executor_.evaluateRetests({{kKey, 101.0}}, at("10:04:00"));
    executor_.suspendEntries("token expired", at("10:05:00"));

    executor_.evaluateRetests({{kKey, 100.0}}, at("10:07:00"));
    entry_worker_.waitIdle();

    EXPECT_FALSE(ledger_.has(kKey));
    EXPECT_FALSE(executor_.isOccupied(kKey));
    EXPECT_EQ(gateway_.requestCount(), 0u);
}

TEST_F(TradeExecutorTest, RetestFillRechecksCapacity) {
    TradeExecutor limited(testRisk(1), pipeline_, ledger_, retests_, orders_, entry_worker_);
    ledger_.add(test_support::makePosition("OTHER", core::Direction::Long, 50.0, 49.0, 53.0, 10, at("09:30:00")));

    core::PendingRetest retest;
    retest.instrument_key = kKey;
    retest.breakout_price = 100.0;
    retest.stop_loss = 98.5;
    retest.target = 103.0;
    retest.quantity = 10;
    EXPECT_EQ(limited.fillRetest(RetestFill{retest, 100.1}, at("10:07:00")), EntryOutcome::SizingRejected);
    EXPECT_EQ(gateway_.requestCount(), 0u);
}

TEST_F(TradeExecutorTest, UnstartedWorkerDropsRetestFillAndReleases) {
    executor_.submitSignal(retestSignal(), state_, at("10:00:00"));
    executor_.evaluateRetests({{kKey, 101.0}}, at("10:05:00"));
    auto evaluation = executor_.evaluateRetests({{kKey, 100.0}}, at("10:07:00"));
    EXPECT_EQ(evaluation.filled.size(), 1u);
    EXPECT_FALSE(executor_.isOccupied(kKey));
}

TEST_F(TradeExecutorTest, ExpiredAndInvalidatedRetestsAreAudited) {
    executor_.submitSignal(retestSignal(), state_, at("10:00:00"));
    executor_.submitSignal(retestSignal("OTHER"), state_, at("10:20:00"));

    executor_.evaluateRetests({{"OTHER", 98.0}}, at("10:31:00"));
    EXPECT_EQ(audit_.count(audit::AuditEventType::RetestExpired), 1u);
    EXPECT_EQ(audit_.count(audit::AuditEventType::RetestInvalidated), 1u);
    EXPECT_EQ(retests_.size(), 0u);
}

TEST_F(TradeExecutorTest, CancelPendingRetestsClearsQueue) {
    executor_.submitSignal(retestSignal(), state_, at("10:00:00"));
    executor_.submitSignal(retestSignal("OTHER"), state_, at("10:00:00"));
    EXPECT_EQ(executor_.cancelPendingRetests("session flatten", at("15:15:00")), 2u);
    EXPECT_FALSE(executor_.isOccupied(kKey));
    EXPECT_EQ(audit_.count(audit::AuditEventType::RetestExpired), 2u);
}

TEST_F(TradeExecutorTest, SuspensionBlocksEntriesUntilResumed) {
    executor_.suspendEntries("token expired", at("10:00:00"));
    executor_.suspendEntries("token expired again", at("10:00:01"));
    EXPECT_TRUE(executor_.entriesSuspended());
    EXPECT_EQ(audit_.count(audit::AuditEventType::EntriesSuspended), 1u);

    auto signal = makeSignal(kKey, core::Direction::Long, 100.0, 98.0, 104.0);
    EXPECT_EQ(executor_.submitSignal(signal, state_, at("10:01:00")), EntryOutcome::Suspended);
    EXPECT_EQ(gateway_.requestCount(), 0u);

    executor_.resumeEntries();
    EXPECT_EQ(executor_.submitSignal(signal, state_, at("10:02:00")), EntryOutcome::Placed);
}
