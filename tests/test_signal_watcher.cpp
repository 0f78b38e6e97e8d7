#include "signal_watcher.hpp"
#include "memory_store.hpp"
#include "config.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using namespace testing_support;
using std::chrono::hours;
using std::chrono::minutes;
using std::chrono::seconds;

namespace {
    const TimePoint kT0 = at("2024-03-04T10:00:00Z");

    Candle quiet(TimePoint ts) {
        // Stays above a 1.1000 entry and inside 1.0985 / 1.1020
        return make_candle(ts, 1.1010, 1.1015, 1.1005, 1.1012);
    }
}

class SignalWatcherTest : public ::testing::Test {
protected:
    Config config;
    InMemorySignalStore store;
    FakeCandleFeed feed;
    RecordingNotifier notifier;

    Signal buy(const std::string& id, SignalState state = SignalState::WaitingForEntry) {
        return make_signal(id, TradeDirection::Buy, 1.1000, 1.1020, 1.0985, kT0, state);
    }

    SignalLifecycleWatcher watcher() {
        return SignalLifecycleWatcher(config, store, feed, notifier);
    }
};

TEST_F(SignalWatcherTest, CandidatePublishesOnce) {
    auto candidate = buy("sig-1", SignalState::Candidate);
    candidate.released = false;
    store.insert_signal(candidate);

    auto w = watcher();
    const auto report = w.tick(kT0 + seconds(30));
    EXPECT_EQ(report.transitions, 1u);
    EXPECT_EQ(report.published, 1u);
    EXPECT_EQ(feed.candle_calls(), 0);

    const auto stored = store.find("sig-1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->state, SignalState::WaitingForEntry);
    EXPECT_TRUE(stored->released);

    w.tick(kT0 + seconds(60));
    const auto sent = notifier.sent();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].signal_id, "sig-1");
    EXPECT_EQ(sent[0].new_state, "WAITING_FOR_ENTRY");
}

TEST_F(SignalWatcherTest, LowReleaseConfidenceStaysCandidate) {
    auto candidate = buy("sig-1", SignalState::Candidate);
    candidate.release_confidence = 0.6;
    store.insert_signal(candidate);

    const auto report = watcher().tick(kT0 + seconds(30));
    EXPECT_EQ(report.transitions, 0u);
    EXPECT_EQ(store.find("sig-1")->state, SignalState::Candidate);
    EXPECT_TRUE(notifier.sent().empty());
}

TEST_F(SignalWatcherTest, FailedNotificationKeepsTransition) {
    store.insert_signal(buy("sig-1", SignalState::Candidate));
    notifier.set_fail(true);

    const auto report = watcher().tick(kT0 + seconds(30));
    EXPECT_EQ(report.transitions, 1u);
    EXPECT_EQ(report.published, 0u);
    EXPECT_EQ(notifier.attempts(), 1);
    EXPECT_EQ(store.find("sig-1")->state, SignalState::WaitingForEntry);
}

TEST_F(SignalWatcherTest, EntryHitThenTargetOnLaterTick) {
    store.insert_signal(buy("sig-1"));
    const Candle touch = make_candle(kT0 + minutes(15), 1.1008, 1.1010, 1.0998, 1.1003);
    feed.set_candles("EUR/USD", {quiet(kT0), touch});

    auto w = watcher();
    auto report = w.tick(kT0 + minutes(20));
    EXPECT_EQ(report.transitions, 1u);

    auto stored = store.find("sig-1");
    EXPECT_EQ(stored->state, SignalState::EntryHit);
    ASSERT_TRUE(stored->entry_hit_at.has_value());
    EXPECT_EQ(*stored->entry_hit_at, kT0 + minutes(15));
    EXPECT_EQ(stored->status, SignalStatus::Active);

    feed.set_candles("EUR/USD", {quiet(kT0), touch,
                                 make_candle(kT0 + minutes(30), 1.1005, 1.1022, 1.1003, 1.1018)});
    report = w.tick(kT0 + minutes(35));
    EXPECT_EQ(report.transitions, 1u);

    stored = store.find("sig-1");
    EXPECT_EQ(stored->state, SignalState::TpHit);
    EXPECT_EQ(stored->result, SignalResult::Profit);
    EXPECT_EQ(stored->status, SignalStatus::Closed);
    EXPECT_TRUE(stored->closed_at == kT0 + minutes(35));

    const auto events = store.validation_events("sig-1");
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[1].from_state, SignalState::EntryHit);
    EXPECT_EQ(events[1].to_state, SignalState::TpHit);
    ASSERT_TRUE(events[1].candle.has_value());
    EXPECT_EQ(events[1].candle->timestamp, kT0 + minutes(30));

    const auto sent = notifier.sent();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].new_state, "TP_HIT");
}

TEST_F(SignalWatcherTest, CandlesBeforeGenerationDoNotFill) {
    store.insert_signal(buy("sig-1"));
    feed.set_candles("EUR/USD", {make_candle(kT0 - minutes(15), 1.1005, 1.1008, 1.0995, 1.1000),
                                 quiet(kT0)});

    const auto report = watcher().tick(kT0 + minutes(10));
    EXPECT_EQ(report.transitions, 0u);
    EXPECT_EQ(store.find("sig-1")->state, SignalState::WaitingForEntry);
}

TEST_F(SignalWatcherTest, UntouchedEntryExpiresOnce) {
    store.insert_signal(buy("sig-1"));
    feed.set_candles("EUR/USD", {quiet(kT0), quiet(kT0 + minutes(15)), quiet(kT0 + minutes(30))});

    auto w = watcher();
    EXPECT_EQ(w.tick(kT0 + minutes(30)).transitions, 0u);

    const auto report = w.tick(kT0 + minutes(40));
    EXPECT_EQ(report.transitions, 1u);

    const auto stored = store.find("sig-1");
    EXPECT_EQ(stored->state, SignalState::Expired);
    EXPECT_EQ(stored->status, SignalStatus::Expired);
    EXPECT_EQ(stored->result, SignalResult::Expired);

    w.tick(kT0 + minutes(45));
    w.tick(kT0 + minutes(50));
    const auto events = store.validation_events("sig-1");
    ASSERT_EQ(events.size(), 1u);
    ASSERT_TRUE(events[0].candle.has_value());
    EXPECT_EQ(events[0].candle->timestamp, kT0 + minutes(30));
}

TEST_F(SignalWatcherTest, CandleSpanningBothLevelsIsLoss) {
    auto entered = buy("sig-1", SignalState::EntryHit);
    entered.entry_hit_at = kT0;
    store.insert_signal(entered);
    feed.set_candles("EUR/USD", {make_candle(kT0, 1.1000, 1.1025, 1.0980, 1.1010)});

    watcher().tick(kT0 + minutes(5));
    const auto stored = store.find("sig-1");
    EXPECT_EQ(stored->state, SignalState::SlHit);
    EXPECT_EQ(stored->result, SignalResult::Loss);
}

TEST_F(SignalWatcherTest, OpenTradeExitsOnTime) {
    auto entered = buy("sig-1", SignalState::EntryHit);
    entered.entry_hit_at = kT0;
    store.insert_signal(entered);

    std::vector<Candle> candles;
    for (int i = 0; i < 7; ++i) {
        candles.push_back(quiet(kT0 + minutes(15) * i));
    }
    feed.set_candles("EUR/USD", candles);

    auto w = watcher();
    EXPECT_EQ(w.tick(kT0 + minutes(85)).transitions, 0u);
    w.tick(kT0 + minutes(95));

    const auto stored = store.find("sig-1");
    EXPECT_EQ(stored->state, SignalState::Expired);
    EXPECT_EQ(stored->result, SignalResult::TimeExit);
    EXPECT_EQ(stored->status, SignalStatus::Expired);
}

TEST_F(SignalWatcherTest, FeedFailureIsIsolatedPerSignal) {
    config.thread_pool_size = 4;
    store.insert_signal(buy("eur-1"));
    auto gbp = buy("gbp-1");
    gbp.asset = "GBP/USD";
    store.insert_signal(gbp);

    feed.set_failing("EUR/USD", true);
    feed.set_candles("GBP/USD", {make_candle(kT0 + minutes(15), 1.1008, 1.1010, 1.0998, 1.1003)});

    const auto report = watcher().tick(kT0 + minutes(20));
    EXPECT_EQ(report.checked, 2u);
    EXPECT_EQ(report.feed_errors, 1u);
    EXPECT_EQ(report.transitions, 1u);
    EXPECT_EQ(store.find("eur-1")->state, SignalState::WaitingForEntry);
    EXPECT_EQ(store.find("gbp-1")->state, SignalState::EntryHit);
}

TEST_F(SignalWatcherTest, MalformedCandleIsSkipped) {
    store.insert_signal(buy("sig-1"));
    feed.set_candles("EUR/USD", {
        make_candle(kT0, 1.1010, 1.0990, 1.0995, 1.1012),  // high below low
        make_candle(kT0 + minutes(15), 1.1008, 1.1010, 1.0998, 1.1003),
    });

    const auto report = watcher().tick(kT0 + minutes(20));
    EXPECT_EQ(report.malformed_candles, 1u);
    EXPECT_EQ(*store.find("sig-1")->entry_hit_at, kT0 + minutes(15));
}

TEST_F(SignalWatcherTest, UnacknowledgedZombieIsCancelled) {
    auto entered = buy("sig-1", SignalState::EntryHit);
    entered.entry_hit_at = kT0 + minutes(1);
    entered.trade_deadline = kT0 + hours(48);
    store.insert_signal(entered);
    feed.set_candles("EUR/USD", {quiet(kT0 + minutes(15))});

    const auto report = watcher().tick(kT0 + hours(25));
    EXPECT_EQ(report.cancelled, 1u);

    const auto stored = store.find("sig-1");
    EXPECT_EQ(stored->state, SignalState::Cancelled);
    EXPECT_EQ(stored->result, SignalResult::Cancelled);
    EXPECT_EQ(stored->status, SignalStatus::Closed);

    const auto events = store.validation_events("sig-1");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, TransitionKind::Administrative);
}

TEST_F(SignalWatcherTest, AcknowledgedSignalIsNotReclaimed) {
    auto entered = buy("sig-1", SignalState::EntryHit);
    entered.entry_hit_at = kT0 + minutes(1);
    entered.trade_deadline = kT0 + hours(48);
    store.insert_signal(entered);
    ASSERT_TRUE(store.acknowledge("sig-1", kT0 + hours(1)));

    const auto report = watcher().tick(kT0 + hours(25));
    EXPECT_EQ(report.cancelled, 0u);
    EXPECT_EQ(store.find("sig-1")->state, SignalState::EntryHit);
}

TEST_F(SignalWatcherTest, ZombieIsCancelledEvenWhenFeedIsDown) {
    auto entered = buy("sig-1", SignalState::EntryHit);
    entered.entry_hit_at = kT0 + minutes(1);
    entered.trade_deadline = kT0 + hours(48);
    store.insert_signal(entered);
    feed.set_failing("EUR/USD", true);

    const auto report = watcher().tick(kT0 + hours(25));
    EXPECT_EQ(report.feed_errors, 1u);
    EXPECT_EQ(report.cancelled, 1u);
    EXPECT_EQ(store.find("sig-1")->state, SignalState::Cancelled);
}

TEST_F(SignalWatcherTest, ElapsedEntryWindowExpiresAfterOutageInsteadOfCancelling) {
    store.insert_signal(buy("sig-1"));
    feed.set_failing("EUR/USD", true);

    auto w = watcher();
    auto report = w.tick(kT0 + hours(25));
    EXPECT_EQ(report.feed_errors, 1u);
    EXPECT_EQ(report.cancelled, 0u);
    EXPECT_EQ(store.find("sig-1")->state, SignalState::WaitingForEntry);

    feed.set_failing("EUR/USD", false);
    feed.set_candles("EUR/USD", {quiet(kT0), quiet(kT0 + minutes(15)), quiet(kT0 + minutes(30))});
    report = w.tick(kT0 + hours(26));
    EXPECT_EQ(report.transitions, 1u);
    EXPECT_EQ(report.cancelled, 0u);

    const auto stored = store.find("sig-1");
    EXPECT_EQ(stored->state, SignalState::Expired);
    EXPECT_EQ(stored->result, SignalResult::Expired);
}

TEST_F(SignalWatcherTest, ElapsedTradeWindowTimesOutAfterOutage) {
    auto entered = buy("sig-1", SignalState::EntryHit);
    entered.entry_hit_at = kT0;
    store.insert_signal(entered);
    feed.set_failing("EUR/USD", true);

    auto w = watcher();
    EXPECT_EQ(w.tick(kT0 + hours(25)).cancelled, 0u);

    feed.set_failing("EUR/USD", false);
    feed.set_candles("EUR/USD", {quiet(kT0), quiet(kT0 + minutes(15))});
    w.tick(kT0 + hours(26));

    const auto stored = store.find("sig-1");
    EXPECT_EQ(stored->state, SignalState::Expired);
    EXPECT_EQ(stored->result, SignalResult::TimeExit);
}

TEST_F(SignalWatcherTest, VendorTimeframeSignalReachesEntry) {
    auto signal = buy("sig-1");
    signal.timeframe = "15min";
    store.insert_signal(signal);
    feed.set_candles("EUR/USD", {quiet(kT0), make_candle(kT0 + minutes(15), 1.1008, 1.1010, 1.0998, 1.1003)});

    const auto report = watcher().tick(kT0 + minutes(20));
    EXPECT_EQ(report.failures, 0u);
    EXPECT_EQ(report.transitions, 1u);

    const auto stored = store.find("sig-1");
    EXPECT_EQ(stored->state, SignalState::EntryHit);
    ASSERT_TRUE(stored->entry_hit_at.has_value());
    EXPECT_EQ(*stored->entry_hit_at, kT0 + minutes(15));
}

TEST_F(SignalWatcherTest, HeartbeatCarriesLatestPrices) {
    store.insert_signal(buy("sig-1"));
    feed.set_price("EUR/USD", 1.1003);

    watcher().tick(kT0 + minutes(5));
    const auto heartbeats = store.heartbeats();
    ASSERT_EQ(heartbeats.size(), 1u);
    EXPECT_EQ(heartbeats[0].status, "WATCHER_ONLINE");
    EXPECT_EQ(heartbeats[0].active_signals, 1u);
    EXPECT_DOUBLE_EQ(heartbeats[0].prices.at("EUR/USD"), 1.1003);
}

TEST_F(SignalWatcherTest, DeadlinesDefaultFromConfig) {
    auto w = watcher();
    auto signal = buy("sig-1");
    EXPECT_EQ(w.entry_deadline(signal), kT0 + minutes(35));
    EXPECT_EQ(w.trade_deadline(signal), kT0 + minutes(90));

    signal.entry_hit_at = kT0 + minutes(10);
    EXPECT_EQ(w.trade_deadline(signal), kT0 + minutes(100));
    signal.entry_deadline = kT0 + minutes(5);
    EXPECT_EQ(w.entry_deadline(signal), kT0 + minutes(5));
}
