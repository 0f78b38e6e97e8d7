#include "structure_engine.hpp"
#include "errors.hpp"
#include "config.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <iterator>

using namespace testing_support;

namespace {
    const TimePoint kStart = at("2024-03-04T00:00:00Z");

    std::vector<Candle> bullish_candles() {
        return candles_from_path(zigzag(1.1000, {
            {1.1060, 6}, {1.1030, 4}, {1.1090, 6}, {1.1060, 4}, {1.1120, 6},
            {1.1090, 4}, {1.1150, 6}, {1.1120, 4}, {1.1180, 6}}), kStart);
    }

    std::vector<Candle> bearish_candles() {
        return candles_from_path(zigzag(1.1000, {
            {1.0940, 6}, {1.0970, 4}, {1.0910, 6}, {1.0940, 4}, {1.0880, 6},
            {1.0910, 4}, {1.0850, 6}, {1.0880, 4}, {1.0820, 6}}), kStart);
    }

    std::vector<Candle> ranging_candles() {
        std::vector<std::pair<double, int>> legs;
        for (int i = 0; i < 6; ++i) {
            legs.push_back({1.1030, 5});
            legs.push_back({1.1000, 5});
        }
        return candles_from_path(zigzag(1.1000, legs), kStart);
    }

    bool is_break(const EvidenceItem& item) {
        return item.type == "BOS" || item.type == "CHOCH" || item.type == "SWING_BREAK" ||
               item.type == "FAKE_BREAKOUT";
    }
}

class StructureEngineTest : public ::testing::Test {
protected:
    Config config;
};

TEST_F(StructureEngineTest, ShortWindowIsInsufficient) {
    StructureEngine engine(config);
    const auto candles = candles_from_path(zigzag(1.1000, {{1.1040, 28}}), kStart);
    ASSERT_EQ(candles.size(), 29u);

    try {
        engine.analyze(candles, "EUR/USD", "M15", "test");
        FAIL() << "expected DataInsufficient";
    } catch (const DataInsufficient& e) {
        EXPECT_EQ(e.required(), 30u);
        EXPECT_EQ(e.actual(), 29u);
    }
}

TEST_F(StructureEngineTest, InconsistentCandleIsRejected) {
    StructureEngine engine(config);
    auto candles = bullish_candles();
    candles[10].low = candles[10].high + 0.001;
    EXPECT_THROW(engine.analyze(candles, "EUR/USD", "M15", "test"), MalformedCandle);
}

TEST_F(StructureEngineTest, UnorderedTimestampsAreRejected) {
    StructureEngine engine(config);
    auto candles = bullish_candles();
    std::swap(candles[5].timestamp, candles[6].timestamp);
    EXPECT_THROW(engine.analyze(candles, "EUR/USD", "M15", "test"), MalformedCandle);
}

TEST_F(StructureEngineTest, IdenticalInputIsDeterministic) {
    StructureEngine engine(config);
    const auto candles = bullish_candles();

    const auto first = engine.analyze(candles, "EUR/USD", "M15", "test");
    const auto second = engine.analyze(candles, "EUR/USD", "M15", "test");
    EXPECT_EQ(first.to_json().dump(), second.to_json().dump());
    EXPECT_EQ(first.trace_id.rfind("struct-", 0), 0u);
    EXPECT_EQ(first.trace_id.size(), 15u);
    EXPECT_EQ(first.generated_at, candles.back().timestamp);

    const auto other = engine.analyze(candles, "GBP/USD", "M15", "test");
    EXPECT_NE(first.trace_id, other.trace_id);
}

TEST_F(StructureEngineTest, HigherHighsAndLowsAreBullish) {
    StructureEngine engine(config);
    const auto state = engine.analyze(bullish_candles(), "EUR/USD", "M15", "test");

    EXPECT_EQ(state.direction, StructureDirection::Bullish);
    EXPECT_NEAR(state.confidence, 0.98, 1e-9);
    EXPECT_GT(state.bullish_score, 1.0);
    EXPECT_DOUBLE_EQ(state.bearish_score, 0.0);
    EXPECT_GT(state.dominance_ratio, 0.5);
    EXPECT_LE(state.dominance_ratio, 1.0);

    const auto bos = std::count_if(state.evidence.begin(), state.evidence.end(),
                                   [](const EvidenceItem& item) { return item.type == "BOS"; });
    EXPECT_GE(bos, 2);
}

TEST_F(StructureEngineTest, LowerHighsAndLowsAreBearish) {
    StructureEngine engine(config);
    const auto state = engine.analyze(bearish_candles(), "EUR/USD", "M15", "test");

    EXPECT_EQ(state.direction, StructureDirection::Bearish);
    EXPECT_GT(state.bearish_score, 1.0);
    EXPECT_DOUBLE_EQ(state.bullish_score, 0.0);
    EXPECT_GT(state.confidence, 0.5);
    EXPECT_GT(state.dominance_ratio, 0.5);
}

TEST_F(StructureEngineTest, BoundedOscillationIsRanging) {
    StructureEngine engine(config);
    const auto state = engine.analyze(ranging_candles(), "EUR/USD", "M15", "test");

    EXPECT_EQ(state.direction, StructureDirection::Ranging);
    EXPECT_NEAR(state.confidence, 0.5, 1e-9);
    EXPECT_TRUE(std::none_of(state.evidence.begin(), state.evidence.end(), is_break));
    EXPECT_EQ(state.evidence.back().type, "RESOLUTION");
}

TEST_F(StructureEngineTest, LaterOppositeBreakOverridesBias) {
    StructureEngine engine(config);
    const auto candles = candles_from_path(zigzag(1.1000, {
        {1.1060, 6}, {1.1030, 4}, {1.1090, 6}, {1.1060, 4}, {1.1120, 6},
        {1.1090, 4}, {1.1150, 6}, {1.1120, 4}, {1.1145, 4}, {1.1100, 8}}), kStart);
    ASSERT_EQ(candles.size(), 53u);

    const auto state = engine.analyze(candles, "EUR/USD", "M15", "test");
    EXPECT_EQ(state.direction, StructureDirection::Ranging);

    const bool has_bearish_break = std::any_of(
        state.evidence.begin(), state.evidence.end(), [](const EvidenceItem& item) {
            return is_break(item) && item.direction == StructureDirection::Bearish;
        });
    EXPECT_TRUE(has_bearish_break);
}

TEST_F(StructureEngineTest, MonotonicWindowHasInsufficientSwings) {
    StructureEngine engine(config);
    const auto candles = candles_from_path(zigzag(1.1000, {{1.1200, 40}}), kStart);

    const auto state = engine.analyze(candles, "EUR/USD", "M15", "test");
    EXPECT_EQ(state.direction, StructureDirection::Ranging);
    EXPECT_DOUBLE_EQ(state.confidence, 0.0);
    ASSERT_EQ(state.evidence.size(), 1u);
    EXPECT_EQ(state.evidence[0].type, "INSUFFICIENT_SWINGS");
}

TEST_F(StructureEngineTest, EvidenceIsOrderedPivotBreaksZonesDominanceResolution) {
    StructureEngine engine(config);
    const auto state = engine.analyze(bullish_candles(), "EUR/USD", "M15", "test");

    ASSERT_GE(state.evidence.size(), 3u);
    EXPECT_EQ(state.evidence.front().type, "PIVOT");
    EXPECT_EQ(state.evidence[state.evidence.size() - 2].type, "DOMINANCE");
    EXPECT_EQ(state.evidence.back().type, "RESOLUTION");

    // Breaks in candle order, then entry zones and sweeps
    std::size_t i = 1;
    std::size_t last_index = 0;
    for (; i + 2 < state.evidence.size() && is_break(state.evidence[i]); ++i) {
        ASSERT_TRUE(state.evidence[i].candle_index.has_value());
        EXPECT_GE(*state.evidence[i].candle_index, last_index);
        last_index = *state.evidence[i].candle_index;
    }
    EXPECT_GT(i, 1u);
    for (; i + 2 < state.evidence.size(); ++i) {
        EXPECT_TRUE(state.evidence[i].type == "FVG" || state.evidence[i].type == "LIQUIDITY_SWEEP")
            << state.evidence[i].type;
        EXPECT_TRUE(state.evidence[i].candle_index.has_value());
    }
}

TEST_F(StructureEngineTest, ImpulseLegReportsNearestUnfilledGap) {
    StructureEngine engine(config);
    const auto candles = bullish_candles();
    const auto state = engine.analyze(candles, "EUR/USD", "M15", "test");

    std::vector<EvidenceItem> gaps;
    std::copy_if(state.evidence.begin(), state.evidence.end(), std::back_inserter(gaps),
                 [](const EvidenceItem& item) { return item.type == "FVG"; });
    ASSERT_EQ(gaps.size(), 1u);

    // Last leg climbs 10 pips a bar: gap 1.1165-1.1175 around candle 45,
    // the only unfilled one within 20 pips of the 1.1183 close
    const auto& gap = gaps[0];
    EXPECT_EQ(gap.direction, StructureDirection::Bullish);
    ASSERT_TRUE(gap.candle_index.has_value());
    EXPECT_EQ(*gap.candle_index, 45u);
    ASSERT_TRUE(gap.price_level.has_value());
    EXPECT_NEAR(*gap.price_level, 1.1170, 1e-9);
    EXPECT_LT(*gap.price_level, candles.back().close);
    ASSERT_TRUE(gap.value.has_value());
    EXPECT_NEAR(*gap.value, 10.0, 1e-9);
    ASSERT_TRUE(gap.strength.has_value());
    EXPECT_NEAR(*gap.strength, 0.76, 1e-9);

    // Zones do not move the scores
    EXPECT_NEAR(state.confidence, 0.98, 1e-9);
    EXPECT_DOUBLE_EQ(state.bearish_score, 0.0);
}

TEST_F(StructureEngineTest, StopHuntOfLastSwingLowIsReported) {
    StructureEngine engine(config);
    auto candles = bullish_candles();
    // Dips through the 1.1115 swing low at candle 40 and closes back near the high
    candles.push_back(make_candle(candles.back().timestamp + std::chrono::minutes(15),
                                  1.1182, 1.1186, 1.1110, 1.1180));

    const auto state = engine.analyze(candles, "EUR/USD", "M15", "test");

    std::vector<EvidenceItem> sweeps;
    std::copy_if(state.evidence.begin(), state.evidence.end(), std::back_inserter(sweeps),
                 [](const EvidenceItem& item) { return item.type == "LIQUIDITY_SWEEP"; });
    ASSERT_EQ(sweeps.size(), 1u);
    EXPECT_EQ(sweeps[0].direction, StructureDirection::Bullish);
    ASSERT_TRUE(sweeps[0].price_level.has_value());
    EXPECT_NEAR(*sweeps[0].price_level, 1.1115, 1e-9);
    ASSERT_TRUE(sweeps[0].candle_index.has_value());
    EXPECT_EQ(*sweeps[0].candle_index, 47u);
    ASSERT_TRUE(sweeps[0].value.has_value());
    EXPECT_NEAR(*sweeps[0].value, 70.0, 1e-9);
}

TEST_F(StructureEngineTest, RangingWithoutBreaksReportsNoZones) {
    StructureEngine engine(config);
    const auto state = engine.analyze(ranging_candles(), "EUR/USD", "M15", "test");
    EXPECT_TRUE(std::none_of(state.evidence.begin(), state.evidence.end(), [](const EvidenceItem& item) {
        return item.type == "FVG" || item.type == "LIQUIDITY_SWEEP";
    }));
}

TEST(StructureEngineScoreTest, FakeBreaksScoreNegative) {
    StructureEvent strong{BreakType::Bos, StructureDirection::Bullish, 1.1, 10, 5, 0.9, true, Trend::Up};
    // 0.6 * min(1, 0.5 + 0.27 + 0.2) * (0.7 + 0.2 + 0.1)
    EXPECT_NEAR(StructureEngine::effective_score(strong, false), 0.6 * 0.97, 1e-9);

    StructureEvent weak{BreakType::Choch, StructureDirection::Bearish, 1.1, 10, 5, 0.1, false, Trend::Up};
    // -0.4 * 0.8 * (0.7 - 0.2)
    EXPECT_NEAR(StructureEngine::effective_score(weak, true), -0.16, 1e-9);
    EXPECT_GT(StructureEngine::effective_score(weak, false), 0.0);
}

TEST(StructureEngineScoreTest, VersionIsStable) {
    EXPECT_EQ(StructureEngine::version(), "structure-engine/1.5.0");
}
