#pragma once

#include "types.hpp"
#include "config.hpp"
#include "swing_detector.hpp"
#include "structure_events.hpp"
#include "fvg_detector.hpp"
#include "liquidity_filter.hpp"
#include <string>
#include <vector>

// Deterministic market-structure classifier.
//
// Workflow:
//   1. detect swings (strict pivots, radius = sensitivity)
//   2. detect BOS / CHoCH breaks of the most recent swings
//   3. split off fake breakouts as negative evidence
//   4. score evidence and resolve direction, confidence and dominance
//   5. report the nearest unfilled fair value gap and any liquidity sweep
//      by the last candle (evidence only, no effect on scores)
//
// Identical input windows and configuration always produce identical states.
class StructureEngine {
public:
    explicit StructureEngine(const Config& config);

    // Throws DataInsufficient for windows shorter than structure_min_window and
    // MalformedCandle for inconsistent or unordered candles.
    StructureState analyze(
        const std::vector<Candle>& candles,
        const std::string& symbol,
        const std::string& timeframe,
        const std::string& source
    ) const;

    // Weighted contribution of one event: base(type) * strength * quality
    static double effective_score(const StructureEvent& event, bool is_fake);
    static double event_strength(const StructureEvent& event);
    static double event_quality(const StructureEvent& event);

    static std::string version();

private:
    void validate_window(const std::vector<Candle>& candles) const;
    std::string make_trace_id(
        const std::vector<Candle>& candles,
        const std::string& symbol,
        const std::string& timeframe,
        const std::string& source
    ) const;
    double dominance_ratio(const std::vector<Candle>& candles, const SwingPoint& pivot,
                           StructureDirection direction) const;

    const Config& config_;
    SwingDetector swing_detector_;
    StructureEventDetector event_detector_;
    FakeBreakoutFilter fake_filter_;
    FvgDetector fvg_detector_;
    LiquidityFilter liquidity_filter_;
};
