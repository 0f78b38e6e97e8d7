#pragma once

#include "types.hpp"
#include "config.hpp"
#include <optional>
#include <vector>

// Three-candle price imbalance: the wicks of candles i and i+2 do not overlap.
// Bullish when high[i] < low[i+2] (gap below price), bearish when low[i] > high[i+2].
struct FairValueGap {
    std::size_t index;              // middle (impulse) candle
    StructureDirection direction;   // Bullish or Bearish
    double top;
    double bottom;
    double midpoint;
    double size_pips;
    double quality;                 // 0.6 * impulse body share + 0.4 * size score, 0..1
    double candle_strength;         // impulse body / range
    bool filled = false;            // a later candle traded back to the midpoint
};

class FvgDetector {
public:
    explicit FvgDetector(const Config& config);

    // Gaps among the last fvg_max_age_candles candles, ordered by index
    // (bullish before bearish on the same candle), with fill flags set
    std::vector<FairValueGap> detect_fvgs(const std::vector<Candle>& candles) const;

    // Unfilled gaps, newest first
    static std::vector<FairValueGap> unfilled(const std::vector<FairValueGap>& gaps);

    // Best unfilled gap to enter from: for Bullish a bullish gap below `price`,
    // for Bearish a bearish gap above it, within fvg_max_entry_distance_pips.
    // Highest quality wins, then the closest midpoint.
    std::optional<FairValueGap> nearest_entry(const std::vector<FairValueGap>& gaps,
                                              StructureDirection direction, double price) const;

private:
    std::optional<FairValueGap> make_gap(const Candle& impulse, std::size_t index, StructureDirection direction,
                                         double top, double bottom) const;

    const Config& config_;
};
